#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "lxcri/errors.h"
#include "lxcri/options.h"
#include "lxcri/validation.h"
#include "test_support.h"

namespace fs = std::filesystem;
using lxcri_test::write_file;

TEST(ValidationTest, ContainerIds) {
    EXPECT_TRUE(is_valid_container_id("web"));
    EXPECT_TRUE(is_valid_container_id("web_1.prod-a"));
    EXPECT_TRUE(is_valid_container_id(std::string(64, 'a')));
    EXPECT_FALSE(is_valid_container_id(""));
    EXPECT_FALSE(is_valid_container_id(std::string(65, 'a')));
    EXPECT_FALSE(is_valid_container_id(".hidden"));
    EXPECT_FALSE(is_valid_container_id("-flag"));
    EXPECT_FALSE(is_valid_container_id("../etc"));
    EXPECT_FALSE(is_valid_container_id("a b"));
    EXPECT_THROW(validate_container_id("a/b"), RuntimeError);
}

TEST(ValidationTest, Hostnames) {
    EXPECT_TRUE(is_valid_hostname("web1"));
    EXPECT_TRUE(is_valid_hostname("web-1.example.com"));
    EXPECT_FALSE(is_valid_hostname(""));
    EXPECT_FALSE(is_valid_hostname("-web"));
    EXPECT_FALSE(is_valid_hostname("web-"));
    EXPECT_FALSE(is_valid_hostname("web..example"));
    EXPECT_FALSE(is_valid_hostname("web_1"));
    EXPECT_FALSE(is_valid_hostname(std::string(64, 'a')));
    EXPECT_FALSE(is_valid_hostname("web;reboot"));
}

TEST(ValidationTest, NetworkSpecs) {
    EXPECT_TRUE(is_valid_network_spec("name=eth0,bridge=vmbr0,ip=dhcp"));
    EXPECT_TRUE(is_valid_network_spec("name=eth0,bridge=vmbr1,ip=10.0.0.5/24,gw=10.0.0.1,tag=20"));
    EXPECT_FALSE(is_valid_network_spec(""));
    EXPECT_FALSE(is_valid_network_spec("name=eth0 bridge=vmbr0"));
    EXPECT_FALSE(is_valid_network_spec("name=eth0;rm -rf /"));
    EXPECT_FALSE(is_valid_network_spec(std::string(513, 'a')));
}

TEST(ValidationTest, TemplateNames) {
    EXPECT_TRUE(is_valid_template_name("nginx-1.25"));
    EXPECT_FALSE(is_valid_template_name(".."));
    EXPECT_FALSE(is_valid_template_name("a/b"));
    EXPECT_FALSE(is_valid_template_name(std::string(129, 'a')));
}

class PathContainmentFixture : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = lxcri_test::make_test_root(std::string("paths-") +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        allowed_ = root_ + "/bundles";
        ensure_directory(allowed_ + "/web");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void expect_rejected(const std::string& path) {
        try {
            canonicalize_within(path, {allowed_});
            ADD_FAILURE() << "expected PathTraversalRejected for " << path;
        } catch (const RuntimeError& e) {
            EXPECT_EQ(e.code(), ErrorCode::PathTraversalRejected) << path;
        }
    }

    std::string root_;
    std::string allowed_;
};

TEST_F(PathContainmentFixture, AcceptsPathsInsidePrefix) {
    std::string resolved = canonicalize_within(allowed_ + "/web", {allowed_});
    EXPECT_EQ(resolved, fs::weakly_canonical(allowed_ + "/web").string());
    EXPECT_EQ(canonicalize_within(allowed_ + "/web/../web", {allowed_}), resolved);
    EXPECT_NO_THROW(canonicalize_within(allowed_, {allowed_}));
}

TEST_F(PathContainmentFixture, RejectsEscapes) {
    expect_rejected(allowed_ + "/../../etc");
    expect_rejected("../../etc");
    expect_rejected("/etc/passwd");
    expect_rejected(root_ + "/bundles-evil");
    expect_rejected("");
}

TEST_F(PathContainmentFixture, RejectsSymlinkEscape) {
    ensure_directory(root_ + "/outside");
    fs::create_symlink(root_ + "/outside", allowed_ + "/sneaky");
    expect_rejected(allowed_ + "/sneaky");
}

class EngineConfigFixture : public PathContainmentFixture {};

TEST_F(EngineConfigFixture, MissingFileYieldsDefaults) {
    EngineConfig config = load_engine_config(root_ + "/absent.json");
    EngineConfig defaults = default_engine_config();
    EXPECT_EQ(config.template_storage, defaults.template_storage);
    EXPECT_EQ(config.network, "name=eth0,bridge=vmbr0,ip=dhcp");
    EXPECT_EQ(config.default_memory_mb, 512u);
    EXPECT_FALSE(config.zfs.has_value());
}

TEST_F(EngineConfigFixture, ReadsOverrides) {
    write_file(root_ + "/config.json", R"({
        "template_storage": "nas",
        "default_memory_mb": 1024,
        "zfs": {"pool": "tank"},
        "allowed_bundle_prefixes": ["/srv/bundles"],
        "tools": {"pct": "/usr/sbin/pct"}
    })");
    EngineConfig config = load_engine_config(root_ + "/config.json");
    EXPECT_EQ(config.template_storage, "nas");
    EXPECT_EQ(config.default_memory_mb, 1024u);
    ASSERT_TRUE(config.zfs.has_value());
    EXPECT_EQ(config.zfs->pool, "tank");
    EXPECT_EQ(config.zfs->parent_dataset, "tank/lxcri");
    ASSERT_EQ(config.allowed_bundle_prefixes.size(), 1u);
    EXPECT_EQ(config.allowed_bundle_prefixes.front(), "/srv/bundles");
    EXPECT_EQ(config.tools.pct, "/usr/sbin/pct");
    EXPECT_EQ(config.tools.tar, "tar");
}

TEST_F(EngineConfigFixture, MalformedFileIsInvalidConfigFormat) {
    write_file(root_ + "/config.json", "{ nope");
    try {
        load_engine_config(root_ + "/config.json");
        FAIL() << "expected InvalidConfigFormat";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidConfigFormat);
    }

    write_file(root_ + "/config.json", R"({"command_timeout_sec": -4})");
    EXPECT_THROW(load_engine_config(root_ + "/config.json"), RuntimeError);
}
