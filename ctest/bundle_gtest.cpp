#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "lxcri/config.h"
#include "lxcri/errors.h"
#include "test_support.h"

namespace fs = std::filesystem;
using lxcri_test::write_file;

class BundleFixture : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = lxcri_test::make_test_root(std::string("bundle-") +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        bundle_ = root_ + "/bundle";
        ensure_directory(bundle_ + "/rootfs/bin");
        write_file(bundle_ + "/rootfs/bin/app", "#!/bin/sh\n");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string root_;
    std::string bundle_;
};

TEST_F(BundleFixture, MissingConfigIsReported) {
    try {
        load_bundle(bundle_);
        FAIL() << "expected ConfigMissing";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConfigMissing);
    }
}

TEST_F(BundleFixture, MalformedJsonIsInvalidConfigFormat) {
    write_file(bundle_ + "/config.json", "{ \"hostname\": ");
    try {
        load_bundle(bundle_);
        FAIL() << "expected InvalidConfigFormat";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidConfigFormat);
    }
}

TEST_F(BundleFixture, NonObjectConfigIsInvalidConfigFormat) {
    write_file(bundle_ + "/config.json", "[1, 2, 3]");
    try {
        load_bundle(bundle_);
        FAIL() << "expected InvalidConfigFormat";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidConfigFormat);
    }
}

TEST_F(BundleFixture, MissingRootfsIsReported) {
    write_file(bundle_ + "/config.json", R"({"root": {"path": "missing"}})");
    try {
        load_bundle(bundle_);
        FAIL() << "expected RootfsMissing";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RootfsMissing);
    }
}

TEST_F(BundleFixture, MinimalConfigLeavesOptionalFieldsUnset) {
    write_file(bundle_ + "/config.json", "{}");
    BundleConfig config = load_bundle(bundle_);

    EXPECT_EQ(config.rootfs_path, resolve_absolute_path(bundle_ + "/rootfs"));
    EXPECT_FALSE(config.hostname.has_value());
    EXPECT_FALSE(config.process_args.has_value());
    EXPECT_FALSE(config.mounts.has_value());
    EXPECT_FALSE(config.memory_limit.has_value());
    EXPECT_FALSE(config.cpu_limit.has_value());
    EXPECT_FALSE(config.image_name.has_value());
    EXPECT_TRUE(config.warnings.empty());
}

TEST_F(BundleFixture, ParsesProcessResourcesAndMounts) {
    write_file(bundle_ + "/config.json", R"({
        "ociVersion": "1.0.2",
        "hostname": "web1",
        "root": {"path": "rootfs", "readonly": true},
        "process": {
            "args": ["/bin/app", "--port", "8080"],
            "env": ["PATH=/usr/bin", "MODE=prod"],
            "cwd": "/srv",
            "user": {"uid": 1000, "gid": 1000, "additionalGids": [27]},
            "capabilities": {"bounding": ["CAP_NET_BIND_SERVICE"]},
            "rlimits": [{"type": "RLIMIT_NOFILE", "hard": 4096, "soft": 1024}],
            "noNewPrivileges": true
        },
        "mounts": [
            {"destination": "/data", "type": "bind", "source": "/srv/data", "options": ["rbind", "ro"]},
            {"type": "tmpfs", "source": "tmpfs"}
        ],
        "linux": {
            "resources": {"memory": {"limit": 268435456}, "cpu": {"shares": 2048}},
            "seccomp": {"defaultAction": "SCMP_ACT_ERRNO"},
            "namespaces": [{"type": "pid"}, {"type": "network", "path": "/proc/1/ns/net"}],
            "cgroupsPath": "/lxcri/web1"
        },
        "annotations": {"org.example.owner": "ops"}
    })");

    BundleConfig config = load_bundle(bundle_);

    ASSERT_TRUE(config.hostname.has_value());
    EXPECT_EQ(*config.hostname, "web1");
    ASSERT_TRUE(config.process_args.has_value());
    EXPECT_EQ(config.process_args->size(), 3u);
    EXPECT_EQ(config.process_args->front(), "/bin/app");
    ASSERT_TRUE(config.environment.has_value());
    EXPECT_EQ(config.environment->at(1), "MODE=prod");
    EXPECT_EQ(config.process_cwd.value_or(""), "/srv");
    ASSERT_TRUE(config.user.has_value());
    EXPECT_EQ(config.user->uid, 1000u);
    EXPECT_EQ(config.user->additional_gids.size(), 1u);
    ASSERT_TRUE(config.capabilities.has_value());
    EXPECT_EQ(config.capabilities->front(), "CAP_NET_BIND_SERVICE");
    ASSERT_TRUE(config.rlimits.has_value());
    EXPECT_EQ(config.rlimits->front().soft, 1024u);
    EXPECT_EQ(config.no_new_privileges.value_or(false), true);
    EXPECT_EQ(config.root_readonly.value_or(false), true);

    ASSERT_TRUE(config.mounts.has_value());
    ASSERT_EQ(config.mounts->size(), 2u);
    EXPECT_EQ(config.mounts->at(0).destination.value_or(""), "/data");
    EXPECT_EQ(config.mounts->at(0).options->size(), 2u);
    EXPECT_FALSE(config.mounts->at(1).destination.has_value());

    EXPECT_EQ(config.memory_limit.value_or(0), 268435456u);
    EXPECT_DOUBLE_EQ(config.cpu_limit.value_or(0.0), 2048.0);
    EXPECT_EQ(config.seccomp_profile.value_or(""), "SCMP_ACT_ERRNO");
    ASSERT_TRUE(config.namespaces.has_value());
    EXPECT_EQ(config.namespaces->at(1).path, "/proc/1/ns/net");
    EXPECT_EQ(config.cgroups_path.value_or(""), "/lxcri/web1");
    ASSERT_TRUE(config.annotations.has_value());
    EXPECT_EQ(config.annotations->at("org.example.owner"), "ops");
    EXPECT_TRUE(config.warnings.empty());
}

TEST_F(BundleFixture, NonPositiveMemoryLimitIsIgnored) {
    write_file(bundle_ + "/config.json", R"({"linux": {"resources": {"memory": {"limit": -1}}}})");
    BundleConfig config = load_bundle(bundle_);
    EXPECT_FALSE(config.memory_limit.has_value());
}

TEST_F(BundleFixture, WrongFieldTypeBecomesWarning) {
    write_file(bundle_ + "/config.json", R"({"hostname": 5, "process": {"args": "not-a-list"}})");
    BundleConfig config = load_bundle(bundle_);
    EXPECT_FALSE(config.hostname.has_value());
    EXPECT_FALSE(config.process_args.has_value());
    EXPECT_EQ(config.warnings.size(), 2u);
}

TEST_F(BundleFixture, MetadataSplitsImageOnFirstColon) {
    write_file(bundle_ + "/config.json", "{}");
    write_file(bundle_ + "/metadata.json", R"({
        "image": "nginx:1.25",
        "entrypoint": ["/docker-entrypoint.sh"],
        "cmd": ["nginx", "-g", "daemon off;"],
        "workingDir": "/usr/share/nginx",
        "labels": {"maintainer": "nginx"}
    })");

    BundleConfig config = load_bundle(bundle_);
    EXPECT_EQ(config.image_name.value_or(""), "nginx");
    EXPECT_EQ(config.image_tag.value_or(""), "1.25");
    ASSERT_TRUE(config.entrypoint.has_value());
    EXPECT_EQ(config.entrypoint->front(), "/docker-entrypoint.sh");
    ASSERT_TRUE(config.cmd.has_value());
    EXPECT_EQ(config.cmd->size(), 3u);
    EXPECT_EQ(config.working_directory.value_or(""), "/usr/share/nginx");
    ASSERT_TRUE(config.labels.has_value());
    EXPECT_EQ(config.labels->at("maintainer"), "nginx");

    write_file(bundle_ + "/metadata.json", R"({"image": "registry:5000/app:v1"})");
    config = load_bundle(bundle_);
    EXPECT_EQ(config.image_name.value_or(""), "registry");
    EXPECT_EQ(config.image_tag.value_or(""), "5000/app:v1");

    write_file(bundle_ + "/metadata.json", R"({"image": "alpine"})");
    config = load_bundle(bundle_);
    EXPECT_EQ(config.image_name.value_or(""), "alpine");
    EXPECT_FALSE(config.image_tag.has_value());
}

TEST_F(BundleFixture, CorruptMetadataIsNotFatal) {
    write_file(bundle_ + "/config.json", R"({"hostname": "web1"})");
    write_file(bundle_ + "/metadata.json", "this is not json");

    BundleConfig config = load_bundle(bundle_);
    EXPECT_EQ(config.hostname.value_or(""), "web1");
    EXPECT_FALSE(config.image_name.has_value());
    EXPECT_FALSE(config.warnings.empty());
}

TEST_F(BundleFixture, ArchiveRootPathIsAccepted) {
    write_file(bundle_ + "/rootfs.tar.gz", "archive");
    write_file(bundle_ + "/config.json", R"({"root": {"path": "rootfs.tar.gz"}})");

    BundleConfig config = load_bundle(bundle_);
    EXPECT_EQ(classify_rootfs_source(config.rootfs_path), RootfsSourceKind::TarGzip);
}

TEST_F(BundleFixture, ClassifiesRootfsSources) {
    EXPECT_EQ(classify_rootfs_source(bundle_ + "/rootfs"), RootfsSourceKind::Directory);
    EXPECT_EQ(classify_rootfs_source("/x/image.tar.zst"), RootfsSourceKind::TarZstd);
    EXPECT_EQ(classify_rootfs_source("/x/image.tzst"), RootfsSourceKind::TarZstd);
    EXPECT_EQ(classify_rootfs_source("/x/image.tgz"), RootfsSourceKind::TarGzip);
    EXPECT_EQ(classify_rootfs_source("/x/image.tar"), RootfsSourceKind::Tar);
    EXPECT_EQ(classify_rootfs_source("/x/image.img"), RootfsSourceKind::Unknown);
}

TEST_F(BundleFixture, RootPathMustStayInsideBundle) {
    ensure_directory(root_ + "/secret");
    write_file(root_ + "/secret/id_rsa", "key");
    fs::create_symlink(root_ + "/secret", bundle_ + "/linked");

    for (const std::string& path : {std::string("../secret"), root_ + "/secret", std::string("linked"),
                                    std::string("rootfs/../../secret")}) {
        write_file(bundle_ + "/config.json", json{{"root", {{"path", path}}}}.dump());
        try {
            load_bundle(bundle_);
            ADD_FAILURE() << "expected PathTraversalRejected for " << path;
        } catch (const RuntimeError& e) {
            EXPECT_EQ(e.code(), ErrorCode::PathTraversalRejected) << path;
        }
    }

    write_file(bundle_ + "/config.json", R"({"root": {"path": "rootfs/../rootfs"}})");
    EXPECT_EQ(load_bundle(bundle_).rootfs_path, fs::canonical(bundle_ + "/rootfs").string());
}
