#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "lxcri/errors.h"
#include "lxcri/state.h"
#include "lxcri/template_cache.h"
#include "test_support.h"

namespace fs = std::filesystem;
using lxcri_test::write_file;

namespace {

constexpr int64_t kDay = 24 * 60 * 60;

TemplateInfo make_info(const std::string& name, int64_t last_accessed) {
    TemplateInfo info;
    info.name = name;
    info.size = 1024;
    info.created_at = last_accessed;
    info.last_accessed = last_accessed;
    info.source_type = TemplateSource::OciBundle;
    return info;
}

} // namespace

class TemplateCacheFixture : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = lxcri_test::make_test_root(std::string("templates-") +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        template_dir_ = root_ + "/cache";
        index_ = root_ + "/templates.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string root_;
    std::string template_dir_;
    std::string index_;
};

TEST_F(TemplateCacheFixture, AddFindAndList) {
    TemplateCache cache(index_, template_dir_);
    TemplateInfo info = make_info("nginx-1.25", 1000);
    TemplateMetadata metadata;
    metadata.image_name = "nginx";
    metadata.image_tag = "1.25";
    metadata.labels["maintainer"] = "nginx";
    info.metadata = metadata;
    cache.add(info);
    cache.add(make_info("alpine", 2000));

    auto found = cache.find("nginx-1.25");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->archive_path, template_dir_ + "/nginx-1.25.tar.zst");
    EXPECT_EQ(found->size, 1024u);
    EXPECT_EQ(found->source_type, TemplateSource::OciBundle);
    ASSERT_TRUE(found->metadata.has_value());
    EXPECT_EQ(found->metadata->image_tag.value_or(""), "1.25");
    EXPECT_EQ(found->metadata->labels.at("maintainer"), "nginx");

    EXPECT_EQ(cache.list().size(), 2u);
    EXPECT_FALSE(cache.find("missing").has_value());
}

TEST_F(TemplateCacheFixture, GetTouchesLastAccessed) {
    TemplateCache cache(index_, template_dir_);
    cache.add(make_info("alpine", 1000));

    int64_t before = unix_now();
    auto info = cache.get("alpine");
    ASSERT_TRUE(info.has_value());
    EXPECT_GE(info->last_accessed, before);
    EXPECT_GE(cache.find("alpine")->last_accessed, before);
    EXPECT_EQ(cache.find("alpine")->created_at, 1000);
    EXPECT_FALSE(cache.get("missing").has_value());
}

TEST_F(TemplateCacheFixture, PruneDropsStaleEntriesOnly) {
    TemplateCache cache(index_, template_dir_);
    const int64_t now = 100 * kDay;
    cache.add(make_info("stale", now - 40 * kDay));
    cache.add(make_info("fresh", now - 2 * kDay));
    write_file(cache.archive_path_for("stale"), "archive bytes");

    auto pruned = cache.prune(30, now);
    ASSERT_EQ(pruned.size(), 1u);
    EXPECT_EQ(pruned.front(), "stale");
    EXPECT_FALSE(cache.find("stale").has_value());
    EXPECT_TRUE(cache.find("fresh").has_value());
    EXPECT_TRUE(fs::exists(cache.archive_path_for("stale")));

    EXPECT_TRUE(cache.prune(0, now - 3 * kDay).empty());
}

TEST_F(TemplateCacheFixture, NegativePruneAgeIsRejected) {
    TemplateCache cache(index_, template_dir_);
    try {
        cache.prune(-1);
        FAIL() << "expected InvalidArgument";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}

TEST_F(TemplateCacheFixture, VerifyChecksArchiveOnDisk) {
    TemplateCache cache(index_, template_dir_);
    EXPECT_FALSE(cache.verify("nginx"));

    cache.add(make_info("nginx", 1000));
    ::testing::internal::CaptureStderr();
    EXPECT_FALSE(cache.verify("nginx"));
    write_file(cache.archive_path_for("nginx"), "");
    EXPECT_FALSE(cache.verify("nginx"));
    ::testing::internal::GetCapturedStderr();

    write_file(cache.archive_path_for("nginx"), "archive bytes");
    EXPECT_TRUE(cache.verify("nginx"));
}

TEST_F(TemplateCacheFixture, RemoveOptionallyDeletesArchive) {
    TemplateCache cache(index_, template_dir_);
    cache.add(make_info("keep", 1000));
    cache.add(make_info("drop", 1000));
    write_file(cache.archive_path_for("keep"), "bytes");
    write_file(cache.archive_path_for("drop"), "bytes");

    EXPECT_TRUE(cache.remove("keep"));
    EXPECT_TRUE(fs::exists(cache.archive_path_for("keep")));
    EXPECT_TRUE(cache.remove("drop", true));
    EXPECT_FALSE(fs::exists(cache.archive_path_for("drop")));
    EXPECT_FALSE(cache.remove("drop", true));
    EXPECT_TRUE(cache.list().empty());
}

TEST(TemplateSourceTest, NamesRoundTrip) {
    for (TemplateSource source : {TemplateSource::OciBundle, TemplateSource::Downloaded,
                                  TemplateSource::Available, TemplateSource::Custom}) {
        auto parsed = parse_template_source(template_source_name(source));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, source);
    }
    EXPECT_FALSE(parse_template_source("docker").has_value());
}

TEST(TemplateMetadataTest, CopiedFromBundle) {
    BundleConfig bundle;
    bundle.image_name = "redis";
    bundle.image_tag = "7";
    bundle.cmd = std::vector<std::string>{"redis-server"};
    bundle.labels = std::map<std::string, std::string>{{"tier", "cache"}};

    TemplateMetadata metadata = template_metadata_from_bundle(bundle);
    EXPECT_EQ(metadata.image_name.value_or(""), "redis");
    EXPECT_EQ(metadata.cmd->front(), "redis-server");
    EXPECT_EQ(metadata.labels.at("tier"), "cache");
    EXPECT_FALSE(metadata.entrypoint.has_value());
}
