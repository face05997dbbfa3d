#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>

#include "lxcri/errors.h"
#include "lxcri/identity.h"
#include "lxcri/json_store.h"
#include "test_support.h"

namespace fs = std::filesystem;

namespace {

class StaticInventory : public VmidInventory {
public:
    std::set<uint32_t> vmids;
    bool fail = false;
    int calls = 0;

    std::set<uint32_t> list_vmids() override {
        ++calls;
        if (fail) {
            throw RuntimeError(ErrorCode::OperationFailed, "pct list failed: connection refused");
        }
        return vmids;
    }
};

} // namespace

class IdentityFixture : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = lxcri_test::make_test_root(std::string("identity-") +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        mapping_ = root_ + "/mapping.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string root_;
    std::string mapping_;
    StaticInventory inventory_;
};

TEST(IdentityHashTest, SeedStaysInRange) {
    for (const char* id : {"a", "web", "db-primary", "x_y.z", "0123456789"}) {
        uint32_t seed = IdentityStore::seed_vmid(id);
        EXPECT_GE(seed, IdentityStore::kMinVmid) << id;
        EXPECT_LE(seed, IdentityStore::kMaxVmid) << id;
        EXPECT_EQ(seed, IdentityStore::seed_vmid(id)) << id;
    }
    EXPECT_NE(IdentityStore::hash_container_id("web"), IdentityStore::hash_container_id("web2"));
}

TEST(IdentityHashTest, ProbingWrapsToMinimum) {
    EXPECT_EQ(IdentityStore::next_candidate(500), 501u);
    EXPECT_EQ(IdentityStore::next_candidate(IdentityStore::kMaxVmid), IdentityStore::kMinVmid);
}

TEST_F(IdentityFixture, AssignIsIdempotent) {
    IdentityStore store(mapping_, &inventory_);
    uint32_t first = store.assign("web", "/bundles/web");
    uint32_t second = store.assign("web", "/bundles/other");

    EXPECT_EQ(first, second);
    EXPECT_EQ(first, IdentityStore::seed_vmid("web"));
    EXPECT_EQ(inventory_.calls, 1);

    auto entry = store.find("web");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->bundle_path, "/bundles/web");
    EXPECT_GT(entry->created_at, 0);
}

TEST_F(IdentityFixture, AssignReportsWhetherItCreatedTheEntry) {
    IdentityStore store(mapping_, &inventory_);
    IdentityStore other(mapping_, &inventory_);

    bool created = false;
    uint32_t vmid = store.assign("web", "/bundles/web", &created);
    EXPECT_TRUE(created);

    created = true;
    EXPECT_EQ(other.assign("web", "/bundles/web", &created), vmid);
    EXPECT_FALSE(created);
}

TEST_F(IdentityFixture, AssignmentSurvivesReopen) {
    uint32_t vmid = 0;
    {
        IdentityStore store(mapping_, nullptr);
        vmid = store.assign("db");
    }
    IdentityStore reopened(mapping_, nullptr);
    EXPECT_EQ(reopened.lookup("db"), vmid);

    JsonFileStore raw(mapping_);
    json doc = raw.read();
    ASSERT_TRUE(doc.contains("db"));
    EXPECT_EQ(doc["db"]["vmid"].get<uint32_t>(), vmid);
}

TEST_F(IdentityFixture, DistinctIdsGetDistinctVmids) {
    IdentityStore store(mapping_, &inventory_);
    std::set<uint32_t> seen;
    for (int i = 0; i < 50; ++i) {
        seen.insert(store.assign("container-" + std::to_string(i)));
    }
    EXPECT_EQ(seen.size(), 50u);
    EXPECT_EQ(store.list().size(), 50u);
}

TEST_F(IdentityFixture, MappedVmidIsSkipped) {
    uint32_t seed = IdentityStore::seed_vmid("alpha");
    JsonFileStore raw(mapping_);
    raw.write(json{{"squatter", {{"vmid", seed}, {"created_at", 1}, {"bundle_path", ""}}}});

    IdentityStore store(mapping_, nullptr);
    EXPECT_EQ(store.assign("alpha"), IdentityStore::next_candidate(seed));
}

TEST_F(IdentityFixture, LiveVmidIsSkipped) {
    uint32_t seed = IdentityStore::seed_vmid("alpha");
    inventory_.vmids = {seed, IdentityStore::next_candidate(seed)};

    IdentityStore store(mapping_, &inventory_);
    EXPECT_EQ(store.assign("alpha"),
              IdentityStore::next_candidate(IdentityStore::next_candidate(seed)));
}

TEST_F(IdentityFixture, InventoryFailureOnlyWarns) {
    inventory_.fail = true;
    IdentityStore store(mapping_, &inventory_);

    ::testing::internal::CaptureStderr();
    uint32_t vmid = store.assign("alpha");
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(vmid, IdentityStore::seed_vmid("alpha"));
    EXPECT_NE(err.find("connection refused"), std::string::npos);
}

TEST_F(IdentityFixture, ExhaustedProbeFailsWithoutPersisting) {
    uint32_t candidate = IdentityStore::seed_vmid("crowded");
    for (int i = 0; i < IdentityStore::kMaxProbeAttempts; ++i) {
        inventory_.vmids.insert(candidate);
        candidate = IdentityStore::next_candidate(candidate);
    }
    IdentityStore store(mapping_, &inventory_);

    try {
        store.assign("crowded");
        FAIL() << "expected IdentityExhausted";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IdentityExhausted);
    }
    EXPECT_FALSE(store.find("crowded").has_value());
}

TEST_F(IdentityFixture, RemoveIsIdempotent) {
    IdentityStore store(mapping_, nullptr);
    store.assign("web");

    EXPECT_TRUE(store.remove("web"));
    EXPECT_FALSE(store.remove("web"));
    EXPECT_FALSE(store.find("web").has_value());
}

TEST_F(IdentityFixture, LookupOfUnknownIdIsNotFound) {
    IdentityStore store(mapping_, nullptr);
    try {
        store.lookup("ghost");
        FAIL() << "expected NotFound";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(IdentityFixture, CorruptMappingIsInvalidStateFormat) {
    lxcri_test::write_file(mapping_, "{ broken");
    IdentityStore store(mapping_, nullptr);
    try {
        store.assign("web");
        FAIL() << "expected InvalidStateFormat";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidStateFormat);
    }
}
