#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "lxcri/errors.h"
#include "lxcri/state.h"
#include "test_support.h"

namespace fs = std::filesystem;
using lxcri_test::read_file;
using lxcri_test::write_file;

namespace {

std::vector<json> read_events(const std::string& path) {
    std::vector<json> events;
    std::ifstream ifs(path);
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty()) {
            events.push_back(json::parse(line));
        }
    }
    return events;
}

} // namespace

class StateFixture : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = lxcri_test::make_test_root(std::string("state-") +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string root_;
};

TEST_F(StateFixture, CreateWritesCreatedRecord) {
    StateStore store(root_);
    ContainerState created = store.create("web", 4711, "/bundles/web", {{"org.example", "yes"}});

    EXPECT_EQ(created.status, ContainerStatus::Created);
    EXPECT_EQ(created.pid, 0);
    EXPECT_TRUE(store.exists("web"));

    json doc = json::parse(read_file(store.state_path("web")));
    EXPECT_EQ(doc["ociVersion"], "1.0.2");
    EXPECT_EQ(doc["id"], "web");
    EXPECT_EQ(doc["status"], "created");
    EXPECT_EQ(doc["pid"], 0);
    EXPECT_EQ(doc["bundle"], "/bundles/web");
    EXPECT_EQ(doc["vmid"], 4711);
    EXPECT_EQ(doc["annotations"]["org.example"], "yes");
    EXPECT_GT(doc["created_at"].get<int64_t>(), 0);

    ContainerState loaded = store.load("web");
    EXPECT_EQ(loaded.id, "web");
    EXPECT_EQ(loaded.vmid, 4711u);
    EXPECT_EQ(loaded.bundle_path, "/bundles/web");
    EXPECT_EQ(loaded.created_at, created.created_at);
}

TEST_F(StateFixture, UpdateRewritesStatusAndPid) {
    StateStore store(root_);
    store.create("web", 4711, "/bundles/web");

    ContainerState running = store.update("web", ContainerStatus::Running, 1234);
    EXPECT_EQ(running.status, ContainerStatus::Running);
    EXPECT_EQ(store.load("web").pid, 1234);
    EXPECT_EQ(store.load("web").vmid, 4711u);

    store.update("web", ContainerStatus::Stopped, 0);
    ContainerState stopped = store.load("web");
    EXPECT_EQ(stopped.status, ContainerStatus::Stopped);
    EXPECT_EQ(stopped.pid, 0);
}

TEST_F(StateFixture, PidMustMatchRunningStatus) {
    StateStore store(root_);
    store.create("web", 4711, "/bundles/web");

    try {
        store.update("web", ContainerStatus::Running, 0);
        FAIL() << "expected InvalidArgument";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
    EXPECT_THROW(store.update("web", ContainerStatus::Stopped, 99), RuntimeError);
    EXPECT_EQ(store.load("web").status, ContainerStatus::Created);
}

TEST_F(StateFixture, MissingRecordIsStateMissing) {
    StateStore store(root_);
    try {
        store.load("ghost");
        FAIL() << "expected StateMissing";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::StateMissing);
    }
    try {
        store.update("ghost", ContainerStatus::Stopped, 0);
        FAIL() << "expected StateMissing";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::StateMissing);
    }
}

TEST_F(StateFixture, CorruptRecordIsInvalidStateFormat) {
    StateStore store(root_);
    write_file(store.state_path("broken"), "{\"id\": ");
    try {
        store.load("broken");
        FAIL() << "expected InvalidStateFormat";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidStateFormat);
    }

    write_file(store.state_path("odd"), R"({"id": "odd", "status": "exploded", "pid": 0})");
    EXPECT_THROW(store.load("odd"), RuntimeError);
}

TEST_F(StateFixture, RemoveIsIdempotent) {
    StateStore store(root_);
    store.create("web", 4711, "/bundles/web");

    store.remove("web");
    EXPECT_FALSE(store.exists("web"));
    EXPECT_FALSE(fs::exists(store.container_dir("web")));

    ::testing::internal::CaptureStderr();
    EXPECT_NO_THROW(store.remove("web"));
    ::testing::internal::GetCapturedStderr();
}

TEST_F(StateFixture, ListIsSortedAndSkipsBrokenRecords) {
    StateStore store(root_);
    store.create("zeta", 300, "/b/zeta");
    store.create("alpha", 100, "/b/alpha");
    write_file(store.state_path("broken"), "not json");
    ensure_directory(root_ + "/empty-dir");

    ::testing::internal::CaptureStderr();
    auto states = store.list();
    std::string err = ::testing::internal::GetCapturedStderr();

    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(states[0].id, "alpha");
    EXPECT_EQ(states[1].id, "zeta");
    EXPECT_NE(err.find("broken"), std::string::npos);
}

TEST_F(StateFixture, TransitionsAreAppendedToEventLog) {
    StateStore store(root_);
    store.create("web", 4711, "/bundles/web");
    store.update("web", ContainerStatus::Running, 1234);
    store.update("web", ContainerStatus::Stopped, 0);

    auto events = read_events(store.events_path("web"));
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0]["type"], "created");
    EXPECT_EQ(events[1]["type"], "running");
    EXPECT_EQ(events[1]["data"]["pid"], 1234);
    EXPECT_EQ(events[2]["type"], "stopped");
    EXPECT_EQ(events[2]["id"], "web");
    EXPECT_TRUE(events[2].contains("timestamp"));
}

TEST(ContainerStateTest, JsonRoundTripKeepsAnnotations) {
    ContainerState state;
    state.id = "web";
    state.status = ContainerStatus::Running;
    state.pid = 77;
    state.vmid = 123;
    state.annotations["org.lxcri.template"] = "local:vztmpl/web.tar.zst";

    ContainerState copy = ContainerState::from_json_object(json::parse(state.to_json()));
    EXPECT_EQ(copy.status, ContainerStatus::Running);
    EXPECT_EQ(copy.pid, 77);
    EXPECT_EQ(copy.annotations.at("org.lxcri.template"), "local:vztmpl/web.tar.zst");
    EXPECT_TRUE(parse_container_status("paused") == ContainerStatus::Paused);
    EXPECT_FALSE(parse_container_status("exploded").has_value());
}
