#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "lxcri/errors.h"
#include "lxcri/lifecycle.h"
#include "test_support.h"

namespace fs = std::filesystem;
using lxcri_test::FakeCommandRunner;
using lxcri_test::contains;
using lxcri_test::read_file;
using lxcri_test::write_file;

class LifecycleFixture : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = lxcri_test::make_test_root(std::string("lifecycle-") +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        config_ = lxcri_test::make_engine_config(root_);
        bundle_ = root_ + "/bundles/web";
        make_bundle(bundle_, R"({"hostname": "web1", "process": {"args": ["/bin/httpd", "-f"]}})");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void make_bundle(const std::string& path, const std::string& config_json) {
        write_file(path + "/config.json", config_json);
        write_file(path + "/rootfs/bin/httpd", "#!/bin/sh\n");
        write_file(path + "/rootfs/etc/os-release", "ID=test\n");
        write_file(path + "/rootfs/etc/passwd", "root:x:0:0::/root:/bin/sh\n");
    }

    void fail_pct(const std::string& subcommand, const std::string& message) {
        runner_.handlers.push_back([=](const std::vector<std::string>& argv) -> std::optional<CommandOutput> {
            if (argv[0] == "pct" && argv.size() > 1 && argv[1] == subcommand) {
                return lxcri_test::failure(1, message);
            }
            return std::nullopt;
        });
    }

    std::string mapping_path() const { return config_.state_root + "/mapping.json"; }

    std::string root_;
    std::string bundle_;
    EngineConfig config_;
    FakeCommandRunner runner_;
};

TEST_F(LifecycleFixture, CreateStartStopDelete) {
    LifecycleOrchestrator orchestrator(config_, runner_);

    ContainerState created = orchestrator.create("c1", bundle_);
    EXPECT_EQ(created.status, ContainerStatus::Created);
    EXPECT_EQ(created.pid, 0);
    EXPECT_EQ(created.vmid, IdentityStore::seed_vmid("c1"));
    EXPECT_EQ(created.annotations.at("org.lxcri.template"), "local:vztmpl/lxcri-c1.tar.zst");
    EXPECT_EQ(orchestrator.identities().lookup("c1"), created.vmid);

    auto create_call = runner_.find_call({"pct", "create"});
    ASSERT_TRUE(create_call.has_value());
    EXPECT_EQ(create_call->at(2), std::to_string(created.vmid));
    EXPECT_EQ(create_call->at(3), "local:vztmpl/lxcri-c1.tar.zst");
    EXPECT_TRUE(contains(*create_call, "web1"));
    EXPECT_TRUE(path_is_regular_file(config_.template_dir + "/lxcri-c1.tar.zst"));
    EXPECT_FALSE(fs::exists(config_.work_dir + "/c1-rootfs"));
    ASSERT_TRUE(orchestrator.templates().find("lxcri-c1").has_value());
    EXPECT_EQ(orchestrator.templates().find("lxcri-c1")->source_type, TemplateSource::OciBundle);

    ContainerState running = orchestrator.start("c1");
    EXPECT_EQ(running.status, ContainerStatus::Running);
    EXPECT_EQ(running.pid, 4242);
    EXPECT_TRUE(runner_.called({"pct", "start", std::to_string(created.vmid)}));
    EXPECT_EQ(orchestrator.state("c1").status, ContainerStatus::Running);

    ContainerState stopped = orchestrator.stop("c1");
    EXPECT_EQ(stopped.status, ContainerStatus::Stopped);
    EXPECT_EQ(stopped.pid, 0);
    EXPECT_EQ(orchestrator.stop("c1").status, ContainerStatus::Stopped);
    EXPECT_EQ(runner_.count({"pct", "stop"}), 1u);

    orchestrator.remove("c1", false);
    EXPECT_TRUE(runner_.called({"pct", "destroy", std::to_string(created.vmid)}));
    EXPECT_FALSE(orchestrator.states().exists("c1"));
    EXPECT_FALSE(orchestrator.identities().find("c1").has_value());
    EXPECT_TRUE(orchestrator.list().empty());
}

TEST_F(LifecycleFixture, ResourcesAndMountsReachPct) {
    make_bundle(bundle_, R"({
        "hostname": "web1",
        "mounts": [
            {"destination": "/data", "type": "bind", "source": "/srv/data", "options": ["rbind", "ro"]},
            {"destination": "/proc", "type": "proc", "source": "proc"},
            {"destination": "/logs", "type": "none", "source": "/srv/logs", "options": ["bind"]}
        ],
        "linux": {"resources": {"memory": {"limit": 268435456}, "cpu": {"shares": 2048}}}
    })");
    LifecycleOrchestrator orchestrator(config_, runner_);
    ContainerState created = orchestrator.create("c1", bundle_);

    auto create_call = runner_.find_call({"pct", "create"});
    ASSERT_TRUE(create_call.has_value());
    std::vector<std::string> expected_tail = {"--hostname", "web1", "--memory", "256", "--cores", "2"};
    EXPECT_TRUE(std::equal(expected_tail.begin(), expected_tail.end(), create_call->begin() + 4));

    std::string vmid = std::to_string(created.vmid);
    std::vector<std::string> first = {"pct", "set", vmid, "-mp0", "/srv/data,mp=/data,ro=1"};
    std::vector<std::string> second = {"pct", "set", vmid, "-mp1", "/srv/logs,mp=/logs"};
    EXPECT_EQ(runner_.count({"pct", "set"}), 2u);
    EXPECT_TRUE(runner_.find_call({"pct", "set", vmid, "-mp0"}) == first);
    EXPECT_TRUE(runner_.find_call({"pct", "set", vmid, "-mp1"}) == second);
}

TEST_F(LifecycleFixture, TraversalIsRejectedBeforeAnyMutation) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    make_bundle(root_ + "/elsewhere", "{}");

    ::testing::internal::CaptureStderr();
    for (const std::string& ref : {bundle_ + "/../../elsewhere", std::string("../../etc")}) {
        try {
            orchestrator.create("c1", ref);
            ADD_FAILURE() << "expected PathTraversalRejected for " << ref;
        } catch (const RuntimeError& e) {
            EXPECT_EQ(e.code(), ErrorCode::PathTraversalRejected);
        }
    }
    ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(runner_.calls.empty());
    EXPECT_FALSE(fs::exists(mapping_path()));
    EXPECT_FALSE(orchestrator.states().exists("c1"));
}

TEST_F(LifecycleFixture, ImageReferenceIsRejected) {
    LifecycleOrchestrator orchestrator(config_, runner_);

    ::testing::internal::CaptureStderr();
    try {
        orchestrator.create("c1", "nginx:latest");
        FAIL() << "expected UnsupportedImageReference";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedImageReference);
        EXPECT_EQ(std::string(e.what()).rfind("create c1: ", 0), 0u);
    }
    ::testing::internal::GetCapturedStderr();
    EXPECT_TRUE(runner_.calls.empty());
    EXPECT_FALSE(fs::exists(mapping_path()));
}

TEST_F(LifecycleFixture, UnsupportedSourceIsRejected) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    write_file(root_ + "/bundles/notes.txt", "hello");

    ::testing::internal::CaptureStderr();
    try {
        orchestrator.create("c1", root_ + "/bundles/notes.txt");
        FAIL() << "expected UnsupportedSource";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedSource);
    }
    ::testing::internal::GetCapturedStderr();
    EXPECT_FALSE(fs::exists(mapping_path()));
}

TEST_F(LifecycleFixture, TemplateReferencePassesThrough) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    TemplateInfo cached;
    cached.name = "debian-12-standard";
    cached.created_at = 1000;
    cached.last_accessed = 1000;
    orchestrator.templates().add(cached);
    ContainerState created = orchestrator.create("c1", "local:vztmpl/debian-12-standard.tar.zst");

    auto create_call = runner_.find_call({"pct", "create"});
    ASSERT_TRUE(create_call.has_value());
    EXPECT_EQ(create_call->at(3), "local:vztmpl/debian-12-standard.tar.zst");
    EXPECT_TRUE(contains(*create_call, "c1"));
    EXPECT_FALSE(runner_.called({"tar"}));
    EXPECT_EQ(created.bundle_path, "local:vztmpl/debian-12-standard.tar.zst");
    ASSERT_TRUE(orchestrator.templates().find("debian-12-standard").has_value());
    EXPECT_GT(orchestrator.templates().find("debian-12-standard")->last_accessed, 1000);
}

TEST_F(LifecycleFixture, FailedMountRollsBackContainerAndIdentity) {
    make_bundle(bundle_, R"({"mounts": [{"destination": "/data", "type": "bind", "source": "/srv/data"}]})");
    fail_pct("set", "mount point busy");
    LifecycleOrchestrator orchestrator(config_, runner_);

    ::testing::internal::CaptureStderr();
    try {
        orchestrator.create("c1", bundle_);
        FAIL() << "expected MountConfigFailed";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MountConfigFailed);
    }
    ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(runner_.called({"pct", "destroy", std::to_string(IdentityStore::seed_vmid("c1"))}));
    EXPECT_FALSE(orchestrator.identities().find("c1").has_value());
    EXPECT_FALSE(orchestrator.states().exists("c1"));
}

TEST_F(LifecycleFixture, FailedCreateReleasesIdentityWithoutDestroy) {
    fail_pct("create", "storage 'local' does not support container directories");
    LifecycleOrchestrator orchestrator(config_, runner_);

    ::testing::internal::CaptureStderr();
    EXPECT_THROW(orchestrator.create("c1", bundle_), RuntimeError);
    ::testing::internal::GetCapturedStderr();

    EXPECT_FALSE(runner_.called({"pct", "destroy"}));
    EXPECT_FALSE(orchestrator.identities().find("c1").has_value());
}

TEST_F(LifecycleFixture, FailedCreateKeepsMappingItDidNotAssign) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    uint32_t vmid = orchestrator.identities().assign("c1", bundle_);
    fail_pct("create", "CT " + std::to_string(vmid) + " already exists on node 'pve'");

    ::testing::internal::CaptureStderr();
    try {
        orchestrator.create("c1", bundle_);
        FAIL() << "expected AlreadyExists";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AlreadyExists);
    }
    ::testing::internal::GetCapturedStderr();

    ASSERT_TRUE(orchestrator.identities().find("c1").has_value());
    EXPECT_EQ(orchestrator.identities().lookup("c1"), vmid);
}

TEST_F(LifecycleFixture, ConcurrentCreatesOfOneIdRunOneAtATime) {
    FakeCommandRunner first_runner;
    FakeCommandRunner second_runner;
    LifecycleOrchestrator first(config_, first_runner);
    LifecycleOrchestrator second(config_, second_runner);

    std::atomic<int> created{0};
    std::atomic<int> rejected{0};
    auto attempt = [&](LifecycleOrchestrator& orchestrator) {
        try {
            orchestrator.create("c1", bundle_);
            ++created;
        } catch (const RuntimeError& e) {
            if (e.code() == ErrorCode::AlreadyExists) {
                ++rejected;
            }
        }
    };

    ::testing::internal::CaptureStderr();
    std::thread a(attempt, std::ref(first));
    std::thread b(attempt, std::ref(second));
    a.join();
    b.join();
    ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(rejected.load(), 1);
    EXPECT_EQ(first_runner.count({"pct", "create"}) + second_runner.count({"pct", "create"}), 1u);
    ContainerState state = first.states().load("c1");
    EXPECT_EQ(first.identities().lookup("c1"), state.vmid);
}

TEST_F(LifecycleFixture, DuplicateCreateIsRejected) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    orchestrator.create("c1", bundle_);

    ::testing::internal::CaptureStderr();
    try {
        orchestrator.create("c1", bundle_);
        FAIL() << "expected AlreadyExists";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AlreadyExists);
    }
    ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(runner_.count({"pct", "create"}), 1u);
    EXPECT_TRUE(orchestrator.identities().find("c1").has_value());
}

TEST_F(LifecycleFixture, BundlesSharingAnImageGetTheirOwnTemplate) {
    std::string other = root_ + "/bundles/worker";
    make_bundle(other, R"({"process": {"args": ["/bin/worker"]}})");
    write_file(other + "/rootfs/bin/worker", "#!/bin/sh\n");
    write_file(bundle_ + "/metadata.json", R"({"image": "app:1"})");
    write_file(other + "/metadata.json", R"({"image": "app:1"})");

    std::vector<std::string> packaged_inits;
    std::vector<bool> worker_present;
    runner_.handlers.push_back([&](const std::vector<std::string>& argv) -> std::optional<CommandOutput> {
        if (lxcri_test::starts_with(argv, {"tar", "--zstd", "-cf"}) && argv.size() > 5) {
            packaged_inits.push_back(read_file(argv[5] + "/sbin/init"));
            worker_present.push_back(path_is_regular_file(argv[5] + "/bin/worker"));
        }
        return std::nullopt;
    });
    LifecycleOrchestrator orchestrator(config_, runner_);

    orchestrator.create("c1", bundle_);
    orchestrator.create("c2", other);

    EXPECT_EQ(runner_.count({"tar", "--zstd", "-cf"}), 2u);
    EXPECT_EQ(orchestrator.states().load("c1").annotations.at("org.lxcri.template"),
              "local:vztmpl/app-1-c1.tar.zst");
    EXPECT_EQ(orchestrator.states().load("c2").annotations.at("org.lxcri.template"),
              "local:vztmpl/app-1-c2.tar.zst");

    ASSERT_EQ(packaged_inits.size(), 2u);
    EXPECT_NE(packaged_inits[0].find("exec /bin/httpd -f\n"), std::string::npos);
    EXPECT_NE(packaged_inits[1].find("exec /bin/worker\n"), std::string::npos);
    EXPECT_EQ(packaged_inits[1].find("/bin/httpd"), std::string::npos);
    ASSERT_EQ(worker_present.size(), 2u);
    EXPECT_FALSE(worker_present[0]);
    EXPECT_TRUE(worker_present[1]);

    auto info = orchestrator.templates().find("app-1-c2");
    ASSERT_TRUE(info.has_value());
    ASSERT_TRUE(info->metadata.has_value());
    EXPECT_EQ(info->metadata->image_name.value_or(""), "app");
}

TEST_F(LifecycleFixture, RecreatingRebuildsTemplate) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    orchestrator.create("c1", bundle_);
    orchestrator.remove("c1", false);

    write_file(bundle_ + "/config.json", R"({"process": {"args": ["/bin/other"]}})");
    std::string init;
    runner_.handlers.push_back([&](const std::vector<std::string>& argv) -> std::optional<CommandOutput> {
        if (lxcri_test::starts_with(argv, {"tar", "--zstd", "-cf"}) && argv.size() > 5) {
            init = read_file(argv[5] + "/sbin/init");
        }
        return std::nullopt;
    });
    orchestrator.create("c1", bundle_);

    EXPECT_EQ(runner_.count({"tar", "--zstd", "-cf"}), 2u);
    EXPECT_NE(init.find("exec /bin/other\n"), std::string::npos);
}

TEST_F(LifecycleFixture, ZfsDatasetIsRecorded) {
    ZfsSettings zfs;
    zfs.pool = "tank";
    zfs.parent_dataset = "tank/lxcri";
    config_.zfs = zfs;
    runner_.zfs_datasets = {"tank"};
    LifecycleOrchestrator orchestrator(config_, runner_);

    ContainerState created = orchestrator.create("c1", bundle_);
    EXPECT_EQ(created.annotations.at("org.lxcri.zfs.dataset"), "tank/lxcri/c1");
    EXPECT_TRUE(runner_.called({"zfs", "create", "tank/lxcri/c1"}));
}

TEST_F(LifecycleFixture, MissingZfsPoolIsNotFatal) {
    ZfsSettings zfs;
    zfs.pool = "tank";
    config_.zfs = zfs;
    LifecycleOrchestrator orchestrator(config_, runner_);

    ::testing::internal::CaptureStderr();
    ContainerState created = orchestrator.create("c1", bundle_);
    ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(created.annotations.count("org.lxcri.zfs.dataset"), 0u);
}

TEST_F(LifecycleFixture, KillWithSigtermShutsDown) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    orchestrator.create("c1", bundle_);
    orchestrator.start("c1");

    ContainerState killed = orchestrator.kill("c1", SIGTERM);
    EXPECT_EQ(killed.status, ContainerStatus::Stopped);
    EXPECT_TRUE(runner_.called({"pct", "shutdown"}));
    EXPECT_FALSE(runner_.called({"pct", "stop"}));

    orchestrator.start("c1");
    orchestrator.kill("c1", SIGKILL);
    EXPECT_TRUE(runner_.called({"pct", "stop"}));

    ::testing::internal::CaptureStderr();
    EXPECT_THROW(orchestrator.kill("c1", SIGKILL), RuntimeError);
    ::testing::internal::GetCapturedStderr();
}

TEST_F(LifecycleFixture, StateNoticesExternalStop) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    orchestrator.create("c1", bundle_);
    orchestrator.start("c1");

    runner_.pct_status = "stopped";
    ContainerState state = orchestrator.state("c1");
    EXPECT_EQ(state.status, ContainerStatus::Stopped);
    EXPECT_EQ(orchestrator.states().load("c1").pid, 0);
}

TEST_F(LifecycleFixture, RunningContainerNeedsForceToDelete) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    orchestrator.create("c1", bundle_);
    orchestrator.start("c1");

    ::testing::internal::CaptureStderr();
    try {
        orchestrator.remove("c1", false);
        FAIL() << "expected InvalidArgument";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
    ::testing::internal::GetCapturedStderr();
    EXPECT_FALSE(runner_.called({"pct", "destroy"}));

    orchestrator.remove("c1", true);
    EXPECT_TRUE(runner_.called({"pct", "stop"}));
    EXPECT_TRUE(runner_.called({"pct", "destroy"}));
    EXPECT_FALSE(orchestrator.states().exists("c1"));
}

TEST_F(LifecycleFixture, DeleteOfUnknownContainerIsNotFound) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    ::testing::internal::CaptureStderr();
    try {
        orchestrator.remove("ghost", false);
        FAIL() << "expected NotFound";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
    ::testing::internal::GetCapturedStderr();
}

TEST_F(LifecycleFixture, StartFailureIsRecordedAsEvent) {
    fail_pct("start", "startup for container '100' failed");
    LifecycleOrchestrator orchestrator(config_, runner_);
    orchestrator.create("c1", bundle_);

    ::testing::internal::CaptureStderr();
    try {
        orchestrator.start("c1");
        FAIL() << "expected LxcStartFailed";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::LxcStartFailed);
    }
    ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(orchestrator.states().load("c1").status, ContainerStatus::Created);
    std::string events = read_file(orchestrator.states().events_path("c1"));
    EXPECT_NE(events.find("\"type\":\"error\""), std::string::npos);
    EXPECT_NE(events.find("LxcStartFailed"), std::string::npos);
}

TEST_F(LifecycleFixture, ExecRequiresRunningContainer) {
    LifecycleOrchestrator orchestrator(config_, runner_);
    orchestrator.create("c1", bundle_);

    ::testing::internal::CaptureStderr();
    EXPECT_THROW(orchestrator.exec("c1", {"ls"}), RuntimeError);
    ::testing::internal::GetCapturedStderr();

    orchestrator.start("c1");
    CommandOutput output = orchestrator.exec("c1", {"ls", "/"});
    EXPECT_TRUE(output.succeeded());
    EXPECT_TRUE(runner_.called({"pct", "exec"}));
}

TEST(BundleRefTest, ClassifiesReferences) {
    std::vector<std::string> prefixes = {"/nonexistent-lxcri-prefix"};
    EXPECT_EQ(classify_bundle_ref("local:vztmpl/alpine.tar.zst", prefixes).kind, BundleRefKind::TemplateRef);
    EXPECT_EQ(classify_bundle_ref("nginx:latest", prefixes).kind, BundleRefKind::ImageReference);
    EXPECT_EQ(classify_bundle_ref("docker.io/library/nginx:1.25", prefixes).kind, BundleRefKind::ImageReference);
    EXPECT_EQ(classify_bundle_ref("", prefixes).kind, BundleRefKind::Unsupported);
    EXPECT_THROW(classify_bundle_ref("/etc", prefixes), RuntimeError);
}
