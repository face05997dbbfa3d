#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "lxcri/errors.h"
#include "lxcri/lifecycle.h"
#include "lxcri/pct.h"
#include "lxcri/zfs.h"
#include "test_support.h"

using lxcri_test::FakeCommandRunner;

class ToolsFixture : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = default_engine_config();
        config_.command_timeout_sec = 30;
    }

    void fail_with(const std::string& subcommand, int exit_code, const std::string& message) {
        runner_.handlers.push_back([=](const std::vector<std::string>& argv) -> std::optional<CommandOutput> {
            if (argv.size() > 1 && argv[1] == subcommand) {
                return lxcri_test::failure(exit_code, message);
            }
            return std::nullopt;
        });
    }

    EngineConfig config_;
    FakeCommandRunner runner_;
};

TEST(ToolErrorTest, TranslatesKnownDiagnostics) {
    EXPECT_EQ(translate_tool_error("Configuration file 'nodes/pve/lxc/105.conf' does not exist"),
              ErrorCode::NotFound);
    EXPECT_EQ(translate_tool_error("unable to open file - Permission denied"), ErrorCode::PermissionDenied);
    EXPECT_EQ(translate_tool_error("CT 105 already exists on node 'pve'"), ErrorCode::AlreadyExists);
    EXPECT_EQ(translate_tool_error("400 Parameter verification failed."), ErrorCode::InvalidArgument);
    EXPECT_EQ(translate_tool_error("something odd happened"), ErrorCode::OperationFailed);
    EXPECT_EQ(translate_tool_error("something odd happened", ErrorCode::LxcStartFailed),
              ErrorCode::LxcStartFailed);
}

TEST(ToolErrorTest, ContextIsPrependedAndCodeKept) {
    try {
        rethrow_with_context(RuntimeError(ErrorCode::NotFound, "no such container"), "start", "web");
        FAIL() << "expected rethrow";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
        EXPECT_STREQ(e.what(), "start web: no such container");
    }
    EXPECT_STREQ(error_code_name(ErrorCode::PathTraversalRejected), "PathTraversalRejected");
}

TEST_F(ToolsFixture, CreateArgumentsFollowRequest) {
    PctClient pct(config_, runner_);
    PctCreateRequest request;
    request.vmid = 4242;
    request.ostemplate = "local:vztmpl/nginx-1.25.tar.zst";
    request.hostname = "web1";
    request.memory_mb = 256;
    request.cores = 2;
    request.network = "name=eth0,bridge=vmbr0,ip=dhcp";
    request.unprivileged = true;

    std::vector<std::string> expected = {
            "pct", "create", "4242", "local:vztmpl/nginx-1.25.tar.zst",
            "--hostname", "web1", "--memory", "256", "--cores", "2",
            "--net0", "name=eth0,bridge=vmbr0,ip=dhcp", "--unprivileged", "1"};
    EXPECT_EQ(pct.create_arguments(request), expected);

    request.rootfs = "local-zfs:8";
    request.unprivileged = false;
    auto argv = pct.create_arguments(request);
    EXPECT_EQ(argv.at(13), "0");
    EXPECT_EQ(argv.at(14), "--rootfs");
    EXPECT_EQ(argv.at(15), "local-zfs:8");
}

TEST_F(ToolsFixture, CreateRejectsUnsafeArgumentsBeforeRunning) {
    PctClient pct(config_, runner_);
    PctCreateRequest request;
    request.vmid = 100;
    request.ostemplate = "local:vztmpl/a.tar.zst";
    request.hostname = "bad host";
    request.network = config_.network;
    EXPECT_THROW(pct.create(request), RuntimeError);

    request.hostname = "good";
    request.network = "name=eth0;reboot";
    EXPECT_THROW(pct.create(request), RuntimeError);
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(ToolsFixture, FailuresAreTranslated) {
    fail_with("start", 2, "Configuration file 'nodes/pve/lxc/105.conf' does not exist");
    fail_with("stop", 255, "CT is locked (backup)");
    PctClient pct(config_, runner_);

    try {
        pct.start(105);
        FAIL() << "expected NotFound";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
    try {
        pct.stop(105);
        FAIL() << "expected LxcStopFailed";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::LxcStopFailed);
        EXPECT_NE(std::string(e.what()).find("locked"), std::string::npos);
    }
}

TEST_F(ToolsFixture, TimeoutUsesOperationCode) {
    runner_.handlers.push_back([](const std::vector<std::string>&) -> std::optional<CommandOutput> {
        CommandOutput output;
        output.timed_out = true;
        output.stderr_output = "not found";
        return output;
    });
    PctClient pct(config_, runner_);
    try {
        pct.destroy(105);
        FAIL() << "expected LxcDeleteFailed";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::LxcDeleteFailed);
    }
}

TEST_F(ToolsFixture, SetMountBuildsMountPointSpec) {
    PctClient pct(config_, runner_);
    pct.set_mount(105, 0, "/srv/data", "/data", true);
    pct.set_mount(105, 1, "/srv/logs", "/var/log/app", false);

    std::vector<std::string> first = {"pct", "set", "105", "-mp0", "/srv/data,mp=/data,ro=1"};
    std::vector<std::string> second = {"pct", "set", "105", "-mp1", "/srv/logs,mp=/var/log/app"};
    ASSERT_EQ(runner_.calls.size(), 2u);
    EXPECT_EQ(runner_.calls[0], first);
    EXPECT_EQ(runner_.calls[1], second);

    EXPECT_THROW(pct.set_mount(105, 2, "/srv,backup=1", "/data", false), RuntimeError);
    EXPECT_EQ(runner_.calls.size(), 2u);
}

TEST_F(ToolsFixture, MountFailureIsMountConfigFailed) {
    fail_with("set", 1, "mount point busy");
    PctClient pct(config_, runner_);
    try {
        pct.set_mount(105, 0, "/srv/data", "/data", false);
        FAIL() << "expected MountConfigFailed";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MountConfigFailed);
    }
}

TEST_F(ToolsFixture, ListParsesVmids) {
    runner_.pct_list_output =
            "VMID       Status     Lock         Name\n"
            "100        running                 web\n"
            "205        stopped    backup       db\n"
            "garbage line\n";
    PctClient pct(config_, runner_);

    auto entries = pct.list();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].vmid, 100u);
    EXPECT_EQ(entries[0].status, "running");
    EXPECT_EQ(entries[0].name, "web");
    EXPECT_EQ(entries[1].name, "db");
    EXPECT_EQ(pct.list_vmids(), (std::set<uint32_t>{100, 205}));
}

TEST_F(ToolsFixture, StatusAndInitPid) {
    runner_.pct_status = "stopped";
    PctClient pct(config_, runner_);
    EXPECT_EQ(pct.status(105), "stopped");
    EXPECT_EQ(pct.init_pid(105), 4242);
    std::vector<std::string> lxc_info = {"lxc-info", "-n", "105", "-p", "-H"};
    EXPECT_EQ(runner_.calls.back(), lxc_info);

    runner_.init_pid = "";
    EXPECT_THROW(pct.init_pid(105), RuntimeError);
}

TEST_F(ToolsFixture, ExecPassesCommandThrough) {
    runner_.handlers.push_back([](const std::vector<std::string>& argv) -> std::optional<CommandOutput> {
        if (argv.size() > 1 && argv[1] == "exec") {
            return lxcri_test::failure(3, "exit 3");
        }
        return std::nullopt;
    });
    PctClient pct(config_, runner_);
    CommandOutput output = pct.exec(105, {"ls", "-l"});
    EXPECT_EQ(output.exit_code, 3);
    std::vector<std::string> expected = {"pct", "exec", "105", "--", "ls", "-l"};
    EXPECT_EQ(runner_.calls.back(), expected);
    EXPECT_THROW(pct.exec(105, {}), RuntimeError);
}

TEST_F(ToolsFixture, ZfsProvisionSkipsMissingPool) {
    ZfsClient zfs(config_, runner_);
    ::testing::internal::CaptureStderr();
    auto dataset = zfs.provision("tank", "tank/lxcri/web");
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_FALSE(dataset.has_value());
    EXPECT_NE(err.find("tank"), std::string::npos);
    EXPECT_FALSE(runner_.called({"zfs", "create"}));
}

TEST_F(ToolsFixture, ZfsProvisionCreatesParentThenDataset) {
    runner_.zfs_datasets = {"tank"};
    ZfsClient zfs(config_, runner_);

    auto dataset = zfs.provision("tank", "tank/lxcri/web");
    ASSERT_TRUE(dataset.has_value());
    EXPECT_EQ(*dataset, "tank/lxcri/web");

    std::vector<std::string> parent = {"zfs", "create", "-p", "tank/lxcri"};
    std::vector<std::string> leaf = {"zfs", "create", "tank/lxcri/web"};
    auto first = runner_.find_call({"zfs", "create"});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, parent);
    EXPECT_EQ(runner_.calls.back(), leaf);
}

TEST_F(ToolsFixture, ZfsProvisionReusesExistingDataset) {
    runner_.zfs_datasets = {"tank", "tank/lxcri", "tank/lxcri/web"};
    ZfsClient zfs(config_, runner_);

    EXPECT_EQ(zfs.provision("tank", "tank/lxcri/web").value_or(""), "tank/lxcri/web");
    EXPECT_FALSE(runner_.called({"zfs", "create"}));
    EXPECT_THROW(zfs.provision("tank", "other/lxcri/web"), RuntimeError);
}

TEST_F(ToolsFixture, ZfsListsTopLevelPools) {
    runner_.zfs_datasets = {"rpool", "tank", "tank/lxcri"};
    ZfsClient zfs(config_, runner_);

    EXPECT_EQ(zfs.list_pools(), (std::vector<std::string>{"rpool", "tank"}));
    std::vector<std::string> expected = {"zfs", "list", "-H", "-o", "name", "-d", "0"};
    EXPECT_EQ(runner_.calls.back(), expected);
    EXPECT_TRUE(zfs.pool_exists("tank"));
    EXPECT_FALSE(zfs.pool_exists("tank/lxcri"));
    EXPECT_FALSE(zfs.pool_exists("data"));
}

TEST_F(ToolsFixture, ZfsListFailureMeansNoPool) {
    fail_with("list", 1, "The ZFS modules are not loaded.");
    ZfsClient zfs(config_, runner_);

    EXPECT_THROW(zfs.list_pools(), RuntimeError);
    ::testing::internal::CaptureStderr();
    EXPECT_FALSE(zfs.pool_exists("tank"));
    EXPECT_FALSE(zfs.provision("tank", "tank/lxcri/web").has_value());
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("ZFS modules are not loaded"), std::string::npos);
    EXPECT_FALSE(runner_.called({"zfs", "create"}));
}

TEST(ZfsNamingTest, DatasetDefaultsBelowPool) {
    ZfsSettings settings;
    settings.pool = "tank";
    EXPECT_EQ(container_dataset_name(settings, "web"), "tank/lxcri/web");
    settings.parent_dataset = "tank/ct";
    EXPECT_EQ(container_dataset_name(settings, "web"), "tank/ct/web");
}

TEST(ResourceMappingTest, MemoryRoundsUpToMebibytes) {
    EXPECT_EQ(memory_limit_to_mb(256ULL * 1024 * 1024), 256u);
    EXPECT_EQ(memory_limit_to_mb(256ULL * 1024 * 1024 + 1), 257u);
    EXPECT_EQ(memory_limit_to_mb(1024), 16u);
}

TEST(ResourceMappingTest, SharesMapToCores) {
    EXPECT_EQ(cpu_shares_to_cores(0.0), 1u);
    EXPECT_EQ(cpu_shares_to_cores(-5.0), 1u);
    EXPECT_EQ(cpu_shares_to_cores(256.0), 1u);
    EXPECT_EQ(cpu_shares_to_cores(1024.0), 1u);
    EXPECT_EQ(cpu_shares_to_cores(2048.0), 2u);
    EXPECT_EQ(cpu_shares_to_cores(1024.0 * 1000), 128u);
}

TEST(ResourceMappingTest, HostnameFallsBackToContainerId) {
    EXPECT_EQ(hostname_for("web_1", std::nullopt), "web-1");
    EXPECT_EQ(hostname_for("web_1", std::string("frontend")), "frontend");
    EXPECT_THROW(hostname_for("web", std::string("not valid!")), RuntimeError);
    EXPECT_THROW(hostname_for("web.", std::nullopt), RuntimeError);
}
