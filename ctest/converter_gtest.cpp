#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <vector>

#include "lxcri/errors.h"
#include "lxcri/image_converter.h"
#include "test_support.h"

namespace fs = std::filesystem;
using lxcri_test::read_file;
using lxcri_test::write_file;

namespace {

mode_t permission_bits(const std::string& path) {
    struct stat st {};
    if (stat(path.c_str(), &st) != 0) {
        return 0;
    }
    return st.st_mode & 07777;
}

} // namespace

class ConverterFixture : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = lxcri_test::make_test_root(std::string("converter-") +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        config_ = lxcri_test::make_engine_config(root_);
        bundle_ = root_ + "/bundles/app";
        ensure_directory(bundle_ + "/rootfs");
        output_ = root_ + "/out";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string root_;
    std::string bundle_;
    std::string output_;
    EngineConfig config_;
    lxcri_test::FakeCommandRunner runner_;
};

TEST(MainCommandTest, EntrypointAndCmdTakePrecedence) {
    BundleConfig bundle;
    bundle.process_args = std::vector<std::string>{"/bin/app"};
    bundle.entrypoint = std::vector<std::string>{"/entry.sh"};
    bundle.cmd = std::vector<std::string>{"serve", "--verbose"};
    EXPECT_EQ(resolve_main_command(bundle), "/entry.sh serve --verbose");

    bundle.cmd.reset();
    EXPECT_EQ(resolve_main_command(bundle), "/entry.sh");
}

TEST(MainCommandTest, ProcessArgsUsedWithoutEntrypoint) {
    BundleConfig bundle;
    bundle.cmd = std::vector<std::string>{"ignored"};
    bundle.process_args = std::vector<std::string>{"/bin/app", "-f"};
    EXPECT_EQ(resolve_main_command(bundle), "/bin/app -f");
}

TEST(MainCommandTest, FallsBackToShell) {
    BundleConfig bundle;
    EXPECT_EQ(resolve_main_command(bundle), "/bin/sh");
    bundle.process_args = std::vector<std::string>{};
    EXPECT_EQ(resolve_main_command(bundle), "/bin/sh");
}

TEST(InitScriptTest, ExportsEnvironmentAndChangesDirectory) {
    BundleConfig bundle;
    bundle.process_args = std::vector<std::string>{"/bin/app"};
    bundle.environment = std::vector<std::string>{"GREETING=it's here", "BROKEN", "1BAD=x"};
    bundle.process_cwd = "/srv/app";

    std::string script = render_init_script(bundle);
    EXPECT_EQ(script.rfind("#!/bin/sh\n", 0), 0u);
    EXPECT_NE(script.find("export GREETING='it'\\''s here'\n"), std::string::npos);
    EXPECT_EQ(script.find("BROKEN"), std::string::npos);
    EXPECT_EQ(script.find("1BAD"), std::string::npos);
    EXPECT_NE(script.find("cd '/srv/app' || exit 1\n"), std::string::npos);
    EXPECT_NE(script.find("grep -qs ' /proc ' /proc/mounts"), std::string::npos);
    EXPECT_NE(script.find("\nexec /bin/app\n"), std::string::npos);
}

TEST(InitScriptTest, MetadataWorkingDirectoryWins) {
    BundleConfig bundle;
    bundle.process_cwd = "/";
    EXPECT_EQ(render_init_script(bundle).find("\ncd "), std::string::npos);

    bundle.working_directory = "/opt/app";
    EXPECT_NE(render_init_script(bundle).find("cd '/opt/app' || exit 1"), std::string::npos);
}

TEST(TemplateNameTest, DerivedFromImageOrContainerId) {
    BundleConfig bundle;
    EXPECT_EQ(template_name_for(bundle, "web"), "lxcri-web");

    bundle.image_name = "nginx";
    EXPECT_EQ(template_name_for(bundle, "web"), "nginx-web");
    bundle.image_tag = "1.25";
    EXPECT_EQ(template_name_for(bundle, "web"), "nginx-1.25-web");
    EXPECT_EQ(template_name_for(bundle, "api"), "nginx-1.25-api");
    bundle.image_name = "library/nginx";
    EXPECT_EQ(template_name_for(bundle, "web"), "library-nginx-1.25-web");
}

TEST_F(ConverterFixture, EmptyRootfsIsRejected) {
    write_file(bundle_ + "/config.json", "{}");
    ImageConverter converter(config_, runner_);
    try {
        converter.convert_to_rootfs(bundle_, output_);
        FAIL() << "expected EmptyRootfs";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EmptyRootfs);
    }
}

TEST_F(ConverterFixture, SingleFileRootfsConvertsWithWarning) {
    write_file(bundle_ + "/config.json", R"({"hostname": "web1", "process": {"args": ["/bin/app"]}})");
    write_file(bundle_ + "/rootfs/bin/app", "#!/bin/sh\necho hi\n");
    ImageConverter converter(config_, runner_);

    ::testing::internal::CaptureStderr();
    BundleConfig bundle = converter.convert_to_rootfs(bundle_, output_);
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("[warning]"), std::string::npos);
    EXPECT_EQ(bundle.hostname.value_or(""), "web1");
    EXPECT_TRUE(path_is_regular_file(output_ + "/bin/app"));
    EXPECT_EQ(read_file(output_ + "/etc/hostname"), "web1\n");
    EXPECT_NE(read_file(output_ + "/etc/network/interfaces").find("iface eth0 inet dhcp"), std::string::npos);
    for (const char* dir : {"dev", "proc", "sys", "run", "var/log", "etc/init.d", "root"}) {
        EXPECT_TRUE(path_is_directory(output_ + "/" + dir)) << dir;
    }
    EXPECT_EQ(permission_bits(output_ + "/tmp"), 01777u);
    EXPECT_EQ(permission_bits(output_ + "/sbin/init"), 0755u);
    EXPECT_NE(read_file(output_ + "/sbin/init").find("exec /bin/app"), std::string::npos);
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(ConverterFixture, ExistingContentIsPreserved) {
    write_file(bundle_ + "/config.json", "{}");
    write_file(bundle_ + "/rootfs/sbin/init", "original init");
    write_file(bundle_ + "/rootfs/etc/network/interfaces", "custom\n");
    write_file(bundle_ + "/rootfs/etc/os-release", "ID=test\n");
    fs::create_symlink("../etc/os-release", bundle_ + "/rootfs/sbin/os-release");
    ImageConverter converter(config_, runner_);

    converter.convert_to_rootfs(bundle_, output_);

    EXPECT_EQ(read_file(output_ + "/sbin/init.lxcri-orig"), "original init");
    EXPECT_NE(read_file(output_ + "/sbin/init").find("exec /bin/sh"), std::string::npos);
    EXPECT_EQ(read_file(output_ + "/etc/network/interfaces"), "custom\n");
    EXPECT_TRUE(fs::is_symlink(output_ + "/sbin/os-release"));
    EXPECT_EQ(fs::read_symlink(output_ + "/sbin/os-release").string(), "../etc/os-release");
    EXPECT_FALSE(fs::exists(output_ + "/etc/hostname"));
}

TEST_F(ConverterFixture, MountPointsAreCreatedInsideRootfs) {
    write_file(bundle_ + "/config.json", R"({"mounts": [
        {"destination": "/data/cache", "type": "bind", "source": "/srv"},
        {"type": "tmpfs", "source": "tmpfs"},
        {"destination": "/../../escape", "type": "bind", "source": "/srv"}
    ]})");
    write_file(bundle_ + "/rootfs/bin/app", "app");
    ImageConverter converter(config_, runner_);

    ::testing::internal::CaptureStderr();
    converter.convert_to_rootfs(bundle_, output_);
    ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(path_is_directory(output_ + "/data/cache"));
    EXPECT_FALSE(fs::exists(root_ + "/escape"));
}

TEST_F(ConverterFixture, ExtractsPlainTarArchive) {
    SystemCommandRunner system_runner;
    write_file(root_ + "/src/bin/app", "app");
    write_file(root_ + "/src/etc/os-release", "ID=test\n");
    CommandOutput packed = system_runner.execute(
            {"tar", "-cf", bundle_ + "/rootfs.tar", "-C", root_ + "/src", "."}, 30);
    ASSERT_TRUE(packed.succeeded()) << command_diagnostic(packed);
    write_file(bundle_ + "/config.json", R"({"root": {"path": "rootfs.tar"}})");

    ImageConverter converter(config_, system_runner);
    converter.convert_to_rootfs(bundle_, output_);

    EXPECT_EQ(read_file(output_ + "/bin/app"), "app");
    EXPECT_EQ(read_file(output_ + "/etc/os-release"), "ID=test\n");
    EXPECT_TRUE(path_is_regular_file(output_ + "/sbin/init"));
}

TEST_F(ConverterFixture, ExtractionFailureIsReported) {
    write_file(bundle_ + "/rootfs.tar.zst", "not really zstd");
    write_file(bundle_ + "/config.json", R"({"root": {"path": "rootfs.tar.zst"}})");
    runner_.handlers.push_back([](const std::vector<std::string>& argv) -> std::optional<CommandOutput> {
        if (argv[0] == "tar") {
            return lxcri_test::failure(2, "zstd: data corruption");
        }
        return std::nullopt;
    });
    ImageConverter converter(config_, runner_);

    try {
        converter.convert_to_rootfs(bundle_, output_);
        FAIL() << "expected ExtractionFailed";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ExtractionFailed);
        EXPECT_NE(std::string(e.what()).find("data corruption"), std::string::npos);
    }
    auto call = runner_.find_call({"tar", "--zstd", "-xf"});
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->back(), output_);
}

TEST_F(ConverterFixture, CompressedArchivesUseMatchingTarFlags) {
    runner_.handlers.push_back([](const std::vector<std::string>& argv) -> std::optional<CommandOutput> {
        if (argv[0] == "tar" && argv.size() > 2 && argv[argv.size() - 2] == "-C") {
            write_file(argv.back() + "/bin/app", "app");
        }
        return std::nullopt;
    });
    ImageConverter converter(config_, runner_);

    write_file(bundle_ + "/rootfs.tar.gz", "gzip data");
    write_file(bundle_ + "/config.json", R"({"root": {"path": "rootfs.tar.gz"}})");
    converter.convert_to_rootfs(bundle_, output_);
    std::vector<std::string> gzip = {"tar", "-zxf", fs::canonical(bundle_ + "/rootfs.tar.gz").string(), "-C", output_};
    ASSERT_EQ(runner_.calls.size(), 1u);
    EXPECT_EQ(runner_.calls[0], gzip);

    fs::remove_all(output_);
    write_file(bundle_ + "/rootfs.tar.zst", "zstd data");
    write_file(bundle_ + "/config.json", R"({"root": {"path": "rootfs.tar.zst"}})");
    converter.convert_to_rootfs(bundle_, output_);
    std::vector<std::string> zstd = {"tar", "--zstd", "-xf", fs::canonical(bundle_ + "/rootfs.tar.zst").string(),
                                     "-C", output_};
    ASSERT_EQ(runner_.calls.size(), 2u);
    EXPECT_EQ(runner_.calls[1], zstd);
    EXPECT_TRUE(path_is_regular_file(output_ + "/sbin/init"));
}

TEST_F(ConverterFixture, CopyFailuresAreCollectedIntoOneError) {
    write_file(bundle_ + "/config.json", "{}");
    write_file(bundle_ + "/rootfs/bin/app", "app");
    write_file(bundle_ + "/rootfs/bin/tool", "tool");
    write_file(bundle_ + "/rootfs/etc/hosts", "127.0.0.1 localhost\n");
    write_file(bundle_ + "/rootfs/etc/os-release", "ID=test\n");
    // directories already sitting where two files belong
    write_file(output_ + "/bin/app/keep", "x");
    write_file(output_ + "/etc/hosts/keep", "x");
    ImageConverter converter(config_, runner_);

    try {
        converter.convert_to_rootfs(bundle_, output_);
        FAIL() << "expected CopyFailed";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CopyFailed);
        std::string message = e.what();
        EXPECT_NE(message.find("2 entries failed"), std::string::npos) << message;
        EXPECT_NE(message.find("bin/app"), std::string::npos) << message;
        EXPECT_NE(message.find("etc/hosts"), std::string::npos) << message;
    }
    EXPECT_EQ(read_file(output_ + "/bin/tool"), "tool");
    EXPECT_EQ(read_file(output_ + "/etc/os-release"), "ID=test\n");
}

TEST_F(ConverterFixture, FifosAreSkippedWithWarning) {
    write_file(bundle_ + "/config.json", "{}");
    write_file(bundle_ + "/rootfs/bin/app", "app");
    ensure_directory(bundle_ + "/rootfs/run");
    ASSERT_EQ(mkfifo((bundle_ + "/rootfs/run/control").c_str(), 0600), 0);
    ImageConverter converter(config_, runner_);

    ::testing::internal::CaptureStderr();
    converter.convert_to_rootfs(bundle_, output_);
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("Skipping unsupported entry"), std::string::npos) << err;
    EXPECT_NE(err.find("run/control"), std::string::npos) << err;
    EXPECT_FALSE(fs::exists(fs::symlink_status(output_ + "/run/control")));
    EXPECT_EQ(read_file(output_ + "/bin/app"), "app");
}

TEST_F(ConverterFixture, ReadOnlyDirectoriesKeepModeAndChildren) {
    write_file(bundle_ + "/config.json", "{}");
    write_file(bundle_ + "/rootfs/usr/share/doc/README", "readme");
    ASSERT_EQ(chmod((bundle_ + "/rootfs/usr/share").c_str(), 0555), 0);
    ImageConverter converter(config_, runner_);

    converter.convert_to_rootfs(bundle_, output_);

    EXPECT_EQ(read_file(output_ + "/usr/share/doc/README"), "readme");
    EXPECT_EQ(permission_bits(output_ + "/usr/share"), 0555u);
    chmod((bundle_ + "/rootfs/usr/share").c_str(), 0755);
    chmod((output_ + "/usr/share").c_str(), 0755);
}

TEST_F(ConverterFixture, ExistingSymlinkInOutputIsReplaced) {
    write_file(bundle_ + "/config.json", "{}");
    write_file(bundle_ + "/rootfs/usr/lib/libc.so", "libc");
    fs::create_symlink("usr/lib", bundle_ + "/rootfs/lib");
    ensure_directory(output_);
    fs::create_symlink("/nonexistent/dangling", output_ + "/lib");
    ImageConverter converter(config_, runner_);

    converter.convert_to_rootfs(bundle_, output_);

    ASSERT_TRUE(fs::is_symlink(output_ + "/lib"));
    EXPECT_EQ(fs::read_symlink(output_ + "/lib").string(), "usr/lib");
}

TEST_F(ConverterFixture, UnknownSourceThatIsNotADirectoryIsUnsupported) {
    write_file(root_ + "/image.img", "raw disk");
    ImageConverter converter(config_, runner_);
    ensure_directory(output_);

    ::testing::internal::CaptureStderr();
    try {
        converter.populate_rootfs(root_ + "/image.img", RootfsSourceKind::Unknown, output_);
        ::testing::internal::GetCapturedStderr();
        FAIL() << "expected UnsupportedSource";
    } catch (const RuntimeError& e) {
        ::testing::internal::GetCapturedStderr();
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedSource);
    }
}

TEST_F(ConverterFixture, PackagesTemplateIntoTemplateDirectory) {
    write_file(output_ + "/bin/app", "app");
    write_file(output_ + "/etc/hostname", "web1\n");
    write_file(output_ + "/sbin/init", "#!/bin/sh\n");
    ImageConverter converter(config_, runner_);

    std::string stored = converter.package_as_template(output_, "nginx-1.25");

    EXPECT_EQ(stored, config_.template_dir + "/nginx-1.25.tar.zst");
    EXPECT_TRUE(path_is_regular_file(stored));
    EXPECT_EQ(permission_bits(stored), 0644u);
    EXPECT_FALSE(fs::exists(config_.work_dir + "/nginx-1.25.tar.zst"));
    auto call = runner_.find_call({"tar", "--zstd", "-cf"});
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->at(3), config_.work_dir + "/nginx-1.25.tar.zst");
    EXPECT_EQ(call->at(5), output_);
}

TEST_F(ConverterFixture, ArchiverFailureIsArchiveCreationFailed) {
    write_file(output_ + "/bin/app", "app");
    runner_.handlers.push_back([](const std::vector<std::string>&) -> std::optional<CommandOutput> {
        return lxcri_test::failure(1, "tar: write error");
    });
    ImageConverter converter(config_, runner_);

    ::testing::internal::CaptureStderr();
    try {
        converter.package_as_template(output_, "app");
        ::testing::internal::GetCapturedStderr();
        FAIL() << "expected ArchiveCreationFailed";
    } catch (const RuntimeError& e) {
        ::testing::internal::GetCapturedStderr();
        EXPECT_EQ(e.code(), ErrorCode::ArchiveCreationFailed);
    }
}

TEST_F(ConverterFixture, MissingArchiveOutputIsArchiveCreationFailed) {
    write_file(output_ + "/bin/app", "app");
    runner_.handlers.push_back([](const std::vector<std::string>&) -> std::optional<CommandOutput> {
        return lxcri_test::success();
    });
    ImageConverter converter(config_, runner_);

    ::testing::internal::CaptureStderr();
    try {
        converter.package_as_template(output_, "app");
        ::testing::internal::GetCapturedStderr();
        FAIL() << "expected ArchiveCreationFailed";
    } catch (const RuntimeError& e) {
        ::testing::internal::GetCapturedStderr();
        EXPECT_EQ(e.code(), ErrorCode::ArchiveCreationFailed);
    }
}

TEST_F(ConverterFixture, UnwritableTemplateDirectoryIsUploadFailed) {
    write_file(output_ + "/bin/app", "app");
    write_file(root_ + "/blocker", "file in the way");
    config_.template_dir = root_ + "/blocker/templates";
    ImageConverter converter(config_, runner_);

    ::testing::internal::CaptureStderr();
    try {
        converter.package_as_template(output_, "app");
        ::testing::internal::GetCapturedStderr();
        FAIL() << "expected UploadFailed";
    } catch (const RuntimeError& e) {
        ::testing::internal::GetCapturedStderr();
        EXPECT_EQ(e.code(), ErrorCode::UploadFailed);
    }
    EXPECT_FALSE(fs::exists(config_.work_dir + "/app.tar.zst"));
}

TEST_F(ConverterFixture, InvalidTemplateNameIsRejected) {
    write_file(output_ + "/bin/app", "app");
    ImageConverter converter(config_, runner_);
    EXPECT_THROW(converter.package_as_template(output_, "../escape"), RuntimeError);
    EXPECT_TRUE(runner_.calls.empty());
}
