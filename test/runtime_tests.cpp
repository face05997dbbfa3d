#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#define main lxcri_cli_main
#include "../main.cpp"
#undef main

#include "test_support.h"

using lxcri_test::read_file;
using lxcri_test::write_file;

struct TestContext {
    int passed = 0;
    int failed = 0;

    void expect(bool condition, const std::string& name, const std::string& message = "") {
        if (condition) {
            ++passed;
        } else {
            ++failed;
            std::cerr << "[FAIL] " << name;
            if (!message.empty()) {
                std::cerr << " - " << message;
            }
            std::cerr << std::endl;
        }
    }
};

// Redirects std::cout and std::cerr for the lifetime of the object.
class CapturedStreams {
public:
    CapturedStreams() : out_(std::cout.rdbuf(stdout_.rdbuf())), err_(std::cerr.rdbuf(stderr_.rdbuf())) {}
    ~CapturedStreams() {
        std::cout.rdbuf(out_);
        std::cerr.rdbuf(err_);
    }

    std::string out() const { return stdout_.str(); }
    std::string err() const { return stderr_.str(); }

private:
    std::ostringstream stdout_;
    std::ostringstream stderr_;
    std::streambuf* out_;
    std::streambuf* err_;
};

std::string make_temp_dir(const std::string& prefix) {
    std::string tmpl = "/tmp/" + prefix + "XXXXXX";
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');
    char* created = mkdtemp(buffer.data());
    if (!created) {
        throw std::runtime_error("mkdtemp failed");
    }
    return created;
}

void remove_tree(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

int run_command(LifecycleOrchestrator& engine, std::vector<std::string> args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return dispatch_command(engine, static_cast<int>(argv.size()), argv.data(), "lxcri");
}

void make_bundle(const std::string& path) {
    write_file(path + "/config.json", R"({"hostname": "demo", "process": {"args": ["/bin/app"]}})");
    write_file(path + "/rootfs/bin/app", "#!/bin/sh\n");
    write_file(path + "/rootfs/etc/os-release", "ID=test\n");
    write_file(path + "/rootfs/etc/passwd", "root:x:0:0::/root:/bin/sh\n");
}

void test_iso8601_format(TestContext& ctx) {
    const std::string ts = iso8601_now();
    bool has_z = !ts.empty() && ts.back() == 'Z';
    ctx.expect(has_z, "iso8601_now terminator", ts);
    bool has_fraction = ts.find('.') != std::string::npos;
    ctx.expect(has_fraction, "iso8601_now fractional", ts);
}

void test_wait_for_process(TestContext& ctx) {
    int status = 0;
    pid_t child = fork();
    if (child == 0) {
        _exit(0);
    }
    bool immediate = wait_for_process(child, 0, status);
    ctx.expect(immediate && WIFEXITED(status), "wait_for_process immediate success");

    pid_t slow_child = fork();
    if (slow_child == 0) {
        sleep(5);
        _exit(42);
    }
    int slow_status = 0;
    bool completed = wait_for_process(slow_child, 1, slow_status);
    ctx.expect(!completed, "wait_for_process timeout triggers kill");
}

void test_parse_create_options(TestContext& ctx) {
    CreateOptions options;
    std::vector<std::string> args = {"create", "--bundle", "/tmp/bundle", "demo"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    bool ok = parse_create_options(static_cast<int>(args.size()), argv.data(), options);
    ctx.expect(ok, "parse_create_options success");
    if (ok) {
        ctx.expect(options.bundle == "/tmp/bundle", "parse_create_options bundle", options.bundle);
        ctx.expect(options.id == "demo", "parse_create_options id", options.id);
    }

    CapturedStreams streams;
    std::vector<std::vector<std::string>> invalid = {
            {"create", "--bundle", "/tmp"},
            {"create", "demo"},
            {"create", "-b", "/tmp", "demo", "extra"},
    };
    for (auto& args_case : invalid) {
        CreateOptions rejected;
        std::vector<char*> invalid_argv;
        for (auto& arg : args_case) {
            invalid_argv.push_back(const_cast<char*>(arg.c_str()));
        }
        bool invalid_ok = parse_create_options(static_cast<int>(invalid_argv.size()), invalid_argv.data(), rejected);
        ctx.expect(!invalid_ok, "parse_create_options rejects " + args_case.back());
    }
}

void test_parse_exec_options(TestContext& ctx) {
    ExecOptions options;
    std::vector<std::string> args = {"exec", "demo", "--", "/bin/echo", "hello"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    bool ok = parse_exec_options(static_cast<int>(args.size()), argv.data(), options);
    ctx.expect(ok, "parse_exec_options success");
    if (ok) {
        ctx.expect(options.id == "demo", "parse_exec_options id", options.id);
        ctx.expect(options.args.size() == 2, "parse_exec_options args size");
        ctx.expect(options.args.front() == "/bin/echo", "parse_exec_options arg0");
    }

    CapturedStreams streams;
    ExecOptions invalid_opts;
    std::vector<std::string> invalid = {"exec", "demo"};
    std::vector<char*> invalid_argv;
    for (auto& arg : invalid) {
        invalid_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    bool invalid_ok = parse_exec_options(static_cast<int>(invalid.size()), invalid_argv.data(), invalid_opts);
    ctx.expect(!invalid_ok, "parse_exec_options requires command");
}

void test_parse_signal(TestContext& ctx) {
    int sig = 0;
    ctx.expect(parse_signal("TERM", sig) && sig == SIGTERM, "parse_signal TERM");
    ctx.expect(parse_signal("SIGKILL", sig) && sig == SIGKILL, "parse_signal SIGKILL");
    ctx.expect(parse_signal("hup", sig) && sig == SIGHUP, "parse_signal lowercase");
    ctx.expect(parse_signal("9", sig) && sig == 9, "parse_signal numeric");
    ctx.expect(!parse_signal("0", sig), "parse_signal rejects zero");
    ctx.expect(!parse_signal("BOGUS", sig), "parse_signal rejects unknown name");
    ctx.expect(!parse_signal("", sig), "parse_signal rejects empty");
}

void test_build_engine_config(TestContext& ctx) {
    std::string dir = make_temp_dir("lxcri-config-");
    std::string config_path = dir + "/config.json";
    write_file(config_path, R"({"state_root": "/srv/lxcri", "template_storage": "nas"})");

    GlobalOptions saved = g_global_options;
    g_global_options.config_path = config_path;
    g_global_options.root_path.clear();
    EngineConfig config = build_engine_config();
    ctx.expect(config.state_root == "/srv/lxcri", "build_engine_config reads file", config.state_root);
    ctx.expect(config.template_storage == "nas", "build_engine_config storage", config.template_storage);

    g_global_options.root_path = dir + "/state";
    config = build_engine_config();
    ctx.expect(config.state_root == dir + "/state", "build_engine_config --root wins", config.state_root);

    write_file(config_path, "[not an object]");
    bool rejected = false;
    try {
        build_engine_config();
    } catch (const RuntimeError& e) {
        rejected = e.code() == ErrorCode::InvalidConfigFormat;
    }
    ctx.expect(rejected, "build_engine_config rejects malformed file");

    g_global_options = saved;
    remove_tree(dir);
}

void test_cli_lifecycle(TestContext& ctx) {
    std::string root = make_temp_dir("lxcri-cli-");
    EngineConfig config = lxcri_test::make_engine_config(root);
    make_bundle(root + "/bundles/demo");
    lxcri_test::FakeCommandRunner runner;
    LifecycleOrchestrator engine(config, runner);

    int rc = run_command(engine, {"create", "--bundle", root + "/bundles/demo", "demo"});
    ctx.expect(rc == 0, "cli create", std::to_string(rc));
    ctx.expect(engine.states().exists("demo"), "cli create records state");

    rc = run_command(engine, {"start", "demo"});
    ctx.expect(rc == 0, "cli start", std::to_string(rc));

    {
        CapturedStreams streams;
        rc = run_command(engine, {"state", "demo"});
        json state = json::parse(streams.out(), nullptr, false);
        ctx.expect(rc == 0 && state.is_object(), "cli state prints json", streams.out());
        if (state.is_object()) {
            ctx.expect(state["status"] == "running", "cli state status");
            ctx.expect(state["pid"] == 4242, "cli state pid");
        }
    }

    {
        CapturedStreams streams;
        rc = run_command(engine, {"list"});
        json list = json::parse(streams.out(), nullptr, false);
        ctx.expect(rc == 0 && list.is_array() && list.size() == 1, "cli list", streams.out());
    }

    {
        CapturedStreams streams;
        rc = run_command(engine, {"delete", "demo"});
        ctx.expect(rc == 1, "cli delete refuses running container");
        ctx.expect(streams.err().find("Error: delete demo:") != std::string::npos, "cli delete error text",
                   streams.err());
    }

    rc = run_command(engine, {"kill", "demo", "TERM"});
    ctx.expect(rc == 0, "cli kill", std::to_string(rc));
    ctx.expect(runner.called({"pct", "shutdown"}), "cli kill TERM shuts down");

    rc = run_command(engine, {"delete", "demo"});
    ctx.expect(rc == 0, "cli delete", std::to_string(rc));
    ctx.expect(!engine.states().exists("demo"), "cli delete removes state");
    ctx.expect(!engine.identities().find("demo"), "cli delete releases vmid");

    {
        CapturedStreams streams;
        rc = run_command(engine, {"delete", "demo"});
        ctx.expect(rc == 1, "cli delete unknown container fails");
        rc = run_command(engine, {"create", "--bundle", "nginx:latest", "web"});
        ctx.expect(rc == 1, "cli create rejects image reference");
        rc = run_command(engine, {"kill", "demo", "NOPE"});
        ctx.expect(rc == 1, "cli kill rejects bad signal");
        rc = run_command(engine, {"frobnicate"});
        ctx.expect(rc == 1, "cli unknown command");
    }

    remove_tree(root);
}

void test_cli_templates(TestContext& ctx) {
    std::string root = make_temp_dir("lxcri-templates-");
    EngineConfig config = lxcri_test::make_engine_config(root);
    make_bundle(root + "/bundles/demo");
    lxcri_test::FakeCommandRunner runner;
    LifecycleOrchestrator engine(config, runner);
    run_command(engine, {"create", "--bundle", root + "/bundles/demo", "demo"});

    {
        CapturedStreams streams;
        int rc = run_command(engine, {"template", "list"});
        json list = json::parse(streams.out(), nullptr, false);
        ctx.expect(rc == 0 && list.is_array() && list.size() == 1, "cli template list", streams.out());
        if (list.is_array() && !list.empty()) {
            ctx.expect(list[0]["name"] == "lxcri-demo", "cli template list name");
            ctx.expect(list[0]["source_type"] == "oci_bundle", "cli template list source");
        }
    }

    {
        CapturedStreams streams;
        int rc = run_command(engine, {"template", "verify", "lxcri-demo"});
        ctx.expect(rc == 0 && streams.out() == "lxcri-demo: ok\n", "cli template verify", streams.out());
        rc = run_command(engine, {"template", "info", "missing"});
        ctx.expect(rc == 1, "cli template info missing");
    }

    int rc = run_command(engine, {"template", "remove", "lxcri-demo"});
    ctx.expect(rc == 0, "cli template remove");
    ctx.expect(!path_is_regular_file(config.template_dir + "/lxcri-demo.tar.zst"), "cli template remove deletes archive");
    ctx.expect(engine.templates().list().empty(), "cli template remove forgets entry");

    remove_tree(root);
}

void test_json_log_format(TestContext& ctx) {
    std::string dir = make_temp_dir("lxcri-logs-");
    std::string log_path = dir + "/lxcri.log";
    GlobalOptions saved = g_global_options;
    g_global_options.log_format = "json";

    bool ok = configure_log_destination(log_path);
    ctx.expect(ok, "configure_log_destination success");
    log_warning("disk almost full");
    log_info("written because a log file is set");
    reset_log_destination();
    g_global_options = saved;

    std::istringstream lines(read_file(log_path));
    std::string line;
    std::vector<json> entries;
    while (std::getline(lines, line)) {
        entries.push_back(json::parse(line, nullptr, false));
    }
    ctx.expect(entries.size() == 2, "json log line count", std::to_string(entries.size()));
    if (entries.size() == 2) {
        ctx.expect(entries[0].is_object() && entries[0]["level"] == "warning", "json log level");
        ctx.expect(entries[0]["msg"] == "disk almost full", "json log message");
        ctx.expect(entries[1]["level"] == "info", "json log info level");
        ctx.expect(entries[0].contains("time"), "json log timestamp");
    }
    remove_tree(dir);
}

int main() {
    TestContext ctx;

    test_iso8601_format(ctx);
    test_wait_for_process(ctx);
    test_parse_create_options(ctx);
    test_parse_exec_options(ctx);
    test_parse_signal(ctx);
    test_build_engine_config(ctx);
    test_cli_lifecycle(ctx);
    test_cli_templates(ctx);
    test_json_log_format(ctx);

    std::cout << "[TEST SUMMARY] Passed: " << ctx.passed << ", Failed: " << ctx.failed << std::endl;
    return ctx.failed == 0 ? 0 : 1;
}
