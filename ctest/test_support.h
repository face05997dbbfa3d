#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "lxcri/filesystem.h"
#include "lxcri/options.h"
#include "lxcri/process.h"

namespace lxcri_test {

inline std::string make_test_root(const std::string& name) {
    std::string safe_name = name;
    std::transform(safe_name.begin(), safe_name.end(), safe_name.begin(), [](unsigned char c) {
        return (std::isalnum(c) || c == '-' || c == '_') ? static_cast<char>(c) : '_';
    });
    std::string root = "/tmp/lxcri-test-" + std::to_string(getpid()) + "-" + safe_name;
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    ensure_directory(root, 0755);
    return root;
}

inline void write_file(const std::string& path, const std::string& contents) {
    ensure_parent_directory(path);
    std::ofstream ofs(path, std::ios::trunc);
    ofs << contents;
}

inline std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

inline bool starts_with(const std::vector<std::string>& argv, const std::vector<std::string>& prefix) {
    if (argv.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), argv.begin());
}

inline bool contains(const std::vector<std::string>& argv, const std::string& value) {
    return std::find(argv.begin(), argv.end(), value) != argv.end();
}

inline CommandOutput success(const std::string& stdout_output = "") {
    CommandOutput output;
    output.exit_code = 0;
    output.stdout_output = stdout_output;
    return output;
}

inline CommandOutput failure(int exit_code, const std::string& stderr_output) {
    CommandOutput output;
    output.exit_code = exit_code;
    output.stderr_output = stderr_output;
    return output;
}

// Stands in for pct, lxc-info, zfs and tar. Handlers run first; the first one
// returning a value answers the call, otherwise a plausible default is used.
class FakeCommandRunner : public CommandRunner {
public:
    using Handler = std::function<std::optional<CommandOutput>(const std::vector<std::string>&)>;

    std::vector<std::vector<std::string>> calls;
    std::vector<Handler> handlers;
    std::string pct_list_output = "VMID       Status     Lock         Name\n";
    std::string pct_status = "running";
    std::string init_pid = "4242";
    std::set<std::string> zfs_datasets;

    CommandOutput execute(const std::vector<std::string>& argv, int) override {
        calls.push_back(argv);
        for (const auto& handler : handlers) {
            if (auto output = handler(argv)) {
                return *output;
            }
        }
        return default_response(argv);
    }

    size_t count(const std::vector<std::string>& prefix) const {
        return static_cast<size_t>(std::count_if(calls.begin(), calls.end(), [&](const std::vector<std::string>& call) {
            return starts_with(call, prefix);
        }));
    }

    bool called(const std::vector<std::string>& prefix) const { return count(prefix) > 0; }

    std::optional<std::vector<std::string>> find_call(const std::vector<std::string>& prefix) const {
        for (const auto& call : calls) {
            if (starts_with(call, prefix)) {
                return call;
            }
        }
        return std::nullopt;
    }

private:
    CommandOutput default_response(const std::vector<std::string>& argv) {
        const std::string& tool = argv[0];
        if (tool == "tar") {
            auto create = std::find(argv.begin(), argv.end(), "-cf");
            if (create != argv.end() && create + 1 != argv.end()) {
                write_file(*(create + 1), std::string(1024, 'x'));
            }
            return success();
        }
        if (tool == "pct" && argv.size() > 1) {
            if (argv[1] == "list") {
                return success(pct_list_output);
            }
            if (argv[1] == "status") {
                return success("status: " + pct_status + "\n");
            }
            return success();
        }
        if (tool == "lxc-info") {
            return success(init_pid + "\n");
        }
        if (tool == "zfs" && argv.size() > 1) {
            if (argv[1] == "list" && argv.size() > 2 && argv[argv.size() - 2] == "-d") {
                std::string pools;
                for (const auto& dataset : zfs_datasets) {
                    if (dataset.find('/') == std::string::npos) {
                        pools += dataset + "\n";
                    }
                }
                return success(pools);
            }
            if (argv[1] == "list") {
                const std::string& name = argv.back();
                if (zfs_datasets.count(name) > 0) {
                    return success(name + "\n");
                }
                return failure(1, "cannot open '" + name + "': dataset does not exist");
            }
            if (argv[1] == "create") {
                zfs_datasets.insert(argv.back());
                return success();
            }
        }
        return success();
    }
};

inline EngineConfig make_engine_config(const std::string& root) {
    EngineConfig config;
    config.state_root = root + "/state";
    config.work_dir = root + "/work";
    config.template_dir = root + "/templates";
    config.allowed_bundle_prefixes = {root + "/bundles"};
    config.command_timeout_sec = 30;
    return config;
}

} // namespace lxcri_test
