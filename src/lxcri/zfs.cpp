#include "lxcri/zfs.h"

#include <algorithm>
#include <sstream>

#include "lxcri/errors.h"
#include "lxcri/options.h"

namespace {

std::string parent_of(const std::string& dataset) {
    auto slash = dataset.find_last_of('/');
    if (slash == std::string::npos) {
        return "";
    }
    return dataset.substr(0, slash);
}

} // namespace

std::string container_dataset_name(const ZfsSettings& settings, const std::string& container_id) {
    std::string parent = settings.parent_dataset.empty() ? settings.pool + "/lxcri" : settings.parent_dataset;
    return parent + "/" + container_id;
}

ZfsClient::ZfsClient(const EngineConfig& config, CommandRunner& runner)
    : config_(config), runner_(runner) {}

std::vector<std::string> ZfsClient::list_pools() {
    CommandOutput output = runner_.execute({config_.tools.zfs, "list", "-H", "-o", "name", "-d", "0"},
                                           config_.command_timeout_sec);
    if (!output.succeeded()) {
        std::string diagnostic = command_diagnostic(output);
        throw RuntimeError(translate_tool_error(diagnostic), "zfs list failed: " + diagnostic);
    }
    std::vector<std::string> pools;
    std::istringstream lines(output.stdout_output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            pools.push_back(line);
        }
    }
    return pools;
}

bool ZfsClient::pool_exists(const std::string& pool) {
    std::vector<std::string> pools;
    try {
        pools = list_pools();
    } catch (const RuntimeError& e) {
        log_warning(std::string("Could not list ZFS pools: ") + e.what());
        return false;
    }
    return std::find(pools.begin(), pools.end(), pool) != pools.end();
}

bool ZfsClient::dataset_exists(const std::string& dataset) {
    CommandOutput output = runner_.execute({config_.tools.zfs, "list", "-H", "-o", "name", dataset},
                                           config_.command_timeout_sec);
    if (output.timed_out) {
        throw RuntimeError(ErrorCode::OperationFailed, "zfs list " + dataset + " timed out");
    }
    return output.exit_code == 0;
}

void ZfsClient::create_dataset(const std::string& dataset, bool recursive) {
    std::vector<std::string> argv = {config_.tools.zfs, "create"};
    if (recursive) {
        argv.push_back("-p");
    }
    argv.push_back(dataset);
    CommandOutput output = runner_.execute(argv, config_.command_timeout_sec);
    if (!output.succeeded()) {
        std::string diagnostic = command_diagnostic(output);
        throw RuntimeError(translate_tool_error(diagnostic),
                           "zfs create " + dataset + " failed: " + diagnostic);
    }
}

std::optional<std::string> ZfsClient::provision(const std::string& pool, const std::string& dataset) {
    if (pool.empty() || dataset.empty()) {
        return std::nullopt;
    }
    if (dataset != pool && dataset.compare(0, pool.size() + 1, pool + "/") != 0) {
        throw RuntimeError(ErrorCode::InvalidArgument,
                           "Dataset " + dataset + " is not inside pool " + pool);
    }
    if (!pool_exists(pool)) {
        log_warning("ZFS pool '" + pool + "' does not exist, continuing without dedicated storage");
        return std::nullopt;
    }
    if (dataset_exists(dataset)) {
        log_info("Reusing existing dataset " + dataset);
        return dataset;
    }
    std::string parent = parent_of(dataset);
    if (!parent.empty() && parent != pool && !dataset_exists(parent)) {
        log_debug("Creating parent dataset " + parent);
        create_dataset(parent, true);
    }
    create_dataset(dataset, false);
    log_info("Created dataset " + dataset);
    return dataset;
}
