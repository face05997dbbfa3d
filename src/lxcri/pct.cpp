#include "lxcri/pct.h"

#include <cctype>
#include <sstream>

#include "lxcri/validation.h"

namespace {

bool parse_unsigned(const std::string& text, uint64_t& value) {
    if (text.empty()) {
        return false;
    }
    value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > UINT32_MAX) {
            return false;
        }
    }
    return true;
}

void reject_separators(const std::string& value, const char* what) {
    if (value.empty() || value.find_first_of(",=\n") != std::string::npos) {
        throw RuntimeError(ErrorCode::InvalidArgument,
                           std::string("Invalid mount ") + what + " '" + value + "'");
    }
}

} // namespace

std::vector<PctListEntry> parse_pct_list(const std::string& output) {
    std::vector<PctListEntry> entries;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::vector<std::string> tokens;
        std::string token;
        while (fields >> token) {
            tokens.push_back(token);
        }
        uint64_t vmid = 0;
        if (tokens.size() < 2 || !parse_unsigned(tokens[0], vmid)) {
            continue;
        }
        PctListEntry entry;
        entry.vmid = static_cast<uint32_t>(vmid);
        entry.status = tokens[1];
        if (tokens.size() >= 3) {
            entry.name = tokens.back();
        }
        entries.push_back(entry);
    }
    return entries;
}

PctClient::PctClient(const EngineConfig& config, CommandRunner& runner)
    : config_(config), runner_(runner) {}

CommandOutput PctClient::run(const std::vector<std::string>& argv, ErrorCode fallback,
                             const std::string& action) {
    CommandOutput output = runner_.execute(argv, config_.command_timeout_sec);
    if (!output.succeeded()) {
        std::string diagnostic = command_diagnostic(output);
        ErrorCode code = output.timed_out ? fallback : translate_tool_error(diagnostic, fallback);
        throw RuntimeError(code, action + " failed: " + diagnostic);
    }
    return output;
}

std::vector<std::string> PctClient::create_arguments(const PctCreateRequest& request) const {
    validate_hostname(request.hostname);
    validate_network_spec(request.network);
    if (request.ostemplate.empty()) {
        throw RuntimeError(ErrorCode::InvalidArgument, "No template given for container create");
    }
    std::vector<std::string> argv = {
            config_.tools.pct, "create", std::to_string(request.vmid), request.ostemplate,
            "--hostname", request.hostname,
            "--memory", std::to_string(request.memory_mb),
            "--cores", std::to_string(request.cores),
            "--net0", request.network,
            "--unprivileged", request.unprivileged ? "1" : "0",
    };
    if (!request.rootfs.empty()) {
        if (!is_valid_network_spec(request.rootfs)) {
            throw RuntimeError(ErrorCode::InvalidArgument, "Invalid rootfs volume '" + request.rootfs + "'");
        }
        argv.push_back("--rootfs");
        argv.push_back(request.rootfs);
    }
    return argv;
}

void PctClient::create(const PctCreateRequest& request) {
    run(create_arguments(request), ErrorCode::LxcCreateFailed, "pct create " + std::to_string(request.vmid));
}

void PctClient::start(uint32_t vmid) {
    run({config_.tools.pct, "start", std::to_string(vmid)}, ErrorCode::LxcStartFailed,
        "pct start " + std::to_string(vmid));
}

void PctClient::stop(uint32_t vmid) {
    run({config_.tools.pct, "stop", std::to_string(vmid)}, ErrorCode::LxcStopFailed,
        "pct stop " + std::to_string(vmid));
}

void PctClient::shutdown(uint32_t vmid) {
    run({config_.tools.pct, "shutdown", std::to_string(vmid)}, ErrorCode::LxcStopFailed,
        "pct shutdown " + std::to_string(vmid));
}

void PctClient::destroy(uint32_t vmid) {
    run({config_.tools.pct, "destroy", std::to_string(vmid)}, ErrorCode::LxcDeleteFailed,
        "pct destroy " + std::to_string(vmid));
}

std::vector<PctListEntry> PctClient::list() {
    CommandOutput output = run({config_.tools.pct, "list"}, ErrorCode::OperationFailed, "pct list");
    return parse_pct_list(output.stdout_output);
}

std::set<uint32_t> PctClient::list_vmids() {
    std::set<uint32_t> vmids;
    for (const auto& entry : list()) {
        vmids.insert(entry.vmid);
    }
    return vmids;
}

std::string PctClient::status(uint32_t vmid) {
    CommandOutput output = run({config_.tools.pct, "status", std::to_string(vmid)},
                               ErrorCode::OperationFailed, "pct status " + std::to_string(vmid));
    std::string text = output.stdout_output;
    auto colon = text.find("status:");
    if (colon != std::string::npos) {
        text = text.substr(colon + 7);
    }
    std::istringstream iss(text);
    std::string status;
    iss >> status;
    if (status.empty()) {
        throw RuntimeError(ErrorCode::OperationFailed,
                           "Unexpected pct status output for " + std::to_string(vmid) + ": " + output.stdout_output);
    }
    return status;
}

void PctClient::set_mount(uint32_t vmid, int index, const std::string& source,
                          const std::string& destination, bool readonly) {
    reject_separators(source, "source");
    reject_separators(destination, "destination");
    std::string spec = source + ",mp=" + destination;
    if (readonly) {
        spec += ",ro=1";
    }
    run({config_.tools.pct, "set", std::to_string(vmid), "-mp" + std::to_string(index), spec},
        ErrorCode::MountConfigFailed, "pct set " + std::to_string(vmid) + " -mp" + std::to_string(index));
}

CommandOutput PctClient::exec(uint32_t vmid, const std::vector<std::string>& command) {
    if (command.empty()) {
        throw RuntimeError(ErrorCode::InvalidArgument, "No command given for exec");
    }
    std::vector<std::string> argv = {config_.tools.pct, "exec", std::to_string(vmid), "--"};
    argv.insert(argv.end(), command.begin(), command.end());
    return runner_.execute(argv, config_.command_timeout_sec);
}

pid_t PctClient::init_pid(uint32_t vmid) {
    CommandOutput output = run({config_.tools.lxc_info, "-n", std::to_string(vmid), "-p", "-H"},
                               ErrorCode::OperationFailed, "lxc-info " + std::to_string(vmid));
    std::istringstream iss(output.stdout_output);
    std::string token;
    iss >> token;
    uint64_t pid = 0;
    if (!parse_unsigned(token, pid) || pid == 0) {
        throw RuntimeError(ErrorCode::OperationFailed,
                           "No init pid reported for " + std::to_string(vmid) + ": '" + output.stdout_output + "'");
    }
    return static_cast<pid_t>(pid);
}
