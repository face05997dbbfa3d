#include "lxcri/state.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "lxcri/errors.h"
#include "lxcri/filesystem.h"
#include "lxcri/json_store.h"
#include "lxcri/options.h"

namespace fs = std::filesystem;

const char* container_status_name(ContainerStatus status) {
    switch (status) {
        case ContainerStatus::Created:
            return "created";
        case ContainerStatus::Running:
            return "running";
        case ContainerStatus::Stopped:
            return "stopped";
        case ContainerStatus::Paused:
            return "paused";
    }
    return "unknown";
}

std::optional<ContainerStatus> parse_container_status(const std::string& name) {
    if (name == "created") {
        return ContainerStatus::Created;
    }
    if (name == "running") {
        return ContainerStatus::Running;
    }
    if (name == "stopped") {
        return ContainerStatus::Stopped;
    }
    if (name == "paused") {
        return ContainerStatus::Paused;
    }
    return std::nullopt;
}

json ContainerState::to_json_object() const {
    json j = {
            {"ociVersion", oci_version},
            {"id", id},
            {"status", container_status_name(status)},
            {"pid", pid > 0 ? pid : 0},
            {"bundle", bundle_path},
            {"vmid", vmid},
            {"created_at", created_at}
    };
    if (!annotations.empty()) {
        j["annotations"] = annotations;
    }
    return j;
}

std::string ContainerState::to_json() const {
    return to_json_object().dump(4);
}

ContainerState ContainerState::from_json_object(const json& j) {
    ContainerState state;
    try {
        if (j.contains("ociVersion")) {
            j.at("ociVersion").get_to(state.oci_version);
        }
        j.at("id").get_to(state.id);
        auto status = parse_container_status(j.at("status").get<std::string>());
        if (!status) {
            throw RuntimeError(ErrorCode::InvalidStateFormat,
                               "Unknown container status '" + j.at("status").get<std::string>() + "'");
        }
        state.status = *status;
        j.at("pid").get_to(state.pid);
        if (j.contains("bundle")) {
            j.at("bundle").get_to(state.bundle_path);
        }
        if (j.contains("annotations")) {
            j.at("annotations").get_to(state.annotations);
        }
        if (j.contains("vmid")) {
            j.at("vmid").get_to(state.vmid);
        }
        if (j.contains("created_at")) {
            j.at("created_at").get_to(state.created_at);
        }
    } catch (const json::exception& e) {
        throw RuntimeError(ErrorCode::InvalidStateFormat, std::string("Malformed state record: ") + e.what());
    }
    return state;
}

int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

StateStore::StateStore(std::string root) : root_(std::move(root)) {}

std::string StateStore::container_dir(const std::string& id) const {
    return root_ + "/" + id;
}

std::string StateStore::state_path(const std::string& id) const {
    return container_dir(id) + "/state.json";
}

std::string StateStore::events_path(const std::string& id) const {
    return container_dir(id) + "/events.log";
}

ContainerState StateStore::create(const std::string& id, uint32_t vmid, const std::string& bundle_path,
                                  const std::map<std::string, std::string>& annotations) {
    ContainerState state;
    state.id = id;
    state.status = ContainerStatus::Created;
    state.pid = 0;
    state.bundle_path = bundle_path;
    state.annotations = annotations;
    state.vmid = vmid;
    state.created_at = unix_now();

    if (!ensure_directory(container_dir(id))) {
        throw RuntimeError(ErrorCode::OperationFailed, "Failed to create state directory " + container_dir(id));
    }
    JsonFileStore(state_path(id)).write(state.to_json_object());
    record_event(id, "created", state.to_json_object());
    return state;
}

ContainerState StateStore::update(const std::string& id, ContainerStatus status, pid_t pid) {
    if ((status == ContainerStatus::Running) != (pid > 0)) {
        throw RuntimeError(ErrorCode::InvalidArgument,
                           std::string("Invalid pid ") + std::to_string(pid) + " for status " +
                           container_status_name(status));
    }
    if (!exists(id)) {
        throw RuntimeError(ErrorCode::StateMissing, "No state recorded for container '" + id + "'");
    }
    ContainerState updated;
    JsonFileStore(state_path(id)).update([&](json& document) {
        updated = ContainerState::from_json_object(document);
        updated.status = status;
        updated.pid = pid;
        document = updated.to_json_object();
    });
    record_event(id, container_status_name(status), updated.to_json_object());
    return updated;
}

ContainerState StateStore::load(const std::string& id) const {
    if (!exists(id)) {
        throw RuntimeError(ErrorCode::StateMissing, "Failed to load state file: " + state_path(id));
    }
    json document = JsonFileStore(state_path(id)).read();
    if (document.empty()) {
        throw RuntimeError(ErrorCode::InvalidStateFormat, "Empty state file: " + state_path(id));
    }
    return ContainerState::from_json_object(document);
}

void StateStore::remove(const std::string& id) {
    std::string dir = container_dir(id);
    if (!exists(id)) {
        log_warning("No state to delete for container '" + id + "'");
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        throw RuntimeError(ErrorCode::OperationFailed, "Failed to remove " + dir + ": " + ec.message());
    }
}

bool StateStore::exists(const std::string& id) const {
    return path_is_regular_file(state_path(id));
}

std::vector<ContainerState> StateStore::list() const {
    std::vector<ContainerState> states;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        return states;
    }
    for (const auto& entry : it) {
        if (!entry.is_directory(ec)) {
            continue;
        }
        std::string id = entry.path().filename().string();
        if (!exists(id)) {
            continue;
        }
        try {
            states.push_back(load(id));
        } catch (const RuntimeError& e) {
            log_warning("Skipping container '" + id + "': " + e.what());
        }
    }
    std::sort(states.begin(), states.end(), [](const ContainerState& a, const ContainerState& b) {
        return a.id < b.id;
    });
    return states;
}

void StateStore::record_event(const std::string& id, const std::string& type, const json& data) const {
    std::string path = events_path(id);
    if (!ensure_parent_directory(path)) {
        log_warning("Failed to prepare events log for container '" + id + "'");
        return;
    }
    std::ofstream ofs(path, std::ios::app);
    if (!ofs) {
        log_warning("Failed to open events log for container '" + id + "'");
        return;
    }
    json entry = {
            {"timestamp", iso8601_now()},
            {"type", type},
            {"id", id}
    };
    if (!data.is_null() && !data.empty()) {
        entry["data"] = data;
    }
    ofs << entry.dump() << std::endl;
}
