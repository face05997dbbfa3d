#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class ContainerStatus {
    Created,
    Running,
    Stopped,
    Paused,
};

const char* container_status_name(ContainerStatus status);
std::optional<ContainerStatus> parse_container_status(const std::string& name);

struct ContainerState {
    std::string oci_version = "1.0.2";
    std::string id;
    ContainerStatus status = ContainerStatus::Created;
    pid_t pid = 0;
    std::string bundle_path;
    std::map<std::string, std::string> annotations;
    uint32_t vmid = 0;
    int64_t created_at = 0;

    json to_json_object() const;
    std::string to_json() const;
    static ContainerState from_json_object(const json& j);
};

// One state.json per container below <root>/<id>/.
class StateStore {
public:
    explicit StateStore(std::string root);

    const std::string& root() const { return root_; }
    std::string container_dir(const std::string& id) const;
    std::string state_path(const std::string& id) const;
    std::string events_path(const std::string& id) const;

    ContainerState create(const std::string& id, uint32_t vmid, const std::string& bundle_path,
                          const std::map<std::string, std::string>& annotations = {});
    // Rewrites the whole record with the given status/pid pair. A pid is
    // required exactly when the status is Running.
    ContainerState update(const std::string& id, ContainerStatus status, pid_t pid);
    ContainerState load(const std::string& id) const;
    void remove(const std::string& id);
    bool exists(const std::string& id) const;
    std::vector<ContainerState> list() const;

    void record_event(const std::string& id, const std::string& type, const json& data = json::object()) const;

private:
    std::string root_;
};

int64_t unix_now();
