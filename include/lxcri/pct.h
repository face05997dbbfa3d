#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <sys/types.h>
#include <vector>

#include "lxcri/errors.h"
#include "lxcri/identity.h"
#include "lxcri/options.h"
#include "lxcri/process.h"

struct PctCreateRequest {
    uint32_t vmid = 0;
    std::string ostemplate;
    std::string hostname;
    uint64_t memory_mb = 512;
    uint32_t cores = 1;
    std::string network;
    std::string rootfs;
    bool unprivileged = true;
};

struct PctListEntry {
    uint32_t vmid = 0;
    std::string status;
    std::string name;
};

// Thin wrapper over the Proxmox `pct` tool. Failed invocations throw
// RuntimeError with a code translated from the tool's diagnostics.
class PctClient : public VmidInventory {
public:
    PctClient(const EngineConfig& config, CommandRunner& runner);

    std::vector<std::string> create_arguments(const PctCreateRequest& request) const;

    void create(const PctCreateRequest& request);
    void start(uint32_t vmid);
    void stop(uint32_t vmid);
    void shutdown(uint32_t vmid);
    void destroy(uint32_t vmid);
    std::vector<PctListEntry> list();
    std::set<uint32_t> list_vmids() override;
    // "running", "stopped", ...
    std::string status(uint32_t vmid);
    void set_mount(uint32_t vmid, int index, const std::string& source,
                   const std::string& destination, bool readonly);
    CommandOutput exec(uint32_t vmid, const std::vector<std::string>& command);
    pid_t init_pid(uint32_t vmid);

private:
    CommandOutput run(const std::vector<std::string>& argv, ErrorCode fallback, const std::string& action);

    const EngineConfig& config_;
    CommandRunner& runner_;
};

std::vector<PctListEntry> parse_pct_list(const std::string& output);
