#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "lxcri/json_store.h"

// Live view of the VMIDs the container tool already knows about.
class VmidInventory {
public:
    virtual ~VmidInventory() = default;
    virtual std::set<uint32_t> list_vmids() = 0;
};

struct IdentityEntry {
    std::string container_id;
    uint32_t vmid = 0;
    int64_t created_at = 0;
    std::string bundle_path;
};

// Persistent container_id -> VMID map (mapping.json). No two container ids
// ever share a VMID: candidates are checked against the map and the live inventory.
class IdentityStore {
public:
    static constexpr uint32_t kMinVmid = 100;
    static constexpr uint32_t kMaxVmid = 999999;
    static constexpr int kMaxProbeAttempts = 1000;

    // `inventory` may be null, in which case only the persisted map is consulted.
    IdentityStore(std::string mapping_path, VmidInventory* inventory);

    const std::string& mapping_path() const { return store_.path(); }

    // Returns the existing VMID for `container_id`, or assigns and persists a new one.
    // `created` is set under the same lock that persists the entry.
    // Throws RuntimeError(IdentityExhausted) when probing finds no free VMID.
    uint32_t assign(const std::string& container_id, const std::string& bundle_path = "",
                    bool* created = nullptr);

    // Throws RuntimeError(NotFound) for unknown ids.
    uint32_t lookup(const std::string& container_id) const;
    std::optional<IdentityEntry> find(const std::string& container_id) const;

    // Returns false when there was nothing to remove.
    bool remove(const std::string& container_id);
    std::vector<IdentityEntry> list() const;

    static uint64_t hash_container_id(const std::string& container_id);
    static uint32_t seed_vmid(const std::string& container_id);
    static uint32_t next_candidate(uint32_t vmid);

private:
    std::set<uint32_t> live_vmids() const;

    JsonFileStore store_;
    VmidInventory* inventory_;
};
