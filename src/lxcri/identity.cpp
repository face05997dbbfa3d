#include "lxcri/identity.h"

#include <utility>

#include "lxcri/errors.h"
#include "lxcri/options.h"
#include "lxcri/state.h"

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

IdentityEntry entry_from_json(const std::string& container_id, const json& value) {
    IdentityEntry entry;
    entry.container_id = container_id;
    try {
        value.at("vmid").get_to(entry.vmid);
        if (value.contains("created_at")) {
            value.at("created_at").get_to(entry.created_at);
        }
        if (value.contains("bundle_path")) {
            value.at("bundle_path").get_to(entry.bundle_path);
        }
    } catch (const json::exception& e) {
        throw RuntimeError(ErrorCode::InvalidStateFormat,
                           "Malformed mapping entry for '" + container_id + "': " + e.what());
    }
    return entry;
}

json entry_to_json(const IdentityEntry& entry) {
    return json{
            {"vmid", entry.vmid},
            {"created_at", entry.created_at},
            {"bundle_path", entry.bundle_path}
    };
}

} // namespace

IdentityStore::IdentityStore(std::string mapping_path, VmidInventory* inventory)
    : store_(std::move(mapping_path)), inventory_(inventory) {}

uint64_t IdentityStore::hash_container_id(const std::string& container_id) {
    uint64_t hash = kFnvOffsetBasis;
    for (unsigned char c : container_id) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}

uint32_t IdentityStore::seed_vmid(const std::string& container_id) {
    const uint64_t range = static_cast<uint64_t>(kMaxVmid - kMinVmid) + 1;
    return kMinVmid + static_cast<uint32_t>(hash_container_id(container_id) % range);
}

uint32_t IdentityStore::next_candidate(uint32_t vmid) {
    return vmid >= kMaxVmid ? kMinVmid : vmid + 1;
}

std::set<uint32_t> IdentityStore::live_vmids() const {
    if (inventory_ == nullptr) {
        return {};
    }
    try {
        return inventory_->list_vmids();
    } catch (const RuntimeError& e) {
        log_warning(std::string("Could not list existing containers, assuming none: ") + e.what());
        return {};
    }
}

uint32_t IdentityStore::assign(const std::string& container_id, const std::string& bundle_path, bool* created) {
    uint32_t assigned = 0;
    bool fresh = false;
    store_.update([&](json& mapping) {
        if (mapping.contains(container_id)) {
            assigned = entry_from_json(container_id, mapping.at(container_id)).vmid;
            log_debug("Reusing VMID " + std::to_string(assigned) + " for '" + container_id + "'");
            return;
        }

        std::set<uint32_t> taken;
        for (auto it = mapping.begin(); it != mapping.end(); ++it) {
            taken.insert(entry_from_json(it.key(), it.value()).vmid);
        }
        std::set<uint32_t> live = live_vmids();
        taken.insert(live.begin(), live.end());

        uint32_t candidate = seed_vmid(container_id);
        for (int attempt = 0; attempt < kMaxProbeAttempts; ++attempt) {
            if (taken.count(candidate) == 0) {
                assigned = candidate;
                break;
            }
            candidate = next_candidate(candidate);
        }
        if (assigned == 0) {
            throw RuntimeError(ErrorCode::IdentityExhausted,
                               "No free VMID for '" + container_id + "' after " +
                               std::to_string(kMaxProbeAttempts) + " attempts");
        }

        IdentityEntry entry;
        entry.container_id = container_id;
        entry.vmid = assigned;
        entry.created_at = unix_now();
        entry.bundle_path = bundle_path;
        mapping[container_id] = entry_to_json(entry);
        fresh = true;
        log_info("Assigned VMID " + std::to_string(assigned) + " to '" + container_id + "'");
    });
    if (created != nullptr) {
        *created = fresh;
    }
    return assigned;
}

uint32_t IdentityStore::lookup(const std::string& container_id) const {
    auto entry = find(container_id);
    if (!entry) {
        throw RuntimeError(ErrorCode::NotFound, "No VMID assigned to container '" + container_id + "'");
    }
    return entry->vmid;
}

std::optional<IdentityEntry> IdentityStore::find(const std::string& container_id) const {
    json mapping = store_.read();
    if (!mapping.contains(container_id)) {
        return std::nullopt;
    }
    return entry_from_json(container_id, mapping.at(container_id));
}

bool IdentityStore::remove(const std::string& container_id) {
    bool removed = false;
    store_.update([&](json& mapping) {
        removed = mapping.erase(container_id) > 0;
    });
    if (!removed) {
        log_debug("No VMID mapping to remove for '" + container_id + "'");
    }
    return removed;
}

std::vector<IdentityEntry> IdentityStore::list() const {
    std::vector<IdentityEntry> entries;
    json mapping = store_.read();
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        entries.push_back(entry_from_json(it.key(), it.value()));
    }
    return entries;
}
