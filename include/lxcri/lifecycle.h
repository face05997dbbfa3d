#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lxcri/config.h"
#include "lxcri/errors.h"
#include "lxcri/identity.h"
#include "lxcri/image_converter.h"
#include "lxcri/options.h"
#include "lxcri/pct.h"
#include "lxcri/process.h"
#include "lxcri/state.h"
#include "lxcri/template_cache.h"
#include "lxcri/zfs.h"

enum class BundleRefKind {
    DirectoryBundle,  // directory holding config.json
    TemplateArchive,  // packaged template file on disk
    TemplateRef,      // "<storage>:vztmpl/<file>"
    ImageReference,   // registry-style "name:tag" with no local directory
    Unsupported,
};

const char* bundle_ref_kind_name(BundleRefKind kind);

struct BundleRef {
    BundleRefKind kind = BundleRefKind::Unsupported;
    // canonical path for on-disk kinds, the reference text otherwise
    std::string value;
};

// Paths are canonicalized and must stay inside `allowed_prefixes`, otherwise
// RuntimeError(PathTraversalRejected) is thrown before anything is touched.
BundleRef classify_bundle_ref(const std::string& ref, const std::vector<std::string>& allowed_prefixes);

uint64_t memory_limit_to_mb(uint64_t bytes);
uint32_t cpu_shares_to_cores(double shares);
std::string hostname_for(const std::string& container_id, const std::optional<std::string>& configured);

class LifecycleOrchestrator {
public:
    LifecycleOrchestrator(const EngineConfig& config, CommandRunner& runner);

    ContainerState create(const std::string& container_id, const std::string& bundle_ref);
    ContainerState start(const std::string& container_id);
    ContainerState stop(const std::string& container_id);
    // SIGTERM asks for a clean shutdown, any other signal stops the container.
    ContainerState kill(const std::string& container_id, int signal);
    // A running container is only removed with `force`, which stops it first.
    void remove(const std::string& container_id, bool force);
    // Reconciles a running record with the container tool before returning it.
    ContainerState state(const std::string& container_id);
    std::vector<ContainerState> list() const;
    CommandOutput exec(const std::string& container_id, const std::vector<std::string>& command);

    const EngineConfig& config() const { return config_; }
    StateStore& states() { return states_; }
    IdentityStore& identities() { return identities_; }
    TemplateCache& templates() { return templates_; }

private:
    std::string prepare_template(const std::string& container_id, const BundleRef& ref,
                                 const std::optional<BundleConfig>& bundle);
    ContainerState create_locked(const std::string& container_id, const std::string& bundle_ref);
    // Held for the whole of create so concurrent creates of one id run one at a time.
    std::string create_lock_path(const std::string& container_id) const;
    std::optional<std::string> provision_storage(const std::string& container_id);
    PctCreateRequest build_create_request(uint32_t vmid, const std::string& container_id,
                                          const std::string& ostemplate,
                                          const std::optional<BundleConfig>& bundle) const;
    void apply_mounts(uint32_t vmid, const BundleConfig& bundle);
    void rollback(const std::string& container_id, uint32_t vmid, bool release_identity, bool destroy_container);
    ContainerState load_running(const std::string& container_id);
    [[noreturn]] void fail(const RuntimeError& error, const std::string& operation, const std::string& container_id);

    EngineConfig config_;
    CommandRunner& runner_;
    PctClient pct_;
    ZfsClient zfs_;
    ImageConverter converter_;
    StateStore states_;
    IdentityStore identities_;
    TemplateCache templates_;
};
