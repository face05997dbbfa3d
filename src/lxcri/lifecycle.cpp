#include "lxcri/lifecycle.h"

#include <algorithm>
#include <cmath>
#include <csignal>
#include <filesystem>
#include <system_error>
#include <utility>

#include "lxcri/filelock.h"
#include "lxcri/filesystem.h"
#include "lxcri/validation.h"

namespace fs = std::filesystem;

namespace {

constexpr uint64_t kBytesPerMiB = 1024 * 1024;
constexpr uint64_t kMinMemoryMb = 16;
constexpr double kSharesPerCore = 1024.0;
constexpr uint32_t kMaxCores = 128;
const char* const kDatasetAnnotation = "org.lxcri.zfs.dataset";
const char* const kTemplateAnnotation = "org.lxcri.template";

bool is_storage_template_ref(const std::string& ref) {
    const std::string marker = ":vztmpl/";
    auto pos = ref.find(marker);
    if (pos == std::string::npos || pos == 0) {
        return false;
    }
    std::string storage = ref.substr(0, pos);
    std::string file = ref.substr(pos + marker.size());
    if (file.empty() || file.find('/') != std::string::npos) {
        return false;
    }
    return is_valid_template_name(storage) && is_valid_template_name(file);
}

bool has_template_suffix(const std::string& path) {
    auto kind = classify_rootfs_source(path);
    if (kind == RootfsSourceKind::TarZstd || kind == RootfsSourceKind::TarGzip || kind == RootfsSourceKind::Tar) {
        return true;
    }
    const std::string xz = ".tar.xz";
    return path.size() >= xz.size() && path.compare(path.size() - xz.size(), xz.size(), xz) == 0;
}

// "local:vztmpl/web.tar.zst" and "/var/lib/vz/template/cache/web.tar.zst" both name "web".
std::string cached_template_name(const std::string& ref) {
    auto slash = ref.find_last_of("/:");
    std::string name = slash == std::string::npos ? ref : ref.substr(slash + 1);
    const std::string suffix = ".tar.zst";
    if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        name.erase(name.size() - suffix.size());
    }
    return name;
}

bool is_bind_mount(const MountSpec& mount) {
    if (mount.type && *mount.type == "bind") {
        return true;
    }
    if (mount.options) {
        for (const auto& option : *mount.options) {
            if (option == "bind" || option == "rbind") {
                return true;
            }
        }
    }
    return false;
}

bool has_option(const MountSpec& mount, const std::string& wanted) {
    if (!mount.options) {
        return false;
    }
    return std::find(mount.options->begin(), mount.options->end(), wanted) != mount.options->end();
}

// Removes a scratch directory when the owning scope ends.
class ScratchDirectory {
public:
    explicit ScratchDirectory(std::string path) : path_(std::move(path)) { clear(); }
    ~ScratchDirectory() { clear(); }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::string& path() const { return path_; }

private:
    void clear() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            log_warning("Failed to remove " + path_ + ": " + ec.message());
        }
    }

    std::string path_;
};

} // namespace

const char* bundle_ref_kind_name(BundleRefKind kind) {
    switch (kind) {
        case BundleRefKind::DirectoryBundle:
            return "bundle";
        case BundleRefKind::TemplateArchive:
            return "template-archive";
        case BundleRefKind::TemplateRef:
            return "template-ref";
        case BundleRefKind::ImageReference:
            return "image-reference";
        case BundleRefKind::Unsupported:
            return "unsupported";
    }
    return "unsupported";
}

BundleRef classify_bundle_ref(const std::string& ref, const std::vector<std::string>& allowed_prefixes) {
    BundleRef result;
    result.value = ref;
    if (ref.empty()) {
        return result;
    }
    if (is_storage_template_ref(ref)) {
        result.kind = BundleRefKind::TemplateRef;
        return result;
    }
    std::error_code ec;
    if (ref.find(':') != std::string::npos && !fs::exists(ref, ec)) {
        result.kind = BundleRefKind::ImageReference;
        return result;
    }

    result.value = canonicalize_within(ref, allowed_prefixes);
    if (path_is_directory(result.value)) {
        if (path_is_regular_file(result.value + "/config.json")) {
            result.kind = BundleRefKind::DirectoryBundle;
        }
    } else if (path_is_regular_file(result.value) && has_template_suffix(result.value)) {
        result.kind = BundleRefKind::TemplateArchive;
    }
    return result;
}

uint64_t memory_limit_to_mb(uint64_t bytes) {
    uint64_t mb = bytes / kBytesPerMiB + (bytes % kBytesPerMiB != 0 ? 1 : 0);
    return std::max(mb, kMinMemoryMb);
}

uint32_t cpu_shares_to_cores(double shares) {
    if (!(shares > 0.0)) {
        return 1;
    }
    double cores = std::round(shares / kSharesPerCore);
    if (cores < 1.0) {
        return 1;
    }
    if (cores > static_cast<double>(kMaxCores)) {
        return kMaxCores;
    }
    return static_cast<uint32_t>(cores);
}

std::string hostname_for(const std::string& container_id, const std::optional<std::string>& configured) {
    if (configured && !configured->empty()) {
        validate_hostname(*configured);
        return *configured;
    }
    std::string hostname = container_id;
    std::replace(hostname.begin(), hostname.end(), '_', '-');
    if (!is_valid_hostname(hostname)) {
        throw RuntimeError(ErrorCode::InvalidArgument,
                           "Cannot derive a hostname from container id '" + container_id + "'");
    }
    return hostname;
}

LifecycleOrchestrator::LifecycleOrchestrator(const EngineConfig& config, CommandRunner& runner)
    : config_(config),
      runner_(runner),
      pct_(config_, runner_),
      zfs_(config_, runner_),
      converter_(config_, runner_),
      states_(config_.state_root),
      identities_(config_.state_root + "/mapping.json", &pct_),
      templates_(config_.state_root + "/templates.json", config_.template_dir) {}

void LifecycleOrchestrator::fail(const RuntimeError& error, const std::string& operation,
                                 const std::string& container_id) {
    log_error(operation + " " + container_id + " failed: " + error.what());
    if (is_valid_container_id(container_id) && states_.exists(container_id)) {
        states_.record_event(container_id, "error", {
                {"operation", operation},
                {"code", error_code_name(error.code())},
                {"message", error.what()}
        });
    }
    rethrow_with_context(error, operation, container_id);
}

ContainerState LifecycleOrchestrator::create(const std::string& container_id, const std::string& bundle_ref) {
    try {
        validate_container_id(container_id);
        FileLock create_lock(create_lock_path(container_id), LockType::Write);
        return create_locked(container_id, bundle_ref);
    } catch (const RuntimeError& e) {
        fail(e, "create", container_id);
    }
}

ContainerState LifecycleOrchestrator::create_locked(const std::string& container_id, const std::string& bundle_ref) {
    uint32_t vmid = 0;
    bool fresh_identity = false;
    bool container_created = false;
    try {
        if (states_.exists(container_id)) {
            throw RuntimeError(ErrorCode::AlreadyExists, "container already exists");
        }

        BundleRef ref = classify_bundle_ref(bundle_ref, config_.allowed_bundle_prefixes);
        log_info("Creating '" + container_id + "' from " + bundle_ref_kind_name(ref.kind) + " " + ref.value);
        if (ref.kind == BundleRefKind::ImageReference) {
            throw RuntimeError(ErrorCode::UnsupportedImageReference,
                               "image reference '" + bundle_ref +
                               "' is not supported; pass an OCI bundle directory or a template");
        }
        if (ref.kind == BundleRefKind::Unsupported) {
            throw RuntimeError(ErrorCode::UnsupportedSource,
                               "'" + bundle_ref + "' is neither an OCI bundle nor a template");
        }

        std::optional<BundleConfig> bundle;
        if (ref.kind == BundleRefKind::DirectoryBundle) {
            bundle = load_bundle(ref.value);
        }

        vmid = identities_.assign(container_id, ref.value, &fresh_identity);

        std::map<std::string, std::string> annotations;
        if (bundle && bundle->annotations) {
            annotations = *bundle->annotations;
        }
        if (auto dataset = provision_storage(container_id)) {
            annotations[kDatasetAnnotation] = *dataset;
        }

        std::string ostemplate = prepare_template(container_id, ref, bundle);
        annotations[kTemplateAnnotation] = ostemplate;

        pct_.create(build_create_request(vmid, container_id, ostemplate, bundle));
        container_created = true;
        if (bundle) {
            apply_mounts(vmid, *bundle);
        }

        ContainerState state = states_.create(container_id, vmid, ref.value, annotations);
        log_info("Created '" + container_id + "' as VMID " + std::to_string(vmid));
        return state;
    } catch (const RuntimeError&) {
        if (vmid != 0) {
            rollback(container_id, vmid, fresh_identity, container_created);
        }
        throw;
    }
}

std::string LifecycleOrchestrator::create_lock_path(const std::string& container_id) const {
    return config_.state_root + "/.locks/" + container_id;
}

std::optional<std::string> LifecycleOrchestrator::provision_storage(const std::string& container_id) {
    if (!config_.zfs || config_.zfs->pool.empty()) {
        return std::nullopt;
    }
    return zfs_.provision(config_.zfs->pool, container_dataset_name(*config_.zfs, container_id));
}

std::string LifecycleOrchestrator::prepare_template(const std::string& container_id, const BundleRef& ref,
                                                    const std::optional<BundleConfig>& bundle) {
    if (ref.kind != BundleRefKind::DirectoryBundle || !bundle) {
        if (auto cached = templates_.get(cached_template_name(ref.value))) {
            log_debug("Using cached template '" + cached->name + "'");
        }
        return ref.value;
    }

    std::string name = template_name_for(*bundle, container_id);
    std::string storage_ref = config_.template_storage + ":vztmpl/" + name + ".tar.zst";
    if (templates_.find(name)) {
        log_info("Rebuilding template '" + name + "' from " + ref.value);
    }

    ScratchDirectory scratch(config_.work_dir + "/" + container_id + "-rootfs");
    BundleConfig converted = converter_.convert_to_rootfs(ref.value, scratch.path());
    std::string archive = converter_.package_as_template(scratch.path(), name);

    TemplateInfo info;
    info.name = name;
    info.archive_path = archive;
    std::error_code ec;
    info.size = fs::file_size(archive, ec);
    if (ec) {
        info.size = 0;
    }
    info.created_at = unix_now();
    info.last_accessed = info.created_at;
    info.source_type = TemplateSource::OciBundle;
    info.metadata = template_metadata_from_bundle(converted);
    templates_.add(info);
    return storage_ref;
}

PctCreateRequest LifecycleOrchestrator::build_create_request(uint32_t vmid, const std::string& container_id,
                                                             const std::string& ostemplate,
                                                             const std::optional<BundleConfig>& bundle) const {
    PctCreateRequest request;
    request.vmid = vmid;
    request.ostemplate = ostemplate;
    std::optional<std::string> configured_hostname;
    if (bundle) {
        configured_hostname = bundle->hostname;
    }
    request.hostname = hostname_for(container_id, configured_hostname);
    request.memory_mb = config_.default_memory_mb;
    request.cores = config_.default_cores;
    if (bundle && bundle->memory_limit) {
        request.memory_mb = memory_limit_to_mb(*bundle->memory_limit);
    }
    if (bundle && bundle->cpu_limit) {
        request.cores = cpu_shares_to_cores(*bundle->cpu_limit);
    }
    request.network = config_.network;
    request.rootfs = config_.rootfs;
    request.unprivileged = config_.unprivileged;
    return request;
}

void LifecycleOrchestrator::apply_mounts(uint32_t vmid, const BundleConfig& bundle) {
    if (!bundle.mounts) {
        return;
    }
    int index = 0;
    for (const auto& mount : *bundle.mounts) {
        if (!mount.destination || mount.destination->empty()) {
            log_warning("Skipping mount without destination");
            continue;
        }
        if (!is_bind_mount(mount)) {
            log_debug("Skipping " + mount.type.value_or("untyped") + " mount at " + *mount.destination +
                      ", provided by LXC");
            continue;
        }
        if (!mount.source || mount.source->empty()) {
            log_warning("Skipping bind mount at " + *mount.destination + " without source");
            continue;
        }
        pct_.set_mount(vmid, index, *mount.source, *mount.destination, has_option(mount, "ro"));
        ++index;
    }
    if (index > 0) {
        log_info("Applied " + std::to_string(index) + " mount(s) to VMID " + std::to_string(vmid));
    }
}

void LifecycleOrchestrator::rollback(const std::string& container_id, uint32_t vmid, bool release_identity,
                                     bool destroy_container) {
    if (destroy_container) {
        try {
            pct_.destroy(vmid);
            log_info("Rolled back container VMID " + std::to_string(vmid));
        } catch (const RuntimeError& e) {
            log_warning("Rollback could not destroy VMID " + std::to_string(vmid) + ": " + e.what());
        }
    }
    if (release_identity) {
        try {
            identities_.remove(container_id);
        } catch (const RuntimeError& e) {
            log_warning("Rollback could not release VMID for '" + container_id + "': " + e.what());
        }
    }
}

ContainerState LifecycleOrchestrator::load_running(const std::string& container_id) {
    ContainerState state = states_.load(container_id);
    if (state.status != ContainerStatus::Running) {
        throw RuntimeError(ErrorCode::InvalidArgument,
                           std::string("container is ") + container_status_name(state.status) + ", not running");
    }
    return state;
}

ContainerState LifecycleOrchestrator::start(const std::string& container_id) {
    try {
        validate_container_id(container_id);
        ContainerState state = states_.load(container_id);
        if (state.status == ContainerStatus::Running) {
            throw RuntimeError(ErrorCode::InvalidArgument, "container is already running");
        }
        uint32_t vmid = identities_.lookup(container_id);
        pct_.start(vmid);
        pid_t pid = pct_.init_pid(vmid);
        return states_.update(container_id, ContainerStatus::Running, pid);
    } catch (const RuntimeError& e) {
        fail(e, "start", container_id);
    }
}

ContainerState LifecycleOrchestrator::stop(const std::string& container_id) {
    try {
        validate_container_id(container_id);
        ContainerState state = states_.load(container_id);
        if (state.status == ContainerStatus::Stopped) {
            log_info("'" + container_id + "' is already stopped");
            return state;
        }
        if (state.status != ContainerStatus::Running) {
            throw RuntimeError(ErrorCode::InvalidArgument,
                               std::string("container is ") + container_status_name(state.status) + ", not running");
        }
        pct_.stop(identities_.lookup(container_id));
        return states_.update(container_id, ContainerStatus::Stopped, 0);
    } catch (const RuntimeError& e) {
        fail(e, "stop", container_id);
    }
}

ContainerState LifecycleOrchestrator::kill(const std::string& container_id, int signal) {
    try {
        validate_container_id(container_id);
        load_running(container_id);
        uint32_t vmid = identities_.lookup(container_id);
        if (signal == SIGTERM) {
            pct_.shutdown(vmid);
        } else {
            pct_.stop(vmid);
        }
        return states_.update(container_id, ContainerStatus::Stopped, 0);
    } catch (const RuntimeError& e) {
        fail(e, "kill", container_id);
    }
}

void LifecycleOrchestrator::remove(const std::string& container_id, bool force) {
    try {
        validate_container_id(container_id);
        std::optional<ContainerState> state;
        if (states_.exists(container_id)) {
            state = states_.load(container_id);
        }
        auto identity = identities_.find(container_id);
        if (!state && !identity) {
            throw RuntimeError(ErrorCode::NotFound, "container does not exist");
        }
        uint32_t vmid = identity ? identity->vmid : state->vmid;

        if (state && state->status == ContainerStatus::Running) {
            if (!force) {
                throw RuntimeError(ErrorCode::InvalidArgument, "container is running; stop it first or use --force");
            }
            pct_.stop(vmid);
        }
        try {
            pct_.destroy(vmid);
        } catch (const RuntimeError& e) {
            if (!force || e.code() != ErrorCode::NotFound) {
                throw;
            }
            log_warning("VMID " + std::to_string(vmid) + " already gone: " + e.what());
        }
        states_.remove(container_id);
        identities_.remove(container_id);
        log_info("Deleted '" + container_id + "' (VMID " + std::to_string(vmid) + ")");
    } catch (const RuntimeError& e) {
        fail(e, "delete", container_id);
    }
}

ContainerState LifecycleOrchestrator::state(const std::string& container_id) {
    try {
        validate_container_id(container_id);
        ContainerState state = states_.load(container_id);
        if (state.status != ContainerStatus::Running) {
            return state;
        }
        std::string reported;
        try {
            reported = pct_.status(state.vmid);
        } catch (const RuntimeError& e) {
            log_warning("Could not query status of '" + container_id + "': " + e.what());
            return state;
        }
        if (reported == "stopped") {
            log_info("'" + container_id + "' stopped outside lxcri, updating state");
            return states_.update(container_id, ContainerStatus::Stopped, 0);
        }
        return state;
    } catch (const RuntimeError& e) {
        fail(e, "state", container_id);
    }
}

std::vector<ContainerState> LifecycleOrchestrator::list() const {
    return states_.list();
}

CommandOutput LifecycleOrchestrator::exec(const std::string& container_id, const std::vector<std::string>& command) {
    try {
        validate_container_id(container_id);
        load_running(container_id);
        return pct_.exec(identities_.lookup(container_id), command);
    } catch (const RuntimeError& e) {
        fail(e, "exec", container_id);
    }
}
