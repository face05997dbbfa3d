#include "lxcri/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits.h>
#include <sstream>
#include <system_error>

#include "lxcri/errors.h"
#include "lxcri/filesystem.h"
#include "lxcri/options.h"
#include "lxcri/validation.h"

namespace fs = std::filesystem;

namespace {

// Reads optional fields, turning type mismatches into warnings instead of failures.
class FieldReader {
public:
    explicit FieldReader(std::vector<std::string>& warnings) : warnings_(warnings) {}

    template <typename T>
    void read(const json& obj, const char* key, const std::string& where, std::optional<T>& out) {
        if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null()) {
            return;
        }
        try {
            out = obj.at(key).get<T>();
        } catch (const json::exception& e) {
            note("Ignoring " + where + "." + key + ": " + e.what());
        }
    }

    void note(const std::string& message) {
        log_warning(message);
        warnings_.push_back(message);
    }

private:
    std::vector<std::string>& warnings_;
};

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool read_capped(const std::string& path, uint64_t cap, std::string& content, std::string& error) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    if (size > cap) {
        error = "file exceeds " + std::to_string(cap) + " bytes";
        return false;
    }
    std::ifstream ifs(path);
    if (!ifs) {
        error = "cannot open file";
        return false;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    content = buffer.str();
    return true;
}

const json* child_object(const json& parent, const char* key) {
    if (parent.is_object() && parent.contains(key) && parent.at(key).is_object()) {
        return &parent.at(key);
    }
    return nullptr;
}

void parse_process(const json& process, FieldReader& reader, BundleConfig& config) {
    reader.read(process, "args", "process", config.process_args);
    reader.read(process, "env", "process", config.environment);
    reader.read(process, "cwd", "process", config.process_cwd);
    reader.read(process, "user", "process", config.user);
    reader.read(process, "rlimits", "process", config.rlimits);
    reader.read(process, "noNewPrivileges", "process", config.no_new_privileges);
    reader.read(process, "oomScoreAdj", "process", config.oom_score_adj);
    reader.read(process, "apparmorProfile", "process", config.apparmor_profile);
    reader.read(process, "selinuxLabel", "process", config.selinux_label);
    if (const json* caps = child_object(process, "capabilities")) {
        reader.read(*caps, "bounding", "process.capabilities", config.capabilities);
    }
}

void parse_linux(const json& linux_section, FieldReader& reader, BundleConfig& config) {
    if (const json* resources = child_object(linux_section, "resources")) {
        if (const json* memory = child_object(*resources, "memory")) {
            std::optional<int64_t> limit;
            reader.read(*memory, "limit", "linux.resources.memory", limit);
            if (limit && *limit > 0) {
                config.memory_limit = static_cast<uint64_t>(*limit);
            } else if (limit) {
                log_debug("Ignoring non-positive memory limit " + std::to_string(*limit));
            }
        }
        if (const json* cpu = child_object(*resources, "cpu")) {
            reader.read(*cpu, "shares", "linux.resources.cpu", config.cpu_limit);
        }
    }
    if (const json* seccomp = child_object(linux_section, "seccomp")) {
        reader.read(*seccomp, "defaultAction", "linux.seccomp", config.seccomp_profile);
    }
    reader.read(linux_section, "devices", "linux", config.devices);
    reader.read(linux_section, "namespaces", "linux", config.namespaces);
    reader.read(linux_section, "cgroupsPath", "linux", config.cgroups_path);
}

void parse_mounts(const json& mounts, FieldReader& reader, BundleConfig& config) {
    if (!mounts.is_array()) {
        reader.note("Ignoring mounts: expected an array");
        return;
    }
    std::vector<MountSpec> parsed;
    for (const auto& entry : mounts) {
        if (!entry.is_object()) {
            reader.note("Ignoring mount entry that is not an object");
            continue;
        }
        parsed.push_back(entry.get<MountSpec>());
    }
    config.mounts = parsed;
}

void resolve_rootfs(const json& root, BundleConfig& config) {
    std::string root_path = "rootfs";
    if (root.is_object()) {
        if (root.contains("path") && root.at("path").is_string() && !root.at("path").get<std::string>().empty()) {
            root_path = root.at("path").get<std::string>();
        }
        if (root.contains("readonly") && root.at("readonly").is_boolean()) {
            config.root_readonly = root.at("readonly").get<bool>();
        }
    }
    std::string candidate = root_path.front() == '/' ? root_path : config.bundle_path + "/" + root_path;
    // root.path may not leave the bundle directory
    candidate = canonicalize_within(candidate, {config.bundle_path});
    RootfsSourceKind kind = classify_rootfs_source(candidate);
    bool usable = kind == RootfsSourceKind::Directory ||
                  (kind != RootfsSourceKind::Unknown && path_is_regular_file(candidate));
    if (!usable) {
        throw RuntimeError(ErrorCode::RootfsMissing, "Bundle rootfs not found: " + candidate);
    }
    config.rootfs_path = resolve_absolute_path(candidate);
}

void load_metadata(FieldReader& reader, BundleConfig& config) {
    std::string path = config.bundle_path + "/metadata.json";
    if (!path_is_regular_file(path)) {
        log_info("No metadata.json found in bundle, using config.json only");
        return;
    }
    std::string content;
    std::string error;
    if (!read_capped(path, kMaxMetadataSize, content, error)) {
        reader.note("Failed to read metadata.json: " + error);
        return;
    }
    json j = json::parse(content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        reader.note("Failed to parse metadata.json: not a JSON object");
        return;
    }

    std::optional<std::string> image;
    reader.read(j, "image", "metadata", image);
    if (image && !image->empty()) {
        auto colon = image->find(':');
        if (colon == std::string::npos) {
            config.image_name = *image;
        } else {
            config.image_name = image->substr(0, colon);
            config.image_tag = image->substr(colon + 1);
        }
    }
    reader.read(j, "entrypoint", "metadata", config.entrypoint);
    reader.read(j, "cmd", "metadata", config.cmd);
    reader.read(j, "workingDir", "metadata", config.working_directory);
    reader.read(j, "labels", "metadata", config.labels);
}

} // namespace

void from_json(const json& j, MountSpec& m) {
    if (j.contains("source") && j.at("source").is_string()) {
        m.source = j.at("source").get<std::string>();
    }
    if (j.contains("destination") && j.at("destination").is_string()) {
        m.destination = j.at("destination").get<std::string>();
    }
    if (j.contains("type") && j.at("type").is_string()) {
        m.type = j.at("type").get<std::string>();
    }
    if (j.contains("options") && j.at("options").is_array()) {
        std::vector<std::string> options;
        for (const auto& option : j.at("options")) {
            if (option.is_string()) {
                options.push_back(option.get<std::string>());
            }
        }
        m.options = options;
    }
}

void from_json(const json& j, UserSpec& u) {
    if (j.contains("uid")) {
        j.at("uid").get_to(u.uid);
    }
    if (j.contains("gid")) {
        j.at("gid").get_to(u.gid);
    }
    if (j.contains("additionalGids")) {
        j.at("additionalGids").get_to(u.additional_gids);
    }
    if (j.contains("username")) {
        j.at("username").get_to(u.username);
    }
}

void from_json(const json& j, RlimitSpec& r) {
    j.at("type").get_to(r.type);
    j.at("hard").get_to(r.hard);
    j.at("soft").get_to(r.soft);
}

void from_json(const json& j, DeviceSpec& d) {
    j.at("path").get_to(d.path);
    j.at("type").get_to(d.type);
    if (j.contains("major")) {
        j.at("major").get_to(d.major);
    }
    if (j.contains("minor")) {
        j.at("minor").get_to(d.minor);
    }
    if (j.contains("fileMode")) {
        d.file_mode = j.at("fileMode").get<uint32_t>();
    }
    if (j.contains("uid")) {
        d.uid = j.at("uid").get<uint32_t>();
    }
    if (j.contains("gid")) {
        d.gid = j.at("gid").get<uint32_t>();
    }
}

void from_json(const json& j, NamespaceSpec& ns) {
    j.at("type").get_to(ns.type);
    if (j.contains("path")) {
        j.at("path").get_to(ns.path);
    }
}

BundleConfig load_bundle(const std::string& bundle_path) {
    BundleConfig config;
    config.bundle_path = resolve_absolute_path(bundle_path);

    std::string config_path = config.bundle_path + "/config.json";
    std::string content;
    std::string error;
    if (!read_capped(config_path, kMaxConfigSize, content, error)) {
        throw RuntimeError(ErrorCode::ConfigMissing,
                           "Failed to load config.json: " + config_path + " (" + error + ")");
    }
    json j = json::parse(content, nullptr, false);
    if (j.is_discarded()) {
        throw RuntimeError(ErrorCode::InvalidConfigFormat, "config.json is not valid JSON: " + config_path);
    }
    if (!j.is_object()) {
        throw RuntimeError(ErrorCode::InvalidConfigFormat,
                           "config.json must describe a JSON object: " + config_path);
    }

    FieldReader reader(config.warnings);
    reader.read(j, "hostname", "config", config.hostname);
    if (const json* process = child_object(j, "process")) {
        parse_process(*process, reader, config);
    }
    if (const json* linux_section = child_object(j, "linux")) {
        parse_linux(*linux_section, reader, config);
    }
    if (j.contains("mounts")) {
        parse_mounts(j.at("mounts"), reader, config);
    }
    reader.read(j, "annotations", "config", config.annotations);
    resolve_rootfs(j.contains("root") ? j.at("root") : json(), config);

    load_metadata(reader, config);
    log_debug("Parsed bundle " + config.bundle_path + " (rootfs " + config.rootfs_path + ")");
    return config;
}

RootfsSourceKind classify_rootfs_source(const std::string& path) {
    if (path_is_directory(path)) {
        return RootfsSourceKind::Directory;
    }
    if (ends_with(path, ".tar.zst") || ends_with(path, ".tzst")) {
        return RootfsSourceKind::TarZstd;
    }
    if (ends_with(path, ".tar.gz") || ends_with(path, ".tgz")) {
        return RootfsSourceKind::TarGzip;
    }
    if (ends_with(path, ".tar")) {
        return RootfsSourceKind::Tar;
    }
    return RootfsSourceKind::Unknown;
}

const char* rootfs_source_kind_name(RootfsSourceKind kind) {
    switch (kind) {
        case RootfsSourceKind::Directory:
            return "directory";
        case RootfsSourceKind::TarZstd:
            return "tar.zst";
        case RootfsSourceKind::TarGzip:
            return "tar.gz";
        case RootfsSourceKind::Tar:
            return "tar";
        case RootfsSourceKind::Unknown:
            return "unknown";
    }
    return "unknown";
}

std::string resolve_absolute_path(const std::string& path) {
    if (path.empty()) {
        return path;
    }
    char resolved_path[PATH_MAX];
    if (realpath(path.c_str(), resolved_path) != nullptr) {
        return std::string(resolved_path);
    }
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        return path;
    }
    return absolute.lexically_normal().string();
}
