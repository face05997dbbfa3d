#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct MountSpec {
    std::optional<std::string> source;
    std::optional<std::string> destination;
    std::optional<std::string> type;
    std::optional<std::vector<std::string>> options;
};

struct UserSpec {
    uint32_t uid = 0;
    uint32_t gid = 0;
    std::vector<uint32_t> additional_gids;
    std::string username;
};

struct RlimitSpec {
    std::string type;
    uint64_t hard = 0;
    uint64_t soft = 0;
};

struct DeviceSpec {
    std::string path;
    std::string type;
    int64_t major = 0;
    int64_t minor = 0;
    std::optional<uint32_t> file_mode;
    std::optional<uint32_t> uid;
    std::optional<uint32_t> gid;
};

struct NamespaceSpec {
    std::string type;
    std::string path;
};

// Everything optional stays unset unless the bundle names it, so "absent" and
// "explicitly empty" remain distinguishable.
struct BundleConfig {
    std::string bundle_path;
    std::string rootfs_path;

    std::optional<std::string> hostname;
    std::optional<std::vector<std::string>> process_args;
    std::optional<std::vector<std::string>> environment;
    std::optional<std::string> process_cwd;
    std::optional<std::vector<MountSpec>> mounts;
    std::optional<uint64_t> memory_limit;
    std::optional<double> cpu_limit;
    std::optional<std::vector<std::string>> capabilities;
    std::optional<std::string> seccomp_profile;

    std::optional<std::map<std::string, std::string>> annotations;
    std::optional<UserSpec> user;
    std::optional<std::vector<RlimitSpec>> rlimits;
    std::optional<std::vector<DeviceSpec>> devices;
    std::optional<std::vector<NamespaceSpec>> namespaces;
    std::optional<std::string> cgroups_path;
    std::optional<std::string> apparmor_profile;
    std::optional<std::string> selinux_label;
    std::optional<bool> no_new_privileges;
    std::optional<int> oom_score_adj;
    std::optional<bool> root_readonly;

    // from metadata.json
    std::optional<std::string> image_name;
    std::optional<std::string> image_tag;
    std::optional<std::vector<std::string>> entrypoint;
    std::optional<std::vector<std::string>> cmd;
    std::optional<std::string> working_directory;
    std::optional<std::map<std::string, std::string>> labels;

    std::vector<std::string> warnings;
};

enum class RootfsSourceKind {
    Directory,
    TarZstd,
    TarGzip,
    Tar,
    Unknown,
};

constexpr uint64_t kMaxConfigSize = 10 * 1024 * 1024;
constexpr uint64_t kMaxMetadataSize = 1024 * 1024;

// Reads <bundle>/config.json (required) and <bundle>/metadata.json (best effort).
// Throws RuntimeError with ConfigMissing, InvalidConfigFormat or RootfsMissing.
BundleConfig load_bundle(const std::string& bundle_path);

RootfsSourceKind classify_rootfs_source(const std::string& path);
const char* rootfs_source_kind_name(RootfsSourceKind kind);
std::string resolve_absolute_path(const std::string& path);

void from_json(const json& j, MountSpec& m);
void from_json(const json& j, UserSpec& u);
void from_json(const json& j, RlimitSpec& r);
void from_json(const json& j, DeviceSpec& d);
void from_json(const json& j, NamespaceSpec& ns);
