#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct GlobalOptions {
    bool debug = false;
    std::string log_path;
    std::string log_format = "text";
    std::string root_path;
    std::string config_path;
};

extern GlobalOptions g_global_options;
extern const std::string RUNTIME_VERSION;
extern const std::string DEFAULT_CONFIG_PATH;

bool configure_log_destination(const std::string& path);
void reset_log_destination();
void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warning(const std::string& message);
void log_error(const std::string& message);

std::string fallback_state_root();
std::string default_state_root();
std::string iso8601_now();

struct ZfsSettings {
    std::string pool;
    std::string parent_dataset;
};

struct ToolPaths {
    std::string pct = "pct";
    std::string zfs = "zfs";
    std::string tar = "tar";
    std::string lxc_info = "lxc-info";
};

struct EngineConfig {
    std::string state_root;
    std::string work_dir = "/tmp/lxcri-work";
    std::string template_dir = "/var/lib/vz/template/cache";
    std::string template_storage = "local";
    std::vector<std::string> allowed_bundle_prefixes = {"/var/lib/lxcri/bundles", "/tmp/lxcri-bundles"};
    std::optional<ZfsSettings> zfs;
    std::string network = "name=eth0,bridge=vmbr0,ip=dhcp";
    std::string rootfs;
    bool unprivileged = true;
    uint64_t default_memory_mb = 512;
    uint32_t default_cores = 1;
    int command_timeout_sec = 300;
    ToolPaths tools;
};

EngineConfig default_engine_config();

// A missing file yields the defaults; a present but malformed one throws
// RuntimeError(InvalidConfigFormat).
EngineConfig load_engine_config(const std::string& path);
