#include "lxcri/options.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "lxcri/errors.h"

using json = nlohmann::json;

namespace {

std::string ensure_trailing_slash(const std::string& path) {
    if (path.empty() || path.back() == '/') {
        return path;
    }
    return path + "/";
}

std::unique_ptr<std::ofstream> g_log_stream;

void emit_log(const char* level, const std::string& message) {
    std::string line;
    if (g_global_options.log_format == "json") {
        json entry = {
                {"time", iso8601_now()},
                {"level", level},
                {"msg", message}
        };
        line = entry.dump();
    } else {
        line = std::string("[") + level + "] " + message;
    }
    if (g_log_stream && g_log_stream->is_open()) {
        (*g_log_stream) << line << std::endl;
    } else {
        std::cerr << line << std::endl;
    }
}

template <typename T>
void read_key(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        j.at(key).get_to(out);
    }
}

} // namespace

GlobalOptions g_global_options;
const std::string RUNTIME_VERSION = "0.1.0";
const std::string DEFAULT_CONFIG_PATH = "/etc/lxcri/config.json";

bool configure_log_destination(const std::string& path) {
    std::unique_ptr<std::ofstream> stream(new std::ofstream(path, std::ios::app));
    if (!stream || !(*stream)) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        return false;
    }
    g_log_stream = std::move(stream);
    return true;
}

void reset_log_destination() {
    g_log_stream.reset();
}

void log_debug(const std::string& message) {
    if (g_global_options.debug) {
        emit_log("debug", message);
    }
}

void log_info(const std::string& message) {
    if (g_global_options.debug || g_log_stream) {
        emit_log("info", message);
    }
}

void log_warning(const std::string& message) {
    emit_log("warning", message);
}

void log_error(const std::string& message) {
    emit_log("error", message);
}

std::string fallback_state_root() {
    return "/tmp/lxcri-" + std::to_string(geteuid());
}

std::string default_state_root() {
    if (geteuid() == 0) {
        return "/var/lib/lxcri";
    }
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir && runtime_dir[0] != '\0') {
        return ensure_trailing_slash(runtime_dir) + "lxcri";
    }
    return fallback_state_root();
}

std::string iso8601_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto seconds = system_clock::to_time_t(now);
    std::tm tm {};
    gmtime_r(&seconds, &tm);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%FT%T") << '.' << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}

EngineConfig default_engine_config() {
    EngineConfig config;
    config.state_root = default_state_root();
    return config;
}

EngineConfig load_engine_config(const std::string& path) {
    EngineConfig config = default_engine_config();
    std::ifstream ifs(path);
    if (!ifs) {
        log_debug("No engine configuration at '" + path + "', using defaults");
        return config;
    }

    json j = json::parse(ifs, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw RuntimeError(ErrorCode::InvalidConfigFormat,
                           "Engine configuration is not a JSON object: " + path);
    }

    try {
        read_key(j, "state_root", config.state_root);
        read_key(j, "work_dir", config.work_dir);
        read_key(j, "template_dir", config.template_dir);
        read_key(j, "template_storage", config.template_storage);
        read_key(j, "allowed_bundle_prefixes", config.allowed_bundle_prefixes);
        read_key(j, "network", config.network);
        read_key(j, "rootfs", config.rootfs);
        read_key(j, "unprivileged", config.unprivileged);
        read_key(j, "default_memory_mb", config.default_memory_mb);
        read_key(j, "default_cores", config.default_cores);
        read_key(j, "command_timeout_sec", config.command_timeout_sec);
        if (j.contains("zfs") && j["zfs"].is_object()) {
            ZfsSettings zfs;
            read_key(j["zfs"], "pool", zfs.pool);
            read_key(j["zfs"], "parent_dataset", zfs.parent_dataset);
            if (!zfs.pool.empty()) {
                if (zfs.parent_dataset.empty()) {
                    zfs.parent_dataset = zfs.pool + "/lxcri";
                }
                config.zfs = zfs;
            }
        }
        if (j.contains("tools") && j["tools"].is_object()) {
            const auto& tools = j["tools"];
            read_key(tools, "pct", config.tools.pct);
            read_key(tools, "zfs", config.tools.zfs);
            read_key(tools, "tar", config.tools.tar);
            read_key(tools, "lxc_info", config.tools.lxc_info);
        }
    } catch (const json::exception& e) {
        throw RuntimeError(ErrorCode::InvalidConfigFormat,
                           "Invalid engine configuration '" + path + "': " + e.what());
    }

    if (config.command_timeout_sec < 0) {
        throw RuntimeError(ErrorCode::InvalidConfigFormat,
                           "command_timeout_sec must not be negative");
    }
    log_debug("Loaded engine configuration from '" + path + "'");
    return config;
}
