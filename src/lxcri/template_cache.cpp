#include "lxcri/template_cache.h"

#include <filesystem>
#include <system_error>
#include <utility>

#include "lxcri/errors.h"
#include "lxcri/options.h"
#include "lxcri/state.h"

namespace fs = std::filesystem;

namespace {

constexpr int64_t kSecondsPerDay = 24 * 60 * 60;

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
void get_optional(const json& j, const char* key, std::optional<T>& value) {
    if (j.contains(key) && !j.at(key).is_null()) {
        value = j.at(key).get<T>();
    }
}

TemplateInfo info_from_entry(const std::string& name, const json& entry) {
    try {
        TemplateInfo info = entry.get<TemplateInfo>();
        info.name = name;
        return info;
    } catch (const json::exception& e) {
        throw RuntimeError(ErrorCode::InvalidStateFormat,
                           "Malformed template entry '" + name + "': " + e.what());
    }
}

} // namespace

const char* template_source_name(TemplateSource source) {
    switch (source) {
        case TemplateSource::OciBundle:
            return "oci_bundle";
        case TemplateSource::Downloaded:
            return "downloaded";
        case TemplateSource::Available:
            return "available";
        case TemplateSource::Custom:
            return "custom";
    }
    return "custom";
}

std::optional<TemplateSource> parse_template_source(const std::string& name) {
    if (name == "oci_bundle") {
        return TemplateSource::OciBundle;
    }
    if (name == "downloaded") {
        return TemplateSource::Downloaded;
    }
    if (name == "available") {
        return TemplateSource::Available;
    }
    if (name == "custom") {
        return TemplateSource::Custom;
    }
    return std::nullopt;
}

void to_json(json& j, const TemplateMetadata& metadata) {
    j = json::object();
    put_optional(j, "image_name", metadata.image_name);
    put_optional(j, "image_tag", metadata.image_tag);
    put_optional(j, "entrypoint", metadata.entrypoint);
    put_optional(j, "cmd", metadata.cmd);
    put_optional(j, "working_directory", metadata.working_directory);
    if (!metadata.labels.empty()) {
        j["labels"] = metadata.labels;
    }
}

void from_json(const json& j, TemplateMetadata& metadata) {
    get_optional(j, "image_name", metadata.image_name);
    get_optional(j, "image_tag", metadata.image_tag);
    get_optional(j, "entrypoint", metadata.entrypoint);
    get_optional(j, "cmd", metadata.cmd);
    get_optional(j, "working_directory", metadata.working_directory);
    if (j.contains("labels")) {
        j.at("labels").get_to(metadata.labels);
    }
}

void to_json(json& j, const TemplateInfo& info) {
    j = json{
            {"name", info.name},
            {"archive_path", info.archive_path},
            {"size", info.size},
            {"created_at", info.created_at},
            {"last_accessed", info.last_accessed},
            {"source_type", template_source_name(info.source_type)}
    };
    if (info.metadata) {
        j["metadata"] = *info.metadata;
    }
}

void from_json(const json& j, TemplateInfo& info) {
    if (j.contains("name")) {
        j.at("name").get_to(info.name);
    }
    if (j.contains("archive_path")) {
        j.at("archive_path").get_to(info.archive_path);
    }
    j.at("size").get_to(info.size);
    j.at("created_at").get_to(info.created_at);
    j.at("last_accessed").get_to(info.last_accessed);
    auto source = parse_template_source(j.at("source_type").get<std::string>());
    info.source_type = source.value_or(TemplateSource::Custom);
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        info.metadata = j.at("metadata").get<TemplateMetadata>();
    }
}

TemplateMetadata template_metadata_from_bundle(const BundleConfig& bundle) {
    TemplateMetadata metadata;
    metadata.image_name = bundle.image_name;
    metadata.image_tag = bundle.image_tag;
    metadata.entrypoint = bundle.entrypoint;
    metadata.cmd = bundle.cmd;
    metadata.working_directory = bundle.working_directory;
    if (bundle.labels) {
        metadata.labels = *bundle.labels;
    }
    return metadata;
}

TemplateCache::TemplateCache(std::string index_path, std::string template_dir)
    : store_(std::move(index_path)), template_dir_(std::move(template_dir)) {}

std::string TemplateCache::archive_path_for(const std::string& name) const {
    return template_dir_ + "/" + name + ".tar.zst";
}

void TemplateCache::add(const TemplateInfo& info) {
    TemplateInfo stored = info;
    if (stored.archive_path.empty()) {
        stored.archive_path = archive_path_for(stored.name);
    }
    store_.update([&](json& index) {
        index[stored.name] = stored;
    });
    log_debug("Registered template '" + stored.name + "' (" + template_source_name(stored.source_type) + ")");
}

std::optional<TemplateInfo> TemplateCache::get(const std::string& name) {
    std::optional<TemplateInfo> found;
    store_.update([&](json& index) {
        if (!index.contains(name)) {
            return;
        }
        TemplateInfo info = info_from_entry(name, index.at(name));
        info.last_accessed = unix_now();
        index[name] = info;
        found = info;
    });
    return found;
}

std::optional<TemplateInfo> TemplateCache::find(const std::string& name) const {
    json index = store_.read();
    if (!index.contains(name)) {
        return std::nullopt;
    }
    return info_from_entry(name, index.at(name));
}

std::vector<TemplateInfo> TemplateCache::list() const {
    std::vector<TemplateInfo> templates;
    json index = store_.read();
    for (auto it = index.begin(); it != index.end(); ++it) {
        templates.push_back(info_from_entry(it.key(), it.value()));
    }
    return templates;
}

bool TemplateCache::remove(const std::string& name, bool delete_archive) {
    std::string archive;
    bool removed = false;
    store_.update([&](json& index) {
        if (!index.contains(name)) {
            return;
        }
        archive = info_from_entry(name, index.at(name)).archive_path;
        index.erase(name);
        removed = true;
    });
    if (removed && delete_archive) {
        if (archive.empty()) {
            archive = archive_path_for(name);
        }
        std::error_code ec;
        if (!fs::remove(archive, ec) && ec) {
            throw RuntimeError(ErrorCode::OperationFailed, "Failed to remove " + archive + ": " + ec.message());
        }
    }
    return removed;
}

std::vector<std::string> TemplateCache::prune(int max_age_days, int64_t now) {
    if (max_age_days < 0) {
        throw RuntimeError(ErrorCode::InvalidArgument, "Prune age must not be negative");
    }
    const int64_t cutoff = now - static_cast<int64_t>(max_age_days) * kSecondsPerDay;
    std::vector<std::string> pruned;
    store_.update([&](json& index) {
        for (auto it = index.begin(); it != index.end();) {
            if (info_from_entry(it.key(), it.value()).last_accessed < cutoff) {
                pruned.push_back(it.key());
                it = index.erase(it);
            } else {
                ++it;
            }
        }
    });
    for (const auto& name : pruned) {
        log_info("Pruned template '" + name + "'");
    }
    return pruned;
}

std::vector<std::string> TemplateCache::prune(int max_age_days) {
    return prune(max_age_days, unix_now());
}

bool TemplateCache::verify(const std::string& name) const {
    auto info = find(name);
    if (!info) {
        return false;
    }
    std::string path = info->archive_path.empty() ? archive_path_for(name) : info->archive_path;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        log_warning("Template '" + name + "' archive missing: " + path);
        return false;
    }
    auto size = fs::file_size(path, ec);
    if (ec || size == 0) {
        log_warning("Template '" + name + "' archive is empty: " + path);
        return false;
    }
    return true;
}
