#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "lxcri/config.h"
#include "lxcri/json_store.h"

enum class TemplateSource {
    OciBundle,
    Downloaded,
    Available,
    Custom,
};

const char* template_source_name(TemplateSource source);
std::optional<TemplateSource> parse_template_source(const std::string& name);

struct TemplateMetadata {
    std::optional<std::string> image_name;
    std::optional<std::string> image_tag;
    std::optional<std::vector<std::string>> entrypoint;
    std::optional<std::vector<std::string>> cmd;
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> labels;
};

struct TemplateInfo {
    std::string name;
    std::string archive_path;
    uint64_t size = 0;
    int64_t created_at = 0;
    int64_t last_accessed = 0;
    TemplateSource source_type = TemplateSource::Custom;
    std::optional<TemplateMetadata> metadata;
};

void to_json(json& j, const TemplateMetadata& metadata);
void from_json(const json& j, TemplateMetadata& metadata);
void to_json(json& j, const TemplateInfo& info);
void from_json(const json& j, TemplateInfo& info);

TemplateMetadata template_metadata_from_bundle(const BundleConfig& bundle);

// Bookkeeping for packaged templates, persisted in templates.json.
class TemplateCache {
public:
    TemplateCache(std::string index_path, std::string template_dir);

    std::string archive_path_for(const std::string& name) const;

    void add(const TemplateInfo& info);
    // Updates last_accessed.
    std::optional<TemplateInfo> get(const std::string& name);
    std::optional<TemplateInfo> find(const std::string& name) const;
    std::vector<TemplateInfo> list() const;
    // With `delete_archive` the packaged file is removed as well.
    bool remove(const std::string& name, bool delete_archive = false);

    // Drops entries not accessed for `max_age_days`; archives are left in place.
    std::vector<std::string> prune(int max_age_days, int64_t now);
    std::vector<std::string> prune(int max_age_days);

    // True when the entry exists and its archive is a non-empty file.
    bool verify(const std::string& name) const;

private:
    JsonFileStore store_;
    std::string template_dir_;
};
