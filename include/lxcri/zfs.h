#pragma once

#include <optional>
#include <string>
#include <vector>

#include "lxcri/options.h"
#include "lxcri/process.h"

class ZfsClient {
public:
    ZfsClient(const EngineConfig& config, CommandRunner& runner);

    std::vector<std::string> list_pools();
    bool pool_exists(const std::string& pool);
    bool dataset_exists(const std::string& dataset);
    void create_dataset(const std::string& dataset, bool recursive);

    // Creates `dataset` (and its parent when missing) inside `pool`. An
    // existing dataset is reused. Returns nullopt, after a warning, when the
    // pool does not exist; every later failure throws.
    std::optional<std::string> provision(const std::string& pool, const std::string& dataset);

private:
    const EngineConfig& config_;
    CommandRunner& runner_;
};

std::string container_dataset_name(const ZfsSettings& settings, const std::string& container_id);
