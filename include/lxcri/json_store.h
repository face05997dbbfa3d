#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// A JSON object persisted in a single file. Every access holds FileLock on the
// file; writes go through "<path>.tmp" and rename(2).
class JsonFileStore {
public:
    explicit JsonFileStore(std::string path);

    const std::string& path() const { return path_; }
    bool exists() const;

    // Missing file reads as an empty object. Unparsable content or a
    // non-object document throws RuntimeError(InvalidStateFormat).
    json read() const;
    void write(const json& document) const;
    json update(const std::function<void(json&)>& mutate) const;

private:
    json read_unlocked() const;
    void write_unlocked(const json& document) const;

    std::string path_;
};
