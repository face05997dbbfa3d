#include "lxcri/json_store.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

#include "lxcri/errors.h"
#include "lxcri/filelock.h"
#include "lxcri/filesystem.h"

JsonFileStore::JsonFileStore(std::string path) : path_(std::move(path)) {}

bool JsonFileStore::exists() const {
    return path_is_regular_file(path_);
}

json JsonFileStore::read() const {
    FileLock lock(path_, LockType::Read);
    return read_unlocked();
}

void JsonFileStore::write(const json& document) const {
    FileLock lock(path_, LockType::Write);
    write_unlocked(document);
}

json JsonFileStore::update(const std::function<void(json&)>& mutate) const {
    FileLock lock(path_, LockType::Write);
    json document = read_unlocked();
    mutate(document);
    write_unlocked(document);
    return document;
}

json JsonFileStore::read_unlocked() const {
    std::ifstream ifs(path_);
    if (!ifs) {
        return json::object();
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (buffer.str().empty()) {
        return json::object();
    }
    json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw RuntimeError(ErrorCode::InvalidStateFormat, "Corrupt JSON store: " + path_);
    }
    return document;
}

void JsonFileStore::write_unlocked(const json& document) const {
    if (!ensure_parent_directory(path_)) {
        throw RuntimeError(ErrorCode::OperationFailed, "Failed to create directory for " + path_);
    }
    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream ofs(tmp_path, std::ios::trunc);
        if (!ofs) {
            throw RuntimeError(ErrorCode::OperationFailed, "Failed to open " + tmp_path);
        }
        ofs << document.dump(4) << std::endl;
        if (!ofs) {
            throw RuntimeError(ErrorCode::OperationFailed, "Failed to write " + tmp_path);
        }
    }
    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        int saved = errno;
        std::remove(tmp_path.c_str());
        throw RuntimeError(ErrorCode::OperationFailed,
                           "Failed to replace " + path_ + ": " + std::strerror(saved));
    }
}
