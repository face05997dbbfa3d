#include "lxcri/filesystem.h"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sys/types.h>
#include <system_error>

#include "lxcri/options.h"

namespace fs = std::filesystem;

bool ensure_directory(const std::string& path, mode_t mode) {
    if (path.empty()) {
        return false;
    }
    struct stat st {};
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    std::string parent;
    auto pos = path.find_last_of('/');
    if (pos != std::string::npos && pos != 0) {
        parent = path.substr(0, pos);
    } else if (pos == 0) {
        parent = "/";
    }
    if (!parent.empty() && parent != path) {
        if (!ensure_directory(parent, mode)) {
            return false;
        }
    }
    if (mkdir(path.c_str(), mode) == 0 || errno == EEXIST) {
        return true;
    }
    return false;
}

bool ensure_parent_directory(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return true;
    }
    return ensure_directory(path.substr(0, pos));
}

bool write_text_file(const std::string& path, const std::string& content, mode_t mode) {
    if (!ensure_parent_directory(path)) {
        return false;
    }
    {
        std::ofstream ofs(path, std::ios::trunc);
        if (!ofs) {
            return false;
        }
        ofs << content;
        if (!ofs) {
            return false;
        }
    }
    return chmod(path.c_str(), mode) == 0;
}

bool path_is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool path_is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

TreeStats count_tree(const std::string& root) {
    TreeStats stats;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return stats;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        auto status = it->symlink_status(ec);
        if (ec) {
            continue;
        }
        if (fs::is_symlink(status)) {
            ++stats.symlinks;
        } else if (fs::is_directory(status)) {
            ++stats.directories;
        } else {
            ++stats.files;
        }
    }
    return stats;
}

namespace {

struct PendingMode {
    fs::path directory;
    fs::perms mode;
};

// Directory modes are collected and applied after the walk, so read-only
// source directories still receive their children.
void copy_entry(const fs::directory_entry& entry, const fs::path& target, CopyReport& report,
                std::vector<PendingMode>& modes) {
    std::error_code ec;
    auto status = entry.symlink_status(ec);
    if (ec) {
        report.errors.push_back(entry.path().string() + ": " + ec.message());
        return;
    }

    if (fs::is_symlink(status)) {
        auto link_target = fs::read_symlink(entry.path(), ec);
        if (!ec) {
            auto existing = fs::symlink_status(target, ec);
            if (!ec && existing.type() != fs::file_type::not_found) {
                fs::remove(target, ec);
            }
            ec.clear();
            fs::create_symlink(link_target, target, ec);
        }
    } else if (fs::is_directory(status)) {
        fs::create_directories(target, ec);
        if (!ec) {
            modes.push_back({target, status.permissions()});
        }
    } else if (fs::is_regular_file(status)) {
        fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing, ec);
    } else {
        log_warning("Skipping unsupported entry '" + entry.path().string() + "'");
        ++report.skipped;
        return;
    }

    if (ec) {
        report.errors.push_back(entry.path().string() + ": " + ec.message());
        return;
    }
    ++report.copied;
}

} // namespace

CopyReport copy_tree(const std::string& source, const std::string& destination) {
    CopyReport report;
    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        report.errors.push_back(destination + ": " + ec.message());
        return report;
    }

    fs::recursive_directory_iterator it(source, ec);
    if (ec) {
        report.errors.push_back(source + ": " + ec.message());
        return report;
    }
    const fs::path source_root(source);
    const fs::path destination_root(destination);
    std::vector<PendingMode> modes;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            report.errors.push_back(source + ": " + ec.message());
            break;
        }
        fs::path relative = it->path().lexically_relative(source_root);
        copy_entry(*it, destination_root / relative, report, modes);
    }
    for (auto mode = modes.rbegin(); mode != modes.rend(); ++mode) {
        fs::permissions(mode->directory, mode->mode, ec);
        if (ec) {
            report.errors.push_back(mode->directory.string() + ": " + ec.message());
        }
    }
    return report;
}

std::string join_strings(const std::vector<std::string>& parts, const char* delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += parts[i];
    }
    return result;
}

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}
