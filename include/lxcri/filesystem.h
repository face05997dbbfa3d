#pragma once

#include <cstddef>
#include <string>
#include <sys/stat.h>
#include <vector>

struct TreeStats {
    std::size_t files = 0;
    std::size_t directories = 0;
    std::size_t symlinks = 0;

    bool empty() const { return files == 0 && directories == 0 && symlinks == 0; }
};

struct CopyReport {
    std::size_t copied = 0;
    std::size_t skipped = 0;
    std::vector<std::string> errors;
};

bool ensure_directory(const std::string& path, mode_t mode = 0755);
bool ensure_parent_directory(const std::string& path);
bool write_text_file(const std::string& path, const std::string& content, mode_t mode = 0644);
bool path_is_directory(const std::string& path);
bool path_is_regular_file(const std::string& path);

// Walks `root` without following symlinks.
TreeStats count_tree(const std::string& root);

// Recursively copies `source` into `destination`, preserving symlinks as links.
// Every entry is attempted; failures are collected in the report and entry
// kinds that cannot be copied (sockets, fifos, device nodes) are skipped with a warning.
CopyReport copy_tree(const std::string& source, const std::string& destination);

std::string join_strings(const std::vector<std::string>& parts, const char* delimiter = ",");
std::string shell_quote(const std::string& value);
