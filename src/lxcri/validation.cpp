#include "lxcri/validation.h"

#include <cctype>
#include <filesystem>
#include <system_error>

#include "lxcri/errors.h"

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxContainerIdLength = 64;
constexpr size_t kMaxHostnameLength = 253;
constexpr size_t kMaxHostnameLabelLength = 63;
constexpr size_t kMaxNetworkSpecLength = 512;
constexpr size_t kMaxTemplateNameLength = 128;

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

bool is_network_spec_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
        case ',':
        case '=':
        case ':':
        case '.':
        case '_':
        case '/':
        case '%':
        case '-':
            return true;
        default:
            return false;
    }
}

fs::path resolve(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        throw RuntimeError(ErrorCode::PathTraversalRejected,
                           "Cannot resolve path '" + path + "': " + ec.message());
    }
    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal();
    }
    return canonical;
}

bool is_within(const std::string& candidate, const std::string& prefix) {
    if (prefix.empty()) {
        return false;
    }
    if (candidate == prefix) {
        return true;
    }
    std::string base = prefix.back() == '/' ? prefix : prefix + "/";
    return candidate.compare(0, base.size(), base) == 0;
}

} // namespace

bool is_valid_container_id(const std::string& id) {
    if (id.empty() || id.size() > kMaxContainerIdLength) {
        return false;
    }
    if (id.front() == '.' || id.front() == '-') {
        return false;
    }
    for (char c : id) {
        if (!is_name_char(c)) {
            return false;
        }
    }
    return true;
}

bool is_valid_hostname(const std::string& hostname) {
    if (hostname.empty() || hostname.size() > kMaxHostnameLength) {
        return false;
    }
    size_t label_start = 0;
    while (label_start <= hostname.size()) {
        size_t dot = hostname.find('.', label_start);
        size_t label_end = dot == std::string::npos ? hostname.size() : dot;
        size_t length = label_end - label_start;
        if (length == 0 || length > kMaxHostnameLabelLength) {
            return false;
        }
        if (hostname[label_start] == '-' || hostname[label_end - 1] == '-') {
            return false;
        }
        for (size_t i = label_start; i < label_end; ++i) {
            char c = hostname[i];
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
                return false;
            }
        }
        if (dot == std::string::npos) {
            break;
        }
        label_start = dot + 1;
    }
    return true;
}

bool is_valid_network_spec(const std::string& spec) {
    if (spec.empty() || spec.size() > kMaxNetworkSpecLength) {
        return false;
    }
    for (char c : spec) {
        if (!is_network_spec_char(c)) {
            return false;
        }
    }
    return true;
}

bool is_valid_template_name(const std::string& name) {
    if (name.empty() || name.size() > kMaxTemplateNameLength) {
        return false;
    }
    if (name == "." || name == "..") {
        return false;
    }
    for (char c : name) {
        if (!is_name_char(c)) {
            return false;
        }
    }
    return true;
}

void validate_container_id(const std::string& id) {
    if (!is_valid_container_id(id)) {
        throw RuntimeError(ErrorCode::InvalidArgument, "Invalid container id '" + id + "'");
    }
}

void validate_hostname(const std::string& hostname) {
    if (!is_valid_hostname(hostname)) {
        throw RuntimeError(ErrorCode::InvalidArgument, "Invalid hostname '" + hostname + "'");
    }
}

void validate_network_spec(const std::string& spec) {
    if (!is_valid_network_spec(spec)) {
        throw RuntimeError(ErrorCode::InvalidArgument, "Invalid network specification '" + spec + "'");
    }
}

std::string canonicalize_within(const std::string& path,
                                const std::vector<std::string>& allowed_prefixes) {
    if (path.empty()) {
        throw RuntimeError(ErrorCode::PathTraversalRejected, "Empty bundle path");
    }
    std::string candidate = resolve(path).string();
    for (const auto& prefix : allowed_prefixes) {
        if (prefix.empty()) {
            continue;
        }
        if (is_within(candidate, resolve(prefix).string())) {
            return candidate;
        }
    }
    throw RuntimeError(ErrorCode::PathTraversalRejected,
                       "Path '" + path + "' resolves to '" + candidate +
                       "' outside the allowed bundle locations");
}
