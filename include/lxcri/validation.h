#pragma once

#include <string>
#include <vector>

bool is_valid_container_id(const std::string& id);
bool is_valid_hostname(const std::string& hostname);
bool is_valid_network_spec(const std::string& spec);
bool is_valid_template_name(const std::string& name);

// Throw RuntimeError(InvalidArgument) naming the offending value.
void validate_container_id(const std::string& id);
void validate_hostname(const std::string& hostname);
void validate_network_spec(const std::string& spec);

// Resolves `path` (relative paths against the working directory, `..` and
// symlinks collapsed) and returns it if it equals or lies below one of
// `allowed_prefixes`. Anything else throws RuntimeError(PathTraversalRejected).
std::string canonicalize_within(const std::string& path,
                                const std::vector<std::string>& allowed_prefixes);
