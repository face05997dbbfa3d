#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "lxcri/config.h"
#include "lxcri/errors.h"
#include "lxcri/filesystem.h"
#include "lxcri/options.h"
#include "lxcri/process.h"

// entrypoint + cmd when an entrypoint is set, else process.args, else "/bin/sh";
// elements joined with single spaces.
std::string resolve_main_command(const BundleConfig& bundle);

std::string render_init_script(const BundleConfig& bundle);

// "<image>[-<tag>]" sanitized to a template name, or "lxcri-<container_id>"
// when the bundle carries no image metadata.
std::string template_name_for(const BundleConfig& bundle, const std::string& container_id);

class ImageConverter {
public:
    ImageConverter(const EngineConfig& config, CommandRunner& runner);

    // Parses the bundle, fills `output_dir` from its rootfs and makes the tree
    // bootable as an LXC container. Returns the parsed bundle.
    BundleConfig convert_to_rootfs(const std::string& bundle_path, const std::string& output_dir);

    // Copies or extracts `source` into `output_dir` according to `kind`.
    void populate_rootfs(const std::string& source, RootfsSourceKind kind, const std::string& output_dir);

    // Throws RuntimeError(EmptyRootfs) for an empty tree, warns below three files.
    TreeStats validate_rootfs(const std::string& rootfs_dir) const;

    void augment_rootfs(const BundleConfig& bundle, const std::string& rootfs_dir) const;

    // Archives `rootfs_dir` as <name>.tar.zst and stores it in the template
    // directory. Returns the stored archive path.
    std::string package_as_template(const std::string& rootfs_dir, const std::string& name);

private:
    void extract_archive(const std::string& archive, RootfsSourceKind kind, const std::string& output_dir);
    void copy_directory(const std::string& source, const std::string& output_dir, ErrorCode failure);
    void create_mount_points(const BundleConfig& bundle, const std::string& rootfs_dir) const;
    void install_init(const BundleConfig& bundle, const std::string& rootfs_dir) const;

    const EngineConfig& config_;
    CommandRunner& runner_;
};

constexpr uintmax_t kMinTemplateArchiveSize = 500;
