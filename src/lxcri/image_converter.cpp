#include "lxcri/image_converter.h"

#include <cctype>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "lxcri/validation.h"

namespace fs = std::filesystem;

namespace {

const char* const kStandardDirectories[] = {
        "dev", "proc", "sys", "tmp", "run",
        "var/tmp", "var/log", "var/cache", "var/lib", "var/run",
        "etc", "etc/init.d", "etc/rc.d", "etc/systemd", "etc/systemd/system", "etc/network",
        "root", "home", "opt", "usr/local", "mnt", "media", "sbin",
};

const char* const kNetworkInterfaces =
        "auto lo\n"
        "iface lo inet loopback\n"
        "\n"
        "auto eth0\n"
        "iface eth0 inet dhcp\n";

constexpr size_t kMaxReportedCopyErrors = 5;

bool is_shell_identifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

std::string sanitize_name(const std::string& value) {
    std::string result;
    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-') {
            result += c;
        } else {
            result += '-';
        }
    }
    while (!result.empty() && (result.front() == '-' || result.front() == '.')) {
        result.erase(result.begin());
    }
    return result;
}

std::string summarize_errors(const std::vector<std::string>& errors) {
    std::ostringstream oss;
    oss << errors.size() << " entries failed";
    for (size_t i = 0; i < errors.size() && i < kMaxReportedCopyErrors; ++i) {
        oss << (i == 0 ? ": " : "; ") << errors[i];
    }
    return oss.str();
}

} // namespace

std::string resolve_main_command(const BundleConfig& bundle) {
    if (bundle.entrypoint && !bundle.entrypoint->empty()) {
        std::vector<std::string> parts = *bundle.entrypoint;
        if (bundle.cmd) {
            parts.insert(parts.end(), bundle.cmd->begin(), bundle.cmd->end());
        }
        return join_strings(parts, " ");
    }
    if (bundle.process_args && !bundle.process_args->empty()) {
        return join_strings(*bundle.process_args, " ");
    }
    return "/bin/sh";
}

std::string render_init_script(const BundleConfig& bundle) {
    std::ostringstream script;
    script << "#!/bin/sh\n"
           << "# Generated by lxcri\n"
           << "export PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin\n"
           << "\n"
           << "grep -qs ' /proc ' /proc/mounts || mount -t proc proc /proc 2>/dev/null\n"
           << "grep -qs ' /sys ' /proc/mounts || mount -t sysfs sysfs /sys 2>/dev/null\n"
           << "grep -qs ' /dev ' /proc/mounts || mount -t devtmpfs devtmpfs /dev 2>/dev/null\n"
           << "\n"
           << "[ -e /dev/console ] || mknod -m 600 /dev/console c 5 1 2>/dev/null\n"
           << "[ -e /dev/null ] || mknod -m 666 /dev/null c 1 3 2>/dev/null\n"
           << "[ -e /dev/zero ] || mknod -m 666 /dev/zero c 1 5 2>/dev/null\n"
           << "\n"
           << "if [ -s /etc/hostname ]; then\n"
           << "    hostname \"$(cat /etc/hostname)\" 2>/dev/null\n"
           << "fi\n"
           << "\n"
           << "if [ -x /etc/init.d/rcS ]; then\n"
           << "    /etc/init.d/rcS\n"
           << "fi\n";

    if (bundle.environment && !bundle.environment->empty()) {
        script << "\n";
        for (const auto& entry : *bundle.environment) {
            auto eq = entry.find('=');
            std::string key = entry.substr(0, eq);
            if (eq == std::string::npos || !is_shell_identifier(key)) {
                log_warning("Skipping environment entry '" + entry + "'");
                continue;
            }
            script << "export " << key << "=" << shell_quote(entry.substr(eq + 1)) << "\n";
        }
    }

    std::string workdir = bundle.working_directory ? *bundle.working_directory
                                                   : bundle.process_cwd.value_or("");
    if (!workdir.empty() && workdir != "/") {
        script << "\ncd " << shell_quote(workdir) << " || exit 1\n";
    }
    script << "\nexec " << resolve_main_command(bundle) << "\n";
    return script.str();
}

std::string template_name_for(const BundleConfig& bundle, const std::string& container_id) {
    if (bundle.image_name && !bundle.image_name->empty()) {
        std::string name = *bundle.image_name;
        if (bundle.image_tag && !bundle.image_tag->empty()) {
            name += "-" + *bundle.image_tag;
        }
        name = sanitize_name(name + "-" + container_id);
        if (is_valid_template_name(name)) {
            return name;
        }
    }
    return "lxcri-" + container_id;
}

ImageConverter::ImageConverter(const EngineConfig& config, CommandRunner& runner)
    : config_(config), runner_(runner) {}

BundleConfig ImageConverter::convert_to_rootfs(const std::string& bundle_path, const std::string& output_dir) {
    BundleConfig bundle = load_bundle(bundle_path);
    if (!ensure_directory(output_dir)) {
        throw RuntimeError(ErrorCode::CopyFailed, "Failed to create output directory " + output_dir);
    }

    RootfsSourceKind kind = classify_rootfs_source(bundle.rootfs_path);
    log_info("Populating " + output_dir + " from " + bundle.rootfs_path + " (" +
             rootfs_source_kind_name(kind) + ")");
    populate_rootfs(bundle.rootfs_path, kind, output_dir);
    validate_rootfs(output_dir);

    augment_rootfs(bundle, output_dir);
    if (count_tree(output_dir).empty()) {
        throw RuntimeError(ErrorCode::EmptyRootfs, "Rootfs is empty after augmentation: " + output_dir);
    }
    return bundle;
}

void ImageConverter::populate_rootfs(const std::string& source, RootfsSourceKind kind,
                                     const std::string& output_dir) {
    switch (kind) {
        case RootfsSourceKind::Directory:
            copy_directory(source, output_dir, ErrorCode::CopyFailed);
            return;
        case RootfsSourceKind::TarZstd:
        case RootfsSourceKind::TarGzip:
        case RootfsSourceKind::Tar:
            extract_archive(source, kind, output_dir);
            return;
        case RootfsSourceKind::Unknown:
            log_warning("Unrecognized rootfs source " + source + ", attempting a directory copy");
            copy_directory(source, output_dir, ErrorCode::UnsupportedSource);
            return;
    }
}

void ImageConverter::copy_directory(const std::string& source, const std::string& output_dir,
                                    ErrorCode failure) {
    CopyReport report = copy_tree(source, output_dir);
    if (!report.errors.empty()) {
        throw RuntimeError(failure, "Copying " + source + " failed, " + summarize_errors(report.errors));
    }
    log_debug("Copied " + std::to_string(report.copied) + " entries from " + source +
              (report.skipped > 0 ? ", skipped " + std::to_string(report.skipped) : std::string()));
}

void ImageConverter::extract_archive(const std::string& archive, RootfsSourceKind kind,
                                     const std::string& output_dir) {
    std::vector<std::string> argv = {config_.tools.tar};
    switch (kind) {
        case RootfsSourceKind::TarZstd:
            argv.insert(argv.end(), {"--zstd", "-xf"});
            break;
        case RootfsSourceKind::TarGzip:
            argv.push_back("-zxf");
            break;
        default:
            argv.push_back("-xf");
            break;
    }
    argv.insert(argv.end(), {archive, "-C", output_dir});

    CommandOutput output = runner_.execute(argv, config_.command_timeout_sec);
    if (!output.succeeded()) {
        throw RuntimeError(ErrorCode::ExtractionFailed,
                           "Extracting " + archive + " failed: " + command_diagnostic(output));
    }
}

TreeStats ImageConverter::validate_rootfs(const std::string& rootfs_dir) const {
    TreeStats stats = count_tree(rootfs_dir);
    if (stats.empty()) {
        throw RuntimeError(ErrorCode::EmptyRootfs, "Rootfs contains no files or directories: " + rootfs_dir);
    }
    if (stats.files < 3) {
        log_warning("Rootfs " + rootfs_dir + " contains only " + std::to_string(stats.files) +
                    " file(s); this looks like minimal or test content");
    }
    return stats;
}

void ImageConverter::augment_rootfs(const BundleConfig& bundle, const std::string& rootfs_dir) const {
    for (const char* dir : kStandardDirectories) {
        std::string path = rootfs_dir + "/" + dir;
        if (!ensure_directory(path)) {
            // an existing symlink (var/run -> ../run) is fine
            std::error_code ec;
            if (!fs::exists(path, ec)) {
                throw RuntimeError(ErrorCode::CopyFailed, "Failed to create " + path);
            }
        }
    }
    if (chmod((rootfs_dir + "/tmp").c_str(), 01777) != 0) {
        log_warning("Failed to set permissions on " + rootfs_dir + "/tmp");
    }

    if (bundle.hostname && !bundle.hostname->empty()) {
        if (!write_text_file(rootfs_dir + "/etc/hostname", *bundle.hostname + "\n")) {
            throw RuntimeError(ErrorCode::CopyFailed, "Failed to write etc/hostname in " + rootfs_dir);
        }
    }

    std::string interfaces = rootfs_dir + "/etc/network/interfaces";
    if (path_is_regular_file(interfaces)) {
        log_debug("Keeping existing " + interfaces);
    } else if (!write_text_file(interfaces, kNetworkInterfaces)) {
        throw RuntimeError(ErrorCode::CopyFailed, "Failed to write " + interfaces);
    }

    create_mount_points(bundle, rootfs_dir);
    install_init(bundle, rootfs_dir);
}

void ImageConverter::create_mount_points(const BundleConfig& bundle, const std::string& rootfs_dir) const {
    if (!bundle.mounts) {
        return;
    }
    for (const auto& mount : *bundle.mounts) {
        if (!mount.destination || mount.destination->empty()) {
            log_warning("Skipping mount without destination" +
                        (mount.source ? " (source " + *mount.source + ")" : std::string()));
            continue;
        }
        fs::path destination = fs::path(*mount.destination).lexically_normal().relative_path();
        if (destination.empty() || *destination.begin() == "..") {
            log_warning("Skipping mount point outside the rootfs: " + *mount.destination);
            continue;
        }
        std::string path = rootfs_dir + "/" + destination.string();
        if (!ensure_directory(path)) {
            log_warning("Could not create mount point " + path);
        }
    }
}

void ImageConverter::install_init(const BundleConfig& bundle, const std::string& rootfs_dir) const {
    std::string init_path = rootfs_dir + "/sbin/init";
    std::error_code ec;
    if (fs::symlink_status(init_path, ec).type() != fs::file_type::not_found) {
        std::string backup = init_path + ".lxcri-orig";
        if (fs::symlink_status(backup, ec).type() == fs::file_type::not_found) {
            fs::rename(init_path, backup, ec);
            if (ec) {
                throw RuntimeError(ErrorCode::CopyFailed,
                                   "Failed to preserve existing " + init_path + ": " + ec.message());
            }
            log_info("Preserved existing init as " + backup);
        } else {
            fs::remove(init_path, ec);
        }
    }
    if (!write_text_file(init_path, render_init_script(bundle), 0755)) {
        throw RuntimeError(ErrorCode::CopyFailed, "Failed to write " + init_path);
    }
    log_debug("Init will exec: " + resolve_main_command(bundle));
}

std::string ImageConverter::package_as_template(const std::string& rootfs_dir, const std::string& name) {
    if (!is_valid_template_name(name)) {
        throw RuntimeError(ErrorCode::InvalidArgument, "Invalid template name '" + name + "'");
    }
    validate_rootfs(rootfs_dir);
    if (!ensure_directory(config_.work_dir)) {
        throw RuntimeError(ErrorCode::ArchiveCreationFailed, "Failed to create work directory " + config_.work_dir);
    }

    std::string archive_name = name + ".tar.zst";
    std::string staging = config_.work_dir + "/" + archive_name;
    std::error_code ec;
    fs::remove(staging, ec);

    CommandOutput output = runner_.execute(
            {config_.tools.tar, "--zstd", "-cf", staging, "-C", rootfs_dir, "."},
            config_.command_timeout_sec);
    if (!output.succeeded()) {
        fs::remove(staging, ec);
        throw RuntimeError(ErrorCode::ArchiveCreationFailed,
                           "Archiving " + rootfs_dir + " failed: " + command_diagnostic(output));
    }
    if (!path_is_regular_file(staging)) {
        throw RuntimeError(ErrorCode::ArchiveCreationFailed, "Archiver produced no file at " + staging);
    }
    auto size = fs::file_size(staging, ec);
    if (!ec && size < kMinTemplateArchiveSize) {
        log_warning("Template archive " + staging + " is only " + std::to_string(size) +
                    " bytes; it probably holds no real content");
    }

    if (!ensure_directory(config_.template_dir)) {
        fs::remove(staging, ec);
        throw RuntimeError(ErrorCode::UploadFailed, "Failed to create template directory " + config_.template_dir);
    }
    std::string destination = config_.template_dir + "/" + archive_name;
    fs::copy_file(staging, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(staging, ec);
        throw RuntimeError(ErrorCode::UploadFailed, "Copying template to " + destination + " failed: " + reason);
    }
    if (chmod(destination.c_str(), 0644) != 0) {
        fs::remove(staging, ec);
        throw RuntimeError(ErrorCode::UploadFailed, "Failed to set permissions on " + destination);
    }
    fs::remove(staging, ec);
    log_info("Stored template " + destination);
    return destination;
}
