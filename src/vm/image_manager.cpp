/**
 * @file image_manager.cpp
 * @brief ImageManager implementation.
 * @author Dimitris Kafetzis
 */

#include "vm/image_manager.hpp"
#include "core/process.hpp"

#include <system_error>

namespace vm_sandbox {

namespace fs = std::filesystem;

ImageManager::ImageManager(const ImageConfig& config, Logger& logger)
    : config_(config), logger_(logger) {}

Result<fs::path> ImageManager::create_overlay(const std::string& name,
                                              const fs::path& base_image,
                                              const fs::path& target_dir) {
    std::error_code ec;
    if (!fs::exists(base_image, ec)) {
        return Error{ErrorCode::ImageError, "Base image not found: " + base_image.string()};
    }
    return run_create(name, target_dir, base_image, std::nullopt);
}

Result<fs::path> ImageManager::create_standalone(const std::string& name,
                                                 const std::optional<std::string>& size_spec,
                                                 const fs::path& target_dir,
                                                 const std::optional<fs::path>& base_image) {
    if (base_image && size_spec) {
        return Error{ErrorCode::ImageError,
                     "Specify either a backing image or a size for " + name + ", not both"};
    }
    if (!base_image && (!size_spec || size_spec->empty())) {
        return Error{ErrorCode::ImageError,
                     "Image " + name + " needs a size when no backing image is given"};
    }
    if (base_image) return create_overlay(name, *base_image, target_dir);
    return run_create(name, target_dir, std::nullopt, size_spec);
}

Result<fs::path> ImageManager::run_create(const std::string& name,
                                          const fs::path& target_dir,
                                          const std::optional<fs::path>& backing,
                                          const std::optional<std::string>& size_spec) {
    if (name.empty() || name.find('/') != std::string::npos || name.find("..") != std::string::npos) {
        return Error{ErrorCode::ImageError, "Invalid image name: '" + name + "'"};
    }

    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (ec) {
        return Error{ErrorCode::ImageError,
                     "Cannot create image directory " + target_dir.string() + ": " + ec.message()};
    }

    const fs::path disk = target_dir / (name + ".qcow2");
    if (fs::exists(disk, ec)) {
        return Error{ErrorCode::ImageError, "Image already exists: " + disk.string()};
    }

    ProcessSpec spec;
    spec.program = config_.qemu_img;
    spec.args = {"create", "-f", "qcow2"};
    if (backing) {
        spec.args.push_back("-F");
        spec.args.push_back("qcow2");
        spec.args.push_back("-b");
        spec.args.push_back(fs::absolute(*backing).string());
    }
    spec.args.push_back(disk.string());
    if (size_spec) spec.args.push_back(*size_spec);
    spec.timeout_ms = config_.qemu_img_timeout_s * 1000;

    logger_.debug("Running " + config_.qemu_img + " create for " + disk.string());
    auto run = run_process(spec);
    if (!run) {
        return Error{ErrorCode::ImageError, "Failed to launch qemu-img: " + run.error().message};
    }
    if (run->timed_out || run->exit_code != 0) {
        fs::remove(disk, ec);
        std::string detail = run->stderr_text.empty() ? run->stdout_text : run->stderr_text;
        return Error{ErrorCode::ImageError,
                     "qemu-img create failed for " + disk.string() + " (exit "
                     + std::to_string(run->exit_code) + "): " + detail};
    }
    if (!fs::exists(disk, ec)) {
        return Error{ErrorCode::ImageError, "qemu-img reported success but " + disk.string()
                                            + " does not exist"};
    }

    logger_.info("Created " + std::string{backing ? "overlay" : "standalone"} + " image "
                 + disk.string());
    return disk;
}

bool ImageManager::is_within_root(const fs::path& path, const fs::path& root) {
    std::error_code ec;
    auto resolved = fs::weakly_canonical(fs::absolute(path, ec), ec);
    if (ec) return false;
    auto resolved_root = fs::weakly_canonical(fs::absolute(root, ec), ec);
    if (ec) return false;

    auto rel = resolved.lexically_relative(resolved_root);
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}

Result<void> ImageManager::delete_image(const fs::path& disk_path, const fs::path& allowed_root) {
    if (!is_within_root(disk_path, allowed_root)) {
        logger_.error("Refusing to delete " + disk_path.string() + ": outside "
                      + allowed_root.string());
        return Error{ErrorCode::SecurityError,
                     "Path " + disk_path.string() + " is not within " + allowed_root.string()};
    }

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(disk_path, ec))) {
        logger_.warn("Image already absent: " + disk_path.string());
        return {};
    }

    // Re-validate right before the irreversible step.
    if (!is_within_root(disk_path, allowed_root)) {
        return Error{ErrorCode::SecurityError,
                     "Path " + disk_path.string() + " escaped " + allowed_root.string()};
    }
    if (!fs::remove(disk_path, ec) && ec) {
        return Error{ErrorCode::ImageError,
                     "Failed to delete " + disk_path.string() + ": " + ec.message()};
    }
    logger_.info("Deleted image " + disk_path.string());
    return {};
}

}  // namespace vm_sandbox
