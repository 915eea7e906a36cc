/**
 * @file image_manager.hpp
 * @brief Copy-on-write disk image creation and guarded deletion.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace vm_sandbox {

/**
 * @brief Creates qcow2 images through qemu-img and deletes them only inside
 *        an allowed root directory.
 *
 * Images are named `<target_dir>/<name>.qcow2`.
 */
class ImageManager {
public:
    ImageManager(const ImageConfig& config, Logger& logger);

    /// Overlay backed by `base_image`; virtual size follows the base.
    Result<std::filesystem::path> create_overlay(const std::string& name,
                                                 const std::filesystem::path& base_image,
                                                 const std::filesystem::path& target_dir);

    /**
     * @brief Standalone image; exactly one of backing file or size is required.
     * @param size_spec  qemu-img size string such as "10G".
     */
    Result<std::filesystem::path> create_standalone(
        const std::string& name,
        const std::optional<std::string>& size_spec,
        const std::filesystem::path& target_dir,
        const std::optional<std::filesystem::path>& base_image = std::nullopt);

    /**
     * @brief Unlink an image after verifying it resolves under `allowed_root`.
     *
     * Fails with SecurityError for paths outside the root (including `..`
     * escapes and symlinks pointing out). A file that is already gone is
     * success.
     */
    Result<void> delete_image(const std::filesystem::path& disk_path,
                              const std::filesystem::path& allowed_root);

    /// True when `path` resolves strictly inside `root`.
    [[nodiscard]] static bool is_within_root(const std::filesystem::path& path,
                                             const std::filesystem::path& root);

private:
    Result<std::filesystem::path> run_create(const std::string& name,
                                             const std::filesystem::path& target_dir,
                                             const std::optional<std::filesystem::path>& backing,
                                             const std::optional<std::string>& size_spec);

    ImageConfig config_;
    Logger& logger_;
};

}  // namespace vm_sandbox
