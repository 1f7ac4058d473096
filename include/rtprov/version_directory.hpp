/**
 * @file version_directory.hpp
 * @brief Owns the <root>/<version> layout and the <root>/current pointer
 *
 * Layout managed under the install root:
 *
 *   <root>/17.03.0-ce/...      extracted release, kept for rollback
 *   <root>/17.03.1-ce/...      extracted release
 *   <root>/current -> <root>/17.03.1-ce
 *
 * The current link is the only record of which release is active.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "rtprov/step_result.hpp"
#include "rtprov/utils.hpp"

namespace rtprov {

    /**
     * @brief Manages version directories and the current link
     *
     * Usage:
     *   VersionDirectoryManager vdm("/opt/docker");
     *   vdm.activate(vdm.version_dir("17.03.1-ce"));
     *   auto active = vdm.current_target();  // "/opt/docker/17.03.1-ce"
     */
    class VersionDirectoryManager {
    public:
        /**
         * @brief Constructs the manager for an install root
         *
         * @param install_root Absolute install root (need not exist yet)
         */
        explicit VersionDirectoryManager(std::filesystem::path install_root);

        /**
         * @brief Points the current link at a version directory
         *
         * The new link is created next to the old one and renamed over it,
         * so readers see either the old or the new target, never a missing
         * link. Re-activating the current target is a normal success.
         *
         * @param version_dir Existing version directory
         * @return std::filesystem::path Path of the current link
         *
         * @throws ProvisionError if version_dir is not an existing directory,
         *         if <root>/current exists and is not a symlink, or if the
         *         link cannot be written
         */
        std::filesystem::path activate(const std::filesystem::path& version_dir);

        /**
         * @brief Reads the target of the current link
         *
         * @return std::optional<std::filesystem::path> Target, or nullopt if there is no link
         */
        [[nodiscard]] std::optional<std::filesystem::path> current_target() const;

        /**
         * @brief Lists installed releases
         *
         * @return std::vector<std::string> Directory names under the root,
         *         sorted, excluding the current link and hidden entries
         */
        [[nodiscard]] std::vector<std::string> list_versions() const;

        [[nodiscard]] std::filesystem::path version_dir(const std::string& version) const {
            return install_root_ / version;
        }

        [[nodiscard]] std::filesystem::path current_link() const {
            return install_root_ / CURRENT_LINK_NAME;
        }

        [[nodiscard]] const std::filesystem::path& get_install_root() const { return install_root_; }

        /**
         * @brief Outcome of applying 0555 to the link itself during the last activate()
         *
         * NOTHING_TO_DO when the platform has no per-symlink modes (Linux).
         */
        [[nodiscard]] const StepResult& last_link_mode_result() const { return link_mode_result_; }

    private:
        static constexpr const char* STAGING_LINK_FILENAME = ".current.tmp";

        /**
         * @brief Sets mode 0555 on a symlink without following it
         */
        static StepResult apply_link_mode(const std::filesystem::path& link);

        std::filesystem::path install_root_;
        StepResult link_mode_result_;
    };

} // namespace rtprov
