/**
 * @file binary_exposer.hpp
 * @brief Links every file of the active release into the executable search path
 */

#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace rtprov {

    /**
     * @brief One symlink created in the search path
     */
    struct ExposedBinary {
        std::filesystem::path link;    ///< <search_path_dir>/<basename>
        std::filesystem::path target;  ///< File under the current link
    };

    /**
     * @brief Upserts <search_path_dir>/<name> -> <current>/.../<name> links
     *
     * Links left behind by an older release whose file names no longer
     * exist are not removed.
     */
    class BinaryExposer {
    public:
        explicit BinaryExposer(std::filesystem::path search_path_dir);

        /**
         * @brief Links every regular file under current_link
         *
         * Files are linked in sorted path order. An existing symlink with
         * the same name is replaced; an existing real file or directory
         * stops the run. The first failure aborts the remaining links.
         *
         * @param current_link Root of the tree to expose (normally <root>/current)
         * @return std::vector<ExposedBinary> The links that were written
         * @throws ProvisionError naming the item that failed
         */
        std::vector<ExposedBinary> expose(const std::filesystem::path& current_link);

        /**
         * @brief Lists regular files below root, sorted
         *
         * Symlinks are not followed or reported, except for root itself.
         *
         * @throws ProvisionError if the tree cannot be read
         */
        [[nodiscard]] static std::vector<std::filesystem::path>
        find_regular_files(const std::filesystem::path& root);

        /**
         * @brief Finds search path links that currently resolve into tree_root
         *
         * Used by the status report; does not modify anything.
         */
        [[nodiscard]] std::vector<ExposedBinary>
        list_exposed(const std::filesystem::path& tree_root) const;

        [[nodiscard]] const std::filesystem::path& get_search_path_dir() const { return search_path_dir_; }

    private:
        /**
         * @brief Creates link -> target, replacing an existing symlink atomically
         */
        void upsert_link(const std::filesystem::path& target,
                         const std::filesystem::path& link) const;

        std::filesystem::path search_path_dir_;
    };

} // namespace rtprov
