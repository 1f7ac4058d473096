#include "rtprov/binary_exposer.hpp"
#include "rtprov/errors.hpp"
#include <unistd.h>
#include <algorithm>

namespace rtprov {

    namespace fs = std::filesystem;

    namespace {
        constexpr const char* STEP = "expose";

        bool path_starts_with(const fs::path& path, const fs::path& prefix) {
            auto mismatch = std::mismatch(prefix.begin(), prefix.end(),
                                          path.begin(), path.end());
            return mismatch.first == prefix.end();
        }
    }

    BinaryExposer::BinaryExposer(fs::path search_path_dir)
        : search_path_dir_(std::move(search_path_dir)) {}

    std::vector<fs::path> BinaryExposer::find_regular_files(const fs::path& root) {
        std::vector<fs::path> files;
        std::error_code ec;

        // The root itself is usually the current symlink; iterating it follows that one link
        fs::recursive_directory_iterator it(root, ec);
        if (ec) {
            throw ProvisionError(STEP, "Failed to read " + root.string() + ": " + ec.message());
        }

        fs::recursive_directory_iterator end;
        for (; it != end; it.increment(ec)) {
            auto status = it->symlink_status(ec);
            if (ec) {
                throw ProvisionError(STEP, "Failed to stat " + it->path().string() + ": " + ec.message());
            }
            if (fs::is_regular_file(status)) {
                files.push_back(it->path());
            }
        }

        if (ec) {
            throw ProvisionError(STEP, "Failed to walk " + root.string() + ": " + ec.message());
        }

        std::sort(files.begin(), files.end());
        return files;
    }

    std::vector<ExposedBinary> BinaryExposer::expose(const fs::path& current_link) {
        std::error_code ec;
        if (!fs::is_directory(search_path_dir_, ec)) {
            throw ProvisionError(STEP, "Search path directory does not exist: " + search_path_dir_.string());
        }

        std::vector<ExposedBinary> exposed;

        for (const auto& file : find_regular_files(current_link)) {
            fs::path link = search_path_dir_ / file.filename();
            upsert_link(file, link);
            exposed.push_back({link, file});
        }

        return exposed;
    }

    void BinaryExposer::upsert_link(const fs::path& target, const fs::path& link) const {
        std::error_code ec;

        auto status = fs::symlink_status(link, ec);
        if (fs::exists(status) && !fs::is_symlink(status)) {
            throw ProvisionError(STEP, link.string() + " exists and is not a symlink");
        }

        fs::path staging = search_path_dir_ /
            ("." + link.filename().string() + ".rtprov-" + std::to_string(getpid()));

        fs::remove(staging, ec);
        if (ec) {
            throw ProvisionError(STEP, "Failed to clear " + staging.string() + ": " + ec.message());
        }

        fs::create_symlink(target, staging, ec);
        if (ec) {
            throw ProvisionError(STEP, "Failed to link " + link.string() + " -> " +
                                       target.string() + ": " + ec.message());
        }

        fs::rename(staging, link, ec);
        if (ec) {
            std::error_code cleanup_ec;
            fs::remove(staging, cleanup_ec);
            throw ProvisionError(STEP, "Failed to replace " + link.string() + ": " + ec.message());
        }
    }

    std::vector<ExposedBinary> BinaryExposer::list_exposed(const fs::path& tree_root) const {
        std::vector<ExposedBinary> exposed;
        std::error_code ec;

        if (!fs::is_directory(search_path_dir_, ec)) {
            return exposed;
        }

        fs::path prefix = tree_root.lexically_normal();

        for (const auto& entry : fs::directory_iterator(search_path_dir_, ec)) {
            if (!entry.is_symlink(ec)) {
                continue;
            }
            fs::path target = fs::read_symlink(entry.path(), ec);
            if (ec) {
                continue;
            }
            if (path_starts_with(target.lexically_normal(), prefix)) {
                exposed.push_back({entry.path(), target});
            }
        }

        std::sort(exposed.begin(), exposed.end(),
                  [](const ExposedBinary& a, const ExposedBinary& b) { return a.link < b.link; });

        return exposed;
    }

} // namespace rtprov
