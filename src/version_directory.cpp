#include "rtprov/version_directory.hpp"
#include "rtprov/errors.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace rtprov {

    namespace fs = std::filesystem;

    namespace {
        constexpr const char* STEP = "activate";
    }

    VersionDirectoryManager::VersionDirectoryManager(fs::path install_root)
        : install_root_(std::move(install_root)) {}

    fs::path VersionDirectoryManager::activate(const fs::path& version_dir) {
        std::error_code ec;

        // Never create a dangling link
        if (!fs::is_directory(version_dir, ec)) {
            throw ProvisionError(STEP, "Version directory does not exist: " + version_dir.string());
        }

        fs::path target = fs::absolute(version_dir, ec).lexically_normal();
        if (ec) {
            throw ProvisionError(STEP, "Failed to resolve " + version_dir.string() + ": " + ec.message());
        }

        fs::path link = current_link();
        auto link_status = fs::symlink_status(link, ec);
        if (fs::exists(link_status) && !fs::is_symlink(link_status)) {
            throw ProvisionError(STEP, link.string() + " exists and is not a symlink");
        }

        // Stage the new link, then rename it over the old one
        fs::path staging = install_root_ / STAGING_LINK_FILENAME;
        fs::remove(staging, ec);
        if (ec) {
            throw ProvisionError(STEP, "Failed to clear " + staging.string() + ": " + ec.message());
        }

        fs::create_directory_symlink(target, staging, ec);
        if (ec) {
            throw ProvisionError(STEP, "Failed to create link " + staging.string() + ": " + ec.message());
        }

        fs::rename(staging, link, ec);
        if (ec) {
            std::error_code cleanup_ec;
            fs::remove(staging, cleanup_ec);
            throw ProvisionError(STEP, "Failed to replace " + link.string() + ": " + ec.message());
        }

        link_mode_result_ = apply_link_mode(link);
        if (link_mode_result_.is_fatal()) {
            throw ProvisionError(STEP, link_mode_result_.message);
        }

        return link;
    }

    StepResult VersionDirectoryManager::apply_link_mode(const fs::path& link) {
        if (fchmodat(AT_FDCWD, link.c_str(), 0555, AT_SYMLINK_NOFOLLOW) == 0) {
            return StepResult::success("Link mode set to 0555");
        }

        int err = errno;
        if (err == ENOTSUP || err == EOPNOTSUPP || err == ENOSYS) {
            return StepResult::nothing_to_do("Symlink modes are not supported on this platform");
        }
        return StepResult::fatal("Failed to set mode on " + link.string() + ": " + strerror(err));
    }

    std::optional<fs::path> VersionDirectoryManager::current_target() const {
        std::error_code ec;
        fs::path link = current_link();

        if (!fs::is_symlink(fs::symlink_status(link, ec))) {
            return std::nullopt;
        }

        fs::path target = fs::read_symlink(link, ec);
        if (ec) {
            return std::nullopt;
        }
        return target;
    }

    std::vector<std::string> VersionDirectoryManager::list_versions() const {
        std::vector<std::string> versions;
        std::error_code ec;

        if (!fs::is_directory(install_root_, ec)) {
            return versions;
        }

        for (const auto& entry : fs::directory_iterator(install_root_, ec)) {
            std::string name = entry.path().filename().string();
            if (name == CURRENT_LINK_NAME || name.empty() || name[0] == '.') {
                continue;
            }
            if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
                versions.push_back(name);
            }
        }

        // Sort alphabetically for consistent ordering
        std::sort(versions.begin(), versions.end());

        return versions;
    }

} // namespace rtprov
