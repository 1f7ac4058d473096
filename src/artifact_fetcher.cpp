#include "rtprov/artifact_fetcher.hpp"
#include "rtprov/command_runner.hpp"
#include "rtprov/errors.hpp"
#include "rtprov/utils.hpp"
#include <cpr/cpr.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>

namespace rtprov {

    namespace fs = std::filesystem;

    namespace {
        constexpr const char* STEP = "fetch";

        constexpr fs::perms FILE_MODE =
            fs::perms::owner_read | fs::perms::owner_exec |
            fs::perms::group_read | fs::perms::group_exec |
            fs::perms::others_read | fs::perms::others_exec;          // 0555

        constexpr fs::perms DIR_MODE = FILE_MODE | fs::perms::owner_write;  // 0755

        // Hidden, uniquely named, created 0600 beside the version directory
        fs::path create_download_file(const fs::path& dest_root, const std::string& version) {
            std::string pattern = (dest_root / ("." + version + ".download-XXXXXX")).string();
            int fd = mkstemp(pattern.data());
            if (fd < 0) {
                throw ProvisionError(STEP, "Failed to create download file in " + dest_root.string() +
                                           ": " + strerror(errno));
            }
            close(fd);
            return pattern;
        }

        void remove_temp_archive(const fs::path& path) {
            std::error_code ec;
            fs::remove(path, ec);
            if (ec) {
                std::cerr << "Warning: failed to remove " << path << ": " << ec.message() << std::endl;
            }
        }
    }

    bool is_already_fetched(const fs::path& root,
                            const std::string& version,
                            const std::string& entry_point) {
        if (!is_valid_version(version) || entry_point.empty()) {
            return false;
        }
        std::error_code ec;
        return fs::exists(root / version / entry_point, ec);
    }

    bool HttpDownloader::download(const std::string& url,
                                  const fs::path& destination) {
        cpr::Response response = cpr::Get(cpr::Url{url},
                                          cpr::Redirect(true));

        if (response.error) {
            std::cerr << "Download failed: " << response.error.message << std::endl;
            return false;
        }

        if (response.status_code != 200) {
            std::cerr << "Download failed with status: " << response.status_code << std::endl;
            return false;
        }

        std::ofstream file(destination, std::ios::binary | std::ios::trunc);
        if (!file) {
            std::cerr << "Failed to open destination file: " << destination << std::endl;
            return false;
        }

        file.write(response.text.data(), static_cast<std::streamsize>(response.text.size()));
        file.close();

        return !file.fail();
    }

    ArtifactFetcher::ArtifactFetcher(IDownloader& downloader,
                                     ICommandRunner& runner,
                                     std::string entry_point)
        : downloader_(downloader)
        , runner_(runner)
        , entry_point_(std::move(entry_point)) {}

    std::string ArtifactFetcher::build_url(const std::string& url_template,
                                           const std::string& version) {
        if (url_template.find(VERSION_PLACEHOLDER) == std::string::npos) {
            throw ProvisionError(STEP, "URL template has no " + std::string(VERSION_PLACEHOLDER) +
                                       " placeholder: " + url_template);
        }
        return substitute(url_template, VERSION_PLACEHOLDER, version);
    }

    fs::path ArtifactFetcher::fetch(const std::string& version,
                                    const std::string& url_template,
                                    const fs::path& dest_root) {
        last_fetch_skipped_ = false;

        if (!is_valid_version(version)) {
            throw ProvisionError(STEP, "Invalid release identifier: '" + version + "'");
        }
        if (entry_point_.empty()) {
            throw ProvisionError(STEP, "No entry point configured");
        }

        fs::path version_dir = dest_root / version;

        // Already installed: no directory creation, no download, no extraction
        if (is_already_fetched(dest_root, version, entry_point_)) {
            last_fetch_skipped_ = true;
            return version_dir;
        }

        std::string url = build_url(url_template, version);

        // Create the version directory (0755)
        std::error_code ec;
        fs::create_directories(version_dir, ec);
        if (ec) {
            throw ProvisionError(STEP, "Failed to create " + version_dir.string() + ": " + ec.message());
        }
        fs::permissions(version_dir, DIR_MODE, fs::perm_options::replace, ec);
        if (ec) {
            throw ProvisionError(STEP, "Failed to set mode on " + version_dir.string() + ": " + ec.message());
        }

        std::cout << "Downloading " << url << std::endl;

        fs::path download_path = create_download_file(dest_root, version);

        if (!downloader_.download(url, download_path)) {
            remove_temp_archive(download_path);
            throw ProvisionError(STEP, "Failed to download " + url);
        }

        std::cout << "Extracting into " << version_dir << std::endl;
        bool extracted = extract_archive(download_path, version_dir);

        // Cleanup temp archive
        remove_temp_archive(download_path);

        if (!extracted) {
            throw ProvisionError(STEP, "Failed to extract archive from " + url);
        }

        seal_tree(version_dir);

        if (!fs::exists(version_dir / entry_point_)) {
            throw ProvisionError(STEP, "Archive from " + url + " does not contain " + entry_point_);
        }

        return version_dir;
    }

    bool ArtifactFetcher::extract_archive(const fs::path& archive_path,
                                          const fs::path& extract_dir) const {
        int status = runner_.run({
            "tar", "-xzf", archive_path.string(),
            "-C", extract_dir.string(),
            "--strip-components=1"
        });
        return status == 0;
    }

    void ArtifactFetcher::seal_tree(const fs::path& dir) {
        std::error_code ec;
        fs::recursive_directory_iterator it(dir, ec);
        if (ec) {
            throw ProvisionError(STEP, "Failed to read " + dir.string() + ": " + ec.message());
        }

        fs::recursive_directory_iterator end;
        for (; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }

            // Symlinks inside the release keep their own mode
            auto type = it->symlink_status(ec).type();
            if (ec) {
                break;
            }

            if (type == fs::file_type::regular) {
                fs::permissions(it->path(), FILE_MODE, fs::perm_options::replace, ec);
            } else if (type == fs::file_type::directory) {
                fs::permissions(it->path(), DIR_MODE, fs::perm_options::replace, ec);
            }
            if (ec) {
                throw ProvisionError(STEP, "Failed to set mode on " + it->path().string() +
                                           ": " + ec.message());
            }
        }

        if (ec) {
            throw ProvisionError(STEP, "Failed to walk " + dir.string() + ": " + ec.message());
        }
    }

} // namespace rtprov
