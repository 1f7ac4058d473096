/**
 * @file artifact_fetcher.hpp
 * @brief Downloads and unpacks a release archive into its version directory
 *
 * This header provides functionality to:
 * - Decide whether a release is already installed (entry point probe)
 * - Build the download URL from a template and a release identifier
 * - Download the tar.gz archive over HTTP
 * - Extract it into <install_root>/<version>, dropping the wrapper directory
 * - Make the installed files read-only (0555)
 *
 * The fetcher never touches a version directory that already holds the
 * entry point file, so re-running a provision is cheap and offline.
 */

#pragma once

#include <string>
#include <filesystem>

namespace rtprov {

    class ICommandRunner;

    /**
     * @brief Checks whether a release has already been fetched
     *
     * Pure filesystem probe, no side effects.
     *
     * @param root Install root
     * @param version Release identifier
     * @param entry_point File expected at the top of the release tree (e.g. "docker")
     * @return true if <root>/<version>/<entry_point> exists
     */
    [[nodiscard]] bool is_already_fetched(const std::filesystem::path& root,
                                          const std::string& version,
                                          const std::string& entry_point);

    /**
     * @brief Interface for fetching a URL into a local file
     *
     * Network access is isolated behind this interface so that the
     * fetch guard can be verified without a network.
     */
    class IDownloader {
    public:
        virtual ~IDownloader() = default;

        /**
         * @brief Downloads a URL to a destination file
         *
         * @param url The URL to download from
         * @param destination Path where to save the file
         * @return true if the download succeeded
         * @return false if the download failed
         */
        virtual bool download(const std::string& url,
                              const std::filesystem::path& destination) = 0;
    };

    /**
     * @brief IDownloader backed by libcpr (libcurl wrapper)
     *
     * Follows redirects and requires HTTP 200.
     */
    class HttpDownloader : public IDownloader {
    public:
        bool download(const std::string& url,
                      const std::filesystem::path& destination) override;
    };

    /**
     * @brief Materializes release archives under the install root
     *
     * Usage:
     *   HttpDownloader http;
     *   SystemCommandRunner runner;
     *   ArtifactFetcher fetcher(http, runner, "docker");
     *   auto dir = fetcher.fetch("17.03.1-ce", url_template, "/opt/docker");
     */
    class ArtifactFetcher {
    public:
        /**
         * @brief Constructs the fetcher
         *
         * @param downloader Used for the archive download
         * @param runner Used to run tar
         * @param entry_point File whose presence marks a release as installed
         */
        ArtifactFetcher(IDownloader& downloader,
                        ICommandRunner& runner,
                        std::string entry_point);

        /**
         * @brief Ensures <dest_root>/<version> holds the extracted release
         *
         * If the entry point already exists nothing happens and no network
         * access is made. Otherwise:
         * 1. Creates <dest_root>/<version> with mode 0755
         * 2. Substitutes the version into the URL template
         * 3. Downloads the archive to a hidden, uniquely named file in dest_root
         * 4. Extracts it with --strip-components=1
         * 5. Sets files to 0555 and directories to 0755
         * 6. Verifies that the entry point is present
         *
         * @param version Release identifier, must be a single path component
         * @param url_template URL containing "{version}"
         * @param dest_root Install root
         * @return std::filesystem::path The version directory
         *
         * @throws ProvisionError on invalid input, unwritable destination,
         *         download or extraction failure
         */
        std::filesystem::path fetch(const std::string& version,
                                    const std::string& url_template,
                                    const std::filesystem::path& dest_root);

        /**
         * @brief Whether the last fetch() call skipped because the release was present
         */
        [[nodiscard]] bool last_fetch_skipped() const { return last_fetch_skipped_; }

        /**
         * @brief Builds the download URL for a release
         *
         * @throws ProvisionError if the template has no "{version}" placeholder
         */
        [[nodiscard]] static std::string build_url(const std::string& url_template,
                                                   const std::string& version);

    private:
        /**
         * @brief Extracts a tar.gz archive, dropping its top-level directory
         *
         * Runs: tar -xzf <archive> -C <extract_dir> --strip-components=1
         *
         * @return true if tar exited with status 0
         */
        bool extract_archive(const std::filesystem::path& archive_path,
                             const std::filesystem::path& extract_dir) const;

        /**
         * @brief Applies 0555 to regular files and 0755 to directories below dir
         */
        static void seal_tree(const std::filesystem::path& dir);

        IDownloader& downloader_;
        ICommandRunner& runner_;
        std::string entry_point_;
        bool last_fetch_skipped_ = false;
    };

} // namespace rtprov
