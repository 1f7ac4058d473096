/**
 * @file config_manager.hpp
 * @brief Loads and validates the provisioning configuration
 *
 * This header provides functionality to:
 * - Describe every knob of a provisioning run (ProvisionConfig)
 * - Load it from a JSON file, missing keys falling back to defaults
 * - Apply command-line overrides on top of the file
 * - Normalize paths (tilde expansion, absolute roots) and validate
 *
 * Example file:
 *   {
 *     "version": "17.03.1-ce",
 *     "install_root": "/opt/docker",
 *     "configure_command": ["/usr/local/sbin/docker-configure"]
 *   }
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace rtprov {

    /**
     * @brief Everything a provisioning run needs to know
     *
     * Defaults describe the Docker static binary tarball layout.
     */
    struct ProvisionConfig {
        std::string version;                        ///< Release to install, required
        std::string url_template =
            "https://get.docker.com/builds/Linux/x86_64/docker-{version}.tgz";
        std::filesystem::path install_root = "/opt/docker";
        std::filesystem::path search_path_dir = "/usr/bin";
        std::string entry_point = "docker";         ///< Presence marks a release as fetched
        std::filesystem::path daemon_binary = "dockerd";  ///< Relative = under search_path_dir
        std::string process_name;                   ///< Empty = base name of daemon_binary
        std::string supervisor_wrapper = "daemon";
        std::string supervisor_package = "daemon";
        std::string kill_command = "killall";
        std::vector<std::string> prerequisites_command;
        std::vector<std::string> configure_command;
        std::vector<std::string> package_check_command = {"dpkg", "-s", "{package}"};
        std::vector<std::string> package_install_command = {"apt-get", "install", "-y", "{package}"};
        std::filesystem::path log_dir;              ///< Empty = default log directory
    };

    void to_json(nlohmann::json& j, const ProvisionConfig& config);
    void from_json(const nlohmann::json& j, ProvisionConfig& config);

    /**
     * @brief Values given on the command line, applied over the file
     */
    struct ConfigOverrides {
        std::optional<std::string> version;
        std::optional<std::string> url_template;
        std::optional<std::string> install_root;
        std::optional<std::string> search_path_dir;
        std::optional<std::string> log_dir;
    };

    /**
     * @brief Builds a ready-to-use ProvisionConfig
     *
     * Usage:
     *   auto config = ConfigManager::load("/etc/rtprov.json");
     *   ConfigManager::apply_overrides(config, args.overrides);
     *   ConfigManager::normalize(config);
     *   ConfigManager::validate(config);
     */
    class ConfigManager {
    public:
        /**
         * @brief Loads a configuration file
         *
         * @param path JSON file; "~" is expanded
         * @return ProvisionConfig Values from the file, defaults for missing keys
         * @throws ConfigError if the file cannot be read or parsed
         */
        [[nodiscard]] static ProvisionConfig load(const std::string& path);

        /**
         * @brief Parses configuration from a JSON string
         *
         * @throws ConfigError on malformed JSON or wrongly typed values
         */
        [[nodiscard]] static ProvisionConfig parse(const std::string& text);

        /**
         * @brief Copies every set override into the configuration
         */
        static void apply_overrides(ProvisionConfig& config, const ConfigOverrides& overrides);

        /**
         * @brief Expands "~", makes roots absolute, resolves the daemon binary
         *
         * After normalization:
         * - install_root and search_path_dir are absolute
         * - daemon_binary is absolute (relative names resolve under search_path_dir)
         * - log_dir is set (default log directory if it was empty)
         */
        static void normalize(ProvisionConfig& config);

        /**
         * @brief Rejects configurations that cannot drive a run
         *
         * @throws ConfigError describing the first problem found
         */
        static void validate(const ProvisionConfig& config);
    };

} // namespace rtprov
