#include "rtprov/config_manager.hpp"
#include "rtprov/errors.hpp"
#include "rtprov/utils.hpp"
#include <fstream>
#include <sstream>

namespace rtprov {

    namespace fs = std::filesystem;

    void to_json(nlohmann::json& j, const ProvisionConfig& config) {
        j = nlohmann::json{
            {"version", config.version},
            {"url_template", config.url_template},
            {"install_root", config.install_root.string()},
            {"search_path_dir", config.search_path_dir.string()},
            {"entry_point", config.entry_point},
            {"daemon_binary", config.daemon_binary.string()},
            {"process_name", config.process_name},
            {"supervisor_wrapper", config.supervisor_wrapper},
            {"supervisor_package", config.supervisor_package},
            {"kill_command", config.kill_command},
            {"prerequisites_command", config.prerequisites_command},
            {"configure_command", config.configure_command},
            {"package_check_command", config.package_check_command},
            {"package_install_command", config.package_install_command},
            {"log_dir", config.log_dir.string()}
        };
    }

    void from_json(const nlohmann::json& j, ProvisionConfig& config) {
        config.version = j.value("version", config.version);
        config.url_template = j.value("url_template", config.url_template);
        config.install_root = j.value("install_root", config.install_root.string());
        config.search_path_dir = j.value("search_path_dir", config.search_path_dir.string());
        config.entry_point = j.value("entry_point", config.entry_point);
        config.daemon_binary = j.value("daemon_binary", config.daemon_binary.string());
        config.process_name = j.value("process_name", config.process_name);
        config.supervisor_wrapper = j.value("supervisor_wrapper", config.supervisor_wrapper);
        config.supervisor_package = j.value("supervisor_package", config.supervisor_package);
        config.kill_command = j.value("kill_command", config.kill_command);
        config.prerequisites_command = j.value("prerequisites_command", config.prerequisites_command);
        config.configure_command = j.value("configure_command", config.configure_command);
        config.package_check_command = j.value("package_check_command", config.package_check_command);
        config.package_install_command = j.value("package_install_command", config.package_install_command);
        config.log_dir = j.value("log_dir", config.log_dir.string());
    }

    ProvisionConfig ConfigManager::load(const std::string& path) {
        fs::path config_path = expand_tilde(path);

        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("Cannot open configuration file: " + config_path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        try {
            return parse(buffer.str());
        } catch (const ConfigError& e) {
            throw ConfigError(config_path.string() + ": " + e.what());
        }
    }

    ProvisionConfig ConfigManager::parse(const std::string& text) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError(std::string("Invalid JSON: ") + e.what());
        }

        if (!j.is_object()) {
            throw ConfigError("Configuration must be a JSON object");
        }

        try {
            return j.get<ProvisionConfig>();
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("Invalid configuration value: ") + e.what());
        }
    }

    void ConfigManager::apply_overrides(ProvisionConfig& config, const ConfigOverrides& overrides) {
        if (overrides.version) {
            config.version = *overrides.version;
        }
        if (overrides.url_template) {
            config.url_template = *overrides.url_template;
        }
        if (overrides.install_root) {
            config.install_root = *overrides.install_root;
        }
        if (overrides.search_path_dir) {
            config.search_path_dir = *overrides.search_path_dir;
        }
        if (overrides.log_dir) {
            config.log_dir = *overrides.log_dir;
        }
    }

    void ConfigManager::normalize(ProvisionConfig& config) {
        config.install_root = fs::absolute(expand_tilde(config.install_root.string())).lexically_normal();
        config.search_path_dir = fs::absolute(expand_tilde(config.search_path_dir.string())).lexically_normal();

        // Remove a trailing separator so "<root>/current" and prefixes compare cleanly
        if (!config.install_root.has_filename() && config.install_root.has_parent_path() &&
            config.install_root != config.install_root.root_path()) {
            config.install_root = config.install_root.parent_path();
        }
        if (!config.search_path_dir.has_filename() && config.search_path_dir.has_parent_path() &&
            config.search_path_dir != config.search_path_dir.root_path()) {
            config.search_path_dir = config.search_path_dir.parent_path();
        }

        fs::path daemon = expand_tilde(config.daemon_binary.string());
        if (!daemon.empty() && daemon.is_relative()) {
            daemon = config.search_path_dir / daemon;
        }
        config.daemon_binary = daemon;

        if (config.log_dir.empty()) {
            config.log_dir = get_default_log_dir();
        } else {
            config.log_dir = expand_tilde(config.log_dir.string());
        }
    }

    void ConfigManager::validate(const ProvisionConfig& config) {
        if (config.version.empty()) {
            throw ConfigError("No release given (set \"version\" or pass --release)");
        }
        if (!is_valid_version(config.version)) {
            throw ConfigError("Invalid release identifier: '" + config.version + "'");
        }
        if (config.url_template.find(VERSION_PLACEHOLDER) == std::string::npos) {
            throw ConfigError("url_template must contain " + std::string(VERSION_PLACEHOLDER));
        }
        if (config.install_root.empty()) {
            throw ConfigError("install_root must not be empty");
        }
        if (config.search_path_dir.empty()) {
            throw ConfigError("search_path_dir must not be empty");
        }
        if (config.entry_point.empty()) {
            throw ConfigError("entry_point must not be empty");
        }
        if (config.daemon_binary.empty()) {
            throw ConfigError("daemon_binary must not be empty");
        }
        if (config.supervisor_wrapper.empty()) {
            throw ConfigError("supervisor_wrapper must not be empty");
        }
    }

} // namespace rtprov
