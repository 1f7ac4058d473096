/**
 * @file main.cpp
 * @brief Entry point for the runtime provisioner
 *
 * Supports two commands:
 * - provision (default): install and activate a release, restart the daemon
 * - status: report the active release and the exposed links
 *
 * Components:
 * - ConfigManager: Loads the JSON configuration and applies overrides
 * - AuditLogger: Records every stage of the run
 * - ArtifactFetcher: Downloads and unpacks the release
 * - VersionDirectoryManager: Maintains <root>/current
 * - BinaryExposer: Links binaries into the search path
 * - ProcessSupervisor: Restarts the daemon under its wrapper
 * - Provisioner: Sequences the stages
 *
 * Exit code is 0 when every stage completed and 1 otherwise.
 */

#include <iostream>

#include "rtprov/arg_parser.hpp"
#include "rtprov/artifact_fetcher.hpp"
#include "rtprov/audit_logger.hpp"
#include "rtprov/binary_exposer.hpp"
#include "rtprov/command_runner.hpp"
#include "rtprov/config_manager.hpp"
#include "rtprov/errors.hpp"
#include "rtprov/external_step.hpp"
#include "rtprov/process_supervisor.hpp"
#include "rtprov/provisioner.hpp"
#include "rtprov/version_directory.hpp"

using namespace rtprov;

/**
 * @brief Builds the effective configuration from file and command line
 *
 * @throws ConfigError if the file is unreadable or the result is invalid
 */
ProvisionConfig build_config(const ParsedArgs& args, bool require_version) {
    ProvisionConfig config;
    if (!args.config_path.empty()) {
        config = ConfigManager::load(args.config_path);
    }

    ConfigManager::apply_overrides(config, args.overrides);
    ConfigManager::normalize(config);

    if (require_version) {
        ConfigManager::validate(config);
    }
    return config;
}

/**
 * @brief Prints a provisioning report
 */
void print_report(const ProvisionReport& report, bool json_output) {
    if (json_output) {
        std::cout << nlohmann::json(report).dump(2) << std::endl;
        return;
    }

    std::cout << "========================================" << std::endl;
    for (const auto& record : report.steps) {
        std::cout << "  " << stage_to_string(record.stage) << ": "
                  << status_to_string(record.result.status);
        if (!record.result.message.empty()) {
            std::cout << " (" << record.result.message << ")";
        }
        std::cout << std::endl;
    }
    std::cout << "Final stage: " << stage_to_string(report.final_stage) << std::endl;
    std::cout << "========================================" << std::endl;
}

/**
 * @brief Run the provisioning workflow
 *
 * @return int Exit code (0 for success)
 */
int run_provision_mode(const ParsedArgs& args) {
    ProvisionConfig config = build_config(args, true);

    std::cout << "========================================" << std::endl;
    std::cout << "Runtime Provisioner (rtprov)" << std::endl;
    std::cout << "Release: " << config.version << std::endl;
    std::cout << "Install root: " << config.install_root << std::endl;
    std::cout << "========================================" << std::endl;

    AuditLogger audit_logger(config.log_dir);

    SystemCommandRunner runner;
    HttpDownloader downloader;

    CommandStep prerequisites(runner, "prerequisites", config.prerequisites_command);
    CommandStep configuration(runner, "configuration", config.configure_command);
    CommandPackageManager packages(runner, config.package_check_command, config.package_install_command);

    ArtifactFetcher fetcher(downloader, runner, config.entry_point);
    VersionDirectoryManager versions(config.install_root);
    BinaryExposer exposer(config.search_path_dir);
    ProcessSupervisor supervisor(runner, SupervisorSettings{
        config.supervisor_wrapper,
        config.kill_command,
        config.process_name
    });

    Provisioner provisioner(config, prerequisites, packages, fetcher, versions,
                            exposer, supervisor, configuration, audit_logger);

    try {
        ProvisionReport report = provisioner.run();
        print_report(report, args.json_output);
    } catch (const ProvisionError&) {
        print_report(provisioner.get_report(), args.json_output);
        throw;
    }

    return 0;
}

/**
 * @brief Print the active release, installed releases and exposed links
 *
 * @return int Exit code (0 for success)
 */
int run_status_mode(const ParsedArgs& args) {
    ProvisionConfig config = build_config(args, false);

    VersionDirectoryManager versions(config.install_root);
    BinaryExposer exposer(config.search_path_dir);

    auto target = versions.current_target();
    auto installed = versions.list_versions();
    auto exposed = exposer.list_exposed(versions.current_link());

    if (args.json_output) {
        nlohmann::json links = nlohmann::json::array();
        for (const auto& binary : exposed) {
            links.push_back({{"link", binary.link.string()}, {"target", binary.target.string()}});
        }
        nlohmann::json status = {
            {"install_root", config.install_root.string()},
            {"current", target ? nlohmann::json(target->string()) : nlohmann::json(nullptr)},
            {"versions", installed},
            {"exposed", links}
        };
        std::cout << status.dump(2) << std::endl;
        return 0;
    }

    std::cout << "Install root: " << config.install_root << std::endl;
    std::cout << "Current: " << (target ? target->string() : std::string("(none)")) << std::endl;
    std::cout << "Installed releases:" << std::endl;
    for (const auto& version : installed) {
        std::cout << "  " << version << std::endl;
    }
    std::cout << "Exposed binaries:" << std::endl;
    for (const auto& binary : exposed) {
        std::cout << "  " << binary.link.string() << " -> " << binary.target.string() << std::endl;
    }
    return 0;
}

/**
 * @brief Main entry point
 *
 * Parses command-line arguments and dispatches to the requested command.
 */
int main(int argc, char* argv[]) {
    ParsedArgs args = ArgParser::parse(argc, argv);

    if (args.show_help) {
        std::cout << ArgParser::get_help_message() << std::endl;
        return 0;
    }

    if (args.show_version) {
        std::cout << ArgParser::get_version_string() << std::endl;
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "ERROR: " << error << std::endl;
        }
        std::cerr << "Run 'rtprov --help' for usage." << std::endl;
        return 1;
    }

    try {
        switch (args.mode) {
            case RunMode::STATUS:
                return run_status_mode(args);

            case RunMode::PROVISION:
            default:
                return run_provision_mode(args);
        }
    } catch (const ConfigError& e) {
        std::cerr << "CONFIGURATION ERROR: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "FATAL ERROR: " << e.what() << std::endl;
        return 1;
    }
}
