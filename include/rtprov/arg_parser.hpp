/**
 * @file arg_parser.hpp
 * @brief Command-line argument parser for rtprov
 *
 * Parses command-line arguments to determine the command to run:
 * - provision (default): install and activate a release, restart the daemon
 * - status: report the active release without changing anything
 */

#pragma once

#include <string>
#include <vector>

#include "rtprov/config_manager.hpp"

namespace rtprov {

    /**
     * @brief Commands understood by rtprov
     */
    enum class RunMode {
        PROVISION,   // Run the full provisioning workflow
        STATUS       // Print installed releases and exposed links
    };

    /**
     * @brief Parsed command-line arguments
     */
    struct ParsedArgs {
        RunMode mode = RunMode::PROVISION;
        std::string config_path;               // Empty = no configuration file
        ConfigOverrides overrides;
        std::vector<std::string> positional_args;
        std::vector<std::string> errors;       // Problems found while parsing
        bool json_output = false;
        bool show_help = false;
        bool show_version = false;
    };

    /**
     * @brief Command-line argument parser
     *
     * Supports:
     *   --config, -c <file>        JSON configuration file
     *   --release, -r <version>    Release to install
     *   --url-template, -u <tpl>   Download URL template
     *   --install-root <dir>       Install root
     *   --bin-dir <dir>            Search path directory for the links
     *   --log-dir <dir>            Audit log directory
     *   --json                     Machine-readable output
     *   --help, -h / --version, -v
     */
    class ArgParser {
    public:
        /**
         * @brief Parses argv into a ParsedArgs
         *
         * Never exits or prints: unknown options, missing option values and
         * stray positionals are collected in ParsedArgs::errors for the
         * caller to report.
         */
        static ParsedArgs parse(int argc, char* argv[]);

        static std::string get_help_message();

        /** @brief "rtprov version X.Y.Z" */
        static std::string get_version_string();

        /** @brief Command name of a mode ("provision", "status") */
        static std::string mode_to_string(RunMode mode);
    };

} // namespace rtprov
