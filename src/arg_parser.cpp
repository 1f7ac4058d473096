#include "rtprov/arg_parser.hpp"

#ifndef RTPROV_VERSION
#define RTPROV_VERSION "0.0.0"
#endif

namespace rtprov {

    ParsedArgs ArgParser::parse(int argc, char* argv[]) {
        ParsedArgs args;

        // Reads the value following an option, recording an error if it is missing
        auto take_value = [&](int& i, const std::string& option) -> std::string {
            if (i + 1 < argc) {
                return argv[++i];
            }
            args.errors.push_back("Option " + option + " requires a value");
            return "";
        };

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--config" || arg == "-c") {
                args.config_path = take_value(i, arg);
            } else if (arg == "--release" || arg == "-r") {
                args.overrides.version = take_value(i, arg);
            } else if (arg == "--url-template" || arg == "-u") {
                args.overrides.url_template = take_value(i, arg);
            } else if (arg == "--install-root") {
                args.overrides.install_root = take_value(i, arg);
            } else if (arg == "--bin-dir") {
                args.overrides.search_path_dir = take_value(i, arg);
            } else if (arg == "--log-dir") {
                args.overrides.log_dir = take_value(i, arg);
            } else if (arg == "--json") {
                args.json_output = true;
            } else if (arg == "--help" || arg == "-h") {
                args.show_help = true;
            } else if (arg == "--version" || arg == "-v") {
                args.show_version = true;
            } else if (!arg.empty() && arg[0] == '-') {
                args.errors.push_back("Unknown option: " + arg);
            } else {
                args.positional_args.push_back(arg);
            }
        }

        if (!args.positional_args.empty()) {
            const std::string& command = args.positional_args.front();
            if (command == "provision") {
                args.mode = RunMode::PROVISION;
            } else if (command == "status") {
                args.mode = RunMode::STATUS;
            } else {
                args.errors.push_back("Unknown command: " + command);
            }
            if (args.positional_args.size() > 1) {
                args.errors.push_back("Unexpected argument: " + args.positional_args[1]);
            }
        }

        return args;
    }

    std::string ArgParser::get_help_message() {
        return R"(Runtime Provisioner (rtprov)

Usage: rtprov [OPTIONS] [provision|status]

Options:
  -c, --config <file>        JSON configuration file
  -r, --release <version>    Release to install (e.g. 17.03.1-ce)
  -u, --url-template <tpl>   Download URL, "{version}" is replaced by the release
      --install-root <dir>   Directory holding <version>/ and current (default: /opt/docker)
      --bin-dir <dir>        Directory receiving the binary links (default: /usr/bin)
      --log-dir <dir>        Audit log directory
      --json                 Print the report as JSON
  -h, --help                 Show this help message
  -v, --version              Show version information

Commands:
  provision                  Fetch, activate, expose and restart (default)
  status                     Show the active release and exposed links

Examples:
  rtprov --release 17.03.1-ce
  rtprov -c /etc/rtprov.json provision --json
  rtprov --install-root /opt/docker status
)";
    }

    std::string ArgParser::get_version_string() {
        return std::string("rtprov version ") + RTPROV_VERSION;
    }

    std::string ArgParser::mode_to_string(RunMode mode) {
        switch (mode) {
            case RunMode::PROVISION: return "provision";
            case RunMode::STATUS:    return "status";
            default:                 return "unknown";
        }
    }

} // namespace rtprov
