#include "rtprov/external_step.hpp"
#include "rtprov/command_runner.hpp"
#include "rtprov/utils.hpp"
#include <iostream>

namespace rtprov {

    CommandStep::CommandStep(ICommandRunner& runner, std::string label, std::vector<std::string> argv)
        : runner_(runner)
        , label_(std::move(label))
        , argv_(std::move(argv)) {}

    StepResult CommandStep::run() {
        if (argv_.empty()) {
            return StepResult::nothing_to_do("No " + label_ + " command configured");
        }

        std::cout << "Running " << label_ << ": " << join_command(argv_) << std::endl;
        int status = runner_.run(argv_);

        if (status != 0) {
            return StepResult::fatal(label_ + " command failed with status " +
                                     std::to_string(status) + ": " + join_command(argv_));
        }
        return StepResult::success(label_ + " completed");
    }

    CommandPackageManager::CommandPackageManager(ICommandRunner& runner,
                                                 std::vector<std::string> check_command,
                                                 std::vector<std::string> install_command)
        : runner_(runner)
        , check_command_(std::move(check_command))
        , install_command_(std::move(install_command)) {}

    StepResult CommandPackageManager::ensure_package(const std::string& name) {
        if (name.empty()) {
            return StepResult::nothing_to_do("No package requested");
        }

        // Already installed?
        if (!check_command_.empty()) {
            auto check = substitute_all(check_command_, PACKAGE_PLACEHOLDER, name);
            if (runner_.run(check) == 0) {
                return StepResult::nothing_to_do("Package " + name + " is already installed");
            }
        }

        if (install_command_.empty()) {
            return StepResult::fatal("Package " + name + " is missing and no install command is configured");
        }

        auto install = substitute_all(install_command_, PACKAGE_PLACEHOLDER, name);
        std::cout << "Installing package " << name << ": " << join_command(install) << std::endl;

        int status = runner_.run(install);
        if (status != 0) {
            return StepResult::fatal("Failed to install package " + name + " (status " +
                                     std::to_string(status) + ")");
        }
        return StepResult::success("Installed package " + name);
    }

} // namespace rtprov
