#include "rtprov/process_supervisor.hpp"
#include "rtprov/command_runner.hpp"
#include "rtprov/errors.hpp"
#include "rtprov/utils.hpp"
#include <iostream>

namespace rtprov {

    namespace {
        constexpr const char* STEP = "restart";
    }

    ProcessSupervisor::ProcessSupervisor(ICommandRunner& runner, SupervisorSettings settings)
        : runner_(runner)
        , settings_(std::move(settings)) {}

    std::string ProcessSupervisor::process_name_for(const std::filesystem::path& binary_path) const {
        if (!settings_.process_name.empty()) {
            return settings_.process_name;
        }
        return binary_path.filename().string();
    }

    StepResult ProcessSupervisor::restart_daemon(const std::filesystem::path& binary_path) {
        // Always attempt termination before launching a new instance
        StepResult terminated = terminate_running(binary_path);
        launch(binary_path);
        return terminated;
    }

    StepResult ProcessSupervisor::terminate_running(const std::filesystem::path& binary_path) {
        std::string name = process_name_for(binary_path);
        if (name.empty() || settings_.kill_command.empty()) {
            return StepResult::nothing_to_do("No process name to terminate");
        }

        std::cout << "Terminating running " << name << " processes..." << std::endl;
        int status = runner_.run({settings_.kill_command, name});

        if (status == 0) {
            return StepResult::success("Terminated running " + name);
        }
        if (status == EXEC_FAILED_STATUS) {
            return StepResult::nothing_to_do(settings_.kill_command + " is not available, skipped termination of " + name);
        }
        return StepResult::nothing_to_do("No running " + name + " process (" +
                                         settings_.kill_command + " exited with " +
                                         std::to_string(status) + ")");
    }

    void ProcessSupervisor::launch(const std::filesystem::path& binary_path) {
        if (settings_.wrapper.empty()) {
            throw ProvisionError(STEP, "No supervising wrapper configured");
        }

        std::vector<std::string> argv = {settings_.wrapper, "--", binary_path.string()};
        std::cout << "Launching " << join_command(argv) << std::endl;

        int status = runner_.run(argv);
        if (status == EXEC_FAILED_STATUS) {
            throw ProvisionError(STEP, "Failed to run supervising wrapper " + settings_.wrapper);
        }
        if (status != 0) {
            throw ProvisionError(STEP, "Supervising wrapper exited with status " +
                                       std::to_string(status) + ": " + join_command(argv));
        }
    }

} // namespace rtprov
