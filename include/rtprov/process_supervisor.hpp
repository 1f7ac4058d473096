/**
 * @file process_supervisor.hpp
 * @brief Restarts the managed daemon under its supervising wrapper
 *
 * This header provides functionality to:
 * - Terminate every running instance of the daemon by name (best effort)
 * - Launch the daemon binary under a supervising wrapper
 *
 * Restart sequence:
 * 1. terminate_running() - `killall <process_name>`, "nothing running" is fine
 * 2. launch()            - `<wrapper> -- <binary>`, must exit 0
 *
 * The wrapper (libslack's `daemon` by default) detaches on its own and
 * keeps the daemon alive afterwards. No readiness check is made.
 */

#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include "rtprov/step_result.hpp"

namespace rtprov {

    class ICommandRunner;

    /**
     * @brief Settings for the supervising wrapper and the kill pass
     */
    struct SupervisorSettings {
        std::string wrapper = "daemon";         ///< Supervising wrapper executable
        std::string kill_command = "killall";   ///< Command used to kill by name
        std::string process_name;               ///< Empty = base name of the daemon binary
    };

    /**
     * @brief Kills and relaunches the managed daemon
     *
     * Example:
     *   SystemCommandRunner runner;
     *   ProcessSupervisor supervisor(runner, SupervisorSettings{});
     *   supervisor.restart_daemon("/usr/bin/dockerd");
     */
    class ProcessSupervisor {
    public:
        ProcessSupervisor(ICommandRunner& runner, SupervisorSettings settings);

        /**
         * @brief Terminates old instances, then launches the daemon
         *
         * @param binary_path Daemon executable (usually a search path symlink)
         * @return StepResult Outcome of the termination pass (never fatal);
         *         the launch either succeeds or throws
         * @throws ProvisionError if the wrapper cannot be run or exits non-zero
         */
        StepResult restart_daemon(const std::filesystem::path& binary_path);

        /**
         * @brief Kills all processes with the daemon's name
         *
         * @param binary_path Daemon executable, used when no process name is configured
         * @return StepResult SUCCESS if something was killed,
         *         NOTHING_TO_DO if nothing was running or the kill command failed
         */
        StepResult terminate_running(const std::filesystem::path& binary_path);

        /**
         * @brief Starts the daemon under the supervising wrapper
         *
         * @throws ProvisionError if the wrapper cannot be run or exits non-zero
         */
        void launch(const std::filesystem::path& binary_path);

        /**
         * @brief Name passed to the kill command for a given binary
         */
        [[nodiscard]] std::string process_name_for(const std::filesystem::path& binary_path) const;

        [[nodiscard]] const SupervisorSettings& get_settings() const { return settings_; }

    private:
        ICommandRunner& runner_;
        SupervisorSettings settings_;
    };

} // namespace rtprov
