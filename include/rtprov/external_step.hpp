/**
 * @file external_step.hpp
 * @brief Collaborators that run outside the provisioner's own logic
 *
 * Three collaborators are delegated to external programs:
 * - the prerequisite installer (runs before anything else)
 * - the package manager (ensures the supervising wrapper is installed)
 * - the post-install configuration (runs after the daemon restart)
 *
 * Each reports a StepResult; what they do internally is opaque.
 */

#pragma once

#include <string>
#include <vector>

#include "rtprov/step_result.hpp"

namespace rtprov {

    class ICommandRunner;

    /**
     * @brief An opaque step invoked with no parameters beyond "run"
     */
    class IExternalStep {
    public:
        virtual ~IExternalStep() = default;

        /**
         * @brief Runs the step
         *
         * @return StepResult FATAL aborts the provisioning run
         */
        virtual StepResult run() = 0;
    };

    /**
     * @brief External step backed by a configured command
     *
     * An empty command means the host has nothing to do for this step.
     */
    class CommandStep : public IExternalStep {
    public:
        /**
         * @param runner Used to run the command
         * @param label Human-readable step name used in messages
         * @param argv Command and arguments, may be empty
         */
        CommandStep(ICommandRunner& runner, std::string label, std::vector<std::string> argv);

        StepResult run() override;

        [[nodiscard]] const std::vector<std::string>& get_command() const { return argv_; }

    private:
        ICommandRunner& runner_;
        std::string label_;
        std::vector<std::string> argv_;
    };

    /**
     * @brief System package manager contract: installed or fatal
     */
    class IPackageManager {
    public:
        virtual ~IPackageManager() = default;

        /**
         * @brief Makes sure a package is installed
         *
         * @param name Package name
         * @return StepResult NOTHING_TO_DO if already installed,
         *         SUCCESS if it was installed now, FATAL otherwise
         */
        virtual StepResult ensure_package(const std::string& name) = 0;
    };

    /**
     * @brief IPackageManager driven by a check command and an install command
     *
     * Both commands are argv templates where "{package}" is replaced by the
     * package name. Defaults target dpkg/apt:
     *   check:   dpkg -s {package}
     *   install: apt-get install -y {package}
     */
    class CommandPackageManager : public IPackageManager {
    public:
        CommandPackageManager(ICommandRunner& runner,
                              std::vector<std::string> check_command,
                              std::vector<std::string> install_command);

        StepResult ensure_package(const std::string& name) override;

    private:
        ICommandRunner& runner_;
        std::vector<std::string> check_command_;
        std::vector<std::string> install_command_;
    };

} // namespace rtprov
