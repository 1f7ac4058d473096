/**
 * @file command_runner.hpp
 * @brief Runs external commands as child processes
 *
 * Every interaction with other programs (tar, killall, the supervising
 * wrapper, the package manager, external provisioning steps) goes through
 * an ICommandRunner. The production implementation forks and execs; tests
 * substitute a recording fake so no real process is touched.
 */

#pragma once

#include <string>
#include <vector>

namespace rtprov {

    /**
     * @brief Exit status reported when the program could not be executed
     */
    inline constexpr int EXEC_FAILED_STATUS = 127;

    /**
     * @brief Interface for running a command and collecting its exit status
     */
    class ICommandRunner {
    public:
        virtual ~ICommandRunner() = default;

        /**
         * @brief Runs argv[0] with the given arguments and waits for it
         *
         * @param argv Program followed by its arguments; argv[0] is looked up in PATH
         * @return int Exit code of the child, 128 + signal number if it was
         *             killed by a signal, 127 if it could not be executed,
         *             -1 if argv was empty or fork failed
         */
        virtual int run(const std::vector<std::string>& argv) = 0;
    };

    /**
     * @brief fork/execvp/waitpid implementation of ICommandRunner
     *
     * The child inherits stdout/stderr so command output shows up next to
     * the provisioner's own progress lines.
     */
    class SystemCommandRunner : public ICommandRunner {
    public:
        int run(const std::vector<std::string>& argv) override;
    };

} // namespace rtprov
