/**
 * @file errors.hpp
 * @brief Exception types raised by the provisioner
 *
 * Every fatal condition during a run is reported as a ProvisionError
 * carrying the name of the step that failed. Problems with the
 * configuration file or the command line are reported as ConfigError
 * before any step starts.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace rtprov {

    /**
     * @brief Fatal failure of a provisioning step
     *
     * Thrown by the components (fetch, activate, expose, restart) and by
     * the orchestrator when an external step reports a fatal result.
     * The whole run unwinds; re-running from scratch is the recovery path.
     */
    class ProvisionError : public std::runtime_error {
    public:
        ProvisionError(const std::string& step, const std::string& message)
            : std::runtime_error("[" + step + "] " + message)
            , step_(step)
            , detail_(message) {}

        /**
         * @brief Name of the step that failed (e.g. "fetch")
         */
        [[nodiscard]] const std::string& step() const { return step_; }

        /**
         * @brief The message without the step prefix
         */
        [[nodiscard]] const std::string& detail() const { return detail_; }

    private:
        std::string step_;
        std::string detail_;
    };

    /**
     * @brief Invalid or unreadable configuration
     */
    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& message)
            : std::runtime_error(message) {}
    };

} // namespace rtprov
