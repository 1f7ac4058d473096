/**
 * @file step_result.hpp
 * @brief Outcome of a single provisioning step
 *
 * Steps that talk to the outside world (prerequisites, package manager,
 * best-effort kill, post-install configuration) report one of three
 * outcomes instead of a bare bool, so the orchestrator can tell
 * "done", "nothing to do" and "fatal" apart.
 */

#pragma once

#include <string>
#include <utility>

namespace rtprov {

    /**
     * @brief Enumeration of step outcomes
     *
     * SUCCESS:       The step changed something and finished
     * NOTHING_TO_DO: The step found the host already converged
     * FATAL:         The step failed and the run must abort
     */
    enum class StepStatus {
        SUCCESS,
        NOTHING_TO_DO,
        FATAL
    };

    /**
     * @brief Converts a StepStatus to its report string
     *
     * @param status The status to convert
     * @return std::string "success", "nothing_to_do" or "fatal"
     */
    inline std::string status_to_string(StepStatus status) {
        switch (status) {
            case StepStatus::SUCCESS:       return "success";
            case StepStatus::NOTHING_TO_DO: return "nothing_to_do";
            case StepStatus::FATAL:         return "fatal";
            default:                        return "unknown";
        }
    }

    /**
     * @brief Status plus a human-readable message
     */
    struct StepResult {
        StepStatus status = StepStatus::SUCCESS;
        std::string message;

        static StepResult success(std::string message = "") {
            return {StepStatus::SUCCESS, std::move(message)};
        }

        static StepResult nothing_to_do(std::string message = "") {
            return {StepStatus::NOTHING_TO_DO, std::move(message)};
        }

        static StepResult fatal(std::string message) {
            return {StepStatus::FATAL, std::move(message)};
        }

        [[nodiscard]] bool is_fatal() const { return status == StepStatus::FATAL; }
    };

} // namespace rtprov
