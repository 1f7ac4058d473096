/**
 * @file state_machine.hpp
 * @brief State machine tracking the progress of a provisioning run
 *
 * A run walks the stages strictly in order:
 *
 * IDLE → PREREQUISITES → SUPERVISOR_PACKAGE → FETCH → ACTIVATE
 *      → EXPOSE → RESTART → CONFIGURE → DONE
 *
 * Any running stage may move to FAILED. DONE and FAILED are terminal;
 * recovery is a fresh run, not a resume.
 */

#pragma once

#include <mutex>
#include <atomic>
#include <string>

namespace rtprov {

    /**
     * @brief Enumeration of provisioning stages
     */
    enum class Stage {
        IDLE,                ///< Run not started
        PREREQUISITES,       ///< External prerequisite installer
        SUPERVISOR_PACKAGE,  ///< Ensure the supervising wrapper package
        FETCH,               ///< Download and extract the release
        ACTIVATE,            ///< Point the current link at the release
        EXPOSE,              ///< Link binaries into the search path
        RESTART,             ///< Kill and relaunch the daemon
        CONFIGURE,           ///< External post-install configuration
        DONE,                ///< All stages completed
        FAILED               ///< A stage failed, run aborted
    };

    /**
     * @brief Converts a Stage enum to its report name
     *
     * @param stage The stage to convert
     * @return std::string Lowercase stage name ("fetch", "activate", etc.)
     */
    inline std::string stage_to_string(Stage stage) {
        switch (stage) {
            case Stage::IDLE:               return "idle";
            case Stage::PREREQUISITES:      return "prerequisites";
            case Stage::SUPERVISOR_PACKAGE: return "supervisor_package";
            case Stage::FETCH:              return "fetch";
            case Stage::ACTIVATE:           return "activate";
            case Stage::EXPOSE:             return "expose";
            case Stage::RESTART:            return "restart";
            case Stage::CONFIGURE:          return "configure";
            case Stage::DONE:               return "done";
            case Stage::FAILED:             return "failed";
            default:                        return "unknown";
        }
    }

    /**
     * @brief Thread-safe forward-only progress tracker
     *
     * Usage:
     *   StateMachine sm;
     *   sm.transition_to(Stage::PREREQUISITES);  // From IDLE only
     *   sm.transition_to(Stage::FETCH);          // Rejected, skips a stage
     */
    class StateMachine {
    public:
        StateMachine() : current_stage_(Stage::IDLE) {}

        /**
         * @brief Gets the current stage (thread-safe)
         */
        Stage get_stage() const {
            return current_stage_.load();
        }

        /**
         * @brief Attempts to move to a new stage
         *
         * @param new_stage The desired stage
         * @return true if transition was successful
         * @return false if transition is invalid
         */
        bool transition_to(Stage new_stage);

        /**
         * @brief Checks if a transition is valid without performing it
         *
         * Valid transitions:
         * - each stage → the next stage in order
         * - CONFIGURE → DONE
         * - any stage from PREREQUISITES to CONFIGURE → FAILED
         */
        static bool is_valid_transition(Stage from, Stage to);

        /**
         * @brief The stage that follows a given one in a successful run
         */
        static Stage next_stage(Stage stage);

    private:
        /** @brief Atomic stage storage for lock-free reads */
        std::atomic<Stage> current_stage_;

        /** @brief Mutex for transition validation */
        mutable std::mutex mutex_;
    };

} // namespace rtprov
