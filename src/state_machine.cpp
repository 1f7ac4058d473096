#include "rtprov/state_machine.hpp"

namespace rtprov {

    Stage StateMachine::next_stage(Stage stage) {
        switch (stage) {
            case Stage::IDLE:               return Stage::PREREQUISITES;
            case Stage::PREREQUISITES:      return Stage::SUPERVISOR_PACKAGE;
            case Stage::SUPERVISOR_PACKAGE: return Stage::FETCH;
            case Stage::FETCH:              return Stage::ACTIVATE;
            case Stage::ACTIVATE:           return Stage::EXPOSE;
            case Stage::EXPOSE:             return Stage::RESTART;
            case Stage::RESTART:            return Stage::CONFIGURE;
            case Stage::CONFIGURE:          return Stage::DONE;
            default:
                // Terminal stages have no successor
                return stage;
        }
    }

    bool StateMachine::is_valid_transition(Stage from, Stage to) {
        switch (from) {
            case Stage::DONE:
            case Stage::FAILED:
                return false;

            case Stage::IDLE:
                // A run that has not started cannot fail a stage
                return to == Stage::PREREQUISITES;

            default:
                return to == next_stage(from) || to == Stage::FAILED;
        }
    }

    bool StateMachine::transition_to(Stage new_stage) {
        std::lock_guard<std::mutex> lock(mutex_);

        Stage current = current_stage_.load();

        if (!is_valid_transition(current, new_stage)) {
            return false;
        }

        current_stage_.store(new_stage);
        return true;
    }

} // namespace rtprov
