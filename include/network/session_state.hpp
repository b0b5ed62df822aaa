#ifndef PNEUMATIC_SESSION_STATE_HPP
#define PNEUMATIC_SESSION_STATE_HPP

#include <mutex>
#include <ostream>
#include <string>

namespace pneumatic {
namespace network {

/**
 * SessionState enforces the session lifecycle. States only move forward.
 */
class SessionState {
public:
    /**
     * Session states:
     * CONNECTING    - Transport accepted or connected, handshake pending
     * ESTABLISHED   - Both cipher directions keyed, messages flowing
     * DISCONNECTING - Disconnect received or initiated, teardown in progress
     * CLOSED        - Channel torn down, terminal
     */
    enum class State {
        CONNECTING,
        ESTABLISHED,
        DISCONNECTING,
        CLOSED
    };

    /**
     * Initialize session state to CONNECTING.
     */
    SessionState() : current_state_(State::CONNECTING) {}

    /**
     * Get the current session state.
     * @return Current state
     */
    State get_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_state_;
    }

    /**
     * Check if the session has reached CLOSED.
     * @return true if in terminal state
     */
    bool is_terminal() const {
        return get_state() == State::CLOSED;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    // Check if a transition is valid
    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::CONNECTING:
                return to == State::ESTABLISHED ||
                       to == State::CLOSED;

            case State::ESTABLISHED:
                return to == State::DISCONNECTING ||
                       to == State::CLOSED;

            case State::DISCONNECTING:
                return to == State::CLOSED;

            case State::CLOSED:
                return false;
        }
        return false;
    }

    // Convert state to string for logging
    static std::string state_to_string(State state) {
        switch (state) {
            case State::CONNECTING:    return "CONNECTING";
            case State::ESTABLISHED:   return "ESTABLISHED";
            case State::DISCONNECTING: return "DISCONNECTING";
            case State::CLOSED:        return "CLOSED";
            default:                   return "UNKNOWN";
        }
    }

    // Get current state as string
    std::string get_state_string() const {
        return state_to_string(get_state());
    }

private:
    mutable std::mutex mutex_;
    State current_state_;
};

// Stream operator for SessionState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const SessionState::State& state) {
    os << SessionState::state_to_string(state);
    return os;
}

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_SESSION_STATE_HPP
