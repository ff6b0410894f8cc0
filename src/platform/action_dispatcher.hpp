#ifndef PLATFORM_ACTION_DISPATCHER_HPP
#define PLATFORM_ACTION_DISPATCHER_HPP

#include "core/action_sink.hpp"
#include "platform/input_source.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace actions {
std::vector<std::string> shell_argv(const std::string& command);
std::vector<std::string> launch_argv(const std::string& program, const std::vector<std::string>& args);
}

// Runs committed actions without waiting for them. Processes are spawned
// detached in their own session with output discarded; only a failure to
// start them is reported.
class ActionDispatcher : public ActionSink {
public:
    using FailureHandler = std::function<void(const std::string& message)>;

    ActionDispatcher(KeystrokeSynthesizer& keystrokes, int64_t keystroke_delay_ms);

    void set_keystroke_delay(int64_t delay_ms);
    // Receives failures that happen after dispatch() returned, i.e. delayed
    // keystrokes.
    void set_failure_handler(FailureHandler handler);
    DispatchResult dispatch(const SlotConfig& slot) override;

private:
    DispatchResult send_keystroke(const std::string& combo_text);
    DispatchResult spawn_detached(const std::vector<std::string>& argv) const;

    KeystrokeSynthesizer& m_keystrokes;
    int64_t m_keystroke_delay_ms;
    FailureHandler m_failure_handler;
};

#endif
