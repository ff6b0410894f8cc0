#include "platform/action_dispatcher.hpp"

#include "core/key_combo.hpp"

#include <glibmm.h>

#include <algorithm>
#include <iostream>
#include <limits>
#include <utility>
#include <unistd.h>

namespace {
void start_new_session() {
    // Fails only for a process group leader, which a fresh child never is.
    static_cast<void>(setsid());
}
}  // namespace

std::vector<std::string> actions::shell_argv(const std::string& command) {
    return {"/bin/sh", "-c", command};
}

std::vector<std::string> actions::launch_argv(const std::string& program, const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(program);
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

ActionDispatcher::ActionDispatcher(KeystrokeSynthesizer& keystrokes, int64_t keystroke_delay_ms)
    : m_keystrokes(keystrokes),
      m_keystroke_delay_ms(keystroke_delay_ms) {}

void ActionDispatcher::set_keystroke_delay(int64_t delay_ms) {
    m_keystroke_delay_ms = delay_ms;
}

void ActionDispatcher::set_failure_handler(FailureHandler handler) {
    m_failure_handler = std::move(handler);
}

DispatchResult ActionDispatcher::dispatch(const SlotConfig& slot) {
    switch (slot.kind) {
        case ActionKind::Keystroke:
            return send_keystroke(slot.value);
        case ActionKind::ShellCommand:
            return spawn_detached(actions::shell_argv(slot.value));
        case ActionKind::LaunchProgram:
            return spawn_detached(actions::launch_argv(slot.value, slot.args));
        case ActionKind::Empty:
        case ActionKind::Folder:
        case ActionKind::Back:
            break;
    }
    return {false, "Slot has no action to run"};
}

DispatchResult ActionDispatcher::send_keystroke(const std::string& combo_text) {
    auto combo = parse_key_combo(combo_text);
    if (!combo.has_value()) {
        return {false, "Invalid key combination \"" + combo_text + "\""};
    }

    if (m_keystroke_delay_ms <= 0) {
        DispatchResult result;
        result.success = m_keystrokes.send(*combo, result.error);
        return result;
    }

    // The activation keys may still be physically down at release time.
    const int64_t delay_ms =
        std::min<int64_t>(m_keystroke_delay_ms, std::numeric_limits<unsigned int>::max());
    Glib::signal_timeout().connect_once(
        [this, combo = *combo, combo_text]() {
            std::string error;
            if (m_keystrokes.send(combo, error)) {
                return;
            }
            std::string message = "Keystroke " + combo_text + ": " + error;
            std::cerr << "Action failed: " << message << '\n';
            if (m_failure_handler) {
                m_failure_handler(message);
            }
        },
        static_cast<unsigned int>(delay_ms));
    return {true, ""};
}

DispatchResult ActionDispatcher::spawn_detached(const std::vector<std::string>& argv) const {
    try {
        Glib::spawn_async("", argv,
                          Glib::SpawnFlags::SEARCH_PATH | Glib::SpawnFlags::STDOUT_TO_DEV_NULL |
                              Glib::SpawnFlags::STDERR_TO_DEV_NULL,
                          sigc::ptr_fun(&start_new_session));
    } catch (const Glib::Error& e) {
        return {false, e.what()};
    }
    return {true, ""};
}
