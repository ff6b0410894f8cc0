#include "features/wheel_controller.hpp"

#include "core/wheel_tree.hpp"

#include <iostream>
#include <utility>

WheelController::WheelController(AppConfig config, ActionSink& actions, Hooks hooks)
    : m_config(std::move(config)),
      m_actions(actions),
      m_hooks(std::move(hooks)),
      m_hotkeys(m_config.hotkey),
      m_navigator(NavigatorSettings::from_config(m_config)) {
    m_navigator.set_root(m_config.root.get());
}

void WheelController::on_key(const std::string& keysym, bool pressed, const Point& pointer, int64_t time_ms) {
    HotkeySignal signal;
    {
        std::lock_guard<std::mutex> lock(m_hotkey_mutex);
        signal = pressed ? m_hotkeys.on_key_press(keysym) : m_hotkeys.on_key_release(keysym);
    }

    switch (signal) {
        case HotkeySignal::None:
            break;
        case HotkeySignal::HoldStart:
            m_queue.push(InputEvent::hold_start(pointer, time_ms));
            break;
        case HotkeySignal::HoldEnd:
            m_queue.push(InputEvent::hold_end(time_ms));
            break;
        case HotkeySignal::Cancel:
            m_queue.push(InputEvent::cancel(time_ms));
            break;
    }
}

void WheelController::on_pointer(const Point& pointer, int64_t time_ms) {
    m_queue.push(InputEvent::pointer(pointer, time_ms));
}

void WheelController::post(const InputEvent& event) {
    m_queue.push(event);
}

void WheelController::process_pending() {
    std::vector<InputEvent> events = m_queue.drain();
    if (events.empty()) {
        return;
    }

    const bool was_open = m_navigator.is_open();
    for (const auto& event : events) {
        handle_outcome(m_navigator.handle(event));

        if (m_pending_config && !m_navigator.is_open()) {
            AppConfig pending = std::move(*m_pending_config);
            m_pending_config.reset();
            apply_config(std::move(pending));
        }
    }

    sync_session_state();
    if (m_hooks.on_state_changed) {
        m_hooks.on_state_changed();
    }
    if (was_open != m_navigator.is_open() && m_hooks.on_session_changed) {
        m_hooks.on_session_changed(m_navigator.is_open());
    }
}

void WheelController::replace_config(AppConfig config) {
    if (m_navigator.is_open()) {
        m_pending_config = std::move(config);
        return;
    }
    apply_config(std::move(config));
}

void WheelController::shutdown() {
    const bool was_open = m_navigator.is_open();
    m_navigator.reset();
    m_queue.drain();
    sync_session_state();

    if (was_open && m_hooks.on_session_changed) {
        m_hooks.on_session_changed(false);
    }
}

EventQueue& WheelController::queue() {
    return m_queue;
}

const WheelNavigator& WheelController::navigator() const {
    return m_navigator;
}

const AppConfig& WheelController::config() const {
    return m_config;
}

void WheelController::handle_outcome(const NavigatorOutcome& outcome) {
    switch (outcome.type) {
        case NavigatorOutcomeType::None:
            break;
        case NavigatorOutcomeType::OpenConfigEditor:
            if (m_hooks.on_open_config_editor) {
                m_hooks.on_open_config_editor(outcome.path);
            }
            break;
        case NavigatorOutcomeType::Dispatch: {
            DispatchResult result = m_actions.dispatch(outcome.slot);
            if (!result.success) {
                std::string message = "Slot " + wheel_tree::format_path(outcome.path) + " (" +
                                      wheel_tree::display_label(outcome.slot) + "): " + result.error;
                std::cerr << "Action failed: " << message << '\n';
                if (m_hooks.on_launch_failure) {
                    m_hooks.on_launch_failure(message);
                }
            }
            break;
        }
    }
}

void WheelController::apply_config(AppConfig config) {
    if (config.hotkey.hold_keys != m_config.hotkey.hold_keys ||
        config.hotkey.cancel_key != m_config.hotkey.cancel_key) {
        std::lock_guard<std::mutex> lock(m_hotkey_mutex);
        m_hotkeys = HotkeyMonitor(config.hotkey);
        m_hotkeys.set_session_open(m_navigator.is_open());
    }

    m_config = std::move(config);
    m_navigator.set_settings(NavigatorSettings::from_config(m_config));
    m_navigator.set_root(m_config.root.get());
}

void WheelController::sync_session_state() {
    std::lock_guard<std::mutex> lock(m_hotkey_mutex);
    m_hotkeys.set_session_open(m_navigator.is_open());
}
