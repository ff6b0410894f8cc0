#ifndef FEATURES_WHEEL_CONTROLLER_HPP
#define FEATURES_WHEEL_CONTROLLER_HPP

#include "core/action_sink.hpp"
#include "core/event_queue.hpp"
#include "core/hotkey_monitor.hpp"
#include "core/models.hpp"
#include "core/wheel_navigator.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class WheelController {
public:
    struct Hooks {
        std::function<void()> on_state_changed;
        std::function<void(bool open)> on_session_changed;
        std::function<void(const std::vector<int>& path)> on_open_config_editor;
        std::function<void(const std::string& message)> on_launch_failure;
    };

    WheelController(AppConfig config, ActionSink& actions, Hooks hooks = Hooks());

    // Input thread side: only enqueue.
    void on_key(const std::string& keysym, bool pressed, const Point& pointer, int64_t time_ms);
    void on_pointer(const Point& pointer, int64_t time_ms);
    void post(const InputEvent& event);

    // Main thread side.
    void process_pending();
    void replace_config(AppConfig config);
    void shutdown();

    EventQueue& queue();
    const WheelNavigator& navigator() const;
    const AppConfig& config() const;

private:
    void handle_outcome(const NavigatorOutcome& outcome);
    void apply_config(AppConfig config);
    void sync_session_state();

    AppConfig m_config;
    std::optional<AppConfig> m_pending_config;
    ActionSink& m_actions;
    Hooks m_hooks;

    std::mutex m_hotkey_mutex;
    HotkeyMonitor m_hotkeys;

    EventQueue m_queue;
    WheelNavigator m_navigator;
};

#endif
