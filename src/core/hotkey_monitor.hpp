#ifndef CORE_HOTKEY_MONITOR_HPP
#define CORE_HOTKEY_MONITOR_HPP

#include "core/models.hpp"

#include <set>
#include <string>

enum class HotkeySignal {
    None,
    HoldStart,
    HoldEnd,
    Cancel,
};

// Turns raw key press/release events (keysym names, repeats included) into
// debounced hold signals. Confined to the thread that delivers key events.
class HotkeyMonitor {
public:
    explicit HotkeyMonitor(HotkeyConfig config = HotkeyConfig());

    HotkeySignal on_key_press(const std::string& keysym);
    HotkeySignal on_key_release(const std::string& keysym);

    // While a wheel is open the cancel key works without the hold combo,
    // e.g. after releasing into a folder.
    void set_session_open(bool open);

    bool is_holding() const;
    void reset();

private:
    bool combo_held() const;
    bool is_cancel_key(const std::string& keysym) const;

    HotkeyConfig m_config;
    std::set<std::string> m_down;
    bool m_holding = false;
    bool m_session_open = false;
};

#endif
