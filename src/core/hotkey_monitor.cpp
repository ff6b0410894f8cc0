#include "core/hotkey_monitor.hpp"

#include "core/key_combo.hpp"

#include <algorithm>
#include <utility>

HotkeyMonitor::HotkeyMonitor(HotkeyConfig config)
    : m_config(std::move(config)) {}

HotkeySignal HotkeyMonitor::on_key_press(const std::string& keysym) {
    if (!m_down.insert(keysym).second) {
        // Auto-repeat.
        return HotkeySignal::None;
    }

    if (!m_holding && combo_held()) {
        m_holding = true;
        return HotkeySignal::HoldStart;
    }

    if ((m_holding || m_session_open) && is_cancel_key(keysym)) {
        return HotkeySignal::Cancel;
    }
    return HotkeySignal::None;
}

HotkeySignal HotkeyMonitor::on_key_release(const std::string& keysym) {
    if (m_down.erase(keysym) == 0) {
        return HotkeySignal::None;
    }

    if (m_holding && !combo_held()) {
        m_holding = false;
        return HotkeySignal::HoldEnd;
    }
    return HotkeySignal::None;
}

void HotkeyMonitor::set_session_open(bool open) {
    m_session_open = open;
}

bool HotkeyMonitor::is_holding() const {
    return m_holding;
}

void HotkeyMonitor::reset() {
    m_down.clear();
    m_holding = false;
    m_session_open = false;
}

bool HotkeyMonitor::combo_held() const {
    if (m_config.hold_keys.empty()) {
        return false;
    }

    return std::all_of(m_config.hold_keys.begin(), m_config.hold_keys.end(), [this](const std::string& wanted) {
        return std::any_of(m_down.begin(), m_down.end(), [&wanted](const std::string& down) {
            return keys::same_key(down, wanted);
        });
    });
}

bool HotkeyMonitor::is_cancel_key(const std::string& keysym) const {
    return !m_config.cancel_key.empty() && keys::same_key(keysym, m_config.cancel_key);
}
