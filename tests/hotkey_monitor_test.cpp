#include "core/hotkey_monitor.hpp"

#include <cassert>

int main() {
    {
        HotkeyMonitor monitor;
        assert(monitor.on_key_press("Super_L") == HotkeySignal::None);
        assert(monitor.on_key_press("Alt_L") == HotkeySignal::HoldStart);
        assert(monitor.is_holding());

        // Auto-repeat of either key changes nothing.
        assert(monitor.on_key_press("Alt_L") == HotkeySignal::None);
        assert(monitor.on_key_press("Super_L") == HotkeySignal::None);
        assert(monitor.on_key_press("Alt_L") == HotkeySignal::None);

        assert(monitor.on_key_release("Alt_L") == HotkeySignal::HoldEnd);
        assert(!monitor.is_holding());
        assert(monitor.on_key_release("Super_L") == HotkeySignal::None);
    }

    {
        // Order of presses and left/right variants do not matter.
        HotkeyMonitor monitor;
        assert(monitor.on_key_press("Alt_R") == HotkeySignal::None);
        assert(monitor.on_key_press("Super_R") == HotkeySignal::HoldStart);
        assert(monitor.on_key_release("Super_R") == HotkeySignal::HoldEnd);

        // Pressing the missing key again starts a new hold.
        assert(monitor.on_key_press("Super_L") == HotkeySignal::HoldStart);
    }

    {
        HotkeyMonitor monitor;
        monitor.on_key_press("Super_L");
        monitor.on_key_press("Alt_L");
        assert(monitor.on_key_press("a") == HotkeySignal::None);
        assert(monitor.on_key_press("Escape") == HotkeySignal::Cancel);
        assert(monitor.on_key_release("Escape") == HotkeySignal::None);
        assert(monitor.on_key_release("a") == HotkeySignal::None);
        assert(monitor.on_key_release("Super_L") == HotkeySignal::HoldEnd);
    }

    {
        // Escape without a hold is ordinary typing.
        HotkeyMonitor monitor;
        assert(monitor.on_key_press("Escape") == HotkeySignal::None);
        assert(monitor.on_key_release("Escape") == HotkeySignal::None);
    }

    {
        // With a wheel left open after the hold ended, the cancel key still cancels.
        HotkeyMonitor monitor;
        monitor.on_key_press("Super_L");
        monitor.on_key_press("Alt_L");
        assert(monitor.on_key_release("Alt_L") == HotkeySignal::HoldEnd);
        monitor.set_session_open(true);
        assert(monitor.on_key_press("a") == HotkeySignal::None);
        assert(monitor.on_key_press("Escape") == HotkeySignal::Cancel);
        assert(monitor.on_key_press("Escape") == HotkeySignal::None);
        assert(monitor.on_key_release("Escape") == HotkeySignal::None);

        monitor.set_session_open(false);
        assert(monitor.on_key_press("Escape") == HotkeySignal::None);
    }

    {
        // Releases for keys pressed before the monitor started are ignored.
        HotkeyMonitor monitor;
        assert(monitor.on_key_release("Alt_L") == HotkeySignal::None);
    }

    {
        HotkeyConfig config;
        config.hold_keys = {"Ctrl", "Shift", "space"};
        config.cancel_key = "q";
        HotkeyMonitor monitor(config);
        assert(monitor.on_key_press("Control_L") == HotkeySignal::None);
        assert(monitor.on_key_press("Shift_L") == HotkeySignal::None);
        assert(monitor.on_key_press("space") == HotkeySignal::HoldStart);
        assert(monitor.on_key_press("Escape") == HotkeySignal::None);
        assert(monitor.on_key_press("q") == HotkeySignal::Cancel);
    }

    {
        HotkeyConfig config;
        config.hold_keys.clear();
        HotkeyMonitor monitor(config);
        assert(monitor.on_key_press("Super_L") == HotkeySignal::None);
        assert(!monitor.is_holding());
    }

    {
        HotkeyMonitor monitor;
        monitor.on_key_press("Super_L");
        monitor.on_key_press("Alt_L");
        monitor.reset();
        assert(!monitor.is_holding());
        assert(monitor.on_key_release("Alt_L") == HotkeySignal::None);
    }

    return 0;
}
