#include "platform/action_dispatcher.hpp"

#include <glibmm.h>

#include <cassert>
#include <string>
#include <vector>

namespace {
class RecordingKeystrokes : public KeystrokeSynthesizer {
public:
    bool send(const KeyCombo& combo, std::string& error) override {
        sent.push_back(combo);
        if (fail) {
            error = "No key code for " + combo.key;
            return false;
        }
        return true;
    }

    std::vector<KeyCombo> sent;
    bool fail = false;
};

SlotConfig make_slot(ActionKind kind, const std::string& value) {
    SlotConfig slot;
    slot.kind = kind;
    slot.value = value;
    return slot;
}
}

int main() {
    Glib::init();

    {
        assert((actions::shell_argv("notify-send hi && true") ==
                std::vector<std::string>{"/bin/sh", "-c", "notify-send hi && true"}));
        assert((actions::launch_argv("gedit", {"--new-window", "a b"}) ==
                std::vector<std::string>{"gedit", "--new-window", "a b"}));
        assert(actions::launch_argv("xterm", {}) == std::vector<std::string>{"xterm"});
    }

    {
        RecordingKeystrokes keystrokes;
        ActionDispatcher dispatcher(keystrokes, 0);

        DispatchResult result = dispatcher.dispatch(make_slot(ActionKind::Keystroke, "Ctrl+Shift+T"));
        assert(result.success);
        assert(keystrokes.sent.size() == 1);
        assert((keystrokes.sent[0].modifiers == std::vector<std::string>{"Control_L", "Shift_L"}));
        assert(keystrokes.sent[0].key == "t");

        result = dispatcher.dispatch(make_slot(ActionKind::Keystroke, "a+b"));
        assert(!result.success);
        assert(keystrokes.sent.size() == 1);

        keystrokes.fail = true;
        result = dispatcher.dispatch(make_slot(ActionKind::Keystroke, "Ctrl+q"));
        assert(!result.success);
        assert(result.error == "No key code for q");
    }

    {
        RecordingKeystrokes keystrokes;
        ActionDispatcher dispatcher(keystrokes, 0);

        assert(!dispatcher.dispatch(make_slot(ActionKind::Empty, "")).success);
        assert(!dispatcher.dispatch(make_slot(ActionKind::Back, "")).success);
        assert(!dispatcher.dispatch(make_slot(ActionKind::Folder, "")).success);
    }

    {
        RecordingKeystrokes keystrokes;
        ActionDispatcher dispatcher(keystrokes, 0);

        assert(dispatcher.dispatch(make_slot(ActionKind::ShellCommand, "exit 3")).success);
        assert(dispatcher.dispatch(make_slot(ActionKind::LaunchProgram, "true")).success);

        SlotConfig with_args = make_slot(ActionKind::LaunchProgram, "/bin/sh");
        with_args.args = {"-c", "true"};
        assert(dispatcher.dispatch(with_args).success);

        DispatchResult result =
            dispatcher.dispatch(make_slot(ActionKind::LaunchProgram, "quick-wheel-no-such-program"));
        assert(!result.success);
        assert(!result.error.empty());
    }

    {
        // Delayed keystrokes are sent from the main loop.
        RecordingKeystrokes keystrokes;
        ActionDispatcher dispatcher(keystrokes, 20);
        auto loop = Glib::MainLoop::create();

        assert(dispatcher.dispatch(make_slot(ActionKind::Keystroke, "Alt+Tab")).success);
        assert(keystrokes.sent.empty());

        Glib::signal_timeout().connect_once([&loop]() { loop->quit(); }, 200);
        loop->run();
        assert(keystrokes.sent.size() == 1);
        assert(keystrokes.sent[0].key == "Tab");
    }

    {
        // A delayed keystroke that fails reaches the failure handler.
        RecordingKeystrokes keystrokes;
        keystrokes.fail = true;
        ActionDispatcher dispatcher(keystrokes, 20);
        std::vector<std::string> failures;
        dispatcher.set_failure_handler([&failures](const std::string& message) { failures.push_back(message); });
        auto loop = Glib::MainLoop::create();

        assert(dispatcher.dispatch(make_slot(ActionKind::Keystroke, "Ctrl+F13")).success);
        assert(failures.empty());

        Glib::signal_timeout().connect_once([&loop]() { loop->quit(); }, 200);
        loop->run();
        assert(keystrokes.sent.size() == 1);
        assert(failures.size() == 1);
        assert(failures[0] == "Keystroke Ctrl+F13: No key code for F13");
    }

    return 0;
}
