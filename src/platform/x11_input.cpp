#include "platform/x11_input.hpp"

#include <X11/XKBlib.h>
#include <X11/Xlib.h>
#include <X11/extensions/XInput2.h>
#include <X11/extensions/XTest.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <vector>

namespace {
// Upper bound on how long a stop or sampling change waits for the thread.
constexpr int kPollTimeoutMs = 50;

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

KeyCode keycode_for(Display* display, const std::string& keysym_name) {
    KeySym sym = XStringToKeysym(keysym_name.c_str());
    if (sym == NoSymbol) {
        return 0;
    }
    return XKeysymToKeycode(display, sym);
}
}  // namespace

X11InputSource::~X11InputSource() {
    stop();
}

bool X11InputSource::start(const Callbacks& callbacks, std::string& error) {
    if (m_running) {
        error = "Input source already running";
        return false;
    }

    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        error = "Failed to open X display";
        return false;
    }

    int event = 0;
    int xi_error = 0;
    if (!XQueryExtension(m_display, "XInputExtension", &m_xi_opcode, &event, &xi_error)) {
        error = "XInput2 not available";
        XCloseDisplay(m_display);
        m_display = nullptr;
        return false;
    }

    int major = 2;
    int minor = 2;
    if (XIQueryVersion(m_display, &major, &minor) != Success) {
        error = "XInput2 < 2.0";
        XCloseDisplay(m_display);
        m_display = nullptr;
        return false;
    }

    m_callbacks = callbacks;
    select_events(m_sampling);
    m_running = true;
    m_thread = std::thread(&X11InputSource::run, this);
    return true;
}

void X11InputSource::stop() {
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }
    if (m_display) {
        XCloseDisplay(m_display);
        m_display = nullptr;
    }
}

void X11InputSource::set_pointer_sampling(bool enabled) {
    m_sampling = enabled;
}

void X11InputSource::run() {
    bool motion_selected = m_sampling;
    pollfd connection{ConnectionNumber(m_display), POLLIN, 0};

    while (m_running) {
        const bool want_motion = m_sampling;
        if (want_motion != motion_selected) {
            select_events(want_motion);
            motion_selected = want_motion;

            double x = 0.0;
            double y = 0.0;
            if (want_motion && m_callbacks.on_pointer && query_pointer(x, y)) {
                m_callbacks.on_pointer({x, y}, now_ms());
            }
        }

        if (XPending(m_display) == 0) {
            if (poll(&connection, 1, kPollTimeoutMs) < 0 && errno != EINTR) {
                std::cerr << "Input polling failed: " << std::strerror(errno) << '\n';
                break;
            }
            continue;
        }

        XEvent ev;
        XNextEvent(m_display, &ev);
        if (ev.xcookie.type != GenericEvent || ev.xcookie.extension != m_xi_opcode) {
            continue;
        }
        if (!XGetEventData(m_display, &ev.xcookie)) {
            continue;
        }

        switch (ev.xcookie.evtype) {
            case XI_RawKeyPress:
            case XI_RawKeyRelease: {
                auto* raw = static_cast<XIRawEvent*>(ev.xcookie.data);
                KeySym sym = XkbKeycodeToKeysym(m_display, static_cast<KeyCode>(raw->detail), 0, 0);
                const char* name = sym == NoSymbol ? nullptr : XKeysymToString(sym);
                if (name && m_callbacks.on_key) {
                    double x = 0.0;
                    double y = 0.0;
                    query_pointer(x, y);
                    m_callbacks.on_key(name, ev.xcookie.evtype == XI_RawKeyPress, {x, y}, now_ms());
                }
                break;
            }
            case XI_RawMotion: {
                double x = 0.0;
                double y = 0.0;
                if (motion_selected && m_callbacks.on_pointer && query_pointer(x, y)) {
                    m_callbacks.on_pointer({x, y}, now_ms());
                }
                break;
            }
        }
        XFreeEventData(m_display, &ev.xcookie);
    }
}

void X11InputSource::select_events(bool with_motion) {
    unsigned char bits[XIMaskLen(XI_LASTEVENT)] = {0};
    XIEventMask mask{};
    mask.deviceid = XIAllMasterDevices;
    mask.mask_len = sizeof(bits);
    mask.mask = bits;
    XISetMask(bits, XI_RawKeyPress);
    XISetMask(bits, XI_RawKeyRelease);
    if (with_motion) {
        XISetMask(bits, XI_RawMotion);
    }
    XISelectEvents(m_display, DefaultRootWindow(m_display), &mask, 1);
    XFlush(m_display);
}

bool X11InputSource::query_pointer(double& x, double& y) const {
    Window root;
    Window child;
    int root_x = 0;
    int root_y = 0;
    int win_x = 0;
    int win_y = 0;
    unsigned int buttons = 0;
    if (!XQueryPointer(m_display, DefaultRootWindow(m_display), &root, &child, &root_x, &root_y, &win_x, &win_y,
                       &buttons)) {
        return false;
    }
    x = root_x;
    y = root_y;
    return true;
}

X11KeystrokeSynthesizer::~X11KeystrokeSynthesizer() {
    if (m_display) {
        XCloseDisplay(m_display);
    }
}

bool X11KeystrokeSynthesizer::open(std::string& error) {
    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        error = "Failed to open X display";
        return false;
    }

    int event = 0;
    int xtest_error = 0;
    int major = 0;
    int minor = 0;
    if (!XTestQueryExtension(m_display, &event, &xtest_error, &major, &minor)) {
        error = "XTest not available";
        XCloseDisplay(m_display);
        m_display = nullptr;
        return false;
    }
    return true;
}

bool X11KeystrokeSynthesizer::send(const KeyCombo& combo, std::string& error) {
    if (!m_display) {
        error = "X display not open";
        return false;
    }

    std::vector<KeyCode> modifiers;
    for (const auto& name : combo.modifiers) {
        KeyCode code = keycode_for(m_display, name);
        if (code == 0) {
            error = "No key code for " + name;
            return false;
        }
        modifiers.push_back(code);
    }

    KeyCode key = 0;
    if (!combo.key.empty()) {
        key = keycode_for(m_display, combo.key);
        if (key == 0) {
            error = "No key code for " + combo.key;
            return false;
        }
    }

    for (KeyCode code : modifiers) {
        XTestFakeKeyEvent(m_display, code, True, CurrentTime);
    }
    if (key != 0) {
        XTestFakeKeyEvent(m_display, key, True, CurrentTime);
        XTestFakeKeyEvent(m_display, key, False, CurrentTime);
    }
    for (auto it = modifiers.rbegin(); it != modifiers.rend(); ++it) {
        XTestFakeKeyEvent(m_display, *it, False, CurrentTime);
    }
    XFlush(m_display);
    return true;
}
