#ifndef PLATFORM_X11_INPUT_HPP
#define PLATFORM_X11_INPUT_HPP

#include "platform/input_source.hpp"

#include <atomic>
#include <string>
#include <thread>

typedef struct _XDisplay Display;

// XInput2 raw key and motion events on the root window. Raw events are
// observed only, so other clients keep receiving input unchanged.
class X11InputSource : public InputSource {
public:
    X11InputSource() = default;
    ~X11InputSource() override;

    X11InputSource(const X11InputSource&) = delete;
    X11InputSource& operator=(const X11InputSource&) = delete;

    bool start(const Callbacks& callbacks, std::string& error) override;
    void stop() override;
    void set_pointer_sampling(bool enabled) override;

private:
    void run();
    void select_events(bool with_motion);
    bool query_pointer(double& x, double& y) const;

    Display* m_display = nullptr;
    int m_xi_opcode = 0;
    Callbacks m_callbacks;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_sampling{false};
};

// XTest keystroke injection. Used from the main thread only.
class X11KeystrokeSynthesizer : public KeystrokeSynthesizer {
public:
    X11KeystrokeSynthesizer() = default;
    ~X11KeystrokeSynthesizer() override;

    X11KeystrokeSynthesizer(const X11KeystrokeSynthesizer&) = delete;
    X11KeystrokeSynthesizer& operator=(const X11KeystrokeSynthesizer&) = delete;

    bool open(std::string& error);
    bool send(const KeyCombo& combo, std::string& error) override;

private:
    Display* m_display = nullptr;
};

#endif
