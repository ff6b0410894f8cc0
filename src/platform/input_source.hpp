#ifndef PLATFORM_INPUT_SOURCE_HPP
#define PLATFORM_INPUT_SOURCE_HPP

#include "core/key_combo.hpp"
#include "core/models.hpp"

#include <cstdint>
#include <functional>
#include <string>

// Global keyboard and pointer observation. Callbacks run on the source's own
// thread and must only hand events off.
class InputSource {
public:
    struct Callbacks {
        std::function<void(const std::string& keysym, bool pressed, const Point& pointer, int64_t time_ms)> on_key;
        std::function<void(const Point& pointer, int64_t time_ms)> on_pointer;
    };

    virtual ~InputSource() = default;

    virtual bool start(const Callbacks& callbacks, std::string& error) = 0;
    virtual void stop() = 0;
    virtual void set_pointer_sampling(bool enabled) = 0;
};

// Injects key presses into the session as if typed.
class KeystrokeSynthesizer {
public:
    virtual ~KeystrokeSynthesizer() = default;
    virtual bool send(const KeyCombo& combo, std::string& error) = 0;
};

#endif
