#ifndef CORE_INPUT_EVENTS_HPP
#define CORE_INPUT_EVENTS_HPP

#include "core/models.hpp"

#include <cstdint>

enum class InputEventType {
    HoldStart,
    HoldEnd,
    Cancel,
    PointerUpdate,
    Tick,
};

struct InputEvent {
    InputEventType type = InputEventType::Tick;
    // Cursor position for HoldStart and PointerUpdate.
    Point position;
    // Monotonic milliseconds.
    int64_t time_ms = 0;

    static InputEvent hold_start(const Point& position, int64_t time_ms) {
        return {InputEventType::HoldStart, position, time_ms};
    }
    static InputEvent hold_end(int64_t time_ms) { return {InputEventType::HoldEnd, {}, time_ms}; }
    static InputEvent cancel(int64_t time_ms) { return {InputEventType::Cancel, {}, time_ms}; }
    static InputEvent pointer(const Point& position, int64_t time_ms) {
        return {InputEventType::PointerUpdate, position, time_ms};
    }
    static InputEvent tick(int64_t time_ms) { return {InputEventType::Tick, {}, time_ms}; }
};

#endif
