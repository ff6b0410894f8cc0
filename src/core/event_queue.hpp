#ifndef CORE_EVENT_QUEUE_HPP
#define CORE_EVENT_QUEUE_HPP

#include "core/input_events.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <vector>

// Multi-producer, single-consumer hand-off between input threads and the
// navigator. Events keep their arrival order; a pointer sample replaces an
// unconsumed pointer sample directly before it.
class EventQueue {
public:
    // Called from the producing thread when the queue goes from empty to
    // non-empty.
    void set_wakeup(std::function<void()> wakeup);

    void push(const InputEvent& event);
    std::vector<InputEvent> drain();
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::deque<InputEvent> m_pending;
    std::function<void()> m_wakeup;
};

#endif
