#include "core/event_queue.hpp"

#include <utility>

void EventQueue::set_wakeup(std::function<void()> wakeup) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_wakeup = std::move(wakeup);
}

void EventQueue::push(const InputEvent& event) {
    std::function<void()> wakeup;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (event.type == InputEventType::PointerUpdate && !m_pending.empty() &&
            m_pending.back().type == InputEventType::PointerUpdate) {
            m_pending.back() = event;
            return;
        }

        m_pending.push_back(event);
        if (m_pending.size() == 1) {
            wakeup = m_wakeup;
        }
    }

    if (wakeup) {
        wakeup();
    }
}

std::vector<InputEvent> EventQueue::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<InputEvent> events(m_pending.begin(), m_pending.end());
    m_pending.clear();
    return events;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}
