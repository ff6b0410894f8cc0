#include "core/event_queue.hpp"

#include <atomic>
#include <cassert>
#include <thread>
#include <vector>

int main() {
    {
        EventQueue queue;
        int wakeups = 0;
        queue.set_wakeup([&wakeups]() { ++wakeups; });

        queue.push(InputEvent::hold_start({1.0, 1.0}, 1));
        queue.push(InputEvent::pointer({2.0, 2.0}, 2));
        queue.push(InputEvent::pointer({3.0, 3.0}, 3));
        queue.push(InputEvent::pointer({4.0, 4.0}, 4));
        queue.push(InputEvent::hold_end(5));
        assert(wakeups == 1);
        assert(queue.size() == 3);

        std::vector<InputEvent> events = queue.drain();
        assert(events.size() == 3);
        assert(events[0].type == InputEventType::HoldStart);
        // Only the latest pointer sample survives, and it stays before the release.
        assert(events[1].type == InputEventType::PointerUpdate);
        assert(events[1].position.x == 4.0);
        assert(events[1].time_ms == 4);
        assert(events[2].type == InputEventType::HoldEnd);
        assert(queue.size() == 0);

        queue.push(InputEvent::tick(6));
        assert(wakeups == 2);
    }

    {
        // Samples separated by another event are both kept.
        EventQueue queue;
        queue.push(InputEvent::pointer({1.0, 0.0}, 1));
        queue.push(InputEvent::tick(2));
        queue.push(InputEvent::pointer({2.0, 0.0}, 3));
        std::vector<InputEvent> events = queue.drain();
        assert(events.size() == 3);
        assert(events[0].position.x == 1.0);
        assert(events[2].position.x == 2.0);
    }

    {
        EventQueue queue;
        assert(queue.drain().empty());
        // No wakeup installed is fine.
        queue.push(InputEvent::cancel(1));
        assert(queue.size() == 1);
    }

    {
        // Concurrent producers: nothing is lost and per-producer order holds.
        EventQueue queue;
        std::atomic<int> wakeups{0};
        queue.set_wakeup([&wakeups]() { ++wakeups; });

        constexpr int kPerThread = 1000;
        auto produce = [&queue](int64_t base) {
            for (int i = 0; i < kPerThread; ++i) {
                queue.push(InputEvent::tick(base + i));
            }
        };
        std::thread first(produce, 0);
        std::thread second(produce, 100000);
        first.join();
        second.join();

        std::vector<InputEvent> events = queue.drain();
        assert(events.size() == 2 * kPerThread);
        int64_t last_first = -1;
        int64_t last_second = -1;
        for (const auto& event : events) {
            int64_t& last = event.time_ms < 100000 ? last_first : last_second;
            assert(event.time_ms > last);
            last = event.time_ms;
        }
        assert(wakeups >= 1);
    }

    return 0;
}
