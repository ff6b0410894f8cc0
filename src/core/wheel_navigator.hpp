#ifndef CORE_WHEEL_NAVIGATOR_HPP
#define CORE_WHEEL_NAVIGATOR_HPP

#include "core/input_events.hpp"
#include "core/models.hpp"

#include <cstdint>
#include <optional>
#include <vector>

struct NavigatorSettings {
    double dead_zone_radius = 50.0;
    double start_angle = -90.0;
    FolderPolicy folder_policy = FolderPolicy::CommitOnRelease;
    int64_t folder_dwell_ms = 400;

    static NavigatorSettings from_config(const AppConfig& config);
};

struct NavigationFrame {
    const WheelConfig* wheel = nullptr;
    Point origin;
    std::optional<int> highlighted;
    int64_t hover_since_ms = 0;
};

enum class NavigatorOutcomeType {
    None,
    Dispatch,
    OpenConfigEditor,
};

struct NavigatorOutcome {
    NavigatorOutcomeType type = NavigatorOutcomeType::None;
    // The committed slot, for Dispatch.
    SlotConfig slot;
    // Slot indices from the root to the committed slot.
    std::vector<int> path;
};

// Session state machine. Closed while the stack is empty; every event is
// handled synchronously and the tree is only ever read.
class WheelNavigator {
public:
    explicit WheelNavigator(NavigatorSettings settings = NavigatorSettings());

    // The root is borrowed and must outlive any session started on it.
    // Refused while a wheel is open.
    bool set_root(const WheelConfig* root);
    void set_settings(const NavigatorSettings& settings);

    NavigatorOutcome handle(const InputEvent& event);
    void reset();

    bool is_open() const;
    size_t depth() const;
    const std::vector<NavigationFrame>& stack() const;
    std::vector<int> highlighted_path() const;

private:
    void open(const Point& cursor, int64_t time_ms);
    void update_highlight(const Point& cursor, int64_t time_ms);
    void check_dwell(int64_t time_ms);
    NavigatorOutcome commit();
    void push_wheel(const WheelConfig* wheel, int64_t time_ms);
    void pop_wheel(int64_t time_ms);
    const SlotConfig* highlighted_slot() const;

    NavigatorSettings m_settings;
    const WheelConfig* m_root = nullptr;
    std::vector<NavigationFrame> m_stack;
    Point m_cursor;
    int64_t m_last_time_ms = 0;
};

#endif
