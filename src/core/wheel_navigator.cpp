#include "core/wheel_navigator.hpp"

#include "core/geometry.hpp"

NavigatorSettings NavigatorSettings::from_config(const AppConfig& config) {
    NavigatorSettings settings;
    settings.dead_zone_radius = config.geometry.dead_zone_radius;
    settings.start_angle = config.geometry.start_angle;
    settings.folder_policy = config.folder_policy;
    settings.folder_dwell_ms = config.folder_dwell_ms;
    return settings;
}

WheelNavigator::WheelNavigator(NavigatorSettings settings)
    : m_settings(settings) {}

bool WheelNavigator::set_root(const WheelConfig* root) {
    if (is_open()) {
        return false;
    }
    m_root = root;
    return true;
}

void WheelNavigator::set_settings(const NavigatorSettings& settings) {
    m_settings = settings;
}

NavigatorOutcome WheelNavigator::handle(const InputEvent& event) {
    m_last_time_ms = event.time_ms;

    if (!is_open()) {
        if (event.type == InputEventType::HoldStart) {
            open(event.position, event.time_ms);
        }
        return {};
    }

    switch (event.type) {
        case InputEventType::HoldStart:
            break;
        case InputEventType::PointerUpdate:
            update_highlight(event.position, event.time_ms);
            break;
        case InputEventType::Tick:
            check_dwell(event.time_ms);
            break;
        case InputEventType::Cancel:
            reset();
            break;
        case InputEventType::HoldEnd:
            return commit();
    }
    return {};
}

void WheelNavigator::reset() {
    m_stack.clear();
}

bool WheelNavigator::is_open() const {
    return !m_stack.empty();
}

size_t WheelNavigator::depth() const {
    return m_stack.size();
}

const std::vector<NavigationFrame>& WheelNavigator::stack() const {
    return m_stack;
}

std::vector<int> WheelNavigator::highlighted_path() const {
    std::vector<int> path;
    for (const auto& frame : m_stack) {
        if (!frame.highlighted.has_value()) {
            break;
        }
        path.push_back(*frame.highlighted);
    }
    return path;
}

void WheelNavigator::open(const Point& cursor, int64_t time_ms) {
    if (!m_root) {
        return;
    }
    m_cursor = cursor;
    push_wheel(m_root, time_ms);
}

void WheelNavigator::update_highlight(const Point& cursor, int64_t time_ms) {
    m_cursor = cursor;

    NavigationFrame& top = m_stack.back();
    std::optional<int> slot =
        geometry::resolve_slot(top.origin, cursor, m_settings.dead_zone_radius, m_settings.start_angle);
    if (slot != top.highlighted) {
        top.highlighted = slot;
        top.hover_since_ms = time_ms;
    }

    check_dwell(time_ms);
}

void WheelNavigator::check_dwell(int64_t time_ms) {
    if (m_settings.folder_policy != FolderPolicy::OpenOnDwell) {
        return;
    }

    const SlotConfig* slot = highlighted_slot();
    if (!slot || time_ms - m_stack.back().hover_since_ms < m_settings.folder_dwell_ms) {
        return;
    }

    if (slot->kind == ActionKind::Folder && slot->folder) {
        push_wheel(slot->folder.get(), time_ms);
    } else if (slot->kind == ActionKind::Back && m_stack.size() > 1) {
        pop_wheel(time_ms);
    }
}

NavigatorOutcome WheelNavigator::commit() {
    NavigatorOutcome outcome;
    const SlotConfig* slot = highlighted_slot();
    if (!slot) {
        reset();
        return outcome;
    }

    const bool commit_levels = m_settings.folder_policy == FolderPolicy::CommitOnRelease;
    switch (slot->kind) {
        case ActionKind::Empty:
            outcome.type = NavigatorOutcomeType::OpenConfigEditor;
            outcome.path = highlighted_path();
            reset();
            break;
        case ActionKind::Folder:
            if (commit_levels && slot->folder) {
                push_wheel(slot->folder.get(), m_last_time_ms);
            } else {
                reset();
            }
            break;
        case ActionKind::Back:
            if (commit_levels && m_stack.size() > 1) {
                pop_wheel(m_last_time_ms);
            } else {
                reset();
            }
            break;
        case ActionKind::Keystroke:
        case ActionKind::ShellCommand:
        case ActionKind::LaunchProgram:
            outcome.type = NavigatorOutcomeType::Dispatch;
            outcome.slot = *slot;
            outcome.path = highlighted_path();
            reset();
            break;
    }
    return outcome;
}

void WheelNavigator::push_wheel(const WheelConfig* wheel, int64_t time_ms) {
    NavigationFrame frame;
    frame.wheel = wheel;
    frame.origin = m_cursor;
    frame.hover_since_ms = time_ms;
    m_stack.push_back(frame);
}

void WheelNavigator::pop_wheel(int64_t time_ms) {
    m_stack.pop_back();
    m_stack.back().highlighted.reset();
    m_stack.back().hover_since_ms = time_ms;
}

const SlotConfig* WheelNavigator::highlighted_slot() const {
    if (m_stack.empty()) {
        return nullptr;
    }

    const NavigationFrame& top = m_stack.back();
    if (!top.wheel || !top.highlighted.has_value()) {
        return nullptr;
    }
    return &top.wheel->slots[*top.highlighted];
}
