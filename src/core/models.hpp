#ifndef CORE_MODELS_HPP
#define CORE_MODELS_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

constexpr int kSlotCount = 8;

struct Point {
    double x = 0.0;
    double y = 0.0;
};

enum class ActionKind {
    Empty,
    Keystroke,
    ShellCommand,
    LaunchProgram,
    Folder,
    Back,
};

struct WheelConfig;

struct SlotConfig {
    std::string label;
    ActionKind kind = ActionKind::Empty;
    // Key combo, shell command or program path depending on kind.
    std::string value;
    std::vector<std::string> args;
    std::shared_ptr<WheelConfig> folder;
};

// Slot index is the position in the array, clockwise from the start angle.
struct WheelConfig {
    std::array<SlotConfig, kSlotCount> slots;
};

enum class FolderPolicy {
    CommitOnRelease,
    OpenOnDwell,
};

struct HotkeyConfig {
    std::vector<std::string> hold_keys = {"Super", "Alt"};
    std::string cancel_key = "Escape";
};

struct GeometryConfig {
    double dead_zone_radius = 50.0;
    double wheel_radius = 180.0;
    double start_angle = -90.0;
};

struct AppConfig {
    HotkeyConfig hotkey;
    GeometryConfig geometry;
    FolderPolicy folder_policy = FolderPolicy::CommitOnRelease;
    int64_t folder_dwell_ms = 400;
    int64_t keystroke_delay_ms = 150;
    std::shared_ptr<WheelConfig> root;
};

#endif
