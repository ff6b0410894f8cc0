#include "core/wheel_tree.hpp"

#include "core/key_combo.hpp"

namespace {
// Top-right with the default start angle.
constexpr int kFolderBackSlot = 1;

bool validate_wheel(const WheelConfig& wheel, std::vector<int>& path, std::string& error) {
    for (int i = 0; i < kSlotCount; ++i) {
        const SlotConfig& slot = wheel.slots[i];
        path.push_back(i);

        switch (slot.kind) {
            case ActionKind::Empty:
            case ActionKind::Back:
                break;
            case ActionKind::Keystroke:
                if (!parse_key_combo(slot.value).has_value()) {
                    error = "slot " + wheel_tree::format_path(path) + ": invalid key combination \"" +
                            slot.value + "\"";
                    return false;
                }
                break;
            case ActionKind::ShellCommand:
            case ActionKind::LaunchProgram:
                if (slot.value.empty()) {
                    error = "slot " + wheel_tree::format_path(path) + ": " + wheel_tree::kind_name(slot.kind) +
                            " needs a value";
                    return false;
                }
                break;
            case ActionKind::Folder:
                if (!slot.folder) {
                    error = "slot " + wheel_tree::format_path(path) + ": folder has no wheel";
                    return false;
                }
                if (!validate_wheel(*slot.folder, path, error)) {
                    return false;
                }
                break;
        }

        path.pop_back();
    }
    return true;
}
}  // namespace

std::shared_ptr<WheelConfig> wheel_tree::make_empty_wheel() {
    return std::make_shared<WheelConfig>();
}

std::shared_ptr<WheelConfig> wheel_tree::make_folder_wheel() {
    auto wheel = make_empty_wheel();
    wheel->slots[kFolderBackSlot].label = "Back";
    wheel->slots[kFolderBackSlot].kind = ActionKind::Back;
    return wheel;
}

const WheelConfig* wheel_tree::wheel_at_path(const WheelConfig& root, const std::vector<int>& path) {
    const WheelConfig* wheel = &root;
    for (int index : path) {
        if (index < 0 || index >= kSlotCount) {
            return nullptr;
        }
        const SlotConfig& slot = wheel->slots[index];
        if (slot.kind != ActionKind::Folder || !slot.folder) {
            return nullptr;
        }
        wheel = slot.folder.get();
    }
    return wheel;
}

const SlotConfig* wheel_tree::slot_at_path(const WheelConfig& root, const std::vector<int>& path) {
    if (path.empty()) {
        return nullptr;
    }

    std::vector<int> parent(path.begin(), path.end() - 1);
    const WheelConfig* wheel = wheel_at_path(root, parent);
    int index = path.back();
    if (!wheel || index < 0 || index >= kSlotCount) {
        return nullptr;
    }
    return &wheel->slots[index];
}

std::string wheel_tree::kind_name(ActionKind kind) {
    switch (kind) {
        case ActionKind::Empty: return "empty";
        case ActionKind::Keystroke: return "keystroke";
        case ActionKind::ShellCommand: return "command";
        case ActionKind::LaunchProgram: return "launch";
        case ActionKind::Folder: return "folder";
        case ActionKind::Back: return "back";
    }
    return "empty";
}

bool wheel_tree::kind_from_name(const std::string& name, ActionKind& kind) {
    if (name.empty() || name == "empty") {
        kind = ActionKind::Empty;
    } else if (name == "keystroke") {
        kind = ActionKind::Keystroke;
    } else if (name == "command") {
        kind = ActionKind::ShellCommand;
    } else if (name == "launch") {
        kind = ActionKind::LaunchProgram;
    } else if (name == "folder") {
        kind = ActionKind::Folder;
    } else if (name == "back") {
        kind = ActionKind::Back;
    } else {
        return false;
    }
    return true;
}

std::string wheel_tree::display_label(const SlotConfig& slot) {
    if (!slot.label.empty()) {
        return slot.label;
    }

    switch (slot.kind) {
        case ActionKind::Empty: return "Select to add action";
        case ActionKind::Back: return "Back";
        case ActionKind::Folder: return "Folder";
        default: return slot.value;
    }
}

std::string wheel_tree::format_path(const std::vector<int>& path) {
    if (path.empty()) {
        return "root";
    }

    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            out += '/';
        }
        out += std::to_string(path[i]);
    }
    return out;
}

bool wheel_tree::validate(const WheelConfig& root, std::string& error) {
    std::vector<int> path;
    return validate_wheel(root, path, error);
}
