#ifndef CORE_WHEEL_TREE_HPP
#define CORE_WHEEL_TREE_HPP

#include "core/models.hpp"

#include <memory>
#include <string>
#include <vector>

namespace wheel_tree {
std::shared_ptr<WheelConfig> make_empty_wheel();
std::shared_ptr<WheelConfig> make_folder_wheel();

const WheelConfig* wheel_at_path(const WheelConfig& root, const std::vector<int>& path);
const SlotConfig* slot_at_path(const WheelConfig& root, const std::vector<int>& path);

std::string kind_name(ActionKind kind);
bool kind_from_name(const std::string& name, ActionKind& kind);
std::string display_label(const SlotConfig& slot);
std::string format_path(const std::vector<int>& path);

// Checks the tree invariants; on failure fills error with the slot location.
bool validate(const WheelConfig& root, std::string& error);
}

#endif
