#ifndef CORE_KEY_COMBO_HPP
#define CORE_KEY_COMBO_HPP

#include <optional>
#include <string>
#include <vector>

// Keys are X keysym names, e.g. {"Control_L", "Shift_L"} + "a".
struct KeyCombo {
    std::vector<std::string> modifiers;
    std::string key;
};

// Parses "Ctrl+Shift+A" style text. Returns nullopt for an empty combo or one
// naming more than one non-modifier key.
std::optional<KeyCombo> parse_key_combo(const std::string& text);

namespace keys {
// Maps left/right variants of a keysym to one name ("Super_R" -> "Super").
std::string canonical_name(const std::string& keysym);
bool same_key(const std::string& lhs, const std::string& rhs);
}

#endif
