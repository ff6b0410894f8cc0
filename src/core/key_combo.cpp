#include "core/key_combo.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace {
std::string trim_copy(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
        ++start;
    }

    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }

    return value.substr(start, end - start);
}

std::string to_lower_ascii(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

const std::map<std::string, std::string>& modifier_keysyms() {
    static const std::map<std::string, std::string> table = {
        {"ctrl", "Control_L"}, {"control", "Control_L"},
        {"shift", "Shift_L"},
        {"alt", "Alt_L"},
        {"meta", "Super_L"}, {"super", "Super_L"}, {"win", "Super_L"},
    };
    return table;
}

const std::map<std::string, std::string>& named_keysyms() {
    static const std::map<std::string, std::string> table = {
        {"enter", "Return"}, {"return", "Return"},
        {"esc", "Escape"}, {"escape", "Escape"},
        {"space", "space"}, {"tab", "Tab"},
        {"backspace", "BackSpace"},
        {"del", "Delete"}, {"delete", "Delete"},
        {"ins", "Insert"}, {"insert", "Insert"},
        {"pgup", "Prior"}, {"pageup", "Prior"},
        {"pgdown", "Next"}, {"pgdn", "Next"}, {"pagedown", "Next"},
        {"home", "Home"}, {"end", "End"},
        {"left", "Left"}, {"right", "Right"}, {"up", "Up"}, {"down", "Down"},
        {"print", "Print"}, {"menu", "Menu"},
    };
    return table;
}

const std::map<char, std::string>& punctuation_keysyms() {
    static const std::map<char, std::string> table = {
        {'+', "plus"}, {'-', "minus"}, {'=', "equal"},
        {',', "comma"}, {'.', "period"}, {'/', "slash"}, {'\\', "backslash"},
        {';', "semicolon"}, {'\'', "apostrophe"}, {'`', "grave"},
        {'[', "bracketleft"}, {']', "bracketright"},
    };
    return table;
}

const std::map<std::string, std::string>& canonical_names() {
    static const std::map<std::string, std::string> table = {
        {"Shift_L", "Shift"}, {"Shift_R", "Shift"},
        {"Control_L", "Ctrl"}, {"Control_R", "Ctrl"}, {"Control", "Ctrl"},
        {"Alt_L", "Alt"}, {"Alt_R", "Alt"},
        {"Super_L", "Super"}, {"Super_R", "Super"}, {"Win", "Super"},
        {"Meta_L", "Meta"}, {"Meta_R", "Meta"},
        {"ISO_Level3_Shift", "AltGr"},
        {"Return", "Enter"}, {"BackSpace", "Backspace"}, {"Escape", "Esc"},
        {"space", "Space"}, {"Prior", "PgUp"}, {"Next", "PgDn"},
        {"Insert", "Ins"}, {"Delete", "Del"},
    };
    return table;
}

std::vector<std::string> split_combo(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (c == '+' && !trim_copy(current).empty()) {
            tokens.push_back(trim_copy(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!trim_copy(current).empty()) {
        tokens.push_back(trim_copy(current));
    }
    return tokens;
}

std::string key_token_to_keysym(const std::string& token) {
    if (token.size() == 1) {
        auto punct = punctuation_keysyms().find(token[0]);
        if (punct != punctuation_keysyms().end()) {
            return punct->second;
        }
        return to_lower_ascii(token);
    }

    auto named = named_keysyms().find(to_lower_ascii(token));
    if (named != named_keysyms().end()) {
        return named->second;
    }
    return token;
}
}  // namespace

std::optional<KeyCombo> parse_key_combo(const std::string& text) {
    KeyCombo combo;
    for (const auto& token : split_combo(text)) {
        auto modifier = modifier_keysyms().find(to_lower_ascii(token));
        if (modifier != modifier_keysyms().end()) {
            combo.modifiers.push_back(modifier->second);
            continue;
        }

        if (!combo.key.empty()) {
            return std::nullopt;
        }
        combo.key = key_token_to_keysym(token);
    }

    if (combo.modifiers.empty() && combo.key.empty()) {
        return std::nullopt;
    }
    return combo;
}

std::string keys::canonical_name(const std::string& keysym) {
    auto it = canonical_names().find(keysym);
    if (it != canonical_names().end()) {
        return it->second;
    }
    return keysym;
}

bool keys::same_key(const std::string& lhs, const std::string& rhs) {
    return to_lower_ascii(canonical_name(lhs)) == to_lower_ascii(canonical_name(rhs));
}
