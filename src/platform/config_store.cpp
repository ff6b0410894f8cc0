#include "platform/config_store.hpp"

#include "core/wheel_tree.hpp"

#include <glibmm.h>
#include <json-glib/json-glib.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace {
// One hour.
constexpr int64_t kMaxMilliseconds = 3600000;

std::string member_path(const std::string& where, const char* member) {
    return where.empty() ? member : where + "." + member;
}

bool read_number(JsonObject* obj, const char* member, const std::string& where, double& out, std::string& error) {
    if (!json_object_has_member(obj, member)) {
        return true;
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (node && JSON_NODE_HOLDS_VALUE(node)) {
        GType type = json_node_get_value_type(node);
        if (type == G_TYPE_DOUBLE) {
            out = json_node_get_double(node);
            return true;
        }
        if (type == G_TYPE_INT64) {
            out = static_cast<double>(json_node_get_int(node));
            return true;
        }
    }

    error = member_path(where, member) + ": expected a number";
    return false;
}

bool read_milliseconds(JsonObject* obj, const char* member, int64_t& out, std::string& error) {
    double value = static_cast<double>(out);
    if (!read_number(obj, member, "", value, error)) {
        return false;
    }
    if (value < 0.0) {
        error = std::string(member) + ": must not be negative";
        return false;
    }
    if (value > static_cast<double>(kMaxMilliseconds)) {
        error = std::string(member) + ": must be at most " + std::to_string(kMaxMilliseconds);
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

bool read_string(JsonObject* obj, const char* member, const std::string& where, std::string& out,
                 std::string& error) {
    if (!json_object_has_member(obj, member)) {
        return true;
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || JSON_NODE_HOLDS_NULL(node)) {
        out.clear();
        return true;
    }
    if (JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == G_TYPE_STRING) {
        out = json_node_get_string(node);
        return true;
    }

    error = member_path(where, member) + ": expected a string";
    return false;
}

bool read_string_array(JsonObject* obj, const char* member, const std::string& where,
                       std::vector<std::string>& out, std::string& error) {
    if (!json_object_has_member(obj, member)) {
        return true;
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_ARRAY(node)) {
        error = member_path(where, member) + ": expected an array of strings";
        return false;
    }

    JsonArray* array = json_node_get_array(node);
    guint length = json_array_get_length(array);
    std::vector<std::string> values;
    for (guint i = 0; i < length; ++i) {
        JsonNode* element = json_array_get_element(array, i);
        if (!element || !JSON_NODE_HOLDS_VALUE(element) || json_node_get_value_type(element) != G_TYPE_STRING) {
            error = member_path(where, member) + "[" + std::to_string(i) + "]: expected a string";
            return false;
        }
        values.push_back(json_node_get_string(element));
    }
    out = std::move(values);
    return true;
}

JsonObject* optional_object(JsonObject* obj, const char* member, std::string& error) {
    if (!json_object_has_member(obj, member)) {
        return nullptr;
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_OBJECT(node)) {
        error = std::string(member) + ": expected an object";
        return nullptr;
    }
    return json_node_get_object(node);
}

bool read_wheel(JsonObject* owner, const std::string& where, WheelConfig& wheel, std::string& error);

bool read_slot(JsonObject* obj, const std::string& where, SlotConfig& slot, std::string& error) {
    if (!read_string(obj, "label", where, slot.label, error)) {
        return false;
    }

    std::string type;
    if (!read_string(obj, "type", where, type, error)) {
        return false;
    }
    if (!wheel_tree::kind_from_name(type, slot.kind)) {
        error = where + ".type: unknown action type \"" + type + "\"";
        return false;
    }

    switch (slot.kind) {
        case ActionKind::Empty:
        case ActionKind::Back:
            break;
        case ActionKind::Keystroke:
        case ActionKind::ShellCommand:
            return read_string(obj, "value", where, slot.value, error);
        case ActionKind::LaunchProgram:
            return read_string(obj, "value", where, slot.value, error) &&
                   read_string_array(obj, "args", where, slot.args, error);
        case ActionKind::Folder:
            if (!json_object_has_member(obj, "slots")) {
                slot.folder = wheel_tree::make_folder_wheel();
                return true;
            }
            slot.folder = wheel_tree::make_empty_wheel();
            return read_wheel(obj, where, *slot.folder, error);
    }
    return true;
}

bool read_wheel(JsonObject* owner, const std::string& where, WheelConfig& wheel, std::string& error) {
    const std::string slots_where = where + ".slots";
    JsonNode* node = json_object_get_member(owner, "slots");
    if (!node || !JSON_NODE_HOLDS_ARRAY(node)) {
        error = slots_where + ": expected an array";
        return false;
    }

    JsonArray* array = json_node_get_array(node);
    guint length = json_array_get_length(array);
    if (length != static_cast<guint>(kSlotCount)) {
        error = slots_where + ": expected " + std::to_string(kSlotCount) + " slots, found " +
                std::to_string(length);
        return false;
    }

    for (guint i = 0; i < length; ++i) {
        const std::string slot_where = slots_where + "[" + std::to_string(i) + "]";
        JsonNode* element = json_array_get_element(array, i);
        if (!element || JSON_NODE_HOLDS_NULL(element)) {
            continue;
        }
        if (!JSON_NODE_HOLDS_OBJECT(element)) {
            error = slot_where + ": expected an object";
            return false;
        }
        if (!read_slot(json_node_get_object(element), slot_where, wheel.slots[i], error)) {
            return false;
        }
    }
    return true;
}

bool read_config(JsonObject* obj, AppConfig& config, std::string& error) {
    JsonObject* hotkey = optional_object(obj, "hotkey", error);
    if (!error.empty()) {
        return false;
    }
    if (hotkey) {
        if (!read_string_array(hotkey, "hold", "hotkey", config.hotkey.hold_keys, error) ||
            !read_string(hotkey, "cancel", "hotkey", config.hotkey.cancel_key, error)) {
            return false;
        }
        if (config.hotkey.hold_keys.empty()) {
            error = "hotkey.hold: needs at least one key";
            return false;
        }
    }

    JsonObject* geometry = optional_object(obj, "geometry", error);
    if (!error.empty()) {
        return false;
    }
    if (geometry) {
        if (!read_number(geometry, "dead_zone_radius", "geometry", config.geometry.dead_zone_radius, error) ||
            !read_number(geometry, "wheel_radius", "geometry", config.geometry.wheel_radius, error) ||
            !read_number(geometry, "start_angle", "geometry", config.geometry.start_angle, error)) {
            return false;
        }
        if (config.geometry.dead_zone_radius < 0.0 || config.geometry.wheel_radius < 0.0) {
            error = "geometry: radii must not be negative";
            return false;
        }
    }

    std::string policy = "release";
    if (!read_string(obj, "folder_policy", "", policy, error)) {
        return false;
    }
    if (policy == "release") {
        config.folder_policy = FolderPolicy::CommitOnRelease;
    } else if (policy == "dwell") {
        config.folder_policy = FolderPolicy::OpenOnDwell;
    } else {
        error = "folder_policy: expected \"release\" or \"dwell\", found \"" + policy + "\"";
        return false;
    }

    if (!read_milliseconds(obj, "folder_dwell_ms", config.folder_dwell_ms, error) ||
        !read_milliseconds(obj, "keystroke_delay_ms", config.keystroke_delay_ms, error)) {
        return false;
    }

    JsonObject* root = optional_object(obj, "root", error);
    if (!root) {
        if (error.empty()) {
            error = "root: missing";
        }
        return false;
    }

    config.root = wheel_tree::make_empty_wheel();
    if (!read_wheel(root, "root", *config.root, error)) {
        return false;
    }
    return wheel_tree::validate(*config.root, error);
}

void write_wheel(JsonBuilder* builder, const WheelConfig& wheel);

void write_slot(JsonBuilder* builder, const SlotConfig& slot) {
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "label");
    json_builder_add_string_value(builder, slot.label.c_str());

    json_builder_set_member_name(builder, "type");
    if (slot.kind == ActionKind::Empty) {
        json_builder_add_null_value(builder);
    } else {
        json_builder_add_string_value(builder, wheel_tree::kind_name(slot.kind).c_str());
    }

    switch (slot.kind) {
        case ActionKind::Empty:
        case ActionKind::Back:
            break;
        case ActionKind::Keystroke:
        case ActionKind::ShellCommand:
            json_builder_set_member_name(builder, "value");
            json_builder_add_string_value(builder, slot.value.c_str());
            break;
        case ActionKind::LaunchProgram:
            json_builder_set_member_name(builder, "value");
            json_builder_add_string_value(builder, slot.value.c_str());
            if (!slot.args.empty()) {
                json_builder_set_member_name(builder, "args");
                json_builder_begin_array(builder);
                for (const auto& arg : slot.args) {
                    json_builder_add_string_value(builder, arg.c_str());
                }
                json_builder_end_array(builder);
            }
            break;
        case ActionKind::Folder:
            if (slot.folder) {
                write_wheel(builder, *slot.folder);
            }
            break;
    }
    json_builder_end_object(builder);
}

// Adds the "slots" member to the object being built.
void write_wheel(JsonBuilder* builder, const WheelConfig& wheel) {
    json_builder_set_member_name(builder, "slots");
    json_builder_begin_array(builder);
    for (const auto& slot : wheel.slots) {
        write_slot(builder, slot);
    }
    json_builder_end_array(builder);
}
}  // namespace

std::string ConfigStore::default_path() {
    return Glib::build_filename(Glib::get_user_config_dir(), "quick-access-wheel", "config.json");
}

AppConfig ConfigStore::default_config() {
    AppConfig config;
    config.root = wheel_tree::make_empty_wheel();
    return config;
}

ConfigLoadResult ConfigStore::load(const std::string& path) {
    std::ifstream inFile(path);
    if (!inFile.is_open()) {
        ConfigLoadResult result;
        result.error = "Could not open config file for reading: " + path;
        return result;
    }

    std::stringstream buffer;
    buffer << inFile.rdbuf();
    ConfigLoadResult result = parse(buffer.str());
    if (!result.success) {
        result.error = path + ": " + result.error;
    }
    return result;
}

ConfigLoadResult ConfigStore::parse(const std::string& json) {
    ConfigLoadResult result;
    result.config = default_config();

    GError* error = nullptr;
    JsonParser* parser = json_parser_new();
    bool parsed = json_parser_load_from_data(parser, json.c_str(), -1, &error);
    if (!parsed) {
        result.error = error ? error->message : "invalid JSON";
        if (error) {
            g_error_free(error);
        }
        g_object_unref(parser);
        return result;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        result.error = "expected a JSON object at the top level";
        g_object_unref(parser);
        return result;
    }

    result.success = read_config(json_node_get_object(root), result.config, result.error);
    g_object_unref(parser);
    return result;
}

bool ConfigStore::save(const std::string& path, const AppConfig& config, std::string& error) {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = "Could not create " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream outFile(path);
    if (!outFile.is_open()) {
        error = "Could not open config file for writing: " + path;
        return false;
    }
    outFile << serialize(config) << '\n';
    if (!outFile.good()) {
        error = "Failed writing config file: " + path;
        return false;
    }
    return true;
}

std::string ConfigStore::serialize(const AppConfig& config) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "hotkey");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "hold");
    json_builder_begin_array(builder);
    for (const auto& key : config.hotkey.hold_keys) {
        json_builder_add_string_value(builder, key.c_str());
    }
    json_builder_end_array(builder);
    json_builder_set_member_name(builder, "cancel");
    json_builder_add_string_value(builder, config.hotkey.cancel_key.c_str());
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "geometry");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "dead_zone_radius");
    json_builder_add_double_value(builder, config.geometry.dead_zone_radius);
    json_builder_set_member_name(builder, "wheel_radius");
    json_builder_add_double_value(builder, config.geometry.wheel_radius);
    json_builder_set_member_name(builder, "start_angle");
    json_builder_add_double_value(builder, config.geometry.start_angle);
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "folder_policy");
    json_builder_add_string_value(builder,
                                  config.folder_policy == FolderPolicy::OpenOnDwell ? "dwell" : "release");
    json_builder_set_member_name(builder, "folder_dwell_ms");
    json_builder_add_int_value(builder, config.folder_dwell_ms);
    json_builder_set_member_name(builder, "keystroke_delay_ms");
    json_builder_add_int_value(builder, config.keystroke_delay_ms);

    json_builder_set_member_name(builder, "root");
    json_builder_begin_object(builder);
    if (config.root) {
        write_wheel(builder, *config.root);
    } else {
        write_wheel(builder, WheelConfig());
    }
    json_builder_end_object(builder);

    json_builder_end_object(builder);

    JsonNode* root = json_builder_get_root(builder);
    JsonGenerator* generator = json_generator_new();
    json_generator_set_pretty(generator, TRUE);
    json_generator_set_root(generator, root);
    gchar* text = json_generator_to_data(generator, nullptr);
    std::string out = text ? text : "";

    g_free(text);
    json_node_free(root);
    g_object_unref(generator);
    g_object_unref(builder);
    return out;
}
