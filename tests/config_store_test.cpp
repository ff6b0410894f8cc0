#include "platform/config_store.hpp"

#include <cassert>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace {
std::string eight_slots(const std::string& first) {
    std::string out = "[" + first;
    for (int i = 1; i < kSlotCount; ++i) {
        out += ", null";
    }
    return out + "]";
}

std::string with_root(const std::string& slots, const std::string& extra = "") {
    return "{" + extra + "\"root\": {\"slots\": " + slots + "}}";
}
}

int main() {
    {
        ConfigLoadResult result = ConfigStore::parse(with_root(eight_slots("null")));
        assert(result.success);
        const AppConfig& config = result.config;
        assert((config.hotkey.hold_keys == std::vector<std::string>{"Super", "Alt"}));
        assert(config.hotkey.cancel_key == "Escape");
        assert(config.geometry.dead_zone_radius == 50.0);
        assert(config.geometry.wheel_radius == 180.0);
        assert(config.geometry.start_angle == -90.0);
        assert(config.folder_policy == FolderPolicy::CommitOnRelease);
        assert(config.folder_dwell_ms == 400);
        assert(config.keystroke_delay_ms == 150);
        assert(config.root);
        for (const auto& slot : config.root->slots) {
            assert(slot.kind == ActionKind::Empty);
        }
    }

    {
        const std::string json = R"({
            "hotkey": {"hold": ["Ctrl", "space"], "cancel": "q"},
            "geometry": {"dead_zone_radius": 20, "wheel_radius": 240.5, "start_angle": 0},
            "folder_policy": "dwell",
            "folder_dwell_ms": 250,
            "keystroke_delay_ms": 0,
            "root": {"slots": [
                {"label": "Hi", "type": "command", "value": "notify-send hi"},
                {"type": "keystroke", "value": "Ctrl+C"},
                {"label": "Editor", "type": "launch", "value": "gedit", "args": ["--new-window", "/tmp/x"]},
                {"label": "Tools", "type": "folder", "slots": [
                    null, {"type": "back"}, null, null, null,
                    {"type": "command", "value": "true"}, null, null
                ]},
                {"label": "More", "type": "folder"},
                {"label": "Unused", "type": null},
                null,
                {}
            ]}
        })";
        ConfigLoadResult result = ConfigStore::parse(json);
        assert(result.success);
        const AppConfig& config = result.config;
        assert((config.hotkey.hold_keys == std::vector<std::string>{"Ctrl", "space"}));
        assert(config.hotkey.cancel_key == "q");
        assert(config.geometry.dead_zone_radius == 20.0);
        assert(config.geometry.wheel_radius == 240.5);
        assert(config.geometry.start_angle == 0.0);
        assert(config.folder_policy == FolderPolicy::OpenOnDwell);
        assert(config.folder_dwell_ms == 250);
        assert(config.keystroke_delay_ms == 0);

        const auto& slots = config.root->slots;
        assert(slots[0].kind == ActionKind::ShellCommand && slots[0].label == "Hi");
        assert(slots[1].kind == ActionKind::Keystroke && slots[1].value == "Ctrl+C");
        assert(slots[2].kind == ActionKind::LaunchProgram);
        assert((slots[2].args == std::vector<std::string>{"--new-window", "/tmp/x"}));
        assert(slots[3].kind == ActionKind::Folder && slots[3].folder);
        assert(slots[3].folder->slots[1].kind == ActionKind::Back);
        assert(slots[3].folder->slots[5].value == "true");
        // A folder without slots gets a fresh wheel with a way back.
        assert(slots[4].folder && slots[4].folder->slots[1].kind == ActionKind::Back);
        assert(slots[5].kind == ActionKind::Empty && slots[5].label == "Unused");
        assert(slots[6].kind == ActionKind::Empty);
        assert(slots[7].kind == ActionKind::Empty);
    }

    {
        ConfigLoadResult result = ConfigStore::parse("{not json");
        assert(!result.success);
        assert(!result.error.empty());

        result = ConfigStore::parse("[1, 2]");
        assert(!result.success);

        result = ConfigStore::parse("{}");
        assert(!result.success);
        assert(result.error == "root: missing");

        result = ConfigStore::parse(with_root("[null, null, null, null, null, null, null]"));
        assert(!result.success);
        assert(result.error == "root.slots: expected 8 slots, found 7");

        result = ConfigStore::parse(with_root(eight_slots(R"({"type": "script", "value": "x"})")));
        assert(!result.success);
        assert(result.error == "root.slots[0].type: unknown action type \"script\"");

        result = ConfigStore::parse(with_root(eight_slots(R"({"type": "command"})")));
        assert(!result.success);
        assert(result.error == "slot 0: command needs a value");

        result = ConfigStore::parse(with_root(eight_slots(R"({"type": "keystroke", "value": "Ctrl+a+b"})")));
        assert(!result.success);
        assert(result.error.find("slot 0: invalid key combination") == 0);

        result = ConfigStore::parse(with_root(eight_slots(R"({"type": "folder", "slots": [null]})")));
        assert(!result.success);
        assert(result.error == "root.slots[0].slots: expected 8 slots, found 1");

        result = ConfigStore::parse(with_root(eight_slots("null"), R"("folder_policy": "hover", )"));
        assert(!result.success);
        assert(result.error.find("folder_policy") == 0);

        result = ConfigStore::parse(with_root(eight_slots("null"), R"("geometry": {"wheel_radius": "big"}, )"));
        assert(!result.success);
        assert(result.error == "geometry.wheel_radius: expected a number");

        result = ConfigStore::parse(with_root(eight_slots("null"), R"("geometry": {"dead_zone_radius": -1}, )"));
        assert(!result.success);

        result = ConfigStore::parse(with_root(eight_slots("null"), R"("hotkey": {"hold": []}, )"));
        assert(!result.success);
        assert(result.error == "hotkey.hold: needs at least one key");

        result = ConfigStore::parse(with_root(eight_slots("null"), R"("keystroke_delay_ms": -5, )"));
        assert(!result.success);

        result = ConfigStore::parse(with_root(eight_slots("null"), R"("keystroke_delay_ms": 1e19, )"));
        assert(!result.success);
        assert(result.error == "keystroke_delay_ms: must be at most 3600000");

        result = ConfigStore::parse(with_root(eight_slots("null"), R"("folder_dwell_ms": 3600001, )"));
        assert(!result.success);
        assert(result.error == "folder_dwell_ms: must be at most 3600000");

        result = ConfigStore::parse(with_root(eight_slots("null"), R"("folder_dwell_ms": 3600000, )"));
        assert(result.success);
        assert(result.config.folder_dwell_ms == 3600000);
    }

    {
        // Written files load back unchanged.
        AppConfig config = ConfigStore::default_config();
        config.geometry.wheel_radius = 200.0;
        config.folder_policy = FolderPolicy::OpenOnDwell;
        config.root->slots[0].kind = ActionKind::LaunchProgram;
        config.root->slots[0].value = "firefox";
        config.root->slots[0].args = {"--private-window"};
        config.root->slots[6].kind = ActionKind::Folder;
        config.root->slots[6].label = "Media";
        config.root->slots[6].folder = std::make_shared<WheelConfig>();
        config.root->slots[6].folder->slots[1].kind = ActionKind::Back;
        config.root->slots[6].folder->slots[2].kind = ActionKind::Keystroke;
        config.root->slots[6].folder->slots[2].value = "XF86AudioPlay";

        const std::filesystem::path dir =
            std::filesystem::temp_directory_path() / ("quick-wheel-config-test-" + std::to_string(::getpid()));
        const std::string path = (dir / "nested" / "config.json").string();

        std::string error;
        assert(ConfigStore::save(path, config, error));

        ConfigLoadResult loaded = ConfigStore::load(path);
        assert(loaded.success);
        assert(loaded.config.geometry.wheel_radius == 200.0);
        assert(loaded.config.folder_policy == FolderPolicy::OpenOnDwell);
        assert(loaded.config.root->slots[0].value == "firefox");
        assert((loaded.config.root->slots[0].args == std::vector<std::string>{"--private-window"}));
        const auto& media = loaded.config.root->slots[6];
        assert(media.label == "Media" && media.folder);
        assert(media.folder->slots[1].kind == ActionKind::Back);
        assert(media.folder->slots[2].value == "XF86AudioPlay");

        std::filesystem::remove_all(dir);
    }

    {
        ConfigLoadResult result = ConfigStore::load("/nonexistent/quick-access-wheel/config.json");
        assert(!result.success);
        assert(result.error.find("Could not open") == 0);

        assert(ConfigStore::default_path().find("quick-access-wheel/config.json") != std::string::npos);
    }

    return 0;
}
