#include "wheel_application.hpp"

#include "core/wheel_tree.hpp"
#include "platform/config_store.hpp"

#include <glib-unix.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <utility>

namespace {
constexpr unsigned int kTickIntervalMs = 50;

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}
}

Glib::RefPtr<WheelApplication> WheelApplication::create(std::string config_path)
{
    return Glib::make_refptr_for_instance<WheelApplication>(new WheelApplication(std::move(config_path)));
}

WheelApplication::WheelApplication(std::string config_path)
    : Gtk::Application("io.github.quick_access_wheel"),
      m_ConfigPath(std::move(config_path))
{
}

WheelApplication::~WheelApplication()
{
    m_InputSource.stop();
}

bool WheelApplication::prepare(std::string& error)
{
    AppConfig config;
    if (!load_initial_config(config, error)) {
        return false;
    }

    if (!m_Keystrokes.open(error)) {
        return false;
    }

    m_ActionDispatcher = std::make_unique<ActionDispatcher>(m_Keystrokes, config.keystroke_delay_ms);
    m_ActionDispatcher->set_failure_handler([this](const std::string& message) {
        send_desktop_notification("launch-failure", "Action failed", message);
    });

    WheelController::Hooks hooks;
    hooks.on_state_changed = [this]() { on_state_changed(); };
    hooks.on_session_changed = [this](bool open) { on_session_changed(open); };
    hooks.on_open_config_editor = [this](const std::vector<int>& path) { on_open_config_editor(path); };
    hooks.on_launch_failure = [this](const std::string& message) {
        send_desktop_notification("launch-failure", "Action failed", message);
    };
    m_Controller = std::make_unique<WheelController>(std::move(config), *m_ActionDispatcher, hooks);

    m_Wakeup = std::make_unique<Glib::Dispatcher>();
    m_Wakeup->connect([this]() { m_Controller->process_pending(); });
    m_Controller->queue().set_wakeup([this]() { m_Wakeup->emit(); });

    InputSource::Callbacks callbacks;
    callbacks.on_key = [this](const std::string& keysym, bool pressed, const Point& pointer, int64_t time_ms) {
        m_Controller->on_key(keysym, pressed, pointer, time_ms);
    };
    callbacks.on_pointer = [this](const Point& pointer, int64_t time_ms) {
        m_Controller->on_pointer(pointer, time_ms);
    };
    if (!m_InputSource.start(callbacks, error)) {
        return false;
    }

    watch_config_file();

    std::string hold;
    for (const auto& key : m_Controller->config().hotkey.hold_keys) {
        hold += hold.empty() ? key : "+" + key;
    }
    std::cout << "Hold " << hold << " to open the wheel (config: " << m_ConfigPath << ")\n";
    return true;
}

void WheelApplication::on_activate()
{
    if (m_Overlay) {
        return;
    }

    m_Overlay = std::make_unique<ui::WheelOverlay>();
    m_Overlay->set_geometry(m_Controller->config().geometry);
    add_window(*m_Overlay);
    hold();

    m_SignalSources.push_back(g_unix_signal_add(SIGINT, &WheelApplication::on_unix_signal, this));
    m_SignalSources.push_back(g_unix_signal_add(SIGTERM, &WheelApplication::on_unix_signal, this));
}

void WheelApplication::on_shutdown()
{
    m_InputSource.stop();
    m_TickConnection.disconnect();
    if (m_Controller) {
        m_Controller->shutdown();
    }
    for (guint source : m_SignalSources) {
        g_source_remove(source);
    }
    m_SignalSources.clear();
    if (m_ConfigMonitor) {
        m_ConfigMonitor->cancel();
    }
    if (m_Overlay) {
        m_Overlay->hide_overlay();
        remove_window(*m_Overlay);
    }

    Gtk::Application::on_shutdown();
}

bool WheelApplication::load_initial_config(AppConfig& config, std::string& error)
{
    if (!std::filesystem::exists(m_ConfigPath)) {
        config = ConfigStore::default_config();
        std::string save_error;
        if (ConfigStore::save(m_ConfigPath, config, save_error)) {
            std::cout << "Created default configuration at " << m_ConfigPath << '\n';
        } else {
            std::cerr << "Warning: " << save_error << '\n';
        }
        return true;
    }

    ConfigLoadResult result = ConfigStore::load(m_ConfigPath);
    if (!result.success) {
        error = "Invalid configuration: " + result.error;
        return false;
    }
    config = std::move(result.config);
    return true;
}

void WheelApplication::watch_config_file()
{
    try {
        m_ConfigMonitor = Gio::File::create_for_path(m_ConfigPath)->monitor_file();
    } catch (const Glib::Error& e) {
        std::cerr << "Warning: not watching " << m_ConfigPath << ": " << e.what() << '\n';
        return;
    }

    m_ConfigMonitor->signal_changed().connect(
        [this](const Glib::RefPtr<Gio::File>&, const Glib::RefPtr<Gio::File>&, Gio::FileMonitor::Event event) {
            if (event == Gio::FileMonitor::Event::CHANGES_DONE_HINT || event == Gio::FileMonitor::Event::CREATED) {
                reload_config();
            }
        });
}

void WheelApplication::reload_config()
{
    ConfigLoadResult result = ConfigStore::load(m_ConfigPath);
    if (!result.success) {
        std::cerr << "Config reload failed, keeping previous configuration: " << result.error << '\n';
        return;
    }

    m_ActionDispatcher->set_keystroke_delay(result.config.keystroke_delay_ms);
    m_Controller->replace_config(std::move(result.config));
    std::cout << "Reloaded configuration from " << m_ConfigPath << '\n';
}

void WheelApplication::on_state_changed()
{
    if (!m_Overlay) {
        return;
    }

    const WheelNavigator& navigator = m_Controller->navigator();
    if (!navigator.is_open()) {
        m_Overlay->hide_overlay();
        return;
    }
    m_Overlay->set_geometry(m_Controller->config().geometry);
    m_Overlay->show_frames(navigator.stack());
}

void WheelApplication::on_session_changed(bool open)
{
    m_InputSource.set_pointer_sampling(open);

    if (!open) {
        m_TickConnection.disconnect();
        return;
    }

    if (!m_TickConnection.connected()) {
        m_TickConnection = Glib::signal_timeout().connect(
            [this]() {
                m_Controller->post(InputEvent::tick(now_ms()));
                return true;
            },
            kTickIntervalMs);
    }
}

void WheelApplication::on_open_config_editor(const std::vector<int>& path)
{
    const std::string where = wheel_tree::format_path(path);
    std::cout << "Slot " << where << " has no action; edit " << m_ConfigPath << " to assign one\n";
    send_desktop_notification("configure-slot", "Slot " + where + " is empty",
                              "Assign an action in " + m_ConfigPath);
}

void WheelApplication::send_desktop_notification(const std::string& id, const std::string& title,
                                                 const std::string& body)
{
    auto notification = Gio::Notification::create(title);
    notification->set_body(body);
    send_notification(id, notification);
}

gboolean WheelApplication::on_unix_signal(gpointer data)
{
    auto* self = static_cast<WheelApplication*>(data);
    std::cout << "Shutting down\n";
    if (self->m_Controller) {
        self->m_Controller->shutdown();
    }
    self->quit();
    return G_SOURCE_CONTINUE;
}
