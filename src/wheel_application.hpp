#ifndef WHEEL_APPLICATION_HPP
#define WHEEL_APPLICATION_HPP

#include "features/wheel_controller.hpp"
#include "platform/action_dispatcher.hpp"
#include "platform/x11_input.hpp"
#include "ui/wheel_overlay.hpp"

#include <gtkmm.h>

#include <memory>
#include <string>
#include <vector>

class WheelApplication : public Gtk::Application
{
public:
    static Glib::RefPtr<WheelApplication> create(std::string config_path);
    ~WheelApplication() override;

    // Loads the configuration and connects to the X server. Must succeed
    // before run().
    bool prepare(std::string& error);

protected:
    explicit WheelApplication(std::string config_path);

    void on_activate() override;
    void on_shutdown() override;

private:
    bool load_initial_config(AppConfig& config, std::string& error);
    void watch_config_file();
    void reload_config();

    void on_state_changed();
    void on_session_changed(bool open);
    void on_open_config_editor(const std::vector<int>& path);
    void send_desktop_notification(const std::string& id, const std::string& title, const std::string& body);

    static gboolean on_unix_signal(gpointer data);

    std::string m_ConfigPath;

    X11InputSource m_InputSource;
    X11KeystrokeSynthesizer m_Keystrokes;
    std::unique_ptr<ActionDispatcher> m_ActionDispatcher;
    std::unique_ptr<WheelController> m_Controller;
    std::unique_ptr<Glib::Dispatcher> m_Wakeup;
    std::unique_ptr<ui::WheelOverlay> m_Overlay;

    Glib::RefPtr<Gio::FileMonitor> m_ConfigMonitor;
    sigc::connection m_TickConnection;
    std::vector<guint> m_SignalSources;
};

#endif
