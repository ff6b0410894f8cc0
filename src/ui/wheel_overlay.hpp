#ifndef UI_WHEEL_OVERLAY_HPP
#define UI_WHEEL_OVERLAY_HPP

#include "core/models.hpp"
#include "core/wheel_navigator.hpp"

#include <gtkmm.h>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace ui {

// Snapshot of one navigation level, copied out of the tree so drawing never
// touches configuration that may be replaced later.
struct FrameView {
    Point origin;
    std::array<std::string, kSlotCount> labels;
    std::array<ActionKind, kSlotCount> kinds{};
    std::optional<int> highlighted;
};

// Fullscreen transparent window that draws the open wheels. It never takes
// input; the pointer and keyboard stay with whatever is underneath.
class WheelOverlay : public Gtk::Window
{
public:
    WheelOverlay();

    void set_geometry(const GeometryConfig& geometry);
    void show_frames(const std::vector<NavigationFrame>& stack);
    void hide_overlay();

protected:
    void on_draw(const Cairo::RefPtr<Cairo::Context>& cr, int width, int height);
    void draw_wheel(const Cairo::RefPtr<Cairo::Context>& cr, const FrameView& frame);
    void draw_label(const Cairo::RefPtr<Cairo::Context>& cr, double x, double y, const std::string& text,
                    bool unset);

    Gtk::DrawingArea m_Area;
    GeometryConfig m_Geometry;
    std::vector<FrameView> m_Frames;
};

}

#endif
