#include "ui/wheel_overlay.hpp"

#include "core/geometry.hpp"
#include "core/wheel_tree.hpp"
#include "ui/label_layout.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace {
const char* kOverlayCss = R"(
    window.wheel-overlay {
        background-color: transparent;
    }
)";

struct Rgba {
    double r;
    double g;
    double b;
    double a;

    void set_as_source(const Cairo::RefPtr<Cairo::Context>& cr) const {
        cr->set_source_rgba(r / 255.0, g / 255.0, b / 255.0, a / 255.0);
    }
};

constexpr Rgba kBackground{30, 30, 30, 220};
constexpr Rgba kSegment{50, 50, 55, 200};
constexpr Rgba kHover{80, 120, 200, 200};
constexpr Rgba kBorder{100, 100, 110, 180};
constexpr Rgba kText{220, 220, 220, 255};
constexpr Rgba kUnsetText{140, 140, 140, 255};
constexpr Rgba kBack{90, 60, 60, 200};

constexpr double kAncestorAlpha = 0.35;
constexpr double kFontSize = 12.0;
constexpr double kLineSpacing = 4.0;
}

namespace ui {

WheelOverlay::WheelOverlay()
{
    set_title("Quick Access Wheel");
    set_decorated(false);
    set_resizable(false);
    add_css_class("wheel-overlay");

    auto css_provider = Gtk::CssProvider::create();
    css_provider->load_from_data(kOverlayCss);
    auto display = Gdk::Display::get_default();
    if (display) {
        Gtk::StyleContext::add_provider_for_display(display, css_provider, GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
    } else {
        std::cerr << "Warning: No default display found for CSS!\n";
    }

    m_Area.set_draw_func(sigc::mem_fun(*this, &WheelOverlay::on_draw));
    m_Area.set_can_target(false);
    set_child(m_Area);

    // Pointer events pass through every pixel of the overlay.
    signal_realize().connect([this]() {
        auto surface = get_surface();
        if (surface) {
            surface->set_input_region(Cairo::Region::create());
        }
    });
}

void WheelOverlay::set_geometry(const GeometryConfig& geometry)
{
    m_Geometry = geometry;
    m_Area.queue_draw();
}

void WheelOverlay::show_frames(const std::vector<NavigationFrame>& stack)
{
    m_Frames.clear();
    for (const auto& frame : stack) {
        if (!frame.wheel) {
            continue;
        }
        FrameView view;
        view.origin = frame.origin;
        view.highlighted = frame.highlighted;
        for (int i = 0; i < kSlotCount; ++i) {
            const SlotConfig& slot = frame.wheel->slots[i];
            view.labels[i] = wheel_tree::display_label(slot);
            view.kinds[i] = slot.kind;
        }
        m_Frames.push_back(std::move(view));
    }

    if (m_Frames.empty()) {
        hide_overlay();
        return;
    }

    if (!get_visible()) {
        fullscreen();
        present();
    }
    m_Area.queue_draw();
}

void WheelOverlay::hide_overlay()
{
    m_Frames.clear();
    if (get_visible()) {
        set_visible(false);
    }
}

void WheelOverlay::on_draw(const Cairo::RefPtr<Cairo::Context>& cr, int, int)
{
    cr->save();
    cr->set_source_rgba(0, 0, 0, 0);
    cr->set_operator(Cairo::Context::Operator::SOURCE);
    cr->paint();
    cr->restore();

    for (size_t i = 0; i < m_Frames.size(); ++i) {
        const bool is_top = i + 1 == m_Frames.size();
        if (is_top) {
            draw_wheel(cr, m_Frames[i]);
            continue;
        }
        cr->push_group();
        draw_wheel(cr, m_Frames[i]);
        cr->pop_group_to_source();
        cr->paint_with_alpha(kAncestorAlpha);
    }
}

void WheelOverlay::draw_wheel(const Cairo::RefPtr<Cairo::Context>& cr, const FrameView& frame)
{
    const double cx = frame.origin.x;
    const double cy = frame.origin.y;
    const double outer_r = m_Geometry.wheel_radius;
    const double inner_r = std::min(m_Geometry.dead_zone_radius, outer_r);

    cr->arc(cx, cy, outer_r + 4.0, 0, 2 * M_PI);
    kBackground.set_as_source(cr);
    cr->fill();

    cr->set_line_width(1.5);
    for (int i = 0; i < kSlotCount; ++i) {
        const double start = geometry::sector_start_angle(i, m_Geometry.start_angle);
        const double end = start + geometry::kSectorDegrees * M_PI / 180.0;

        cr->begin_new_path();
        cr->arc(cx, cy, outer_r, start, end);
        cr->arc_negative(cx, cy, inner_r, end, start);
        cr->close_path();

        if (frame.highlighted && *frame.highlighted == i) {
            kHover.set_as_source(cr);
        } else if (frame.kinds[i] == ActionKind::Back) {
            kBack.set_as_source(cr);
        } else {
            kSegment.set_as_source(cr);
        }
        cr->fill_preserve();
        kBorder.set_as_source(cr);
        cr->stroke();

        const double mid = geometry::sector_mid_angle(i, m_Geometry.start_angle);
        const double text_r = (outer_r + inner_r) / 2.0;
        draw_label(cr, cx + text_r * std::cos(mid), cy + text_r * std::sin(mid), frame.labels[i],
                   frame.kinds[i] == ActionKind::Empty);
    }

    cr->begin_new_path();
    cr->arc(cx, cy, inner_r, 0, 2 * M_PI);
    kBackground.set_as_source(cr);
    cr->fill_preserve();
    kBorder.set_as_source(cr);
    cr->stroke();
}

// Centered on (x, y); long labels wrap once at a space, then get cut.
void WheelOverlay::draw_label(const Cairo::RefPtr<Cairo::Context>& cr, double x, double y, const std::string& text,
                              bool unset)
{
    (unset ? kUnsetText : kText).set_as_source(cr);
    cr->select_font_face("Sans", Cairo::ToyFontFace::Slant::NORMAL, Cairo::ToyFontFace::Weight::NORMAL);
    cr->set_font_size(kFontSize);

    const double max_width = m_Geometry.wheel_radius * 0.45;
    std::vector<std::string> lines = wrap_label(text, [&cr, max_width](const std::string& line) {
        Cairo::TextExtents extents;
        cr->get_text_extents(line, extents);
        return extents.width <= max_width;
    });

    const double line_height = kFontSize + kLineSpacing;
    double line_y = y - line_height * (static_cast<double>(lines.size()) - 1.0) / 2.0;
    for (const auto& line : lines) {
        Cairo::TextExtents extents;
        cr->get_text_extents(line, extents);
        cr->move_to(x - extents.width / 2 - extents.x_bearing, line_y - extents.height / 2 - extents.y_bearing);
        cr->show_text(line);
        line_y += line_height;
    }
}

}
