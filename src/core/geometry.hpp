#ifndef CORE_GEOMETRY_HPP
#define CORE_GEOMETRY_HPP

#include "core/models.hpp"

#include <optional>

namespace geometry {
constexpr double kSectorDegrees = 360.0 / kSlotCount;

// Maps a cursor position to the slot whose sector contains it. Sector 0 is
// centered on start_angle (degrees, screen coordinates with y pointing down)
// and indices grow clockwise. Sectors are half-open, so a cursor exactly on an
// edge belongs to the clockwise-next slot. Returns nullopt inside the dead zone.
std::optional<int> resolve_slot(const Point& origin, const Point& cursor, double dead_zone_radius,
                                double start_angle);

// Radians, for drawing.
double sector_start_angle(int index, double start_angle);
double sector_mid_angle(int index, double start_angle);
}

#endif
