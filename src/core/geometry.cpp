#include "core/geometry.hpp"

#include <cmath>

namespace {
constexpr double kPi = 3.14159265358979323846;
// Positions closer than this to a sector edge are treated as on the edge.
constexpr double kEdgeSnap = 1e-9;

double degrees_to_radians(double degrees) {
    return degrees * kPi / 180.0;
}
}  // namespace

std::optional<int> geometry::resolve_slot(const Point& origin, const Point& cursor, double dead_zone_radius,
                                          double start_angle) {
    const double dx = cursor.x - origin.x;
    const double dy = cursor.y - origin.y;
    if (std::hypot(dx, dy) < dead_zone_radius) {
        return std::nullopt;
    }

    const double theta = std::atan2(dy, dx) * 180.0 / kPi;
    double relative = std::fmod(theta - (start_angle - kSectorDegrees / 2.0), 360.0);
    if (relative < 0.0) {
        relative += 360.0;
    }

    double position = relative / kSectorDegrees;
    const double nearest_edge = std::round(position);
    if (std::fabs(position - nearest_edge) < kEdgeSnap) {
        position = nearest_edge;
    }

    return static_cast<int>(std::floor(position)) % kSlotCount;
}

double geometry::sector_start_angle(int index, double start_angle) {
    return degrees_to_radians(start_angle - kSectorDegrees / 2.0 + index * kSectorDegrees);
}

double geometry::sector_mid_angle(int index, double start_angle) {
    return degrees_to_radians(start_angle + index * kSectorDegrees);
}
