#pragma once
#include <optional>
#include <vector>

namespace waycodec {

/// Ordered list where each position is either a value or an explicit absence.
template <typename T>
using Sequence = std::vector<std::optional<T>>;

struct Point {
    double longitude = 0.0;
    double latitude = 0.0;

    static Point from_lng_lat(double longitude, double latitude) {
        return Point{longitude, latitude};
    }

    bool operator==(const Point& o) const {
        return longitude == o.longitude && latitude == o.latitude;
    }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

/// (angle, tolerance) in degrees. Kept as a list so arity is checkable.
using Bearing = std::vector<std::optional<double>>;

/// (pickup waypoint index, drop-off waypoint index).
using Distribution = std::vector<int>;

} // namespace waycodec
