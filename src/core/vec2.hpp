#ifndef SPIRITS_VEC2_HPP
#define SPIRITS_VEC2_HPP

#include <cmath>

namespace spirits {

/**
 * @brief Plane position / offset used by every entity on the map
 *
 * The game is played on a flat 2-D plane in map units; there is no
 * frame bookkeeping, only Euclidean distance.
 */
struct Vec2 {
    double x, y;

    Vec2() : x(0), y(0) {}
    Vec2(double x_, double y_) : x(x_), y(y_) {}

    double norm() const {
        return std::sqrt(x*x + y*y);
    }

    double distance_to(const Vec2& other) const {
        double dx = other.x - x;
        double dy = other.y - y;
        return std::sqrt(dx*dx + dy*dy);
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }

    bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Vec2& o) const { return !(*this == o); }

    static Vec2 Zero() { return Vec2(0, 0); }
};

} // namespace spirits

#endif // SPIRITS_VEC2_HPP
