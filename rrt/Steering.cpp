#include "Steering.hpp"

#include <cmath>

namespace {

int sign(int v) {
    return (v > 0) - (v < 0);
}

}  // namespace

double heading(double dx, double dy) {
    if (dx > 0) {
        return std::atan(dy / dx);
    }
    // atan only covers (-pi/2, pi/2), so mirror the left half-plane onto the
    // right one and rotate the result back by pi.
    double theta = std::atan(dy / -dx);
    return dy < 0 ? -EIGEN_PI - theta : EIGEN_PI - theta;
}

Cell steer_toward(const Cell& from, const Cell& to, double radius, int height) {
    if (distance(from, to) <= radius) {
        return to;
    }

    const int flipped_from = height - from.y();
    const int flipped_to = height - to.y();
    const int dx = to.x() - from.x();
    const int dy = flipped_to - flipped_from;

    double x, flipped_y;
    if (dx == 0) {
        // Straight up or down the screen.
        x = from.x();
        flipped_y = flipped_from - sign(to.y() - from.y()) * radius;
    } else {
        double theta = heading(dx, dy);
        x = static_cast<int>(from.x() + std::cos(theta) * radius);
        flipped_y = static_cast<int>(flipped_from + std::sin(theta) * radius);
    }
    return Cell(static_cast<int>(x), static_cast<int>(height - flipped_y));
}

Cell interpolate(const Cell& from, const Cell& to, double fraction, int height) {
    return steer_toward(from, to, fraction * distance(from, to), height);
}
