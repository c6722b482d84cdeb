#include "OccupancyGrid.hpp"

#include <stdexcept>
#include <utility>

#include "PlanningErrors.hpp"
#include "Steering.hpp"

constexpr int OccupancyGrid::kFreeWindowHalfSize;
constexpr int OccupancyGrid::kSegmentChecks;

namespace {

OccupancyGrid::Cells threshold(const RasterMap& map) {
    if (map.rows() == 0 || map.cols() == 0) {
        throw std::invalid_argument("Raster map is empty");
    }
    for (const auto& channel : map.channels) {
        if (channel.rows() != map.rows() || channel.cols() != map.cols()) {
            throw std::invalid_argument("Raster map channels differ in size");
        }
    }
    return map.channels[0].array() == std::uint8_t(0);
}

}  // namespace

OccupancyGrid::OccupancyGrid(const RasterMap& map) : occupied(threshold(map)) {}

OccupancyGrid::OccupancyGrid(Cells occupied) : occupied(std::move(occupied)) {
    if (this->occupied.size() == 0) {
        throw std::invalid_argument("Occupancy grid is empty");
    }
}

bool OccupancyGrid::is_occupied(const Cell& c) const {
    if (!contains(c)) {
        throw OutOfBounds(c, width(), height());
    }
    return occupied(c.y(), c.x());
}

bool OccupancyGrid::is_free(const Cell& c) const {
    if (!contains(c)) {
        throw OutOfBounds(c, width(), height());
    }

    const int top = c.y() - kFreeWindowHalfSize;
    const int left = c.x() - kFreeWindowHalfSize;
    const int size = 2 * kFreeWindowHalfSize;
    if (top < 0 || left < 0 || top + size > height() || left + size > width()) {
        return false;
    }
    return !occupied.block(top, left, size, size).any();
}

bool OccupancyGrid::segment_is_free(const Cell& from, const Cell& to) const {
    if (!is_free(from)) {
        throw std::logic_error("Segment starts at " + describe(from) + ", which is not free");
    }
    if (!is_free(to)) {
        return false;
    }

    for (int i = 0; i < kSegmentChecks; i++) {
        double fraction = static_cast<double>(i) / kSegmentChecks;
        if (!is_free(interpolate(from, to, fraction, height()))) {
            return false;
        }
    }
    return true;
}
