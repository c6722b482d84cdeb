#pragma once

#include "eigen3/Eigen/Core"

#include "common/types.h"

// Binary obstacle map derived once from a raster map. A cell is occupied iff
// the first channel of the raster is 0.
class OccupancyGrid {
public:
    using Cells = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    static constexpr int kFreeWindowHalfSize = 5;
    static constexpr int kSegmentChecks = 10;

    explicit OccupancyGrid(const RasterMap& map);
    explicit OccupancyGrid(Cells occupied);

    int width() const { return occupied.cols(); }
    int height() const { return occupied.rows(); }

    bool contains(const Cell& c) const {
        return c.x() >= 0 && c.x() < width() && c.y() >= 0 && c.y() < height();
    }

    // Throws OutOfBounds.
    bool is_occupied(const Cell& c) const;

    // True iff the rows [y - 5, y + 5) and columns [x - 5, x + 5) around `c` are
    // all unoccupied. The part of that window outside the grid counts as
    // occupied, so cells within 5 of the top/left edge (or closer than 5 to the
    // bottom/right edge) are never free. Throws OutOfBounds if `c` itself is
    // outside the grid.
    bool is_free(const Cell& c) const;

    // Approximate check of the straight segment from `from` (which must be
    // free) to `to`: `to` must be free, and so must the points at fractions
    // 0/10, 1/10, ..., 9/10 along the segment. Obstacles thinner than the
    // spacing between those points can slip through.
    bool segment_is_free(const Cell& from, const Cell& to) const;

private:
    Cells occupied;
};
