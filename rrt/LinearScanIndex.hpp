#pragma once

#include <stdexcept>
#include <utility>
#include <vector>

#include "common/types.h"

// Brute force nearest neighbor over every inserted cell. Ties go to the cell
// that was inserted first.
class LinearScanIndex {
public:
    void add(const Cell& position, int id) {
        points.emplace_back(position, id);
    }

    int nearest(const Cell& query) const {
        if (points.empty()) {
            throw std::runtime_error("No values in index!");
        }
        int best = points.front().second;
        double best_distance = distance(points.front().first, query);
        for (const auto& point : points) {
            double d = distance(point.first, query);
            if (d < best_distance) {
                best = point.second;
                best_distance = d;
            }
        }
        return best;
    }

    void reset() {
        points.clear();
    }

    bool is_empty() const {
        return points.empty();
    }

private:
    std::vector<std::pair<Cell, int>> points;
};
