#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "eigen3/Eigen/Core"

template<int N = Eigen::Dynamic>
using Vector = Eigen::Matrix<double, N, 1>;

// x is the column, y is the row. Rows grow downwards.
using Cell = Eigen::Vector2i;

struct CellHash {
    std::size_t operator()(const Cell& c) const {
        auto hash1 = std::hash<int>{}(c.x());
        auto hash2 = std::hash<int>{}(c.y());
        return hash1 ^ (hash2 << 1);
    }
};

inline Vector<2> to_vector(const Cell& c) {
    return c.cast<double>();
}

inline double distance(const Cell& a, const Cell& b) {
    return (to_vector(a) - to_vector(b)).norm();
}

using Channel = Eigen::Matrix<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Row-major color image, one matrix per channel, as handed over by a map loader.
struct RasterMap {
    Channel channels[3];

    RasterMap() = default;
    RasterMap(int rows, int cols, std::uint8_t fill = 255) {
        for (auto& channel : channels) {
            channel = Channel::Constant(rows, cols, fill);
        }
    }

    int rows() const { return channels[0].rows(); }
    int cols() const { return channels[0].cols(); }
};
