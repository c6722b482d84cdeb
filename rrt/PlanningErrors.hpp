#pragma once

#include <stdexcept>
#include <string>

#include "common/types.h"

inline std::string describe(const Cell& c) {
    return "(" + std::to_string(c.x()) + ", " + std::to_string(c.y()) + ")";
}

class OutOfBounds : public std::out_of_range {
public:
    OutOfBounds(const Cell& c, int width, int height)
        : std::out_of_range("Cell " + describe(c) + " outside of "
                + std::to_string(width) + "x" + std::to_string(height) + " grid"),
          cell(c) {}

    Cell cell;
};

class PlanningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidStart : public PlanningError {
public:
    explicit InvalidStart(const Cell& c)
        : PlanningError("Start " + describe(c) + " is not in free space") {}
};

class InvalidGoal : public PlanningError {
public:
    explicit InvalidGoal(const Cell& c)
        : PlanningError("Goal " + describe(c) + " is not in free space") {}
};
