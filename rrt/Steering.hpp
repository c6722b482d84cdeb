#pragma once

#include "common/types.h"

// Heading of (dx, dy) in a frame where y points up, over the full circle.
// dx must be non-zero.
double heading(double dx, double dy);

// Cell `radius` away from `from` on the ray towards `to`, or `to` itself if it is
// already within `radius`. Grid rows grow downwards, so both cells are mirrored
// through `height` (the number of rows) before any angle is computed, and the
// result is mirrored back. Coordinates are truncated towards zero.
Cell steer_toward(const Cell& from, const Cell& to, double radius, int height);

// Cell at `fraction` of the way from `from` to `to`.
Cell interpolate(const Cell& from, const Cell& to, double fraction, int height);
