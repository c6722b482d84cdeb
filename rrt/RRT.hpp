#pragma once

#include <functional>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include "common/logger.h"
#include "common/types.h"
#include "LinearScanIndex.hpp"
#include "OccupancyGrid.hpp"
#include "PlanningErrors.hpp"
#include "SearchTree.hpp"
#include "Steering.hpp"

struct RRTParams {
    int max_iterations = 1000;
    double max_step_radius = 30;  // cells
    double goal_radius = 50;      // cells
};

template<typename NearestIndex>
class SpaceFillingTree {
public:
    static constexpr int kRejected = -1;

    // Grows the tree one step from its nearest node towards `towards`, at most
    // `delta` away. Returns the new node's index, or kRejected if the step hit an
    // obstacle or landed on a cell the tree already has.
    int extend(const Cell& towards, double delta, const OccupancyGrid& grid) {
        int nearest = index.nearest(towards);
        Cell from = tree.node(nearest).position;
        Cell new_point = steer_toward(from, towards, delta, grid.height());

        if (tree.contains(new_point)) {
            LOG_TRACE("Skipping " << describe(new_point) << ", already in tree");
            return kRejected;
        }
        if (!grid.segment_is_free(from, new_point)) {
            LOG_TRACE("Edge " << describe(from) << " -> " << describe(new_point) << " is blocked");
            return kRejected;
        }

        int new_node = tree.add(new_point, nearest);
        index.add(new_point, new_node);
        LOG_DEBUG("Node " << new_node << " at " << describe(new_point) << ", parent " << nearest);
        return new_node;
    }

    void reset(const Cell& start) {
        tree.reset(start);
        index.reset();
        index.add(start, 0);
    }

    const SearchTree& nodes() const {
        return tree;
    }

private:
    SearchTree tree;
    NearestIndex index;
};

template<typename NearestIndex>
constexpr int SpaceFillingTree<NearestIndex>::kRejected;

// Rapidly-exploring random tree over an occupancy grid. The returned plan runs
// from start to goal, or is just [start] when the iteration budget ran out.
template<typename NearestIndex = LinearScanIndex>
class RRT {
public:
    using Plan = std::vector<Cell>;
    using IterationCallback = std::function<void(int, const SearchTree&)>;

    explicit RRT(const RasterMap& map) : grid(map) {}
    explicit RRT(OccupancyGrid grid) : grid(std::move(grid)) {}

    template<typename Generator>
    Plan plan(const Cell& start, const Cell& goal, const RRTParams& params, Generator& gen) {
        check(params);
        if (!in_free_space(start)) {
            LOG_ERROR("Start " << describe(start) << " is not in free space");
            throw InvalidStart(start);
        }
        if (!in_free_space(goal)) {
            LOG_ERROR("Goal " << describe(goal) << " is not in free space");
            throw InvalidGoal(goal);
        }

        LOG_INFO("Planning " << describe(start) << " -> " << describe(goal)
                << " with " << params.max_iterations << " iterations, step "
                << params.max_step_radius << ", goal radius " << params.goal_radius);

        space_tree.reset(start);
        iterations_used = 0;

        if (distance(start, goal) < params.goal_radius) {
            LOG_INFO("Start is already within the goal radius");
            return {start, goal};
        }

        std::uniform_int_distribution<int> sample_x(0, grid.width() - 1);
        std::uniform_int_distribution<int> sample_y(0, grid.height() - 1);

        for (int i = 0; i < params.max_iterations; i++) {
            iterations_used = i + 1;

            int x = sample_x(gen);
            int y = sample_y(gen);
            int new_node = space_tree.extend(Cell(x, y), params.max_step_radius, grid);

            bool reached = new_node != SpaceFillingTree<NearestIndex>::kRejected
                    && distance(tree().node(new_node).position, goal) < params.goal_radius;

            if (on_iteration) {
                on_iteration(iterations_used, tree());
            }

            if (reached) {
                Plan result = tree().extract_path(new_node);
                result.push_back(goal);
                LOG_INFO("Reached goal after " << iterations_used << " iterations, "
                        << tree().size() << " nodes, " << result.size() << " waypoints");
                return result;
            }
        }

        LOG_INFO("No path found after " << iterations_used << " iterations, "
                << tree().size() << " nodes");
        return {start};
    }

    template<typename Generator>
    Plan plan(const Cell& start, const Cell& goal, int max_iterations,
              double max_step_radius, double goal_radius, Generator& gen) {
        RRTParams params;
        params.max_iterations = max_iterations;
        params.max_step_radius = max_step_radius;
        params.goal_radius = goal_radius;
        return plan(start, goal, params, gen);
    }

    void set_iteration_callback(IterationCallback callback) {
        on_iteration = std::move(callback);
    }

    const OccupancyGrid& occupancy() const {
        return grid;
    }

    // Tree grown by the last call to plan().
    const SearchTree& tree() const {
        return space_tree.nodes();
    }

    int iterations() const {
        return iterations_used;
    }

private:
    static void check(const RRTParams& params) {
        if (params.max_iterations < 0) {
            throw std::invalid_argument("max_iterations must not be negative");
        }
        if (!(params.max_step_radius > 0)) {
            throw std::invalid_argument("max_step_radius must be positive");
        }
        if (!(params.goal_radius > 0)) {
            throw std::invalid_argument("goal_radius must be positive");
        }
    }

    bool in_free_space(const Cell& c) const {
        return grid.contains(c) && grid.is_free(c);
    }

    OccupancyGrid grid;
    SpaceFillingTree<NearestIndex> space_tree;
    IterationCallback on_iteration;
    int iterations_used = 0;
};
