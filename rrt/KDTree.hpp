#pragma once

#include <memory>
#include <limits>
#include <stdexcept>

#include "eigen3/Eigen/Core"

// 2-d tree over integer grid points. Each point carries the id of the search
// tree node it stands for. Points are inserted one at a time and never removed.
template<int N>
class KDTree {
public:
    using Point = Eigen::Matrix<int, N, 1>;

    struct TreeNode;

    KDTree() = default;

    TreeNode* add(const Point& position, int id) {
        if (root) {
            return root->add(position, id);
        } else {
            root = std::make_unique<TreeNode>(position, id, 0);
            return root.get();
        }
    }

    TreeNode* nearest_neighbor(const Point& query) const {
        if (root) {
            return root->nearest_neighbor(query);
        } else {
            throw std::runtime_error("No values in tree!");
        }
    }

    int nearest(const Point& query) const {
        return nearest_neighbor(query)->id;
    }

    void reset() {
        root.reset();
    }

    // Checks that every node lies within the bounds its ancestors' splits imply.
    bool verify() const {
        Point lower, upper;
        for (int i = 0; i < N; i++) {
            lower(i) = std::numeric_limits<int>::min();
            upper(i) = std::numeric_limits<int>::max();
        }
        return !root || root->verify(lower, upper);
    }

    bool is_empty() const {
        return !root;
    }

    struct TreeNode {
        Point position;
        int id;
        int split_dimension;
        std::unique_ptr<TreeNode> children[2];

        TreeNode(const Point& position, int id, int split)
            : position(position), id(id), split_dimension(split) {}

        TreeNode* add(const Point& new_point, int new_id) {
            int direction = position(split_dimension) < new_point(split_dimension);
            if (children[direction]) {
                return children[direction]->add(new_point, new_id);
            } else {
                children[direction] = std::make_unique<TreeNode>(
                        new_point, new_id, (split_dimension + 1) % N);
                return children[direction].get();
            }
        }

        TreeNode* nearest_neighbor(const Point& query) {
            TreeNode* best_result = this;
            long best_score = squared_distance(position, query);

            int direction = query(split_dimension) > position(split_dimension);
            if (children[direction]) {
                TreeNode* recurse_result = children[direction]->nearest_neighbor(query);
                long recurse_score = squared_distance(recurse_result->position, query);
                if (recurse_score < best_score) {
                    best_result = recurse_result;
                    best_score = recurse_score;
                }
            }

            long plane_distance = query(split_dimension) - position(split_dimension);
            if (children[!direction] && best_score > plane_distance * plane_distance) {
                // Recurse on opposite side.
                TreeNode* recurse_result = children[!direction]->nearest_neighbor(query);
                long recurse_score = squared_distance(recurse_result->position, query);
                if (recurse_score < best_score) {
                    best_result = recurse_result;
                    best_score = recurse_score;
                }
            }
            return best_result;
        }

        bool verify(Point lower, Point upper) const {
            for (int i = 0; i < N; i++) {
                if (position(i) < lower(i) || position(i) > upper(i)) {
                    return false;
                }
            }

            if (children[0]) {
                Point new_upper = upper;
                new_upper(split_dimension) = position(split_dimension);
                if (!children[0]->verify(lower, new_upper)) {
                    return false;
                }
            }

            if (children[1]) {
                Point new_lower = lower;
                new_lower(split_dimension) = position(split_dimension);
                if (!children[1]->verify(new_lower, upper)) {
                    return false;
                }
            }
            return true;
        }
    };

private:
    static long squared_distance(const Point& a, const Point& b) {
        return (a - b).template cast<long>().squaredNorm();
    }

    std::unique_ptr<TreeNode> root;
};
