#pragma once

#include <unordered_set>
#include <vector>

#include "common/types.h"

// Tree of grid cells stored as an arena. Nodes refer to each other by index, the
// root's parent is kNoParent. Nodes are only ever appended.
class SearchTree {
public:
    static constexpr int kNoParent = -1;

    struct Node {
        Cell position;
        int parent;
        std::vector<int> children;
    };

    void reset(const Cell& root);

    // Appends `position` as a child of `parent` and returns its index.
    int add(const Cell& position, int parent);

    bool contains(const Cell& position) const {
        return positions.count(position) > 0;
    }

    const Node& node(int index) const;

    int size() const { return nodes.size(); }
    bool empty() const { return nodes.empty(); }

    const std::vector<Node>& all_nodes() const { return nodes; }

    // Positions from the root to `terminal`, root first.
    std::vector<Cell> extract_path(int terminal) const;

private:
    std::vector<Node> nodes;
    std::unordered_set<Cell, CellHash> positions;
};
