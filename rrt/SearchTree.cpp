#include "SearchTree.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "PlanningErrors.hpp"

constexpr int SearchTree::kNoParent;

void SearchTree::reset(const Cell& root) {
    nodes.clear();
    positions.clear();
    nodes.push_back({root, kNoParent, {}});
    positions.insert(root);
}

int SearchTree::add(const Cell& position, int parent) {
    if (parent < 0 || parent >= size()) {
        throw std::out_of_range("Parent index " + std::to_string(parent) + " is not in the tree");
    }
    if (contains(position)) {
        throw std::invalid_argument("Cell " + describe(position) + " is already in the tree");
    }

    int index = size();
    nodes.push_back({position, parent, {}});
    nodes[parent].children.push_back(index);
    positions.insert(position);
    return index;
}

const SearchTree::Node& SearchTree::node(int index) const {
    if (index < 0 || index >= size()) {
        throw std::out_of_range("Node index " + std::to_string(index) + " is not in the tree");
    }
    return nodes[index];
}

std::vector<Cell> SearchTree::extract_path(int terminal) const {
    std::vector<Cell> path;
    int current = terminal;
    while (current != kNoParent) {
        if (current < 0 || current >= size()) {
            throw std::logic_error("Broken parent chain: index " + std::to_string(current));
        }
        // A chain longer than the tree itself must contain a cycle.
        if (static_cast<int>(path.size()) >= size()) {
            throw std::logic_error("Cycle in parent chain starting at node " + std::to_string(terminal));
        }
        path.push_back(nodes[current].position);
        current = nodes[current].parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
}
