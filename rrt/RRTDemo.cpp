#include <iostream>
#include <random>

#include "common/logger.h"
#include "RRT.hpp"

int main() {
    // 600x600 white map with a black wall across the middle, open on the right.
    RasterMap map(600, 600);
    for (auto& channel : map.channels) {
        channel.block(290, 0, 20, 450).setZero();
    }

    RRT<> rrt(map);
    std::mt19937 gen(1);

    Cell start(10, 10), goal(500, 500);
    RRTParams params;
    auto plan = rrt.plan(start, goal, params, gen);

    if (plan.size() == 1) {
        LOG_WARN("No plan after " << rrt.iterations() << " iterations");
        return 1;
    }
    for (auto& cell : plan) {
        std::cout << cell.transpose() << std::endl;
    }
}
