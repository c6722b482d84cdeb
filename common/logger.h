#pragma once

#include <iostream>

// 0 = silent, 1 = ERROR, 2 = WARN, 3 = INFO, 4 = DEBUG, 5 = TRACE
#ifndef GRID_RRT_LOG_LEVEL
#define GRID_RRT_LOG_LEVEL 3
#endif

#define GRID_RRT_LOG(LEVEL, COLOR, TAG, X)                                   \
    do {                                                                     \
        if (GRID_RRT_LOG_LEVEL >= LEVEL) {                                   \
            std::cout << COLOR << "[" TAG "] " << X << "\033[m" << std::endl; \
        }                                                                    \
    } while (0)

#define LOG_TRACE(X) GRID_RRT_LOG(5, "\033[0;96m", "TRACE", X)
#define LOG_DEBUG(X) GRID_RRT_LOG(4, "\033[0;32m", "DEBUG", X)
#define LOG_INFO(X)  GRID_RRT_LOG(3, "", "INFO", X)
#define LOG_WARN(X)  GRID_RRT_LOG(2, "\033[0;93m", "WARN", X)
#define LOG_ERROR(X) GRID_RRT_LOG(1, "\033[0;31m", "ERROR", X)
