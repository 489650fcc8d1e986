#pragma once
#include <cmath>
#include <iostream>

// Report and fail the enclosing bool test function.
#define CHECK(cond) do { \
    if (!(cond)) { \
        std::cerr << __FILE__ << ":" << __LINE__ << ": check failed: " #cond "\n"; \
        return false; \
    } \
} while (0)

inline bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }
