#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// Whole argument must be a positive decimal integer; "2abc" and "3.9" are rejected.
inline int parsePositive(const char* arg) {
    std::size_t pos = 0;
    int value = std::stoi(arg, &pos);
    if (arg[pos] != '\0') {
        throw std::invalid_argument(arg);
    }
    if (value <= 0) {
        throw std::out_of_range(arg);
    }
    return value;
}
