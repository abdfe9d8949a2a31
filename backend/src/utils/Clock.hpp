#pragma once
#include <ctime>
#include <functional>

// Source of "now" in Unix seconds. Managers take one so tests can move time.
using Clock = std::function<std::time_t()>;

inline Clock systemClock() {
    return [] { return std::time(nullptr); };
}
