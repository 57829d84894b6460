#pragma once

// -------------------------------------------------------------------------
// 1. SYSTEM HEADERS
// -------------------------------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
    #define NOMINMAX // avoid clashes with std::min/std::max
    #include <windows.h>
#else
    #include <sys/time.h>
    #include <ctime>
#endif

// -------------------------------------------------------------------------
// 2. STANDARD C++ LIBRARY (Commonly used across the project)
// -------------------------------------------------------------------------
// Containers
#include <vector>
#include <string>
#include <map>
#include <optional>
#include <variant>
#include <utility>    // std::pair
#include <ranges>
#include <functional> // std::function

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric>    // std::iota, std::accumulate
#include <limits>     // std::numeric_limits

// IO & Strings
#include <format>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstdint>
#include <cstddef>

// Concurrency & Randoms
#include <atomic>
#include <random>
#include <chrono>

#include <memory>     // std::shared_ptr
#include <stdexcept>
#include <exception>
#include <type_traits>

// -------------------------------------------------------------------------
// 3. GLOBAL CONSTANTS
// -------------------------------------------------------------------------
namespace pslearn::core {

    // worst representable fitness (maximization): failed or unevaluated candidates
    inline constexpr double WORST_FITNESS = -std::numeric_limits<double>::infinity();

    // a binary inclusion coordinate selects its feature at or above this value
    inline constexpr double FEATURE_THRESHOLD = 0.5;

} // namespace pslearn::core
