#pragma once

#include <stdexcept>
#include <string>

namespace pslearn::core {

    // Invalid bounds, empty search space, non-positive sizes, bad config files.
    class ConfigurationError : public std::invalid_argument {
        public:
            explicit ConfigurationError(const std::string& what)
                : std::invalid_argument(what) {}
    };

    // Every evaluated candidate of the whole run scored the worst sentinel.
    class NoViableCandidateError : public std::runtime_error {
        public:
            explicit NoViableCandidateError(const std::string& what)
                : std::runtime_error(what) {}
    };

    // The parallel evaluation phase could not complete.
    class BackendError : public std::runtime_error {
        public:
            explicit BackendError(const std::string& what)
                : std::runtime_error(what) {}
    };

} // namespace pslearn::core
