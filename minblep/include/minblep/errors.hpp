#pragma once

#include <stdexcept>
#include <string>

namespace minblep {

/// Thrown when table parameters are rejected before any table is built
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Thrown by cache stores for unreadable, unwritable or corrupt entries
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A requested scale that does not match the gcd-derived one
class ScaleMismatchError : public ConfigurationError {
public:
    ScaleMismatchError(int requested, int ideal)
        : ConfigurationError("Expected scale " + std::to_string(requested) +
                             " but ideal is " + std::to_string(ideal) + ".")
        , requested_(requested)
        , ideal_(ideal) {}

    [[nodiscard]] int requested() const noexcept { return requested_; }
    [[nodiscard]] int ideal() const noexcept { return ideal_; }

private:
    int requested_;
    int ideal_;
};

}  // namespace minblep
