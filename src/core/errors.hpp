#pragma once

#include <stdexcept>
#include <string>

namespace backtester {

/**
 * Malformed or insufficient price data (empty series, out-of-order or
 * duplicate timestamps, unusable prices). Raised before any run state exists.
 */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Invalid configuration or strategy parameter combination.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace backtester
