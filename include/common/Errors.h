#pragma once

#include <stdexcept>
#include <string>

namespace semilev {

// Malformed configuration; raised at construction/load time, never during a run.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Bars must arrive in strictly increasing timestamp order.
class OutOfOrderBarError : public std::runtime_error {
public:
    explicit OutOfOrderBarError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace semilev
