#pragma once

/// @file include/daloop/errors.hpp
/// @brief Exception types raised by the adaptation components.
///
/// Both types abort the current training step. Trainer::fit does not catch
/// them; the owner of the loop decides whether the run continues.

#include <stdexcept>
#include <string>

namespace daloop {

/// Bad cluster count, shape or dimension mismatch, momentum outside [0, 1),
/// unknown sample index, or a device mismatch.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument(what) {}
};

/// A domain subset or point set that must be non-empty is empty.
class EmptyPartition : public std::runtime_error {
public:
    explicit EmptyPartition(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace daloop
