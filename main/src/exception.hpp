#pragma once

#include <stdexcept>
#include <string>

class RjarException : public std::runtime_error {
public:
    explicit RjarException(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised when a required setting (e.g. the Spark home) cannot be resolved.
// Unlike RjarException it is never converted into a per-jar failure.
class RjarConfigException : public RjarException {
public:
    explicit RjarConfigException(const std::string& message)
        : RjarException(message) {}
};
