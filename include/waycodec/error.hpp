#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace waycodec {

class WaycodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A present token could not be read as its declared element type.
class MalformedElementError : public WaycodecError {
public:
    std::size_t position;
    MalformedElementError(std::size_t position, const std::string& msg)
        : WaycodecError(msg), position(position) {}
};

/// A value was read fine but breaks a field rule (range, accepted set).
class ValidationError : public WaycodecError {
public:
    std::size_t position;
    ValidationError(std::size_t position, const std::string& msg)
        : WaycodecError(msg), position(position) {}
};

/// Invalid JSON handed to the route-parameter loader.
class ParseError : public WaycodecError {
public:
    using WaycodecError::WaycodecError;
};

} // namespace waycodec
