#pragma once
#include <stdexcept>
#include <string>

// Width or height of a world was not positive.
class InvalidDimension : public std::invalid_argument {
public:
    explicit InvalidDimension(const std::string& what) : std::invalid_argument(what) {}
};

// A mutator or render call received an argument it cannot act on
// (unregistered material id, undersized pixel buffer).
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};
