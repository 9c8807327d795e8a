#pragma once
#include <stdexcept>
#include <string>

namespace rec {

// empty or whitespace-only query; nothing was computed
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// catalog / model / cached index unusable; the process must not serve
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// embedding failed for one request; no partial result
class ComputationError : public std::runtime_error {
public:
    explicit ComputationError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace rec
