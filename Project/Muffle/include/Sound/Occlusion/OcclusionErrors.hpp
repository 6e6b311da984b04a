#pragma once

#include <stdexcept>
#include <string>

// Thrown when emitter settings cannot be used (e.g. non-positive maximum range).
// Raised at configuration time only, never from a per-frame update.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Thrown when an estimator is constructed without a required collaborator
// (listener, emitter transform, geometry query or source sink).
class MissingCollaboratorError : public std::runtime_error {
public:
    explicit MissingCollaboratorError(const std::string& message) : std::runtime_error(message) {}
};
