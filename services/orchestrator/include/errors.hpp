#pragma once
#include <exception>
#include <stdexcept>
#include <string>

enum class ErrorClass {
    Configuration,
    TransientInference,
    PermanentInference,
    DependencyUnmet,
    Aggregation,
    InputUnavailable,
    Cancelled
};

const char* to_string(ErrorClass c);

// Malformed graph, unknown role, invalid options. Raised before anything runs.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

class DuplicateWriteError : public std::runtime_error {
public:
    explicit DuplicateWriteError(const std::string& role)
        : std::runtime_error("result already recorded for role " + role), role_(role) {}
    const std::string& role() const { return role_; }

private:
    std::string role_;
};

// Raw data required by a role could not be loaded.
class InputUnavailableError : public std::runtime_error {
public:
    explicit InputUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

class CancelledError : public std::runtime_error {
public:
    CancelledError() : std::runtime_error("run cancelled") {}
};

struct ClassifiedError {
    ErrorClass cls{ErrorClass::PermanentInference};
    std::string message;
};

// Maps an exception thrown while executing an attempt onto the error taxonomy.
// Anything not recognised is treated as permanent.
ClassifiedError classify(std::exception_ptr ep);
