#pragma once
#include <stdexcept>
#include <string>

struct GeneralsError : std::runtime_error {
    explicit GeneralsError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed, mis-counted or disconnected grid. Construction aborts.
struct InvalidGridError : GeneralsError {
    explicit InvalidGridError(const std::string& msg) : GeneralsError("invalid grid: " + msg) {}
};

// Structurally malformed step input. The state is left untouched.
struct InvalidActionError : GeneralsError {
    explicit InvalidActionError(const std::string& msg) : GeneralsError("invalid action: " + msg) {}
};

struct ReplayCorruptionError : GeneralsError {
    explicit ReplayCorruptionError(const std::string& msg) : GeneralsError("corrupt replay: " + msg) {}
};

struct ReplayIOError : GeneralsError {
    explicit ReplayIOError(const std::string& msg) : GeneralsError("replay i/o: " + msg) {}
};
