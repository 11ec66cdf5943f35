#pragma once

#include <stdexcept>
#include <string>

namespace trip_atlas {

class TripAtlasError : public std::runtime_error {
public:
    explicit TripAtlasError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public TripAtlasError {
public:
    explicit ConfigError(const std::string& message)
        : TripAtlasError("Config error: " + message) {}
};

class ValidationError : public TripAtlasError {
public:
    explicit ValidationError(const std::string& message)
        : TripAtlasError("Validation error: " + message) {}
};

class IOError : public TripAtlasError {
public:
    explicit IOError(const std::string& message)
        : TripAtlasError("I/O error: " + message) {}
};

class InputFormatError : public IOError {
public:
    explicit InputFormatError(const std::string& message)
        : IOError("Input format error: " + message) {}
};

} // namespace trip_atlas
