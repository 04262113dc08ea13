#pragma once

#include <stdexcept>
#include <string>

namespace image_collate {

class ImageCollateError : public std::runtime_error {
public:
    explicit ImageCollateError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public ImageCollateError {
public:
    explicit ConfigError(const std::string& message)
        : ImageCollateError("Config error: " + message) {}
};

class ValidationError : public ImageCollateError {
public:
    explicit ValidationError(const std::string& message)
        : ImageCollateError("Validation error: " + message) {}
};

class IOError : public ImageCollateError {
public:
    explicit IOError(const std::string& message)
        : ImageCollateError("I/O error: " + message) {}
};

class DecodeError : public IOError {
public:
    explicit DecodeError(const std::string& message)
        : IOError("Decode error: " + message) {}
};

class LedgerError : public IOError {
public:
    explicit LedgerError(const std::string& message)
        : IOError("Ledger error: " + message) {}
};

} // namespace image_collate
