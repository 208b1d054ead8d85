#pragma once

#include <stdexcept>
#include <string>

namespace collagist::model {

// Root of every error the collage pipeline raises.
class CollageError : public std::runtime_error {
public:
    explicit CollageError(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid option value or malformed command line / config file. Fatal.
class ConfigError : public CollageError {
public:
    explicit ConfigError(const std::string& msg) : CollageError(msg) {}
};

// Input directory missing and not creatable, or not readable. Fatal.
class ScanError : public CollageError {
public:
    explicit ScanError(const std::string& msg) : CollageError(msg) {}
};

// One source image could not be decoded. Recovered per item.
class DecodeError : public CollageError {
public:
    explicit DecodeError(const std::string& msg) : CollageError(msg) {}
};

// A fitted cell could not be placed on the canvas. Recovered per item.
class CompositeError : public CollageError {
public:
    explicit CompositeError(const std::string& msg) : CollageError(msg) {}
};

// Output could not be encoded or persisted. Fatal.
class WriteError : public CollageError {
public:
    explicit WriteError(const std::string& msg) : CollageError(msg) {}
};

}  // namespace collagist::model
