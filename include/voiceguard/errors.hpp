#ifndef VOICEGUARD_ERRORS_HPP
#define VOICEGUARD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace voiceguard {

// Starting the monitor without references, or invalid settings
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Capture stream could not be opened or attached
class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& what) : std::runtime_error(what) {}
};

// Embedding model failed on a given input
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& what) : std::runtime_error(what) {}
};

// Voice sample could not be written, read or deleted
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

// Bytes are not in an audio format libsndfile can read
class DecodeError : public PersistenceError {
public:
    explicit DecodeError(const std::string& what) : PersistenceError(what) {}
};

} // namespace voiceguard

#endif // VOICEGUARD_ERRORS_HPP
