#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the ridesim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace ridesim::io {

/// @brief Exception for I/O errors (loading, parsing, validation).
///
/// Thrown by loader functions when input is malformed, required fields
/// are missing, or values fail semantic validation (e.g. a negative
/// patience or a reused identifier).
///
/// @ingroup io
/// @see load_scenario, load_event_script
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Additional context such as the file path or line.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

/// @brief A line of an event script could not be parsed.
///
/// The context names the offending line (`"line 7"`).
///
/// @ingroup io
/// @see parse_event_script
class ParseError : public LoaderError {
public:
    using LoaderError::LoaderError;
};

} // namespace ridesim::io
