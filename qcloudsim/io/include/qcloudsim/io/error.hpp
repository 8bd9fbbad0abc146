#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the qcloudsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace qcloudsim::io {

/// @brief Exception for I/O errors (loading, parsing, validation).
///
/// Thrown by loader functions when platform or job files are malformed,
/// required fields are missing, values fail validation, or the file type
/// is not supported.
///
/// @ingroup io
/// @see load_platform, load_jobs
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  File path, field path or line number.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace qcloudsim::io
