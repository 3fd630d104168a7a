#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the loopsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace loopsim::io {

/// @brief Exception for scenario loading errors (reading, parsing, validation).
///
/// Thrown by loader functions when JSON input is malformed, required fields
/// are missing, or values fail validation (e.g. a negative clock advance).
///
/// @ingroup io
/// @see load_scenario
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Additional context such as the file path or field name.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

/// @brief Exception for a scenario step that cannot be executed.
///
/// Thrown by run_scenario when a step names an unknown loop, or when the
/// loop refuses the requested driver call.
///
/// @ingroup io
/// @see run_scenario
class ScenarioError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a ScenarioError with a contextual prefix.
    /// @param message  Human-readable description of the error.
    /// @param context  Step or loop the error refers to.
    ScenarioError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace loopsim::io
