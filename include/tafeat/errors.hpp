#pragma once

/// @file include/tafeat/errors.hpp
/// @brief Exception taxonomy for the feature/label pipeline.
///
/// Only structural and configuration problems are exceptions. Row-level
/// numeric gaps (insufficient history, zero denominators, horizon overrun)
/// are missing cells and never throw.

#include <stdexcept>
#include <string>
#include <utility>

namespace tafeat {

/// Base of every exception thrown by tafeat.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed input series: empty, non-monotonic or duplicate timestamps,
/// non-finite close. Raised before any transform runs.
class StructuralError : public Error {
public:
    using Error::Error;
};

/// Invalid transform, labeler or pipeline configuration.
/// `parameter()` names the offending option (e.g. "window", "short_window").
class ParameterError : public Error {
public:
    ParameterError(std::string parameter, const std::string& message)
        : Error(message), parameter_(std::move(parameter)) {}

    [[nodiscard]] const std::string& parameter() const noexcept { return parameter_; }

private:
    std::string parameter_;
};

/// The acquisition collaborator could not produce any bars.
class DataUnavailableError : public Error {
public:
    using Error::Error;
};

}  // namespace tafeat
