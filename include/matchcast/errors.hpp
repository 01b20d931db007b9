#pragma once

/// @file include/matchcast/errors.hpp
/// @brief Error taxonomy surfaced by the prediction pipeline.
///
/// NotFound, Validation and Transient failures are exceptions derived from
/// `matchcast::Error`. Strategy faults are not errors: they degrade to a
/// neutral estimate and are flagged on the result instead.

#include <stdexcept>
#include <string>
#include <string_view>

namespace matchcast {

enum class ErrorKind {
    NotFound,    ///< Unknown entity id
    Validation,  ///< Malformed request, non-finite features, oversized batch
    Transient,   ///< Collaborator timeout or temporary unavailability
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Base class for all categorized engine errors.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(ErrorKind::NotFound, message) {}
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::Validation, message) {}
};

class TransientError : public Error {
public:
    explicit TransientError(const std::string& message)
        : Error(ErrorKind::Transient, message) {}
};

}  // namespace matchcast
