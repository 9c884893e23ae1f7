/// @file error.hpp
/// @brief Error types for the leaf-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace leaf_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_entity_id,  ///< Entity id text is malformed or has the wrong length.
    invalid_document,   ///< The document data is malformed or corrupt.
    encoding_error,     ///< An error occurred during binary encoding.
    decoding_error,     ///< An error occurred during binary decoding.
    storage_error,      ///< A storage backend failed to read or write.
    sync_error,         ///< An error occurred during the sync protocol.
    invalid_operation,  ///< An operation is invalid in the current context.
    entity_released,    ///< The entity's document was already released.
    reentrant_call,     ///< A document was mutated from inside its own listener.
    invalid_config,     ///< A configuration value has the wrong type or range.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_entity_id: return "invalid_entity_id";
        case ErrorKind::invalid_document:  return "invalid_document";
        case ErrorKind::encoding_error:    return "encoding_error";
        case ErrorKind::decoding_error:    return "decoding_error";
        case ErrorKind::storage_error:     return "storage_error";
        case ErrorKind::sync_error:        return "sync_error";
        case ErrorKind::invalid_operation: return "invalid_operation";
        case ErrorKind::entity_released:   return "entity_released";
        case ErrorKind::reentrant_call:    return "reentrant_call";
        case ErrorKind::invalid_config:    return "invalid_config";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown across the public API. Carries the structured Error.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace leaf_cpp
