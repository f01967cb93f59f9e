/// @file error.hpp
/// @brief Error types for the richdoc-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace richdoc_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    out_of_range,            ///< An index or offset lies outside the valid range.
    not_found,               ///< A node id does not refer to a node in the document.
    precondition_violation,  ///< An argument breaks the operation's contract (e.g. start > end).
    duplicate_node_id,       ///< A node id would appear twice in one document.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::out_of_range:           return "out_of_range";
        case ErrorKind::not_found:              return "not_found";
        case ErrorKind::precondition_violation: return "precondition_violation";
        case ErrorKind::duplicate_node_id:      return "duplicate_node_id";
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

/// The exception thrown by every failing library operation.
///
/// Operations either complete fully or throw before changing anything, so
/// a caught Exception never leaves a document half-mutated.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    /// The structured error carried by this exception.
    auto error() const noexcept -> const Error& { return error_; }

    /// Shorthand for error().kind.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace richdoc_cpp
