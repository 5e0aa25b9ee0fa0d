/// @file error.hpp
/// @brief Error types for the splice-ot library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace splice_ot {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_operation,  ///< An operation is malformed or a no-op.
    invalid_patch,      ///< A patch violates its structural invariants.
    invalid_hash,       ///< A content hash is not 64 lowercase hex characters.
    hash_mismatch,      ///< A patch was used against a document it is not anchored to.
    out_of_range,       ///< An offset or length exceeds the document.
    decoding_error,     ///< Packed wire data could not be decoded.
    resolver_failure,   ///< A pluggable conflict resolver threw.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_operation: return "invalid_operation";
        case ErrorKind::invalid_patch:     return "invalid_patch";
        case ErrorKind::invalid_hash:      return "invalid_hash";
        case ErrorKind::hash_mismatch:     return "hash_mismatch";
        case ErrorKind::out_of_range:      return "out_of_range";
        case ErrorKind::decoding_error:    return "decoding_error";
        case ErrorKind::resolver_failure:  return "resolver_failure";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
///
/// Every invariant violation in the library is reported by throwing an
/// Error. None of them are recoverable except resolver_failure, which
/// transform() catches and degrades to an empty patch.
class Error : public std::runtime_error {
public:
    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, const std::string& msg)
        : std::runtime_error{msg}, kind_{k} {}

    /// The category of this error.
    auto kind() const noexcept -> ErrorKind { return kind_; }

    /// A human-readable description.
    auto message() const -> std::string { return what(); }

private:
    ErrorKind kind_;
};

}  // namespace splice_ot
