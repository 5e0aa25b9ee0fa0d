/// @file content_hash.hpp
/// @brief ContentHash: the 256-bit digest that anchors a patch to a document.

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace splice_ot {

/// A SHA-256 digest of a document's content.
///
/// Used both as a document version identifier and as the precondition that
/// binds a patch to the exact text it applies to. On the wire a hash is
/// always 64 lowercase hex characters.
struct ContentHash {
    static constexpr std::size_t size = 32;      ///< Fixed size in bytes.
    static constexpr std::size_t hex_size = 64;  ///< Length of the hex rendering.
    std::array<std::byte, size> bytes{};         ///< Raw digest bytes.

    constexpr ContentHash() = default;

    /// Construct from a byte array.
    explicit constexpr ContentHash(std::array<std::byte, size> b) : bytes{b} {}

    /// Hash the given document text.
    static auto of(std::string_view text) -> ContentHash;

    /// Parse a 64 character lowercase hex string.
    /// @throws Error (invalid_hash) if the string is not exactly that.
    static auto from_hex(std::string_view hex) -> ContentHash;

    /// True if `hex` is exactly 64 lowercase hex characters.
    static auto is_valid_hex(std::string_view hex) noexcept -> bool;

    /// Render as 64 lowercase hex characters.
    auto to_hex() const -> std::string;

    auto operator<=>(const ContentHash&) const = default;
    auto operator==(const ContentHash&) const -> bool = default;
};

}  // namespace splice_ot

template <>
struct std::hash<splice_ot::ContentHash> {
    auto operator()(const splice_ot::ContentHash& h) const noexcept -> std::size_t {
        // Digest bytes are uniformly distributed; the first word is enough.
        auto result = std::size_t{0};
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | static_cast<std::size_t>(h.bytes[i]);
        }
        return result;
    }
};
