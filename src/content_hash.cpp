#include <splice-ot/content_hash.hpp>
#include <splice-ot/error.hpp>

#include "crypto/sha256.hpp"

#include <algorithm>

namespace splice_ot {

namespace {

auto nibble(char c) -> std::byte {
    if (c >= '0' && c <= '9') return std::byte(c - '0');
    return std::byte(c - 'a' + 10);
}

}  // anonymous namespace

auto ContentHash::of(std::string_view text) -> ContentHash {
    return ContentHash{crypto::sha256(text)};
}

auto ContentHash::is_valid_hex(std::string_view hex) noexcept -> bool {
    return hex.size() == hex_size &&
           std::ranges::all_of(hex, [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

auto ContentHash::from_hex(std::string_view hex) -> ContentHash {
    if (!is_valid_hex(hex)) {
        throw Error{ErrorKind::invalid_hash,
                    "content hash must be 64 lowercase hex characters, got \"" +
                        std::string{hex.substr(0, hex_size + 1)} + "\""};
    }
    auto out = ContentHash{};
    for (std::size_t i = 0; i < size; ++i) {
        out.bytes[i] = (nibble(hex[i * 2]) << 4) | nibble(hex[i * 2 + 1]);
    }
    return out;
}

auto ContentHash::to_hex() const -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(hex_size);
    for (auto b : bytes) {
        auto v = static_cast<unsigned char>(b);
        result.push_back(hex_chars[v >> 4]);
        result.push_back(hex_chars[v & 0x0F]);
    }
    return result;
}

}  // namespace splice_ot
