#pragma once

// Header-only SHA-256 (FIPS 180-4) used to compute content hashes.
// Internal header — not installed.

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace splice_ot::crypto {

namespace detail {

inline constexpr std::uint32_t round_constants[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

inline constexpr auto rotr(std::uint32_t x, unsigned n) -> std::uint32_t {
    return (x >> n) | (x << (32 - n));
}

inline auto load_be32(const unsigned char* p) -> std::uint32_t {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           (static_cast<std::uint32_t>(p[3]));
}

/// Run the compression function over one 64-byte block.
inline void compress(std::array<std::uint32_t, 8>& state, const unsigned char* block) {
    auto w = std::array<std::uint32_t, 64>{};
    for (int i = 0; i < 16; ++i) {
        w[i] = load_be32(block + static_cast<std::ptrdiff_t>(i) * 4);
    }
    for (int i = 16; i < 64; ++i) {
        const auto s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        const auto s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    auto v = state;
    for (int i = 0; i < 64; ++i) {
        const auto [a, b, c, d, e, f, g, h] = v;
        const auto big_s1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        const auto choose = (e & f) ^ (~e & g);
        const auto t1 = h + big_s1 + choose + round_constants[i] + w[i];
        const auto big_s0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        const auto majority = (a & b) ^ (a & c) ^ (b & c);
        const auto t2 = big_s0 + majority;
        v = {t1 + t2, a, b, c, d + t1, e, f, g};
    }
    for (std::size_t i = 0; i < state.size(); ++i) {
        state[i] += v[i];
    }
}

}  // namespace detail

// Compute the SHA-256 digest of a byte string.
inline auto sha256(std::string_view input) -> std::array<std::byte, 32> {
    auto state = std::array<std::uint32_t, 8>{
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
    };

    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const auto full_blocks = input.size() / 64;
    for (std::size_t i = 0; i < full_blocks; ++i) {
        detail::compress(state, data + i * 64);
    }

    // Tail: remaining bytes + 0x80 + zero padding + 64-bit big-endian bit length.
    // Fits in at most two blocks.
    auto tail = std::array<unsigned char, 128>{};
    const auto rest = input.size() - full_blocks * 64;
    if (rest > 0) {
        std::memcpy(tail.data(), data + full_blocks * 64, rest);
    }
    tail[rest] = 0x80;
    const auto tail_len = (rest + 1 + 8 <= 64) ? std::size_t{64} : std::size_t{128};
    const auto bit_len = static_cast<std::uint64_t>(input.size()) * 8;
    for (int i = 0; i < 8; ++i) {
        tail[tail_len - 1 - static_cast<std::size_t>(i)] =
            static_cast<unsigned char>(bit_len >> (8 * i));
    }
    for (std::size_t off = 0; off < tail_len; off += 64) {
        detail::compress(state, tail.data() + off);
    }

    auto digest = std::array<std::byte, 32>{};
    for (std::size_t i = 0; i < state.size(); ++i) {
        digest[i * 4]     = static_cast<std::byte>(state[i] >> 24);
        digest[i * 4 + 1] = static_cast<std::byte>(state[i] >> 16);
        digest[i * 4 + 2] = static_cast<std::byte>(state[i] >> 8);
        digest[i * 4 + 3] = static_cast<std::byte>(state[i]);
    }
    return digest;
}

}  // namespace splice_ot::crypto
