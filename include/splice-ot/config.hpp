/// @file config.hpp
/// @brief Per-call configuration: verification level and logger.

#pragma once

#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <string_view>

namespace splice_ot {

/// How much invariant checking a call performs.
enum class Verification : std::uint8_t {
    off,   ///< Bounds checks only. Intended for production throughput.
    full,  ///< Re-verify every patch invariant and parent hash on each call.
};

/// Convert a Verification level to its string representation.
constexpr auto to_string_view(Verification v) noexcept -> std::string_view {
    switch (v) {
        case Verification::off:  return "off";
        case Verification::full: return "full";
    }
    return "unknown";
}

/// Configuration threaded through every splice-ot call.
///
/// There is no global state: callers that want paranoid checking or
/// diagnostics pass a Config with the desired settings.
///
/// @code
/// auto cfg = Config{Verification::full, spdlog::stderr_color_mt("ot")};
/// auto merged = transform(mine, theirs, doc, TransformPolicy{}, cfg);
/// @endcode
struct Config {
    Verification verification{Verification::off};  ///< Invariant checking level.
    std::shared_ptr<spdlog::logger> logger{};      ///< Diagnostics sink; null = silent.

    /// True when invariants are re-verified on every call.
    auto verify() const noexcept -> bool {
        return verification == Verification::full;
    }

    /// The configured logger, or a shared null-sink logger if none was given.
    auto log() const -> spdlog::logger&;
};

}  // namespace splice_ot
