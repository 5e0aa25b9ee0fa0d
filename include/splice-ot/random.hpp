/// @file random.hpp
/// @brief Random operations and patches for fuzz and property testing.

#pragma once

#include <splice-ot/config.hpp>
#include <splice-ot/operation.hpp>
#include <splice-ot/patch.hpp>

#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace splice_ot {

/// A string of `length` printable ASCII characters.
auto random_ascii(std::size_t length, std::mt19937& rng) -> std::string;

/// A random valid operation against a document of `doc_length` bytes.
/// Edits are kept small: at most 20 bytes removed and 19 inserted.
auto random_operation(std::size_t doc_length, std::mt19937& rng) -> Operation;

/// A random valid patch against `doc`, built from `op_count` random
/// operations (1 to 30 if not given) folded in with add_operation().
auto random_patch(std::string_view doc, std::mt19937& rng,
                  std::optional<std::size_t> op_count = std::nullopt,
                  const Config& cfg = {}) -> Patch;

}  // namespace splice_ot
