/// @file json.hpp
/// @brief Packed wire format of operations and patches over nlohmann/json.
///
/// An operation packs to `[offset, to_remove, to_insert]`. A patch packs to
/// its operations in order followed by its parent hash:
///
/// @code
/// [[5, 0, "X"], [9, 2, ""], "3f2a...e1"]
/// @endcode
///
/// Field order is part of the format. The checkpoint flag is not packed;
/// the receiver knows from context whether it expects a checkpoint.

#pragma once

#include <splice-ot/config.hpp>
#include <splice-ot/content_hash.hpp>
#include <splice-ot/operation.hpp>
#include <splice-ot/patch.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace splice_ot {

// -- ADL serialization --------------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op);

/// @throws Error (decoding_error) unless `j` is `[uint, uint, string]`.
void from_json(const nlohmann::json& j, Operation& op);

void to_json(nlohmann::json& j, const ContentHash& h);

/// @throws Error (decoding_error) unless `j` is a valid hex hash string.
void from_json(const nlohmann::json& j, ContentHash& h);

// -- Patch packing ------------------------------------------------------------

/// Pack a patch into its flat wire form.
auto to_obj(const Patch& patch, const Config& cfg = {}) -> nlohmann::json;

/// Unpack a patch. The result is always fully validated.
/// @param is_checkpoint Whether the packed patch is a checkpoint.
/// @throws Error (decoding_error) on any malformed input.
auto from_obj(const nlohmann::json& obj, bool is_checkpoint = false) -> Patch;

/// to_obj() rendered as compact JSON text.
/// @throws Error (invalid_operation) if inserted text is not valid UTF-8.
auto serialize(const Patch& patch, const Config& cfg = {}) -> std::string;

/// Parse JSON text and from_obj() it.
/// @throws Error (decoding_error) on invalid JSON or an invalid patch.
auto deserialize(std::string_view text, bool is_checkpoint = false) -> Patch;

}  // namespace splice_ot
