/// @file operation.hpp
/// @brief Operation: the atomic splice edit.

#pragma once

#include <splice-ot/config.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace splice_ot {

/// Replace `to_remove` bytes at `offset` with `to_insert`.
///
/// Operations are plain values with no identity beyond their fields.
/// A valid operation always has an effect: it removes something, inserts
/// something, or both.
///
/// Inside a Patch, an operation's offset is expressed against the patch's
/// parent document. When an operation is being folded into a patch (see
/// Patch::add_operation), it is expressed against the document the patch
/// produces; should_merge, merge and rebase translate between the two.
struct Operation {
    std::size_t offset{0};     ///< Position of the first affected byte.
    std::size_t to_remove{0};  ///< Number of bytes removed at offset.
    std::string to_insert{};   ///< Text inserted at offset.

    /// Net change in document length when this operation is applied.
    auto length_change() const noexcept -> std::int64_t {
        return static_cast<std::int64_t>(to_insert.size()) -
               static_cast<std::int64_t>(to_remove);
    }

    /// Validate the operation's shape, and its bounds if the length is known.
    /// @throws Error (invalid_operation) on a no-op,
    ///         Error (out_of_range) if offset + to_remove > doc_length.
    auto check(std::optional<std::size_t> doc_length = std::nullopt) const -> const Operation&;

    /// Apply to a document and return the edited copy.
    /// @throws Error (out_of_range) if the removed range exceeds the document.
    auto apply(std::string_view doc, const Config& cfg = {}) const -> std::string;

    /// The operation that undoes this one.
    /// @param doc The document state before this operation is applied.
    auto invert(std::string_view doc, const Config& cfg = {}) const -> Operation;

    /// True if `newer` (expressed after this operation) touches or overlaps
    /// the span this operation leaves behind, so the two can be expressed as
    /// one operation.
    auto should_merge(const Operation& newer) const -> bool;

    /// Combine with `newer` into one operation with the same net effect.
    /// Requires should_merge(newer).
    /// @return The combined operation, or nullopt if together they do nothing.
    auto merge(const Operation& newer) const -> std::optional<Operation>;

    /// Translate `newer` from post-this coordinates back to this operation's
    /// base. Returns `newer` unchanged when it lies entirely before this
    /// operation, meaning it belongs in front of it.
    auto rebase(const Operation& newer) const -> Operation;

    /// Strip the prefix and suffix that the inserted text shares with the
    /// text it replaces. Never splits a UTF-8 sequence.
    /// @param doc The document state before this operation is applied.
    /// @return The narrowed operation, or nullopt if nothing is left.
    auto simplify(std::string_view doc) const -> std::optional<Operation>;

    auto operator==(const Operation&) const -> bool = default;
};

/// Build an operation, validating its shape when `cfg` verifies.
auto make_operation(std::size_t offset, std::size_t to_remove, std::string to_insert,
                    const Config& cfg = {}) -> Operation;

/// True if `op` replaces the whole of `text` with `text` itself, i.e. it is a
/// checkpoint that changes nothing.
auto is_checkpoint_operation(const Operation& op, std::string_view text) noexcept -> bool;

/// Decides the merged content of a region both sides edited concurrently.
/// Arguments are: what the transformed side made of the region, what the
/// concurrent side made of it, and the region's original text.
///
/// Must be deterministic and symmetric in its first two arguments for
/// replicas to converge.
using ConflictResolver =
    std::function<std::string(std::string_view, std::string_view, std::string_view)>;

/// Elementary OT step.
///
/// Adjusts `to_transform` so that it can be applied after `concurrent`,
/// both having been computed against `doc`. Where the two operations
/// overlap, or both insert at the same position, `resolve` decides the
/// content of the contested region.
///
/// @return The transformed operation, or nullopt if nothing of
///         `to_transform` survives.
/// @throws Error (resolver_failure) if `resolve` throws.
auto transform(std::string_view doc,
               const Operation& to_transform,
               const Operation& concurrent,
               const ConflictResolver& resolve,
               const Config& cfg = {}) -> std::optional<Operation>;

}  // namespace splice_ot
