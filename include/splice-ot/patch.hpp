/// @file patch.hpp
/// @brief Patch: an ordered, hash-anchored set of operations.

#pragma once

#include <splice-ot/config.hpp>
#include <splice-ot/content_hash.hpp>
#include <splice-ot/operation.hpp>
#include <splice-ot/policy.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace splice_ot {

/// Write-once record of which patch a patch undoes.
///
/// A freshly created patch is `unset`. A checkpoint starts out as
/// `baseline_identity`. A patch produced by Patch::invert() is linked
/// `inverse_of` the patch it undoes; only that patch's parent hash is kept,
/// which is the hash of the document the inverse produces. Once set, the
/// link is never changed.
class InverseLink {
public:
    enum class State : std::uint8_t {
        unset,              ///< Not linked.
        baseline_identity,  ///< Checkpoint sentinel.
        inverse_of,         ///< Undoes the patch whose parent hash is target().
    };

    auto state() const noexcept -> State { return state_; }
    auto is_set() const noexcept -> bool { return state_ != State::unset; }

    /// Parent hash of the inverted patch, when state() is inverse_of.
    auto target() const noexcept -> const std::optional<ContentHash>& { return target_; }

    /// @throws Error (invalid_patch) if the link is already set.
    void mark_baseline_identity();

    /// @throws Error (invalid_patch) if the link is already set.
    void link(const ContentHash& inverted_parent);

private:
    State state_{State::unset};
    std::optional<ContentHash> target_{};
};

/// One logical edit against a known document state.
///
/// Operations are kept sorted by offset with no two neighbours touching
/// (touching operations are merged as they are added), and are applied from
/// the highest offset down so that every offset refers to the parent
/// document. A checkpoint replaces the entire document with a single
/// operation at offset 0.
///
/// Patches are built with add_operation() and are treated as immutable
/// afterwards. The inverse link is the one field that may be written after
/// construction, and only once; set it before sharing the patch between
/// threads.
///
/// @code
/// auto doc = std::string{"hello world"};
/// auto patch = Patch{ContentHash::of(doc)};
/// patch.add_operation(Operation{5, 0, ","});
/// auto edited = patch.apply(doc);  // "hello, world"
/// @endcode
class Patch {
public:
    /// Create an empty patch against the document with the given hash.
    explicit Patch(ContentHash parent_hash, bool is_checkpoint = false);

    /// Build a patch from operations already in patch order.
    /// @throws Error if the result violates any patch invariant.
    static auto from_operations(ContentHash parent_hash, std::vector<Operation> operations,
                                bool is_checkpoint = false) -> Patch;

    /// A checkpoint replacing all of `old_content` with `new_content`.
    /// @param old_hash Hash of `old_content` if already known; it is verified.
    /// @throws Error (hash_mismatch) if `old_hash` does not match,
    ///         Error (invalid_operation) if both contents are empty.
    static auto create_checkpoint(std::string_view old_content, std::string_view new_content,
                                  std::optional<ContentHash> old_hash = std::nullopt,
                                  const Config& cfg = {}) -> Patch;

    // -- Accessors ------------------------------------------------------------

    auto operations() const noexcept -> const std::vector<Operation>& { return operations_; }
    auto parent_hash() const noexcept -> const ContentHash& { return parent_hash_; }
    auto is_checkpoint() const noexcept -> bool { return is_checkpoint_; }
    auto empty() const noexcept -> bool { return operations_.empty(); }
    auto size() const noexcept -> std::size_t { return operations_.size(); }
    auto inverse_link() const noexcept -> const InverseLink& { return inverse_; }

    /// Record that this patch undoes `original`.
    /// @throws Error (invalid_patch) if the link is already set.
    void link_inverse_of(const Patch& original) const;

    // -- Validation -----------------------------------------------------------

    /// Verify every invariant; with `doc_length`, also offset bounds and the
    /// checkpoint's full-document removal.
    /// @throws Error (invalid_operation, invalid_patch or out_of_range).
    auto check(std::optional<std::size_t> doc_length = std::nullopt) const -> const Patch&;

    // -- Construction ---------------------------------------------------------

    /// Fold `op` into the patch.
    ///
    /// `op` is expressed against the document this patch currently produces.
    /// It is merged with every operation it touches and placed so the
    /// operations stay sorted; if the merge cancels out, the patch shrinks.
    void add_operation(Operation op, const Config& cfg = {});

    /// A fresh patch with the same operations, parent and checkpoint flag.
    /// The inverse link is not carried over.
    auto clone() const -> Patch;

    // -- Use ------------------------------------------------------------------

    /// Apply to `doc` and return the result.
    /// @throws Error (hash_mismatch) if verifying and `doc` is not the parent,
    ///         Error (out_of_range) if an operation exceeds the document.
    auto apply(std::string_view doc, const Config& cfg = {}) const -> std::string;

    /// Sum of every operation's length change.
    auto length_change() const noexcept -> std::int64_t;

    /// The patch that takes apply(doc) back to `doc`.
    /// @param doc The parent document of this patch.
    auto invert(std::string_view doc, const Config& cfg = {}) const -> Patch;

    /// Run every operation through `simplifier`, dropping those it rejects.
    /// @param doc The parent document of this patch.
    auto simplify(std::string_view doc,
                  const OperationSimplifier& simplifier = default_simplifier,
                  const Config& cfg = {}) const -> Patch;

private:
    std::vector<Operation> operations_{};
    ContentHash parent_hash_;
    bool is_checkpoint_{false};
    mutable InverseLink inverse_{};
};

/// True if both patches hold the same operations. Parent hash, checkpoint
/// flag and inverse link are not compared.
auto equals(const Patch& a, const Patch& b) -> bool;

inline auto operator==(const Patch& a, const Patch& b) -> bool { return equals(a, b); }

/// Sequential composition: `newer` was authored on top of `older` and both
/// share a parent.
///
/// - both checkpoints: an empty patch at the shared parent;
/// - `older` is a checkpoint: a clone of `newer`;
/// - `newer` is a checkpoint: a clone of `older`;
/// - otherwise `older` with every operation of `newer` folded in.
///
/// @throws Error (hash_mismatch) if `older` is a checkpoint and the parents differ.
auto merge(const Patch& older, const Patch& newer, const Config& cfg = {}) -> Patch;

/// Operational transform.
///
/// Both patches were computed against `doc`. Returns a patch anchored at
/// the result of `transform_by` that carries the effect of `to_transform`,
/// so that either replica converges on the same document.
///
/// If a conflict resolver fails, the failure is logged and the result is an
/// empty patch: the edits of `to_transform` are dropped rather than risk
/// divergent replicas.
///
/// @throws Error (hash_mismatch) if the patches have different parents, or
///         if verifying and `doc` is not their parent or the inverse link
///         of `transform_by` does not name the document it produces.
auto transform(const Patch& to_transform, const Patch& transform_by, std::string_view doc,
               const TransformPolicy& policy = {}, const Config& cfg = {}) -> Patch;

/// The per-operation strategy of transform(), without its shortcuts.
auto transform_operations(const Patch& to_transform, const Patch& transform_by,
                          std::string_view doc, const ConflictResolver& resolve,
                          const Config& cfg = {}) -> Patch;

}  // namespace splice_ot
