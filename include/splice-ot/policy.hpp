/// @file policy.hpp
/// @brief Pluggable strategies supplied by the embedding application.
///
/// Every strategy is a plain function value passed at the call site.
/// All of them must be pure and deterministic.

#pragma once

#include <splice-ot/operation.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace splice_ot {

/// The library's own single-operation simplification (Operation::simplify).
using SimplifyStep =
    std::function<std::optional<Operation>(const Operation&, std::string_view)>;

/// Simplifies one operation of a patch against the document state it
/// applies to. Returning nullopt drops the operation. The third argument
/// is the library's own SimplifyStep, for simplifiers that want to
/// post-process or fall back to it.
using OperationSimplifier = std::function<std::optional<Operation>(
    const Operation&, std::string_view, const SimplifyStep&)>;

/// Whole-document merge used by the content-level transform strategy.
/// Arguments are: the result of the patch being transformed, the result of
/// the concurrent patch, and the common base document.
using ContentMerger =
    std::function<std::string(std::string_view, std::string_view, std::string_view)>;

/// Computes the operations turning the first text into the second, in
/// patch order (ascending, non-overlapping, offsets against the first text).
using DiffFunction =
    std::function<std::vector<Operation>(std::string_view, std::string_view)>;

/// Symmetric default conflict resolver.
///
/// If both sides agree, or one side left the region as it was, the other
/// side wins. Otherwise each side is reduced to a single splice of the base
/// text. Splices that do not overlap are both applied; overlapping ones
/// remove everything either side removed and keep both insertions, the
/// earlier-starting one first. Two insertions at the same point are
/// ordered lexicographically.
auto default_resolver(std::string_view ours, std::string_view theirs,
                      std::string_view base) -> std::string;

/// Default simplifier: defers to the library's SimplifyStep.
auto default_simplifier(const Operation& op, std::string_view doc,
                        const SimplifyStep& recurse) -> std::optional<Operation>;

/// Minimal diff: at most one operation, spanning everything between the
/// longest common prefix and suffix of the two texts.
auto common_affix_diff(std::string_view from, std::string_view to) -> std::vector<Operation>;

/// The strategies used by transform().
///
/// With only `resolve` set, patches are transformed operation by operation.
/// With both `merge_content` and `diff` set, the transform instead merges
/// the two resulting documents and diffs the merge against the concurrent
/// result.
struct TransformPolicy {
    ConflictResolver resolve{default_resolver};  ///< Per-operation conflict policy.
    ContentMerger merge_content{};               ///< Optional whole-document merge.
    DiffFunction diff{};                         ///< Optional differ, used with merge_content.

    /// True when the whole-document strategy is selected.
    auto merges_content() const -> bool {
        return static_cast<bool>(merge_content) && static_cast<bool>(diff);
    }
};

}  // namespace splice_ot
