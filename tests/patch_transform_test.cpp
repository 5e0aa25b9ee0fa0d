#include <splice-ot/error.hpp>
#include <splice-ot/patch.hpp>
#include <splice-ot/policy.hpp>

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace splice_ot;

namespace {

const auto sentence = std::string{"The quick brown fox jumps over the lazy dog"};
const auto paranoid = Config{Verification::full};

auto patch_of(std::string_view doc, std::vector<Operation> ops) -> Patch {
    return Patch::from_operations(ContentHash::of(doc), std::move(ops));
}

// Both replicas' final documents, checked against each other.
auto converge(const Patch& a, const Patch& b, std::string_view doc,
              const TransformPolicy& policy = {}) -> std::string {
    const auto a_prime = splice_ot::transform(a, b, doc, policy, paranoid);
    const auto b_prime = splice_ot::transform(b, a, doc, policy, paranoid);
    const auto via_b = a_prime.apply(b.apply(doc), paranoid);
    const auto via_a = b_prime.apply(a.apply(doc), paranoid);
    EXPECT_EQ(via_a, via_b);
    return via_a;
}

}  // namespace

// =============================================================================
// Shortcuts and preconditions
// =============================================================================

TEST(PatchTransform, against_empty_patch_is_unchanged) {
    const auto a = patch_of(sentence, {Operation{4, 5, "slow"}});
    const auto by = Patch{ContentHash::of(sentence)};
    const auto out = splice_ot::transform(a, by, sentence);
    EXPECT_EQ(out, a);
    EXPECT_EQ(out.parent_hash(), a.parent_hash());
}

TEST(PatchTransform, empty_patch_moves_to_concurrent_result) {
    const auto empty = Patch{ContentHash::of(sentence)};
    const auto by = patch_of(sentence, {Operation{0, 3, "A"}});
    const auto out = splice_ot::transform(empty, by, sentence);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(out.parent_hash(), ContentHash::of(by.apply(sentence)));
}

TEST(PatchTransform, different_parents_are_rejected) {
    const auto a = patch_of("one", {Operation{0, 0, "x"}});
    const auto b = patch_of("two", {Operation{0, 0, "y"}});
    try {
        (void)splice_ot::transform(a, b, "one");
        FAIL() << "expected Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::hash_mismatch);
    }
}

TEST(PatchTransform, verification_rejects_wrong_document) {
    const auto a = patch_of(sentence, {Operation{0, 0, "x"}});
    const auto b = patch_of(sentence, {Operation{1, 0, "y"}});
    EXPECT_THROW((void)splice_ot::transform(a, b, "not the sentence", {}, paranoid), Error);
}

// =============================================================================
// Convergence
// =============================================================================

TEST(PatchTransform, insertions_at_both_ends) {
    const auto doc = std::string{"middle"};
    const auto a = patch_of(doc, {Operation{0, 0, "foo"}});
    const auto b = patch_of(doc, {Operation{6, 0, "bar"}});

    const auto a_prime = splice_ot::transform(a, b, doc);
    EXPECT_EQ(a_prime.parent_hash(), ContentHash::of("middlebar"));
    EXPECT_EQ(a_prime.operations(), a.operations());
    EXPECT_EQ(converge(a, b, doc), "foomiddlebar");
}

TEST(PatchTransform, interleaved_disjoint_edits) {
    const auto a = patch_of(sentence, {Operation{4, 5, "slow"}, Operation{35, 4, "happy"}});
    const auto b = patch_of(sentence, {Operation{10, 5, "red"}, Operation{40, 3, "cat"}});

    const auto a_prime = splice_ot::transform(a, b, sentence);
    EXPECT_EQ(a_prime.operations(),
              (std::vector<Operation>{Operation{4, 5, "slow"}, Operation{33, 4, "happy"}}));
    EXPECT_EQ(converge(a, b, sentence), "The slow red fox jumps over the happy cat");
}

TEST(PatchTransform, same_point_insertions) {
    const auto a = patch_of(sentence, {Operation{0, 0, "foo"}});
    const auto b = patch_of(sentence, {Operation{0, 0, "bar"}});
    EXPECT_EQ(converge(a, b, sentence), "barfoo" + sentence);
}

TEST(PatchTransform, overlapping_deletions) {
    const auto doc = std::string{"abcdefgh"};
    const auto a = patch_of(doc, {Operation{1, 3, ""}});
    const auto b = patch_of(doc, {Operation{2, 3, ""}});
    EXPECT_EQ(converge(a, b, doc), "afgh");
}

TEST(PatchTransform, identical_patches_collapse) {
    const auto a = patch_of(sentence, {Operation{4, 5, "slow"}});
    const auto a_prime = splice_ot::transform(a, a, sentence);
    EXPECT_TRUE(a_prime.empty());
    EXPECT_EQ(converge(a, a, sentence), a.apply(sentence));
}

// =============================================================================
// Checkpoints and inverses
// =============================================================================

TEST(PatchTransform, unchanged_checkpoint_is_skipped) {
    const auto a = patch_of(sentence, {Operation{4, 5, "slow"}});
    const auto cp = Patch::create_checkpoint(sentence, sentence);

    const auto out = splice_ot::transform(a, cp, sentence, {}, paranoid);
    EXPECT_EQ(out, a);
    EXPECT_EQ(out.parent_hash(), ContentHash::of(sentence));
}

TEST(PatchTransform, unchanged_checkpoint_contributes_nothing) {
    const auto cp = Patch::create_checkpoint(sentence, sentence);
    const auto b = patch_of(sentence, {Operation{0, 3, "A"}});

    const auto out = splice_ot::transform(cp, b, sentence, {}, paranoid);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(out.parent_hash(), ContentHash::of(b.apply(sentence)));
}

TEST(PatchTransform, inverse_reuses_recorded_anchor) {
    const auto original = patch_of(sentence, {Operation{0, 3, "A"}});
    const auto edited = original.apply(sentence);
    const auto undo = original.invert(sentence);
    const auto concurrent = patch_of(edited, {Operation{edited.size(), 0, "!"}});

    const auto out = splice_ot::transform(concurrent, undo, edited);
    EXPECT_EQ(out.parent_hash(), original.parent_hash());
    EXPECT_EQ(out.apply(sentence, paranoid), sentence + "!");
}

TEST(PatchTransform, anchor_taken_from_inverse_link) {
    // The anchor is read from the link, not recomputed from the content.
    const auto doc = std::string{"abc"};
    const auto elsewhere = patch_of("unrelated", {Operation{0, 0, "x"}});
    const auto by = patch_of(doc, {Operation{0, 1, "A"}});
    by.link_inverse_of(elsewhere);

    const auto out = splice_ot::transform(patch_of(doc, {Operation{3, 0, "d"}}), by, doc);
    EXPECT_EQ(out.parent_hash(), ContentHash::of("unrelated"));
}

TEST(PatchTransform, verification_rejects_stale_inverse_link) {
    const auto doc = std::string{"abc"};
    const auto elsewhere = patch_of("unrelated", {Operation{0, 0, "x"}});
    const auto by = patch_of(doc, {Operation{0, 1, "A"}});
    by.link_inverse_of(elsewhere);

    try {
        (void)splice_ot::transform(patch_of(doc, {Operation{3, 0, "d"}}), by, doc, {}, paranoid);
        FAIL() << "expected Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::hash_mismatch);
    }
}

TEST(PatchTransform, verification_accepts_genuine_inverse) {
    const auto original = patch_of(sentence, {Operation{0, 3, "A"}});
    const auto edited = original.apply(sentence);
    const auto undo = original.invert(sentence);
    const auto concurrent = patch_of(edited, {Operation{10, 1, "a"}});

    const auto out = splice_ot::transform(concurrent, undo, edited, {}, paranoid);
    EXPECT_EQ(out.parent_hash(), ContentHash::of(sentence));
}

// =============================================================================
// Policies
// =============================================================================

TEST(PatchTransform, resolver_failure_drops_patch_and_logs) {
    auto stream = std::ostringstream{};
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
    auto cfg = Config{Verification::off, std::make_shared<spdlog::logger>("transform_test", sink)};

    auto policy = TransformPolicy{};
    policy.resolve = [](std::string_view, std::string_view, std::string_view) -> std::string {
        throw std::runtime_error{"refusing to merge"};
    };

    const auto a = patch_of(sentence, {Operation{0, 0, "foo"}, Operation{20, 5, "leaps"}});
    const auto b = patch_of(sentence, {Operation{0, 0, "bar"}});

    const auto out = splice_ot::transform(a, b, sentence, policy, cfg);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(out.parent_hash(), ContentHash::of("bar" + sentence));
    EXPECT_NE(stream.str().find("refusing to merge"), std::string::npos);
}

TEST(PatchTransform, custom_resolver_decides_conflicts) {
    const auto doc = std::string{"abcdefgh"};
    const auto a = patch_of(doc, {Operation{2, 2, "X"}});
    const auto b = patch_of(doc, {Operation{3, 2, "Y"}});

    // Concurrent side always wins.
    auto policy = TransformPolicy{};
    policy.resolve = [](std::string_view, std::string_view theirs, std::string_view) {
        return std::string{theirs};
    };
    EXPECT_TRUE(splice_ot::transform(a, b, doc, policy).empty());
}

TEST(PatchTransform, whole_document_strategy) {
    const auto doc = std::string{"hello world"};
    const auto a = patch_of(doc, {Operation{0, 5, "HELLO"}});
    const auto b = patch_of(doc, {Operation{6, 5, "WORLD"}});

    auto policy = TransformPolicy{};
    policy.merge_content = default_resolver;
    policy.diff = common_affix_diff;

    const auto a_prime = splice_ot::transform(a, b, doc, policy, paranoid);
    EXPECT_EQ(a_prime.parent_hash(), ContentHash::of("hello WORLD"));
    EXPECT_EQ(a_prime.operations(), (std::vector<Operation>{Operation{0, 5, "HELLO"}}));
    EXPECT_EQ(converge(a, b, doc, policy), "HELLO WORLD");
}
