#include <splice-ot/error.hpp>
#include <splice-ot/operation.hpp>
#include <splice-ot/policy.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

using namespace splice_ot;

namespace {

const auto doc = std::string{"abcdefgh"};

auto apply_opt(const std::optional<Operation>& op, const std::string& text) -> std::string {
    return op ? op->apply(text) : text;
}

// Applies a then b', and b then a', and checks both orders agree.
auto converge(const Operation& a, const Operation& b,
              const ConflictResolver& resolve = default_resolver) -> std::string {
    const auto a_prime = transform(doc, a, b, resolve);
    const auto b_prime = transform(doc, b, a, resolve);
    const auto via_b = apply_opt(a_prime, b.apply(doc));
    const auto via_a = apply_opt(b_prime, a.apply(doc));
    EXPECT_EQ(via_a, via_b);
    return via_a;
}

}  // namespace

TEST(OperationTransform, earlier_operation_is_unchanged) {
    const auto a = Operation{1, 1, "X"};
    const auto b = Operation{5, 1, "Y"};
    EXPECT_EQ(transform(doc, a, b, default_resolver), a);
}

TEST(OperationTransform, later_operation_is_shifted) {
    const auto a = Operation{5, 1, "Y"};
    const auto b = Operation{1, 1, "XX"};
    EXPECT_EQ(transform(doc, a, b, default_resolver), (Operation{6, 1, "Y"}));
}

TEST(OperationTransform, disjoint_edits_converge) {
    EXPECT_EQ(converge(Operation{1, 1, "X"}, Operation{5, 2, "YYY"}), "aXcdeYYYh");
}

TEST(OperationTransform, insert_at_start_and_end_converge) {
    EXPECT_EQ(converge(Operation{0, 0, "foo"}, Operation{8, 0, "bar"}), "fooabcdefghbar");
}

TEST(OperationTransform, touching_edits_converge) {
    // a's removed range ends exactly where b's begins
    EXPECT_EQ(converge(Operation{2, 2, "X"}, Operation{4, 2, "Y"}), "abXYgh");
    // insertion right where a deletion starts stays in front of it
    EXPECT_EQ(converge(Operation{3, 0, "X"}, Operation{3, 2, ""}), "abcXfgh");
}

TEST(OperationTransform, same_point_insertions_use_resolver) {
    const auto a = Operation{3, 0, "foo"};
    const auto b = Operation{3, 0, "bar"};
    EXPECT_EQ(transform(doc, a, b, default_resolver), (Operation{3, 3, "barfoo"}));
    EXPECT_EQ(converge(a, b), "abcbarfoodefgh");
}

TEST(OperationTransform, identical_insertions_collapse) {
    const auto a = Operation{3, 0, "x"};
    EXPECT_FALSE(transform(doc, a, a, default_resolver).has_value());
    EXPECT_EQ(converge(a, a), "abcxdefgh");
}

TEST(OperationTransform, identical_deletions_are_subsumed) {
    const auto a = Operation{2, 3, ""};
    EXPECT_FALSE(transform(doc, a, a, default_resolver).has_value());
    EXPECT_EQ(converge(a, a), "abfgh");
}

TEST(OperationTransform, overlapping_deletions_remove_union) {
    const auto a = Operation{1, 3, ""};  // bcd
    const auto b = Operation{2, 3, ""};  // cde
    EXPECT_EQ(transform(doc, a, b, default_resolver), (Operation{1, 1, ""}));
    EXPECT_EQ(converge(a, b), "afgh");
}

TEST(OperationTransform, insertion_inside_concurrent_deletion_survives) {
    const auto a = Operation{3, 0, "X"};
    const auto b = Operation{2, 3, ""};
    EXPECT_EQ(transform(doc, a, b, default_resolver), (Operation{2, 0, "X"}));
    EXPECT_EQ(converge(a, b), "abXfgh");
}

TEST(OperationTransform, resolver_sees_region_versions) {
    auto seen_ours = std::string{};
    auto seen_theirs = std::string{};
    auto seen_base = std::string{};
    const auto spy = ConflictResolver{
        [&](std::string_view ours, std::string_view theirs, std::string_view base) {
            seen_ours = ours;
            seen_theirs = theirs;
            seen_base = base;
            return std::string{theirs};
        }};

    const auto result = transform(doc, Operation{2, 2, "X"}, Operation{3, 2, "Y"}, spy);
    EXPECT_EQ(seen_base, "cde");
    EXPECT_EQ(seen_ours, "Xe");
    EXPECT_EQ(seen_theirs, "cY");
    EXPECT_FALSE(result.has_value());
}

TEST(OperationTransform, resolver_failure_is_reported) {
    const auto failing = ConflictResolver{
        [](std::string_view, std::string_view, std::string_view) -> std::string {
            throw std::runtime_error{"no policy for this"};
        }};
    try {
        (void)transform(doc, Operation{3, 0, "a"}, Operation{3, 0, "b"}, failing);
        FAIL() << "expected Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::resolver_failure);
    }
}

TEST(OperationTransform, resolver_not_consulted_without_conflict) {
    auto calls = 0;
    const auto counting = ConflictResolver{
        [&](std::string_view ours, std::string_view, std::string_view) {
            ++calls;
            return std::string{ours};
        }};
    (void)transform(doc, Operation{0, 1, "A"}, Operation{6, 1, "G"}, counting);
    EXPECT_EQ(calls, 0);
}

TEST(OperationTransform, verification_rejects_out_of_range) {
    const auto cfg = Config{Verification::full};
    EXPECT_THROW((void)transform(doc, Operation{7, 3, ""}, Operation{0, 1, ""},
                                 default_resolver, cfg),
                 Error);
}
