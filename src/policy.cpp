#include <splice-ot/policy.hpp>

#include <algorithm>
#include <utility>

namespace splice_ot {

namespace {

auto common_prefix(std::string_view a, std::string_view b) -> std::size_t {
    auto n = std::size_t{0};
    const auto limit = std::min(a.size(), b.size());
    while (n < limit && a[n] == b[n]) ++n;
    return n;
}

auto common_suffix(std::string_view a, std::string_view b, std::size_t limit) -> std::size_t {
    auto n = std::size_t{0};
    while (n < limit && a[a.size() - 1 - n] == b[b.size() - 1 - n]) ++n;
    return n;
}

auto is_continuation(std::string_view s, std::size_t at) -> bool {
    return at < s.size() && (static_cast<unsigned char>(s[at]) & 0xC0) == 0x80;
}

// One side's edit of the base text: base[begin, end) became `text`.
struct Hunk {
    std::size_t begin;
    std::size_t end;
    std::string_view text;

    auto operator<(const Hunk& other) const -> bool {
        if (begin != other.begin) return begin < other.begin;
        if (end != other.end) return end < other.end;
        return text < other.text;
    }
};

// The single splice turning `base` into `side`, cut at UTF-8 boundaries.
auto hunk_of(std::string_view side, std::string_view base) -> Hunk {
    auto prefix = common_prefix(side, base);
    while (prefix > 0 && (is_continuation(side, prefix) || is_continuation(base, prefix))) {
        --prefix;
    }
    const auto room = std::min(side.size(), base.size()) - prefix;
    auto suffix = common_suffix(side, base, room);
    while (suffix > 0 && is_continuation(side, side.size() - suffix)) --suffix;
    return Hunk{prefix, base.size() - suffix, side.substr(prefix, side.size() - prefix - suffix)};
}

}  // anonymous namespace

auto default_resolver(std::string_view ours, std::string_view theirs,
                      std::string_view base) -> std::string {
    if (ours == theirs) return std::string{ours};
    if (ours == base) return std::string{theirs};
    if (theirs == base) return std::string{ours};

    // Order the two edits by position so the result does not depend on
    // which side is asking.
    auto first = hunk_of(ours, base);
    auto second = hunk_of(theirs, base);
    if (second < first) std::swap(first, second);

    const auto same_point = first.begin == first.end && second.begin == second.end &&
                            first.begin == second.begin;

    auto out = std::string{base.substr(0, first.begin)};
    out += first.text;
    if (first.end <= second.begin && !same_point) {
        out += base.substr(first.end, second.begin - first.end);
        out += second.text;
        out += base.substr(second.end);
    } else {
        // Overlapping edits: whatever either side removed stays removed and
        // both insertions are kept.
        out += second.text;
        out += base.substr(std::max(first.end, second.end));
    }
    return out;
}

auto default_simplifier(const Operation& op, std::string_view doc,
                        const SimplifyStep& recurse) -> std::optional<Operation> {
    return recurse(op, doc);
}

auto common_affix_diff(std::string_view from, std::string_view to) -> std::vector<Operation> {
    if (from == to) return {};
    auto prefix = common_prefix(from, to);
    while (prefix > 0 && (is_continuation(from, prefix) || is_continuation(to, prefix))) {
        --prefix;
    }
    const auto room = std::min(from.size(), to.size()) - prefix;
    auto suffix = common_suffix(from, to, room);
    while (suffix > 0 && (is_continuation(from, from.size() - suffix) ||
                          is_continuation(to, to.size() - suffix))) {
        --suffix;
    }
    return {Operation{
        prefix,
        from.size() - prefix - suffix,
        std::string{to.substr(prefix, to.size() - prefix - suffix)},
    }};
}

}  // namespace splice_ot
