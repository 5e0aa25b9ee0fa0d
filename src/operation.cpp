#include <splice-ot/error.hpp>
#include <splice-ot/operation.hpp>

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace splice_ot {

namespace {

auto describe(const Operation& op) -> std::string {
    return "{offset=" + std::to_string(op.offset) +
           ", to_remove=" + std::to_string(op.to_remove) +
           ", to_insert=" + std::to_string(op.to_insert.size()) + " bytes}";
}

void check_range(const Operation& op, std::size_t doc_length) {
    if (op.offset > doc_length || op.to_remove > doc_length - op.offset) {
        throw Error{ErrorKind::out_of_range,
                    "operation " + describe(op) + " exceeds document of length " +
                        std::to_string(doc_length)};
    }
}

// UTF-8 continuation bytes have the bit pattern 10xxxxxx.
auto is_continuation(char c) noexcept -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // anonymous namespace

auto Operation::check(std::optional<std::size_t> doc_length) const -> const Operation& {
    if (to_remove == 0 && to_insert.empty()) {
        throw Error{ErrorKind::invalid_operation,
                    "operation at offset " + std::to_string(offset) + " has no effect"};
    }
    if (doc_length) check_range(*this, *doc_length);
    return *this;
}

auto Operation::apply(std::string_view doc, const Config& cfg) const -> std::string {
    if (cfg.verify()) check();
    check_range(*this, doc.size());

    auto result = std::string{};
    result.reserve(doc.size() - to_remove + to_insert.size());
    result.append(doc.substr(0, offset));
    result.append(to_insert);
    result.append(doc.substr(offset + to_remove));
    return result;
}

auto Operation::invert(std::string_view doc, const Config& cfg) const -> Operation {
    if (cfg.verify()) check();
    check_range(*this, doc.size());
    return Operation{offset, to_insert.size(), std::string{doc.substr(offset, to_remove)}};
}

auto Operation::should_merge(const Operation& newer) const -> bool {
    if (newer.offset < offset) {
        return offset <= newer.offset + newer.to_remove;
    }
    return newer.offset <= offset + to_insert.size();
}

auto Operation::merge(const Operation& newer) const -> std::optional<Operation> {
    if (!should_merge(newer)) {
        throw Error{ErrorKind::invalid_operation,
                    "cannot merge " + describe(newer) + " into " + describe(*this)};
    }

    const auto offset_diff = static_cast<std::int64_t>(newer.offset) -
                             static_cast<std::int64_t>(offset);
    auto out = *this;

    if (newer.to_remove > 0) {
        // The part of newer's removal that falls inside our insertion cancels
        // it; the rest widens our removal.
        const auto inserted = static_cast<std::int64_t>(out.to_insert.size());
        const auto begin = std::clamp<std::int64_t>(offset_diff, 0, inserted);
        const auto end = std::clamp<std::int64_t>(
            offset_diff + static_cast<std::int64_t>(newer.to_remove), 0, inserted);
        const auto eaten = static_cast<std::size_t>(end - begin);
        out.to_insert.erase(static_cast<std::size_t>(begin), eaten);
        out.to_remove += newer.to_remove - eaten;
    }

    if (offset_diff < 0) {
        out.offset = newer.offset;
        out.to_insert.insert(0, newer.to_insert);
    } else {
        out.to_insert.insert(static_cast<std::size_t>(offset_diff), newer.to_insert);
    }

    if (out.to_remove == 0 && out.to_insert.empty()) return std::nullopt;
    return out;
}

auto Operation::rebase(const Operation& newer) const -> Operation {
    if (newer.offset < offset) return newer;
    const auto shifted = static_cast<std::int64_t>(newer.offset) - length_change();
    if (shifted < 0) {
        throw Error{ErrorKind::invalid_operation,
                    "cannot rebase " + describe(newer) + " over " + describe(*this)};
    }
    auto out = newer;
    out.offset = static_cast<std::size_t>(shifted);
    return out;
}

auto Operation::simplify(std::string_view doc) const -> std::optional<Operation> {
    check_range(*this, doc.size());
    const auto removed = doc.substr(offset, to_remove);
    const auto inserted = std::string_view{to_insert};

    auto prefix = std::size_t{0};
    const auto shortest = std::min(removed.size(), inserted.size());
    while (prefix < shortest && removed[prefix] == inserted[prefix]) ++prefix;
    while (prefix > 0 &&
           ((prefix < removed.size() && is_continuation(removed[prefix])) ||
            (prefix < inserted.size() && is_continuation(inserted[prefix])))) {
        --prefix;
    }

    auto suffix = std::size_t{0};
    const auto room = shortest - prefix;
    while (suffix < room &&
           removed[removed.size() - 1 - suffix] == inserted[inserted.size() - 1 - suffix]) {
        ++suffix;
    }
    while (suffix > 0 && is_continuation(inserted[inserted.size() - suffix])) --suffix;

    auto out = Operation{
        offset + prefix,
        to_remove - prefix - suffix,
        std::string{inserted.substr(prefix, inserted.size() - prefix - suffix)},
    };
    if (out.to_remove == 0 && out.to_insert.empty()) return std::nullopt;
    return out;
}

auto make_operation(std::size_t offset, std::size_t to_remove, std::string to_insert,
                    const Config& cfg) -> Operation {
    auto op = Operation{offset, to_remove, std::move(to_insert)};
    if (cfg.verify()) op.check();
    return op;
}

auto is_checkpoint_operation(const Operation& op, std::string_view text) noexcept -> bool {
    return op.offset == 0 && op.to_remove == text.size() && op.to_insert == text;
}

auto transform(std::string_view doc,
               const Operation& to_transform,
               const Operation& concurrent,
               const ConflictResolver& resolve,
               const Config& cfg) -> std::optional<Operation> {
    if (cfg.verify()) {
        to_transform.check(doc.size());
        concurrent.check(doc.size());
    }
    check_range(to_transform, doc.size());
    check_range(concurrent, doc.size());

    const auto a0 = to_transform.offset;
    const auto a1 = a0 + to_transform.to_remove;
    const auto b0 = concurrent.offset;
    const auto b1 = b0 + concurrent.to_remove;

    // Two insertions at the same point have no natural order and go to the
    // resolver; everything else that does not overlap is a plain shift.
    const auto same_point = a0 == a1 && b0 == b1 && a0 == b0;
    if (!same_point) {
        if (a1 <= b0) return to_transform;
        if (a0 >= b1) {
            auto out = to_transform;
            out.offset = static_cast<std::size_t>(
                static_cast<std::int64_t>(a0) + concurrent.length_change());
            return out;
        }
    }

    const auto u0 = std::min(a0, b0);
    const auto u1 = std::max(a1, b1);
    const auto base = doc.substr(u0, u1 - u0);

    auto text_a = std::string{doc.substr(u0, a0 - u0)};
    text_a += to_transform.to_insert;
    text_a += doc.substr(a1, u1 - a1);

    auto text_b = std::string{doc.substr(u0, b0 - u0)};
    text_b += concurrent.to_insert;
    text_b += doc.substr(b1, u1 - b1);

    auto merged = std::string{};
    try {
        merged = resolve(text_a, text_b, base);
    } catch (const std::exception& e) {
        throw Error{ErrorKind::resolver_failure,
                    std::string{"conflict resolver failed: "} + e.what()};
    }

    if (merged == text_b) return std::nullopt;

    auto out = Operation{u0, text_b.size(), std::move(merged)};
    if (cfg.verify()) {
        out.check(static_cast<std::size_t>(
            static_cast<std::int64_t>(doc.size()) + concurrent.length_change()));
    }
    return out;
}

}  // namespace splice_ot
