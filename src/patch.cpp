#include <splice-ot/error.hpp>
#include <splice-ot/patch.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace splice_ot {

namespace {

void verify_parent(const Patch& patch, std::string_view doc) {
    if (ContentHash::of(doc) != patch.parent_hash()) {
        throw Error{ErrorKind::hash_mismatch,
                    "document does not match patch parent " + patch.parent_hash().to_hex()};
    }
}

}  // anonymous namespace

// -- InverseLink --------------------------------------------------------------

void InverseLink::mark_baseline_identity() {
    if (is_set()) throw Error{ErrorKind::invalid_patch, "inverse link is already set"};
    state_ = State::baseline_identity;
}

void InverseLink::link(const ContentHash& inverted_parent) {
    if (is_set()) throw Error{ErrorKind::invalid_patch, "inverse link is already set"};
    state_ = State::inverse_of;
    target_ = inverted_parent;
}

// -- Patch --------------------------------------------------------------------

Patch::Patch(ContentHash parent_hash, bool is_checkpoint)
    : parent_hash_{parent_hash}, is_checkpoint_{is_checkpoint} {
    if (is_checkpoint_) inverse_.mark_baseline_identity();
}

auto Patch::from_operations(ContentHash parent_hash, std::vector<Operation> operations,
                            bool is_checkpoint) -> Patch {
    auto out = Patch{parent_hash, is_checkpoint};
    out.operations_ = std::move(operations);
    out.check();
    return out;
}

auto Patch::create_checkpoint(std::string_view old_content, std::string_view new_content,
                              std::optional<ContentHash> old_hash,
                              const Config& cfg) -> Patch {
    auto op = Operation{0, old_content.size(), std::string{new_content}};
    op.check();

    const auto actual = ContentHash::of(old_content);
    if (old_hash && *old_hash != actual) {
        throw Error{ErrorKind::hash_mismatch,
                    "checkpoint parent hash " + old_hash->to_hex() +
                        " does not match content hash " + actual.to_hex()};
    }

    auto out = Patch{actual, true};
    out.operations_.push_back(std::move(op));
    if (cfg.verify()) out.check(old_content.size());
    return out;
}

void Patch::link_inverse_of(const Patch& original) const {
    inverse_.link(original.parent_hash());
}

auto Patch::check(std::optional<std::size_t> doc_length) const -> const Patch& {
    for (std::size_t i = 0; i < operations_.size(); ++i) {
        operations_[i].check(doc_length);
        if (i == 0) continue;
        const auto& prev = operations_[i - 1];
        const auto& op = operations_[i];
        if (op.offset <= prev.offset || prev.to_remove >= op.offset - prev.offset) {
            throw Error{ErrorKind::invalid_patch,
                        "operations " + std::to_string(i - 1) + " and " + std::to_string(i) +
                            " are out of order or should have been merged"};
        }
    }
    if (is_checkpoint_) {
        if (operations_.size() != 1) {
            throw Error{ErrorKind::invalid_patch,
                        "checkpoint must hold exactly one operation, has " +
                            std::to_string(operations_.size())};
        }
        const auto& op = operations_.front();
        if (op.offset != 0) {
            throw Error{ErrorKind::invalid_patch, "checkpoint operation must start at offset 0"};
        }
        if (doc_length && op.to_remove != *doc_length) {
            throw Error{ErrorKind::invalid_patch,
                        "checkpoint removes " + std::to_string(op.to_remove) +
                            " bytes of a " + std::to_string(*doc_length) + " byte document"};
        }
    }
    return *this;
}

void Patch::add_operation(Operation op, const Config& cfg) {
    if (cfg.verify()) {
        check();
        op.check();
    }

    // Work on a copy so that a failure leaves the patch untouched.
    auto ops = operations_;
    auto placed = false;
    for (std::size_t i = 0; i < ops.size();) {
        if (ops[i].should_merge(op)) {
            auto merged = ops[i].merge(op);
            ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(i));
            if (!merged) {
                placed = true;
                break;
            }
            op = std::move(*merged);
            continue;
        }
        if (op.offset < ops[i].offset) {
            ops.insert(ops.begin() + static_cast<std::ptrdiff_t>(i), std::move(op));
            placed = true;
            break;
        }
        // op lies past ops[i]; look at it from ops[i]'s side of the edit.
        op = ops[i].rebase(op);
        ++i;
    }
    if (!placed) ops.push_back(std::move(op));

    operations_ = std::move(ops);
    if (cfg.verify()) check();
}

auto Patch::clone() const -> Patch {
    auto out = Patch{parent_hash_, is_checkpoint_};
    out.operations_ = operations_;
    return out;
}

auto Patch::apply(std::string_view doc, const Config& cfg) const -> std::string {
    if (cfg.verify()) {
        check(doc.size());
        verify_parent(*this, doc);
    }

    // Applying from the highest offset down leaves every lower offset valid,
    // so the result can be assembled front to back in a single pass.
    auto result = std::string{};
    result.reserve(static_cast<std::size_t>(
        std::max<std::int64_t>(0, static_cast<std::int64_t>(doc.size()) + length_change())));
    auto cursor = std::size_t{0};
    for (const auto& op : operations_) {
        if (op.offset < cursor || op.offset > doc.size() ||
            op.to_remove > doc.size() - op.offset) {
            throw Error{ErrorKind::out_of_range,
                        "operation at offset " + std::to_string(op.offset) +
                            " does not fit a " + std::to_string(doc.size()) + " byte document"};
        }
        result.append(doc.substr(cursor, op.offset - cursor));
        result.append(op.to_insert);
        cursor = op.offset + op.to_remove;
    }
    result.append(doc.substr(cursor));
    return result;
}

auto Patch::length_change() const noexcept -> std::int64_t {
    auto out = std::int64_t{0};
    for (const auto& op : operations_) out += op.length_change();
    return out;
}

auto Patch::invert(std::string_view doc, const Config& cfg) const -> Patch {
    if (cfg.verify()) {
        check(doc.size());
        verify_parent(*this, doc);
    }
    const auto result = apply(doc);

    // An inverse operation lives in the edited document, where everything
    // below it has moved by the length change of the operations below it.
    auto inverted = std::vector<Operation>{};
    inverted.reserve(operations_.size());
    auto shift = std::int64_t{0};
    for (const auto& op : operations_) {
        auto inv = op.invert(doc);
        inv.offset = static_cast<std::size_t>(static_cast<std::int64_t>(inv.offset) + shift);
        shift += op.length_change();
        inverted.push_back(std::move(inv));
    }

    auto out = from_operations(ContentHash::of(result), std::move(inverted), is_checkpoint_);
    if (!is_checkpoint_) out.link_inverse_of(*this);
    if (cfg.verify()) out.check(result.size());
    return out;
}

auto Patch::simplify(std::string_view doc, const OperationSimplifier& simplifier,
                     const Config& cfg) const -> Patch {
    if (cfg.verify()) {
        check(doc.size());
        verify_parent(*this, doc);
    }

    const auto recurse = SimplifyStep{[](const Operation& op, std::string_view text) {
        return op.simplify(text);
    }};

    auto kept = std::vector<Operation>{};
    auto text = std::string{doc};
    for (auto it = operations_.rbegin(); it != operations_.rend(); ++it) {
        auto out = simplifier(*it, text, recurse);
        if (!out) continue;
        text = out->apply(text, cfg);
        kept.push_back(std::move(*out));
    }
    std::reverse(kept.begin(), kept.end());
    return from_operations(parent_hash_, std::move(kept));
}

auto equals(const Patch& a, const Patch& b) -> bool {
    return a.operations() == b.operations();
}

auto merge(const Patch& older, const Patch& newer, const Config& cfg) -> Patch {
    if (cfg.verify()) {
        older.check();
        newer.check();
    }
    if (older.is_checkpoint()) {
        if (newer.parent_hash() != older.parent_hash()) {
            throw Error{ErrorKind::hash_mismatch, "cannot merge patches with different parents"};
        }
        if (newer.is_checkpoint()) return Patch{older.parent_hash()};
        return newer.clone();
    }
    if (newer.is_checkpoint()) return older.clone();

    auto out = older.clone();
    const auto& ops = newer.operations();
    for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
        out.add_operation(*it, cfg);
    }
    return out;
}

}  // namespace splice_ot
