#include <splice-ot/error.hpp>
#include <splice-ot/patch.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace splice_ot {

namespace {

// The hash of the document transform_by produces. An inverse already knows
// it, and a checkpoint that restates its parent produces its parent.
auto result_hash(const Patch& transform_by, std::string_view doc, const std::string& result,
                 const Config& cfg) -> ContentHash {
    const auto& link = transform_by.inverse_link();
    if (link.target()) {
        if (cfg.verify() && ContentHash::of(result) != *link.target()) {
            throw Error{ErrorKind::hash_mismatch,
                        "inverse link " + link.target()->to_hex() +
                            " does not match the document the inverse produces"};
        }
        return *link.target();
    }
    if (link.state() == InverseLink::State::baseline_identity && result == doc) {
        return transform_by.parent_hash();
    }
    return ContentHash::of(result);
}

}  // anonymous namespace

auto transform_operations(const Patch& to_transform, const Patch& transform_by,
                          std::string_view doc, const ConflictResolver& resolve,
                          const Config& cfg) -> Patch {
    auto& log = cfg.log();
    const auto& by_ops = transform_by.operations();

    // before[j] is the document by_ops[j] was written against once the
    // higher operations of transform_by have been applied.
    auto before = std::vector<std::string>(by_ops.size());
    auto text = std::string{doc};
    for (auto j = by_ops.size(); j-- > 0;) {
        before[j] = text;
        text = by_ops[j].apply(text, cfg);
    }
    const auto& result_of_transform_by = text;

    auto out = Patch{result_hash(transform_by, doc, result_of_transform_by, cfg)};
    const auto& ops = to_transform.operations();
    for (auto i = ops.size(); i-- > 0;) {
        if (is_checkpoint_operation(ops[i], doc)) {
            log.debug("skipping checkpoint operation {} of patch being transformed", i);
            continue;
        }
        auto op = std::optional<Operation>{ops[i]};
        for (auto j = by_ops.size(); j-- > 0;) {
            if (is_checkpoint_operation(by_ops[j], before[j])) {
                log.debug("skipping checkpoint operation {} of concurrent patch", j);
                continue;
            }
            log.trace("transform [{}, {}, +{}] against [{}, {}, +{}]",
                      op->offset, op->to_remove, op->to_insert.size(),
                      by_ops[j].offset, by_ops[j].to_remove, by_ops[j].to_insert.size());
            try {
                op = transform(before[j], *op, by_ops[j], resolve, cfg);
            } catch (const Error& e) {
                if (e.kind() != ErrorKind::resolver_failure) throw;
                log.error("conflict resolver threw, dropping the transformed patch: {}",
                          e.what());
                return Patch{out.parent_hash()};
            }
            if (!op) break;
        }
        if (!op) continue;
        if (cfg.verify()) op->check(result_of_transform_by.size());
        out.add_operation(std::move(*op), cfg);
    }

    if (cfg.verify()) out.check(result_of_transform_by.size());
    return out;
}

auto transform(const Patch& to_transform, const Patch& transform_by, std::string_view doc,
               const TransformPolicy& policy, const Config& cfg) -> Patch {
    if (cfg.verify()) {
        to_transform.check(doc.size());
        transform_by.check(doc.size());
        if (ContentHash::of(doc) != to_transform.parent_hash()) {
            throw Error{ErrorKind::hash_mismatch,
                        "document does not match parent " + to_transform.parent_hash().to_hex()};
        }
    }
    if (to_transform.parent_hash() != transform_by.parent_hash()) {
        throw Error{ErrorKind::hash_mismatch,
                    "cannot transform " + to_transform.parent_hash().to_hex() +
                        " against " + transform_by.parent_hash().to_hex()};
    }

    if (transform_by.empty()) return to_transform.clone();
    if (to_transform.empty()) {
        return Patch{ContentHash::of(transform_by.apply(doc, cfg))};
    }

    if (policy.merges_content()) {
        const auto ours = to_transform.apply(doc, cfg);
        const auto theirs = transform_by.apply(doc, cfg);
        const auto merged = policy.merge_content(ours, theirs, doc);

        auto out = Patch{ContentHash::of(theirs)};
        const auto ops = policy.diff(theirs, merged);
        for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
            out.add_operation(*it, cfg);
        }
        if (cfg.verify()) out.check(theirs.size());
        return out;
    }

    return transform_operations(to_transform, transform_by, doc, policy.resolve, cfg);
}

}  // namespace splice_ot
