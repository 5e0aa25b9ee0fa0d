// undo_history — local undo on top of a shared document
//
// Keeps a history of local patches, squashes them with merge(), undoes
// the squashed edit with invert(), and rebases the undo over a remote edit
// that arrived in the meantime. Finishes with a checkpoint that resets the
// document.
//
// Build: cmake --build build
// Run:   ./build/undo_history

#include <splice-ot/splice_ot.hpp>

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace ot = splice_ot;

int main() {
    auto doc = std::string{"Dear team,\nthe release is on Friday.\n"};
    std::printf("-- start --\n%s", doc.c_str());

    // -- Record a few local edits ---------------------------------------------
    auto history = std::vector<ot::Patch>{};
    const auto edit = [&](ot::Operation op) {
        auto patch = ot::Patch{ot::ContentHash::of(doc)};
        patch.add_operation(std::move(op));
        doc = patch.apply(doc);
        history.push_back(std::move(patch));
    };
    edit(ot::Operation{5, 4, "all"});
    edit(ot::Operation{28, 6, "Monday"});
    edit(ot::Operation{34, 0, " (tentative)"});
    std::printf("-- after %zu local edits --\n%s", history.size(), doc.c_str());

    // -- Squash the history into one patch ------------------------------------
    auto squashed = history.front().clone();
    for (auto it = history.begin() + 1; it != history.end(); ++it) {
        squashed = ot::merge(squashed, *it);
    }
    std::printf("squashed into %zu operation(s)\n", squashed.size());

    const auto original = std::string{"Dear team,\nthe release is on Friday.\n"};
    const auto undo = squashed.invert(original);

    // -- A remote edit lands before the user hits undo ------------------------
    auto remote = ot::Patch{ot::ContentHash::of(doc)};
    remote.add_operation(ot::Operation{doc.size(), 0, "-- sent from the road\n"});
    const auto rebased_undo = ot::transform(undo, remote, doc);
    doc = remote.apply(doc);
    std::printf("-- with remote edit --\n%s", doc.c_str());

    doc = rebased_undo.apply(doc, ot::Config{ot::Verification::full});
    std::printf("-- after undo --\n%s", doc.c_str());

    // -- Reset everything with a checkpoint -----------------------------------
    const auto reset = ot::Patch::create_checkpoint(doc, "Dear all,\nno release this week.\n");
    doc = reset.apply(doc);
    std::printf("-- after checkpoint --\n%s", doc.c_str());

    return 0;
}
