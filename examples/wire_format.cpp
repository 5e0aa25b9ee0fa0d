// wire_format — packing patches for transport
//
// Serializes a patch to its compact JSON form, parses it back on the
// "receiving" side, and shows how malformed input is reported.
//
// Build: cmake --build build
// Run:   ./build/wire_format

#include <splice-ot/splice_ot.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <random>
#include <string>

namespace ot = splice_ot;

int main() {
    const auto doc = std::string{"int main() { return 0; }"};

    auto patch = ot::Patch{ot::ContentHash::of(doc)};
    patch.add_operation(ot::Operation{20, 1, "42"});
    patch.add_operation(ot::Operation{9, 0, "int argc, char** argv"});

    // -- Sender ---------------------------------------------------------------
    const auto wire = ot::serialize(patch);
    std::printf("wire:   %s\n", wire.c_str());
    std::printf("pretty: %s\n", ot::to_obj(patch).dump(2).c_str());

    // -- Receiver -------------------------------------------------------------
    const auto received = ot::deserialize(wire);
    std::printf("same operations: %s\n", received == patch ? "yes" : "no");
    std::printf("applied: %s\n",
                received.apply(doc, ot::Config{ot::Verification::full}).c_str());

    // -- A checkpoint travels the same way; the flag comes from context -------
    const auto cp = ot::Patch::create_checkpoint(doc, "int main() {}");
    const auto cp_received = ot::deserialize(ot::serialize(cp), /*is_checkpoint=*/true);
    std::printf("checkpoint: %s\n", cp_received.apply(doc).c_str());

    // -- Rejections -----------------------------------------------------------
    for (const auto* bad : {"[", "[[3, 0, \"\"], \"00\"]", "[[9, 1, \"a\"], [2, 0, \"b\"]]"}) {
        try {
            (void)ot::deserialize(bad);
            std::printf("accepted?! %s\n", bad);
            return 1;
        } catch (const ot::Error& e) {
            std::printf("rejected (%s): %s\n",
                        std::string{ot::to_string_view(e.kind())}.c_str(), e.what());
        }
    }

    // -- Random patches for load testing --------------------------------------
    auto rng = std::mt19937{2024};
    const auto fuzzed = ot::random_patch(doc, rng, 5);
    std::printf("random: %s\n", ot::serialize(fuzzed).c_str());

    return 0;
}
