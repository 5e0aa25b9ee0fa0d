// Fuzz target for transform() — seeds random patches from the input and
// checks that two single-operation replicas converge, and that every patch
// inverts back to its parent.

#include <splice-ot/patch.hpp>
#include <splice-ot/random.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <random>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace ot = splice_ot;
    if (size < 4) return 0;

    auto seed = std::seed_seq(data, data + size);
    auto rng = std::mt19937{seed};
    const auto doc = std::string{reinterpret_cast<const char*>(data) + 4, size - 4};
    const auto cfg = ot::Config{ot::Verification::full};

    const auto a = ot::random_patch(doc, rng, 1, cfg);
    const auto b = ot::random_patch(doc, rng, 1, cfg);

    const auto via_b = ot::transform(a, b, doc, {}, cfg).apply(b.apply(doc), cfg);
    const auto via_a = ot::transform(b, a, doc, {}, cfg).apply(a.apply(doc), cfg);
    if (via_a != via_b) std::abort();

    const auto many = ot::random_patch(doc, rng, std::nullopt, cfg);
    if (many.invert(doc, cfg).apply(many.apply(doc), cfg) != doc) std::abort();
    return 0;
}
