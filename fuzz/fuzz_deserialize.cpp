// Fuzz target for deserialize() — exercises the packed JSON patch decoder.
// Anything accepted must re-serialize to a patch that decodes identically.

#include <splice-ot/error.hpp>
#include <splice-ot/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto is_checkpoint = size > 0 && (data[0] & 1) != 0;

    try {
        const auto patch = splice_ot::deserialize(text, is_checkpoint);
        const auto again = splice_ot::deserialize(splice_ot::serialize(patch), is_checkpoint);
        if (!(again == patch) || again.parent_hash() != patch.parent_hash()) std::abort();
    } catch (const splice_ot::Error&) {
        // Rejected input is fine; crashes and other exception types are not.
    }
    return 0;
}
