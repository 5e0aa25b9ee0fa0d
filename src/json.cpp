#include <splice-ot/error.hpp>
#include <splice-ot/json.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace splice_ot {

namespace {

[[noreturn]] void decoding_error(const std::string& what) {
    throw Error{ErrorKind::decoding_error, what};
}

// Diagnostic rendering; invalid UTF-8 in the input is replaced, not thrown.
auto describe(const nlohmann::json& j) -> std::string {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json::array({op.offset, op.to_remove, op.to_insert});
}

void from_json(const nlohmann::json& j, Operation& op) {
    if (!j.is_array() || j.size() != 3) {
        decoding_error("operation must be a 3 element array, got " + describe(j));
    }
    if (!j[0].is_number_unsigned() || !j[1].is_number_unsigned() || !j[2].is_string()) {
        decoding_error("operation must be [offset, to_remove, to_insert], got " + describe(j));
    }
    op = Operation{
        j[0].get<std::size_t>(),
        j[1].get<std::size_t>(),
        j[2].get<std::string>(),
    };
}

void to_json(nlohmann::json& j, const ContentHash& h) {
    j = h.to_hex();
}

void from_json(const nlohmann::json& j, ContentHash& h) {
    if (!j.is_string()) decoding_error("content hash must be a string, got " + describe(j));
    const auto& hex = j.get_ref<const std::string&>();
    if (!ContentHash::is_valid_hex(hex)) decoding_error("malformed content hash \"" + hex + "\"");
    h = ContentHash::from_hex(hex);
}

// =============================================================================
// Patch packing
// =============================================================================

auto to_obj(const Patch& patch, const Config& cfg) -> nlohmann::json {
    if (cfg.verify()) patch.check();
    auto out = nlohmann::json::array();
    for (const auto& op : patch.operations()) {
        out.push_back(op);
    }
    out.push_back(patch.parent_hash());
    return out;
}

auto from_obj(const nlohmann::json& obj, bool is_checkpoint) -> Patch {
    if (!obj.is_array() || obj.empty()) {
        decoding_error("packed patch must be a non-empty array");
    }
    const auto parent = obj.back().get<ContentHash>();

    auto ops = std::vector<Operation>{};
    ops.reserve(obj.size() - 1);
    for (std::size_t i = 0; i + 1 < obj.size(); ++i) {
        ops.push_back(obj[i].get<Operation>());
    }

    try {
        return Patch::from_operations(parent, std::move(ops), is_checkpoint);
    } catch (const Error& e) {
        decoding_error(std::string{"packed patch is invalid: "} + e.what());
    }
}

auto serialize(const Patch& patch, const Config& cfg) -> std::string {
    try {
        return to_obj(patch, cfg).dump();
    } catch (const nlohmann::json::type_error& e) {
        throw Error{ErrorKind::invalid_operation,
                    std::string{"patch text cannot be encoded: "} + e.what()};
    }
}

auto deserialize(std::string_view text, bool is_checkpoint) -> Patch {
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) decoding_error("packed patch is not valid JSON");
    return from_obj(parsed, is_checkpoint);
}

}  // namespace splice_ot
