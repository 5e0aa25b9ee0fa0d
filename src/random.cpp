#include <splice-ot/random.hpp>

#include <algorithm>
#include <cstdint>
#include <utility>

namespace splice_ot {

auto random_ascii(std::size_t length, std::mt19937& rng) -> std::string {
    auto dist = std::uniform_int_distribution<int>{' ', '~'};
    auto out = std::string(length, ' ');
    for (auto& c : out) c = static_cast<char>(dist(rng));
    return out;
}

auto random_operation(std::size_t doc_length, std::mt19937& rng) -> Operation {
    static constexpr std::size_t max_remove = 20;
    static constexpr std::size_t max_insert = 19;

    const auto offset = std::uniform_int_distribution<std::size_t>{0, doc_length}(rng);
    const auto room = std::min(doc_length - offset, max_remove);
    const auto to_remove = std::uniform_int_distribution<std::size_t>{0, room}(rng);

    auto insert_len = std::uniform_int_distribution<std::size_t>{0, max_insert};
    auto to_insert = std::string{};
    do {
        to_insert = random_ascii(insert_len(rng), rng);
    } while (to_remove == 0 && to_insert.empty());

    return Operation{offset, to_remove, std::move(to_insert)};
}

auto random_patch(std::string_view doc, std::mt19937& rng,
                  std::optional<std::size_t> op_count, const Config& cfg) -> Patch {
    auto count = op_count.value_or(std::uniform_int_distribution<std::size_t>{1, 30}(rng));
    auto patch = Patch{ContentHash::of(doc)};
    auto doc_length = doc.size();
    while (count-- > 0) {
        auto op = random_operation(doc_length, rng);
        doc_length = static_cast<std::size_t>(
            static_cast<std::int64_t>(doc_length) + op.length_change());
        patch.add_operation(std::move(op), cfg);
    }
    patch.check(doc.size());
    return patch;
}

}  // namespace splice_ot
