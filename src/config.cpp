#include <splice-ot/config.hpp>

#include <spdlog/sinks/null_sink.h>

namespace splice_ot {

auto Config::log() const -> spdlog::logger& {
    if (logger) return *logger;
    // Shared by every Config without a logger; never registered globally.
    static auto silent = std::make_shared<spdlog::logger>(
        "splice_ot", std::make_shared<spdlog::sinks::null_sink_mt>());
    return *silent;
}

}  // namespace splice_ot
