#include "../include/interleave.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "../include/alternating.hpp"
#include "../include/alternating_all.hpp"
#include "../include/alternating_no_remainder.hpp"
#include "../include/fused_source.hpp"
#include "../include/logger.hpp"

namespace alternating {

namespace {

std::unique_ptr<JsonSource> ArraySource(const nlohmann::json& input, const char* key) {
    auto it = input.find(key);
    if (it == input.end() || !it->is_array()) {
        throw std::invalid_argument(std::string("input field '") + key + "' must be an array");
    }
    // Own a copy of the elements so the source does not borrow from input.
    return FromContainer(it->get<std::vector<nlohmann::json>>());
}

}  // namespace

std::unique_ptr<JsonSource> MakeAdapter(Mode mode, bool fuse,
                                        std::unique_ptr<JsonSource> left,
                                        std::unique_ptr<JsonSource> right) {
    std::unique_ptr<JsonSource> adapter;
    switch (mode) {
        case Mode::kAlternate:
            adapter = Alternating<nlohmann::json>::Create(std::move(left), std::move(right));
            break;
        case Mode::kAlternateAll:
            adapter = AlternatingAll<nlohmann::json>::Create(std::move(left), std::move(right));
            break;
        case Mode::kNoRemainder:
            adapter = AlternatingNoRemainder<nlohmann::json>::Create(std::move(left), std::move(right));
            break;
    }
    if (!adapter) {
        throw std::invalid_argument("unsupported mode");
    }
    if (fuse) {
        return Fuse(std::move(adapter));
    }
    return adapter;
}

nlohmann::json Interleave(const Options& options, const nlohmann::json& input) {
    if (!input.is_object()) {
        throw std::invalid_argument("input must be a JSON object");
    }

    auto adapter = MakeAdapter(options.mode, options.fuse,
                               ArraySource(input, "left"), ArraySource(input, "right"));

    SizeHint hint = adapter->GetSizeHint();
    nlohmann::json result;
    result["size_hint"]["lower"] = hint.lower;
    if (hint.upper) {
        result["size_hint"]["upper"] = *hint.upper;
    } else {
        result["size_hint"]["upper"] = nullptr;
    }

    auto items = CollectUntilGaps(*adapter, options.max_gaps);
    ALT_LOG_INFO("mode=%s fuse=%d produced %zu items", ModeName(options.mode),
                 options.fuse ? 1 : 0, items.size());
    result["items"] = std::move(items);
    return result;
}

logger::LogConfig CommandLineLogConfig(logger::LogConfig config) {
    if (config.use_stdout) {
        config.use_stdout = false;
        config.use_stderr = true;
    }
    return config;
}

}  // namespace alternating
