#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "logger.hpp"
#include "options.hpp"
#include "source.hpp"

namespace alternating {

using JsonSource = Source<nlohmann::json>;

/**
 * @brief Build the adapter selected by `mode` over two sources, wrapped in a
 *        FusedSource when `fuse` is set.
 */
std::unique_ptr<JsonSource> MakeAdapter(Mode mode, bool fuse,
                                        std::unique_ptr<JsonSource> left,
                                        std::unique_ptr<JsonSource> right);

/**
 * @brief Interleave the `left` and `right` arrays of `input`.
 *
 * @param options policy, fusing and gap tolerance
 * @param input object of the form {"left": [...], "right": [...]}
 * @return {"items": [...], "size_hint": {"lower": n, "upper": n | null}},
 *         with the hint taken before anything is pulled
 * @throws std::invalid_argument if `input` is not shaped as above
 */
nlohmann::json Interleave(const Options& options, const nlohmann::json& input);

/**
 * @brief Logging setup for a process whose stdout carries JSON results:
 *        console logging is sent to stderr instead.
 */
logger::LogConfig CommandLineLogConfig(logger::LogConfig config);

}  // namespace alternating
