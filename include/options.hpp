#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "logger.hpp"

namespace alternating {

/**
 * @brief Which interleaving policy to apply.
 */
enum class Mode {
    kAlternate,    // Alternating
    kAlternateAll, // AlternatingAll
    kNoRemainder   // AlternatingNoRemainder
};

const char* ModeName(Mode mode) noexcept;
Mode ParseMode(const std::string& name);
logger::Level ParseLevel(const std::string& name);

/**
 * @brief Options for the alternate_cli front end
 */
class Options {
public:
    // Interleaving policy
    Mode mode{Mode::kAlternate};

    // Wrap the adapter in a FusedSource
    bool fuse{false};

    // Consecutive empty results tolerated while collecting; 1 stops at the first
    std::size_t max_gaps{1};

    // Logger settings, applied before anything is pulled
    logger::LogConfig log;

    Options() = default;

    /**
     * @brief Read options from a JSON object. Missing keys keep their
     *        defaults and unknown keys are ignored.
     *
     * @throws std::invalid_argument on a wrong type or value
     */
    static Options FromJson(const nlohmann::json& j);

    /**
     * @throws std::runtime_error if the file cannot be read
     */
    static Options FromFile(const std::filesystem::path& path);
};

}  // namespace alternating
