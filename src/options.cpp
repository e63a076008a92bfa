#include "../include/options.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace alternating {

namespace {

template <typename V>
V Field(const nlohmann::json& j, const char* key, V fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<V>();
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("invalid option '") + key + "': " + e.what());
    }
}

}  // namespace

const char* ModeName(Mode mode) noexcept {
    switch (mode) {
        case Mode::kAlternate: return "alternate";
        case Mode::kAlternateAll: return "all";
        case Mode::kNoRemainder: return "no_remainder";
    }
    return "unknown";
}

Mode ParseMode(const std::string& name) {
    if (name == "alternate") return Mode::kAlternate;
    if (name == "all") return Mode::kAlternateAll;
    if (name == "no_remainder") return Mode::kNoRemainder;
    throw std::invalid_argument("unknown mode: " + name);
}

logger::Level ParseLevel(const std::string& name) {
    if (name == "debug") return logger::Level::kDebug;
    if (name == "info") return logger::Level::kInfo;
    if (name == "warning") return logger::Level::kWarning;
    if (name == "error") return logger::Level::kError;
    throw std::invalid_argument("unknown log level: " + name);
}

Options Options::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("options must be a JSON object");
    }

    Options options;
    if (j.contains("mode")) {
        options.mode = ParseMode(Field<std::string>(j, "mode", ModeName(options.mode)));
    }
    options.fuse = Field<bool>(j, "fuse", options.fuse);

    auto gaps = j.find("max_gaps");
    if (gaps != j.end() && !gaps->is_null()) {
        bool positive = gaps->is_number_unsigned()
            ? gaps->get<std::size_t>() > 0
            : gaps->is_number_integer() && gaps->get<long long>() > 0;
        if (!positive) {
            throw std::invalid_argument("invalid option 'max_gaps': expected a positive integer");
        }
        options.max_gaps = gaps->get<std::size_t>();
    }

    auto log = j.find("log");
    if (log != j.end() && !log->is_null()) {
        if (!log->is_object()) {
            throw std::invalid_argument("invalid option 'log': expected an object");
        }
        options.log.log_dir = Field<std::string>(*log, "log_dir", options.log.log_dir);
        options.log.use_stdout = Field<bool>(*log, "use_stdout", options.log.use_stdout);
        options.log.use_stderr = Field<bool>(*log, "use_stderr", options.log.use_stderr);
        if (log->contains("min_level")) {
            options.log.min_level = ParseLevel(Field<std::string>(*log, "min_level", "warning"));
        }
    }
    return options;
}

Options Options::FromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open options file: " + path.string());
    }
    return FromJson(nlohmann::json::parse(file));
}

}  // namespace alternating
