#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace alternating {
namespace logger {

enum class Level {
    kDebug,
    kInfo,
    kWarning,
    kError
};

struct LogConfig {
    std::string log_dir = "/tmp/.alternating_log";
    bool use_stdout = false;
    bool use_stderr = false;  // takes precedence over use_stdout
    Level min_level = Level::kWarning;
    size_t max_file_size = 10 * 1024 * 1024;  // 10MB
    size_t max_files = 5;
};

const char* LevelName(Level level) noexcept;

/**
 * @brief Process-wide logger writing to stdout, stderr or to rotated files
 *        under `log_dir`.
 *
 * The file sink is opened on the first message that passes `min_level`, so
 * a process that never logs above the threshold never touches the disk.
 */
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);
    LogConfig config() const;

    bool enabled(Level level) const;

    void log(Level level, const char* file, const char* func, int line, const char* fmt, ...)
        __attribute__((format(printf, 6, 7)));

private:
    Logger() = default;

    std::string format_log(Level level, const char* file, const char* func, int line,
                           const std::string& message) const;
    void write_log(const std::string& entry);
    bool open_sink();
    void rotate_log_files();
    std::filesystem::path get_log_path(size_t index) const;

    mutable std::mutex mutex_;
    LogConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::filesystem::path current_log_path_;
    bool sink_failed_ = false;
};

}  // namespace logger
}  // namespace alternating

#define ALT_LOG_DEBUG(fmt, ...) \
    ::alternating::logger::Logger::instance().log(::alternating::logger::Level::kDebug, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define ALT_LOG_INFO(fmt, ...) \
    ::alternating::logger::Logger::instance().log(::alternating::logger::Level::kInfo, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define ALT_LOG_WARNING(fmt, ...) \
    ::alternating::logger::Logger::instance().log(::alternating::logger::Level::kWarning, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define ALT_LOG_ERROR(fmt, ...) \
    ::alternating::logger::Logger::instance().log(::alternating::logger::Level::kError, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)
