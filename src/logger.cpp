#include "../include/logger.hpp"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace alternating {
namespace logger {

const char* LevelName(Level level) noexcept {
    switch (level) {
        case Level::kDebug: return "DEBUG";
        case Level::kInfo: return "INFO";
        case Level::kWarning: return "WARNING";
        case Level::kError: return "ERROR";
    }
    return "UNKNOWN";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    // Reopen with the new settings on the next message.
    file_stream_.reset();
    sink_failed_ = false;
}

LogConfig Logger::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

bool Logger::enabled(Level level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= config_.min_level;
}

void Logger::log(Level level, const char* file, const char* func, int line, const char* fmt, ...) {
    if (!enabled(level)) return;

    char buffer[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    write_log(format_log(level, file, func, line, buffer));
}

std::string Logger::format_log(Level level, const char* file, const char* func, int line,
                               const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char time_str[20];
    std::strftime(time_str, sizeof(time_str), "%Y%m%d%H%M%S", &tm_buf);

    std::ostringstream oss;
    oss << "[" << time_str << "] "
        << "[" << LevelName(level) << "] "
        << "[" << getpid() << "] "
        << "[" << file << ":" << func << ":" << line << "] "
        << message << "\n";
    return oss.str();
}

void Logger::write_log(const std::string& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.use_stderr) {
        std::cerr << entry;
        return;
    }
    if (config_.use_stdout) {
        std::cout << entry;
        return;
    }

    if (!open_sink()) {
        std::cerr << entry;
        return;
    }

    *file_stream_ << entry;
    file_stream_->flush();

    std::error_code ec;
    auto size = std::filesystem::file_size(current_log_path_, ec);
    if (!ec && size >= config_.max_file_size) {
        rotate_log_files();
    }
}

bool Logger::open_sink() {
    if (file_stream_ && file_stream_->is_open()) return true;
    if (sink_failed_) return false;

    std::error_code ec;
    std::filesystem::create_directories(config_.log_dir, ec);
    if (ec) {
        std::cerr << "Logger initialization failed: " << ec.message() << std::endl;
        sink_failed_ = true;
        return false;
    }

    current_log_path_ = get_log_path(0);
    file_stream_ = std::make_unique<std::ofstream>(current_log_path_, std::ios::out | std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Logger initialization failed: cannot open " << current_log_path_ << std::endl;
        file_stream_.reset();
        sink_failed_ = true;
        return false;
    }
    return true;
}

void Logger::rotate_log_files() {
    namespace fs = std::filesystem;

    file_stream_.reset();

    std::error_code ec;
    for (size_t i = config_.max_files; i-- > 0;) {
        auto old_path = get_log_path(i);
        if (!fs::exists(old_path, ec)) continue;
        if (i + 1 >= config_.max_files) {
            fs::remove(old_path, ec);
        } else {
            fs::rename(old_path, get_log_path(i + 1), ec);
        }
    }
    // open_sink() recreates the base file on the next write.
}

std::filesystem::path Logger::get_log_path(size_t index) const {
    auto base_name = std::to_string(getpid()) + ".log";
    if (index == 0) return std::filesystem::path(config_.log_dir) / base_name;
    return std::filesystem::path(config_.log_dir) / (base_name + "." + std::to_string(index));
}

}  // namespace logger
}  // namespace alternating
