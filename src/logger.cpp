#include "logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace cabin_voice {

namespace {

thread_local std::string t_thread_name;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

/// One line: [LEVEL] 2024-01-01 12:00:00.123 (thread): message
std::string format_line(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << "[" << level_tag(level) << "] "
        << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    if (!t_thread_name.empty()) {
        oss << " (" << t_thread_name << ")";
    }
    oss << ": " << message;
    return oss.str();
}

void write_console(LogLevel level, const std::string& line) {
    // stderr for WARN/ERROR, stdout for INFO/DEBUG
    std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
    out << line << std::endl;
}

} // namespace

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file) : min_level_(min_level) {
        if (!output_file.empty()) {
            file_.open(output_file, std::ios::app);
            if (!file_.is_open()) {
                std::cerr << "Warning: Failed to open log file: " << output_file << std::endl;
            }
        }
    }

    bool enabled(LogLevel level) const {
        return level >= min_level_.load();
    }

    void write(LogLevel level, const std::string& line) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_console(level, line);
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel get_level() const { return min_level_; }

private:
    std::atomic<LogLevel> min_level_;
    std::mutex write_mutex_;
    std::ofstream file_;
};

std::shared_ptr<Logger::Impl> Logger::impl_ = nullptr;
std::mutex Logger::impl_mutex_;

std::shared_ptr<Logger::Impl> Logger::current() {
    std::lock_guard<std::mutex> lock(impl_mutex_);
    return impl_;
}

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    auto impl = std::make_shared<Impl>(min_level, output_file);
    std::lock_guard<std::mutex> lock(impl_mutex_);
    impl_ = std::move(impl);
}

void Logger::shutdown() {
    std::shared_ptr<Impl> released;
    {
        std::lock_guard<std::mutex> lock(impl_mutex_);
        released.swap(impl_);
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    std::shared_ptr<Impl> impl = current();
    if (impl) {
        if (impl->enabled(level)) {
            impl->write(level, format_line(level, message));
        }
        return;
    }

    // Not initialized: plain console, no DEBUG
    if (level != LogLevel::DEBUG) {
        write_console(level, message);
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::set_level(LogLevel level) {
    std::shared_ptr<Impl> impl = current();
    if (impl) {
        impl->set_level(level);
    }
}

LogLevel Logger::get_level() {
    std::shared_ptr<Impl> impl = current();
    return impl ? impl->get_level() : LogLevel::INFO;
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::set_thread_name(const std::string& name) {
    t_thread_name = name;
}

} // namespace cabin_voice
