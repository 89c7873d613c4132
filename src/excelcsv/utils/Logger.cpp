#include "Logger.hpp"
#include <filesystem>
#include <cctype>
#include <iostream>
#include <thread>
#include <sstream>
#include <fmt/format.h>
#include <fmt/chrono.h>

namespace excelcsv {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files,
                        WriteMode write_mode) {
    if (shutting_down_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) {
        return;
    }

    // 重复初始化时按新配置重新打开
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }

    current_level_.store(level);
    enable_console_.store(enable_console);
    log_file_path_ = log_file_path;
    max_file_size_ = max_file_size;
    max_files_ = max_files;
    write_mode_ = write_mode;

    if (!log_file_path_.empty()) {
        try {
            std::filesystem::path log_path(log_file_path_);
            std::filesystem::path log_dir = log_path.parent_path();
            if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
                std::filesystem::create_directories(log_dir);
            }
        } catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }

        std::ios::openmode open_mode = (write_mode_ == WriteMode::APPEND) ?
                                       (std::ios::out | std::ios::app) :
                                       (std::ios::out | std::ios::trunc);
        file_stream_.open(log_file_path_, open_mode);
        if (file_stream_.is_open() && write_mode_ == WriteMode::APPEND) {
            file_stream_.seekp(0, std::ios::end);
            current_file_size_.store(static_cast<size_t>(file_stream_.tellp()));
        } else {
            current_file_size_.store(0);
        }
        if (!file_stream_.is_open()) {
            std::cerr << "Logger initialization failed: cannot open " << log_file_path_ << std::endl;
        }
    }

    initialized_.store(true);

    if (should_log(Level::DEBUG)) {
        std::string msg = format_message(Level::DEBUG,
            fmt::format("Logger initialized. Log file: {}, Mode: {}",
                        log_file_path_.empty() ? "<none>" : log_file_path_,
                        (write_mode_ == WriteMode::APPEND ? "APPEND" : "TRUNCATE")));
        if (enable_console_.load()) {
            log_to_console(Level::DEBUG, msg);
        }
        log_to_file(msg);
    }
}

void Logger::setLevel(Level level) {
    current_level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return current_level_.load();
}

bool Logger::parseLevel(const std::string& name, Level& level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") level = Level::TRACE;
    else if (lower == "debug") level = Level::DEBUG;
    else if (lower == "info") level = Level::INFO;
    else if (lower == "warn" || lower == "warning") level = Level::WARN;
    else if (lower == "error") level = Level::ERROR;
    else if (lower == "critical") level = Level::CRITICAL;
    else if (lower == "off") level = Level::OFF;
    else return false;
    return true;
}

bool Logger::should_log(Level level) const {
    return static_cast<int>(level) >= static_cast<int>(current_level_.load()) &&
           !shutting_down_.load();
}

void Logger::write(Level level, const std::string& message) {
    if (!should_log(level)) return;

    if (!initialized_.load()) {
        initialize("", current_level_.load());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;

    std::string formatted_message = format_message(level, message);

    if (enable_console_.load()) {
        log_to_console(level, formatted_message);
    }
    log_to_file(formatted_message);

    // 警告及以上立即刷新
    if (level >= Level::WARN && file_stream_.is_open()) {
        file_stream_.flush();
    }
}

void Logger::trace(const std::string& message) {
    write(Level::TRACE, message);
}

void Logger::debug(const std::string& message) {
    write(Level::DEBUG, message);
}

void Logger::info(const std::string& message) {
    write(Level::INFO, message);
}

void Logger::warn(const std::string& message) {
    write(Level::WARN, message);
}

void Logger::error(const std::string& message) {
    write(Level::ERROR, message);
}

void Logger::critical(const std::string& message) {
    write(Level::CRITICAL, message);
}

void Logger::log_to_console(Level level, const std::string& message) {
    (void)level;
    std::cerr << message << std::endl;
}

void Logger::log_to_file(const std::string& message) {
    if (!file_stream_.is_open()) {
        return;
    }

    rotate_file_if_needed();

    file_stream_ << message << '\n';
    current_file_size_.fetch_add(message.length() + 1);
}

void Logger::rotate_file_if_needed() {
    if (current_file_size_.load() < max_file_size_) {
        return;
    }

    file_stream_.close();

    std::error_code ec;
    for (size_t i = max_files_ - 1; i > 0; --i) {
        std::string old_file = get_rotated_filename(i - 1);
        std::string new_file = get_rotated_filename(i);
        if (std::filesystem::exists(old_file, ec)) {
            std::filesystem::rename(old_file, new_file, ec);
        }
    }

    file_stream_.open(log_file_path_, std::ios::out | std::ios::trunc);
    current_file_size_.store(0);
}

std::string Logger::get_rotated_filename(size_t index) const {
    if (index == 0) {
        return log_file_path_;
    }
    return fmt::format("{}.{}", log_file_path_, index);
}

std::string Logger::format_message(Level level, const std::string& message) const {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return fmt::format("[{}] [{}] [{}] {}",
                       get_timestamp(),
                       level_to_string(level),
                       oss.str(),
                       message);
}

std::string Logger::level_to_string(Level level) const {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO ";
        case Level::WARN:     return "WARN ";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT ";
        default:              return "UNKN ";
    }
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", now);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::cerr.flush();
}

void Logger::shutdown() {
    shutting_down_.store(true);

    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }

    if (initialized_.load()) {
        if (file_stream_.is_open()) {
            file_stream_.flush();
            file_stream_.close();
        }
        initialized_.store(false);
    }
    // 关闭后允许再次 initialize
    shutting_down_.store(false);
}

Logger::~Logger() {
    shutdown();
}

} // namespace excelcsv
