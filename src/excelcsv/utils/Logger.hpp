#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef ERROR
#undef ERROR
#endif

namespace excelcsv {

/**
 * @brief 全局日志器
 *
 * 控制台输出固定写到 stderr，stdout 留给 CSV 数据。
 * 日志文件为可选项，路径为空时只输出到控制台。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "",
                    Level level = Level::WARN,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;

    /**
     * @brief 解析级别名称（trace/debug/info/warn/error/critical/off）
     * @return 是否识别成功
     */
    static bool parseLevel(const std::string& name, Level& level);

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    template<typename... Args>
    inline void log(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        std::string message;
        try {
            message = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            message = fmt_str;
        }
        switch (level) {
            case Level::TRACE:    trace(message); break;
            case Level::DEBUG:    debug(message); break;
            case Level::INFO:     info(message); break;
            case Level::WARN:     warn(message); break;
            case Level::ERROR:    error(message); break;
            case Level::CRITICAL: critical(message); break;
            default: break;
        }
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        log(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void write(Level level, const std::string& message);
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    std::string level_to_string(Level level) const;
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::WARN};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    std::atomic<size_t> current_file_size_{0};
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define EXCELCSV_FUNC __FUNCTION__
#else
#  define EXCELCSV_FUNC __func__
#endif

// 统一日志宏（带源码位置信息）
#define EXCELCSV_LOG_TRACE(fmt, ...)    excelcsv::Logger::getInstance().logCtx(excelcsv::Logger::Level::TRACE,    __FILE__, __LINE__, EXCELCSV_FUNC, fmt, ##__VA_ARGS__)
#define EXCELCSV_LOG_DEBUG(fmt, ...)    excelcsv::Logger::getInstance().logCtx(excelcsv::Logger::Level::DEBUG,    __FILE__, __LINE__, EXCELCSV_FUNC, fmt, ##__VA_ARGS__)
#define EXCELCSV_LOG_INFO(fmt, ...)     excelcsv::Logger::getInstance().logCtx(excelcsv::Logger::Level::INFO,     __FILE__, __LINE__, EXCELCSV_FUNC, fmt, ##__VA_ARGS__)
#define EXCELCSV_LOG_WARN(fmt, ...)     excelcsv::Logger::getInstance().logCtx(excelcsv::Logger::Level::WARN,     __FILE__, __LINE__, EXCELCSV_FUNC, fmt, ##__VA_ARGS__)
#define EXCELCSV_LOG_ERROR(fmt, ...)    excelcsv::Logger::getInstance().logCtx(excelcsv::Logger::Level::ERROR,    __FILE__, __LINE__, EXCELCSV_FUNC, fmt, ##__VA_ARGS__)
#define EXCELCSV_LOG_CRITICAL(fmt, ...) excelcsv::Logger::getInstance().logCtx(excelcsv::Logger::Level::CRITICAL, __FILE__, __LINE__, EXCELCSV_FUNC, fmt, ##__VA_ARGS__)

} // namespace excelcsv
