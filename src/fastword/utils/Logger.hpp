#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef ERROR
#undef ERROR
#endif

namespace fastword {

/**
 * @brief 全局日志器
 *
 * 控制台 + 可选文件输出，文件按大小滚动。
 * 格式化统一走 fmt，调用方使用 FASTWORD_LOG_* 宏附带源码位置。
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

    /**
     * @brief 初始化日志器
     * @param log_file_path 日志文件路径，为空时只输出到控制台
     * @param level 最低输出等级
     * @param enable_console 是否输出到控制台
     * @param max_file_size 单个文件最大字节数，超过后滚动
     * @param max_files 保留的滚动文件数
     */
    void initialize(const std::string& log_file_path = "logs/fastword.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;

    bool isInitialized() const { return initialized_.load(); }

    void log(Level level, const std::string& message);

    template<typename... Args>
    inline void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) {
            return;
        }
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            log(level, fmt_str);
        }
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) {
            return;
        }
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define FASTWORD_FUNC __FUNCTION__
#else
#  define FASTWORD_FUNC __func__
#endif

#define FASTWORD_LOG_AT(level, fmt, ...) \
    fastword::Logger::getInstance().logCtx(level, __FILE__, __LINE__, FASTWORD_FUNC, fmt, ##__VA_ARGS__)

#define FASTWORD_LOG_TRACE(fmt, ...)    FASTWORD_LOG_AT(fastword::Logger::Level::TRACE,    fmt, ##__VA_ARGS__)
#define FASTWORD_LOG_DEBUG(fmt, ...)    FASTWORD_LOG_AT(fastword::Logger::Level::DEBUG,    fmt, ##__VA_ARGS__)
#define FASTWORD_LOG_INFO(fmt, ...)     FASTWORD_LOG_AT(fastword::Logger::Level::INFO,     fmt, ##__VA_ARGS__)
#define FASTWORD_LOG_WARN(fmt, ...)     FASTWORD_LOG_AT(fastword::Logger::Level::WARN,     fmt, ##__VA_ARGS__)
#define FASTWORD_LOG_ERROR(fmt, ...)    FASTWORD_LOG_AT(fastword::Logger::Level::ERROR,    fmt, ##__VA_ARGS__)
#define FASTWORD_LOG_CRITICAL(fmt, ...) FASTWORD_LOG_AT(fastword::Logger::Level::CRITICAL, fmt, ##__VA_ARGS__)

} // namespace fastword
