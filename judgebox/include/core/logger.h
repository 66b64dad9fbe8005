/**
 * @file logger.h
 * @brief 轻量级日志系统
 *
 * 特性：
 * - 多日志级别 (TRACE ~ FATAL)
 * - 控制台彩色输出 / 文件输出
 * - 时间戳、级别、线程、位置前缀
 * - 线程安全（评测池的多个 worker 会同时写日志）
 */

#ifndef JUDGEBOX_CORE_LOGGER_H
#define JUDGEBOX_CORE_LOGGER_H

#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <memory>
#include <vector>
#include <atomic>
#include <thread>
#include <algorithm>
#include <cctype>

namespace judgebox {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

inline const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

/**
 * @brief 从配置字符串解析日志级别，无法识别时返回 fallback
 */
inline LogLevel parse_log_level(std::string name, LogLevel fallback = LogLevel::INFO) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    if (name == "off" || name == "none") return LogLevel::OFF;
    return fallback;
}

inline const char* level_to_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";      // 灰色
        case LogLevel::DEBUG: return "\033[36m";      // 青色
        case LogLevel::INFO:  return "\033[32m";      // 绿色
        case LogLevel::WARN:  return "\033[33m";      // 黄色
        case LogLevel::ERROR: return "\033[31m";      // 红色
        case LogLevel::FATAL: return "\033[35;1m";    // 粗体紫色
        default: return "";
    }
}

/**
 * @brief 日志输出接口
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string &message) = 0;
    virtual void flush() = 0;
};

/**
 * @brief 控制台输出，WARN 及以上走 stderr
 */
class ConsoleSink : public LogSink {
private:
    bool use_color_;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool use_color = true) : use_color_(use_color) {}

    void write(LogLevel level, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream &out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        if (use_color_) {
            out << level_to_color(level) << message << "\033[0m" << '\n';
        } else {
            out << message << '\n';
        }
    }

    void flush() override {
        std::cout.flush();
        std::cerr.flush();
    }
};

class FileSink : public LogSink {
private:
    std::ofstream file_;
    std::mutex mutex_;
    bool auto_flush_;

public:
    explicit FileSink(const std::string &filename, bool append = true, bool auto_flush = true)
        : auto_flush_(auto_flush) {
        file_.open(filename, append ? std::ios::app : std::ios::trunc);
    }

    bool is_open() const { return file_.is_open(); }

    void write(LogLevel, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!file_.is_open()) return;
        file_ << message << '\n';
        if (auto_flush_) {
            file_.flush();
        }
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.flush();
        }
    }
};

/**
 * @brief 日志记录器
 *
 * 级别用 atomic 保存，worker 线程读取时无需加锁；
 * sink 列表的修改只在初始化阶段进行。
 */
class Logger {
private:
    std::string name_;
    std::atomic<LogLevel> level_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex mutex_;
    bool show_timestamp_;
    bool show_level_;
    bool show_thread_;
    bool show_location_;

    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static std::string basename(const std::string &path) {
        size_t pos = path.find_last_of("/\\");
        return (pos == std::string::npos) ? path : path.substr(pos + 1);
    }

    /**
     * @brief 线程短编号，日志里比 std::thread::id 易读
     */
    static int thread_tag() {
        static std::atomic<int> next{0};
        thread_local int tag = next++;
        return tag;
    }

public:
    explicit Logger(const std::string &name = "judgebox")
        : name_(name), level_(LogLevel::INFO),
          show_timestamp_(true), show_level_(true),
          show_thread_(true), show_location_(false) {}

    Logger& set_level(LogLevel level) { level_ = level; return *this; }
    Logger& show_timestamp(bool show) { show_timestamp_ = show; return *this; }
    Logger& show_level(bool show) { show_level_ = show; return *this; }
    Logger& show_thread(bool show) { show_thread_ = show; return *this; }
    Logger& show_location(bool show) { show_location_ = show; return *this; }

    LogLevel level() const { return level_; }
    const std::string& name() const { return name_; }
    bool enabled(LogLevel level) const { return level >= level_.load(); }

    Logger& add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
        return *this;
    }

    Logger& add_console(bool use_color = true) {
        return add_sink(std::make_shared<ConsoleSink>(use_color));
    }

    /**
     * @brief 添加文件输出，文件打不开时静默跳过
     */
    Logger& add_file(const std::string &filename, bool append = true) {
        auto sink = std::make_shared<FileSink>(filename, append);
        if (sink->is_open()) {
            add_sink(sink);
        }
        return *this;
    }

    void clear_sinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->flush();
        }
    }

    void log(LogLevel level, const char *file, int line, const std::string &message) {
        if (!enabled(level)) return;

        std::ostringstream oss;
        if (show_timestamp_) {
            oss << "[" << get_timestamp() << "] ";
        }
        if (show_level_) {
            oss << "[" << level_to_string(level) << "] ";
        }
        if (show_thread_) {
            oss << "[" << name_ << "#" << thread_tag() << "] ";
        }
        if (show_location_ && file) {
            oss << "[" << basename(file) << ":" << line << "] ";
        }
        oss << message;

        std::string formatted = oss.str();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->write(level, formatted);
        }
    }
};

/**
 * @brief 流式日志构建器，析构时提交
 */
class LogStream {
private:
    Logger &logger_;
    LogLevel level_;
    const char *file_;
    int line_;
    std::ostringstream stream_;

public:
    LogStream(Logger &logger, LogLevel level, const char *file, int line)
        : logger_(logger), level_(level), file_(file), line_(line) {}

    ~LogStream() {
        logger_.log(level_, file_, line_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T &value) {
        if (logger_.enabled(level_)) {
            stream_ << value;
        }
        return *this;
    }
};

} // namespace judgebox

//==============================================================================
// 日志宏
//==============================================================================

#define LOGGER_TRACE(logger) judgebox::LogStream(logger, judgebox::LogLevel::TRACE, __FILE__, __LINE__)
#define LOGGER_DEBUG(logger) judgebox::LogStream(logger, judgebox::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOGGER_INFO(logger)  judgebox::LogStream(logger, judgebox::LogLevel::INFO,  __FILE__, __LINE__)
#define LOGGER_WARN(logger)  judgebox::LogStream(logger, judgebox::LogLevel::WARN,  __FILE__, __LINE__)
#define LOGGER_ERROR(logger) judgebox::LogStream(logger, judgebox::LogLevel::ERROR, __FILE__, __LINE__)
#define LOGGER_FATAL(logger) judgebox::LogStream(logger, judgebox::LogLevel::FATAL, __FILE__, __LINE__)

#endif // JUDGEBOX_CORE_LOGGER_H
