/**
 * @file error.h
 * @brief 统一错误处理机制
 *
 * 提供：
 * - Result<T> 类型：成功值或 Error
 * - 按模块分段的错误码
 * - 错误传播宏
 *
 * 沙箱内"预期中的失败"（超时、超内存、违规 syscall）不是错误，
 * 它们作为 RunOutcome 数据返回；这里只描述评测系统自身的失败。
 */

#ifndef JUDGEBOX_CORE_ERROR_H
#define JUDGEBOX_CORE_ERROR_H

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <ostream>
#include <utility>

namespace judgebox {

//==============================================================================
// 错误码定义
//==============================================================================

enum class ErrorCode {
    OK = 0,

    // 文件操作错误 (1xx)
    FILE_NOT_FOUND = 100,
    FILE_READ_ERROR = 101,
    FILE_WRITE_ERROR = 102,
    FILE_PERMISSION_DENIED = 103,

    // 配置错误 (2xx)
    CONFIG_PARSE_ERROR = 200,
    CONFIG_MISSING_KEY = 201,
    CONFIG_INVALID_VALUE = 202,

    // 编译错误 (3xx)
    COMPILE_ERROR = 300,
    COMPILER_NOT_FOUND = 303,

    // 评测错误 (5xx)
    JUDGE_ERROR = 500,
    CHECKER_ERROR = 501,

    // 沙箱错误 (6xx)
    LIMIT_ERROR = 600,            ///< rlimit / cgroup 限制无法施加
    POLICY_ERROR = 601,           ///< 策略非法，无法编译
    POLICY_INSTALL_FAILED = 602,  ///< 过滤器无法安装
    FILTER_TOO_LARGE = 603,       ///< BPF 程序超过内核上限
    CGROUP_ERROR = 604,
    LANDLOCK_ERROR = 605,

    // 系统错误 (9xx)
    SYSTEM_ERROR = 900,
    FORK_FAILED = 901,
    EXEC_FAILED = 902,
    PIPE_FAILED = 903,
    WAIT_FAILED = 904,
    CANCELLED = 905,
    UNKNOWN_ERROR = 999
};

inline const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR: return "FILE_WRITE_ERROR";
        case ErrorCode::FILE_PERMISSION_DENIED: return "FILE_PERMISSION_DENIED";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_MISSING_KEY: return "CONFIG_MISSING_KEY";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::COMPILE_ERROR: return "COMPILE_ERROR";
        case ErrorCode::COMPILER_NOT_FOUND: return "COMPILER_NOT_FOUND";
        case ErrorCode::JUDGE_ERROR: return "JUDGE_ERROR";
        case ErrorCode::CHECKER_ERROR: return "CHECKER_ERROR";
        case ErrorCode::LIMIT_ERROR: return "LIMIT_ERROR";
        case ErrorCode::POLICY_ERROR: return "POLICY_ERROR";
        case ErrorCode::POLICY_INSTALL_FAILED: return "POLICY_INSTALL_FAILED";
        case ErrorCode::FILTER_TOO_LARGE: return "FILTER_TOO_LARGE";
        case ErrorCode::CGROUP_ERROR: return "CGROUP_ERROR";
        case ErrorCode::LANDLOCK_ERROR: return "LANDLOCK_ERROR";
        case ErrorCode::SYSTEM_ERROR: return "SYSTEM_ERROR";
        case ErrorCode::FORK_FAILED: return "FORK_FAILED";
        case ErrorCode::EXEC_FAILED: return "EXEC_FAILED";
        case ErrorCode::PIPE_FAILED: return "PIPE_FAILED";
        case ErrorCode::WAIT_FAILED: return "WAIT_FAILED";
        case ErrorCode::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN_ERROR";
    }
}

inline std::ostream& operator<<(std::ostream &os, ErrorCode code) {
    return os << error_code_str(code);
}

//==============================================================================
// Error 类
//==============================================================================

class Error {
private:
    ErrorCode code_;
    std::string message_;
    std::string file_;
    int line_;
    std::string context_;

public:
    Error() : code_(ErrorCode::OK), line_(0) {}

    Error(ErrorCode code, const std::string &message = "")
        : code_(code), message_(message), line_(0) {}

    Error(ErrorCode code, const std::string &message,
          const char *file, int line)
        : code_(code), message_(message), file_(file ? file : ""), line_(line) {}

    Error& with_context(const std::string &ctx) {
        context_ = ctx;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& file() const { return file_; }
    int line() const { return line_; }
    const std::string& context() const { return context_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }  // true 表示有错误

    std::string to_string() const {
        std::ostringstream oss;
        oss << "[" << error_code_str(code_) << "]";
        if (!message_.empty()) {
            oss << " " << message_;
        }
        if (!context_.empty()) {
            oss << " (context: " << context_ << ")";
        }
        if (!file_.empty() && line_ > 0) {
            // 只保留文件名，日志里完整路径太长
            auto pos = file_.find_last_of('/');
            oss << " at " << (pos == std::string::npos ? file_ : file_.substr(pos + 1))
                << ":" << line_;
        }
        return oss.str();
    }
};

//==============================================================================
// Result<T> 类型
//==============================================================================

/**
 * @brief 结果类型
 *
 * 用法：
 *   Result<FilterProgram> prog = compile(policy, opts);
 *   if (!prog.ok()) {
 *       RLOG_ERROR << prog.error().to_string();
 *   }
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(const T &value) : data_(value) {}
    Result(T &&value) : data_(std::move(value)) {}

    Result(const Error &err) : data_(err) {}
    Result(Error &&err) : data_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "")
        : data_(Error(code, msg)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const & { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(const T &default_val) const {
        return ok() ? std::get<T>(data_) : default_val;
    }

    Error& error() & { return std::get<Error>(data_); }
    const Error& error() const & { return std::get<Error>(data_); }

    // 解包（错误时抛异常，只在测试和 main 中使用）
    T& unwrap() & {
        if (is_error()) {
            throw std::runtime_error(error().to_string());
        }
        return value();
    }

};

/**
 * @brief 无值的结果类型（仅表示成功/失败）
 */
template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() : error_(std::nullopt) {}
    Result(const Error &err) : error_(err) {}
    Result(Error &&err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "")
        : error_(Error(code, msg)) {}

    bool ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return ok(); }

    Error& error() { return *error_; }
    const Error& error() const { return *error_; }
};

//==============================================================================
// 便捷函数
//==============================================================================

template<typename T>
Result<std::decay_t<T>> Ok(T &&value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(ErrorCode code, const std::string &message = "") {
    return Result<T>(Error(code, message));
}

template<typename T = void>
Result<T> Err(const Error &err) {
    return Result<T>(err);
}

//==============================================================================
// 错误处理宏
//==============================================================================

/**
 * @brief 创建带位置信息的错误
 */
#define JUDGEBOX_ERROR(code, msg) \
    judgebox::Error(code, msg, __FILE__, __LINE__)

/**
 * @brief 如果结果是错误，则返回错误
 */
#define JUDGEBOX_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) { \
            return _result.error(); \
        } \
    } while (0)

/**
 * @brief 如果结果是错误，则返回错误；否则解包值
 */
#define JUDGEBOX_TRY_UNWRAP(var, expr) \
    auto _tmp_##var = (expr); \
    if (_tmp_##var.is_error()) { \
        return _tmp_##var.error(); \
    } \
    auto var = std::move(_tmp_##var.value())

/**
 * @brief 断言条件，失败时返回错误
 */
#define JUDGEBOX_ENSURE(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return JUDGEBOX_ERROR(code, msg); \
        } \
    } while (0)

} // namespace judgebox

#endif // JUDGEBOX_CORE_ERROR_H
