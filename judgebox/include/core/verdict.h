/**
 * @file verdict.h
 * @brief 评测结论与提交汇总
 *
 * Verdict 是封闭的 variant，汇总时按严重程度取最差的一个：
 *   SystemError > SecurityViolation > CompileError > RuntimeError
 *   > MemoryLimitExceeded > TimeLimitExceeded = OutputLimitExceeded
 *   > WrongAnswer > Accepted
 */

#ifndef JUDGEBOX_CORE_VERDICT_H
#define JUDGEBOX_CORE_VERDICT_H

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <ostream>
#include <algorithm>

#include "core/types.h"
#include "core/syscall_map.h"

namespace judgebox {

namespace verdict {

struct Accepted {};

struct WrongAnswer {
    std::string detail;   ///< checker 输出或差异说明
};

struct TimeLimitExceeded {};

struct MemoryLimitExceeded {};

struct OutputLimitExceeded {};

struct RuntimeError {
    std::optional<int> exit_code;
    std::optional<int> signal;
};

struct SecurityViolation {
    int syscall_nr = -1;
};

struct CompileError {
    std::string diagnostic;
};

struct SystemError {
    std::string reason;
};

} // namespace verdict

using Verdict = std::variant<
    verdict::Accepted,
    verdict::WrongAnswer,
    verdict::TimeLimitExceeded,
    verdict::MemoryLimitExceeded,
    verdict::OutputLimitExceeded,
    verdict::RuntimeError,
    verdict::SecurityViolation,
    verdict::CompileError,
    verdict::SystemError>;

/**
 * @brief 严重程度，数值越大越严重
 */
inline int severity(const Verdict &v) {
    return std::visit(detail::overloaded{
        [](const verdict::Accepted &) { return 0; },
        [](const verdict::WrongAnswer &) { return 1; },
        [](const verdict::TimeLimitExceeded &) { return 2; },
        [](const verdict::OutputLimitExceeded &) { return 2; },
        [](const verdict::MemoryLimitExceeded &) { return 3; },
        [](const verdict::RuntimeError &) { return 4; },
        [](const verdict::CompileError &) { return 5; },
        [](const verdict::SecurityViolation &) { return 6; },
        [](const verdict::SystemError &) { return 7; },
    }, v);
}

/**
 * @brief 取两者中更严重的；同级时保留 a（先出现的测试点）
 */
inline const Verdict& worse_of(const Verdict &a, const Verdict &b) {
    return severity(b) > severity(a) ? b : a;
}

inline bool is_accepted(const Verdict &v) {
    return std::holds_alternative<verdict::Accepted>(v);
}

template<typename T>
bool is(const Verdict &v) {
    return std::holds_alternative<T>(v);
}

/**
 * @brief 简称，如 "AC"、"TLE"
 */
inline const char* verdict_code(const Verdict &v) {
    return std::visit(detail::overloaded{
        [](const verdict::Accepted &) { return "AC"; },
        [](const verdict::WrongAnswer &) { return "WA"; },
        [](const verdict::TimeLimitExceeded &) { return "TLE"; },
        [](const verdict::MemoryLimitExceeded &) { return "MLE"; },
        [](const verdict::OutputLimitExceeded &) { return "OLE"; },
        [](const verdict::RuntimeError &) { return "RE"; },
        [](const verdict::SecurityViolation &) { return "SV"; },
        [](const verdict::CompileError &) { return "CE"; },
        [](const verdict::SystemError &) { return "SE"; },
    }, v);
}

inline std::string verdict_to_string(const Verdict &v) {
    return std::visit(detail::overloaded{
        [](const verdict::Accepted &) -> std::string { return "Accepted"; },
        [](const verdict::WrongAnswer &w) -> std::string {
            return w.detail.empty() ? "Wrong Answer" : "Wrong Answer: " + w.detail;
        },
        [](const verdict::TimeLimitExceeded &) -> std::string { return "Time Limit Exceeded"; },
        [](const verdict::MemoryLimitExceeded &) -> std::string { return "Memory Limit Exceeded"; },
        [](const verdict::OutputLimitExceeded &) -> std::string { return "Output Limit Exceeded"; },
        [](const verdict::RuntimeError &r) -> std::string {
            if (r.signal) return "Runtime Error (signal " + std::to_string(*r.signal) + ")";
            if (r.exit_code) return "Runtime Error (exit code " + std::to_string(*r.exit_code) + ")";
            return "Runtime Error";
        },
        [](const verdict::SecurityViolation &s) -> std::string {
            if (s.syscall_nr < 0) return "Security Violation";
            return "Security Violation (" + syscall_nr_to_name(s.syscall_nr) + ")";
        },
        [](const verdict::CompileError &) -> std::string { return "Compile Error"; },
        [](const verdict::SystemError &e) -> std::string {
            return e.reason.empty() ? "System Error" : "System Error: " + e.reason;
        },
    }, v);
}

namespace verdict {

// Verdict 是 std::variant，ADL 只在各结论类型所在的命名空间里查找
inline std::ostream& operator<<(std::ostream &os, const Verdict &v) {
    return os << verdict_to_string(v);
}

} // namespace verdict

//==============================================================================
// 提交汇总
//==============================================================================

struct TestJudgement {
    std::string test_id;
    Verdict verdict;
    RunOutcome outcome;
};

struct SubmissionJudgement {
    std::string submission_id;
    std::vector<TestJudgement> per_test;   ///< 按声明顺序
    Verdict overall = verdict::Accepted{};
    std::string compile_log;

    uint64_t max_cpu_time_ms() const {
        uint64_t t = 0;
        for (const auto &r : per_test) t = std::max(t, r.outcome.cpu_time_used_ms);
        return t;
    }

    uint64_t max_memory_bytes() const {
        uint64_t m = 0;
        for (const auto &r : per_test) m = std::max(m, r.outcome.memory_peak_bytes);
        return m;
    }
};

/**
 * @brief 汇总各测试点结论：取最差；没有测试点时为 Accepted
 */
inline Verdict aggregate(const std::vector<TestJudgement> &results) {
    Verdict overall = verdict::Accepted{};
    for (const auto &r : results) {
        overall = worse_of(overall, r.verdict);
    }
    return overall;
}

} // namespace judgebox

#endif // JUDGEBOX_CORE_VERDICT_H
