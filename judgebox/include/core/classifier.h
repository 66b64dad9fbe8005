/**
 * @file classifier.h
 * @brief 运行结果分类
 *
 * 判定顺序：
 *   SupervisorError → SystemError
 *   PolicyViolation → SecurityViolation
 *   超时 / SIGXCPU / CPU 超限 → TimeLimitExceeded
 *   峰值内存超限 → MemoryLimitExceeded（正常退出也检查）
 *   输出超限 / SIGXFSZ → OutputLimitExceeded
 *   非零退出或被信号终止 → RuntimeError
 *   最后比较输出 → Accepted / WrongAnswer
 */

#ifndef JUDGEBOX_CORE_CLASSIFIER_H
#define JUDGEBOX_CORE_CLASSIFIER_H

#include <string>
#include <optional>
#include <csignal>

#include "core/types.h"
#include "core/verdict.h"
#include "core/comparator.h"

namespace judgebox {

/**
 * @brief 只看进程终止方式与资源用量，不比较输出
 * @return 运行干净（退出码 0 且未超限）时返回 nullopt
 */
inline std::optional<Verdict> check_outcome(const RunOutcome &outcome, const ResourceLimits &limits) {
    std::optional<Verdict> terminal = std::visit(detail::overloaded{
        [](const outcome::SupervisorError &e) -> std::optional<Verdict> {
            return Verdict(verdict::SystemError{e.reason});
        },
        [](const outcome::PolicyViolation &v) -> std::optional<Verdict> {
            return Verdict(verdict::SecurityViolation{v.syscall_nr});
        },
        [](const outcome::TimedOut &) -> std::optional<Verdict> {
            return Verdict(verdict::TimeLimitExceeded{});
        },
        [](const outcome::Signaled &s) -> std::optional<Verdict> {
            if (s.signal == SIGXCPU) return Verdict(verdict::TimeLimitExceeded{});
            return std::nullopt;
        },
        [](const outcome::Exited &) -> std::optional<Verdict> {
            return std::nullopt;
        },
    }, outcome.exit_status);
    if (terminal) return terminal;

    if (ResourceLimits::bounded(limits.cpu_time_ms) &&
        outcome.cpu_time_used_ms > limits.cpu_time_ms) {
        return Verdict(verdict::TimeLimitExceeded{});
    }

    if (ResourceLimits::bounded(limits.memory_bytes) &&
        outcome.memory_peak_bytes > limits.memory_bytes) {
        return Verdict(verdict::MemoryLimitExceeded{});
    }

    auto sig = std::get_if<outcome::Signaled>(&outcome.exit_status);
    if (outcome.output_limit_hit || (sig && sig->signal == SIGXFSZ)) {
        return Verdict(verdict::OutputLimitExceeded{});
    }
    if (ResourceLimits::bounded(limits.output_bytes) &&
        outcome.stdout_bytes_written + outcome.stderr_bytes_written > limits.output_bytes) {
        return Verdict(verdict::OutputLimitExceeded{});
    }

    if (sig) {
        verdict::RuntimeError re;
        re.signal = sig->signal;
        return Verdict(re);
    }
    auto ex = std::get_if<outcome::Exited>(&outcome.exit_status);
    if (ex && ex->code != 0) {
        verdict::RuntimeError re;
        re.exit_code = ex->code;
        return Verdict(re);
    }
    return std::nullopt;
}

/**
 * @brief 分类一次运行
 * @param expected 期望输出；为空时不比较，干净运行即 Accepted
 */
inline Verdict classify(const RunOutcome &outcome, const ResourceLimits &limits,
                        const std::optional<std::string> &expected, CompareMode mode) {
    if (auto v = check_outcome(outcome, limits)) {
        return *v;
    }
    if (!expected) {
        return verdict::Accepted{};
    }
    CompareResult cmp = compare_output(outcome.stdout_data, *expected, mode);
    if (cmp.same) {
        return verdict::Accepted{};
    }
    return verdict::WrongAnswer{cmp.detail};
}

} // namespace judgebox

#endif // JUDGEBOX_CORE_CLASSIFIER_H
