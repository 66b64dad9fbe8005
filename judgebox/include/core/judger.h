/**
 * @file judger.h
 * @brief 评测流程
 *
 * 一次提交的完整流程：
 *
 *   1. 预编译全部策略（任何一个无法编译即整体 SystemError，不运行任何东西）
 *   2. 编译（可选），产物留在编译目录
 *   3. 逐个（或 test_concurrency 个并行）运行测试点：
 *      独占临时目录 → 复制产物 → 沙箱运行（交互题与交互器同时运行）→ 分类 / checker
 *   4. 按声明顺序汇总
 *
 * 短路模式下第一个非 Accepted 测试点之后的结果不报告；
 * 并行时已经在运行的后续测试点会被取消。
 */

#ifndef JUDGEBOX_CORE_JUDGER_H
#define JUDGEBOX_CORE_JUDGER_H

#include <string>
#include <vector>
#include <memory>
#include <thread>
#include <mutex>
#include <atomic>
#include <optional>
#include <algorithm>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/verdict.h"
#include "core/classifier.h"
#include "core/submission.h"
#include "core/runner.h"
#include "core/compiler.h"
#include "core/checker.h"
#include "core/interactor.h"
#include "core/cancellation.h"
#include "core/judger_logger.h"
#include "sandbox/seccomp.h"
#include "sandbox/scratch_dir.h"

namespace judgebox {

class Judger {
private:
    JudgeOptions options_;
    Runner runner_;

public:
    Judger(JudgeOptions options, Runner runner)
        : options_(std::move(options)), runner_(std::move(runner)) {}

    const JudgeOptions& options() const { return options_; }
    const Runner& runner() const { return runner_; }

    /**
     * @brief 检查本次评测会用到的策略都能编译成过滤器
     */
    Result<void> check_policies(const std::optional<CompileStep> &compile,
                                bool interactive = false) const {
        std::vector<const SyscallPolicy*> used = {&options_.run_policy, &options_.checker_policy};
        if (compile) used.push_back(&compile->policy);
        if (interactive) used.push_back(&options_.interactor_policy);
        for (const SyscallPolicy *p : used) {
            auto prog = sandbox::compile(*p);
            if (!prog.ok()) {
                return prog.error();
            }
        }
        return Ok();
    }

    /**
     * @brief 评测一次提交
     *
     * 总是返回一个 SubmissionJudgement；无法评测时 overall 为 SystemError。
     */
    SubmissionJudgement judge(const Submission &sub, const std::vector<TestCase> &tests,
                              const std::optional<CompileStep> &compile = std::nullopt,
                              const CancellationToken *cancel = nullptr) const {
        SubmissionJudgement result;
        result.submission_id = sub.id;
        TLOG_INFO << "judging submission " << sub.id
                  << (sub.language.empty() ? std::string() : " [" + sub.language + "]")
                  << ", " << tests.size() << " test(s)";

        auto policies_ok = check_policies(compile, sub.interactive());
        if (!policies_ok.ok()) {
            TLOG_ERROR << "policy check failed: " << policies_ok.error().to_string();
            result.overall = verdict::SystemError{"policy: " + policies_ok.error().message()};
            return result;
        }
        if (is_cancelled(cancel)) {
            result.overall = verdict::SystemError{"cancelled"};
            return result;
        }

        // 编译目录要活到所有测试点结束
        sandbox::ScratchDir compile_dir;
        std::string artifact;
        if (!sub.source_path.empty() && compile) {
            auto dir = runner_.scratch("compile_");
            if (!dir.ok()) {
                result.overall = verdict::SystemError{"scratch: " + dir.error().message()};
                return result;
            }
            compile_dir = std::move(dir.value());

            CompileResult cr = Compiler(runner_).compile(sub.source_path, *compile, compile_dir, cancel);
            result.compile_log = cr.log;
            if (!cr.succeeded) {
                result.overall = *cr.failure;
                if (is_cancelled(cancel)) result.overall = verdict::SystemError{"cancelled"};
                CLOG_INFO << "submission " << sub.id << ": " << verdict_to_string(result.overall);
                return result;
            }
            artifact = cr.artifact_path;
        } else if (!sub.executable_path.empty()) {
            artifact = sub.executable_path;
        } else if (!sub.source_path.empty()) {
            // 没有编译步骤：源文件本身可执行（如带 #! 的脚本）
            artifact = sub.source_path;
        } else {
            result.overall = verdict::SystemError{"submission has neither source nor executable"};
            return result;
        }

        ResourceLimits limits = sub.limits.value_or(options_.run_limits);
        std::vector<std::optional<TestJudgement>> slots(tests.size());
        if (options_.test_concurrency <= 1 || tests.size() <= 1) {
            run_sequential(sub, tests, artifact, limits, cancel, slots);
        } else {
            run_parallel(sub, tests, artifact, limits, cancel, slots);
        }

        for (auto &slot : slots) {
            if (!slot) break;
            bool accepted = is_accepted(slot->verdict);
            result.per_test.push_back(std::move(*slot));
            if (options_.short_circuit && !accepted) break;
        }
        result.overall = aggregate(result.per_test);
        if (is_cancelled(cancel)) {
            result.overall = verdict::SystemError{"cancelled"};
        }

        TLOG_INFO << "submission " << sub.id << ": " << verdict_to_string(result.overall)
                  << " (" << result.per_test.size() << "/" << tests.size() << " reported, "
                  << result.max_cpu_time_ms() << "ms, " << result.max_memory_bytes() / KiB << "KiB)";
        return result;
    }

    /**
     * @brief 运行单个测试点
     */
    TestJudgement judge_test(const Submission &sub, const TestCase &test, const std::string &artifact,
                             const ResourceLimits &limits, const CancellationToken *cancel) const {
        TestJudgement tj;
        tj.test_id = test.id;

        auto fail = [&](const std::string &reason) {
            tj.verdict = verdict::SystemError{reason};
            tj.outcome = RunOutcome::supervisor_error(reason);
            TLOG_WARN << "test " << test.id << ": " << reason;
            return tj;
        };

        auto dir = runner_.scratch("test_");
        if (!dir.ok()) return fail("scratch: " + dir.error().message());

        std::string exe = dir.value().file(base_name(artifact));
        auto copied = copy_file(artifact, exe, true);
        if (!copied.ok()) return fail("artifact: " + copied.error().message());

        std::optional<std::string> expected;
        if (test.expected) {
            auto data = test.expected->load();
            if (!data.ok()) return fail("expected output: " + data.error().message());
            expected = std::move(data.value());
        }

        SandboxSpec spec = runner_.make_spec(exe, dir.value().path(), limits, options_.run_policy);
        spec.argv.insert(spec.argv.end(), sub.args.begin(), sub.args.end());
        spec.stdin_source = test.input.as_stdin();

        if (sub.interactive()) {
            tj.verdict = judge_interactive(sub, test, spec, expected, dir.value().path(), cancel,
                                           &tj.outcome);
            TLOG_DEBUG << "test " << test.id << ": " << verdict_code(tj.verdict) << " " << tj.outcome;
            return tj;
        }

        tj.outcome = runner_.execute(spec, cancel);

        if (sub.checker_path.empty()) {
            tj.verdict = classify(tj.outcome, limits, expected, options_.comparison);
        } else if (auto bad = check_outcome(tj.outcome, limits)) {
            tj.verdict = *bad;
        } else {
            CheckerSpec cs;
            cs.path = sub.checker_path;
            cs.limits = options_.checker_limits;
            cs.policy = options_.checker_policy;
            tj.verdict = Checker(runner_, cs).check(dir.value().path(), test.input,
                                                     tj.outcome.stdout_data, expected.value_or(""),
                                                     cancel);
        }

        TLOG_DEBUG << "test " << test.id << ": " << verdict_code(tj.verdict) << " " << tj.outcome;
        return tj;
    }

private:
    /**
     * @brief 交互题的一个测试点
     *
     * 用户程序超时、超内存、违规优先；其次是交互器的判定；再次是用户程序的
     * 运行错误（交互器提前结束时用户程序常死于 SIGPIPE）；都通过后有 checker 时
     * 由 checker 检查 tout。
     */
    Verdict judge_interactive(const Submission &sub, const TestCase &test, const SandboxSpec &spec,
                              const std::optional<std::string> &expected, const std::string &work_dir,
                              const CancellationToken *cancel, RunOutcome *user_outcome) const {
        InteractorSpec ispec;
        ispec.path = sub.interactor_path;
        ispec.limits = options_.interactor_limits;
        ispec.policy = options_.interactor_policy;
        Interaction ia = Interactor(runner_, ispec).interact(work_dir, test.input, expected.value_or(""),
                                                             spec, cancel);
        *user_outcome = ia.user;

        std::optional<Verdict> bad = check_outcome(ia.user, spec.limits);
        bool runtime_error = bad && is<verdict::RuntimeError>(*bad);
        if (bad && !runtime_error) return *bad;
        if (!is_accepted(ia.verdict)) return ia.verdict;
        if (bad) return *bad;
        if (sub.checker_path.empty()) return verdict::Accepted{};

        CheckerSpec cs;
        cs.path = sub.checker_path;
        cs.limits = options_.checker_limits;
        cs.policy = options_.checker_policy;
        return Checker(runner_, cs).check(work_dir, test.input, ia.tout, expected.value_or(""), cancel);
    }

    void run_sequential(const Submission &sub, const std::vector<TestCase> &tests,
                        const std::string &artifact, const ResourceLimits &limits,
                        const CancellationToken *cancel,
                        std::vector<std::optional<TestJudgement>> &slots) const {
        for (size_t i = 0; i < tests.size(); i++) {
            if (is_cancelled(cancel)) break;
            slots[i] = judge_test(sub, tests[i], artifact, limits, cancel);
            if (options_.short_circuit && !is_accepted(slots[i]->verdict)) break;
        }
    }

    void run_parallel(const Submission &sub, const std::vector<TestCase> &tests,
                      const std::string &artifact, const ResourceLimits &limits,
                      const CancellationToken *cancel,
                      std::vector<std::optional<TestJudgement>> &slots) const {
        const size_t n = tests.size();
        std::vector<std::unique_ptr<CancellationToken>> tokens;
        tokens.reserve(n);
        for (size_t i = 0; i < n; i++) {
            tokens.push_back(std::make_unique<CancellationToken>(cancel));
        }

        std::atomic<size_t> next{0};
        std::mutex mutex;
        size_t first_failure = n;   // 受 mutex 保护

        auto worker = [&] {
            while (true) {
                size_t i = next.fetch_add(1);
                if (i >= n || is_cancelled(cancel)) return;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (i > first_failure) return;
                }

                TestJudgement tj = judge_test(sub, tests[i], artifact, limits, tokens[i].get());
                bool accepted = is_accepted(tj.verdict);

                std::lock_guard<std::mutex> lock(mutex);
                slots[i] = std::move(tj);
                if (options_.short_circuit && !accepted && i < first_failure) {
                    first_failure = i;
                    for (size_t j = i + 1; j < n; j++) tokens[j]->cancel();
                }
            }
        };

        size_t count = std::min(options_.test_concurrency, n);
        std::vector<std::thread> threads;
        threads.reserve(count);
        for (size_t t = 0; t < count; t++) {
            threads.emplace_back(worker);
        }
        for (auto &t : threads) {
            t.join();
        }
    }
};

} // namespace judgebox

#endif // JUDGEBOX_CORE_JUDGER_H
