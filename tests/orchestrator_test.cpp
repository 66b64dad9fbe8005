/**
 * @file orchestrator_test.cpp
 * @brief 评测流程测试：编译、测试点、短路、并行、checker、评测池与取消
 *
 * "编译" 用 /bin/cp 或 /bin/sh 模拟，不依赖宿主上的编译器。
 */

#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <future>
#include <sys/syscall.h>

#include "core/verdict.h"
#include "core/config.h"
#include "core/submission.h"
#include "core/run_slots.h"
#include "core/runner.h"
#include "core/judger.h"
#include "core/worker_pool.h"
#include "core/result.h"
#include "core/cancellation.h"

#include "test_programs.h"

using namespace judgebox;
using judgebox::testing_support::program;

namespace {

TestCase make_test(const std::string &id, const std::string &input,
                   std::optional<std::string> expected = std::nullopt) {
    TestCase tc;
    tc.id = id;
    tc.input = TestData::from_bytes(input);
    if (expected) tc.expected = TestData::from_bytes(*expected);
    return tc;
}

Submission executable_submission(const std::string &id, const std::string &name) {
    Submission sub;
    sub.id = id;
    sub.executable_path = program(name);
    return sub;
}

CompileStep copy_compile() {
    CompileStep step;
    step.command = "/bin/cp {source} {output}";
    return step;
}

} // namespace

class JudgerTest : public ::testing::Test {
protected:
    SandboxOptions sandbox;
    JudgeOptions options;

    void SetUp() override {
        sandbox.scratch_root = testing_support::scratch_root();
        sandbox.use_cgroup = false;
        options.run_limits = ResourceLimits(1000, 3000, 64 * MiB, 1 * MiB, 1);
    }

    Judger make_judger() const {
        return Judger(options, Runner(sandbox));
    }
};

//==============================================================================
// 基本结论
//==============================================================================

TEST_F(JudgerTest, ExactMatchIsAccepted) {
    options.comparison = CompareMode::Exact;
    Judger judger = make_judger();
    auto result = judger.judge(executable_submission("a", "sum"),
                               {make_test("1", "1 2\n", std::string("3\n"))});
    EXPECT_TRUE(is_accepted(result.overall)) << result.overall;
    ASSERT_EQ(result.per_test.size(), 1u);
    EXPECT_EQ(result.per_test[0].test_id, "1");
    EXPECT_EQ(result.per_test[0].outcome.stdout_data, "3\n");
    EXPECT_EQ(result.submission_id, "a");
}

TEST_F(JudgerTest, TrailingWhitespaceDependsOnComparison) {
    std::vector<TestCase> tests = {make_test("1", "1 2\n", std::string("3\n\n   "))};

    options.comparison = CompareMode::Tokens;
    EXPECT_TRUE(is_accepted(make_judger().judge(executable_submission("b", "sum"), tests).overall));

    options.comparison = CompareMode::Lines;
    EXPECT_TRUE(is_accepted(make_judger().judge(executable_submission("b", "sum"), tests).overall));

    options.comparison = CompareMode::Exact;
    auto exact = make_judger().judge(executable_submission("b", "sum"), tests);
    EXPECT_TRUE(is<verdict::WrongAnswer>(exact.overall)) << exact.overall;
}

TEST_F(JudgerTest, ForkingSubmissionIsStopped) {
    auto result = make_judger().judge(executable_submission("c", "fork_bomb"), {make_test("1", "")});
    ASSERT_EQ(result.per_test.size(), 1u);
    EXPECT_TRUE(is<verdict::SecurityViolation>(result.overall) ||
                is<verdict::RuntimeError>(result.overall)) << result.overall;
}

TEST_F(JudgerTest, SubmissionArgsAreAppended) {
    Submission sub = executable_submission("d", "sum");
    sub.args = {"wrong"};
    auto result = make_judger().judge(sub, {make_test("1", "1 2", std::string("3"))});
    EXPECT_TRUE(is<verdict::WrongAnswer>(result.overall)) << result.overall;
}

TEST_F(JudgerTest, SubmissionLimitsOverrideDefaults) {
    Submission sub = executable_submission("e", "sleeper");
    sub.args = {"10000"};
    sub.limits = ResourceLimits(1000, 200, 64 * MiB, 1 * MiB, 1);
    auto result = make_judger().judge(sub, {make_test("1", "")});
    EXPECT_TRUE(is<verdict::TimeLimitExceeded>(result.overall)) << result.overall;
    EXPECT_LT(result.per_test.at(0).outcome.wall_time_used_ms, 1000u);
}

TEST_F(JudgerTest, NoTestsIsAccepted) {
    auto result = make_judger().judge(executable_submission("f", "sum"), {});
    EXPECT_TRUE(is_accepted(result.overall));
    EXPECT_TRUE(result.per_test.empty());
}

TEST_F(JudgerTest, MissingProgramIsSystemError) {
    Submission sub;
    sub.id = "g";
    EXPECT_TRUE(is<verdict::SystemError>(make_judger().judge(sub, {make_test("1", "")}).overall));

    Submission missing = executable_submission("g", "no_such_program");
    auto result = make_judger().judge(missing, {make_test("1", "")});
    EXPECT_TRUE(is<verdict::SystemError>(result.overall)) << result.overall;
}

TEST_F(JudgerTest, UncompilablePolicyRunsNothing) {
    options.run_policy = SyscallPolicy("broken", PolicyAction::Kill);
    options.run_policy.add(-5, PolicyAction::Allow);
    auto result = make_judger().judge(executable_submission("h", "sum"), {make_test("1", "1 2")});
    ASSERT_TRUE(is<verdict::SystemError>(result.overall));
    EXPECT_EQ(std::get<verdict::SystemError>(result.overall).reason.find("policy: "), 0u);
    EXPECT_TRUE(result.per_test.empty());
}

//==============================================================================
// 编译
//==============================================================================

TEST_F(JudgerTest, CompiledArtifactIsJudged) {
    Submission sub;
    sub.id = "compiled";
    sub.source_path = program("sum");
    auto result = make_judger().judge(sub, {make_test("1", "20 22", std::string("42"))}, copy_compile());
    EXPECT_TRUE(is_accepted(result.overall)) << result.overall << "\n" << result.compile_log;
}

TEST_F(JudgerTest, CompilerFailureIsCompileError) {
    CompileStep step;
    step.command = "/bin/sh -c \"echo 'main.c:1:1: error: boom' >&2; exit 1\"";
    Submission sub;
    sub.id = "ce";
    sub.source_path = program("sum");

    auto result = make_judger().judge(sub, {make_test("1", "1 2", std::string("3"))}, step);
    ASSERT_TRUE(is<verdict::CompileError>(result.overall)) << result.overall;
    EXPECT_NE(std::get<verdict::CompileError>(result.overall).diagnostic.find("boom"), std::string::npos);
    EXPECT_NE(result.compile_log.find("boom"), std::string::npos);
    EXPECT_TRUE(result.per_test.empty());
}

TEST_F(JudgerTest, CompilerWithoutOutputIsCompileError) {
    CompileStep step;
    step.command = "/bin/sh -c true";
    Submission sub;
    sub.id = "no_output";
    sub.source_path = program("sum");
    auto result = make_judger().judge(sub, {make_test("1", "1 2")}, step);
    EXPECT_TRUE(is<verdict::CompileError>(result.overall)) << result.overall;
}

TEST_F(JudgerTest, CompilerTimeoutIsCompileError) {
    CompileStep step;
    step.command = program("busy_loop");
    step.limits = ResourceLimits(200, 1000, 256 * MiB, 1 * MiB, 64);
    Submission sub;
    sub.id = "slow_compile";
    sub.source_path = program("sum");
    auto result = make_judger().judge(sub, {make_test("1", "1 2")}, step);
    ASSERT_TRUE(is<verdict::CompileError>(result.overall)) << result.overall;
    EXPECT_NE(std::get<verdict::CompileError>(result.overall).diagnostic.find("Time Limit"), std::string::npos);
}

TEST_F(JudgerTest, MissingCompilerIsSystemError) {
    CompileStep step;
    step.command = "no-such-compiler {source}";
    Submission sub;
    sub.id = "no_cc";
    sub.source_path = program("sum");
    auto result = make_judger().judge(sub, {make_test("1", "1 2")}, step);
    EXPECT_FALSE(is_accepted(result.overall));
    EXPECT_TRUE(result.per_test.empty());
}

//==============================================================================
// 短路与并行
//==============================================================================

TEST_F(JudgerTest, ShortCircuitStopsAtFirstFailure) {
    std::vector<TestCase> tests = {
        make_test("1", "1 1", std::string("2")),
        make_test("2", "1 1", std::string("3")),
        make_test("3", "2 2", std::string("4")),
    };
    auto result = make_judger().judge(executable_submission("sc", "sum"), tests);
    EXPECT_TRUE(is<verdict::WrongAnswer>(result.overall));
    ASSERT_EQ(result.per_test.size(), 2u);
    EXPECT_TRUE(is_accepted(result.per_test[0].verdict));
    EXPECT_EQ(result.per_test[1].test_id, "2");

    options.short_circuit = false;
    auto full = make_judger().judge(executable_submission("sc", "sum"), tests);
    EXPECT_TRUE(is<verdict::WrongAnswer>(full.overall));
    ASSERT_EQ(full.per_test.size(), 3u);
    EXPECT_TRUE(is_accepted(full.per_test[2].verdict));
}

TEST_F(JudgerTest, OverallIsWorstVerdict) {
    options.short_circuit = false;
    Submission sub = executable_submission("worst", "sum");
    std::vector<TestCase> tests = {
        make_test("wa", "1 1", std::string("3")),
        make_test("re", "not numbers", std::string("0")),
        make_test("ac", "1 1", std::string("2")),
    };
    auto result = make_judger().judge(sub, tests);
    ASSERT_EQ(result.per_test.size(), 3u);
    EXPECT_TRUE(is<verdict::WrongAnswer>(result.per_test[0].verdict));
    EXPECT_TRUE(is<verdict::RuntimeError>(result.per_test[1].verdict));
    EXPECT_TRUE(is<verdict::RuntimeError>(result.overall));
}

TEST_F(JudgerTest, ParallelTestsKeepDeclaredOrder) {
    options.test_concurrency = 4;
    std::vector<TestCase> tests;
    for (int i = 0; i < 10; i++) {
        tests.push_back(make_test("t" + std::to_string(i), std::to_string(i) + " 100",
                                  std::to_string(i + 100)));
    }
    auto result = make_judger().judge(executable_submission("par", "sum"), tests);
    EXPECT_TRUE(is_accepted(result.overall)) << result.overall;
    ASSERT_EQ(result.per_test.size(), tests.size());
    for (size_t i = 0; i < tests.size(); i++) {
        EXPECT_EQ(result.per_test[i].test_id, tests[i].id);
        EXPECT_EQ(result.per_test[i].outcome.stdout_data, std::to_string(i + 100) + "\n");
    }
}

TEST_F(JudgerTest, ParallelShortCircuitMatchesSequential) {
    std::vector<TestCase> tests;
    for (int i = 0; i < 8; i++) {
        std::string expected = i == 3 ? "wrong" : std::to_string(2 * i);
        tests.push_back(make_test(std::to_string(i), std::to_string(i) + " " + std::to_string(i), expected));
    }
    auto sequential = make_judger().judge(executable_submission("s", "sum"), tests);

    options.test_concurrency = 3;
    auto parallel = make_judger().judge(executable_submission("s", "sum"), tests);

    ASSERT_EQ(sequential.per_test.size(), 4u);
    ASSERT_EQ(parallel.per_test.size(), sequential.per_test.size());
    for (size_t i = 0; i < parallel.per_test.size(); i++) {
        EXPECT_EQ(parallel.per_test[i].test_id, sequential.per_test[i].test_id);
        EXPECT_EQ(verdict_code(parallel.per_test[i].verdict), std::string(verdict_code(sequential.per_test[i].verdict)));
    }
    EXPECT_TRUE(is<verdict::WrongAnswer>(parallel.overall));
}

//==============================================================================
// checker
//==============================================================================

TEST_F(JudgerTest, CheckerDecidesVerdict) {
    Submission sub = executable_submission("chk", "sum");
    sub.checker_path = program("token_checker");
    auto ok = make_judger().judge(sub, {make_test("1", "1 2", std::string("3"))});
    EXPECT_TRUE(is_accepted(ok.overall)) << ok.overall;

    sub.args = {"wrong"};
    auto wa = make_judger().judge(sub, {make_test("1", "1 2", std::string("3"))});
    ASSERT_TRUE(is<verdict::WrongAnswer>(wa.overall)) << wa.overall;
    EXPECT_NE(std::get<verdict::WrongAnswer>(wa.overall).detail.find("token 1"), std::string::npos);
}

TEST_F(JudgerTest, CrashingCheckerIsSystemError) {
    Submission sub = executable_submission("bad_chk", "sum");
    sub.checker_path = program("segfault");
    auto result = make_judger().judge(sub, {make_test("1", "1 2", std::string("3"))});
    EXPECT_TRUE(is<verdict::SystemError>(result.overall)) << result.overall;
}

TEST_F(JudgerTest, CheckerNotRunWhenSubmissionFails) {
    Submission sub = executable_submission("re_chk", "exit_code");
    sub.args = {"4"};
    sub.checker_path = program("token_checker");
    auto result = make_judger().judge(sub, {make_test("1", "", std::string(""))});
    ASSERT_TRUE(is<verdict::RuntimeError>(result.overall)) << result.overall;
}

//==============================================================================
// 交互题
//==============================================================================

namespace {

Submission guessing_submission(const std::string &id, const std::string &mode = "") {
    Submission sub = executable_submission(id, "guesser");
    sub.interactor_path = program("guess_interactor");
    if (!mode.empty()) sub.args = {mode};
    return sub;
}

} // namespace

TEST_F(JudgerTest, InteractiveSearchIsAccepted) {
    auto result = make_judger().judge(guessing_submission("int_ok"),
                                      {make_test("1", "777777\n"), make_test("2", "1\n")});
    EXPECT_TRUE(is_accepted(result.overall)) << result.overall;
    ASSERT_EQ(result.per_test.size(), 2u);
    EXPECT_TRUE(result.per_test[0].outcome.exited_with(0)) << result.per_test[0].outcome;
    // 用户程序的输出全部进了管道
    EXPECT_TRUE(result.per_test[0].outcome.stdout_data.empty());
}

TEST_F(JudgerTest, InteractorVerdictIsReported) {
    auto result = make_judger().judge(guessing_submission("int_wa", "ones"), {make_test("1", "500\n")});
    ASSERT_TRUE(is<verdict::WrongAnswer>(result.overall)) << result.overall;
    EXPECT_NE(std::get<verdict::WrongAnswer>(result.overall).detail.find("too many guesses"),
              std::string::npos);
}

TEST_F(JudgerTest, InteractiveProgramTimeoutComesFirst) {
    Submission sub = guessing_submission("int_tle", "silent");
    sub.limits = ResourceLimits(1000, 300, 64 * MiB, 1 * MiB, 1);
    auto start = std::chrono::steady_clock::now();
    auto result = make_judger().judge(sub, {make_test("1", "42\n")});
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_TRUE(is<verdict::TimeLimitExceeded>(result.overall)) << result.overall;
    EXPECT_LT(elapsed, 5000);
}

TEST_F(JudgerTest, CrashingInteractorIsSystemError) {
    Submission sub = guessing_submission("int_crash");
    sub.interactor_path = program("segfault");
    auto result = make_judger().judge(sub, {make_test("1", "42\n")});
    EXPECT_TRUE(is<verdict::SystemError>(result.overall)) << result.overall;
}

TEST_F(JudgerTest, CheckerReadsInteractorTranscript) {
    Submission sub = guessing_submission("int_chk");
    sub.checker_path = program("token_checker");
    auto ok = make_judger().judge(sub, {make_test("1", "31337\n", std::string("guessed\n"))});
    EXPECT_TRUE(is_accepted(ok.overall)) << ok.overall;

    auto wa = make_judger().judge(sub, {make_test("1", "31337\n", std::string("lost\n"))});
    EXPECT_TRUE(is<verdict::WrongAnswer>(wa.overall)) << wa.overall;
}

TEST_F(JudgerTest, InteractorPolicyMustCompile) {
    options.interactor_policy = SyscallPolicy("broken", PolicyAction::Allow);
    options.interactor_policy.deny({__NR_read}, 0);
    Judger judger = make_judger();
    auto result = judger.judge(guessing_submission("int_policy"), {make_test("1", "1\n")});
    EXPECT_TRUE(is<verdict::SystemError>(result.overall)) << result.overall;
    EXPECT_TRUE(result.per_test.empty());

    // 非交互题不检查交互器策略
    EXPECT_TRUE(judger.check_policies(std::nullopt, false).ok());
}

//==============================================================================
// 取消
//==============================================================================

TEST_F(JudgerTest, CancelledJudgementIsSystemError) {
    Submission sub = executable_submission("cancel", "sleeper");
    sub.args = {"10000"};
    sub.limits = ResourceLimits(1000, 20000, 64 * MiB, 1 * MiB, 1);
    CancellationToken token;

    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        token.cancel();
    });
    auto result = make_judger().judge(sub, {make_test("1", ""), make_test("2", "")}, std::nullopt, &token);
    canceller.join();

    ASSERT_TRUE(is<verdict::SystemError>(result.overall)) << result.overall;
    EXPECT_EQ(std::get<verdict::SystemError>(result.overall).reason, "cancelled");
}

TEST(RunSlotsTest, CountsAndCancels) {
    RunSlots slots(2);
    EXPECT_EQ(slots.capacity(), 2u);
    {
        RunSlotGuard a(&slots, nullptr);
        RunSlotGuard b(&slots, nullptr);
        EXPECT_TRUE(a.held());
        EXPECT_TRUE(b.held());
        EXPECT_EQ(slots.available(), 0u);

        CancellationToken token;
        std::thread canceller([&token] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            token.cancel();
        });
        RunSlotGuard c(&slots, &token);
        canceller.join();
        EXPECT_FALSE(c.held());
    }
    EXPECT_EQ(slots.available(), 2u);

    RunSlotGuard unlimited(nullptr, nullptr);
    EXPECT_TRUE(unlimited.held());
}

TEST(CancellationTokenTest, ParentPropagates) {
    CancellationToken parent;
    CancellationToken child(&parent);
    EXPECT_FALSE(child.cancelled());
    parent.cancel();
    EXPECT_TRUE(child.cancelled());
    EXPECT_FALSE(is_cancelled(nullptr));
}

//==============================================================================
// 评测池
//==============================================================================

class JudgePoolTest : public JudgerTest {
protected:
    PoolOptions pool;

    void SetUp() override {
        JudgerTest::SetUp();
        pool.workers = 2;
        pool.run_slots = 2;
    }

    JudgeRequest sum_request(const std::string &id, int a, int b) {
        JudgeRequest req;
        req.submission = executable_submission(id, "sum");
        req.tests = {make_test("1", std::to_string(a) + " " + std::to_string(b), std::to_string(a + b))};
        return req;
    }
};

TEST_F(JudgePoolTest, JudgesManySubmissions) {
    JudgePool judge_pool(pool, options, sandbox);
    EXPECT_EQ(judge_pool.run_slots(), 2u);

    std::vector<std::future<SubmissionJudgement>> futures;
    for (int i = 0; i < 6; i++) {
        auto f = judge_pool.submit(sum_request("s" + std::to_string(i), i, i * 10));
        ASSERT_TRUE(f.ok()) << f.error().to_string();
        futures.push_back(std::move(f.value()));
    }
    for (int i = 0; i < 6; i++) {
        SubmissionJudgement j = futures[i].get();
        EXPECT_EQ(j.submission_id, "s" + std::to_string(i));
        EXPECT_TRUE(is_accepted(j.overall)) << j.overall;
    }
}

TEST_F(JudgePoolTest, CancelRunningSubmission) {
    JudgePool judge_pool(pool, options, sandbox);
    JudgeRequest req;
    req.submission = executable_submission("slow", "sleeper");
    req.submission.args = {"10000"};
    req.submission.limits = ResourceLimits(1000, 20000, 64 * MiB, 1 * MiB, 1);
    req.tests = {make_test("1", "")};

    auto f = judge_pool.submit(req);
    ASSERT_TRUE(f.ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_TRUE(judge_pool.cancel("slow"));
    EXPECT_FALSE(judge_pool.cancel("unknown"));

    auto status = f.value().wait_for(std::chrono::seconds(5));
    ASSERT_EQ(status, std::future_status::ready);
    SubmissionJudgement j = f.value().get();
    ASSERT_TRUE(is<verdict::SystemError>(j.overall)) << j.overall;
    EXPECT_EQ(std::get<verdict::SystemError>(j.overall).reason, "cancelled");
}

TEST_F(JudgePoolTest, RejectsUncompilablePolicy) {
    options.run_policy = SyscallPolicy("broken", PolicyAction::Deny);
    options.run_policy.default_errno = 0;
    JudgePool judge_pool(pool, options, sandbox);
    auto f = judge_pool.submit(sum_request("x", 1, 2));
    ASSERT_FALSE(f.ok());
    EXPECT_EQ(f.error().code(), ErrorCode::POLICY_ERROR);
}

TEST_F(JudgePoolTest, ShutdownRejectsNewWork) {
    JudgePool judge_pool(pool, options, sandbox);
    auto before = judge_pool.submit(sum_request("before", 1, 2));
    ASSERT_TRUE(before.ok());
    judge_pool.shutdown();
    EXPECT_TRUE(is_accepted(before.value().get().overall));

    auto after = judge_pool.submit(sum_request("after", 1, 2));
    ASSERT_FALSE(after.ok());
    EXPECT_EQ(after.error().code(), ErrorCode::JUDGE_ERROR);
}

TEST_F(JudgePoolTest, ShutdownCancelsPending) {
    pool.workers = 1;
    JudgePool judge_pool(pool, options, sandbox);
    std::vector<std::future<SubmissionJudgement>> futures;
    for (int i = 0; i < 3; i++) {
        JudgeRequest req;
        req.submission = executable_submission("p" + std::to_string(i), "sleeper");
        req.submission.args = {"10000"};
        req.submission.limits = ResourceLimits(1000, 20000, 64 * MiB, 1 * MiB, 1);
        req.tests = {make_test("1", "")};
        auto f = judge_pool.submit(req);
        ASSERT_TRUE(f.ok());
        futures.push_back(std::move(f.value()));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    judge_pool.shutdown(true);
    for (auto &f : futures) {
        EXPECT_TRUE(is<verdict::SystemError>(f.get().overall));
    }
}

//==============================================================================
// 报告
//==============================================================================

TEST_F(JudgerTest, ReportListsTests) {
    options.short_circuit = false;
    auto result = make_judger().judge(executable_submission("rep", "sum"), {
        make_test("1", "1 2", std::string("3")),
        make_test("2", "1 2", std::string("<4>")),
    });
    std::string text = JudgeReport(result).str();
    EXPECT_NE(text.find("submission rep\n"), std::string::npos);
    EXPECT_NE(text.find("result WA\n"), std::string::npos);
    EXPECT_NE(text.find("<test id=\"1\" result=\"AC\""), std::string::npos);
    EXPECT_NE(text.find("<test id=\"2\" result=\"WA\""), std::string::npos);
    EXPECT_NE(text.find("&lt;4&gt;"), std::string::npos);
    EXPECT_NE(text.find("</tests>"), std::string::npos);

    std::string quiet = JudgeReport(result).preview_length(0).str();
    EXPECT_EQ(quiet.find("<out>"), std::string::npos);
}

TEST(JudgeReportTest, CompileErrorReport) {
    SubmissionJudgement j;
    j.submission_id = "7";
    j.overall = verdict::CompileError{"a.c:1: error: <missing>"};
    std::string text = JudgeReport(j).str();
    EXPECT_NE(text.find("result CE\n"), std::string::npos);
    EXPECT_NE(text.find("<compile-error>a.c:1: error: &lt;missing&gt;</compile-error>"), std::string::npos);
    EXPECT_EQ(text.find("<tests>"), std::string::npos);
}
