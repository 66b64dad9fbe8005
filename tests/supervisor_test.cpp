/**
 * @file supervisor_test.cpp
 * @brief 沙箱安全性与资源限制测试
 *
 * 在沙箱中运行 tests/programs 下的测试程序，验证限制与拦截都能生效。
 */

#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <vector>
#include <filesystem>
#include <csignal>
#include <cstring>
#include <sys/resource.h>
#include <sys/syscall.h>

#include "core/types.h"
#include "core/utils.h"
#include "core/classifier.h"
#include "core/cancellation.h"
#include "core/syscall_policy.h"
#include "sandbox/cgroup.h"
#include "sandbox/limiter.h"
#include "sandbox/landlock.h"
#include "sandbox/scratch_dir.h"
#include "sandbox/supervisor.h"

#include "test_programs.h"

using namespace judgebox;
using namespace judgebox::sandbox;
using judgebox::testing_support::program;

class SandboxSecurityTest : public ::testing::Test {
protected:
    ScratchDir work_dir;
    Supervisor supervisor;

    void SetUp() override {
        auto dir = ScratchDir::create(testing_support::scratch_root(), "sup_");
        ASSERT_TRUE(dir.ok()) << dir.error().to_string();
        work_dir = std::move(dir.value());
    }

    // 默认：judge 策略，1s CPU，64MB 内存，捕获输出
    SandboxSpec make_spec(const std::string &name, std::vector<std::string> args = {}) {
        SandboxSpec spec;
        spec.executable_path = program(name);
        spec.argv = {spec.executable_path};
        spec.argv.insert(spec.argv.end(), args.begin(), args.end());
        spec.working_dir = work_dir.path();
        spec.limits = ResourceLimits(1000, 3000, 64 * MiB, 1 * MiB, 1);
        spec.policy = policies::judge_policy();
        spec.use_cgroup = false;
        return spec;
    }

    Verdict verdict_of(const RunOutcome &o, const SandboxSpec &spec) {
        return classify(o, spec.limits, std::nullopt, CompareMode::Exact);
    }

    /// 宿主允许 ptrace 时违规能报告出具体的 syscall
    bool syscalls_reported() {
        RunOutcome o = supervisor.run(make_spec("socket_call"));
        auto v = std::get_if<outcome::PolicyViolation>(&o.exit_status);
        return v != nullptr && v->syscall_nr != -1;
    }
};

//==============================================================================
// 正常运行
//==============================================================================

TEST_F(SandboxSecurityTest, EchoesStdinBytes) {
    SandboxSpec spec = make_spec("echo");
    spec.stdin_source = StdinSource::bytes("1 2 3\nhello\n");
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_EQ(o.stdout_data, "1 2 3\nhello\n");
    EXPECT_EQ(o.stdout_bytes_written, 12u);
    EXPECT_TRUE(o.stderr_data.empty());
    EXPECT_GT(o.memory_peak_bytes, 0u);
    EXPECT_FALSE(o.output_limit_hit);
}

TEST_F(SandboxSecurityTest, StdinFromFileAndStdoutToFile) {
    std::string in = work_dir.file("in.txt");
    std::string out = work_dir.file("out.txt");
    ASSERT_TRUE(write_file(in, "7 8\n").ok());

    SandboxSpec spec = make_spec("sum");
    spec.stdin_source = StdinSource::file(in);
    spec.stdout_sink = OutputSink::file(out);
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_TRUE(o.stdout_data.empty());
    EXPECT_EQ(o.stdout_bytes_written, 3u);

    auto content = read_file(out);
    ASSERT_TRUE(content.ok());
    EXPECT_EQ(content.value(), "15\n");
}

TEST_F(SandboxSecurityTest, EmptyStdinByDefault) {
    RunOutcome o = supervisor.run(make_spec("echo"));
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_TRUE(o.stdout_data.empty());
}

TEST_F(SandboxSecurityTest, EnvironmentIsExactlyTheAllowList) {
    SandboxSpec spec = make_spec("print_env");
    spec.env = {{"FOO", "bar"}};
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_EQ(o.stdout_data, "FOO=bar\n");

    spec.env.clear();
    RunOutcome empty = supervisor.run(spec);
    ASSERT_TRUE(empty.exited_with(0)) << empty;
    EXPECT_TRUE(empty.stdout_data.empty());
}

TEST_F(SandboxSecurityTest, NonZeroExitIsRuntimeError) {
    SandboxSpec spec = make_spec("exit_code", {"3"});
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(3)) << o;
    Verdict v = verdict_of(o, spec);
    ASSERT_TRUE(is<verdict::RuntimeError>(v));
    EXPECT_EQ(std::get<verdict::RuntimeError>(v).exit_code, 3);
}

TEST_F(SandboxSecurityTest, SegfaultIsRuntimeError) {
    SandboxSpec spec = make_spec("segfault");
    RunOutcome o = supervisor.run(spec);
    auto sig = std::get_if<outcome::Signaled>(&o.exit_status);
    ASSERT_NE(sig, nullptr) << o;
    EXPECT_EQ(sig->signal, SIGSEGV);
    Verdict v = verdict_of(o, spec);
    ASSERT_TRUE(is<verdict::RuntimeError>(v));
    EXPECT_EQ(std::get<verdict::RuntimeError>(v).signal, SIGSEGV);
}

//==============================================================================
// 资源限制
//==============================================================================

TEST_F(SandboxSecurityTest, TimeLimitEnforced) {
    SandboxSpec spec = make_spec("busy_loop");
    spec.limits.cpu_time_ms = 200;
    spec.limits.wall_time_ms = kUnbounded;
    RunOutcome o = supervisor.run(spec);

    auto to = std::get_if<outcome::TimedOut>(&o.exit_status);
    ASSERT_NE(to, nullptr) << o;
    EXPECT_EQ(to->kind, outcome::TimeoutKind::Cpu);
    EXPECT_GE(o.cpu_time_used_ms, 200u);
    EXPECT_LE(o.cpu_time_used_ms, 250u);
    EXPECT_TRUE(is<verdict::TimeLimitExceeded>(verdict_of(o, spec)));
}

TEST_F(SandboxSecurityTest, WallLimitCatchesSleepers) {
    SandboxSpec spec = make_spec("sleeper", {"10000"});
    spec.limits.wall_time_ms = 300;
    RunOutcome o = supervisor.run(spec);

    auto to = std::get_if<outcome::TimedOut>(&o.exit_status);
    ASSERT_NE(to, nullptr) << o;
    EXPECT_EQ(to->kind, outcome::TimeoutKind::Wall);
    EXPECT_GE(o.wall_time_used_ms, 300u);
    EXPECT_LT(o.wall_time_used_ms, 1000u);
    EXPECT_LT(o.cpu_time_used_ms, 100u);
    EXPECT_TRUE(is<verdict::TimeLimitExceeded>(verdict_of(o, spec)));
}

TEST_F(SandboxSecurityTest, ShortSleepFinishesWithinWallLimit) {
    SandboxSpec spec = make_spec("sleeper", {"50"});
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_GE(o.wall_time_used_ms, 50u);
}

TEST_F(SandboxSecurityTest, MemoryLimitEnforced) {
    SandboxSpec spec = make_spec("memory_hog", {"256"});
    RunOutcome o = supervisor.run(spec);
    EXPECT_GT(o.memory_peak_bytes, spec.limits.memory_bytes) << o;
    EXPECT_TRUE(is<verdict::MemoryLimitExceeded>(verdict_of(o, spec))) << o;
}

TEST_F(SandboxSecurityTest, MemoryWithinLimitIsAccepted) {
    SandboxSpec spec = make_spec("memory_hog", {"16"});
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_GE(o.memory_peak_bytes, 16 * MiB);
    EXPECT_TRUE(is_accepted(verdict_of(o, spec)));
}

// fork 之后、exec 之前的子进程还是监督进程的镜像，这部分不能算到程序头上
TEST_F(SandboxSecurityTest, SupervisorFootprintNotChargedToChild) {
    std::vector<char> ballast(128 * MiB);
    memset(ballast.data(), 1, ballast.size());

    SandboxSpec spec = make_spec("echo");
    spec.stdin_source = StdinSource::bytes("hi\n");
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_EQ(o.stdout_data, "hi\n");
    EXPECT_LT(o.memory_peak_bytes, spec.limits.memory_bytes) << o;
    EXPECT_TRUE(is_accepted(verdict_of(o, spec))) << o;
    EXPECT_EQ(ballast.back(), 1);
}

TEST_F(SandboxSecurityTest, CapturedOutputIsCapped) {
    SandboxSpec spec = make_spec("output_flood");
    spec.limits.output_bytes = 64 * KiB;
    RunOutcome o = supervisor.run(spec);
    EXPECT_TRUE(o.output_limit_hit) << o;
    EXPECT_EQ(o.stdout_data.size(), 64 * KiB);
    EXPECT_TRUE(is<verdict::OutputLimitExceeded>(verdict_of(o, spec)));
}

TEST_F(SandboxSecurityTest, FileOutputIsCappedByFsize) {
    SandboxSpec spec = make_spec("output_flood");
    spec.limits.output_bytes = 64 * KiB;
    spec.stdout_sink = OutputSink::file(work_dir.file("flood.txt"));
    RunOutcome o = supervisor.run(spec);
    EXPECT_LE(o.stdout_bytes_written, 64 * KiB);
    EXPECT_TRUE(is<verdict::OutputLimitExceeded>(verdict_of(o, spec))) << o;
}

TEST(RlimitPlanTest, TranslatesLimits) {
    RlimitPlan plan = plan_rlimits(ResourceLimits(1500, 3000, 64 * MiB, 1 * MiB, 1));
    const RlimitEntry *cpu = plan.find(RLIMIT_CPU);
    ASSERT_NE(cpu, nullptr);
    EXPECT_EQ(cpu->soft, 3u);   // 向上取整后再留 1 秒
    EXPECT_EQ(cpu->hard, 4u);
    ASSERT_NE(plan.find(RLIMIT_AS), nullptr);
    EXPECT_EQ(plan.find(RLIMIT_AS)->soft, 128 * MiB);
    ASSERT_NE(plan.find(RLIMIT_FSIZE), nullptr);
    EXPECT_EQ(plan.find(RLIMIT_FSIZE)->soft, 1 * MiB);
    ASSERT_NE(plan.find(RLIMIT_CORE), nullptr);
    EXPECT_EQ(plan.find(RLIMIT_CORE)->hard, 0u);
    // 进程数交给 cgroup pids.max 和 syscall 策略
    EXPECT_EQ(plan.find(RLIMIT_NPROC), nullptr);

    RlimitPlan unbounded = plan_rlimits(ResourceLimits(kUnbounded, kUnbounded, kUnbounded, kUnbounded, kUnbounded));
    EXPECT_EQ(unbounded.find(RLIMIT_CPU), nullptr);
    EXPECT_EQ(unbounded.find(RLIMIT_AS), nullptr);
    EXPECT_EQ(unbounded.find(RLIMIT_FSIZE), nullptr);
    EXPECT_NE(unbounded.find(RLIMIT_CORE), nullptr);
}

TEST(RlimitPlanTest, EffectiveWallLimit) {
    EXPECT_EQ(ResourceLimits(1000, 2500, 0, 0).effective_wall_ms(), 2500u);
    EXPECT_EQ(ResourceLimits(1000, kUnbounded, 0, 0).effective_wall_ms(), 4000u);
    EXPECT_EQ(ResourceLimits(kUnbounded, kUnbounded, 0, 0).effective_wall_ms(), kUnbounded);
}

//==============================================================================
// syscall 拦截
//==============================================================================

TEST_F(SandboxSecurityTest, NetworkBlocked) {
    SandboxSpec spec = make_spec("socket_call");
    RunOutcome o = supervisor.run(spec);
    auto v = std::get_if<outcome::PolicyViolation>(&o.exit_status);
    ASSERT_NE(v, nullptr) << o;
    // 宿主不允许 ptrace 时无法得知具体的 syscall
    EXPECT_TRUE(v->syscall_nr == __NR_socket || v->syscall_nr == -1) << v->syscall_nr;
    EXPECT_TRUE(o.stdout_data.empty());
    EXPECT_TRUE(is<verdict::SecurityViolation>(verdict_of(o, spec)));
}

TEST_F(SandboxSecurityTest, ViolationWithoutSyscallReport) {
    SandboxSpec spec = make_spec("socket_call");
    spec.report_syscalls = false;
    RunOutcome o = supervisor.run(spec);
    auto v = std::get_if<outcome::PolicyViolation>(&o.exit_status);
    ASSERT_NE(v, nullptr) << o;
    EXPECT_EQ(v->syscall_nr, -1);
}

TEST_F(SandboxSecurityTest, DeniedSyscallReturnsErrno) {
    SandboxSpec spec = make_spec("socket_call");
    spec.policy = policies::compiler_policy();
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_EQ(o.stdout_data, "socket=-1\n");
}

TEST_F(SandboxSecurityTest, ForkBombLimited) {
    SandboxSpec spec = make_spec("fork_bomb");
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(std::holds_alternative<outcome::PolicyViolation>(o.exit_status)) << o;
    EXPECT_TRUE(is<verdict::SecurityViolation>(verdict_of(o, spec)));
}

// 没有 cgroup 时也不能因为宿主上同一 uid 的进程数而拒绝建线程
TEST_F(SandboxSecurityTest, ThreadsAllowedWithSingleProcessLimit) {
    SandboxSpec spec = make_spec("threads");
    ASSERT_EQ(spec.limits.max_processes, 1u);
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_EQ(o.stdout_data, "8000002000000\n");
    EXPECT_TRUE(is_accepted(verdict_of(o, spec)));
}

// 违规线程不是主线程，且进程自己装了 SIGSYS 处理函数
TEST_F(SandboxSecurityTest, ViolationInSecondaryThreadIsCaught) {
    SandboxSpec spec = make_spec("thread_trap");
    RunOutcome o = supervisor.run(spec);
    auto v = std::get_if<outcome::PolicyViolation>(&o.exit_status);
    ASSERT_NE(v, nullptr) << o;
    EXPECT_TRUE(v->syscall_nr == __NR_socket || v->syscall_nr == -1) << v->syscall_nr;
    EXPECT_EQ(o.stdout_data.find("survived"), std::string::npos) << o.stdout_data;
    EXPECT_TRUE(is<verdict::SecurityViolation>(verdict_of(o, spec)));
}

// 程序把 exec 路径指针所在的地址重新映射出来，再 execve 一次
TEST_F(SandboxSecurityTest, SecondExecThroughRemappedPathIsViolation) {
    if (!syscalls_reported()) {
        GTEST_SKIP() << "ptrace not permitted on this host";
    }
    SandboxSpec spec = make_spec("reexec");
    const uintptr_t exec_ptr = reinterpret_cast<uintptr_t>(spec.executable_path.c_str());
    spec.argv.push_back(std::to_string(exec_ptr));
    spec.argv.push_back(program("echo"));
    RunOutcome o = supervisor.run(spec);
    if (o.exited_with(2)) {
        GTEST_SKIP() << "exec path address already mapped in the new image";
    }
    auto v = std::get_if<outcome::PolicyViolation>(&o.exit_status);
    ASSERT_NE(v, nullptr) << o;
    EXPECT_EQ(v->syscall_nr, __NR_execve);
    EXPECT_TRUE(o.stdout_data.empty()) << o.stdout_data;
    EXPECT_TRUE(is<verdict::SecurityViolation>(verdict_of(o, spec)));
}

TEST_F(SandboxSecurityTest, WriteOpenDeniedByJudgePolicy) {
    SandboxSpec spec = make_spec("write_file", {work_dir.file("created.txt")});
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_EQ(o.stdout_data, "denied\n");
    EXPECT_FALSE(file_exists(work_dir.file("created.txt")));
}

TEST_F(SandboxSecurityTest, WritesConfinedToWorkingDir) {
    if (!landlock::available()) {
        GTEST_SKIP() << "Landlock not supported by this kernel";
    }
    auto outside = ScratchDir::create(testing_support::scratch_root(), "outside_");
    ASSERT_TRUE(outside.ok());

    SandboxSpec inside_spec = make_spec("write_file", {work_dir.file("ok.txt")});
    inside_spec.policy = policies::compiler_policy();
    RunOutcome inside = supervisor.run(inside_spec);
    ASSERT_TRUE(inside.exited_with(0)) << inside;
    EXPECT_EQ(inside.stdout_data, "written\n");

    SandboxSpec outside_spec = make_spec("write_file", {outside.value().file("escape.txt")});
    outside_spec.policy = policies::compiler_policy();
    RunOutcome escaped = supervisor.run(outside_spec);
    ASSERT_TRUE(escaped.exited_with(0)) << escaped;
    EXPECT_EQ(escaped.stdout_data, "denied\n");
    EXPECT_FALSE(file_exists(outside.value().file("escape.txt")));
}

TEST_F(SandboxSecurityTest, PolicyDenyingEverythingNeverStarts) {
    SandboxSpec spec = make_spec("echo");
    spec.policy = SyscallPolicy("deny_all", PolicyAction::Deny);
    RunOutcome o = supervisor.run(spec);
    auto v = std::get_if<outcome::PolicyViolation>(&o.exit_status);
    ASSERT_NE(v, nullptr) << o;
    EXPECT_EQ(v->syscall_nr, __NR_execve);
    EXPECT_EQ(o.cpu_time_used_ms, 0u);
    EXPECT_TRUE(is<verdict::SecurityViolation>(verdict_of(o, spec)));
}

TEST_F(SandboxSecurityTest, InvalidPolicyIsSupervisorError) {
    SandboxSpec spec = make_spec("echo");
    spec.policy = SyscallPolicy("broken", PolicyAction::Allow);
    spec.policy.deny({__NR_read}, 0);
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.is_supervisor_error()) << o;
    EXPECT_TRUE(is<verdict::SystemError>(verdict_of(o, spec)));
}

//==============================================================================
// 宿主侧失败与取消
//==============================================================================

TEST_F(SandboxSecurityTest, MissingExecutableIsSupervisorError) {
    SandboxSpec spec = make_spec("echo");
    spec.executable_path = work_dir.file("no_such_program");
    spec.argv = {spec.executable_path};
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.is_supervisor_error()) << o;
    EXPECT_NE(std::get<outcome::SupervisorError>(o.exit_status).reason.find("no_such_program"),
              std::string::npos);
}

TEST_F(SandboxSecurityTest, MissingStdinFileIsSupervisorError) {
    SandboxSpec spec = make_spec("echo");
    spec.stdin_source = StdinSource::file(work_dir.file("missing.in"));
    RunOutcome o = supervisor.run(spec);
    EXPECT_TRUE(o.is_supervisor_error()) << o;
}

TEST_F(SandboxSecurityTest, MissingWorkingDirReportsSetupStage) {
    SandboxSpec spec = make_spec("echo");
    spec.working_dir = work_dir.file("missing_dir");
    spec.confine_writes = false;
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.is_supervisor_error()) << o;
    EXPECT_EQ(std::get<outcome::SupervisorError>(o.exit_status).reason.find("setup"), 0u);
}

TEST_F(SandboxSecurityTest, CancellationStopsRun) {
    SandboxSpec spec = make_spec("sleeper", {"10000"});
    spec.limits.wall_time_ms = 10000;
    CancellationToken token;

    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    RunOutcome o = supervisor.run(spec, &token);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    canceller.join();

    ASSERT_TRUE(o.is_supervisor_error()) << o;
    EXPECT_EQ(std::get<outcome::SupervisorError>(o.exit_status).reason, "cancelled");
    EXPECT_LT(elapsed, 2000);
}

TEST_F(SandboxSecurityTest, AlreadyCancelledNeverStarts) {
    CancellationToken token;
    token.cancel();
    RunOutcome o = supervisor.run(make_spec("echo"), &token);
    ASSERT_TRUE(o.is_supervisor_error());
    EXPECT_EQ(o.wall_time_used_ms, 0u);
}

TEST_F(SandboxSecurityTest, ConcurrentRunsAreIndependent) {
    const int n = 6;
    std::vector<RunOutcome> outcomes(n);
    std::vector<std::thread> threads;
    for (int i = 0; i < n; i++) {
        threads.emplace_back([&, i] {
            SandboxSpec spec = make_spec("echo");
            spec.stdin_source = StdinSource::bytes("run " + std::to_string(i) + "\n");
            outcomes[i] = supervisor.run(spec);
        });
    }
    for (auto &t : threads) t.join();

    for (int i = 0; i < n; i++) {
        ASSERT_TRUE(outcomes[i].exited_with(0)) << outcomes[i];
        EXPECT_EQ(outcomes[i].stdout_data, "run " + std::to_string(i) + "\n");
    }
}

//==============================================================================
// cgroup
//==============================================================================

class CgroupSandboxTest : public SandboxSecurityTest {
protected:
    void SetUp() override {
        SandboxSecurityTest::SetUp();
        if (HasFatalFailure()) return;
        auto init = CgroupManager::instance().initialize();
        if (!init.ok()) {
            GTEST_SKIP() << "cgroup v2 not usable: " << init.error().message();
        }
    }

    SandboxSpec make_cgroup_spec(const std::string &name, std::vector<std::string> args = {}) {
        SandboxSpec spec = make_spec(name, std::move(args));
        spec.use_cgroup = true;
        return spec;
    }

    /// 本进程创建、尚未删除的运行 cgroup
    static size_t live_run_cgroups() {
        const std::string prefix = "box_" + std::to_string(getpid()) + "_";
        size_t n = 0;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(
                 CgroupManager::instance().sandbox_parent_path(), ec)) {
            if (entry.path().filename().string().rfind(prefix, 0) == 0) n++;
        }
        return n;
    }
};

TEST_F(CgroupSandboxTest, MemoryPeakComesFromCgroup) {
    SandboxSpec spec = make_cgroup_spec("memory_hog", {"256"});
    RunOutcome o = supervisor.run(spec);
    const uint64_t memory_max = CgroupLimits::from(spec.limits).memory_max;
    EXPECT_GT(o.memory_peak_bytes, spec.limits.memory_bytes) << o;
    EXPECT_LE(o.memory_peak_bytes, memory_max) << o;
    EXPECT_TRUE(is<verdict::MemoryLimitExceeded>(verdict_of(o, spec))) << o;
}

TEST_F(CgroupSandboxTest, SmallProgramNextToLargeSupervisor) {
    std::vector<char> ballast(128 * MiB);
    memset(ballast.data(), 1, ballast.size());

    SandboxSpec spec = make_cgroup_spec("memory_hog", {"16"});
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_GE(o.memory_peak_bytes, 16 * MiB);
    EXPECT_LT(o.memory_peak_bytes, spec.limits.memory_bytes) << o;
    EXPECT_TRUE(is_accepted(verdict_of(o, spec)));
    EXPECT_EQ(ballast.back(), 1);
}

TEST_F(CgroupSandboxTest, ForkingStoppedByPidsMax) {
    SandboxSpec spec = make_cgroup_spec("fork_count", {"64"});
    spec.policy = policies::compiler_policy();
    spec.limits.max_processes = 4;
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    ASSERT_EQ(o.stdout_data.rfind("forked=", 0), 0u) << o.stdout_data;
    long forked = std::stol(o.stdout_data.substr(7));
    // pids.max = max_processes + 2，主进程自己占一个
    EXPECT_LE(forked, static_cast<long>(CgroupLimits::from(spec.limits).pids_max) - 1);
    EXPECT_LT(forked, 64);
}

TEST_F(CgroupSandboxTest, ThreadsWithinPidsMax) {
    SandboxSpec spec = make_cgroup_spec("threads");
    spec.limits.max_processes = 8;
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_EQ(o.stdout_data, "8000002000000\n");
}

TEST_F(CgroupSandboxTest, RunCgroupRemovedAfterRun) {
    size_t during = 0;
    SandboxSpec spec = make_cgroup_spec("sleeper", {"50"});
    spec.on_started = [&during](pid_t) { during = live_run_cgroups(); };
    RunOutcome o = supervisor.run(spec);
    ASSERT_TRUE(o.exited_with(0)) << o;
    EXPECT_EQ(during, 1u);
    EXPECT_EQ(live_run_cgroups(), 0u);

    RunOutcome killed = supervisor.run(make_cgroup_spec("memory_hog", {"256"}));
    EXPECT_FALSE(killed.exited_with(0)) << killed;
    EXPECT_EQ(live_run_cgroups(), 0u);
}
