/**
 * @file supervisor.h
 * @brief 沙箱进程监督
 *
 * 一次 run() 对应一个独立的子进程树：
 *
 *   父进程（fork 前）: 编译过滤器、算好 rlimit、打开标准流、建 Landlock 规则集
 *   子进程:           等待放行 → setpgid → chdir → 重定向 → 关闭多余 fd
 *                     → rlimit（Limits Applied）→ Landlock
 *                     → seccomp（Policy Installed）→ execve（Executing）
 *   父进程（fork 后）: 放入 cgroup、PTRACE_SEIZE、放行，然后轮询：
 *                     读取捕获管道、回收、处理 ptrace 停止、CPU/墙钟/内存/取消检查
 *
 * fork 与 execve 之间子进程只做异步信号安全的系统调用，失败时把阶段和 errno
 * 写进 O_CLOEXEC 的状态管道后 _exit(127)。exec 成功后状态管道被内核关闭。
 *
 * 跟踪只处理停止事件，不跟踪 syscall：
 *   - 新线程（TRACECLONE）：每个线程的 seccomp SIGSYS 都由监督进程接管
 *   - execve（TRACEEXEC）：第一次是监督进程自己的 exec，之后的任何 exec 都是违规
 *   - 退出（TRACEEXIT）：mm 释放前读取 VmHWM，即 exec 之后的峰值常驻内存
 */

#ifndef JUDGEBOX_SANDBOX_SUPERVISOR_H
#define JUDGEBOX_SANDBOX_SUPERVISOR_H

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <mutex>
#include <algorithm>
#include <cstddef>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <cstdlib>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <sys/ptrace.h>
#include <sys/syscall.h>
#include <sys/resource.h>
#include <linux/close_range.h>

#include "core/error.h"
#include "core/types.h"
#include "core/cancellation.h"
#include "core/judger_logger.h"
#include "sandbox/process.h"
#include "sandbox/limiter.h"
#include "sandbox/seccomp.h"
#include "sandbox/landlock.h"
#include "sandbox/cgroup.h"

#ifndef SYS_SECCOMP
#define SYS_SECCOMP 1
#endif

namespace judgebox {
namespace sandbox {

/**
 * @brief 子进程失败的阶段
 */
enum class ChildStage : int {
    Setup = 0,    ///< setpgid / chdir / 重定向 / fd 清理
    Limits = 1,
    Landlock = 2,
    Policy = 3,
    Exec = 4
};

inline const char* child_stage_str(ChildStage stage) {
    switch (stage) {
        case ChildStage::Setup:    return "setup";
        case ChildStage::Limits:   return "limit";
        case ChildStage::Landlock: return "landlock";
        case ChildStage::Policy:   return "policy install";
        case ChildStage::Exec:     return "exec";
    }
    return "?";
}

/**
 * @brief 子进程经状态管道上报的失败
 */
struct ChildFailure {
    int stage;
    int err;
};

/// 放行字节：T 安装 TRAP 版过滤器（父进程在跟踪），K 安装 KILL 版
constexpr char kGoTraced = 'T';
constexpr char kGoUntraced = 'K';

namespace detail {

/**
 * @brief 子进程需要的全部数据，fork 前准备好
 */
struct ChildContext {
    int go_fd = -1;
    int status_fd = -1;
    int stdio[3] = {-1, -1, -1};
    const char *working_dir = nullptr;
    const RlimitPlan *rlimits = nullptr;
    int landlock_fd = -1;
    const FilterProgram *trap_filter = nullptr;
    const FilterProgram *kill_filter = nullptr;
    const char *exec_path = nullptr;
    char *const *argv = nullptr;
    char *const *envp = nullptr;
};

[[noreturn]] inline void child_fail(int status_fd, ChildStage stage, int err) {
    ChildFailure f;
    f.stage = static_cast<int>(stage);
    f.err = err;
    ssize_t n = write(status_fd, &f, sizeof(f));
    (void)n;  // 父进程读不到时按 exit 127 处理
    _exit(127);
}

/**
 * @brief fork 之后的子进程入口，不返回
 */
[[noreturn]] inline void child_main(const ChildContext &ctx) {
    char mode = 0;
    ssize_t n;
    do {
        n = read(ctx.go_fd, &mode, 1);
    } while (n < 0 && errno == EINTR);
    if (n != 1) {
        // 父进程在放行前放弃了这次运行
        _exit(127);
    }

    if (setpgid(0, 0) < 0) {
        child_fail(ctx.status_fd, ChildStage::Setup, errno);
    }
    if (ctx.working_dir && chdir(ctx.working_dir) < 0) {
        child_fail(ctx.status_fd, ChildStage::Setup, errno);
    }
    for (int i = 0; i < 3; i++) {
        if (ctx.stdio[i] == i) {
            if (fcntl(i, F_SETFD, 0) < 0) {
                child_fail(ctx.status_fd, ChildStage::Setup, errno);
            }
        } else if (dup2(ctx.stdio[i], i) < 0) {
            child_fail(ctx.status_fd, ChildStage::Setup, errno);
        }
    }
    // 其余 fd 在 exec 时全部关闭；状态管道与规则集 fd 要用到 exec 之前
    if (syscall(__NR_close_range, 3U, ~0U, CLOSE_RANGE_CLOEXEC) < 0) {
        child_fail(ctx.status_fd, ChildStage::Setup, errno);
    }

    int err = 0;
    if (!apply_rlimits(*ctx.rlimits, &err)) {
        child_fail(ctx.status_fd, ChildStage::Limits, err);
    }

    if (ctx.landlock_fd >= 0 && !enforce_ruleset(ctx.landlock_fd, &err)) {
        child_fail(ctx.status_fd, ChildStage::Landlock, err);
    }

    const FilterProgram *filter =
        (mode == kGoTraced && ctx.trap_filter) ? ctx.trap_filter : ctx.kill_filter;
    if (!install_filter(*filter, &err)) {
        child_fail(ctx.status_fd, ChildStage::Policy, err);
    }

    execve(ctx.exec_path, ctx.argv, ctx.envp);
    child_fail(ctx.status_fd, ChildStage::Exec, errno);
}

/**
 * @brief 从 /proc/<pid>/stat 读取 utime + stime（毫秒）
 */
inline bool read_proc_cpu_ms(pid_t pid, uint64_t *ms) {
    char path[64];
    snprintf(path, sizeof(path), "/proc/%d/stat", static_cast<int>(pid));
    UniqueFd fd(open(path, O_RDONLY | O_CLOEXEC));
    if (!fd) return false;

    char buf[1024];
    ssize_t n = read(fd.get(), buf, sizeof(buf) - 1);
    if (n <= 0) return false;
    buf[n] = '\0';

    // comm 字段可能含空格和括号，从最后一个 ')' 之后开始数
    char *p = strrchr(buf, ')');
    if (!p) return false;
    p++;

    // ')' 之后第一个字段是第 3 个字段（state），utime/stime 是第 14/15 个
    unsigned long long utime = 0, stime = 0;
    int field = 2;
    char *save = nullptr;
    for (char *tok = strtok_r(p, " ", &save); tok; tok = strtok_r(nullptr, " ", &save)) {
        field++;
        if (field == 14) utime = strtoull(tok, nullptr, 10);
        if (field == 15) {
            stime = strtoull(tok, nullptr, 10);
            break;
        }
    }
    if (field < 15) return false;

    static const long ticks = sysconf(_SC_CLK_TCK);
    *ms = (utime + stime) * 1000ULL / static_cast<unsigned long long>(ticks > 0 ? ticks : 100);
    return true;
}

/**
 * @brief 从 /proc/<pid>/statm 读取常驻内存（字节）
 */
inline bool read_proc_rss_bytes(pid_t pid, uint64_t *bytes) {
    char path[64];
    snprintf(path, sizeof(path), "/proc/%d/statm", static_cast<int>(pid));
    UniqueFd fd(open(path, O_RDONLY | O_CLOEXEC));
    if (!fd) return false;

    char buf[256];
    ssize_t n = read(fd.get(), buf, sizeof(buf) - 1);
    if (n <= 0) return false;
    buf[n] = '\0';

    unsigned long long size_pages = 0, resident_pages = 0;
    if (sscanf(buf, "%llu %llu", &size_pages, &resident_pages) != 2) return false;

    static const long page = sysconf(_SC_PAGESIZE);
    *bytes = resident_pages * static_cast<unsigned long long>(page > 0 ? page : 4096);
    return true;
}

/**
 * @brief 从 /proc/<tid>/status 读取 VmHWM（字节）
 *
 * 只在 exec 之后的地址空间上有意义；fork 出来的监督进程镜像不计入。
 */
inline bool read_proc_hwm_bytes(pid_t tid, uint64_t *bytes) {
    char path[64];
    snprintf(path, sizeof(path), "/proc/%d/status", static_cast<int>(tid));
    UniqueFd fd(open(path, O_RDONLY | O_CLOEXEC));
    if (!fd) return false;

    char buf[4096];
    ssize_t n = read(fd.get(), buf, sizeof(buf) - 1);
    if (n <= 0) return false;
    buf[n] = '\0';

    const char *p = strstr(buf, "VmHWM:");
    if (!p) return false;
    unsigned long long kb = 0;
    if (sscanf(p + 6, "%llu", &kb) != 1) return false;
    *bytes = kb * 1024ULL;
    return true;
}

inline uint64_t timeval_ms(const struct timeval &tv) {
    return static_cast<uint64_t>(tv.tv_sec) * 1000 + static_cast<uint64_t>(tv.tv_usec) / 1000;
}

} // namespace detail

//==============================================================================
// Supervisor
//==============================================================================

class Supervisor {
public:
    static constexpr int kTickMs = 5;

private:
    /// 进程被杀的第一个原因
    enum class KillReason { None, Wall, Cpu, Memory, Output, Violation, Cancelled, Failure };

    /**
     * @brief 父进程一侧的标准流
     */
    struct Stdio {
        UniqueFd child_fds[3];   ///< 交给子进程 dup2 的 fd
        UniqueFd capture[3];     ///< Capture 模式下父进程持有的读端（只用 1、2）
    };

    static Result<UniqueFd> open_sink(const OutputSink &sink, UniqueFd *capture) {
        switch (sink.kind) {
            case OutputSink::Kind::Null: {
                UniqueFd fd(open("/dev/null", O_WRONLY | O_CLOEXEC));
                if (!fd) {
                    return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
                        std::string("open /dev/null: ") + strerror(errno));
                }
                return std::move(fd);
            }
            case OutputSink::Kind::File: {
                UniqueFd fd(open(sink.path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
                if (!fd) {
                    return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
                        "open " + sink.path + ": " + strerror(errno));
                }
                return std::move(fd);
            }
            case OutputSink::Kind::Fd: {
                UniqueFd fd(fcntl(sink.fd, F_DUPFD_CLOEXEC, 0));
                if (!fd) {
                    return JUDGEBOX_ERROR(ErrorCode::PIPE_FAILED,
                        std::string("dup output fd: ") + strerror(errno));
                }
                return std::move(fd);
            }
            case OutputSink::Kind::Capture: {
                JUDGEBOX_TRY_UNWRAP(pipe, Pipe::create());
                int flags = fcntl(pipe.read_end.get(), F_GETFL);
                if (flags < 0 || fcntl(pipe.read_end.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
                    return JUDGEBOX_ERROR(ErrorCode::PIPE_FAILED,
                        std::string("fcntl O_NONBLOCK: ") + strerror(errno));
                }
                *capture = std::move(pipe.read_end);
                return std::move(pipe.write_end);
            }
        }
        return JUDGEBOX_ERROR(ErrorCode::SYSTEM_ERROR, "unknown output sink");
    }

    static Result<Stdio> prepare_stdio(const SandboxSpec &spec) {
        Stdio io;

        switch (spec.stdin_source.kind) {
            case StdinSource::Kind::Null:
                io.child_fds[0].reset(open("/dev/null", O_RDONLY | O_CLOEXEC));
                if (!io.child_fds[0]) {
                    return JUDGEBOX_ERROR(ErrorCode::FILE_READ_ERROR,
                        std::string("open /dev/null: ") + strerror(errno));
                }
                break;
            case StdinSource::Kind::File:
                io.child_fds[0].reset(open(spec.stdin_source.path.c_str(), O_RDONLY | O_CLOEXEC));
                if (!io.child_fds[0]) {
                    return JUDGEBOX_ERROR(ErrorCode::FILE_NOT_FOUND,
                        "open " + spec.stdin_source.path + ": " + strerror(errno));
                }
                break;
            case StdinSource::Kind::Bytes: {
                JUDGEBOX_TRY_UNWRAP(memfd, make_memfd("judgebox-stdin", spec.stdin_source.data));
                io.child_fds[0] = std::move(memfd);
                break;
            }
            case StdinSource::Kind::Fd:
                io.child_fds[0].reset(fcntl(spec.stdin_source.fd, F_DUPFD_CLOEXEC, 0));
                if (!io.child_fds[0]) {
                    return JUDGEBOX_ERROR(ErrorCode::PIPE_FAILED,
                        std::string("dup input fd: ") + strerror(errno));
                }
                break;
        }

        JUDGEBOX_TRY_UNWRAP(out, open_sink(spec.stdout_sink, &io.capture[1]));
        io.child_fds[1] = std::move(out);
        JUDGEBOX_TRY_UNWRAP(err, open_sink(spec.stderr_sink, &io.capture[2]));
        io.child_fds[2] = std::move(err);

        return std::move(io);
    }

    static uint64_t file_size(const std::string &path) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) return 0;
        return static_cast<uint64_t>(st.st_size);
    }

    static void warn_landlock_unavailable() {
        static std::once_flag once;
        std::call_once(once, [] {
            RLOG_WARN << "landlock not available, file writes are restricted by the syscall policy only";
        });
    }

    static void warn_no_process_limit() {
        static std::once_flag once;
        std::call_once(once, [] {
            RLOG_WARN << "no cgroup, process creation is restricted by the syscall policy only";
        });
    }

public:
    /**
     * @brief 运行一次沙箱
     *
     * 总是返回 RunOutcome；宿主侧的任何失败都表现为 SupervisorError，
     * 只影响这一次运行。
     */
    RunOutcome run(const SandboxSpec &spec, const CancellationToken *cancel = nullptr) const {
        if (spec.executable_path.empty()) {
            return RunOutcome::supervisor_error("exec: empty executable path");
        }
        if (access(spec.executable_path.c_str(), X_OK) != 0) {
            return RunOutcome::supervisor_error("exec " + spec.executable_path + ": " + strerror(errno));
        }
        if (is_cancelled(cancel)) {
            return RunOutcome::supervisor_error("cancelled");
        }

        // 子进程 execve 使用的就是这个指针，过滤器按它的值放行
        const char *exec_path = spec.executable_path.c_str();
        const uint64_t exec_ptr = reinterpret_cast<uintptr_t>(exec_path);

        // 策略连监督进程自己的 exec 都不放行时，程序不可能开始执行
        {
            uint64_t args[6] = {exec_ptr, 0, 0, 0, 0, 0};
            PolicyDecision d = spec.policy.evaluate(__NR_execve, args, exec_ptr);
            if (d.action != PolicyAction::Allow) {
                RLOG_DEBUG << "policy '" << spec.policy.name << "' denies execve, run not started";
                RunOutcome o;
                o.exit_status = outcome::PolicyViolation{__NR_execve};
                return o;
            }
        }

        // 1. 过滤器
        CompileOptions kill_opts;
        kill_opts.exec_path = exec_ptr;
        auto kill_filter = compile(spec.policy, kill_opts);
        if (!kill_filter.ok()) {
            return RunOutcome::supervisor_error("policy: " + kill_filter.error().message());
        }
        std::unique_ptr<FilterProgram> trap_filter;
        if (spec.report_syscalls) {
            CompileOptions trap_opts = kill_opts;
            trap_opts.kill_reports_syscall = true;
            auto trap = compile(spec.policy, trap_opts);
            if (!trap.ok()) {
                return RunOutcome::supervisor_error("policy: " + trap.error().message());
            }
            trap_filter = std::make_unique<FilterProgram>(std::move(trap.value()));
        }

        // 2. rlimit 与标准流
        RlimitPlan rlimits = plan_rlimits(spec.limits);
        auto stdio_res = prepare_stdio(spec);
        if (!stdio_res.ok()) {
            return RunOutcome::supervisor_error("stdio: " + stdio_res.error().message());
        }
        Stdio io = std::move(stdio_res.value());

        // 3. Landlock
        UniqueFd ruleset;
        if (spec.confine_writes && !spec.working_dir.empty()) {
            if (landlock::available()) {
                auto rs = build_write_ruleset(spec.working_dir);
                if (!rs.ok()) {
                    return RunOutcome::supervisor_error("landlock: " + rs.error().message());
                }
                ruleset = std::move(rs.value());
            } else {
                warn_landlock_unavailable();
            }
        }

        // 4. cgroup
        std::unique_ptr<CgroupController> cgroup;
        if (spec.use_cgroup && CgroupManager::instance().is_initialized()) {
            auto cg = CgroupManager::instance().create_run_cgroup(spec.limits);
            if (!cg.ok()) {
                return RunOutcome::supervisor_error("cgroup: " + cg.error().message());
            }
            cgroup = std::move(cg.value());
        } else if (ResourceLimits::bounded(spec.limits.max_processes)) {
            warn_no_process_limit();
        }

        // 5. argv / envp
        std::vector<std::string> argv_str = spec.build_argv();
        std::vector<std::string> envp_str = spec.build_envp();
        std::vector<char*> argv;
        std::vector<char*> envp;
        for (auto &s : argv_str) argv.push_back(&s[0]);
        argv.push_back(nullptr);
        for (auto &s : envp_str) envp.push_back(&s[0]);
        envp.push_back(nullptr);

        // 6. 同步管道与状态管道
        auto go_pipe = Pipe::create();
        auto status_pipe = Pipe::create(O_NONBLOCK);
        if (!go_pipe.ok() || !status_pipe.ok()) {
            return RunOutcome::supervisor_error(
                "pipe: " + (go_pipe.ok() ? status_pipe.error() : go_pipe.error()).message());
        }

        detail::ChildContext ctx;
        ctx.go_fd = go_pipe.value().read_end.get();
        ctx.status_fd = status_pipe.value().write_end.get();
        for (int i = 0; i < 3; i++) ctx.stdio[i] = io.child_fds[i].get();
        ctx.working_dir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();
        ctx.rlimits = &rlimits;
        ctx.landlock_fd = ruleset.get();
        ctx.trap_filter = trap_filter.get();
        ctx.kill_filter = &kill_filter.value();
        ctx.exec_path = exec_path;
        ctx.argv = argv.data();
        ctx.envp = envp.data();

        pid_t pid = fork();
        if (pid < 0) {
            return RunOutcome::supervisor_error(std::string("fork: ") + strerror(errno));
        }
        if (pid == 0) {
            detail::child_main(ctx);
        }

        // ---- 父进程 ----
        ChildProcess child(pid);
        setpgid(pid, pid);  // 与子进程的 setpgid 竞争无害，保证 kill(-pid) 立即可用

        go_pipe.value().read_end.reset();
        status_pipe.value().write_end.reset();
        for (auto &fd : io.child_fds) fd.reset();
        ruleset.reset();
        if (spec.on_started) {
            spec.on_started(pid);
        }

        if (cgroup) {
            auto added = cgroup->add_process(pid);
            if (!added.ok()) {
                return RunOutcome::supervisor_error("cgroup: " + added.error().message());
            }
        }

        const long trace_opts = PTRACE_O_EXITKILL | PTRACE_O_TRACECLONE |
                                PTRACE_O_TRACEEXEC | PTRACE_O_TRACEEXIT;
        bool traced = ptrace(PTRACE_SEIZE, pid, nullptr, reinterpret_cast<void*>(trace_opts)) == 0;
        if (!traced) {
            RLOG_DEBUG << "PTRACE_SEIZE failed (" << strerror(errno)
                       << "), violating syscall numbers and repeated execve will not be reported";
        }
        char go = (traced && trap_filter) ? kGoTraced : kGoUntraced;

        auto start = std::chrono::steady_clock::now();
        if (write(go_pipe.value().write_end.get(), &go, 1) != 1) {
            return RunOutcome::supervisor_error(std::string("release child: ") + strerror(errno));
        }
        go_pipe.value().write_end.reset();

        return supervise(spec, child, io, status_pipe.value().read_end,
                         cgroup.get(), start, cancel);
    }

private:
    RunOutcome supervise(const SandboxSpec &spec, ChildProcess &child, Stdio &io,
                         UniqueFd &status_fd, CgroupController *cgroup,
                         std::chrono::steady_clock::time_point start,
                         const CancellationToken *cancel) const {
        const pid_t pid = child.pid();
        const ResourceLimits &limits = spec.limits;
        const uint64_t wall_limit = limits.effective_wall_ms();
        const uint64_t out_cap = ResourceLimits::bounded(limits.output_bytes)
                                     ? limits.output_bytes : UINT64_MAX;
        const bool sample_memory = !cgroup;

        RunOutcome result;
        KillReason reason = KillReason::None;
        std::string failure_reason;
        int violation_nr = -1;
        bool child_failed = false;
        bool exec_done = false;
        int exec_count = 0;
        ChildFailure failure{0, 0};
        uint64_t sampled_rss = 0;
        uint64_t exit_hwm = 0;
        std::vector<pid_t> threads;   ///< 除主线程外被跟踪的线程
        uint64_t bytes[3] = {0, 0, 0};
        std::string *data[3] = {nullptr, &result.stdout_data, &result.stderr_data};

        auto kill_for = [&](KillReason r) {
            if (reason == KillReason::None) reason = r;
            child.kill_tree();
            if (cgroup) {
                auto killed = cgroup->kill_all();
                if (!killed.ok()) {
                    RLOG_DEBUG << "cgroup.kill: " << killed.error().message();
                }
            }
        };

        auto elapsed_ms = [&] {
            return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count());
        };

        auto read_status = [&] {
            while (status_fd) {
                ChildFailure f;
                ssize_t n = read(status_fd.get(), &f, sizeof(f));
                if (n == static_cast<ssize_t>(sizeof(f))) {
                    failure = f;
                    child_failed = true;
                    continue;
                }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && errno == EAGAIN) return;
                // EOF：exec 成功或子进程已退出
                status_fd.reset();
                if (!child_failed) exec_done = true;
            }
        };

        auto drain = [&](int i, int max_rounds) {
            char chunk[64 * 1024];
            for (int round = 0; io.capture[i] && round < max_rounds; round++) {
                ssize_t n = read(io.capture[i].get(), chunk, sizeof(chunk));
                if (n > 0) {
                    bytes[i] += static_cast<uint64_t>(n);
                    std::string &buf = *data[i];
                    if (buf.size() < out_cap) {
                        size_t room = static_cast<size_t>(std::min<uint64_t>(out_cap - buf.size(), n));
                        buf.append(chunk, room);
                    }
                    if (bytes[i] > out_cap && !result.output_limit_hit) {
                        result.output_limit_hit = true;
                        kill_for(KillReason::Output);
                    }
                    continue;
                }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && errno == EAGAIN) return;
                io.capture[i].reset();
            }
        };

        auto handle_stop = [&](pid_t tid, int status) {
            int sig = WSTOPSIG(status);
            unsigned event = static_cast<unsigned>(status) >> 16;
            long inject = 0;
            switch (event) {
                case 0:
                    if (sig == SIGSYS) {
                        siginfo_t si;
                        memset(&si, 0, sizeof(si));
                        if (ptrace(PTRACE_GETSIGINFO, tid, nullptr, &si) == 0 &&
                            si.si_code == SYS_SECCOMP) {
                            violation_nr = si.si_syscall;
                            kill_for(KillReason::Violation);
                            return;
                        }
                    }
                    inject = sig;
                    break;
                case PTRACE_EVENT_CLONE: {
                    unsigned long new_tid = 0;
                    if (ptrace(PTRACE_GETEVENTMSG, tid, nullptr, &new_tid) == 0) {
                        threads.push_back(static_cast<pid_t>(new_tid));
                    }
                    break;
                }
                case PTRACE_EVENT_EXEC:
                    if (++exec_count > 1) {
                        violation_nr = __NR_execve;
                        kill_for(KillReason::Violation);
                        return;
                    }
                    break;
                case PTRACE_EVENT_EXIT: {
                    uint64_t hwm = 0;
                    if (detail::read_proc_hwm_bytes(tid, &hwm)) {
                        exit_hwm = std::max(exit_hwm, hwm);
                    }
                    break;
                }
                default:
                    // PTRACE_EVENT_STOP：group-stop 或新线程的第一次停止，不让它停下来
                    break;
            }
            if (ptrace(PTRACE_CONT, tid, nullptr, reinterpret_cast<void*>(inject)) < 0) {
                RLOG_DEBUG << "PTRACE_CONT " << tid << ": " << strerror(errno);
            }
        };

        // 线程要由跟踪者逐个回收，否则主线程永远等不到
        auto poll_threads = [&] {
            for (size_t i = 0; i < threads.size();) {
                int st = 0;
                pid_t r = wait4(threads[i], &st, WNOHANG | __WALL, nullptr);
                if (r == 0) {
                    i++;
                    continue;
                }
                if (r < 0 && errno == EINTR) continue;
                if (r < 0 || WIFEXITED(st) || WIFSIGNALED(st)) {
                    // ECHILD：线程在别的线程 execve 时被内核收走
                    threads.erase(threads.begin() + static_cast<std::ptrdiff_t>(i));
                    continue;
                }
                handle_stop(threads[i], st);
            }
        };

        struct rusage usage;
        memset(&usage, 0, sizeof(usage));
        int wstatus = 0;

        while (true) {
            struct pollfd fds[3];
            int nfds = 0;
            if (status_fd) fds[nfds++] = {status_fd.get(), POLLIN, 0};
            for (int i = 1; i <= 2; i++) {
                if (io.capture[i]) fds[nfds++] = {io.capture[i].get(), POLLIN, 0};
            }
            if (poll(fds, static_cast<nfds_t>(nfds), kTickMs) < 0 && errno != EINTR) {
                failure_reason = std::string("poll: ") + strerror(errno);
                kill_for(KillReason::Failure);
            }

            read_status();
            drain(1, 16);
            drain(2, 16);

            poll_threads();

            bool terminated = false;
            while (true) {
                auto ev = child.poll_wait(&usage);
                if (!ev.ok()) {
                    failure_reason = ev.error().message();
                    kill_for(KillReason::Failure);
                    break;
                }
                auto kind = ev.value().kind;
                if (kind == ChildProcess::WaitEvent::Kind::None) break;
                if (kind == ChildProcess::WaitEvent::Kind::Stopped) {
                    handle_stop(pid, ev.value().status);
                    continue;
                }
                wstatus = ev.value().status;
                terminated = true;
                break;
            }
            if (terminated) break;

            if (reason == KillReason::Failure) {
                // wait4 本身失败时无法再观察子进程，交给析构回收
                break;
            }
            if (reason != KillReason::None) {
                continue;
            }

            if (is_cancelled(cancel)) {
                kill_for(KillReason::Cancelled);
                continue;
            }
            if (ResourceLimits::bounded(wall_limit) && elapsed_ms() >= wall_limit) {
                kill_for(KillReason::Wall);
                continue;
            }
            uint64_t cpu_ms = 0;
            if (ResourceLimits::bounded(limits.cpu_time_ms) &&
                detail::read_proc_cpu_ms(pid, &cpu_ms) && cpu_ms > limits.cpu_time_ms) {
                kill_for(KillReason::Cpu);
                continue;
            }
            // exec 之前的常驻内存是监督进程的镜像，不能算进去
            uint64_t rss = 0;
            if (sample_memory && exec_done && detail::read_proc_rss_bytes(pid, &rss)) {
                sampled_rss = std::max(sampled_rss, rss);
                if (ResourceLimits::bounded(limits.memory_bytes) && rss > limits.memory_bytes) {
                    kill_for(KillReason::Memory);
                }
            }
        }

        result.wall_time_used_ms = elapsed_ms();

        // 进程组里可能还有泄漏的子孙进程
        child.kill_tree();
        if (cgroup) {
            auto killed = cgroup->kill_all();
            if (!killed.ok()) {
                RLOG_DEBUG << "cgroup.kill: " << killed.error().message();
            }
        }
        for (pid_t tid : threads) {
            while (true) {
                int st = 0;
                pid_t r = wait4(tid, &st, __WALL, nullptr);
                if (r < 0 && errno == EINTR) continue;
                if (r < 0 || WIFEXITED(st) || WIFSIGNALED(st)) break;
            }
        }
        threads.clear();
        read_status();
        drain(1, 64);
        drain(2, 64);

        result.cpu_time_used_ms = detail::timeval_ms(usage.ru_utime) + detail::timeval_ms(usage.ru_stime);
        // ru_maxrss 含 fork 到 exec 之间的监督进程镜像，不使用
        if (cgroup) {
            CgroupStats stats = cgroup->get_stats();
            result.memory_peak_bytes = stats.memory_peak;
            if (stats.oom_killed) {
                result.memory_peak_bytes = std::max(result.memory_peak_bytes,
                                                    CgroupLimits::from(limits).memory_max);
            }
        }
        if (result.memory_peak_bytes == 0) {
            // 没有 cgroup，或内核不提供 memory.peak
            result.memory_peak_bytes = std::max(exit_hwm, sampled_rss);
        }

        result.stdout_bytes_written = spec.stdout_sink.kind == OutputSink::Kind::File
                                          ? file_size(spec.stdout_sink.path) : bytes[1];
        result.stderr_bytes_written = spec.stderr_sink.kind == OutputSink::Kind::File
                                          ? file_size(spec.stderr_sink.path) : bytes[2];

        // 终止状态
        if (reason == KillReason::Failure) {
            result.exit_status = outcome::SupervisorError{failure_reason};
        } else if (child_failed) {
            auto stage = static_cast<ChildStage>(failure.stage);
            result.exit_status = outcome::SupervisorError{
                std::string(child_stage_str(stage)) + ": " + strerror(failure.err)};
        } else if (reason == KillReason::Cancelled) {
            result.exit_status = outcome::SupervisorError{"cancelled"};
        } else if (reason == KillReason::Violation) {
            result.exit_status = outcome::PolicyViolation{violation_nr};
        } else if (reason == KillReason::Wall) {
            result.exit_status = outcome::TimedOut{outcome::TimeoutKind::Wall};
        } else if (reason == KillReason::Cpu) {
            result.exit_status = outcome::TimedOut{outcome::TimeoutKind::Cpu};
        } else if (WIFEXITED(wstatus)) {
            result.exit_status = outcome::Exited{WEXITSTATUS(wstatus)};
        } else if (WIFSIGNALED(wstatus) && WTERMSIG(wstatus) == SIGSYS) {
            // KILL_PROCESS 版过滤器或未被跟踪的线程触发的违规
            result.exit_status = outcome::PolicyViolation{-1};
        } else if (WIFSIGNALED(wstatus)) {
            result.exit_status = outcome::Signaled{WTERMSIG(wstatus)};
        } else {
            result.exit_status = outcome::SupervisorError{"child state unknown"};
        }

        RLOG_DEBUG << spec.executable_path << ": " << result;
        return result;
    }
};

} // namespace sandbox
} // namespace judgebox

#endif // JUDGEBOX_SANDBOX_SUPERVISOR_H
