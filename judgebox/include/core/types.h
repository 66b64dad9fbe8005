/**
 * @file types.h
 * @brief 核心数据结构定义
 *
 * - ResourceLimits: 资源限制
 * - SandboxSpec:    一次沙箱运行的完整描述
 * - ExitStatus:     进程的终止方式（封闭的 variant）
 * - RunOutcome:     一次沙箱运行的观测结果
 */

#ifndef JUDGEBOX_CORE_TYPES_H
#define JUDGEBOX_CORE_TYPES_H

#include <string>
#include <vector>
#include <map>
#include <variant>
#include <functional>
#include <cstdint>
#include <ostream>
#include <sys/types.h>

#include "core/error.h"
#include "core/syscall_policy.h"

namespace judgebox {

/// 限制值为 0 表示不限制
constexpr uint64_t kUnbounded = 0;

constexpr uint64_t KiB = 1024;
constexpr uint64_t MiB = 1024 * 1024;

/**
 * @brief 资源限制配置
 *
 * CPU 时间与墙钟时间是两个独立的上限。附加到一次运行后不再修改。
 */
struct ResourceLimits {
    uint64_t cpu_time_ms = 1000;
    uint64_t wall_time_ms = 3000;
    uint64_t memory_bytes = 256 * MiB;
    uint64_t output_bytes = 64 * MiB;
    uint64_t max_processes = 1;

    ResourceLimits() = default;
    ResourceLimits(uint64_t cpu_ms, uint64_t wall_ms, uint64_t memory, uint64_t output,
                   uint64_t procs = 1)
        : cpu_time_ms(cpu_ms), wall_time_ms(wall_ms), memory_bytes(memory),
          output_bytes(output), max_processes(procs) {}

    static bool bounded(uint64_t v) { return v != kUnbounded; }

    /**
     * @brief 实际生效的墙钟上限：未设置时为 CPU 上限的 3 倍加 1 秒
     */
    uint64_t effective_wall_ms() const {
        if (bounded(wall_time_ms)) return wall_time_ms;
        if (bounded(cpu_time_ms)) return cpu_time_ms * 3 + 1000;
        return kUnbounded;
    }
};

// 预定义资源限制
namespace limits {
    const ResourceLimits DEFAULT  = ResourceLimits(1000, 3000, 256 * MiB, 64 * MiB, 1);
    const ResourceLimits COMPILER = ResourceLimits(10000, 30000, 1024 * MiB, 16 * MiB, 64);
    const ResourceLimits CHECKER  = ResourceLimits(5000, 10000, 256 * MiB, 1 * MiB, 1);
}

//==============================================================================
// 标准流
//==============================================================================

/**
 * @brief 标准输入来源
 */
struct StdinSource {
    enum class Kind { Null, File, Bytes, Fd };
    Kind kind = Kind::Null;
    std::string path;   ///< Kind::File
    std::string data;   ///< Kind::Bytes
    int fd = -1;        ///< Kind::Fd，借用，至少保持打开到子进程启动

    static StdinSource null() { return StdinSource(); }
    static StdinSource file(const std::string &p) {
        StdinSource s;
        s.kind = Kind::File;
        s.path = p;
        return s;
    }
    static StdinSource bytes(const std::string &d) {
        StdinSource s;
        s.kind = Kind::Bytes;
        s.data = d;
        return s;
    }
    static StdinSource descriptor(int fd) {
        StdinSource s;
        s.kind = Kind::Fd;
        s.fd = fd;
        return s;
    }
};

/**
 * @brief 标准输出/错误去向
 *
 * Capture 由监督进程通过管道读取，超过 output_bytes 时截断并终止进程；
 * File 依靠 RLIMIT_FSIZE 限制；Fd 是借用的描述符（交互时接到另一个进程），不计字节数。
 */
struct OutputSink {
    enum class Kind { Null, File, Capture, Fd };
    Kind kind = Kind::Capture;
    std::string path;
    int fd = -1;

    static OutputSink null() {
        OutputSink s;
        s.kind = Kind::Null;
        return s;
    }
    static OutputSink file(const std::string &p) {
        OutputSink s;
        s.kind = Kind::File;
        s.path = p;
        return s;
    }
    static OutputSink capture() { return OutputSink(); }
    static OutputSink descriptor(int fd) {
        OutputSink s;
        s.kind = Kind::Fd;
        s.fd = fd;
        return s;
    }
};

//==============================================================================
// SandboxSpec
//==============================================================================

/**
 * @brief 一次沙箱运行的完整描述
 *
 * 每次运行新建一份，由一次 Supervisor::run 独占；运行期间不修改。
 * 所有可调项都在这里显式给出，不读取任何进程级的全局配置。
 */
struct SandboxSpec {
    std::string executable_path;
    std::vector<std::string> argv;               ///< argv[0] 起的完整参数；为空时使用 executable_path
    std::map<std::string, std::string> env;      ///< 显式白名单，不继承调用者环境
    std::string working_dir;

    StdinSource stdin_source;
    OutputSink stdout_sink;
    OutputSink stderr_sink;

    ResourceLimits limits;
    SyscallPolicy policy;

    bool confine_writes = true;    ///< Landlock：只允许写 working_dir
    bool report_syscalls = true;   ///< 用 ptrace 捕获违规 syscall 号
    bool use_cgroup = true;        ///< cgroup v2 可用时使用

    /// 子进程放行前在父进程里调用一次；此后借用的 Fd 可以关闭
    std::function<void(pid_t)> on_started;

    std::vector<std::string> build_argv() const {
        if (argv.empty()) return {executable_path};
        return argv;
    }

    std::vector<std::string> build_envp() const {
        std::vector<std::string> out;
        out.reserve(env.size());
        for (const auto &kv : env) {
            out.push_back(kv.first + "=" + kv.second);
        }
        return out;
    }
};

//==============================================================================
// ExitStatus / RunOutcome
//==============================================================================

namespace outcome {

struct Exited {
    int code = 0;
};

struct Signaled {
    int signal = 0;
};

enum class TimeoutKind { Cpu, Wall };

struct TimedOut {
    TimeoutKind kind = TimeoutKind::Wall;
};

struct PolicyViolation {
    int syscall_nr = -1;   ///< -1 表示无法确定
};

struct SupervisorError {
    std::string reason;
};

} // namespace outcome

/**
 * @brief 进程终止方式，终态互斥
 */
using ExitStatus = std::variant<
    outcome::Exited,
    outcome::Signaled,
    outcome::TimedOut,
    outcome::PolicyViolation,
    outcome::SupervisorError>;

/**
 * @brief 一次沙箱运行的观测结果
 */
struct RunOutcome {
    ExitStatus exit_status = outcome::SupervisorError{"not run"};
    uint64_t cpu_time_used_ms = 0;
    uint64_t wall_time_used_ms = 0;
    uint64_t memory_peak_bytes = 0;
    uint64_t stdout_bytes_written = 0;
    uint64_t stderr_bytes_written = 0;
    bool output_limit_hit = false;   ///< 捕获超过上限被截断并终止

    std::string stdout_data;         ///< Capture 模式下的内容（截断到上限）
    std::string stderr_data;

    bool exited_with(int code) const {
        auto e = std::get_if<outcome::Exited>(&exit_status);
        return e && e->code == code;
    }

    bool is_supervisor_error() const {
        return std::holds_alternative<outcome::SupervisorError>(exit_status);
    }

    static RunOutcome supervisor_error(const std::string &reason) {
        RunOutcome o;
        o.exit_status = outcome::SupervisorError{reason};
        return o;
    }
};

//==============================================================================
// 文本化
//==============================================================================

namespace detail {
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace detail

inline std::string exit_status_to_string(const ExitStatus &status) {
    return std::visit(detail::overloaded{
        [](const outcome::Exited &e) {
            return "exited(" + std::to_string(e.code) + ")";
        },
        [](const outcome::Signaled &s) {
            return "signaled(" + std::to_string(s.signal) + ")";
        },
        [](const outcome::TimedOut &t) {
            return std::string(t.kind == outcome::TimeoutKind::Cpu ? "timed-out(cpu)"
                                                                    : "timed-out(wall)");
        },
        [](const outcome::PolicyViolation &v) {
            return "policy-violation(" +
                   (v.syscall_nr >= 0 ? syscall_nr_to_name(v.syscall_nr) : std::string("?")) + ")";
        },
        [](const outcome::SupervisorError &e) {
            return "supervisor-error(" + e.reason + ")";
        },
    }, status);
}

inline std::ostream& operator<<(std::ostream &os, const RunOutcome &o) {
    return os << exit_status_to_string(o.exit_status)
              << " cpu=" << o.cpu_time_used_ms << "ms"
              << " wall=" << o.wall_time_used_ms << "ms"
              << " mem=" << o.memory_peak_bytes / KiB << "KiB"
              << " out=" << o.stdout_bytes_written << "B"
              << " err=" << o.stderr_bytes_written << "B";
}

} // namespace judgebox

#endif // JUDGEBOX_CORE_TYPES_H
