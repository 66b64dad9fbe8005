/**
 * @file syscall_policy.h
 * @brief 声明式 syscall 策略
 *
 * 策略 = 默认动作 + 有序规则列表。规则按声明顺序匹配，第一条命中的规则生效，
 * 都不命中时执行默认动作。策略本身是纯数据，编译成 BPF 见 sandbox/seccomp.h。
 */

#ifndef JUDGEBOX_CORE_SYSCALL_POLICY_H
#define JUDGEBOX_CORE_SYSCALL_POLICY_H

#include <string>
#include <vector>
#include <optional>
#include <initializer_list>
#include <cstdint>
#include <cerrno>
#include <fcntl.h>
#include <sched.h>
#include <sys/syscall.h>

#include "core/error.h"
#include "core/syscall_map.h"

namespace judgebox {

/**
 * @brief 命中后的动作
 */
enum class PolicyAction {
    Allow,  ///< 放行
    Deny,   ///< 不执行，返回 errno
    Kill    ///< 立即终止进程，记为违规
};

/**
 * @brief 参数比较操作（64 位无符号比较）
 */
enum class ArgOp {
    EQ,
    NE,
    LT,
    LE,
    GT,
    GE,
    MASKED_EQ   ///< (arg & mask) == value
};

/**
 * @brief 单个参数谓词
 *
 * match_exec_path 为 true 时，value 在编译时替换为沙箱自身 execve 使用的
 * 路径指针，从而只放行监督进程发起的那一次 exec。
 */
struct ArgPredicate {
    unsigned int arg_index = 0;   ///< 0-5
    ArgOp op = ArgOp::EQ;
    uint64_t value = 0;
    uint64_t mask = ~0ULL;
    bool match_exec_path = false;

    static ArgPredicate cmp(unsigned int idx, ArgOp op, uint64_t value) {
        ArgPredicate p;
        p.arg_index = idx;
        p.op = op;
        p.value = value;
        return p;
    }

    static ArgPredicate masked(unsigned int idx, uint64_t mask, uint64_t value) {
        ArgPredicate p;
        p.arg_index = idx;
        p.op = ArgOp::MASKED_EQ;
        p.mask = mask;
        p.value = value;
        return p;
    }

    static ArgPredicate exec_path() {
        ArgPredicate p;
        p.match_exec_path = true;
        return p;
    }

    /**
     * @brief 用户态求值，exec_ptr 为 match_exec_path 的实际指针值
     */
    bool matches(const uint64_t args[6], uint64_t exec_ptr = 0) const {
        uint64_t a = args[arg_index];
        uint64_t v = match_exec_path ? exec_ptr : value;
        switch (op) {
            case ArgOp::EQ: return a == v;
            case ArgOp::NE: return a != v;
            case ArgOp::LT: return a < v;
            case ArgOp::LE: return a <= v;
            case ArgOp::GT: return a > v;
            case ArgOp::GE: return a >= v;
            case ArgOp::MASKED_EQ: return (a & mask) == v;
        }
        return false;
    }
};

/**
 * @brief 一条规则
 */
struct SyscallRule {
    int syscall_nr = -1;
    std::optional<ArgPredicate> predicate;
    PolicyAction action = PolicyAction::Allow;
    int errno_value = EPERM;   ///< action == Deny 时返回的 errno
};

/**
 * @brief 规则匹配结果
 */
struct PolicyDecision {
    PolicyAction action;
    int errno_value;
    int rule_index;   ///< -1 表示默认动作
};

struct SyscallPolicy {
    std::string name;
    PolicyAction default_action = PolicyAction::Kill;
    int default_errno = EPERM;
    std::vector<SyscallRule> rules;

    SyscallPolicy() = default;
    SyscallPolicy(std::string n, PolicyAction def)
        : name(std::move(n)), default_action(def) {}

    SyscallPolicy& add(int nr, PolicyAction action, int err = EPERM) {
        SyscallRule r;
        r.syscall_nr = nr;
        r.action = action;
        r.errno_value = err;
        rules.push_back(r);
        return *this;
    }

    SyscallPolicy& add_if(int nr, const ArgPredicate &pred, PolicyAction action, int err = EPERM) {
        SyscallRule r;
        r.syscall_nr = nr;
        r.predicate = pred;
        r.action = action;
        r.errno_value = err;
        rules.push_back(r);
        return *this;
    }

    SyscallPolicy& allow(std::initializer_list<int> nrs) {
        for (int nr : nrs) add(nr, PolicyAction::Allow);
        return *this;
    }

    SyscallPolicy& deny(std::initializer_list<int> nrs, int err = EPERM) {
        for (int nr : nrs) add(nr, PolicyAction::Deny, err);
        return *this;
    }

    SyscallPolicy& kill(std::initializer_list<int> nrs) {
        for (int nr : nrs) add(nr, PolicyAction::Kill);
        return *this;
    }

    /**
     * @brief 追加另一个策略的规则（默认动作保持不变）
     */
    SyscallPolicy& extend(const SyscallPolicy &other) {
        rules.insert(rules.end(), other.rules.begin(), other.rules.end());
        return *this;
    }

    /**
     * @brief 用户态求值：第一条命中的规则生效
     */
    PolicyDecision evaluate(int nr, const uint64_t args[6], uint64_t exec_ptr = 0) const {
        for (size_t i = 0; i < rules.size(); i++) {
            const auto &r = rules[i];
            if (r.syscall_nr != nr) continue;
            if (r.predicate && !r.predicate->matches(args, exec_ptr)) continue;
            return {r.action, r.errno_value, static_cast<int>(i)};
        }
        return {default_action, default_errno, -1};
    }

    /**
     * @brief 检查策略是否合法（编译前调用）
     */
    Result<void> validate() const {
        if (default_action == PolicyAction::Deny &&
            (default_errno <= 0 || default_errno > 4095)) {
            return JUDGEBOX_ERROR(ErrorCode::POLICY_ERROR,
                "policy '" + name + "': default errno out of range");
        }
        for (size_t i = 0; i < rules.size(); i++) {
            const auto &r = rules[i];
            std::string where = "policy '" + name + "' rule #" + std::to_string(i);
            if (r.syscall_nr < 0) {
                return JUDGEBOX_ERROR(ErrorCode::POLICY_ERROR, where + ": invalid syscall");
            }
            if (r.predicate && r.predicate->arg_index > 5) {
                return JUDGEBOX_ERROR(ErrorCode::POLICY_ERROR, where + ": argument index > 5");
            }
            if (r.action == PolicyAction::Deny && (r.errno_value <= 0 || r.errno_value > 4095)) {
                return JUDGEBOX_ERROR(ErrorCode::POLICY_ERROR, where + ": errno out of range");
            }
        }
        return Ok();
    }
};

//==============================================================================
// 内置策略
//==============================================================================

namespace policies {

/// open 系列 flags 中任何一位表示写意图
constexpr uint64_t kWriteOpenFlags = O_WRONLY | O_RDWR | O_CREAT | O_TRUNC | O_APPEND;

/**
 * @brief 评测用户程序的默认策略
 *
 * 默认 Kill。允许：退出、已打开描述符上的 I/O、只读打开文件、内存分配、
 * 时间、信号、线程（clone 带 CLONE_THREAD）。写方式打开文件返回 EACCES，
 * 向其他进程发信号返回 EPERM（abort() 会退化为 SIGSEGV 而不是违规）。
 */
inline SyscallPolicy judge_policy() {
    SyscallPolicy p("judge", PolicyAction::Kill);

    // 只放行监督进程自己的那一次 exec。过滤器比较的是指针值，程序可以用
    // mmap(MAP_FIXED) 在同一地址放上别的路径再 exec；这种情况由监督进程在
    // PTRACE_EVENT_EXEC 上识别（第二次 exec 即违规），宿主不允许 ptrace 时无法识别。
    p.add_if(__NR_execve, ArgPredicate::exec_path(), PolicyAction::Allow);

    // 基础 I/O
    p.allow({
        __NR_read, __NR_write, __NR_readv, __NR_writev,
        __NR_pread64, __NR_lseek, __NR_close,
        __NR_fstat, __NR_newfstatat, __NR_statx,
        __NR_dup, __NR_dup3, __NR_fcntl, __NR_ioctl,
        __NR_faccessat, __NR_readlinkat, __NR_getdents64, __NR_getcwd,
        __NR_ppoll, __NR_pselect6,
    });
#ifdef __NR_faccessat2
    p.allow({__NR_faccessat2});
#endif

    // 只读打开；带写意图的打开返回 EACCES
    p.add_if(__NR_openat, ArgPredicate::masked(2, kWriteOpenFlags, 0), PolicyAction::Allow);
    p.add(__NR_openat, PolicyAction::Deny, EACCES);
#ifdef __NR_open
    p.add_if(__NR_open, ArgPredicate::masked(1, kWriteOpenFlags, 0), PolicyAction::Allow);
    p.add(__NR_open, PolicyAction::Deny, EACCES);
    p.deny({__NR_creat}, EACCES);
    p.allow({
        __NR_stat, __NR_lstat, __NR_access, __NR_readlink,
        __NR_getdents, __NR_dup2, __NR_poll, __NR_select,
        __NR_arch_prctl, __NR_getrlimit, __NR_time,
    });
#endif

    // 内存
    p.allow({
        __NR_brk, __NR_mmap, __NR_munmap, __NR_mprotect,
        __NR_mremap, __NR_madvise,
    });

    // 进程信息、退出、线程
    p.allow({
        __NR_exit, __NR_exit_group,
        __NR_getpid, __NR_gettid, __NR_getppid,
        __NR_getuid, __NR_geteuid, __NR_getgid, __NR_getegid,
        __NR_set_tid_address, __NR_set_robust_list, __NR_get_robust_list,
        __NR_prlimit64, __NR_getrusage, __NR_uname, __NR_sysinfo,
        __NR_sched_yield, __NR_sched_getaffinity, __NR_getrandom, __NR_futex,
    });
#ifdef __NR_rseq
    p.allow({__NR_rseq});
#endif
    p.add_if(__NR_clone, ArgPredicate::masked(0, CLONE_THREAD, CLONE_THREAD), PolicyAction::Allow);
#ifdef __NR_clone3
    // clone3 的 flags 在用户内存里无法检查；返回 ENOSYS 让 libc 退回 clone
    p.deny({__NR_clone3}, ENOSYS);
#endif
    p.deny({__NR_kill, __NR_tkill, __NR_tgkill}, EPERM);

    // 信号与时间
    p.allow({
        __NR_rt_sigaction, __NR_rt_sigprocmask, __NR_rt_sigreturn, __NR_sigaltstack,
        __NR_clock_gettime, __NR_clock_getres, __NR_clock_nanosleep,
        __NR_gettimeofday, __NR_nanosleep, __NR_times,
    });

    return p;
}

/**
 * @brief 编译器策略：默认放行，只终止会影响宿主的调用
 *
 * 编译器需要 fork/exec 子进程（cc1、as、ld），白名单维护成本太高；
 * 写文件范围由 Landlock 限制在编译目录内。
 */
inline SyscallPolicy compiler_policy() {
    SyscallPolicy p("compiler", PolicyAction::Allow);
    p.kill({
        __NR_ptrace, __NR_mount, __NR_umount2, __NR_pivot_root, __NR_chroot,
        __NR_unshare, __NR_setns, __NR_reboot, __NR_kexec_load,
        __NR_init_module, __NR_finit_module, __NR_delete_module,
        __NR_bpf, __NR_perf_event_open, __NR_process_vm_readv, __NR_process_vm_writev,
        __NR_keyctl, __NR_add_key, __NR_request_key,
        __NR_swapon, __NR_swapoff, __NR_settimeofday,
        __NR_sethostname, __NR_setdomainname, __NR_acct,
        __NR_userfaultfd,
    });
    // 网络
    p.deny({
        __NR_socket, __NR_connect, __NR_bind, __NR_listen,
        __NR_accept, __NR_accept4,
    }, EACCES);
    return p;
}

/**
 * @brief 交互器策略：judge 策略加上写方式打开文件
 *
 * 交互器要写 tout，写入范围由 Landlock 限制在测试点目录。
 */
inline SyscallPolicy interactor_policy() {
    SyscallPolicy p("interactor", PolicyAction::Kill);
    p.allow({__NR_openat, __NR_ftruncate, __NR_fsync});
#ifdef __NR_open
    p.allow({__NR_open, __NR_creat});
#endif
    p.extend(judge_policy());
    return p;
}

/**
 * @brief 按名称取内置策略
 */
inline std::optional<SyscallPolicy> builtin_policy(const std::string &name) {
    if (name == "judge") return judge_policy();
    if (name == "compiler") return compiler_policy();
    if (name == "interactor") return interactor_policy();
    return std::nullopt;
}

} // namespace policies

} // namespace judgebox

#endif // JUDGEBOX_CORE_SYSCALL_POLICY_H
