/**
 * @file seccomp.h
 * @brief seccomp-bpf 系统调用过滤
 *
 * 把 SyscallPolicy 编译成 BPF 程序，在内核层过滤系统调用。
 *
 * 程序结构：
 *   1. 检查架构，非本机架构直接 KILL_PROCESS
 *   2. 加载 syscall 号
 *   3. 按声明顺序逐条匹配规则（第一条命中的生效）
 *   4. 默认动作
 *
 * 参数谓词比较完整的 64 位参数值：高低 32 位分两次加载比较。
 */

#ifndef JUDGEBOX_SANDBOX_SECCOMP_H
#define JUDGEBOX_SANDBOX_SECCOMP_H

#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include <cerrno>
#include <cstring>

#include <sys/prctl.h>
#include <sys/syscall.h>
#include <linux/seccomp.h>
#include <linux/filter.h>
#include <linux/audit.h>

#include "core/error.h"
#include "core/syscall_policy.h"

namespace judgebox {
namespace sandbox {

//==============================================================================
// BPF 指令生成辅助
//==============================================================================

struct BPF {
    static sock_filter stmt(uint16_t code, uint32_t k) {
        return {code, 0, 0, k};
    }

    static sock_filter jump(uint16_t code, uint32_t k, uint8_t jt, uint8_t jf) {
        return {code, jt, jf, k};
    }

    // 加载系统调用号
    static sock_filter load_syscall_nr() {
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr));
    }

    // 加载架构
    static sock_filter load_arch() {
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch));
    }

    // 加载参数低 32 位（小端）
    static sock_filter load_arg_lo(unsigned int arg) {
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args) + arg * 8);
    }

    // 加载参数高 32 位
    static sock_filter load_arg_hi(unsigned int arg) {
        return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args) + arg * 8 + 4);
    }

    static sock_filter and_k(uint32_t k) {
        return stmt(BPF_ALU | BPF_AND | BPF_K, k);
    }

    // 返回动作
    static sock_filter ret(uint32_t action) {
        return stmt(BPF_RET | BPF_K, action);
    }
};

#if defined(__x86_64__)
constexpr uint32_t NATIVE_AUDIT_ARCH = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr uint32_t NATIVE_AUDIT_ARCH = AUDIT_ARCH_AARCH64;
#else
#error "Unsupported architecture"
#endif

//==============================================================================
// FilterProgram
//==============================================================================

/**
 * @brief 编译好的 BPF 程序
 *
 * 在父进程中编译，子进程里只读取 data()/size()，不再分配内存。
 */
class FilterProgram {
private:
    std::vector<sock_filter> insns_;
    std::string policy_name_;

public:
    FilterProgram() = default;
    FilterProgram(std::vector<sock_filter> insns, std::string name)
        : insns_(std::move(insns)), policy_name_(std::move(name)) {}

    size_t size() const { return insns_.size(); }
    bool empty() const { return insns_.empty(); }
    const sock_filter* data() const { return insns_.data(); }
    const std::vector<sock_filter>& instructions() const { return insns_; }
    const std::string& policy_name() const { return policy_name_; }

    sock_fprog fprog() const {
        sock_fprog prog;
        prog.len = static_cast<unsigned short>(insns_.size());
        prog.filter = const_cast<sock_filter*>(insns_.data());
        return prog;
    }
};

/**
 * @brief 编译选项
 */
struct CompileOptions {
    /// Kill 编译为 SECCOMP_RET_TRAP，由 ptrace 监督方读取 si_syscall；
    /// 否则编译为 SECCOMP_RET_KILL_PROCESS
    bool kill_reports_syscall = false;

    /// match_exec_path 谓词替换成的指针值（子进程 execve 的 pathname 参数）
    uint64_t exec_path = 0;
};

namespace detail {

inline uint32_t action_to_seccomp(PolicyAction action, int errno_value, const CompileOptions &opts) {
    switch (action) {
        case PolicyAction::Allow:
            return SECCOMP_RET_ALLOW;
        case PolicyAction::Deny:
            return SECCOMP_RET_ERRNO | (static_cast<uint32_t>(errno_value) & SECCOMP_RET_DATA);
        case PolicyAction::Kill:
            return opts.kill_reports_syscall ? SECCOMP_RET_TRAP : SECCOMP_RET_KILL_PROCESS;
    }
    return SECCOMP_RET_KILL_PROCESS;
}

/**
 * @brief 生成参数谓词的指令
 *
 * 生成的指令紧接一条 RET（命中目标），RET 之后是下一条规则（未命中目标）。
 * 跳转偏移按这两个目标计算。
 */
inline void emit_predicate(std::vector<sock_filter> &out, const ArgPredicate &pred, uint64_t value) {
    const uint32_t hi = static_cast<uint32_t>(value >> 32);
    const uint32_t lo = static_cast<uint32_t>(value & 0xFFFFFFFFu);
    const unsigned int idx = pred.arg_index;

    // 从谓词第 i 条指令跳到命中 / 未命中的偏移；n 为谓词指令总数
    auto to_match = [](size_t i, size_t n) { return static_cast<uint8_t>(n - i - 1); };
    auto to_miss = [](size_t i, size_t n) { return static_cast<uint8_t>(n - i); };

    const uint16_t JEQ = BPF_JMP | BPF_JEQ | BPF_K;
    const uint16_t JGT = BPF_JMP | BPF_JGT | BPF_K;
    const uint16_t JGE = BPF_JMP | BPF_JGE | BPF_K;

    switch (pred.op) {
        case ArgOp::EQ: {
            const size_t n = 4;
            out.push_back(BPF::load_arg_hi(idx));
            out.push_back(BPF::jump(JEQ, hi, 0, to_miss(1, n)));
            out.push_back(BPF::load_arg_lo(idx));
            out.push_back(BPF::jump(JEQ, lo, to_match(3, n), to_miss(3, n)));
            break;
        }
        case ArgOp::NE: {
            const size_t n = 4;
            out.push_back(BPF::load_arg_hi(idx));
            out.push_back(BPF::jump(JEQ, hi, 0, to_match(1, n)));
            out.push_back(BPF::load_arg_lo(idx));
            out.push_back(BPF::jump(JEQ, lo, to_miss(3, n), to_match(3, n)));
            break;
        }
        case ArgOp::GT:
        case ArgOp::GE: {
            const size_t n = 5;
            out.push_back(BPF::load_arg_hi(idx));
            out.push_back(BPF::jump(JGT, hi, to_match(1, n), 0));
            out.push_back(BPF::jump(JEQ, hi, 0, to_miss(2, n)));
            out.push_back(BPF::load_arg_lo(idx));
            out.push_back(BPF::jump(pred.op == ArgOp::GT ? JGT : JGE, lo,
                                    to_match(4, n), to_miss(4, n)));
            break;
        }
        case ArgOp::LT:
        case ArgOp::LE: {
            // a < v 等价于 !(a >= v)
            const size_t n = 5;
            out.push_back(BPF::load_arg_hi(idx));
            out.push_back(BPF::jump(JGT, hi, to_miss(1, n), 0));
            out.push_back(BPF::jump(JEQ, hi, 0, to_match(2, n)));
            out.push_back(BPF::load_arg_lo(idx));
            out.push_back(BPF::jump(pred.op == ArgOp::LT ? JGE : JGT, lo,
                                    to_miss(4, n), to_match(4, n)));
            break;
        }
        case ArgOp::MASKED_EQ: {
            const size_t n = 6;
            out.push_back(BPF::load_arg_hi(idx));
            out.push_back(BPF::and_k(static_cast<uint32_t>(pred.mask >> 32)));
            out.push_back(BPF::jump(JEQ, hi, 0, to_miss(2, n)));
            out.push_back(BPF::load_arg_lo(idx));
            out.push_back(BPF::and_k(static_cast<uint32_t>(pred.mask & 0xFFFFFFFFu)));
            out.push_back(BPF::jump(JEQ, lo, to_match(5, n), to_miss(5, n)));
            break;
        }
    }
}

} // namespace detail

//==============================================================================
// 编译与安装
//==============================================================================

/**
 * @brief 编译策略
 *
 * 策略非法返回 POLICY_ERROR，程序超过 BPF_MAXINSNS 返回 FILTER_TOO_LARGE。
 */
inline Result<FilterProgram> compile(const SyscallPolicy &policy, const CompileOptions &opts = CompileOptions()) {
    auto valid = policy.validate();
    if (!valid.ok()) {
        return valid.error();
    }

    std::vector<sock_filter> prog;

    // 1. 检查架构
    prog.push_back(BPF::load_arch());
    prog.push_back(BPF::jump(BPF_JMP | BPF_JEQ | BPF_K, NATIVE_AUDIT_ARCH, 1, 0));
    prog.push_back(BPF::ret(SECCOMP_RET_KILL_PROCESS));

    // 2. 加载系统调用号
    prog.push_back(BPF::load_syscall_nr());
#if defined(__x86_64__)
    // x32 ABI 的调用号带 0x40000000 位，同样视为外来架构
    prog.push_back(BPF::jump(BPF_JMP | BPF_JGE | BPF_K, 0x40000000u, 0, 1));
    prog.push_back(BPF::ret(SECCOMP_RET_KILL_PROCESS));
#endif

    // 3. 规则，每条规则一个块：[LD nr] JEQ nr [谓词] RET
    bool a_holds_nr = true;
    for (const auto &rule : policy.rules) {
        std::vector<sock_filter> body;
        if (rule.predicate) {
            uint64_t value = rule.predicate->match_exec_path ? opts.exec_path : rule.predicate->value;
            detail::emit_predicate(body, *rule.predicate, value);
        }
        body.push_back(BPF::ret(detail::action_to_seccomp(rule.action, rule.errno_value, opts)));

        if (!a_holds_nr) {
            prog.push_back(BPF::load_syscall_nr());
        }
        prog.push_back(BPF::jump(BPF_JMP | BPF_JEQ | BPF_K,
                                 static_cast<uint32_t>(rule.syscall_nr),
                                 0, static_cast<uint8_t>(body.size())));
        prog.insert(prog.end(), body.begin(), body.end());

        // 谓词会覆盖累加器
        a_holds_nr = !rule.predicate;
    }

    // 4. 默认动作
    prog.push_back(BPF::ret(detail::action_to_seccomp(policy.default_action, policy.default_errno, opts)));

    if (prog.size() > BPF_MAXINSNS) {
        return JUDGEBOX_ERROR(ErrorCode::FILTER_TOO_LARGE,
            "policy '" + policy.name + "' compiles to " + std::to_string(prog.size()) +
            " instructions (max " + std::to_string(BPF_MAXINSNS) + ")");
    }

    return FilterProgram(std::move(prog), policy.name);
}

/**
 * @brief 把过滤器安装到当前进程（只做两次 prctl，可在 fork 后的子进程里调用）
 *
 * 安装后无法撤销或放宽。
 */
inline bool install_filter(const FilterProgram &program, int *failed_errno) {
    // 设置 no_new_privs（非特权进程安装过滤器的前提）
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        if (failed_errno) *failed_errno = errno;
        return false;
    }

    sock_fprog prog = program.fprog();
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) < 0) {
        if (failed_errno) *failed_errno = errno;
        return false;
    }
    return true;
}

inline Result<void> install(const FilterProgram &program) {
    int err = 0;
    if (!install_filter(program, &err)) {
        return JUDGEBOX_ERROR(ErrorCode::POLICY_INSTALL_FAILED,
            "cannot install filter '" + program.policy_name() + "': " + strerror(err));
    }
    return Ok();
}

} // namespace sandbox
} // namespace judgebox

#endif // JUDGEBOX_SANDBOX_SECCOMP_H
