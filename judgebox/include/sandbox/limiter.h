/**
 * @file limiter.h
 * @brief rlimit 资源限制
 *
 * plan_rlimits() 在父进程里算好要设置的 rlimit；apply_rlimits() 在子进程 fork 之后、
 * exec 之前调用，只用 setrlimit，可以安全地在 fork 后的子进程里执行。
 *
 * CPU 与地址空间的 rlimit 只是兜底：精确的 CPU 限制由监督进程按
 * /proc/<pid>/stat 采样执行，内存由 cgroup 或 RSS 采样执行。
 */

#ifndef JUDGEBOX_SANDBOX_LIMITER_H
#define JUDGEBOX_SANDBOX_LIMITER_H

#include <string>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <sys/resource.h>

#include "core/error.h"
#include "core/types.h"

namespace judgebox {
namespace sandbox {

/**
 * @brief 单个 rlimit 项
 */
struct RlimitEntry {
    int resource = 0;
    rlim_t soft = RLIM_INFINITY;
    rlim_t hard = RLIM_INFINITY;
};

/**
 * @brief 固定容量的 rlimit 计划
 *
 * 不使用堆内存，子进程里只做遍历。
 */
struct RlimitPlan {
    static constexpr size_t kMaxEntries = 8;

    RlimitEntry entries[kMaxEntries];
    size_t count = 0;

    void set(int resource, rlim_t soft, rlim_t hard) {
        for (size_t i = 0; i < count; i++) {
            if (entries[i].resource == resource) {
                entries[i].soft = soft;
                entries[i].hard = hard;
                return;
            }
        }
        if (count < kMaxEntries) {
            entries[count].resource = resource;
            entries[count].soft = soft;
            entries[count].hard = hard;
            count++;
        }
    }

    const RlimitEntry* find(int resource) const {
        for (size_t i = 0; i < count; i++) {
            if (entries[i].resource == resource) return &entries[i];
        }
        return nullptr;
    }
};

/**
 * @brief 把逻辑限制换算成 rlimit
 */
inline RlimitPlan plan_rlimits(const ResourceLimits &limits) {
    RlimitPlan plan;

    if (ResourceLimits::bounded(limits.cpu_time_ms)) {
        rlim_t sec = (limits.cpu_time_ms + 999) / 1000 + 1;
        plan.set(RLIMIT_CPU, sec, sec + 1);
    }

    if (ResourceLimits::bounded(limits.memory_bytes)) {
        plan.set(RLIMIT_AS, limits.memory_bytes * 2, limits.memory_bytes * 2);
        // 栈大小 = 内存限制
        plan.set(RLIMIT_STACK, limits.memory_bytes, limits.memory_bytes);
    }

    if (ResourceLimits::bounded(limits.output_bytes)) {
        plan.set(RLIMIT_FSIZE, limits.output_bytes, limits.output_bytes);
    }

    plan.set(RLIMIT_CORE, 0, 0);

    // 不设 RLIMIT_NPROC：它按真实 uid 统计整台机器的进程，root 下又被忽略。
    // 进程数由 cgroup pids.max 和 syscall 策略限制。

    return plan;
}

/**
 * @brief 在当前进程上施加 rlimit
 *
 * 只调用 setrlimit，可在 fork 后的子进程里使用。任何一项失败都返回 false，
 * 调用方不得继续执行目标程序。
 * @param failed_errno 失败时写入 errno
 */
inline bool apply_rlimits(const RlimitPlan &plan, int *failed_errno) {
    for (size_t i = 0; i < plan.count; i++) {
        struct rlimit rl;
        rl.rlim_cur = plan.entries[i].soft;
        rl.rlim_max = plan.entries[i].hard;
        if (setrlimit(plan.entries[i].resource, &rl) != 0) {
            if (failed_errno) *failed_errno = errno;
            return false;
        }
    }
    return true;
}

} // namespace sandbox
} // namespace judgebox

#endif // JUDGEBOX_SANDBOX_LIMITER_H
