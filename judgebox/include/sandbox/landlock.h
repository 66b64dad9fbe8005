/**
 * @file landlock.h
 * @brief Landlock 文件系统写入限制
 *
 * 只限制写类权限：规则集处理所有写类访问，只在工作目录下放行。
 * 读文件不受影响（由 syscall 策略和文件权限控制）。
 *
 * 规则集 fd 在父进程里建好；子进程只调用 landlock_restrict_self。
 */

#ifndef JUDGEBOX_SANDBOX_LANDLOCK_H
#define JUDGEBOX_SANDBOX_LANDLOCK_H

#include <string>
#include <cerrno>
#include <cstring>
#include <cstdint>

#include <fcntl.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <linux/landlock.h>

#include "core/error.h"
#include "sandbox/process.h"

namespace judgebox {
namespace sandbox {

namespace landlock {

inline int create_ruleset(const landlock_ruleset_attr *attr, size_t size, uint32_t flags) {
    return static_cast<int>(syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

inline int add_rule(int ruleset_fd, landlock_rule_type type, const void *attr, uint32_t flags) {
    return static_cast<int>(syscall(__NR_landlock_add_rule, ruleset_fd, type, attr, flags));
}

inline int restrict_self(int ruleset_fd, uint32_t flags) {
    return static_cast<int>(syscall(__NR_landlock_restrict_self, ruleset_fd, flags));
}

/**
 * @brief 内核支持的 ABI 版本，不支持时返回 0（只探测一次）
 */
inline int abi_version() {
    static const int version = [] {
        int v = create_ruleset(nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
        return v < 0 ? 0 : v;
    }();
    return version;
}

inline bool available() { return abi_version() > 0; }

/**
 * @brief 按 ABI 版本计算要处理的写类权限
 */
inline uint64_t write_access_rights(int abi) {
    uint64_t rights =
        LANDLOCK_ACCESS_FS_WRITE_FILE |
        LANDLOCK_ACCESS_FS_REMOVE_DIR |
        LANDLOCK_ACCESS_FS_REMOVE_FILE |
        LANDLOCK_ACCESS_FS_MAKE_CHAR |
        LANDLOCK_ACCESS_FS_MAKE_DIR |
        LANDLOCK_ACCESS_FS_MAKE_REG |
        LANDLOCK_ACCESS_FS_MAKE_SOCK |
        LANDLOCK_ACCESS_FS_MAKE_FIFO |
        LANDLOCK_ACCESS_FS_MAKE_BLOCK |
        LANDLOCK_ACCESS_FS_MAKE_SYM;
#ifdef LANDLOCK_ACCESS_FS_REFER
    if (abi >= 2) {
        rights |= LANDLOCK_ACCESS_FS_REFER;
    }
#endif
#ifdef LANDLOCK_ACCESS_FS_TRUNCATE
    if (abi >= 3) {
        rights |= LANDLOCK_ACCESS_FS_TRUNCATE;
    }
#endif
    return rights;
}

} // namespace landlock

/**
 * @brief 建立"只能写 writable_dir"的规则集
 *
 * /dev/null 额外放行写文件权限（编译器会把丢弃的输出写到这里）。
 * @return 规则集 fd（O_CLOEXEC）
 */
inline Result<UniqueFd> build_write_ruleset(const std::string &writable_dir) {
    int abi = landlock::abi_version();
    if (abi <= 0) {
        return JUDGEBOX_ERROR(ErrorCode::LANDLOCK_ERROR, "landlock not supported by kernel");
    }

    landlock_ruleset_attr attr;
    memset(&attr, 0, sizeof(attr));
    attr.handled_access_fs = landlock::write_access_rights(abi);

    UniqueFd ruleset(landlock::create_ruleset(&attr, sizeof(attr), 0));
    if (!ruleset) {
        return JUDGEBOX_ERROR(ErrorCode::LANDLOCK_ERROR,
            std::string("landlock_create_ruleset: ") + strerror(errno));
    }

    UniqueFd dir(open(writable_dir.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC));
    if (!dir) {
        return JUDGEBOX_ERROR(ErrorCode::LANDLOCK_ERROR,
            "cannot open " + writable_dir + ": " + strerror(errno));
    }

    landlock_path_beneath_attr beneath;
    memset(&beneath, 0, sizeof(beneath));
    beneath.allowed_access = attr.handled_access_fs;
    beneath.parent_fd = dir.get();
    if (landlock::add_rule(ruleset.get(), LANDLOCK_RULE_PATH_BENEATH, &beneath, 0) < 0) {
        return JUDGEBOX_ERROR(ErrorCode::LANDLOCK_ERROR,
            std::string("landlock_add_rule: ") + strerror(errno));
    }

    UniqueFd devnull(open("/dev/null", O_PATH | O_CLOEXEC));
    if (devnull) {
        landlock_path_beneath_attr null_rule;
        memset(&null_rule, 0, sizeof(null_rule));
        null_rule.allowed_access = LANDLOCK_ACCESS_FS_WRITE_FILE;
        null_rule.parent_fd = devnull.get();
        if (landlock::add_rule(ruleset.get(), LANDLOCK_RULE_PATH_BENEATH, &null_rule, 0) < 0) {
            return JUDGEBOX_ERROR(ErrorCode::LANDLOCK_ERROR,
                std::string("landlock_add_rule(/dev/null): ") + strerror(errno));
        }
    }

    return std::move(ruleset);
}

/**
 * @brief 子进程中启用规则集（只做系统调用）
 *
 * landlock_restrict_self 要求 no_new_privs，这里先设置。
 */
inline bool enforce_ruleset(int ruleset_fd, int *failed_errno) {
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0 ||
        landlock::restrict_self(ruleset_fd, 0) < 0) {
        if (failed_errno) *failed_errno = errno;
        return false;
    }
    return true;
}

} // namespace sandbox
} // namespace judgebox

#endif // JUDGEBOX_SANDBOX_LANDLOCK_H
