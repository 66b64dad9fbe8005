/**
 * @file cgroup.h
 * @brief cgroups v2 资源限制
 *
 * 每次运行一个独立的 cgroup，运行结束即销毁，不在运行之间复用。
 *
 * 层级结构（遵循 cgroup v2 "no internal processes" 规则）：
 *
 *   <base>/              ← 被委派的 cgroup（systemd-run --scope -p Delegate=yes）或容器根
 *   ├── judger/          ← judgebox_judger 进程移动到这里
 *   └── sandbox/         ← 每次运行的 cgroup
 *       ├── box_<pid>_0/
 *       └── ...
 *
 * 管理器只在 CLI 启动时显式初始化；未初始化时监督进程不使用 cgroup。
 */

#ifndef JUDGEBOX_SANDBOX_CGROUP_H
#define JUDGEBOX_SANDBOX_CGROUP_H

#include <string>
#include <fstream>
#include <sstream>
#include <memory>
#include <mutex>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/vfs.h>
#include <linux/magic.h>

#include "core/error.h"
#include "core/types.h"

namespace judgebox {
namespace sandbox {

/**
 * @brief cgroup 资源使用统计
 */
struct CgroupStats {
    uint64_t memory_current = 0;   ///< 当前内存使用 (bytes)
    uint64_t memory_peak = 0;      ///< 峰值内存使用 (bytes)，内核不支持时为 0
    bool oom_killed = false;       ///< 是否被 OOM killer 杀死
    uint64_t pids_current = 0;
};

/**
 * @brief cgroup 资源限制配置
 */
struct CgroupLimits {
    uint64_t memory_max = 0;       ///< 最大内存 (bytes), 0 = 不限制
    uint64_t memory_swap_max = 0;  ///< 最大 swap (bytes), 0 = 禁用 swap
    uint64_t pids_max = 0;         ///< 最大进程数, 0 = 不限制

    /// 内存留出的余量，超出 memory_bytes 但仍在余量内的运行由分类器判 MLE
    static constexpr uint64_t kMemorySlack = 16 * MiB;
    /// 进程数余量（fork 后、exec 前的子进程本身）
    static constexpr uint64_t kPidsSlack = 2;

    static CgroupLimits from(const ResourceLimits &limits) {
        CgroupLimits cg;
        if (ResourceLimits::bounded(limits.memory_bytes)) {
            cg.memory_max = limits.memory_bytes + kMemorySlack;
        }
        if (ResourceLimits::bounded(limits.max_processes)) {
            cg.pids_max = limits.max_processes + kPidsSlack;
        }
        return cg;
    }
};

/**
 * @brief 解析无符号整数，"max" 视为 UINT64_MAX
 */
inline bool parse_cgroup_u64(const std::string &s, uint64_t *out) {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) i++;
    if (s.compare(i, 3, "max") == 0) {
        *out = UINT64_MAX;
        return true;
    }
    const char *begin = s.c_str() + i;
    char *end = nullptr;
    errno = 0;
    unsigned long long v = strtoull(begin, &end, 10);
    if (end == begin || errno != 0) return false;
    *out = v;
    return true;
}

/**
 * @brief 获取当前进程的 cgroup 路径
 *
 * 读取 /proc/self/cgroup，cgroup v2 格式为 "0::/path/to/cgroup"
 * @return cgroup 路径（相对于 /sys/fs/cgroup）
 */
inline std::string get_self_cgroup_path() {
    std::ifstream cgroup_file("/proc/self/cgroup");
    if (!cgroup_file) {
        return "";
    }

    std::string line;
    while (std::getline(cgroup_file, line)) {
        if (line.compare(0, 3, "0::") == 0) {
            return line.substr(3);
        }
    }
    return "";
}

/**
 * @brief 检查 cgroups v2 是否可用
 *
 * 使用 statfs 检测文件系统类型，比检查文件存在更健壮。
 */
inline bool is_cgroup_v2_available() {
    struct statfs buf;
    if (statfs("/sys/fs/cgroup", &buf) != 0) {
        return false;
    }
    return buf.f_type == CGROUP2_SUPER_MAGIC;
}

/**
 * @brief cgroup v2 控制器
 */
class CgroupController {
private:
    std::string cgroup_path_;
    bool created_ = false;

    Result<void> write_file(const std::string &filename, const std::string &content) {
        std::string path = cgroup_path_ + "/" + filename;
        std::ofstream file(path);
        if (!file) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR, "cannot open " + path);
        }
        file << content;
        file.flush();
        if (!file) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR, "write failed: " + path);
        }
        return Ok();
    }

    Result<std::string> read_file(const std::string &filename) const {
        std::string path = cgroup_path_ + "/" + filename;
        std::ifstream file(path);
        if (!file) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR, "cannot read " + path);
        }
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    uint64_t read_uint64(const std::string &filename, uint64_t default_val = 0) const {
        auto content = read_file(filename);
        if (!content.ok()) return default_val;
        uint64_t v = 0;
        return parse_cgroup_u64(content.value(), &v) ? v : default_val;
    }

    /**
     * @brief 解析 key-value 格式的状态文件（如 memory.events）
     */
    static uint64_t parse_stat(const std::string &content, const std::string &key) {
        std::istringstream iss(content);
        std::string line;
        while (std::getline(iss, line)) {
            if (line.compare(0, key.size() + 1, key + " ") == 0) {
                uint64_t v = 0;
                if (parse_cgroup_u64(line.substr(key.size() + 1), &v)) return v;
            }
        }
        return 0;
    }

public:
    /**
     * @param name cgroup 名称
     * @param parent_path 父 cgroup 的绝对路径
     */
    CgroupController(const std::string &name, const std::string &parent_path)
        : cgroup_path_(parent_path + "/" + name) {}

    ~CgroupController() {
        if (created_) {
            auto r = destroy();
            (void)r;  // 析构中无法上报
        }
    }

    CgroupController(const CgroupController&) = delete;
    CgroupController& operator=(const CgroupController&) = delete;

    Result<void> create() {
        if (mkdir(cgroup_path_.c_str(), 0755) < 0 && errno != EEXIST) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR,
                "cannot create cgroup " + cgroup_path_ + ": " + strerror(errno));
        }
        created_ = true;
        return Ok();
    }

    /**
     * @brief 杀掉残留进程并删除 cgroup
     */
    Result<void> destroy() {
        if (!created_) return Ok();

        auto killed = kill_all();
        (void)killed;  // 进程可能已全部退出，cgroup.kill 失败不影响删除

        // 进程退出需要一点时间，rmdir 会返回 EBUSY
        for (int i = 0; i < 50; i++) {
            if (rmdir(cgroup_path_.c_str()) == 0 || errno == ENOENT) {
                created_ = false;
                return Ok();
            }
            if (errno != EBUSY) break;
            usleep(1000);
        }
        return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR,
            "cannot remove cgroup " + cgroup_path_ + ": " + strerror(errno));
    }

    Result<void> apply_limits(const CgroupLimits &limits) {
        if (limits.memory_max > 0) {
            JUDGEBOX_TRY(write_file("memory.max", std::to_string(limits.memory_max)));
        }
        // 没有 swap 控制器时文件不存在，忽略
        auto swap = write_file("memory.swap.max", std::to_string(limits.memory_swap_max));
        (void)swap;
        if (limits.pids_max > 0) {
            JUDGEBOX_TRY(write_file("pids.max", std::to_string(limits.pids_max)));
        }
        return Ok();
    }

    Result<void> add_process(pid_t pid) {
        return write_file("cgroup.procs", std::to_string(pid));
    }

    CgroupStats get_stats() const {
        CgroupStats stats;
        stats.memory_current = read_uint64("memory.current");
        stats.memory_peak = read_uint64("memory.peak");
        auto events = read_file("memory.events");
        if (events.ok()) {
            stats.oom_killed = parse_stat(events.value(), "oom_kill") > 0;
        }
        stats.pids_current = read_uint64("pids.current");
        return stats;
    }

    /**
     * @brief 杀死 cgroup 中的所有进程（内核 5.14+）
     */
    Result<void> kill_all() {
        return write_file("cgroup.kill", "1");
    }

    const std::string& path() const { return cgroup_path_; }
};

/**
 * @brief cgroup 管理器
 */
class CgroupManager {
private:
    std::string base_path_;
    std::string sandbox_parent_;
    std::atomic<bool> initialized_{false};
    std::atomic<uint64_t> next_id_{0};
    std::mutex mutex_;

    static constexpr const char* CGROUP_ROOT = "/sys/fs/cgroup";

    CgroupManager() = default;

    static bool enable_controllers(const std::string &path) {
        std::ofstream subtree(path + "/cgroup.subtree_control");
        if (!subtree) return false;
        subtree << "+memory +pids";
        subtree.flush();
        return subtree.good();
    }

    static bool create_dir(const std::string &path) {
        return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
    }

    static bool move_process(const std::string &cgroup_path, pid_t pid) {
        std::ofstream procs(cgroup_path + "/cgroup.procs");
        if (!procs) return false;
        procs << pid;
        procs.flush();
        return procs.good();
    }

public:
    static CgroupManager& instance() {
        static CgroupManager mgr;
        return mgr;
    }

    /**
     * @brief 初始化层级结构，并把当前进程移到 judger/
     */
    Result<void> initialize() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) return Ok();

        if (!is_cgroup_v2_available()) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR, "cgroup v2 not mounted at /sys/fs/cgroup");
        }

        std::string self_cgroup = get_self_cgroup_path();
        if (self_cgroup.empty() || self_cgroup == "/") {
            base_path_ = CGROUP_ROOT;
        } else {
            base_path_ = std::string(CGROUP_ROOT) + self_cgroup;
        }

        // 必须先把进程移出 base，才能在 base 上启用 subtree_control（否则 EBUSY）
        std::string judger_path = base_path_ + "/judger";
        if (!create_dir(judger_path)) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR, "cannot create " + judger_path);
        }
        if (!move_process(judger_path, getpid())) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR, "cannot move self to " + judger_path);
        }
        if (!enable_controllers(base_path_)) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR,
                "cannot enable memory/pids controllers in " + base_path_);
        }

        sandbox_parent_ = base_path_ + "/sandbox";
        if (!create_dir(sandbox_parent_)) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR, "cannot create " + sandbox_parent_);
        }
        if (!enable_controllers(sandbox_parent_)) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR,
                "cannot enable controllers in " + sandbox_parent_);
        }

        initialized_ = true;
        return Ok();
    }

    bool is_initialized() const { return initialized_; }
    const std::string& sandbox_parent_path() const { return sandbox_parent_; }

    /**
     * @brief 为一次运行创建 cgroup 并施加限制
     */
    Result<std::unique_ptr<CgroupController>> create_run_cgroup(const ResourceLimits &limits) {
        if (!initialized_) {
            return JUDGEBOX_ERROR(ErrorCode::CGROUP_ERROR, "cgroup manager not initialized");
        }
        std::string name = "box_" + std::to_string(getpid()) + "_" + std::to_string(next_id_++);
        auto cg = std::make_unique<CgroupController>(name, sandbox_parent_);
        JUDGEBOX_TRY(cg->create());
        JUDGEBOX_TRY(cg->apply_limits(CgroupLimits::from(limits)));
        return std::move(cg);
    }
};

} // namespace sandbox
} // namespace judgebox

#endif // JUDGEBOX_SANDBOX_CGROUP_H
