/**
 * @file process.h
 * @brief 文件描述符与子进程的所有权封装
 *
 * - UniqueFd:     独占 fd，析构时 close
 * - Pipe:         O_CLOEXEC 管道
 * - ChildProcess: 独占子进程句柄，析构时杀掉整个进程组并回收
 */

#ifndef JUDGEBOX_SANDBOX_PROCESS_H
#define JUDGEBOX_SANDBOX_PROCESS_H

#include <string>
#include <utility>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <sys/mman.h>
#include <sys/wait.h>
#include <sys/resource.h>

#include "core/error.h"

namespace judgebox {
namespace sandbox {

//==============================================================================
// UniqueFd
//==============================================================================

class UniqueFd {
private:
    int fd_ = -1;

public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}

    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd &&other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd &&other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    explicit operator bool() const { return valid(); }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }
};

//==============================================================================
// Pipe
//==============================================================================

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;

    static Result<Pipe> create(int extra_flags = 0) {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC | extra_flags) < 0) {
            return JUDGEBOX_ERROR(ErrorCode::PIPE_FAILED,
                std::string("pipe2: ") + strerror(errno));
        }
        Pipe p;
        p.read_end.reset(fds[0]);
        p.write_end.reset(fds[1]);
        return std::move(p);
    }
};

/**
 * @brief 把字节写进一个匿名内存文件，定位到开头，用作标准输入
 */
inline Result<UniqueFd> make_memfd(const std::string &name, const std::string &data) {
    UniqueFd fd(memfd_create(name.c_str(), MFD_CLOEXEC));
    if (!fd) {
        return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
            std::string("memfd_create: ") + strerror(errno));
    }
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = write(fd.get(), data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
                std::string("write memfd: ") + strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
    if (lseek(fd.get(), 0, SEEK_SET) < 0) {
        return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
            std::string("lseek memfd: ") + strerror(errno));
    }
    return std::move(fd);
}

//==============================================================================
// ChildProcess
//==============================================================================

/**
 * @brief 子进程句柄
 *
 * 子进程在自己的进程组里（pgid == pid）。无论从哪条路径离开作用域，
 * 析构都会 SIGKILL 整个进程组并回收，不会留下孤儿进程。
 */
class ChildProcess {
private:
    pid_t pid_ = -1;
    bool reaped_ = false;

public:
    ChildProcess() = default;
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    ~ChildProcess() {
        if (pid_ > 0 && !reaped_) {
            kill_tree();
            int status = 0;
            while (true) {
                pid_t ret = waitpid(pid_, &status, __WALL);
                if (ret < 0 && errno == EINTR) continue;
                if (ret < 0 || WIFEXITED(status) || WIFSIGNALED(status)) break;
            }
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ChildProcess(ChildProcess &&other) noexcept
        : pid_(other.pid_), reaped_(other.reaped_) {
        other.pid_ = -1;
    }

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !reaped_; }

    /**
     * @brief 杀掉整个进程组（含泄漏的子孙进程）
     */
    void kill_tree() {
        if (pid_ <= 0) return;
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
    }

    /**
     * @brief wait4 观察到的事件
     */
    struct WaitEvent {
        enum class Kind { None, Stopped, Terminated };
        Kind kind = Kind::None;
        int status = 0;
    };

    /**
     * @brief 非阻塞等待一次
     *
     * Stopped 是 ptrace 停止状态，由调用方决定如何继续；Terminated 表示已回收。
     */
    Result<WaitEvent> poll_wait(struct rusage *usage) {
        WaitEvent ev;
        if (reaped_) {
            ev.kind = WaitEvent::Kind::Terminated;
            return ev;
        }
        int status = 0;
        pid_t ret = wait4(pid_, &status, WNOHANG | __WALL, usage);
        if (ret < 0) {
            if (errno == EINTR) return ev;
            return JUDGEBOX_ERROR(ErrorCode::WAIT_FAILED,
                std::string("wait4: ") + strerror(errno));
        }
        if (ret == 0) return ev;
        ev.status = status;
        if (WIFEXITED(status) || WIFSIGNALED(status)) {
            reaped_ = true;
            ev.kind = WaitEvent::Kind::Terminated;
        } else {
            ev.kind = WaitEvent::Kind::Stopped;
        }
        return ev;
    }

    /**
     * @brief 阻塞回收（调用前应已 kill_tree）
     */
    Result<void> reap(int *status, struct rusage *usage) {
        while (!reaped_) {
            pid_t ret = wait4(pid_, status, __WALL, usage);
            if (ret < 0) {
                if (errno == EINTR) continue;
                return JUDGEBOX_ERROR(ErrorCode::WAIT_FAILED,
                    std::string("wait4: ") + strerror(errno));
            }
            if (WIFEXITED(*status) || WIFSIGNALED(*status)) {
                reaped_ = true;
            }
        }
        return Ok();
    }
};

} // namespace sandbox
} // namespace judgebox

#endif // JUDGEBOX_SANDBOX_PROCESS_H
