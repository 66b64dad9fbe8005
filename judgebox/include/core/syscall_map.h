/**
 * @file syscall_map.h
 * @brief syscall 名称与编号的双向映射
 *
 * 配置文件里的策略规则用名称书写，违规报告里用名称展示，
 * 都经过这里转换。只收录当前架构存在的 syscall。
 */

#ifndef JUDGEBOX_CORE_SYSCALL_MAP_H
#define JUDGEBOX_CORE_SYSCALL_MAP_H

#include <string>
#include <map>
#include <unordered_map>
#include <sys/syscall.h>

namespace judgebox {

class SyscallMap {
public:
    static const SyscallMap& instance() {
        static const SyscallMap inst;
        return inst;
    }

    /**
     * @return syscall 编号，未知返回 -1
     */
    int name_to_nr(const std::string& name) const {
        auto it = by_name_.find(name);
        return it != by_name_.end() ? it->second : -1;
    }

    /**
     * @return syscall 名称，未知时返回 "syscall#<nr>"
     */
    std::string nr_to_name(int nr) const {
        auto it = by_nr_.find(nr);
        if (it != by_nr_.end()) return it->second;
        return "syscall#" + std::to_string(nr);
    }

    size_t size() const { return by_name_.size(); }

private:
    std::map<std::string, int> by_name_;
    std::unordered_map<int, std::string> by_nr_;

    void add(const char* name, int nr) {
        by_name_[name] = nr;
        by_nr_.emplace(nr, name);
    }

    SyscallMap() {
#define JUDGEBOX_SYSCALL(name) add(#name, __NR_##name)
        // 文件 I/O
        JUDGEBOX_SYSCALL(read);
        JUDGEBOX_SYSCALL(write);
        JUDGEBOX_SYSCALL(close);
        JUDGEBOX_SYSCALL(openat);
        JUDGEBOX_SYSCALL(fstat);
        JUDGEBOX_SYSCALL(lseek);
        JUDGEBOX_SYSCALL(pread64);
        JUDGEBOX_SYSCALL(pwrite64);
        JUDGEBOX_SYSCALL(readv);
        JUDGEBOX_SYSCALL(writev);
        JUDGEBOX_SYSCALL(dup);
        JUDGEBOX_SYSCALL(dup3);
        JUDGEBOX_SYSCALL(pipe2);
        JUDGEBOX_SYSCALL(fcntl);
        JUDGEBOX_SYSCALL(flock);
        JUDGEBOX_SYSCALL(ioctl);
        JUDGEBOX_SYSCALL(faccessat);
        JUDGEBOX_SYSCALL(readlinkat);
        JUDGEBOX_SYSCALL(getdents64);
        JUDGEBOX_SYSCALL(getcwd);
        JUDGEBOX_SYSCALL(chdir);
        JUDGEBOX_SYSCALL(fchdir);
        JUDGEBOX_SYSCALL(statfs);
        JUDGEBOX_SYSCALL(fstatfs);
        JUDGEBOX_SYSCALL(umask);
        JUDGEBOX_SYSCALL(fchmod);
        JUDGEBOX_SYSCALL(fchown);
        JUDGEBOX_SYSCALL(ftruncate);
        JUDGEBOX_SYSCALL(truncate);
        JUDGEBOX_SYSCALL(fsync);
        JUDGEBOX_SYSCALL(fdatasync);
        JUDGEBOX_SYSCALL(mkdirat);
        JUDGEBOX_SYSCALL(unlinkat);
        JUDGEBOX_SYSCALL(renameat);
        JUDGEBOX_SYSCALL(linkat);
        JUDGEBOX_SYSCALL(symlinkat);
        JUDGEBOX_SYSCALL(fchmodat);
        JUDGEBOX_SYSCALL(fchownat);
        JUDGEBOX_SYSCALL(statx);
        JUDGEBOX_SYSCALL(newfstatat);
#ifdef __NR_open
        JUDGEBOX_SYSCALL(open);
        JUDGEBOX_SYSCALL(stat);
        JUDGEBOX_SYSCALL(lstat);
        JUDGEBOX_SYSCALL(access);
        JUDGEBOX_SYSCALL(readlink);
        JUDGEBOX_SYSCALL(getdents);
        JUDGEBOX_SYSCALL(dup2);
        JUDGEBOX_SYSCALL(pipe);
        JUDGEBOX_SYSCALL(creat);
        JUDGEBOX_SYSCALL(mkdir);
        JUDGEBOX_SYSCALL(rmdir);
        JUDGEBOX_SYSCALL(unlink);
        JUDGEBOX_SYSCALL(rename);
        JUDGEBOX_SYSCALL(link);
        JUDGEBOX_SYSCALL(symlink);
        JUDGEBOX_SYSCALL(chmod);
        JUDGEBOX_SYSCALL(chown);
        JUDGEBOX_SYSCALL(lchown);
        JUDGEBOX_SYSCALL(poll);
        JUDGEBOX_SYSCALL(select);
        JUDGEBOX_SYSCALL(epoll_create);
        JUDGEBOX_SYSCALL(epoll_wait);
        JUDGEBOX_SYSCALL(fork);
        JUDGEBOX_SYSCALL(vfork);
        JUDGEBOX_SYSCALL(time);
        JUDGEBOX_SYSCALL(alarm);
        JUDGEBOX_SYSCALL(pause);
        JUDGEBOX_SYSCALL(getpgrp);
        JUDGEBOX_SYSCALL(arch_prctl);
        JUDGEBOX_SYSCALL(getrlimit);
#endif
#ifdef __NR_faccessat2
        JUDGEBOX_SYSCALL(faccessat2);
#endif
#ifdef __NR_renameat2
        JUDGEBOX_SYSCALL(renameat2);
#endif
#ifdef __NR_copy_file_range
        JUDGEBOX_SYSCALL(copy_file_range);
#endif
        JUDGEBOX_SYSCALL(sendfile);

        // 多路复用
        JUDGEBOX_SYSCALL(ppoll);
        JUDGEBOX_SYSCALL(pselect6);
        JUDGEBOX_SYSCALL(epoll_create1);
        JUDGEBOX_SYSCALL(epoll_ctl);
        JUDGEBOX_SYSCALL(epoll_pwait);
        JUDGEBOX_SYSCALL(eventfd2);

        // 内存
        JUDGEBOX_SYSCALL(brk);
        JUDGEBOX_SYSCALL(mmap);
        JUDGEBOX_SYSCALL(munmap);
        JUDGEBOX_SYSCALL(mprotect);
        JUDGEBOX_SYSCALL(mremap);
        JUDGEBOX_SYSCALL(madvise);
        JUDGEBOX_SYSCALL(membarrier);
        JUDGEBOX_SYSCALL(memfd_create);

        // 进程与线程
        JUDGEBOX_SYSCALL(execve);
        JUDGEBOX_SYSCALL(execveat);
        JUDGEBOX_SYSCALL(exit);
        JUDGEBOX_SYSCALL(exit_group);
        JUDGEBOX_SYSCALL(clone);
#ifdef __NR_clone3
        JUDGEBOX_SYSCALL(clone3);
#endif
        JUDGEBOX_SYSCALL(wait4);
        JUDGEBOX_SYSCALL(waitid);
        JUDGEBOX_SYSCALL(kill);
        JUDGEBOX_SYSCALL(tkill);
        JUDGEBOX_SYSCALL(tgkill);
        JUDGEBOX_SYSCALL(getpid);
        JUDGEBOX_SYSCALL(gettid);
        JUDGEBOX_SYSCALL(getppid);
        JUDGEBOX_SYSCALL(getuid);
        JUDGEBOX_SYSCALL(geteuid);
        JUDGEBOX_SYSCALL(getgid);
        JUDGEBOX_SYSCALL(getegid);
        JUDGEBOX_SYSCALL(getresuid);
        JUDGEBOX_SYSCALL(getresgid);
        JUDGEBOX_SYSCALL(getgroups);
        JUDGEBOX_SYSCALL(setuid);
        JUDGEBOX_SYSCALL(setgid);
        JUDGEBOX_SYSCALL(setreuid);
        JUDGEBOX_SYSCALL(setregid);
        JUDGEBOX_SYSCALL(setresuid);
        JUDGEBOX_SYSCALL(setresgid);
        JUDGEBOX_SYSCALL(setgroups);
        JUDGEBOX_SYSCALL(setpgid);
        JUDGEBOX_SYSCALL(getpgid);
        JUDGEBOX_SYSCALL(setsid);
        JUDGEBOX_SYSCALL(getsid);
        JUDGEBOX_SYSCALL(set_tid_address);
        JUDGEBOX_SYSCALL(set_robust_list);
        JUDGEBOX_SYSCALL(get_robust_list);
#ifdef __NR_rseq
        JUDGEBOX_SYSCALL(rseq);
#endif
        JUDGEBOX_SYSCALL(prctl);
        JUDGEBOX_SYSCALL(prlimit64);
        JUDGEBOX_SYSCALL(setrlimit);
        JUDGEBOX_SYSCALL(getrusage);
        JUDGEBOX_SYSCALL(sched_yield);
        JUDGEBOX_SYSCALL(sched_getaffinity);
        JUDGEBOX_SYSCALL(sched_setaffinity);
        JUDGEBOX_SYSCALL(uname);
        JUDGEBOX_SYSCALL(sysinfo);
        JUDGEBOX_SYSCALL(getrandom);
        JUDGEBOX_SYSCALL(futex);

        // 信号
        JUDGEBOX_SYSCALL(rt_sigaction);
        JUDGEBOX_SYSCALL(rt_sigprocmask);
        JUDGEBOX_SYSCALL(rt_sigreturn);
        JUDGEBOX_SYSCALL(rt_sigsuspend);
        JUDGEBOX_SYSCALL(sigaltstack);

        // 时间
        JUDGEBOX_SYSCALL(clock_gettime);
        JUDGEBOX_SYSCALL(clock_getres);
        JUDGEBOX_SYSCALL(clock_nanosleep);
        JUDGEBOX_SYSCALL(gettimeofday);
        JUDGEBOX_SYSCALL(nanosleep);
        JUDGEBOX_SYSCALL(times);
        JUDGEBOX_SYSCALL(setitimer);
        JUDGEBOX_SYSCALL(getitimer);

        // 网络
        JUDGEBOX_SYSCALL(socket);
        JUDGEBOX_SYSCALL(socketpair);
        JUDGEBOX_SYSCALL(connect);
        JUDGEBOX_SYSCALL(bind);
        JUDGEBOX_SYSCALL(listen);
        JUDGEBOX_SYSCALL(accept);
        JUDGEBOX_SYSCALL(accept4);
        JUDGEBOX_SYSCALL(sendto);
        JUDGEBOX_SYSCALL(recvfrom);
        JUDGEBOX_SYSCALL(sendmsg);
        JUDGEBOX_SYSCALL(recvmsg);
        JUDGEBOX_SYSCALL(shutdown);
        JUDGEBOX_SYSCALL(setsockopt);
        JUDGEBOX_SYSCALL(getsockopt);
        JUDGEBOX_SYSCALL(getsockname);
        JUDGEBOX_SYSCALL(getpeername);

        // 危险操作
        JUDGEBOX_SYSCALL(ptrace);
        JUDGEBOX_SYSCALL(mount);
        JUDGEBOX_SYSCALL(umount2);
        JUDGEBOX_SYSCALL(pivot_root);
        JUDGEBOX_SYSCALL(chroot);
        JUDGEBOX_SYSCALL(unshare);
        JUDGEBOX_SYSCALL(setns);
        JUDGEBOX_SYSCALL(reboot);
        JUDGEBOX_SYSCALL(kexec_load);
        JUDGEBOX_SYSCALL(init_module);
        JUDGEBOX_SYSCALL(finit_module);
        JUDGEBOX_SYSCALL(delete_module);
        JUDGEBOX_SYSCALL(bpf);
        JUDGEBOX_SYSCALL(perf_event_open);
        JUDGEBOX_SYSCALL(seccomp);
        JUDGEBOX_SYSCALL(process_vm_readv);
        JUDGEBOX_SYSCALL(process_vm_writev);
        JUDGEBOX_SYSCALL(keyctl);
        JUDGEBOX_SYSCALL(add_key);
        JUDGEBOX_SYSCALL(request_key);
        JUDGEBOX_SYSCALL(swapon);
        JUDGEBOX_SYSCALL(swapoff);
        JUDGEBOX_SYSCALL(settimeofday);
        JUDGEBOX_SYSCALL(sethostname);
        JUDGEBOX_SYSCALL(setdomainname);
        JUDGEBOX_SYSCALL(acct);
        JUDGEBOX_SYSCALL(io_uring_setup);
        JUDGEBOX_SYSCALL(io_uring_enter);
        JUDGEBOX_SYSCALL(io_uring_register);
        JUDGEBOX_SYSCALL(userfaultfd);
#undef JUDGEBOX_SYSCALL
    }
};

inline int syscall_name_to_nr(const std::string& name) {
    return SyscallMap::instance().name_to_nr(name);
}

inline std::string syscall_nr_to_name(int nr) {
    return SyscallMap::instance().nr_to_name(nr);
}

} // namespace judgebox

#endif // JUDGEBOX_CORE_SYSCALL_MAP_H
