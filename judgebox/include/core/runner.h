/**
 * @file runner.h
 * @brief 程序运行器
 *
 * 把宿主侧设置（临时目录、环境变量白名单、cgroup/ptrace 开关）和运行槽位
 * 组合到每一次沙箱运行上。编译、测试点、checker、交互器都经由这里进入 Supervisor。
 */

#ifndef JUDGEBOX_CORE_RUNNER_H
#define JUDGEBOX_CORE_RUNNER_H

#include <string>
#include <vector>
#include <thread>

#include "core/error.h"
#include "core/types.h"
#include "core/config.h"
#include "core/utils.h"
#include "core/run_slots.h"
#include "core/cancellation.h"
#include "core/judger_logger.h"
#include "sandbox/supervisor.h"
#include "sandbox/scratch_dir.h"

namespace judgebox {

/**
 * @brief 交互运行的两个结果
 */
struct InteractiveOutcome {
    RunOutcome user;
    RunOutcome interactor;
};

class Runner {
private:
    SandboxOptions options_;
    RunSlots *slots_;
    sandbox::Supervisor supervisor_;

public:
    explicit Runner(SandboxOptions options, RunSlots *slots = nullptr)
        : options_(std::move(options)), slots_(slots) {}

    const SandboxOptions& options() const { return options_; }

    /**
     * @brief 在 scratch_root 下新建一个独占目录
     */
    Result<sandbox::ScratchDir> scratch(const std::string &prefix) const {
        return sandbox::ScratchDir::create(options_.scratch_root, prefix);
    }

    /**
     * @brief 以宿主设置为底构造一份 SandboxSpec
     *
     * 标准输入默认为 /dev/null，标准输出和错误被捕获。
     */
    SandboxSpec make_spec(const std::string &executable, const std::string &work_dir,
                          const ResourceLimits &limits, const SyscallPolicy &policy) const {
        SandboxSpec spec;
        spec.executable_path = executable;
        spec.argv = {executable};
        spec.env = options_.env;
        spec.working_dir = work_dir;
        spec.stdin_source = StdinSource::null();
        spec.stdout_sink = OutputSink::capture();
        spec.stderr_sink = OutputSink::capture();
        spec.limits = limits;
        spec.policy = policy;
        spec.confine_writes = true;
        spec.report_syscalls = options_.report_syscalls;
        spec.use_cgroup = options_.use_cgroup;
        return spec;
    }

    /**
     * @brief 取得运行槽位后执行
     *
     * 等待槽位期间被取消时不启动进程，直接返回 cancelled。
     */
    RunOutcome execute(const SandboxSpec &spec, const CancellationToken *cancel = nullptr) const {
        RunSlotGuard slot(slots_, cancel);
        if (!slot.held()) {
            return RunOutcome::supervisor_error("cancelled");
        }
        return run_logged(spec, cancel);
    }

    /**
     * @brief 用两条管道把用户程序和交互器接起来同时运行
     *
     * 用户程序的标准输出是交互器的标准输入，反之亦然。两次运行共用一个槽位，
     * 交互器在单独的线程里监督。每一方启动后立即关掉本进程持有的那两个端，
     * 一方退出时另一方才能读到 EOF 或写出 EPIPE。
     */
    InteractiveOutcome execute_interactive(SandboxSpec user, SandboxSpec interactor,
                                           const CancellationToken *cancel = nullptr) const {
        InteractiveOutcome out;
        RunSlotGuard slot(slots_, cancel);
        if (!slot.held()) {
            out.user = RunOutcome::supervisor_error("cancelled");
            out.interactor = RunOutcome::supervisor_error("cancelled");
            return out;
        }

        auto to_user = sandbox::Pipe::create();
        auto from_user = sandbox::Pipe::create();
        if (!to_user.ok() || !from_user.ok()) {
            std::string reason = "pipe: " + (to_user.ok() ? from_user.error() : to_user.error()).message();
            out.user = RunOutcome::supervisor_error(reason);
            out.interactor = RunOutcome::supervisor_error(reason);
            return out;
        }
        sandbox::Pipe &down = to_user.value();
        sandbox::Pipe &up = from_user.value();

        user.stdin_source = StdinSource::descriptor(down.read_end.get());
        user.stdout_sink = OutputSink::descriptor(up.write_end.get());
        user.on_started = [&down, &up](pid_t) {
            down.read_end.reset();
            up.write_end.reset();
        };
        interactor.stdin_source = StdinSource::descriptor(up.read_end.get());
        interactor.stdout_sink = OutputSink::descriptor(down.write_end.get());
        interactor.on_started = [&down, &up](pid_t) {
            up.read_end.reset();
            down.write_end.reset();
        };

        // 启动前就失败的一方也要放掉自己的端，否则另一方等不到 EOF
        std::thread interactor_thread([&] {
            out.interactor = run_logged(interactor, cancel);
            up.read_end.reset();
            down.write_end.reset();
        });
        out.user = run_logged(user, cancel);
        down.read_end.reset();
        up.write_end.reset();
        interactor_thread.join();

        RLOG_DEBUG << "interactive run: user " << out.user << ", interactor " << out.interactor;
        return out;
    }

private:
    RunOutcome run_logged(const SandboxSpec &spec, const CancellationToken *cancel) const {
        RunOutcome outcome = supervisor_.run(spec, cancel);
        if (outcome.is_supervisor_error()) {
            RLOG_WARN << spec.executable_path << ": " << exit_status_to_string(outcome.exit_status);
        }
        return outcome;
    }
};

} // namespace judgebox

#endif // JUDGEBOX_CORE_RUNNER_H
