/**
 * @file interactor.h
 * @brief 交互题：交互器与用户程序通过管道对话
 *
 * testlib 约定：interactor <input> <tout> <answer>
 *   标准输入读用户程序的输出，标准输出写给用户程序；
 *   tout 由交互器写出，需要时再交给 checker 检查。
 */

#ifndef JUDGEBOX_CORE_INTERACTOR_H
#define JUDGEBOX_CORE_INTERACTOR_H

#include <string>
#include <csignal>

#include "core/types.h"
#include "core/utils.h"
#include "core/verdict.h"
#include "core/runner.h"
#include "core/checker.h"
#include "core/submission.h"
#include "core/judger_logger.h"

namespace judgebox {

struct InteractorSpec {
    std::string path;
    ResourceLimits limits = limits::CHECKER;
    SyscallPolicy policy = policies::interactor_policy();
};

/**
 * @brief 一次交互的结果
 */
struct Interaction {
    RunOutcome user;
    RunOutcome interactor;
    Verdict verdict = verdict::Accepted{};   ///< 交互器给出的判定
    std::string tout;
};

class Interactor {
private:
    const Runner &runner_;
    InteractorSpec spec_;

    static constexpr size_t kInfoLen = 512;

public:
    Interactor(const Runner &runner, InteractorSpec spec)
        : runner_(runner), spec_(std::move(spec)) {}

    /**
     * @brief 交互器的墙钟时间要覆盖用户程序的整个运行
     */
    static ResourceLimits limits_for(const ResourceLimits &own, const ResourceLimits &user) {
        ResourceLimits l = own;
        uint64_t own_wall = own.effective_wall_ms();
        uint64_t user_wall = user.effective_wall_ms();
        if (!ResourceLimits::bounded(user_wall)) {
            l.wall_time_ms = kUnbounded;
        } else if (ResourceLimits::bounded(own_wall)) {
            l.wall_time_ms = own_wall + user_wall;
        }
        return l;
    }

    /**
     * @brief 运行一次交互
     * @param work_dir  测试点的临时目录
     * @param user      用户程序的 SandboxSpec，标准输入输出会被替换成管道
     */
    Interaction interact(const std::string &work_dir, const TestData &input,
                         const std::string &answer, SandboxSpec user,
                         const CancellationToken *cancel = nullptr) const {
        Interaction ia;
        auto fail = [&](const std::string &reason) {
            ia.user = RunOutcome::supervisor_error(reason);
            ia.interactor = RunOutcome::supervisor_error(reason);
            ia.verdict = verdict::SystemError{reason};
            return ia;
        };

        std::string input_path = input.path;
        if (input.kind == TestData::Kind::Bytes) {
            input_path = work_dir + "/input.txt";
            auto w = write_file(input_path, input.bytes);
            if (!w.ok()) return fail("interactor input: " + w.error().message());
        }
        std::string answer_path = work_dir + "/answer.txt";
        std::string tout_path = work_dir + "/tout.txt";
        auto w1 = write_file(answer_path, answer);
        if (!w1.ok()) return fail("interactor answer: " + w1.error().message());
        auto w2 = write_file(tout_path, "");
        if (!w2.ok()) return fail("interactor tout: " + w2.error().message());

        ResourceLimits limits = limits_for(spec_.limits, user.limits);
        SandboxSpec ispec = runner_.make_spec(spec_.path, work_dir, limits, spec_.policy);
        ispec.argv = {spec_.path, input_path, tout_path, answer_path};

        InteractiveOutcome run = runner_.execute_interactive(std::move(user), std::move(ispec), cancel);
        ia.user = std::move(run.user);
        ia.interactor = std::move(run.interactor);

        std::string info = preview(ia.interactor.stderr_data, kInfoLen);
        TLOG_DEBUG << "interactor " << ia.interactor << ": " << info;

        auto sig = std::get_if<outcome::Signaled>(&ia.interactor.exit_status);
        if (sig && sig->signal == SIGPIPE) {
            // 用户程序先关掉了管道
            ia.verdict = verdict::WrongAnswer{"program closed the interaction early"};
        } else {
            ia.verdict = testlib_verdict(ia.interactor, limits, "interactor", info);
        }

        auto tout = read_file(tout_path);
        if (tout.ok()) {
            ia.tout = std::move(tout.value());
        } else if (is_accepted(ia.verdict)) {
            ia.verdict = verdict::SystemError{"interactor tout: " + tout.error().message()};
        }
        return ia;
    }
};

} // namespace judgebox

#endif // JUDGEBOX_CORE_INTERACTOR_H
