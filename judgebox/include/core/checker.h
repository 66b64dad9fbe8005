/**
 * @file checker.h
 * @brief 自定义 checker
 *
 * testlib 约定：checker <input> <output> <answer>
 *   退出码 0       → Accepted
 *   退出码 1, 2, 4 → WrongAnswer（WA、PE、DIRT，stderr 作为说明）
 *   退出码 3 及其他 → SystemError（FAIL 表示题目数据或 checker 自身有错）
 */

#ifndef JUDGEBOX_CORE_CHECKER_H
#define JUDGEBOX_CORE_CHECKER_H

#include <string>

#include "core/types.h"
#include "core/utils.h"
#include "core/verdict.h"
#include "core/classifier.h"
#include "core/runner.h"
#include "core/submission.h"
#include "core/judger_logger.h"

namespace judgebox {

/**
 * @brief 按 testlib 退出码解释 checker 或交互器的一次运行
 * @param who  出错时写进说明的名字
 * @param info checker 的输出摘要
 */
inline Verdict testlib_verdict(const RunOutcome &run, const ResourceLimits &limits,
                               const std::string &who, const std::string &info) {
    if (auto err = std::get_if<outcome::SupervisorError>(&run.exit_status)) {
        return verdict::SystemError{who + ": " + err->reason};
    }
    auto bad = check_outcome(run, limits);
    if (!bad) {
        return verdict::Accepted{};
    }
    auto re = std::get_if<verdict::RuntimeError>(&*bad);
    if (re && re->exit_code) {
        int code = *re->exit_code;
        if (code == 1 || code == 2 || code == 4) {
            return verdict::WrongAnswer{info};
        }
    }
    return verdict::SystemError{who + " " + verdict_to_string(*bad) +
                                (info.empty() ? std::string() : ": " + info)};
}

/**
 * @brief checker 运行参数
 */
struct CheckerSpec {
    std::string path;
    ResourceLimits limits = limits::CHECKER;
    SyscallPolicy policy = policies::judge_policy();
};

class Checker {
private:
    const Runner &runner_;
    CheckerSpec spec_;

    static constexpr size_t kInfoLen = 512;

public:
    Checker(const Runner &runner, CheckerSpec spec)
        : runner_(runner), spec_(std::move(spec)) {}

    /**
     * @brief 运行 checker
     * @param work_dir 测试点的临时目录，输入/输出/答案文件写在这里
     * @param input    测试输入
     * @param output   选手输出
     * @param answer   标准答案（测试点没有时为空串）
     */
    Verdict check(const std::string &work_dir, const TestData &input,
                  const std::string &output, const std::string &answer,
                  const CancellationToken *cancel = nullptr) const {
        std::string input_path = input.path;
        if (input.kind == TestData::Kind::Bytes) {
            input_path = work_dir + "/input.txt";
            auto w = write_file(input_path, input.bytes);
            if (!w.ok()) return verdict::SystemError{"checker input: " + w.error().message()};
        }
        std::string output_path = work_dir + "/output.txt";
        std::string answer_path = work_dir + "/answer.txt";
        auto w1 = write_file(output_path, output);
        if (!w1.ok()) return verdict::SystemError{"checker output: " + w1.error().message()};
        auto w2 = write_file(answer_path, answer);
        if (!w2.ok()) return verdict::SystemError{"checker answer: " + w2.error().message()};

        SandboxSpec spec = runner_.make_spec(spec_.path, work_dir, spec_.limits, spec_.policy);
        spec.argv = {spec_.path, input_path, output_path, answer_path};

        RunOutcome run = runner_.execute(spec, cancel);
        std::string info = preview(run.stderr_data.empty() ? run.stdout_data : run.stderr_data, kInfoLen);
        TLOG_DEBUG << "checker " << run << ": " << info;

        return testlib_verdict(run, spec_.limits, "checker", info);
    }
};

} // namespace judgebox

#endif // JUDGEBOX_CORE_CHECKER_H
