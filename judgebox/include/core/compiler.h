/**
 * @file compiler.h
 * @brief 编译步骤
 *
 * 编译器同样在沙箱里运行（默认 compiler 策略），工作目录是一个独占的临时目录，
 * 写文件被 Landlock 限制在该目录内。编译失败不重试。
 */

#ifndef JUDGEBOX_CORE_COMPILER_H
#define JUDGEBOX_CORE_COMPILER_H

#include <string>
#include <vector>
#include <map>
#include <optional>

#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/verdict.h"
#include "core/classifier.h"
#include "core/runner.h"
#include "core/judger_logger.h"
#include "sandbox/scratch_dir.h"

namespace judgebox {

/**
 * @brief 编译结果
 */
struct CompileResult {
    bool succeeded = false;
    std::string artifact_path;
    std::string log;                  ///< 编译器输出（截断）
    std::optional<Verdict> failure;   ///< CompileError 或 SystemError
    RunOutcome outcome;

    static CompileResult failed(Verdict v, const std::string &log = "") {
        CompileResult r;
        r.failure = std::move(v);
        r.log = log;
        return r;
    }
};

class Compiler {
private:
    const Runner &runner_;

    static constexpr size_t kLogTail = 4096;

    static std::string compiler_output(const RunOutcome &o) {
        if (!o.stderr_data.empty() && !o.stdout_data.empty()) {
            return o.stdout_data + o.stderr_data;
        }
        return o.stderr_data.empty() ? o.stdout_data : o.stderr_data;
    }

public:
    explicit Compiler(const Runner &runner) : runner_(runner) {}

    /**
     * @brief 编译源代码
     * @param dir 编译目录，产物留在这里，调用方负责它的生命周期
     */
    CompileResult compile(const std::string &source_path, const CompileStep &step,
                          const sandbox::ScratchDir &dir,
                          const CancellationToken *cancel = nullptr) const {
        std::string source = dir.file(base_name(source_path));
        std::string output = dir.file(step.output_name);

        auto copied = copy_file(source_path, source);
        if (!copied.ok()) {
            return CompileResult::failed(verdict::SystemError{"source: " + copied.error().message()});
        }

        // 替换占位符
        std::map<std::string, std::string> vars = {
            {"source", source},
            {"output", output},
            {"workdir", dir.path()},
        };
        auto args = split_command(expand_template(step.command, vars));
        if (!args.ok() || args.value().empty()) {
            return CompileResult::failed(verdict::SystemError{
                "compile command: " + (args.ok() ? std::string("empty") : args.error().message())});
        }

        auto path_it = runner_.options().env.find("PATH");
        std::string search = path_it != runner_.options().env.end() ? path_it->second : "/usr/bin:/bin";
        std::string compiler = find_executable(args.value()[0], search);
        if (compiler.empty()) {
            return CompileResult::failed(verdict::SystemError{"compiler not found: " + args.value()[0]});
        }

        SandboxSpec spec = runner_.make_spec(compiler, dir.path(), step.limits, step.policy);
        spec.argv = args.value();
        spec.env["TMPDIR"] = dir.path();

        CLOG_DEBUG << "compile: " << step.command << " in " << dir.path();
        RunOutcome outcome = runner_.execute(spec, cancel);
        CLOG_DEBUG << "compiler finished: " << outcome;

        CompileResult res;
        res.outcome = outcome;
        res.log = tail(compiler_output(outcome), kLogTail);

        if (auto bad = check_outcome(outcome, step.limits)) {
            res.failure = std::visit(detail::overloaded{
                [&](const verdict::SystemError &e) -> Verdict { return e; },
                [&](const verdict::SecurityViolation &v) -> Verdict {
                    return verdict::CompileError{"Compiler Dangerous Syscalls (" +
                        (v.syscall_nr >= 0 ? syscall_nr_to_name(v.syscall_nr) : std::string("?")) + ")"};
                },
                [&](const verdict::TimeLimitExceeded &) -> Verdict {
                    return verdict::CompileError{"Compiler Time Limit Exceeded"};
                },
                [&](const verdict::MemoryLimitExceeded &) -> Verdict {
                    return verdict::CompileError{"Compiler Memory Limit Exceeded"};
                },
                [&](const verdict::OutputLimitExceeded &) -> Verdict {
                    return verdict::CompileError{"Compiler Output Limit Exceeded"};
                },
                [&](const verdict::RuntimeError &r) -> Verdict {
                    // 编译器退出码非零是正常的（表示编译失败）
                    if (!res.log.empty()) return verdict::CompileError{res.log};
                    if (r.signal) {
                        return verdict::CompileError{"Compiler killed by signal " + std::to_string(*r.signal)};
                    }
                    return verdict::CompileError{"Compile failed with exit code " +
                        std::to_string(r.exit_code.value_or(-1))};
                },
                [&](const auto &v) -> Verdict { return v; },
            }, *bad);
            return res;
        }

        if (!file_exists(output)) {
            res.failure = verdict::CompileError{"Compiler produced no output file " + step.output_name};
            return res;
        }

        res.succeeded = true;
        res.artifact_path = output;
        return res;
    }
};

} // namespace judgebox

#endif // JUDGEBOX_CORE_COMPILER_H
