/**
 * @file result.h
 * @brief 评测报告输出
 *
 * 格式：
 *
 *   submission <id>
 *   result <简称>
 *   info <结论>
 *   time <最大 CPU 时间 ms>
 *   memory <最大内存 KiB>
 *   details
 *   <tests>
 *   <test id="1" result="AC" info="Accepted" time="3" memory="1024" status="exited(0)">
 *   <out>...</out>
 *   </test>
 *   </tests>
 *
 * 编译错误和无法评测时 details 下是 <compile-error> 或 <error>。
 */

#ifndef JUDGEBOX_CORE_RESULT_H
#define JUDGEBOX_CORE_RESULT_H

#include <string>
#include <sstream>
#include <ostream>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/verdict.h"

namespace judgebox {

class JudgeReport {
private:
    const SubmissionJudgement &judgement_;
    size_t preview_len_ = 100;

public:
    explicit JudgeReport(const SubmissionJudgement &judgement) : judgement_(judgement) {}

    /**
     * @brief 每个测试点附带的输出预览长度，0 表示不输出
     */
    JudgeReport& preview_length(size_t len) {
        preview_len_ = len;
        return *this;
    }

    void write(std::ostream &os) const {
        const Verdict &overall = judgement_.overall;
        os << "submission " << judgement_.submission_id << "\n";
        os << "result " << verdict_code(overall) << "\n";
        os << "info " << verdict_to_string(overall) << "\n";
        os << "time " << judgement_.max_cpu_time_ms() << "\n";
        os << "memory " << judgement_.max_memory_bytes() / KiB << "\n";
        os << "details\n";

        if (auto ce = std::get_if<verdict::CompileError>(&overall)) {
            os << "<compile-error>" << htmlspecialchars(ce->diagnostic) << "</compile-error>\n";
            return;
        }
        if (judgement_.per_test.empty()) {
            if (auto se = std::get_if<verdict::SystemError>(&overall)) {
                os << "<error>" << htmlspecialchars(se->reason) << "</error>\n";
                return;
            }
        }

        os << "<tests>\n";
        for (const auto &t : judgement_.per_test) {
            os << "<test id=\"" << htmlspecialchars(t.test_id) << "\""
               << " result=\"" << verdict_code(t.verdict) << "\""
               << " info=\"" << htmlspecialchars(verdict_to_string(t.verdict)) << "\""
               << " time=\"" << t.outcome.cpu_time_used_ms << "\""
               << " memory=\"" << t.outcome.memory_peak_bytes / KiB << "\""
               << " status=\"" << htmlspecialchars(exit_status_to_string(t.outcome.exit_status)) << "\">\n";
            if (preview_len_ > 0) {
                os << "<out>" << htmlspecialchars(preview(t.outcome.stdout_data, preview_len_)) << "</out>\n";
            }
            os << "</test>\n";
        }
        os << "</tests>\n";
    }

    std::string str() const {
        std::ostringstream oss;
        write(oss);
        return oss.str();
    }

    Result<void> write_file(const std::string &path) const {
        return judgebox::write_file(path, str());
    }
};

inline std::ostream& operator<<(std::ostream &os, const JudgeReport &report) {
    report.write(os);
    return os;
}

} // namespace judgebox

#endif // JUDGEBOX_CORE_RESULT_H
