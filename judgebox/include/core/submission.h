/**
 * @file submission.h
 * @brief 提交与测试点描述
 *
 * 提交描述文件（submission.yml）示例：
 *
 *   id: 1024
 *   source: a.c              # 或 executable: a.out
 *   language: c
 *   checker: chk             # 可选，testlib 约定
 *   interactor: inter        # 可选，交互题
 *   limits: {cpu_time_ms: 2000, memory_mb: 128}
 *   tests:
 *     - {id: 1, input: 1.in, expected: 1.ans}
 *     - {id: 2, input: 2.in}
 *
 * 相对路径相对于描述文件所在目录。
 */

#ifndef JUDGEBOX_CORE_SUBMISSION_H
#define JUDGEBOX_CORE_SUBMISSION_H

#include <string>
#include <vector>
#include <optional>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/yaml_config.h"

namespace judgebox {

/**
 * @brief 测试数据：文件路径或内存中的字节
 */
struct TestData {
    enum class Kind { File, Bytes };
    Kind kind = Kind::Bytes;
    std::string path;
    std::string bytes;

    static TestData file(const std::string &p) {
        TestData d;
        d.kind = Kind::File;
        d.path = p;
        return d;
    }

    static TestData from_bytes(const std::string &b) {
        TestData d;
        d.kind = Kind::Bytes;
        d.bytes = b;
        return d;
    }

    Result<std::string> load() const {
        if (kind == Kind::Bytes) return bytes;
        return read_file(path);
    }

    StdinSource as_stdin() const {
        return kind == Kind::File ? StdinSource::file(path) : StdinSource::bytes(bytes);
    }
};

struct TestCase {
    std::string id;
    TestData input;
    std::optional<TestData> expected;   ///< 为空时不比较输出
};

struct Submission {
    std::string id;
    std::string source_path;       ///< 需要编译的源文件
    std::string executable_path;   ///< 已编译的程序；两者都给时优先编译
    std::string language;
    std::optional<ResourceLimits> limits;   ///< 覆盖配置中的 limits.run
    std::vector<std::string> args;          ///< 追加在 argv[0] 之后
    std::string checker_path;               ///< 为空时使用内置比较
    std::string interactor_path;            ///< 非空时为交互题

    bool interactive() const { return !interactor_path.empty(); }
};

/**
 * @brief 一次评测请求
 */
struct JudgeRequest {
    Submission submission;
    std::vector<TestCase> tests;
    std::optional<CompileStep> compile;
};

//==============================================================================
// 提交描述文件
//==============================================================================

namespace submission_detail {

inline std::string resolve(const std::string &base_dir, const std::string &path) {
    if (path.empty() || path[0] == '/' || base_dir.empty()) return path;
    return base_dir + "/" + path;
}

} // namespace submission_detail

/**
 * @brief 解析提交描述
 * @param base_dir 相对路径的基准目录
 */
inline Result<JudgeRequest> parse_request(const yaml::YamlNode &root, const std::string &base_dir) {
    using submission_detail::resolve;
    JudgeRequest req;
    Submission &sub = req.submission;

    sub.id = yaml::get_str(root, "id");
    if (sub.id.empty()) {
        return JUDGEBOX_ERROR(ErrorCode::CONFIG_MISSING_KEY, "submission: missing 'id'");
    }
    sub.source_path = resolve(base_dir, yaml::get_str(root, "source"));
    sub.executable_path = resolve(base_dir, yaml::get_str(root, "executable"));
    if (sub.source_path.empty() && sub.executable_path.empty()) {
        return JUDGEBOX_ERROR(ErrorCode::CONFIG_MISSING_KEY,
            "submission " + sub.id + ": needs 'source' or 'executable'");
    }
    sub.language = yaml::get_str(root, "language");
    sub.checker_path = resolve(base_dir, yaml::get_str(root, "checker"));
    sub.interactor_path = resolve(base_dir, yaml::get_str(root, "interactor"));
    if (auto args = root["args"]) {
        sub.args = args->as_string_list();
    }
    if (auto lim = root["limits"]) {
        JUDGEBOX_TRY_UNWRAP(parsed, config_detail::parse_limits(lim, "limits", limits::DEFAULT));
        sub.limits = parsed;
    }

    auto tests = root["tests"];
    if (tests && !tests->is_list()) {
        return JUDGEBOX_ERROR(ErrorCode::CONFIG_INVALID_VALUE, "submission: 'tests' must be a list");
    }
    if (tests) {
        const auto &list = tests->as_list();
        for (size_t i = 0; i < list.size(); i++) {
            const auto &node = *list[i];
            TestCase tc;
            tc.id = yaml::get_str(node, "id", std::to_string(i + 1));
            std::string input = yaml::get_str(node, "input");
            if (input.empty()) {
                return JUDGEBOX_ERROR(ErrorCode::CONFIG_MISSING_KEY,
                    "submission: test " + tc.id + " has no 'input'");
            }
            tc.input = TestData::file(resolve(base_dir, input));
            std::string expected = yaml::get_str(node, "expected");
            if (!expected.empty()) {
                tc.expected = TestData::file(resolve(base_dir, expected));
            }
            req.tests.push_back(tc);
        }
    }
    return req;
}

inline Result<JudgeRequest> load_request(const std::string &path) {
    auto root = yaml::load_yaml(path);
    if (!root.ok()) {
        return root.error();
    }
    // 沙箱先 chdir 再 execve，路径必须是绝对的
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) {
        return JUDGEBOX_ERROR(ErrorCode::FILE_NOT_FOUND, "cannot resolve " + path + ": " + ec.message());
    }
    auto req = parse_request(*root.value(), abs.parent_path().string());
    if (!req.ok()) {
        return Error(req.error()).with_context(path);
    }
    return req;
}

} // namespace judgebox

#endif // JUDGEBOX_CORE_SUBMISSION_H
