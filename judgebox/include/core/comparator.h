/**
 * @file comparator.h
 * @brief 输出比较
 *
 * 纯函数，不读写文件，不重新运行程序。
 */

#ifndef JUDGEBOX_CORE_COMPARATOR_H
#define JUDGEBOX_CORE_COMPARATOR_H

#include <string>
#include <vector>
#include <algorithm>
#include <optional>

namespace judgebox {

/**
 * @brief 比较方式
 */
enum class CompareMode {
    Exact,   ///< 逐字节
    Tokens,  ///< 按空白切分后逐 token 比较
    Lines    ///< 逐行比较，忽略行末空白与末尾空行
};

inline const char* compare_mode_str(CompareMode mode) {
    switch (mode) {
        case CompareMode::Exact:  return "exact";
        case CompareMode::Tokens: return "tokens";
        case CompareMode::Lines:  return "lines";
    }
    return "?";
}

inline std::optional<CompareMode> parse_compare_mode(const std::string &s) {
    if (s == "exact") return CompareMode::Exact;
    if (s == "tokens" || s == "token") return CompareMode::Tokens;
    if (s == "lines" || s == "line") return CompareMode::Lines;
    return std::nullopt;
}

/**
 * @brief 比较结果；不一致时 detail 给出第一处差异
 */
struct CompareResult {
    bool same = true;
    std::string detail;

    static CompareResult ok() { return CompareResult(); }
    static CompareResult differ(const std::string &d) {
        CompareResult r;
        r.same = false;
        r.detail = d;
        return r;
    }
};

namespace detail {

inline bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

inline std::string shorten(const std::string &s, size_t len = 32) {
    if (s.size() <= len) return s;
    return s.substr(0, len) + "...";
}

inline std::vector<std::string> split_tokens(const std::string &s) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_blank(s[i])) i++;
        size_t j = i;
        while (j < s.size() && !is_blank(s[j])) j++;
        if (j > i) out.push_back(s.substr(i, j - i));
        i = j;
    }
    return out;
}

/// 切行并去掉每行行末空白，再去掉末尾的空行
inline std::vector<std::string> split_trimmed_lines(const std::string &s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t nl = s.find('\n', start);
        size_t end = nl == std::string::npos ? s.size() : nl;
        std::string line = s.substr(start, end - start);
        while (!line.empty() && is_blank(line.back())) line.pop_back();
        out.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    while (!out.empty() && out.back().empty()) out.pop_back();
    return out;
}

} // namespace detail

inline CompareResult compare_exact(const std::string &output, const std::string &expected) {
    if (output == expected) return CompareResult::ok();
    size_t i = 0;
    while (i < output.size() && i < expected.size() && output[i] == expected[i]) i++;
    return CompareResult::differ("differ at byte " + std::to_string(i) +
                                 " (output " + std::to_string(output.size()) +
                                 " bytes, expected " + std::to_string(expected.size()) + ")");
}

inline CompareResult compare_tokens(const std::string &output, const std::string &expected) {
    auto out = detail::split_tokens(output);
    auto exp = detail::split_tokens(expected);
    size_t n = std::min(out.size(), exp.size());
    for (size_t i = 0; i < n; i++) {
        if (out[i] != exp[i]) {
            return CompareResult::differ("token " + std::to_string(i + 1) + ": read '" +
                                         detail::shorten(out[i]) + "', expected '" +
                                         detail::shorten(exp[i]) + "'");
        }
    }
    if (out.size() != exp.size()) {
        return CompareResult::differ("read " + std::to_string(out.size()) +
                                     " tokens, expected " + std::to_string(exp.size()));
    }
    return CompareResult::ok();
}

inline CompareResult compare_lines(const std::string &output, const std::string &expected) {
    auto out = detail::split_trimmed_lines(output);
    auto exp = detail::split_trimmed_lines(expected);
    size_t n = std::min(out.size(), exp.size());
    for (size_t i = 0; i < n; i++) {
        if (out[i] != exp[i]) {
            return CompareResult::differ("line " + std::to_string(i + 1) + ": read '" +
                                         detail::shorten(out[i]) + "', expected '" +
                                         detail::shorten(exp[i]) + "'");
        }
    }
    if (out.size() != exp.size()) {
        return CompareResult::differ("read " + std::to_string(out.size()) +
                                     " lines, expected " + std::to_string(exp.size()));
    }
    return CompareResult::ok();
}

inline CompareResult compare_output(const std::string &output, const std::string &expected,
                                    CompareMode mode) {
    switch (mode) {
        case CompareMode::Exact:  return compare_exact(output, expected);
        case CompareMode::Tokens: return compare_tokens(output, expected);
        case CompareMode::Lines:  return compare_lines(output, expected);
    }
    return compare_exact(output, expected);
}

} // namespace judgebox

#endif // JUDGEBOX_CORE_COMPARATOR_H
