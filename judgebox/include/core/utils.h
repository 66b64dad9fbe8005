/**
 * @file utils.h
 * @brief 工具函数
 *
 * 包含各种辅助函数：
 * - 文件读写与复制
 * - 命令模板展开与拆分
 * - 字符串预览与转义
 */

#ifndef JUDGEBOX_CORE_UTILS_H
#define JUDGEBOX_CORE_UTILS_H

#include <string>
#include <vector>
#include <map>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <system_error>
#include <cstring>
#include <cstdlib>
#include <unistd.h>

#include "core/error.h"

namespace judgebox {

namespace fs = std::filesystem;

//==============================================================================
// 文件操作
//==============================================================================

inline bool file_exists(const std::string &path) {
    return access(path.c_str(), F_OK) == 0;
}

/**
 * @brief 读取整个文件（二进制）
 */
inline Result<std::string> read_file(const std::string &path) {
    std::ifstream fin(path, std::ios::binary);
    if (!fin) {
        return JUDGEBOX_ERROR(ErrorCode::FILE_NOT_FOUND, "cannot open " + path);
    }
    std::ostringstream buf;
    buf << fin.rdbuf();
    if (fin.bad()) {
        return JUDGEBOX_ERROR(ErrorCode::FILE_READ_ERROR, "cannot read " + path);
    }
    return buf.str();
}

/**
 * @brief 覆盖写入文件
 */
inline Result<void> write_file(const std::string &path, const std::string &content) {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout) {
        return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR, "cannot open " + path + " for writing");
    }
    fout.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!fout) {
        return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR, "cannot write " + path);
    }
    return Ok();
}

/**
 * @brief 复制文件，目标已存在时覆盖
 * @param executable 为 true 时给目标加上所有者可执行位
 */
inline Result<void> copy_file(const std::string &from, const std::string &to, bool executable = false) {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
            "copy " + from + " -> " + to + ": " + ec.message());
    }
    if (executable) {
        fs::permissions(to, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                            fs::perms::others_read | fs::perms::others_exec,
                        fs::perm_options::replace, ec);
        if (ec) {
            return JUDGEBOX_ERROR(ErrorCode::FILE_PERMISSION_DENIED,
                "chmod " + to + ": " + ec.message());
        }
    }
    return Ok();
}

/**
 * @brief 路径的最后一段
 */
inline std::string base_name(const std::string &path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

/**
 * @brief 在 PATH（冒号分隔）中查找可执行文件；含 '/' 的名字原样检查
 * @return 找不到时返回空字符串
 */
inline std::string find_executable(const std::string &name, const std::string &search_path) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    std::istringstream ss(search_path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

//==============================================================================
// 命令模板
//==============================================================================

/**
 * @brief 替换 {name} 形式的占位符，未知占位符保持原样
 */
inline std::string expand_template(const std::string &tmpl, const std::map<std::string, std::string> &vars) {
    std::string out = tmpl;
    for (const auto &kv : vars) {
        std::string key = "{" + kv.first + "}";
        size_t pos = 0;
        while ((pos = out.find(key, pos)) != std::string::npos) {
            out.replace(pos, key.size(), kv.second);
            pos += kv.second.size();
        }
    }
    return out;
}

/**
 * @brief 按空白拆分命令行，支持单引号、双引号和反斜杠转义
 *
 * 不经过 shell，只是为了让配置文件里能写一整行命令。
 */
inline Result<std::vector<std::string>> split_command(const std::string &cmd) {
    std::vector<std::string> args;
    std::string cur;
    bool in_token = false;
    char quote = 0;

    for (size_t i = 0; i < cmd.size(); i++) {
        char c = cmd[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < cmd.size()) {
                cur += cmd[++i];
            } else {
                cur += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_token = true;
        } else if (c == '\\' && i + 1 < cmd.size()) {
            cur += cmd[++i];
            in_token = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (in_token) {
                args.push_back(cur);
                cur.clear();
                in_token = false;
            }
        } else {
            cur += c;
            in_token = true;
        }
    }
    if (quote) {
        return JUDGEBOX_ERROR(ErrorCode::CONFIG_INVALID_VALUE, "unterminated quote in: " + cmd);
    }
    if (in_token) {
        args.push_back(cur);
    }
    return args;
}

//==============================================================================
// 字符串处理
//==============================================================================

/**
 * @brief 保留末尾 len 字节，截断时在前面加 "..."
 */
inline std::string tail(const std::string &s, size_t len = 4096) {
    if (s.size() <= len) return s;
    return "..." + s.substr(s.size() - len);
}

/**
 * @brief 保留开头 len 字节，截断时在后面加 "..."
 */
inline std::string preview(const std::string &s, size_t len = 100) {
    if (s.size() <= len) return s;
    return s.substr(0, len) + "...";
}

/**
 * @brief HTML 特殊字符转义
 */
inline std::string htmlspecialchars(const std::string &s) {
    std::string r;
    for (size_t i = 0; i < s.length(); i++) {
        switch (s[i]) {
            case '&':  r += "&amp;"; break;
            case '<':  r += "&lt;"; break;
            case '>':  r += "&gt;"; break;
            case '"':  r += "&quot;"; break;
            case '\0': r += "<b>\\0</b>"; break;
            default:   r += s[i]; break;
        }
    }
    return r;
}

} // namespace judgebox

#endif // JUDGEBOX_CORE_UTILS_H
