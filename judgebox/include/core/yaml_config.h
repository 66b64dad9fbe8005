/**
 * @file yaml_config.h
 * @brief 轻量级 YAML 配置解析器
 *
 * 支持的 YAML 子集：
 * - 键值对、嵌套对象
 * - 列表（流式和块式，块式列表项可以是对象）
 * - 注释
 * - 字符串（带引号和不带引号）
 *
 * 评测配置和提交描述都很小，不引入完整的 YAML 库。
 */

#ifndef JUDGEBOX_CORE_YAML_CONFIG_H
#define JUDGEBOX_CORE_YAML_CONFIG_H

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <variant>
#include <memory>
#include <cerrno>
#include <cstdlib>
#include <cstdint>

#include "core/error.h"

namespace judgebox {
namespace yaml {

class YamlNode;
using YamlNodePtr = std::shared_ptr<YamlNode>;
using YamlMap = std::map<std::string, YamlNodePtr>;
using YamlList = std::vector<YamlNodePtr>;
using YamlValue = std::variant<std::monostate, std::string, int64_t, double, bool, YamlMap, YamlList>;

/**
 * @brief 严格解析整数，整个字符串都必须是数字
 */
inline bool parse_int64(const std::string &s, int64_t &out) {
    if (s.empty()) return false;
    errno = 0;
    char *end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

inline bool parse_double(const std::string &s, double &out) {
    if (s.empty()) return false;
    errno = 0;
    char *end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

class YamlNode {
public:
    YamlValue value;

    YamlNode() : value(std::monostate{}) {}
    explicit YamlNode(const std::string& s) : value(s) {}
    explicit YamlNode(int64_t i) : value(i) {}
    explicit YamlNode(double d) : value(d) {}
    explicit YamlNode(bool b) : value(b) {}
    explicit YamlNode(const YamlMap& m) : value(m) {}
    explicit YamlNode(const YamlList& l) : value(l) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(value); }
    bool is_string() const { return std::holds_alternative<std::string>(value); }
    bool is_int() const { return std::holds_alternative<int64_t>(value); }
    bool is_double() const { return std::holds_alternative<double>(value); }
    bool is_bool() const { return std::holds_alternative<bool>(value); }
    bool is_map() const { return std::holds_alternative<YamlMap>(value); }
    bool is_list() const { return std::holds_alternative<YamlList>(value); }
    bool is_scalar() const { return is_string() || is_int() || is_double() || is_bool(); }

    std::string as_string(const std::string& def = "") const {
        if (is_string()) return std::get<std::string>(value);
        if (is_int()) return std::to_string(std::get<int64_t>(value));
        if (is_double()) {
            std::ostringstream oss;
            oss << std::get<double>(value);
            return oss.str();
        }
        if (is_bool()) return std::get<bool>(value) ? "true" : "false";
        return def;
    }

    int64_t as_int(int64_t def = 0) const {
        if (is_int()) return std::get<int64_t>(value);
        if (is_double()) return static_cast<int64_t>(std::get<double>(value));
        if (is_string()) {
            int64_t v;
            return parse_int64(std::get<std::string>(value), v) ? v : def;
        }
        return def;
    }

    bool as_bool(bool def = false) const {
        if (is_bool()) return std::get<bool>(value);
        if (is_string()) {
            auto s = std::get<std::string>(value);
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
            if (s == "false" || s == "no" || s == "off" || s == "0") return false;
            return def;
        }
        if (is_int()) return std::get<int64_t>(value) != 0;
        return def;
    }

    const YamlMap& as_map() const {
        static const YamlMap empty;
        return is_map() ? std::get<YamlMap>(value) : empty;
    }

    const YamlList& as_list() const {
        static const YamlList empty;
        return is_list() ? std::get<YamlList>(value) : empty;
    }

    YamlNodePtr get(const std::string& key) const {
        if (!is_map()) return nullptr;
        auto& m = std::get<YamlMap>(value);
        auto it = m.find(key);
        return it != m.end() ? it->second : nullptr;
    }

    YamlNodePtr get(size_t index) const {
        if (!is_list()) return nullptr;
        auto& l = std::get<YamlList>(value);
        return index < l.size() ? l[index] : nullptr;
    }

    // 路径访问，如 "limits.run.cpu_time_ms"
    YamlNodePtr operator[](const std::string& path) const {
        size_t pos = path.find('.');
        if (pos == std::string::npos) {
            return get(path);
        }
        auto child = get(path.substr(0, pos));
        if (!child) return nullptr;
        return (*child)[path.substr(pos + 1)];
    }

    std::vector<std::string> as_string_list() const {
        std::vector<std::string> result;
        if (is_list()) {
            for (const auto& item : std::get<YamlList>(value)) {
                result.push_back(item->as_string());
            }
        } else if (is_scalar()) {
            result.push_back(as_string());
        }
        return result;
    }
};

//==============================================================================
// 便捷取值（路径不存在时返回默认值）
//==============================================================================

inline std::string get_str(const YamlNode &root, const std::string &path, const std::string &def = "") {
    auto n = root[path];
    return n ? n->as_string(def) : def;
}

//==============================================================================
// YAML 解析器
//==============================================================================

class YamlParser {
private:
    std::vector<std::string> lines_;
    size_t current_line_ = 0;

    static std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    static size_t get_indent(const std::string& line) {
        size_t indent = 0;
        for (char c : line) {
            if (c == ' ') indent++;
            else if (c == '\t') indent += 2;
            else break;
        }
        return indent;
    }

    static std::string remove_comment(const std::string& line) {
        bool in_string = false;
        char quote_char = 0;
        for (size_t i = 0; i < line.size(); i++) {
            if (!in_string && (line[i] == '"' || line[i] == '\'')) {
                in_string = true;
                quote_char = line[i];
            } else if (in_string && line[i] == quote_char) {
                in_string = false;
            } else if (!in_string && line[i] == '#' &&
                       (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
                return line.substr(0, i);
            }
        }
        return line;
    }

    static std::string unquote(const std::string& s) {
        if (s.size() >= 2) {
            if ((s.front() == '"' && s.back() == '"') ||
                (s.front() == '\'' && s.back() == '\'')) {
                std::string inner = s.substr(1, s.size() - 2);
                if (s.front() == '\'') return inner;
                // 双引号内支持常用转义
                std::string out;
                for (size_t i = 0; i < inner.size(); i++) {
                    if (inner[i] == '\\' && i + 1 < inner.size()) {
                        char c = inner[++i];
                        switch (c) {
                            case 'n': out += '\n'; break;
                            case 't': out += '\t'; break;
                            case '\\': out += '\\'; break;
                            case '"': out += '"'; break;
                            default: out += '\\'; out += c;
                        }
                    } else {
                        out += inner[i];
                    }
                }
                return out;
            }
        }
        return s;
    }

    /**
     * @brief 找到键值分隔符 ": "（或行尾的 ":"），跳过引号内部
     */
    static size_t find_key_colon(const std::string& s) {
        bool in_string = false;
        char quote_char = 0;
        for (size_t i = 0; i < s.size(); i++) {
            char c = s[i];
            if (!in_string && (c == '"' || c == '\'')) {
                in_string = true;
                quote_char = c;
            } else if (in_string && c == quote_char) {
                in_string = false;
            } else if (!in_string && c == ':' &&
                       (i + 1 == s.size() || s[i + 1] == ' ' || s[i + 1] == '\t')) {
                return i;
            }
        }
        return std::string::npos;
    }

    static YamlNodePtr parse_scalar(const std::string& s) {
        std::string value = trim(s);

        if (value.empty() || value == "~" || value == "null") {
            return std::make_shared<YamlNode>();
        }

        if ((value.front() == '"' && value.back() == '"' && value.size() >= 2) ||
            (value.front() == '\'' && value.back() == '\'' && value.size() >= 2)) {
            return std::make_shared<YamlNode>(unquote(value));
        }

        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "yes") {
            return std::make_shared<YamlNode>(true);
        }
        if (lower == "false" || lower == "no") {
            return std::make_shared<YamlNode>(false);
        }

        int64_t i;
        if (parse_int64(value, i)) {
            return std::make_shared<YamlNode>(i);
        }
        double d;
        if (value.find('.') != std::string::npos && parse_double(value, d)) {
            return std::make_shared<YamlNode>(d);
        }

        return std::make_shared<YamlNode>(value);
    }

    // 流式列表 [a, b, c]（不处理嵌套）
    static YamlNodePtr parse_flow_list(const std::string& s) {
        YamlList list;
        std::string content = trim(s.substr(1, s.size() - 2));
        if (content.empty()) {
            return std::make_shared<YamlNode>(list);
        }
        std::stringstream ss(content);
        std::string item;
        while (std::getline(ss, item, ',')) {
            list.push_back(parse_scalar(trim(item)));
        }
        return std::make_shared<YamlNode>(list);
    }

    // 流式 map {a: 1, b: 2}
    static YamlNodePtr parse_flow_map(const std::string& s) {
        YamlMap map;
        std::string content = trim(s.substr(1, s.size() - 2));
        if (content.empty()) {
            return std::make_shared<YamlNode>(map);
        }
        std::stringstream ss(content);
        std::string pair;
        while (std::getline(ss, pair, ',')) {
            size_t colon = pair.find(':');
            if (colon != std::string::npos) {
                std::string key = trim(pair.substr(0, colon));
                std::string val = trim(pair.substr(colon + 1));
                map[unquote(key)] = parse_scalar(val);
            }
        }
        return std::make_shared<YamlNode>(map);
    }

    YamlNodePtr parse_value(const std::string& s) {
        std::string value = trim(s);
        if (value.empty()) {
            return std::make_shared<YamlNode>();
        }
        if (value.front() == '[' && value.back() == ']') {
            return parse_flow_list(value);
        }
        if (value.front() == '{' && value.back() == '}') {
            return parse_flow_map(value);
        }
        return parse_scalar(value);
    }

    /**
     * @brief 解析 "key: value" 中的值部分；值为空时读取下一层缩进块
     */
    YamlNodePtr parse_entry_value(const std::string& val, size_t indent) {
        if (!val.empty()) {
            return parse_value(val);
        }
        // 下一行缩进更深才是子块，否则是 null
        size_t look = current_line_;
        while (look < lines_.size() && trim(remove_comment(lines_[look])).empty()) {
            look++;
        }
        if (look < lines_.size()) {
            std::string next = remove_comment(lines_[look]);
            size_t next_indent = get_indent(next);
            std::string next_trimmed = trim(next);
            // 允许 "key:\n- item" 这种与 key 同缩进的列表写法
            if (next_indent > indent || (next_indent == indent && next_trimmed[0] == '-')) {
                return parse_block(next_indent);
            }
        }
        return std::make_shared<YamlNode>();
    }

    YamlNodePtr parse_block(size_t base_indent) {
        YamlMap map;
        YamlList list;
        bool is_list_mode = false;

        while (current_line_ < lines_.size()) {
            std::string line = remove_comment(lines_[current_line_]);
            std::string trimmed = trim(line);

            if (trimmed.empty()) {
                current_line_++;
                continue;
            }

            size_t indent = get_indent(line);
            if (indent != base_indent) {
                break;
            }

            if (trimmed[0] == '-' && (trimmed.size() == 1 || trimmed[1] == ' ')) {
                if (!map.empty()) break;
                is_list_mode = true;
                std::string item_content = trim(trimmed.substr(1));
                // 列表项内容的实际缩进
                size_t item_indent = indent + (trimmed.size() - item_content.size());

                if (item_content.empty()) {
                    current_line_++;
                    list.push_back(parse_entry_value("", indent));
                } else if (find_key_colon(item_content) != std::string::npos &&
                           item_content.front() != '"' && item_content.front() != '\'' &&
                           item_content.front() != '{') {
                    // 列表项是 map：把 "- " 替换为空格后按普通块解析
                    lines_[current_line_] = std::string(item_indent, ' ') + item_content;
                    list.push_back(parse_block(item_indent));
                } else {
                    current_line_++;
                    list.push_back(parse_value(item_content));
                }
            } else {
                if (is_list_mode) break;
                size_t colon = find_key_colon(trimmed);
                current_line_++;
                if (colon == std::string::npos) {
                    continue;
                }
                std::string key = unquote(trim(trimmed.substr(0, colon)));
                std::string val = trim(trimmed.substr(colon + 1));
                map[key] = parse_entry_value(val, indent);
            }
        }

        if (is_list_mode) {
            return std::make_shared<YamlNode>(list);
        }
        return std::make_shared<YamlNode>(map);
    }

public:
    YamlNodePtr parse(const std::string& content) {
        lines_.clear();
        current_line_ = 0;

        std::istringstream iss(content);
        std::string line;
        while (std::getline(iss, line)) {
            lines_.push_back(line);
        }

        // 跳过开头的空行以确定根缩进
        size_t first = 0;
        while (first < lines_.size() && trim(remove_comment(lines_[first])).empty()) {
            first++;
        }
        if (first == lines_.size()) {
            return std::make_shared<YamlNode>(YamlMap{});
        }
        return parse_block(get_indent(lines_[first]));
    }

    static Result<YamlNodePtr> load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return Err<YamlNodePtr>(ErrorCode::FILE_NOT_FOUND, "Cannot open file: " + filename);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        YamlParser parser;
        return Ok(parser.parse(buffer.str()));
    }
};

inline Result<YamlNodePtr> load_yaml(const std::string& filename) {
    return YamlParser::load(filename);
}

inline YamlNodePtr parse_yaml(const std::string& content) {
    YamlParser parser;
    return parser.parse(content);
}

} // namespace yaml
} // namespace judgebox

#endif // JUDGEBOX_CORE_YAML_CONFIG_H
