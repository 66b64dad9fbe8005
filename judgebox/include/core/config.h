/**
 * @file config.h
 * @brief 评测机配置
 *
 * 从 YAML 读取评测池、判定、沙箱、资源限制、syscall 策略、编译命令和日志配置。
 * 配置只在启动时读一次，解析结果显式传给各个组件，不存在进程级的可变全局配置。
 *
 * 示例：
 *
 *   pool:
 *     workers: 4
 *     run_slots: 8
 *     test_concurrency: 1
 *   judge:
 *     short_circuit: true
 *     comparison: tokens
 *     interactor_policy: interactor
 *   sandbox:
 *     scratch_root: /tmp/judgebox
 *     env: {PATH: /usr/bin:/bin}
 *   limits:
 *     run: {cpu_time_ms: 1000, memory_mb: 256}
 *     compile: {cpu_time_ms: 10000, memory_mb: 1024, max_processes: 64}
 *     interactor: {cpu_time_ms: 5000, memory_mb: 256}
 *   policies:
 *     judge_no_dup:
 *       base: judge
 *       rules:
 *         - {syscall: dup, action: deny, errno: 1}
 *   compile:
 *     command: /usr/bin/gcc -O2 -o {output} {source} -lm
 *     policy: compiler
 *   log:
 *     level: info
 *     dir: /var/log/judgebox
 */

#ifndef JUDGEBOX_CORE_CONFIG_H
#define JUDGEBOX_CORE_CONFIG_H

#include <string>
#include <map>
#include <optional>
#include <thread>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

#include "core/error.h"
#include "core/types.h"
#include "core/syscall_policy.h"
#include "core/syscall_map.h"
#include "core/comparator.h"
#include "core/yaml_config.h"
#include "core/judger_logger.h"

namespace judgebox {

/**
 * @brief 评测池规模
 */
struct PoolOptions {
    size_t workers = 1;            ///< 同时评测的提交数
    size_t run_slots = 0;          ///< 同时运行的沙箱数；0 表示按 CPU 核数
    size_t test_concurrency = 1;   ///< 单个提交内并行的测试点数

    size_t effective_run_slots() const {
        if (run_slots > 0) return run_slots;
        unsigned n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }
};

/**
 * @brief 每次沙箱运行共用的宿主侧设置
 */
struct SandboxOptions {
    std::string scratch_root = "/tmp/judgebox";
    bool use_cgroup = true;
    bool report_syscalls = true;
    std::map<std::string, std::string> env = {{"PATH", "/usr/bin:/bin"}};
};

/**
 * @brief 判定设置
 */
struct JudgeOptions {
    bool short_circuit = true;
    CompareMode comparison = CompareMode::Tokens;
    size_t test_concurrency = 1;
    ResourceLimits run_limits = limits::DEFAULT;
    ResourceLimits checker_limits = limits::CHECKER;
    ResourceLimits interactor_limits = limits::CHECKER;   ///< 墙钟时间另加用户程序的
    SyscallPolicy run_policy = policies::judge_policy();
    SyscallPolicy checker_policy = policies::judge_policy();
    SyscallPolicy interactor_policy = policies::interactor_policy();
};

/**
 * @brief 编译步骤
 *
 * command 中可用的占位符：{source} 源文件、{output} 产物、{workdir} 编译目录。
 */
struct CompileStep {
    std::string command;
    ResourceLimits limits = limits::COMPILER;
    SyscallPolicy policy = policies::compiler_policy();
    std::string output_name = "main";
};

//==============================================================================
// 解析辅助
//==============================================================================

namespace config_detail {

inline Error invalid(const std::string &path, const std::string &what) {
    return JUDGEBOX_ERROR(ErrorCode::CONFIG_INVALID_VALUE, path + ": " + what);
}

/**
 * @brief 非负整数；接受十进制、0x 十六进制
 */
inline Result<uint64_t> parse_u64(const yaml::YamlNode &node, const std::string &path) {
    if (node.is_int()) {
        int64_t v = std::get<int64_t>(node.value);
        if (v < 0) return invalid(path, "must not be negative");
        return static_cast<uint64_t>(v);
    }
    if (node.is_string()) {
        const std::string &s = std::get<std::string>(node.value);
        if (s.empty() || s[0] == '-') return invalid(path, "expected a non-negative integer");
        errno = 0;
        char *end = nullptr;
        unsigned long long v = std::strtoull(s.c_str(), &end, 0);
        if (errno != 0 || end != s.c_str() + s.size()) {
            return invalid(path, "expected a non-negative integer, got '" + s + "'");
        }
        return static_cast<uint64_t>(v);
    }
    return invalid(path, "expected a non-negative integer");
}

/**
 * @brief 资源限制的单个值：0 或 unbounded 表示不限制
 */
inline Result<uint64_t> parse_limit_value(const yaml::YamlNode &node, const std::string &path) {
    if (node.is_string()) {
        std::string s = std::get<std::string>(node.value);
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (s == "unbounded" || s == "unlimited") return kUnbounded;
    }
    return parse_u64(node, path);
}

inline Result<size_t> parse_count(const yaml::YamlNode &root, const std::string &key, size_t def) {
    auto n = root[key];
    if (!n) return def;
    JUDGEBOX_TRY_UNWRAP(v, parse_u64(*n, key));
    return static_cast<size_t>(v);
}

inline Result<bool> parse_flag(const yaml::YamlNode &root, const std::string &key, bool def) {
    auto n = root[key];
    if (!n) return def;
    if (n->is_bool()) return std::get<bool>(n->value);
    if (n->is_string() || n->is_int()) {
        // as_bool 无法识别时两个默认值给出不同结果
        bool a = n->as_bool(true);
        bool b = n->as_bool(false);
        if (a == b) return a;
    }
    return invalid(key, "expected a boolean");
}

/**
 * @brief 解析一个 limits.<name> 块，缺省的字段取 defaults
 */
inline Result<ResourceLimits> parse_limits(const yaml::YamlNodePtr &node, const std::string &path,
                                           const ResourceLimits &defaults) {
    ResourceLimits out = defaults;
    if (!node) return out;
    if (!node->is_map()) return invalid(path, "expected a mapping");

    for (const auto &kv : node->as_map()) {
        const std::string &key = kv.first;
        std::string where = path + "." + key;
        JUDGEBOX_TRY_UNWRAP(v, parse_limit_value(*kv.second, where));
        if (key == "cpu_time_ms") {
            out.cpu_time_ms = v;
        } else if (key == "wall_time_ms") {
            out.wall_time_ms = v;
        } else if (key == "memory_mb") {
            out.memory_bytes = v * MiB;
        } else if (key == "memory_bytes") {
            out.memory_bytes = v;
        } else if (key == "output_kb") {
            out.output_bytes = v * KiB;
        } else if (key == "output_bytes") {
            out.output_bytes = v;
        } else if (key == "max_processes") {
            out.max_processes = v;
        } else {
            return invalid(where, "unknown limit");
        }
    }
    return out;
}

inline Result<PolicyAction> parse_action(const std::string &s, const std::string &path) {
    if (s == "allow") return PolicyAction::Allow;
    if (s == "deny") return PolicyAction::Deny;
    if (s == "kill") return PolicyAction::Kill;
    return invalid(path, "unknown action '" + s + "' (allow | deny | kill)");
}

inline Result<ArgOp> parse_arg_op(const std::string &s, const std::string &path) {
    if (s == "eq" || s == "==") return ArgOp::EQ;
    if (s == "ne" || s == "!=") return ArgOp::NE;
    if (s == "lt" || s == "<") return ArgOp::LT;
    if (s == "le" || s == "<=") return ArgOp::LE;
    if (s == "gt" || s == ">") return ArgOp::GT;
    if (s == "ge" || s == ">=") return ArgOp::GE;
    if (s == "masked_eq") return ArgOp::MASKED_EQ;
    return invalid(path, "unknown argument operator '" + s + "'");
}

/**
 * @brief syscall 名称或编号
 */
inline Result<int> parse_syscall(const yaml::YamlNode &node, const std::string &path) {
    if (node.is_int()) {
        int64_t v = std::get<int64_t>(node.value);
        if (v < 0) return invalid(path, "syscall number must not be negative");
        return static_cast<int>(v);
    }
    std::string name = node.as_string();
    int nr = syscall_name_to_nr(name);
    if (nr < 0) return invalid(path, "unknown syscall '" + name + "'");
    return nr;
}

inline Result<int> parse_errno(const yaml::YamlNodePtr &node, const std::string &path, int def) {
    if (!node) return def;
    JUDGEBOX_TRY_UNWRAP(v, parse_u64(*node, path));
    if (v == 0 || v > 4095) return invalid(path, "errno must be in 1..4095");
    return static_cast<int>(v);
}

inline Result<SyscallRule> parse_rule(const yaml::YamlNode &node, const std::string &path) {
    if (!node.is_map()) return invalid(path, "expected a mapping");

    SyscallRule rule;
    auto sc = node.get("syscall");
    if (!sc) return invalid(path, "missing 'syscall'");
    JUDGEBOX_TRY_UNWRAP(nr, parse_syscall(*sc, path + ".syscall"));
    rule.syscall_nr = nr;

    JUDGEBOX_TRY_UNWRAP(action, parse_action(yaml::get_str(node, "action", "allow"), path + ".action"));
    rule.action = action;
    JUDGEBOX_TRY_UNWRAP(err, parse_errno(node.get("errno"), path + ".errno", EPERM));
    rule.errno_value = err;

    if (auto arg = node.get("arg")) {
        JUDGEBOX_TRY_UNWRAP(idx, parse_u64(*arg, path + ".arg"));
        if (idx > 5) return invalid(path + ".arg", "argument index must be 0..5");

        ArgPredicate pred;
        pred.arg_index = static_cast<unsigned int>(idx);
        JUDGEBOX_TRY_UNWRAP(op, parse_arg_op(yaml::get_str(node, "op", "eq"), path + ".op"));
        pred.op = op;

        auto value = node.get("value");
        if (!value) return invalid(path, "'arg' requires 'value'");
        JUDGEBOX_TRY_UNWRAP(v, parse_u64(*value, path + ".value"));
        pred.value = v;

        if (auto mask = node.get("mask")) {
            JUDGEBOX_TRY_UNWRAP(m, parse_u64(*mask, path + ".mask"));
            pred.mask = m;
        } else if (op == ArgOp::MASKED_EQ) {
            return invalid(path, "masked_eq requires 'mask'");
        }
        rule.predicate = pred;
    }
    return rule;
}

/**
 * @brief 解析 policies.<name>
 *
 * 自定义规则排在 base 策略的规则之前，因此可以覆盖内置规则。
 */
inline Result<SyscallPolicy> parse_policy(const std::string &name, const yaml::YamlNode &node) {
    std::string path = "policies." + name;
    if (!node.is_map()) return invalid(path, "expected a mapping");

    std::string base = yaml::get_str(node, "base", "none");
    SyscallPolicy base_policy(name, PolicyAction::Kill);
    if (base != "none") {
        auto builtin = policies::builtin_policy(base);
        if (!builtin) return invalid(path + ".base", "unknown base policy '" + base + "'");
        base_policy = *builtin;
    }

    SyscallPolicy policy(name, base_policy.default_action);
    policy.default_errno = base_policy.default_errno;
    if (auto def = node.get("default_action")) {
        JUDGEBOX_TRY_UNWRAP(action, parse_action(def->as_string(), path + ".default_action"));
        policy.default_action = action;
    }
    JUDGEBOX_TRY_UNWRAP(err, parse_errno(node.get("errno"), path + ".errno", policy.default_errno));
    policy.default_errno = err;

    if (auto rules = node.get("rules")) {
        if (!rules->is_list()) return invalid(path + ".rules", "expected a list");
        const auto &list = rules->as_list();
        for (size_t i = 0; i < list.size(); i++) {
            JUDGEBOX_TRY_UNWRAP(rule, parse_rule(*list[i], path + ".rules[" + std::to_string(i) + "]"));
            policy.rules.push_back(rule);
        }
    }
    policy.extend(base_policy);
    return policy;
}

} // namespace config_detail

//==============================================================================
// JudgeConfig
//==============================================================================

class JudgeConfig {
public:
    PoolOptions pool;
    JudgeOptions judge;
    SandboxOptions sandbox;
    std::optional<CompileStep> compile;      ///< 未配置 compile.command 时为空
    std::map<std::string, SyscallPolicy> policies;
    LogOptions log;

    /**
     * @brief 按名称查找策略：先查配置文件，再查内置策略
     */
    Result<SyscallPolicy> find_policy(const std::string &name) const {
        auto it = policies.find(name);
        if (it != policies.end()) return it->second;
        auto builtin = policies::builtin_policy(name);
        if (builtin) return *builtin;
        return config_detail::invalid("policy", "unknown policy '" + name + "'");
    }

    static Result<JudgeConfig> load(const std::string &path) {
        auto root = yaml::load_yaml(path);
        if (!root.ok()) {
            return root.error();
        }
        auto cfg = from_yaml(*root.value());
        if (!cfg.ok()) {
            return Error(cfg.error()).with_context(path);
        }
        return cfg;
    }

    static Result<JudgeConfig> parse(const std::string &text) {
        return from_yaml(*yaml::parse_yaml(text));
    }

    static Result<JudgeConfig> from_yaml(const yaml::YamlNode &root) {
        using namespace config_detail;
        JudgeConfig cfg;

        // pool
        JUDGEBOX_TRY_UNWRAP(workers, parse_count(root, "pool.workers", 1));
        JUDGEBOX_TRY_UNWRAP(run_slots, parse_count(root, "pool.run_slots", 0));
        JUDGEBOX_TRY_UNWRAP(test_conc, parse_count(root, "pool.test_concurrency", 1));
        if (workers == 0) return invalid("pool.workers", "must be at least 1");
        if (test_conc == 0) return invalid("pool.test_concurrency", "must be at least 1");
        cfg.pool.workers = workers;
        cfg.pool.run_slots = run_slots;
        cfg.pool.test_concurrency = test_conc;

        // sandbox
        cfg.sandbox.scratch_root = yaml::get_str(root, "sandbox.scratch_root", cfg.sandbox.scratch_root);
        if (cfg.sandbox.scratch_root.empty()) return invalid("sandbox.scratch_root", "must not be empty");
        JUDGEBOX_TRY_UNWRAP(use_cgroup, parse_flag(root, "sandbox.use_cgroup", true));
        JUDGEBOX_TRY_UNWRAP(report, parse_flag(root, "sandbox.report_syscalls", true));
        cfg.sandbox.use_cgroup = use_cgroup;
        cfg.sandbox.report_syscalls = report;
        if (auto env = root["sandbox.env"]) {
            if (!env->is_map()) return invalid("sandbox.env", "expected a mapping");
            cfg.sandbox.env.clear();
            for (const auto &kv : env->as_map()) {
                cfg.sandbox.env[kv.first] = kv.second->as_string();
            }
        }

        // limits
        JUDGEBOX_TRY_UNWRAP(run_limits, parse_limits(root["limits.run"], "limits.run", limits::DEFAULT));
        JUDGEBOX_TRY_UNWRAP(compile_limits, parse_limits(root["limits.compile"], "limits.compile", limits::COMPILER));
        JUDGEBOX_TRY_UNWRAP(checker_limits, parse_limits(root["limits.checker"], "limits.checker", limits::CHECKER));
        JUDGEBOX_TRY_UNWRAP(interactor_limits, parse_limits(root["limits.interactor"], "limits.interactor", limits::CHECKER));

        // policies
        if (auto pol = root["policies"]) {
            if (!pol->is_map()) return invalid("policies", "expected a mapping");
            for (const auto &kv : pol->as_map()) {
                JUDGEBOX_TRY_UNWRAP(p, parse_policy(kv.first, *kv.second));
                cfg.policies[kv.first] = p;
            }
        }

        // judge
        JUDGEBOX_TRY_UNWRAP(short_circuit, parse_flag(root, "judge.short_circuit", true));
        cfg.judge.short_circuit = short_circuit;
        std::string mode = yaml::get_str(root, "judge.comparison", "tokens");
        auto parsed_mode = parse_compare_mode(mode);
        if (!parsed_mode) return invalid("judge.comparison", "unknown mode '" + mode + "' (exact | tokens | lines)");
        cfg.judge.comparison = *parsed_mode;
        cfg.judge.test_concurrency = cfg.pool.test_concurrency;
        cfg.judge.run_limits = run_limits;
        cfg.judge.checker_limits = checker_limits;
        cfg.judge.interactor_limits = interactor_limits;
        JUDGEBOX_TRY_UNWRAP(run_policy, cfg.find_policy(yaml::get_str(root, "judge.policy", "judge")));
        JUDGEBOX_TRY_UNWRAP(checker_policy, cfg.find_policy(yaml::get_str(root, "judge.checker_policy", "judge")));
        JUDGEBOX_TRY_UNWRAP(interactor_policy,
                            cfg.find_policy(yaml::get_str(root, "judge.interactor_policy", "interactor")));
        cfg.judge.run_policy = run_policy;
        cfg.judge.checker_policy = checker_policy;
        cfg.judge.interactor_policy = interactor_policy;

        // compile
        std::string command = yaml::get_str(root, "compile.command");
        if (!command.empty()) {
            CompileStep step;
            step.command = command;
            step.limits = compile_limits;
            JUDGEBOX_TRY_UNWRAP(compile_policy, cfg.find_policy(yaml::get_str(root, "compile.policy", "compiler")));
            step.policy = compile_policy;
            step.output_name = yaml::get_str(root, "compile.output", "main");
            if (step.output_name.empty() || step.output_name.find('/') != std::string::npos) {
                return invalid("compile.output", "must be a plain file name");
            }
            cfg.compile = step;
        }

        // log
        std::string level = yaml::get_str(root, "log.level", "info");
        cfg.log.level = parse_log_level(level, LogLevel::OFF);
        if (cfg.log.level == LogLevel::OFF && level != "off" && level != "none") {
            return invalid("log.level", "unknown level '" + level + "'");
        }
        cfg.log.dir = yaml::get_str(root, "log.dir");
        JUDGEBOX_TRY_UNWRAP(console, parse_flag(root, "log.console", true));
        JUDGEBOX_TRY_UNWRAP(color, parse_flag(root, "log.color", true));
        cfg.log.console = console;
        cfg.log.color = color;

        return cfg;
    }
};

} // namespace judgebox

#endif // JUDGEBOX_CORE_CONFIG_H
