/**
 * @file judger_logger.h
 * @brief 评测机专用日志配置
 *
 * 四个通道：
 * - main    主流程（池、配置、cgroup）
 * - compile 编译阶段
 * - run     沙箱运行
 * - judge   判定与汇总
 *
 * 每个通道可以同时写控制台和 <log_dir>/<通道>.log。
 */

#ifndef JUDGEBOX_CORE_JUDGER_LOGGER_H
#define JUDGEBOX_CORE_JUDGER_LOGGER_H

#include "core/logger.h"

#include <string>
#include <sys/stat.h>

namespace judgebox {

/**
 * @brief 日志初始化参数（来自配置文件 log 段）
 */
struct LogOptions {
    LogLevel level = LogLevel::INFO;
    std::string dir;          ///< 为空时不写文件
    bool console = true;
    bool color = true;
};

class JudgerLogger {
private:
    Logger main_logger_;
    Logger compile_logger_;
    Logger run_logger_;
    Logger judge_logger_;
    std::mutex mutex_;

    static void setup(Logger &logger, const LogOptions &opts, const std::string &channel) {
        logger.clear_sinks();
        logger.set_level(opts.level)
              .show_timestamp(true)
              .show_level(true)
              .show_location(opts.level <= LogLevel::DEBUG);
        if (opts.console) {
            logger.add_console(opts.color);
        }
        if (!opts.dir.empty()) {
            logger.add_file(opts.dir + "/" + channel + ".log");
        }
    }

public:
    JudgerLogger()
        : main_logger_("main"),
          compile_logger_("compile"),
          run_logger_("run"),
          judge_logger_("judge") {
        // 未初始化前只输出 WARN 以上到控制台，避免测试输出刷屏
        LogOptions quiet;
        quiet.level = LogLevel::WARN;
        init(quiet);
    }

    /**
     * @brief 初始化全部通道，可重复调用（后一次覆盖前一次）
     */
    void init(const LogOptions &opts) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!opts.dir.empty()) {
            ::mkdir(opts.dir.c_str(), 0755);
        }
        setup(main_logger_, opts, "main");
        setup(compile_logger_, opts, "compile");
        setup(run_logger_, opts, "run");
        setup(judge_logger_, opts, "judge");
    }

    Logger& main()    { return main_logger_; }
    Logger& compile() { return compile_logger_; }
    Logger& run()     { return run_logger_; }
    Logger& judge()   { return judge_logger_; }

    void flush_all() {
        main_logger_.flush();
        compile_logger_.flush();
        run_logger_.flush();
        judge_logger_.flush();
    }
};

inline JudgerLogger& judger_log() {
    static JudgerLogger instance;
    return instance;
}

} // namespace judgebox

//==============================================================================
// 评测机专用日志宏
//==============================================================================

#define JLOG_DEBUG LOGGER_DEBUG(judgebox::judger_log().main())
#define JLOG_INFO  LOGGER_INFO(judgebox::judger_log().main())
#define JLOG_WARN  LOGGER_WARN(judgebox::judger_log().main())
#define JLOG_ERROR LOGGER_ERROR(judgebox::judger_log().main())
#define JLOG_FATAL LOGGER_FATAL(judgebox::judger_log().main())

#define CLOG_DEBUG LOGGER_DEBUG(judgebox::judger_log().compile())
#define CLOG_INFO  LOGGER_INFO(judgebox::judger_log().compile())
#define CLOG_WARN  LOGGER_WARN(judgebox::judger_log().compile())
#define CLOG_ERROR LOGGER_ERROR(judgebox::judger_log().compile())

#define RLOG_TRACE LOGGER_TRACE(judgebox::judger_log().run())
#define RLOG_DEBUG LOGGER_DEBUG(judgebox::judger_log().run())
#define RLOG_INFO  LOGGER_INFO(judgebox::judger_log().run())
#define RLOG_WARN  LOGGER_WARN(judgebox::judger_log().run())
#define RLOG_ERROR LOGGER_ERROR(judgebox::judger_log().run())

#define TLOG_DEBUG LOGGER_DEBUG(judgebox::judger_log().judge())
#define TLOG_INFO  LOGGER_INFO(judgebox::judger_log().judge())
#define TLOG_WARN  LOGGER_WARN(judgebox::judger_log().judge())
#define TLOG_ERROR LOGGER_ERROR(judgebox::judger_log().judge())

#endif // JUDGEBOX_CORE_JUDGER_LOGGER_H
