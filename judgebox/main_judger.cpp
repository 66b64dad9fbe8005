/**
 * @file main_judger.cpp
 * @brief 命令行评测入口
 *
 *   judgebox_judger <config.yml> <submission.yml> [report-file]
 *
 * 退出码：0 已评测（任意结论），1 配置错误，2 结论为 SystemError
 */

#include <iostream>
#include <fstream>

#include "judgebox.h"

using namespace judgebox;

static void usage(const char *prog) {
    std::cerr << "usage: " << prog << " <config.yml> <submission.yml> [report-file]" << std::endl;
}

int main(int argc, char **argv) {
    if (argc < 3 || argc > 4) {
        usage(argv[0]);
        return 1;
    }

    auto config = JudgeConfig::load(argv[1]);
    if (!config.ok()) {
        std::cerr << "config: " << config.error().to_string() << std::endl;
        return 1;
    }
    JudgeConfig &cfg = config.value();
    judger_log().init(cfg.log);

    auto request = load_request(argv[2]);
    if (!request.ok()) {
        JLOG_ERROR << "submission: " << request.error().to_string();
        return 1;
    }
    if (!request.value().compile) {
        request.value().compile = cfg.compile;
    }

    // 初始化 cgroup 管理器
    // 失败时继续执行，内存改为按 RSS 采样限制
    if (cfg.sandbox.use_cgroup) {
        auto cgroup_result = sandbox::CgroupManager::instance().initialize();
        if (!cgroup_result.ok()) {
            JLOG_WARN << "cgroup unavailable: " << cgroup_result.error().message();
        }
    }

    SubmissionJudgement judgement;
    {
        JudgePool pool(cfg);
        auto future = pool.submit(std::move(request.value()));
        if (!future.ok()) {
            JLOG_ERROR << future.error().to_string();
            return 1;
        }
        judgement = future.value().get();
    }

    JudgeReport report(judgement);
    if (argc == 4) {
        auto written = report.write_file(argv[3]);
        if (!written.ok()) {
            JLOG_ERROR << "report: " << written.error().to_string();
            return 2;
        }
    } else {
        std::cout << report;
    }

    judger_log().flush_all();
    return is<verdict::SystemError>(judgement.overall) ? 2 : 0;
}
