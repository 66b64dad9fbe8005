/**
 * @file judgebox.h
 * @brief judgebox 主头文件
 *
 * 沙箱 (seccomp-bpf + Landlock + rlimit + cgroups v2) 与评测流程。
 *
 * 使用方式：
 *   #include "judgebox.h"
 *   using namespace judgebox;
 */

#ifndef JUDGEBOX_H
#define JUDGEBOX_H

// 核心模块
#include "core/error.h"
#include "core/logger.h"
#include "core/judger_logger.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/syscall_map.h"
#include "core/syscall_policy.h"
#include "core/yaml_config.h"
#include "core/config.h"
#include "core/verdict.h"
#include "core/comparator.h"
#include "core/classifier.h"
#include "core/cancellation.h"
#include "core/submission.h"
#include "core/run_slots.h"
#include "core/runner.h"
#include "core/compiler.h"
#include "core/checker.h"
#include "core/interactor.h"
#include "core/judger.h"
#include "core/worker_pool.h"
#include "core/result.h"

// 沙箱
#include "sandbox/limiter.h"
#include "sandbox/seccomp.h"
#include "sandbox/landlock.h"
#include "sandbox/cgroup.h"
#include "sandbox/process.h"
#include "sandbox/scratch_dir.h"
#include "sandbox/supervisor.h"

#endif // JUDGEBOX_H
