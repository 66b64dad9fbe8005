/**
 * @file worker_pool.h
 * @brief 评测池
 *
 * N 个工作线程各自驱动一次提交的完整流程；所有沙箱运行共享一组运行槽位，
 * 宿主上同时存在的沙箱数不超过槽位数。提交之间互不影响，也不保证顺序。
 */

#ifndef JUDGEBOX_CORE_WORKER_POOL_H
#define JUDGEBOX_CORE_WORKER_POOL_H

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <memory>
#include <thread>
#include <mutex>
#include <future>
#include <condition_variable>

#include "core/error.h"
#include "core/config.h"
#include "core/verdict.h"
#include "core/submission.h"
#include "core/run_slots.h"
#include "core/runner.h"
#include "core/judger.h"
#include "core/cancellation.h"
#include "core/judger_logger.h"

namespace judgebox {

class JudgePool {
private:
    struct Task {
        JudgeRequest request;
        CancellationTokenPtr token;
        std::promise<SubmissionJudgement> promise;
    };

    RunSlots slots_;
    Judger judger_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<Task>> queue_;
    std::multimap<std::string, CancellationTokenPtr> active_;   ///< 排队中和运行中
    bool stopping_ = false;
    std::vector<std::thread> workers_;

    void worker_loop() {
        while (true) {
            std::unique_ptr<Task> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) return;   // stopping_ 且队列已空
                task = std::move(queue_.front());
                queue_.pop_front();
            }

            const JudgeRequest &req = task->request;
            SubmissionJudgement result =
                judger_.judge(req.submission, req.tests, req.compile, task->token.get());
            task->promise.set_value(std::move(result));

            std::lock_guard<std::mutex> lock(mutex_);
            auto range = active_.equal_range(req.submission.id);
            for (auto it = range.first; it != range.second; ++it) {
                if (it->second == task->token) {
                    active_.erase(it);
                    break;
                }
            }
        }
    }

public:
    JudgePool(const PoolOptions &pool, JudgeOptions judge, SandboxOptions sandbox)
        : slots_(pool.effective_run_slots()),
          judger_(std::move(judge), Runner(std::move(sandbox), &slots_)) {
        size_t n = pool.workers > 0 ? pool.workers : 1;
        workers_.reserve(n);
        for (size_t i = 0; i < n; i++) {
            workers_.emplace_back([this] { worker_loop(); });
        }
        JLOG_INFO << "judge pool started: " << n << " worker(s), "
                  << slots_.capacity() << " run slot(s)";
    }

    explicit JudgePool(const JudgeConfig &config)
        : JudgePool(config.pool, config.judge, config.sandbox) {}

    ~JudgePool() { shutdown(); }

    JudgePool(const JudgePool&) = delete;
    JudgePool& operator=(const JudgePool&) = delete;

    const Judger& judger() const { return judger_; }
    size_t run_slots() const { return slots_.capacity(); }

    /**
     * @brief 提交评测
     *
     * 策略无法编译时直接失败，不入队。
     */
    Result<std::future<SubmissionJudgement>> submit(JudgeRequest request) {
        auto policies_ok = judger_.check_policies(request.compile, request.submission.interactive());
        if (!policies_ok.ok()) {
            JLOG_ERROR << "rejecting submission " << request.submission.id << ": "
                       << policies_ok.error().to_string();
            return policies_ok.error();
        }

        auto task = std::make_unique<Task>();
        task->token = std::make_shared<CancellationToken>();
        std::future<SubmissionJudgement> future = task->promise.get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return JUDGEBOX_ERROR(ErrorCode::JUDGE_ERROR, "judge pool is shut down");
            }
            active_.emplace(request.submission.id, task->token);
            task->request = std::move(request);
            queue_.push_back(std::move(task));
        }
        cv_.notify_one();
        return std::move(future);
    }

    /**
     * @brief 取消一个提交（排队中或运行中）
     * @return 是否找到该提交
     */
    bool cancel(const std::string &submission_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto range = active_.equal_range(submission_id);
        if (range.first == range.second) return false;
        for (auto it = range.first; it != range.second; ++it) {
            it->second->cancel();
        }
        JLOG_INFO << "submission " << submission_id << " cancelled";
        return true;
    }

    /**
     * @brief 停止接收新提交并等待工作线程退出
     * @param cancel_pending 为 true 时取消排队中和运行中的提交，否则全部评测完
     */
    void shutdown(bool cancel_pending = false) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && workers_.empty()) return;
            stopping_ = true;
            if (cancel_pending) {
                for (auto &kv : active_) kv.second->cancel();
            }
        }
        cv_.notify_all();
        for (auto &t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();
    }
};

} // namespace judgebox

#endif // JUDGEBOX_CORE_WORKER_POOL_H
