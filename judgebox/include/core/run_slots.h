/**
 * @file run_slots.h
 * @brief 沙箱运行槽位（计数信号量）
 *
 * 宿主上同时运行的沙箱数只由这里决定：每次 Supervisor::run 之前先取得一个槽位。
 */

#ifndef JUDGEBOX_CORE_RUN_SLOTS_H
#define JUDGEBOX_CORE_RUN_SLOTS_H

#include <mutex>
#include <chrono>
#include <cstddef>
#include <condition_variable>

#include "core/cancellation.h"

namespace judgebox {

class RunSlots {
private:
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t available_;
    const size_t capacity_;

public:
    explicit RunSlots(size_t capacity)
        : available_(capacity > 0 ? capacity : 1), capacity_(capacity > 0 ? capacity : 1) {}

    RunSlots(const RunSlots&) = delete;
    RunSlots& operator=(const RunSlots&) = delete;

    size_t capacity() const { return capacity_; }

    size_t available() {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

    /**
     * @brief 等待一个槽位
     * @return false 表示等待期间被取消，没有取得槽位
     */
    bool acquire(const CancellationToken *cancel = nullptr) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (available_ == 0) {
            if (is_cancelled(cancel)) return false;
            // 取消标记没有通知机制，定期醒来检查
            cv_.wait_for(lock, std::chrono::milliseconds(20));
        }
        if (is_cancelled(cancel)) return false;
        available_--;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            available_++;
        }
        cv_.notify_one();
    }
};

/**
 * @brief 槽位的 RAII 持有者
 */
class RunSlotGuard {
private:
    RunSlots *slots_ = nullptr;
    bool held_ = false;

public:
    RunSlotGuard(RunSlots *slots, const CancellationToken *cancel) : slots_(slots) {
        held_ = slots_ == nullptr || slots_->acquire(cancel);
    }

    ~RunSlotGuard() {
        if (slots_ && held_) slots_->release();
    }

    RunSlotGuard(const RunSlotGuard&) = delete;
    RunSlotGuard& operator=(const RunSlotGuard&) = delete;

    bool held() const { return held_; }
};

} // namespace judgebox

#endif // JUDGEBOX_CORE_RUN_SLOTS_H
