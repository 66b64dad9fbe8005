/**
 * @file cancellation.h
 * @brief 评测取消标记
 */

#ifndef JUDGEBOX_CORE_CANCELLATION_H
#define JUDGEBOX_CORE_CANCELLATION_H

#include <atomic>
#include <memory>

namespace judgebox {

/**
 * @brief 取消标记，一次提交共享一个
 *
 * 监督进程每个轮询周期检查一次，被取消时杀掉整个进程树。
 * 带 parent 的标记在自身或 parent 被取消时都视为已取消，
 * 用于短路模式下只取消某一个测试点的运行。
 */
class CancellationToken {
private:
    std::atomic<bool> cancelled_{false};
    const CancellationToken *parent_ = nullptr;

public:
    CancellationToken() = default;
    explicit CancellationToken(const CancellationToken *parent) : parent_(parent) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_release); }

    bool cancelled() const {
        if (cancelled_.load(std::memory_order_acquire)) return true;
        return parent_ && parent_->cancelled();
    }
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline bool is_cancelled(const CancellationToken *token) {
    return token && token->cancelled();
}

} // namespace judgebox

#endif // JUDGEBOX_CORE_CANCELLATION_H
