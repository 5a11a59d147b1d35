/**
 * @file LazyResult.hpp
 * @brief 线程安全的延迟计算槽，成功和失败都会被记住
 */

#pragma once

#include "fastword/core/Expected.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace fastword {
namespace core {

/**
 * @brief 延迟计算容器
 *
 * 第一次 getOrCompute() 调用工厂函数，结果（对象或错误）保存下来；
 * 之后的调用直接返回同一个结果。并发的首次访问只有一个线程执行工厂函数。
 */
template<typename T>
class LazyResult {
public:
    LazyResult() = default;

    LazyResult(const LazyResult&) = delete;
    LazyResult& operator=(const LazyResult&) = delete;

    /**
     * @brief 获取结果，必要时计算
     * @param factory 返回 Result<std::unique_ptr<T>> 的可调用对象
     * @return 指向缓存对象的指针，或缓存的错误
     */
    template<typename F>
    Result<const T*> getOrCompute(F&& factory) {
        if (!computed_.load(std::memory_order_acquire)) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!computed_.load(std::memory_order_relaxed)) {
                Result<std::unique_ptr<T>> result = factory();
                if (result) {
                    instance_ = std::move(result).value();
                } else {
                    error_ = result.error();
                }
                computed_.store(true, std::memory_order_release);
            }
        }

        if (instance_) {
            return static_cast<const T*>(instance_.get());
        }
        return *error_;
    }

private:
    std::mutex mutex_;
    std::atomic<bool> computed_{false};
    std::unique_ptr<T> instance_;
    std::optional<Error> error_;
};

}} // namespace fastword::core
