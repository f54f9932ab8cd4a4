#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace ipt {

// Fixed-size pool running blocking probe work off the I/O thread.
// Every task observes the pool's cancellation flag, which trips on shutdown().
class WorkerPool {
public:
    using Task = std::function<void(const std::atomic<bool>&)>;

    explicit WorkerPool(int threads, std::string name = "worker");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown() has been called.
    bool submit(Task task);

    // Wait until the queue is empty and all tasks complete
    void wait_idle();

    // Trip the cancel flag, drop queued tasks, join workers. Idempotent.
    void shutdown();

    const std::atomic<bool>& cancel_flag() const;
    std::size_t pending() const;
    std::size_t failed_tasks() const;
    int size() const;

private:
    struct Impl;
    Impl* impl_;
};

// Caps how many detached calls may be outstanding at once. A Slot holds
// one unit until it is destroyed, which may happen on another thread.
class InFlightLimit {
public:
    class Slot {
    public:
        explicit Slot(InFlightLimit& owner) : owner_(&owner) {}
        ~Slot() { owner_->release(); }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        InFlightLimit* owner_;
    };

    explicit InFlightLimit(int max) : max_(max < 1 ? 1 : max) {}

    InFlightLimit(const InFlightLimit&) = delete;
    InFlightLimit& operator=(const InFlightLimit&) = delete;

    // nullptr when `max` slots are already taken.
    std::shared_ptr<Slot> try_acquire()
    {
        int cur = count_.load(std::memory_order_relaxed);
        while (cur < max_) {
            if (count_.compare_exchange_weak(cur, cur + 1, std::memory_order_acq_rel)) {
                return std::make_shared<Slot>(*this);
            }
        }
        return nullptr;
    }

    int in_flight() const { return count_.load(std::memory_order_acquire); }
    int limit() const { return max_; }

private:
    void release() { count_.fetch_sub(1, std::memory_order_acq_rel); }

    const int max_;
    std::atomic<int> count_{0};
};

// Run fn on a detached thread and wait at most `timeout` for it.
// std::nullopt when the deadline passed first; fn keeps running and its
// result is dropped. Exceptions thrown by fn are rethrown here.
template <typename T>
std::optional<T> call_with_timeout(std::function<T()> fn,
                                   std::chrono::milliseconds timeout)
{
    auto task = std::make_shared<std::packaged_task<T()>>(std::move(fn));
    std::future<T> fut = task->get_future();
    std::thread([task] { (*task)(); }).detach();
    if (fut.wait_for(timeout) != std::future_status::ready) return std::nullopt;
    return fut.get();
}

} // namespace ipt
