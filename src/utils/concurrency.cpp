#include "ipt/concurrency.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <vector>

#include <spdlog/spdlog.h>

namespace ipt {

struct WorkerPool::Impl {
    Impl(int n, std::string pool_name)
        : name(std::move(pool_name)), stop(false), active(0), failed(0), cancel(false)
    {
        if (n <= 0) n = 1;
        workers.reserve(n);
        for (int i = 0; i < n; ++i)
        {
            workers.emplace_back([this]{ this->worker_loop(); });
        }
    }

    ~Impl()
    {
        shutdown();
    }

    bool submit(Task task)
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (stop) return false;
            q.push(std::move(task));
        }
        cv_task.notify_one();
        return true;
    }

    void wait_idle()
    {
        std::unique_lock<std::mutex> lk(mtx);
        cv_idle.wait(lk, [&]{ return q.empty() && active == 0; });
    }

    void shutdown()
    {
        std::lock_guard<std::mutex> join_lk(join_mtx);
        {
            std::lock_guard<std::mutex> lk(mtx);
            stop = true;
            cancel.store(true, std::memory_order_relaxed);
            std::queue<Task>().swap(q);
        }
        cv_task.notify_all();
        for (auto& th : workers) if (th.joinable()) th.join();
        workers.clear();
        cv_idle.notify_all();
    }

    std::size_t pending() const
    {
        std::lock_guard<std::mutex> lk(mtx);
        return q.size() + active;
    }

private:
    void worker_loop()
    {
        for(;;)
        {
            Task task;
            {
                std::unique_lock<std::mutex> lk(mtx);
                cv_task.wait(lk, [&]{ return stop || !q.empty(); });
                if (stop && q.empty()) return;
                task = std::move(q.front());
                q.pop();
                ++active;
            }
            try {
                task(cancel);
            } catch (const std::exception& e) {
                failed.fetch_add(1, std::memory_order_relaxed);
                spdlog::error("{} task failed: {}", name, e.what());
            } catch (...) {
                failed.fetch_add(1, std::memory_order_relaxed);
                spdlog::error("{} task failed with a non-standard exception", name);
            }
            {
                std::lock_guard<std::mutex> lk(mtx);
                --active;
                if (q.empty() && active == 0) cv_idle.notify_all();
            }
        }
    }

public:
    std::string name;
    mutable std::mutex mtx;
    mutable std::mutex join_mtx;   // serialises shutdown()
    std::condition_variable cv_task;
    std::condition_variable cv_idle;
    std::queue<Task> q;
    std::vector<std::thread> workers;
    bool stop;
    std::size_t active;
    std::atomic<std::size_t> failed;
    std::atomic<bool> cancel;
};

WorkerPool::WorkerPool(int threads, std::string name)
  : impl_(new Impl(threads, std::move(name)))
{}

WorkerPool::~WorkerPool()
{
    delete impl_;
}

bool WorkerPool::submit(Task task)
{
    return impl_->submit(std::move(task));
}

void WorkerPool::wait_idle()
{
    impl_->wait_idle();
}

void WorkerPool::shutdown()
{
    impl_->shutdown();
}

const std::atomic<bool>& WorkerPool::cancel_flag() const
{
    return impl_->cancel;
}

std::size_t WorkerPool::pending() const
{
    return impl_->pending();
}

std::size_t WorkerPool::failed_tasks() const
{
    return impl_->failed.load(std::memory_order_relaxed);
}

int WorkerPool::size() const
{
    std::lock_guard<std::mutex> lk(impl_->join_mtx);
    return static_cast<int>(impl_->workers.size());
}

} // namespace ipt
