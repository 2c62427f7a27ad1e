#pragma once

#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <atomic>
#include <algorithm>
#include <exception>

namespace ps {

// Shared flag polled by long-running stages at every chunk boundary.
using cancel_token = std::shared_ptr<std::atomic<bool>>;

inline bool is_cancelled(const cancel_token& token) {
    return token && token->load(std::memory_order_acquire);
}

// A simple work-stealing queue based on std::deque and a mutex.
// Not lock-free, but each worker owns its own queue so contention is
// spread out instead of piling up on a single lock.
template<typename T>
class WorkStealingQueue {
public:
    WorkStealingQueue() = default;
    WorkStealingQueue(const WorkStealingQueue&) = delete;
    WorkStealingQueue& operator=(const WorkStealingQueue&) = delete;

    WorkStealingQueue(WorkStealingQueue&& other) noexcept {
        std::lock_guard<std::mutex> lock(other.mutex_);
        queue_ = std::move(other.queue_);
    }

    WorkStealingQueue& operator=(WorkStealingQueue&& other) noexcept {
        if (this != &other) {
            std::scoped_lock lock(mutex_, other.mutex_);
            queue_ = std::move(other.queue_);
        }
        return *this;
    }

    void push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_front(std::move(item));
    }

    // Owner side: LIFO.
    bool pop(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // Thief side: FIFO.
    bool steal(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.back());
        queue_.pop_back();
        return true;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
};

class ThreadPool {
public:
    explicit ThreadPool(size_t threads = std::thread::hardware_concurrency()) : stop_(false), active_threads_(0) {
        if (threads == 0) {
            threads = 1;
        }
        thread_count_ = threads;
        queues_.resize(threads);
        workers_.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this, i] { worker_loop(i); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            stop_.store(true);
        }
        condition_.notify_all();
        for (std::thread& worker : workers_) {
            worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const noexcept { return thread_count_; }

    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>
    {
        using return_type = std::invoke_result_t<F, Args...>;

        if (stop_.load()) {
            throw std::runtime_error("enqueue on stopped ThreadPool");
        }

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        std::future<return_type> res = task->get_future();

        // Round-robin over the worker queues; idle workers steal the rest.
        size_t queue_idx = submission_idx_.fetch_add(1) % thread_count_;
        queues_[queue_idx].push([task]() { (*task)(); });

        {
            // Taking the wait mutex orders this push against a worker that is
            // between its predicate check and going to sleep.
            std::lock_guard<std::mutex> lock(wait_mutex_);
        }
        if (active_threads_ < thread_count_) {
            condition_.notify_one();
        } else {
            condition_.notify_all();
        }
        return res;
    }

private:
    using Task = std::function<void()>;

    bool has_pending() const {
        for (size_t i = 0; i < thread_count_; ++i) {
            if (!queues_[i].empty()) return true;
        }
        return false;
    }

    void worker_loop(size_t id) {
        while (!stop_.load()) {
            Task task;

            active_threads_++;
            if (queues_[id].pop(task)) {
                task();
                active_threads_--;
                continue;
            }

            bool stolen = false;
            for (size_t i = 1; i < thread_count_; ++i) {
                if (queues_[(id + i) % thread_count_].steal(task)) {
                    stolen = true;
                    break;
                }
            }
            active_threads_--;

            if (stolen) {
                task();
            } else {
                std::unique_lock<std::mutex> lock(wait_mutex_);
                condition_.wait(lock, [this] { return stop_.load() || has_pending(); });
            }
        }
    }

    size_t thread_count_;
    std::vector<std::thread> workers_;
    std::vector<WorkStealingQueue<Task>> queues_;

    std::atomic<bool> stop_;
    std::atomic<size_t> submission_idx_{0};
    std::atomic<size_t> active_threads_;

    std::mutex wait_mutex_;
    std::condition_variable condition_;
};

inline ThreadPool& get_pool() {
    static ThreadPool pool;
    return pool;
}

struct chunk_range {
    size_t begin = 0;
    size_t end = 0;
};

// Fork-join over [0, total): the range is cut into chunks of at most
// chunk_size items, each chunk runs fn(chunk_range) on the pool and the
// per-chunk results come back in chunk order. on_chunk_done(done, total) is
// called on the calling thread as chunks are joined. Chunks that start after
// the token is set return a default-constructed result; callers must check the
// token after the join.
template<class F, class Progress>
auto parallel_chunks(ThreadPool& pool, size_t total, size_t chunk_size, const cancel_token& cancel,
                     F&& fn, Progress&& on_chunk_done)
    -> std::vector<std::invoke_result_t<F&, chunk_range>>
{
    using result_type = std::invoke_result_t<F&, chunk_range>;
    std::vector<result_type> results;
    if (total == 0) {
        return results;
    }
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    // A single chunk or a single worker gains nothing from the queue round trip.
    if (total <= chunk_size || pool.size() <= 1) {
        for (size_t begin = 0; begin < total; begin += chunk_size) {
            if (is_cancelled(cancel)) break;
            const size_t end = std::min(begin + chunk_size, total);
            results.push_back(fn(chunk_range{begin, end}));
            on_chunk_done(end, total);
        }
        return results;
    }

    std::vector<std::future<result_type>> futures;
    futures.reserve((total + chunk_size - 1) / chunk_size);
    for (size_t begin = 0; begin < total; begin += chunk_size) {
        const chunk_range range{begin, std::min(begin + chunk_size, total)};
        futures.push_back(pool.enqueue([&fn, &cancel, range]() -> result_type {
            if (is_cancelled(cancel)) return result_type{};
            return fn(range);
        }));
    }

    // Every future is joined before returning or rethrowing: the tasks hold
    // references into this frame.
    results.reserve(futures.size());
    std::exception_ptr failure;
    size_t done = 0;
    for (auto& fut : futures) {
        try {
            results.push_back(fut.get());
        } catch (...) {
            if (!failure) failure = std::current_exception();
            continue;
        }
        done = std::min(done + chunk_size, total);
        if (!failure) on_chunk_done(done, total);
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    return results;
}

template<class F>
auto parallel_chunks(ThreadPool& pool, size_t total, size_t chunk_size, const cancel_token& cancel, F&& fn)
    -> std::vector<std::invoke_result_t<F&, chunk_range>>
{
    return parallel_chunks(pool, total, chunk_size, cancel, std::forward<F>(fn), [](size_t, size_t) {});
}

} // namespace ps
