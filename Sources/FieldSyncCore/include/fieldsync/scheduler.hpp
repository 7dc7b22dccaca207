#pragma once

#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <queue>
#include <vector>
#include <condition_variable>
#include <atomic>

namespace fieldsync {

// ============================================================================
// Scheduler interface - where sessions run and where their results land
// ============================================================================
//
// sync_service runs a session on a worker scheduler and hands the summary to
// a callback scheduler, typically the UI thread:
// - immediate_scheduler: run inline (tests, command line tools)
// - std_thread_scheduler: one dedicated worker thread
// - main_thread_scheduler: queued until the owner's run loop drains it

struct scheduler {
    virtual ~scheduler() = default;

    // Invoke the given function on this scheduler's execution context.
    // Can be called from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // Check if the caller is currently on this scheduler's thread/context.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // Check if invoke() is currently possible.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using shared_scheduler = std::shared_ptr<scheduler>;

// ============================================================================
// Worker thread scheduler - runs work in FIFO order on one thread
// ============================================================================

class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler() : running_(true) {
        worker_ = std::thread([this] { run_loop(); });
        thread_id_ = worker_.get_id();
    }

    ~std_thread_scheduler() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void invoke(std::function<void()>&& fn) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            queue_.push(std::move(fn));
        }
        cv_.notify_all();
    }

    // Block until every queued function has finished running
    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == thread_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return running_;
    }

private:
    void run_loop() {
        while (true) {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

                if (!running_ && queue_.empty()) {
                    return;
                }

                fn = std::move(queue_.front());
                queue_.pop();
                busy_ = true;
            }

            if (fn) {
                fn();
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                busy_ = false;
            }
            idle_cv_.notify_all();
        }
    }

    std::thread worker_;
    std::thread::id thread_id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> running_;
    bool busy_ = false;
};

// ============================================================================
// Immediate scheduler - runs callbacks synchronously on calling thread
// ============================================================================

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }
};

// ============================================================================
// Main thread scheduler - results wait for the owner's run loop
// ============================================================================
//
// Captures the constructing thread as "main". Call process_pending() from
// that thread's run loop to deliver queued completions.

class main_thread_scheduler : public scheduler {
public:
    main_thread_scheduler() : main_thread_id_(std::this_thread::get_id()) {}

    void invoke(std::function<void()>&& fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(fn));
    }

    // Returns the number of functions run
    size_t process_pending() {
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            while (!queue_.empty()) {
                pending.push_back(std::move(queue_.front()));
                queue_.pop();
            }
        }
        for (auto& fn : pending) {
            if (fn) fn();
        }
        return pending.size();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == main_thread_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }

private:
    std::thread::id main_thread_id_;
    std::mutex mutex_;
    std::queue<std::function<void()>> queue_;
};

} // namespace fieldsync
