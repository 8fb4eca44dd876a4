#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <actor-theta/detail/intrusive_ptr.hpp>
#include <actor-theta/scheduler/task.hpp>
#include <actor-theta/scheduler/worker.hpp>

namespace actor_theta { namespace scheduler {

    /// @brief Owns the workers and the counters shared between them.
    class scheduler_t final {
    public:
        scheduler_t(size_t num_worker_threads, size_t max_throughput_param, duration timer_tick);
        scheduler_t(const scheduler_t&) = delete;
        scheduler_t& operator=(const scheduler_t&) = delete;
        ~scheduler_t();

        /// creates the workers and their reactors, nothing runs yet
        std::error_code init();

        void start(const std::string& thread_name_prefix);

        /// wait for every worker to leave its loop, then tear down what is left
        void stop();

        size_t max_throughput() const noexcept {
            return max_throughput_;
        }

        size_t num_workers() const noexcept {
            return num_workers_;
        }

        worker* worker_by_id(size_t x) {
            return workers_[x].get();
        }

        task_id next_task_id() noexcept {
            return next_task_id_.fetch_add(1, std::memory_order_relaxed);
        }

        /// @brief Pick a worker, round-robin unless `hint` names one.
        /// @return nullptr when `hint` is not a valid worker index
        worker* place(std::optional<size_t> hint);

        void submit(worker* target, detail::intrusive_ptr<task_base> task);

        void task_finished() noexcept;

        size_t live_tasks() const noexcept {
            return live_tasks_.load(std::memory_order_acquire);
        }

        bool stopping() const noexcept {
            return stopping_.load(std::memory_order_acquire);
        }

        /// @brief Begin an orderly stop; the first non-empty reason is kept.
        void request_shutdown(std::error_code reason = {});

        std::error_code shutdown_reason() const;

    private:
        void notify_all() noexcept;

        std::atomic<size_t> next_worker_{0};
        std::atomic<task_id> next_task_id_{1};
        std::atomic<size_t> live_tasks_{0};
        std::atomic<bool> stopping_{false};
        size_t max_throughput_;
        size_t num_workers_;
        duration timer_tick_;
        std::vector<std::unique_ptr<worker>> workers_;
        mutable std::mutex reason_mtx_;
        std::error_code reason_;
    };

}} // namespace actor_theta::scheduler
