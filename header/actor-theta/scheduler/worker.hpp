#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

#include <actor-theta/detail/intrusive_ptr.hpp>
#include <actor-theta/detail/lifo_stack.hpp>
#include <actor-theta/scheduler/reactor.hpp>
#include <actor-theta/scheduler/task.hpp>
#include <actor-theta/scheduler/timer_wheel.hpp>

namespace actor_theta { namespace scheduler {

    class scheduler_t;

    /// @brief One OS thread driving the tasks pinned to it.
    class worker final {
    public:
        using task_ptr = detail::intrusive_ptr<task_base>;

        worker(size_t id, scheduler_t* parent, size_t max_throughput, duration timer_tick);
        worker(const worker&) = delete;
        worker& operator=(const worker&) = delete;
        ~worker();

        std::error_code init();

        void start(std::string thread_name);
        void join();

        /// @brief Teardown of leftover tasks after join(), in three passes over all workers.
        void finish_all() noexcept;
        void teardown_all() noexcept;
        void release_queues() noexcept;

        size_t id() const noexcept {
            return id_;
        }

        /// @brief Hand a freshly spawned task over, any thread.
        void adopt(task_ptr task);

        /// @brief Queue a task that just went waiting -> scheduled, any thread.
        void enqueue(task_base* task) noexcept;

        /// interrupt the event poll so the loop re-checks the stop conditions
        void notify() noexcept;

        timer_wheel& timers() noexcept {
            return timers_;
        }

        reactor& io() noexcept {
            return reactor_;
        }

        scheduler_t* parent() const noexcept {
            return parent_;
        }

        size_t task_count() const noexcept {
            return tasks_.size();
        }

        std::thread& get_thread() {
            return this_thread_;
        }

    private:
        void run();
        bool should_stop() const noexcept;
        bool has_incoming() const;
        void drain_incoming();
        void run_task(task_base* task);
        void poll_events();
        int poll_timeout() const;
        void wake_local(task_id id);

        const size_t id_;
        scheduler_t* parent_;
        const size_t max_throughput_;

        std::thread this_thread_;
        reactor reactor_;
        timer_wheel timers_;

        std::deque<task_base*> ready_;
        std::unordered_map<task_id, task_ptr> tasks_;

        detail::lifo_stack<task_base> woken_;
        mutable std::mutex adopt_mtx_;
        std::vector<task_ptr> adopted_;
        std::atomic<bool> polling_{false};
    };

}} // namespace actor_theta::scheduler
