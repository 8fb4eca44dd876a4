#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <utility>

#include <pthread.h>

#include <actor-theta/log.hpp>
#include <actor-theta/scheduler/scheduler.hpp>
#include <actor-theta/scheduler/worker.hpp>

namespace actor_theta { namespace scheduler {

    void task_base::wake() noexcept {
        if (schedule_if_waiting()) {
            assert(owner_ && "wake(): task is not bound to a worker");
            owner_->enqueue(this);
        }
    }

    worker::worker(size_t id, scheduler_t* parent, size_t max_throughput, duration timer_tick)
        : id_(id)
        , parent_(parent)
        , max_throughput_(max_throughput > 0 ? max_throughput : 1)
        , timers_(timer_tick) {
    }

    worker::~worker() {
        release_queues();
    }

    std::error_code worker::init() {
        return reactor_.open();
    }

    void worker::start(std::string thread_name) {
        assert(!this_thread_.joinable());
        this_thread_ = std::thread([this] { run(); });
        if (thread_name.size() > 15) {
            thread_name.resize(15);
        }
        if (int rc = ::pthread_setname_np(this_thread_.native_handle(), thread_name.c_str()); rc != 0) {
            ACTOR_THETA_LOG_DEBUG("worker {}: cannot set thread name: {}", id_, std::error_code(rc, std::system_category()).message());
        }
    }

    void worker::join() {
        if (this_thread_.joinable()) {
            this_thread_.join();
        }
    }

    void worker::adopt(task_ptr task) {
        {
            std::lock_guard<std::mutex> guard(adopt_mtx_);
            adopted_.emplace_back(std::move(task));
        }
        std::atomic_thread_fence(std::memory_order_seq_cst);
        if (polling_.load(std::memory_order_relaxed) && polling_.exchange(false, std::memory_order_acq_rel)) {
            reactor_.notify();
        }
    }

    void worker::enqueue(task_base* task) noexcept {
        task->ref();
        woken_.push(task);
        std::atomic_thread_fence(std::memory_order_seq_cst);
        if (polling_.load(std::memory_order_relaxed) && polling_.exchange(false, std::memory_order_acq_rel)) {
            reactor_.notify();
        }
    }

    void worker::notify() noexcept {
        std::atomic_thread_fence(std::memory_order_seq_cst);
        reactor_.notify();
    }

    bool worker::should_stop() const noexcept {
        return parent_->stopping() || parent_->live_tasks() == 0;
    }

    bool worker::has_incoming() const {
        if (!woken_.empty()) {
            return true;
        }
        std::lock_guard<std::mutex> guard(adopt_mtx_);
        return !adopted_.empty();
    }

    void worker::drain_incoming() {
        std::vector<task_ptr> adopted;
        {
            std::lock_guard<std::mutex> guard(adopt_mtx_);
            adopted.swap(adopted_);
        }
        for (auto& task : adopted) {
            auto* raw = task.get();
            auto id = raw->id();
            tasks_.emplace(id, std::move(task));
            if (raw->initially_ready()) {
                ready_.push_back(raw);
            }
        }

        auto* node = woken_.take_all();
        while (node) {
            auto* next = node->next_node;
            node->next_node = nullptr;
            task_ptr task(node, detail::adopt_ref);
            // a wake can overtake the adoption of a task that was spawned waiting
            tasks_.emplace(node->id(), task);
            ready_.push_back(node);
            node = next;
        }
    }

    void worker::run_task(task_base* task) {
        task->begin_run();
        auto result = step_result::finished;
        try {
            result = task->step();
        } catch (const std::exception& e) {
            ACTOR_THETA_LOG_ERROR("worker {}: task {} threw out of its step, stopping it: {}", id_, task->id(), e.what());
        } catch (...) {
            ACTOR_THETA_LOG_ERROR("worker {}: task {} threw out of its step, stopping it", id_, task->id());
        }
        if (task->end_run(result)) {
            ready_.push_back(task);
            return;
        }
        if (result != step_result::finished) {
            return;
        }

        auto id = task->id();
        task->teardown();
        ACTOR_THETA_LOG_TRACE("worker {}: task {} finished", id_, id);
        tasks_.erase(id);
        parent_->task_finished();
    }

    int worker::poll_timeout() const {
        if (!ready_.empty()) {
            return 0;
        }
        auto deadline = timers_.next_deadline();
        if (!deadline) {
            return -1;
        }
        auto now = clock::now();
        if (*deadline <= now) {
            return 0;
        }
        auto wait = std::chrono::ceil<std::chrono::milliseconds>(*deadline - now);
        return static_cast<int>(std::min<std::chrono::milliseconds::rep>(wait.count(), 60 * 60 * 1000));
    }

    void worker::wake_local(task_id id) {
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return;
        }
        auto* task = it->second.get();
        if (task->schedule_if_waiting()) {
            ready_.push_back(task);
        }
    }

    void worker::poll_events() {
        int timeout = poll_timeout();
        if (timeout != 0) {
            polling_.store(true, std::memory_order_relaxed);
            std::atomic_thread_fence(std::memory_order_seq_cst);
            if (has_incoming() || should_stop()) {
                timeout = 0;
            }
        }

        auto ec = reactor_.poll(timeout, [this](task_id id) {
            auto it = tasks_.find(id);
            if (it == tasks_.end()) {
                return;
            }
            it->second->set_io_ready(true);
            wake_local(id);
        });
        polling_.store(false, std::memory_order_relaxed);

        if (ec) {
            ACTOR_THETA_LOG_ERROR("worker {}: polling failed: {}", id_, ec.message());
            parent_->request_shutdown(ec);
        }

        timers_.expire(clock::now(), [this](task_id id, uint64_t timer) {
            auto it = tasks_.find(id);
            if (it == tasks_.end()) {
                return;
            }
            it->second->on_timer_expired(timer);
            wake_local(id);
        });
    }

    void worker::run() {
        ACTOR_THETA_LOG_DEBUG("worker {}: started", id_);
        for (;;) {
            drain_incoming();
            if (should_stop()) {
                break;
            }

            size_t processed = 0;
            while (processed < max_throughput_ && !ready_.empty()) {
                auto* task = ready_.front();
                ready_.pop_front();
                run_task(task);
                ++processed;
            }

            if (should_stop()) {
                break;
            }
            poll_events();
        }
        ACTOR_THETA_LOG_DEBUG("worker {}: stopped with {} task(s) left", id_, tasks_.size());
    }

    void worker::finish_all() noexcept {
        for (auto& entry : tasks_) {
            entry.second->force_finish();
        }
        std::lock_guard<std::mutex> guard(adopt_mtx_);
        for (auto& task : adopted_) {
            task->force_finish();
        }
    }

    void worker::teardown_all() noexcept {
        for (auto& entry : tasks_) {
            entry.second->teardown();
        }
        std::lock_guard<std::mutex> guard(adopt_mtx_);
        for (auto& task : adopted_) {
            task->teardown();
        }
    }

    void worker::release_queues() noexcept {
        ready_.clear();
        auto* node = woken_.take_all();
        size_t dropped = 0;
        while (node) {
            auto* next = node->next_node;
            node->next_node = nullptr;
            node->deref();
            node = next;
            ++dropped;
        }
        if (dropped > 0) {
            ACTOR_THETA_LOG_TRACE("worker {}: dropped {} pending wake(s)", id_, dropped);
        }
        tasks_.clear();
        std::lock_guard<std::mutex> guard(adopt_mtx_);
        adopted_.clear();
    }

}} // namespace actor_theta::scheduler
