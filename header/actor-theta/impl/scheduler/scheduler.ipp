#pragma once

#include <actor-theta/log.hpp>
#include <actor-theta/scheduler/scheduler.hpp>

namespace actor_theta { namespace scheduler {

    scheduler_t::scheduler_t(size_t num_worker_threads, size_t max_throughput_param, duration timer_tick)
        : max_throughput_(max_throughput_param)
        , num_workers_(num_worker_threads)
        , timer_tick_(timer_tick) {
    }

    scheduler_t::~scheduler_t() {
        stop();
    }

    std::error_code scheduler_t::init() {
        workers_.reserve(num_workers_);
        for (size_t i = 0; i < num_workers_; ++i) {
            auto w = std::make_unique<worker>(i, this, max_throughput_, timer_tick_);
            if (auto ec = w->init()) {
                workers_.clear();
                return ec;
            }
            workers_.emplace_back(std::move(w));
        }
        return {};
    }

    void scheduler_t::start(const std::string& thread_name_prefix) {
        for (auto& w : workers_) {
            w->start(thread_name_prefix + "-" + std::to_string(w->id()));
        }
    }

    void scheduler_t::stop() {
        for (auto& w : workers_) {
            w->join(); /// wait until all workers finish working
        }

        // three passes so that a teardown waking a task on another worker never re-queues it
        for (auto& w : workers_) {
            w->finish_all();
        }
        for (auto& w : workers_) {
            w->teardown_all();
        }
        for (auto& w : workers_) {
            w->release_queues();
        }
    }

    worker* scheduler_t::place(std::optional<size_t> hint) {
        if (workers_.empty()) {
            return nullptr;
        }
        if (hint) {
            if (*hint >= workers_.size()) {
                ACTOR_THETA_LOG_ERROR("worker {} requested, the runtime has {} worker(s)", *hint, workers_.size());
                return nullptr;
            }
            return workers_[*hint].get();
        }
        auto index = next_worker_.fetch_add(1, std::memory_order_relaxed) % workers_.size();
        return workers_[index].get();
    }

    void scheduler_t::submit(worker* target, detail::intrusive_ptr<task_base> task) {
        live_tasks_.fetch_add(1, std::memory_order_acq_rel);
        target->adopt(std::move(task));
    }

    void scheduler_t::task_finished() noexcept {
        if (live_tasks_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            ACTOR_THETA_LOG_DEBUG("last task finished, stopping {} worker(s)", workers_.size());
            notify_all();
        }
    }

    void scheduler_t::request_shutdown(std::error_code reason) {
        {
            std::lock_guard<std::mutex> guard(reason_mtx_);
            if (reason && !reason_) {
                reason_ = reason;
            }
        }
        if (!stopping_.exchange(true, std::memory_order_acq_rel)) {
            ACTOR_THETA_LOG_DEBUG("shutdown requested: {}", reason ? reason.message() : std::string("no error"));
        }
        notify_all();
    }

    std::error_code scheduler_t::shutdown_reason() const {
        std::lock_guard<std::mutex> guard(reason_mtx_);
        return reason_;
    }

    void scheduler_t::notify_all() noexcept {
        for (auto& w : workers_) {
            w->notify();
        }
    }

}} // namespace actor_theta::scheduler
