#pragma once

#include <actor-theta/context.hpp>
#include <actor-theta/log.hpp>
#include <actor-theta/scheduler/worker.hpp>

namespace actor_theta {

    scheduler::worker& context_base::worker() const noexcept {
        assert(task_->owner());
        return *task_->owner();
    }

    timer_token context_base::register_timer(time_point deadline) {
        auto token = worker().timers().add(deadline, task_->id());
        task_->arm_timer(token.id);
        return token;
    }

    bool context_base::cancel_timer(const timer_token& token) {
        task_->disarm_timer(token.id);
        return worker().timers().cancel(token);
    }

    timer_token context_base::add_wakeup(time_point deadline) {
        return worker().timers().add(deadline, task_->id());
    }

    void context_base::cancel_wakeup(const timer_token& token) {
        worker().timers().cancel(token);
    }

    namespace detail {

        sleep_awaiter::~sleep_awaiter() {
            await_resume();
        }

        bool sleep_awaiter::await_suspend(promise_handle h) {
            token_ = ctx_->add_wakeup(deadline_);
            h.promise().park(pending_wait{this, &sleep_awaiter::poll, scheduler::wait_reason::timer});
            return true;
        }

        void sleep_awaiter::await_resume() noexcept {
            if (token_.valid()) {
                ctx_->cancel_wakeup(token_);
                token_ = timer_token{};
            }
        }

        io_awaiter::~io_awaiter() {
            if (registered_) {
                if (auto ec = ctx_->worker().io().unwatch(fd_, what_, ctx_->id())) {
                    ACTOR_THETA_LOG_DEBUG("task {}: dropping watch on fd {} failed: {}", ctx_->id(), fd_, ec.message());
                }
            }
        }

        bool io_awaiter::await_suspend(promise_handle h) {
            auto* task = ctx_->task();
            task->set_io_ready(false);
            ec_ = ctx_->worker().io().watch(fd_, what_, task->id());
            if (ec_) {
                return false;
            }
            registered_ = true;
            h.promise().park(pending_wait{this, &io_awaiter::poll, scheduler::wait_reason::io});
            return true;
        }

        std::error_code io_awaiter::await_resume() noexcept {
            if (registered_) {
                registered_ = false;
                auto ec = ctx_->worker().io().unwatch(fd_, what_, ctx_->id());
                if (!ec_ && ec) {
                    ec_ = ec;
                }
            }
            return ec_;
        }

        bool io_awaiter::poll(void* self) noexcept {
            auto* a = static_cast<io_awaiter*>(self);
            return a->ctx_->task()->io_ready();
        }

    } // namespace detail

} // namespace actor_theta
