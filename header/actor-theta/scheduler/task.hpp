#pragma once

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <utility>
#include <vector>

#include <actor-theta/detail/ref_counted.hpp>
#include <actor-theta/detail/singly_linked.hpp>
#include <actor-theta/inbox/waker.hpp>

namespace actor_theta { namespace scheduler {

    using task_id = uint64_t;

    class worker;

    enum class task_state : uint8_t {
        not_scheduled,
        scheduled,
        running,
        running_notified,
        waiting,
        finished
    };

    enum class wait_reason : uint8_t {
        none,
        inbox,
        timer,
        io
    };

    /// outcome of resuming a task once
    enum class step_result {
        yield,
        waiting,
        finished
    };

    /// @brief Everything the workers know about an actor.
    ///
    /// The state word is the only part touched from foreign threads (through
    /// `wake()`); the rest belongs to the owning worker.
    class task_base
        : public detail::ref_counted
        , public detail::singly_linked<task_base> {
    public:
        explicit task_base(task_id id) noexcept
            : id_(id) {}

        ~task_base() override = default;

        task_id id() const noexcept {
            return id_;
        }

        task_state state() const noexcept {
            return state_.load(std::memory_order_acquire);
        }

        worker* owner() const noexcept {
            return owner_;
        }

        void bind(worker* w, bool ready) noexcept {
            owner_ = w;
            state_.store(ready ? task_state::scheduled : task_state::waiting, std::memory_order_release);
            initially_ready_ = ready;
        }

        bool initially_ready() const noexcept {
            return initially_ready_;
        }

        wait_reason reason() const noexcept {
            return reason_;
        }

        void set_reason(wait_reason reason) noexcept {
            reason_ = reason;
        }

        /// @brief Safe from any thread. Re-queues a waiting task on its worker.
        void wake() noexcept;

        /// @return true when the caller now has to enqueue the task
        bool schedule_if_waiting() noexcept {
            auto current = state_.load(std::memory_order_acquire);
            for (;;) {
                switch (current) {
                    case task_state::waiting:
                        if (state_.compare_exchange_weak(current, task_state::scheduled, std::memory_order_acq_rel, std::memory_order_acquire)) {
                            return true;
                        }
                        break;
                    case task_state::running:
                        if (state_.compare_exchange_weak(current, task_state::running_notified, std::memory_order_acq_rel, std::memory_order_acquire)) {
                            return false;
                        }
                        break;
                    default:
                        return false;
                }
            }
        }

        void begin_run() noexcept {
            auto expected = task_state::scheduled;
            bool ok = state_.compare_exchange_strong(expected, task_state::running, std::memory_order_acq_rel);
            assert(ok && "begin_run(): task was not scheduled");
            (void) ok;
        }

        /// @return true when the task must go back to the ready queue
        bool end_run(step_result result) noexcept {
            switch (result) {
                case step_result::yield:
                    state_.store(task_state::scheduled, std::memory_order_release);
                    return true;
                case step_result::waiting: {
                    auto expected = task_state::running;
                    if (state_.compare_exchange_strong(expected, task_state::waiting, std::memory_order_acq_rel)) {
                        return false;
                    }
                    assert(expected == task_state::running_notified);
                    state_.store(task_state::scheduled, std::memory_order_release);
                    return true;
                }
                case step_result::finished:
                    state_.store(task_state::finished, std::memory_order_release);
                    return false;
            }
            return false;
        }

        /// no further wakes are accepted once this returns
        void force_finish() noexcept {
            state_.store(task_state::finished, std::memory_order_release);
        }

        void set_io_ready(bool value) noexcept {
            io_ready_ = value;
        }

        bool io_ready() const noexcept {
            return io_ready_;
        }

        /// @brief Timers registered by the actor body itself; their expiry ends an inbox wait.
        void arm_timer(uint64_t timer) {
            armed_timers_.push_back(timer);
        }

        /// @return true if `timer` was armed and had not fired yet
        bool disarm_timer(uint64_t timer) noexcept {
            auto it = std::find(armed_timers_.begin(), armed_timers_.end(), timer);
            if (it == armed_timers_.end()) {
                return false;
            }
            *it = armed_timers_.back();
            armed_timers_.pop_back();
            return true;
        }

        void disarm_all_timers() noexcept {
            armed_timers_.clear();
            timer_fired_ = false;
        }

        void on_timer_expired(uint64_t timer) noexcept {
            if (disarm_timer(timer)) {
                timer_fired_ = true;
            }
        }

        bool timer_fired() const noexcept {
            return timer_fired_;
        }

        bool take_timer_fired() noexcept {
            return std::exchange(timer_fired_, false);
        }

        /// @brief A waker that holds a reference to this task.
        inbox::waker make_waker() noexcept {
            ref();
            return inbox::waker(this, &waker_vtable);
        }

        /// Resume once. Called by the owning worker only.
        virtual step_result step() = 0;

        /// Drop the coroutine, the inbox ends and everything else that keeps other objects alive.
        virtual void teardown() noexcept = 0;

    private:
        static void wake_fn(void* ptr) noexcept {
            static_cast<task_base*>(ptr)->wake();
        }

        static void retain_fn(void* ptr) noexcept {
            static_cast<task_base*>(ptr)->ref();
        }

        static void release_fn(void* ptr) noexcept {
            static_cast<task_base*>(ptr)->deref();
        }

        static constexpr inbox::waker::vtable waker_vtable{&wake_fn, &retain_fn, &release_fn};

        const task_id id_;
        std::atomic<task_state> state_{task_state::not_scheduled};
        worker* owner_ = nullptr;
        wait_reason reason_ = wait_reason::none;
        bool initially_ready_ = true;
        bool io_ready_ = false;
        bool timer_fired_ = false;
        std::vector<uint64_t> armed_timers_;
    };

}} // namespace actor_theta::scheduler
