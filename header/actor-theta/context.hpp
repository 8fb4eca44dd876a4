#pragma once

#include <cassert>
#include <coroutine>
#include <memory_resource>
#include <optional>
#include <system_error>
#include <utility>

#include <actor-theta/actor_ref.hpp>
#include <actor-theta/behavior.hpp>
#include <actor-theta/inbox.hpp>
#include <actor-theta/options.hpp>
#include <actor-theta/scheduler/reactor.hpp>
#include <actor-theta/scheduler/task.hpp>
#include <actor-theta/scheduler/timer_wheel.hpp>
#include <actor-theta/supervisor.hpp>

namespace actor_theta {

    class runtime;

    namespace scheduler {
        class worker;
    } // namespace scheduler

    using scheduler::clock;
    using scheduler::duration;
    using scheduler::time_point;
    using scheduler::timer_token;

    class context_base;

    namespace detail {

        using promise_handle = std::coroutine_handle<behavior::promise_type>;

        class sleep_awaiter final {
        public:
            sleep_awaiter(context_base* ctx, time_point deadline) noexcept
                : ctx_(ctx)
                , deadline_(deadline) {}

            ~sleep_awaiter();

            bool await_ready() const noexcept {
                return deadline_ <= clock::now();
            }

            bool await_suspend(promise_handle h);

            void await_resume() noexcept;

        private:
            static bool poll(void* self) noexcept {
                return clock::now() >= static_cast<sleep_awaiter*>(self)->deadline_;
            }

            context_base* ctx_;
            time_point deadline_;
            timer_token token_;
        };

        class io_awaiter final {
        public:
            io_awaiter(context_base* ctx, int fd, scheduler::interest what) noexcept
                : ctx_(ctx)
                , fd_(fd)
                , what_(what) {}

            ~io_awaiter();

            bool await_ready() const noexcept {
                return false;
            }

            bool await_suspend(promise_handle h);

            /// @return the registration error, if any
            std::error_code await_resume() noexcept;

        private:
            static bool poll(void* self) noexcept;

            context_base* ctx_;
            int fd_;
            scheduler::interest what_;
            bool registered_ = false;
            std::error_code ec_;
        };

        template<class T>
        class oneshot_awaiter final {
        public:
            oneshot_awaiter(inbox::oneshot_receiver<T>* receiver, scheduler::task_base* task) noexcept
                : receiver_(receiver)
                , task_(task) {}

            bool await_ready() {
                return receiver_->try_recv(value_) != inbox::recv_result::empty;
            }

            bool await_suspend(promise_handle h) {
                if (poll(this)) {
                    return false;
                }
                h.promise().park(pending_wait{this, &oneshot_awaiter::poll, scheduler::wait_reason::inbox});
                return true;
            }

            /// @return nullopt when the sender went away without sending, or a registered timer fired
            std::optional<T> await_resume() noexcept {
                return std::move(value_);
            }

        private:
            static bool poll(void* self) {
                auto* a = static_cast<oneshot_awaiter*>(self);
                return a->receiver_->poll_recv(a->value_, a->task_->make_waker()) != inbox::recv_result::empty;
            }

            inbox::oneshot_receiver<T>* receiver_;
            scheduler::task_base* task_;
            std::optional<T> value_;
        };

        struct yield_awaiter final {
            bool await_ready() const noexcept {
                return false;
            }

            void await_suspend(promise_handle h) noexcept {
                h.promise().park(pending_wait{});
            }

            void await_resume() const noexcept {}
        };

    } // namespace detail

    /// @brief What an actor body may do besides receiving: timers, I/O waits, spawning.
    class context_base {
    public:
        context_base(runtime* rt, scheduler::task_base* task, std::pmr::memory_resource* resource) noexcept
            : runtime_(rt)
            , task_(task)
            , resource_(resource) {}

        context_base(const context_base&) = delete;
        context_base& operator=(const context_base&) = delete;

        runtime& system() const noexcept {
            assert(runtime_);
            return *runtime_;
        }

        scheduler::task_id id() const noexcept {
            return task_->id();
        }

        scheduler::task_base* task() const noexcept {
            return task_;
        }

        scheduler::worker& worker() const noexcept;

        /// frames of the actor's coroutine come from here
        std::pmr::memory_resource* resource() const noexcept {
            return resource_;
        }

        time_point now() const noexcept {
            return clock::now();
        }

        /// @brief Wake this actor once `deadline` has passed.
        ///
        /// A `receive()` that is pending when the timer fires, or the next one to
        /// find the inbox empty, completes with nullopt. Tell it apart from a
        /// disconnected inbox with `timer_expired()` or `inbox_connected()`.
        timer_token register_timer(time_point deadline);

        bool cancel_timer(const timer_token& token);

        /// a plain wakeup for the awaiters, unlike register_timer it never ends a receive
        timer_token add_wakeup(time_point deadline);

        void cancel_wakeup(const timer_token& token);

        bool timer_expired(const timer_token& token) const noexcept {
            return clock::now() >= token.deadline;
        }

        detail::sleep_awaiter sleep_until(time_point deadline) noexcept {
            return detail::sleep_awaiter(this, deadline);
        }

        detail::sleep_awaiter sleep_for(duration d) noexcept {
            return detail::sleep_awaiter(this, clock::now() + d);
        }

        /// @brief Suspend until `fd` is readable, or has an error or hangup pending.
        ///
        /// One reader and one writer may wait on an fd at a time; a second
        /// reader gets `std::errc::device_or_resource_busy` right away.
        detail::io_awaiter wait_readable(int fd) noexcept {
            return detail::io_awaiter(this, fd, scheduler::interest::readable);
        }

        detail::io_awaiter wait_writable(int fd) noexcept {
            return detail::io_awaiter(this, fd, scheduler::interest::writable);
        }

        /// @brief Suspend until the value for `receiver` arrives, e.g. a reply to a request this actor sent.
        template<class T>
        detail::oneshot_awaiter<T> receive_reply(inbox::oneshot_receiver<T>& receiver) noexcept {
            return detail::oneshot_awaiter<T>(&receiver, task_);
        }

        /// let the worker run other tasks before continuing
        detail::yield_awaiter yield() noexcept {
            return {};
        }

        /// @brief Spawn a sibling actor, on this actor's worker unless the options say otherwise.
        template<class M, class Body, class... Args>
        actor_ref<M> spawn(actor_options options, supervisor_ptr sup, Body&& body, Args&&... args);

        template<class M, class Body, class... Args>
        actor_ref<M> spawn(supervisor_ptr sup, Body&& body, Args&&... args) {
            return spawn<M>(actor_options{}, std::move(sup), std::forward<Body>(body), std::forward<Args>(args)...);
        }

    protected:
        ~context_base() = default;

    private:
        runtime* runtime_;
        scheduler::task_base* task_;
        std::pmr::memory_resource* resource_;
    };

    namespace detail {

        template<class M>
        class receive_awaiter final {
        public:
            explicit receive_awaiter(inbox::receiver<M>* receiver, scheduler::task_base* task) noexcept
                : receiver_(receiver)
                , task_(task) {}

            bool await_ready() {
                return receiver_->try_recv(value_) != inbox::recv_result::empty;
            }

            bool await_suspend(promise_handle h) {
                if (poll(this)) {
                    return false;
                }
                h.promise().park(pending_wait{this, &receive_awaiter::poll, scheduler::wait_reason::inbox});
                return true;
            }

            /// @return nullopt once every strong reference to the actor is gone
            std::optional<M> await_resume() noexcept {
                return std::move(value_);
            }

        private:
            static bool poll(void* self) {
                auto* a = static_cast<receive_awaiter*>(self);
                return a->receiver_->poll_recv(a->value_, a->task_->make_waker()) != inbox::recv_result::empty;
            }

            inbox::receiver<M>* receiver_;
            scheduler::task_base* task_;
            std::optional<M> value_;
        };

        template<class M>
        class receive_until_awaiter final {
        public:
            receive_until_awaiter(inbox::receiver<M>* receiver, context_base* ctx, time_point deadline) noexcept
                : receiver_(receiver)
                , ctx_(ctx)
                , deadline_(deadline) {}

            ~receive_until_awaiter() {
                cancel();
            }

            bool await_ready() {
                return receiver_->try_recv(value_) != inbox::recv_result::empty || deadline_ <= clock::now();
            }

            bool await_suspend(promise_handle h) {
                if (poll(this)) {
                    return false;
                }
                token_ = ctx_->add_wakeup(deadline_);
                h.promise().park(pending_wait{this, &receive_until_awaiter::poll, scheduler::wait_reason::inbox});
                return true;
            }

            /// @return nullopt on timeout or disconnection
            std::optional<M> await_resume() {
                cancel();
                return std::move(value_);
            }

        private:
            static bool poll(void* self) {
                auto* a = static_cast<receive_until_awaiter*>(self);
                if (a->receiver_->poll_recv(a->value_, a->ctx_->task()->make_waker()) != inbox::recv_result::empty) {
                    return true;
                }
                return clock::now() >= a->deadline_;
            }

            void cancel() {
                if (token_.valid()) {
                    ctx_->cancel_wakeup(token_);
                    token_ = timer_token{};
                }
            }

            inbox::receiver<M>* receiver_;
            context_base* ctx_;
            time_point deadline_;
            timer_token token_;
            std::optional<M> value_;
        };

    } // namespace detail

    /// @brief Handed to every actor body; owns nothing but reaches the actor's inbox.
    template<class M>
    class context final : public context_base {
    public:
        using message_type = M;

        context(runtime* rt, scheduler::task_base* task, std::pmr::memory_resource* resource) noexcept
            : context_base(rt, task, resource) {}

        /// suspends until a message arrives, nullopt once the inbox is disconnected
        detail::receive_awaiter<M> receive() noexcept {
            assert(receiver_);
            return detail::receive_awaiter<M>(receiver_, task());
        }

        detail::receive_until_awaiter<M> receive_until(time_point deadline) noexcept {
            assert(receiver_);
            return detail::receive_until_awaiter<M>(receiver_, this, deadline);
        }

        detail::receive_until_awaiter<M> receive_for(duration timeout) noexcept {
            return receive_until(clock::now() + timeout);
        }

        std::optional<M> try_receive() {
            assert(receiver_);
            return receiver_->try_recv();
        }

        /// true while a strong reference to this actor exists
        bool inbox_connected() const noexcept {
            return receiver_ && receiver_->is_connected();
        }

        size_t inbox_len() const noexcept {
            return receiver_ ? receiver_->len() : 0;
        }

        /// @brief A weak reference to this actor; holding it never keeps the actor alive.
        actor_ref<M> self() const noexcept {
            if (!receiver_) {
                return actor_ref<M>();
            }
            return actor_ref<M>(receiver_->new_weak_sender());
        }

        void attach(inbox::receiver<M>* receiver) noexcept {
            receiver_ = receiver;
        }

    private:
        inbox::receiver<M>* receiver_ = nullptr;
    };

} // namespace actor_theta
