#pragma once

#include <cassert>
#include <concepts>
#include <coroutine>
#include <exception>
#include <memory_resource>
#include <system_error>
#include <type_traits>
#include <utility>

#include <actor-theta/config.hpp>
#include <actor-theta/detail/coro_frame_header.hpp>
#include <actor-theta/scheduler/task.hpp>

namespace actor_theta {

    namespace detail {

        template<typename T>
        concept has_resource_method = requires(T* t) {
            { t->resource() } -> std::convertible_to<std::pmr::memory_resource*>;
        };

        /// @brief The suspension an actor is parked on.
        ///
        /// `poll` is asked before the coroutine is resumed; while it answers
        /// false the task stays waiting and resuming would be spurious.
        struct pending_wait {
            void* awaiter = nullptr;
            bool (*poll)(void*) = nullptr;
            scheduler::wait_reason reason = scheduler::wait_reason::none;

            explicit operator bool() const noexcept {
                return poll != nullptr;
            }
        };

    } // namespace detail

    /// @brief Return type of every actor body: `behavior body(context<M>& ctx, Args...)`.
    ///
    /// The coroutine starts suspended and is driven one step at a time by its
    /// task. `co_return {};` ends the actor normally, any other error code (or an
    /// escaping exception) is reported to the supervisor.
    class behavior final {
    public:
        class promise_type {
        public:
            promise_type() noexcept = default;

            behavior get_return_object() noexcept {
                return behavior(std::coroutine_handle<promise_type>::from_promise(*this));
            }

            std::suspend_always initial_suspend() const noexcept {
                return {};
            }

            std::suspend_always final_suspend() const noexcept {
                return {};
            }

            void return_value(std::error_code ec) noexcept {
                result_ = ec;
            }

            void unhandled_exception() noexcept {
                exception_ = std::current_exception();
            }

            template<typename... Args>
            static void* operator new(std::size_t size, const Args&... args) {
                return detail::allocate_coro_frame(extract_resource_from_args(args...), size);
            }

            static void operator delete(void* ptr) noexcept {
                detail::deallocate_coro_frame(ptr);
            }

            void park(const detail::pending_wait& wait) noexcept {
                pending_ = wait;
            }

            detail::pending_wait& pending() noexcept {
                return pending_;
            }

            const std::error_code& result() const noexcept {
                return result_;
            }

            std::exception_ptr exception() const noexcept {
                return exception_;
            }

        private:
            template<typename U>
            static std::pmr::memory_resource* extract_resource_impl(const U& arg) noexcept {
                if constexpr (std::is_convertible_v<const U&, std::pmr::memory_resource*>) {
                    return arg;
                } else if constexpr (detail::has_resource_method<const U>) {
                    return arg.resource();
                } else {
                    return nullptr;
                }
            }

            static std::pmr::memory_resource* extract_resource_from_args() noexcept {
                return nullptr;
            }

            // the first argument that is or carries a memory resource wins
            template<typename First, typename... Rest>
            static std::pmr::memory_resource* extract_resource_from_args(const First& first, const Rest&... rest) noexcept {
                if (auto* res = extract_resource_impl(first)) {
                    return res;
                }
                return extract_resource_from_args(rest...);
            }

            detail::pending_wait pending_;
            std::error_code result_;
            std::exception_ptr exception_;
        };

        using handle_type = std::coroutine_handle<promise_type>;

        behavior() noexcept = default;

        behavior(const behavior&) = delete;
        behavior& operator=(const behavior&) = delete;

        behavior(behavior&& other) noexcept
            : handle_(std::exchange(other.handle_, nullptr)) {}

        behavior& operator=(behavior&& other) noexcept {
            if (this != &other) {
                reset();
                handle_ = std::exchange(other.handle_, nullptr);
            }
            return *this;
        }

        ~behavior() {
            reset();
        }

        bool valid() const noexcept {
            return static_cast<bool>(handle_);
        }

        bool done() const noexcept {
            assert(handle_);
            return handle_.done();
        }

        void resume() {
            assert(handle_ && !handle_.done());
            handle_.resume();
        }

        promise_type& promise() noexcept {
            assert(handle_);
            return handle_.promise();
        }

        void reset() noexcept {
            if (handle_) {
                std::exchange(handle_, nullptr).destroy();
            }
        }

    private:
        explicit behavior(handle_type h) noexcept
            : handle_(h) {}

        handle_type handle_;
    };

} // namespace actor_theta
