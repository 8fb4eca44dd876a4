#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>

namespace actor_theta {

    enum class supervisor_strategy {
        restart,
        stop,
        propagate
    };

    const char* to_string(supervisor_strategy strategy) noexcept;

    /// @brief Why an actor body ended abnormally: a returned error or a captured exception.
    struct actor_failure {
        std::error_code code;
        std::exception_ptr exception;

        std::string what() const;
    };

    class supervisor {
    public:
        virtual ~supervisor() = default;

        virtual supervisor_strategy decide(const actor_failure& failure) = 0;

        /// called when building the restarted body itself fails
        virtual supervisor_strategy decide_on_restart_error(const actor_failure& failure) {
            (void) failure;
            return supervisor_strategy::stop;
        }
    };

    using supervisor_ptr = std::unique_ptr<supervisor>;

    class stop_supervisor final : public supervisor {
    public:
        supervisor_strategy decide(const actor_failure&) override {
            return supervisor_strategy::stop;
        }
    };

    class propagate_supervisor final : public supervisor {
    public:
        supervisor_strategy decide(const actor_failure&) override {
            return supervisor_strategy::propagate;
        }
    };

    /// @brief Restart until more than `max_restarts` failures happened within `window`, then stop.
    class restart_supervisor final : public supervisor {
    public:
        using clock = std::chrono::steady_clock;

        explicit restart_supervisor(size_t max_restarts = 5, clock::duration window = std::chrono::seconds(5)) noexcept
            : max_restarts_(max_restarts)
            , window_(window) {}

        supervisor_strategy decide(const actor_failure& failure) override;

        size_t restarts() const noexcept {
            return total_;
        }

    private:
        size_t max_restarts_;
        clock::duration window_;
        size_t total_ = 0;
        std::deque<clock::time_point> recent_;
    };

    template<class F>
    class function_supervisor final : public supervisor {
    public:
        explicit function_supervisor(F fn)
            : fn_(std::move(fn)) {}

        supervisor_strategy decide(const actor_failure& failure) override {
            return fn_(failure);
        }

    private:
        F fn_;
    };

    /// @brief Implemented by supervisors that hand a restarted body new arguments.
    ///
    /// Asked right after `decide()` returned `restart`; nullopt keeps the
    /// arguments the failed body ran with.
    template<class... Args>
    class restart_args_provider {
    public:
        virtual ~restart_args_provider() = default;

        virtual std::optional<std::tuple<Args...>> restart_args(const actor_failure& failure) = 0;
    };

    /// @brief Restart with whatever arguments `fn` returns, stop when it returns nullopt.
    template<class F, class... Args>
    class restart_with_supervisor final
        : public supervisor
        , public restart_args_provider<Args...> {
    public:
        explicit restart_with_supervisor(F fn)
            : fn_(std::move(fn)) {}

        supervisor_strategy decide(const actor_failure& failure) override {
            next_ = fn_(failure);
            return next_ ? supervisor_strategy::restart : supervisor_strategy::stop;
        }

        std::optional<std::tuple<Args...>> restart_args(const actor_failure&) override {
            return std::exchange(next_, std::nullopt);
        }

    private:
        F fn_;
        std::optional<std::tuple<Args...>> next_;
    };

    template<class... Args, class F>
        requires std::is_invocable_r_v<std::optional<std::tuple<Args...>>, F&, const actor_failure&>
    supervisor_ptr make_restart_supervisor(F&& fn) {
        return std::make_unique<restart_with_supervisor<std::decay_t<F>, Args...>>(std::forward<F>(fn));
    }

    template<class F>
        requires std::is_invocable_r_v<supervisor_strategy, F&, const actor_failure&>
    supervisor_ptr make_supervisor(F&& fn) {
        return std::make_unique<function_supervisor<std::decay_t<F>>>(std::forward<F>(fn));
    }

    template<class S, class... Args>
        requires std::is_base_of_v<supervisor, S>
    supervisor_ptr make_supervisor(Args&&... args) {
        return std::make_unique<S>(std::forward<Args>(args)...);
    }

} // namespace actor_theta
