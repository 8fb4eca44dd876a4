#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <memory_resource>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>

#include <actor-theta/actor_ref.hpp>
#include <actor-theta/behavior.hpp>
#include <actor-theta/context.hpp>
#include <actor-theta/errors.hpp>
#include <actor-theta/inbox.hpp>
#include <actor-theta/log.hpp>
#include <actor-theta/scheduler/task.hpp>
#include <actor-theta/supervisor.hpp>

namespace actor_theta {

    void request_runtime_shutdown(runtime& rt, std::error_code reason);

    namespace actor {

        /// @brief An actor as the workers see it: its body, its inbox and its supervisor.
        ///
        /// The inbox is held through a manager so a restarted body reads the same
        /// inbox, queued messages included. `Args` are kept for every restart and
        /// handed to the body as lvalues, unless the supervisor is a
        /// `restart_args_provider<Args...>` that supplies new ones.
        template<class M, class Body, class... Args>
        class actor_task final : public scheduler::task_base {
        public:
            actor_task(scheduler::task_id id,
                       runtime* rt,
                       std::pmr::memory_resource* resource,
                       size_t inbox_capacity,
                       supervisor_ptr sup,
                       Body body,
                       std::tuple<Args...> args)
                : task_base(id)
                , manager_(resource, inbox_capacity)
                , supervisor_(sup ? std::move(sup) : std::make_unique<stop_supervisor>())
                , body_(std::move(body))
                , args_(std::move(args))
                , context_(rt, this, resource) {
            }

            ~actor_task() override {
                teardown();
            }

            actor_ref<M> make_ref() const noexcept {
                return actor_ref<M>(manager_.new_sender());
            }

            /// @brief Connect the receiver. A task that is not ready waits for its first message.
            void prepare(bool ready) {
                attach_receiver();
                if (!ready) {
                    receiver_.register_waker(make_waker());
                }
            }

            size_t restarts() const noexcept {
                return restarts_;
            }

            scheduler::step_result step() override {
                if (!body_coro_.valid()) {
                    if (auto failure = start()) {
                        return on_failure(*failure, restarting_);
                    }
                    restarting_ = false;
                }

                auto& promise = body_coro_.promise();
                try {
                    auto& wait = promise.pending();
                    if (wait) {
                        // an armed timer that fired ends an inbox wait even without a message
                        if (!wait.poll(wait.awaiter) && !(wait.reason == scheduler::wait_reason::inbox && take_timer_fired())) {
                            set_reason(wait.reason);
                            return scheduler::step_result::waiting;
                        }
                        wait = detail::pending_wait{};
                    }
                    body_coro_.resume();
                } catch (...) {
                    return on_failure(actor_failure{make_error_code(errc::actor_panicked), std::current_exception()}, false);
                }

                if (body_coro_.done()) {
                    if (auto exception = promise.exception()) {
                        return on_failure(actor_failure{make_error_code(errc::actor_panicked), exception}, false);
                    }
                    if (auto ec = promise.result()) {
                        return on_failure(actor_failure{ec, nullptr}, false);
                    }
                    return scheduler::step_result::finished;
                }

                auto& wait = promise.pending();
                if (!wait || (wait.reason == scheduler::wait_reason::inbox && timer_fired())) {
                    set_reason(scheduler::wait_reason::none);
                    return scheduler::step_result::yield;
                }
                set_reason(wait.reason);
                return scheduler::step_result::waiting;
            }

            void teardown() noexcept override {
                body_coro_.reset();
                context_.attach(nullptr);
                receiver_.reset();
                manager_.reset();
                args_.reset();
            }

        private:
            void attach_receiver() {
                std::error_code ec;
                receiver_ = manager_.new_receiver(ec);
                if (ec) {
                    ACTOR_THETA_LOG_ERROR("actor {}: cannot attach inbox receiver: {}", id(), ec.message());
                }
                context_.attach(&receiver_);
            }

            std::optional<actor_failure> start() {
                if (!args_) {
                    return actor_failure{make_error_code(errc::shutdown), nullptr};
                }
                try {
                    body_coro_ = std::apply(
                        [this](Args&... args) -> behavior {
                            return std::invoke(body_, context_, args...);
                        },
                        *args_);
                } catch (...) {
                    return actor_failure{make_error_code(errc::actor_panicked), std::current_exception()};
                }
                return std::nullopt;
            }

            scheduler::step_result on_failure(const actor_failure& failure, bool during_restart) {
                body_coro_.reset();
                disarm_all_timers();

                supervisor_strategy decision = supervisor_strategy::stop;
                std::string reason;
                try {
                    reason = failure.what();
                    decision = during_restart ? supervisor_->decide_on_restart_error(failure) : supervisor_->decide(failure);
                    if (decision == supervisor_strategy::restart) {
                        take_restart_args(failure);
                    }
                } catch (const std::exception& e) {
                    ACTOR_THETA_LOG_ERROR("actor {}: supervisor threw while handling a failure, stopping the actor: {}", id(), e.what());
                    return scheduler::step_result::finished;
                } catch (...) {
                    ACTOR_THETA_LOG_ERROR("actor {}: supervisor threw while handling a failure, stopping the actor", id());
                    return scheduler::step_result::finished;
                }

                switch (decision) {
                    case supervisor_strategy::restart:
                        ++restarts_;
                        ACTOR_THETA_LOG_WARN("actor {} failed ({}), restart #{}", id(), reason, restarts_);
                        receiver_.reset();
                        attach_receiver();
                        restarting_ = true;
                        // the new body runs on the next step, right after this one
                        return scheduler::step_result::yield;
                    case supervisor_strategy::stop:
                        ACTOR_THETA_LOG_ERROR("actor {} failed ({}), stopping it", id(), reason);
                        return scheduler::step_result::finished;
                    case supervisor_strategy::propagate:
                        ACTOR_THETA_LOG_ERROR("actor {} failed ({}), stopping the runtime", id(), reason);
                        request_runtime_shutdown(context_.system(), failure.code);
                        return scheduler::step_result::finished;
                }
                return scheduler::step_result::finished;
            }

            void take_restart_args(const actor_failure& failure) {
                auto* provider = dynamic_cast<restart_args_provider<Args...>*>(supervisor_.get());
                if (!provider) {
                    return;
                }
                if (auto next = provider->restart_args(failure)) {
                    args_.emplace(std::move(*next));
                }
            }

            inbox::manager<M> manager_;
            inbox::receiver<M> receiver_;
            supervisor_ptr supervisor_;
            Body body_;
            std::optional<std::tuple<Args...>> args_;
            context<M> context_;
            behavior body_coro_;
            size_t restarts_ = 0;
            bool restarting_ = false;
        };

    } // namespace actor

} // namespace actor_theta
