#pragma once

#include <atomic>
#include <memory>
#include <memory_resource>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>

#include <actor-theta/actor/actor_task.hpp>
#include <actor-theta/actor_ref.hpp>
#include <actor-theta/context.hpp>
#include <actor-theta/detail/intrusive_ptr.hpp>
#include <actor-theta/log.hpp>
#include <actor-theta/options.hpp>
#include <actor-theta/scheduler/scheduler.hpp>
#include <actor-theta/supervisor.hpp>

namespace actor_theta {

    /// @brief Workers plus the actors spawned on them.
    ///
    /// `run()` blocks the calling thread until every actor finished without a
    /// restart, or until an actor's supervisor decided to propagate its failure.
    class runtime final {
    public:
        /// @brief Create the workers. OS failures (epoll, eventfd) come back through `ec`.
        static std::unique_ptr<runtime> make(runtime_options options, std::error_code& ec);

        runtime(const runtime&) = delete;
        runtime& operator=(const runtime&) = delete;
        ~runtime();

        template<class M, class Body, class... Args>
        actor_ref<M> spawn(const actor_options& options, supervisor_ptr sup, Body&& body, Args&&... args) {
            static_assert(std::is_invocable_r_v<behavior, std::decay_t<Body>&, context<M>&, std::decay_t<Args>&...>,
                          "actor body must be callable as behavior(context<M>&, Args...)");

            if (state_.load(std::memory_order_acquire) == run_state::finished || scheduler_.stopping()) {
                ACTOR_THETA_LOG_WARN("spawn after shutdown, the actor is not started");
                return actor_ref<M>();
            }

            auto* target = scheduler_.place(options.worker);
            if (!target) {
                return actor_ref<M>();
            }
            auto capacity = options.inbox_capacity > 0 ? options.inbox_capacity : options_.default_inbox_capacity;

            using task_type = actor::actor_task<M, std::decay_t<Body>, std::decay_t<Args>...>;
            auto task = detail::make_counted<task_type>(
                scheduler_.next_task_id(),
                this,
                options_.resource,
                capacity,
                std::move(sup),
                std::forward<Body>(body),
                std::make_tuple(std::forward<Args>(args)...));

            task->bind(target, options.mark_ready);
            task->prepare(options.mark_ready);
            auto ref = task->make_ref();
            ACTOR_THETA_LOG_TRACE("spawned actor {} on worker {}", task->id(), target->id());
            scheduler_.submit(target, std::move(task));
            return ref;
        }

        template<class M, class Body, class... Args>
        actor_ref<M> spawn(supervisor_ptr sup, Body&& body, Args&&... args) {
            return spawn<M>(actor_options{}, std::move(sup), std::forward<Body>(body), std::forward<Args>(args)...);
        }

        /// @return the propagated failure, errc::runtime_not_running if called twice
        std::error_code run();

        /// @brief Ask every worker to stop, any thread.
        void shutdown(std::error_code reason = {});

        size_t num_workers() const noexcept {
            return scheduler_.num_workers();
        }

        size_t live_actors() const noexcept {
            return scheduler_.live_tasks();
        }

        std::pmr::memory_resource* resource() const noexcept {
            return options_.resource;
        }

        const runtime_options& options() const noexcept {
            return options_;
        }

    private:
        enum class run_state {
            created,
            running,
            finished
        };

        explicit runtime(runtime_options options);

        runtime_options options_;
        scheduler::scheduler_t scheduler_;
        std::atomic<run_state> state_{run_state::created};
    };

    template<class M, class Body, class... Args>
    actor_ref<M> context_base::spawn(actor_options options, supervisor_ptr sup, Body&& body, Args&&... args) {
        if (!options.worker) {
            options.worker = worker().id();
        }
        return system().spawn<M>(options, std::move(sup), std::forward<Body>(body), std::forward<Args>(args)...);
    }

} // namespace actor_theta
