#pragma once

#include <actor-theta/errors.hpp>
#include <actor-theta/log.hpp>
#include <actor-theta/runtime.hpp>

namespace actor_theta {

    void request_runtime_shutdown(runtime& rt, std::error_code reason) {
        rt.shutdown(reason);
    }

    runtime::runtime(runtime_options options)
        : options_(std::move(options))
        , scheduler_(options_.num_workers, options_.max_throughput, options_.timer_tick) {
    }

    runtime::~runtime() {
        scheduler_.request_shutdown();
        scheduler_.stop();
    }

    std::unique_ptr<runtime> runtime::make(runtime_options options, std::error_code& ec) {
        ec.clear();
        if (options.log_level) {
            log::set_level(*options.log_level);
        }

        if (options.num_workers == 0) {
            ec = make_error_code(errc::no_workers);
            ACTOR_THETA_LOG_ERROR("cannot start runtime: {}", ec.message());
            return nullptr;
        }
        if (!options.resource) {
            options.resource = std::pmr::get_default_resource();
        }

        std::unique_ptr<runtime> rt(new runtime(std::move(options)));
        if (auto init_ec = rt->scheduler_.init()) {
            ec = init_ec;
            ACTOR_THETA_LOG_ERROR("cannot start runtime: {}", ec.message());
            return nullptr;
        }
        ACTOR_THETA_LOG_DEBUG("runtime created with {} worker(s)", rt->num_workers());
        return rt;
    }

    std::error_code runtime::run() {
        auto expected = run_state::created;
        if (!state_.compare_exchange_strong(expected, run_state::running, std::memory_order_acq_rel)) {
            return make_error_code(errc::runtime_not_running);
        }

        ACTOR_THETA_LOG_DEBUG("runtime running {} actor(s)", scheduler_.live_tasks());
        scheduler_.start(options_.thread_name_prefix);
        scheduler_.stop();
        state_.store(run_state::finished, std::memory_order_release);

        auto reason = scheduler_.shutdown_reason();
        if (reason) {
            ACTOR_THETA_LOG_WARN("runtime stopped: {}", reason.message());
        }
        return reason;
    }

    void runtime::shutdown(std::error_code reason) {
        scheduler_.request_shutdown(reason);
    }

} // namespace actor_theta
