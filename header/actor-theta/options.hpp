#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <actor-theta/log.hpp>

namespace actor_theta {

    struct runtime_options {
        size_t num_workers = std::max<size_t>(std::thread::hardware_concurrency(), 1);
        /// tasks resumed per loop iteration before the worker polls for events
        size_t max_throughput = 32;
        size_t default_inbox_capacity = 8;
        std::chrono::steady_clock::duration timer_tick = std::chrono::milliseconds(1);
        /// process-wide log level applied by runtime::make, left alone when unset
        std::optional<log::level> log_level;
        std::pmr::memory_resource* resource = std::pmr::get_default_resource();
        std::string thread_name_prefix = "actor-theta";

        runtime_options& with_workers(size_t n) {
            num_workers = n;
            return *this;
        }

        runtime_options& with_max_throughput(size_t n) {
            max_throughput = n;
            return *this;
        }

        runtime_options& with_inbox_capacity(size_t n) {
            default_inbox_capacity = n;
            return *this;
        }

        runtime_options& with_timer_tick(std::chrono::steady_clock::duration tick) {
            timer_tick = tick;
            return *this;
        }

        runtime_options& with_log_level(log::level lvl) {
            log_level = lvl;
            return *this;
        }

        runtime_options& with_resource(std::pmr::memory_resource* res) {
            resource = res;
            return *this;
        }

        runtime_options& with_thread_name_prefix(std::string prefix) {
            thread_name_prefix = std::move(prefix);
            return *this;
        }
    };

    struct actor_options {
        /// 0 takes the runtime default
        size_t inbox_capacity = 0;
        /// pin to a worker, round-robin otherwise
        std::optional<size_t> worker;
        /// run the body right away instead of waiting for the first message
        bool mark_ready = true;

        actor_options& with_inbox_capacity(size_t n) {
            inbox_capacity = n;
            return *this;
        }

        actor_options& with_worker(size_t index) {
            worker = index;
            return *this;
        }

        actor_options& with_mark_ready(bool ready) {
            mark_ready = ready;
            return *this;
        }
    };

} // namespace actor_theta
