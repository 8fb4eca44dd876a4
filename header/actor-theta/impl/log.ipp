#pragma once

#include <atomic>
#include <cstdio>
#include <mutex>

#include <actor-theta/log.hpp>

namespace actor_theta { namespace log {

    namespace {

        std::atomic<int> global_level{static_cast<int>(level::warn)};

        struct sink_holder {
            std::mutex mtx;
            sink_t sink;
        };

        sink_holder& holder() {
            static sink_holder instance;
            return instance;
        }

        void stderr_sink(level lvl, std::string_view message) {
            fmt::print(stderr, "[actor-theta] [{}] {}\n", to_string(lvl), message);
        }

    } // namespace

    void set_level(level lvl) noexcept {
        global_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
    }

    level current_level() noexcept {
        return static_cast<level>(global_level.load(std::memory_order_relaxed));
    }

    void set_sink(sink_t sink) {
        auto& h = holder();
        std::lock_guard<std::mutex> guard(h.mtx);
        h.sink = std::move(sink);
    }

    void write(level lvl, std::string_view message) {
        auto& h = holder();
        std::lock_guard<std::mutex> guard(h.mtx);
        if (h.sink) {
            h.sink(lvl, message);
        } else {
            stderr_sink(lvl, message);
        }
    }

    std::string_view to_string(level lvl) noexcept {
        switch (lvl) {
            case level::trace:
                return "trace";
            case level::debug:
                return "debug";
            case level::info:
                return "info";
            case level::warn:
                return "warn";
            case level::error:
                return "error";
            case level::off:
                return "off";
        }
        return "unknown";
    }

}} // namespace actor_theta::log
