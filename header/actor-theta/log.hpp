#pragma once

#include <functional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace actor_theta { namespace log {

    enum class level : int {
        trace = 0,
        debug,
        info,
        warn,
        error,
        off
    };

    using sink_t = std::function<void(level, std::string_view)>;

    void set_level(level lvl) noexcept;
    level current_level() noexcept;

    inline bool enabled(level lvl) noexcept {
        return lvl != level::off && lvl >= current_level();
    }

    /// @brief Replace the output function. An empty sink restores the stderr sink.
    void set_sink(sink_t sink);

    void write(level lvl, std::string_view message);

    std::string_view to_string(level lvl) noexcept;

    template<typename... Args>
    void print(level lvl, fmt::format_string<Args...> format, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }
        write(lvl, fmt::format(format, std::forward<Args>(args)...));
    }

}} // namespace actor_theta::log

#define ACTOR_THETA_LOG_TRACE(...) ::actor_theta::log::print(::actor_theta::log::level::trace, __VA_ARGS__)
#define ACTOR_THETA_LOG_DEBUG(...) ::actor_theta::log::print(::actor_theta::log::level::debug, __VA_ARGS__)
#define ACTOR_THETA_LOG_INFO(...) ::actor_theta::log::print(::actor_theta::log::level::info, __VA_ARGS__)
#define ACTOR_THETA_LOG_WARN(...) ::actor_theta::log::print(::actor_theta::log::level::warn, __VA_ARGS__)
#define ACTOR_THETA_LOG_ERROR(...) ::actor_theta::log::print(::actor_theta::log::level::error, __VA_ARGS__)
