#pragma once

#include <string>
#include <system_error>

namespace actor_theta {

    enum class errc {
        full = 1,
        disconnected,
        actor_panicked,
        actor_failed,
        receiver_connected,
        no_workers,
        runtime_not_running,
        shutdown
    };

    const std::error_category& error_category() noexcept;

    inline std::error_code make_error_code(errc e) noexcept {
        return {static_cast<int>(e), error_category()};
    }

} // namespace actor_theta

namespace std {
    template<>
    struct is_error_code_enum<actor_theta::errc> : true_type {};
} // namespace std
