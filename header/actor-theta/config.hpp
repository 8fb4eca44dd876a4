#pragma once

namespace actor_theta {

#if defined(__has_include)
#if __has_include(<coroutine>) && defined(__cpp_impl_coroutine)
#define ACTOR_THETA_HAVE_COROUTINES 1
#else
#define ACTOR_THETA_HAVE_COROUTINES 0
#endif
#else
#define ACTOR_THETA_HAVE_COROUTINES 0
#endif

#if !ACTOR_THETA_HAVE_COROUTINES
    namespace actor_theta_config_check {
        static_assert(
            ACTOR_THETA_HAVE_COROUTINES,
            "\n"
            "actor-theta REQUIRES C++20 Coroutines Support\n"
            "\n"
            "Required: <coroutine>\n"
            "Minimum: GCC 10+, Clang 14+, MSVC 2019 16.8+\n"
            "\n"
            "Fix: Update compiler or add -std=c++20\n");
    }
#endif

#if !defined(__linux__)
    namespace actor_theta_config_check {
        static_assert(false, "actor-theta workers are built on epoll and eventfd (Linux only)");
    }
#endif

#define ACTOR_THETA_CACHE_LINE_SIZE 64

} // namespace actor_theta
