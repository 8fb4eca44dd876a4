#pragma once

#include <thread>

namespace actor_theta { namespace detail {

    // a producer gives up on the reservation after this many lost races
    inline constexpr int kMaxCasAttempts = 64;

    inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
        __builtin_ia32_pause();
#elif defined(__aarch64__)
        asm volatile("yield" ::: "memory");
#endif
    }

    // spin with a doubling pause count, then yield; never sleeps, senders stay non-blocking
    inline void exponential_backoff(int attempt) noexcept {
        constexpr int kSpinPhaseEnd = 6;

        if (attempt < kSpinPhaseEnd) {
            for (int i = 0; i < (1 << attempt); ++i) {
                cpu_relax();
            }
        } else {
            std::this_thread::yield();
        }
    }

}} // namespace actor_theta::detail
