#pragma once

#include <atomic>
#include <cassert>
#include <cstddef>

namespace actor_theta { namespace detail {

    /// @brief Atomic reference count for objects shared between workers and wakers.
    ///
    /// A new object starts with one reference owned by its creator; the last
    /// `deref()` deletes it.
    class ref_counted {
    public:
        ref_counted() noexcept = default;
        ref_counted(const ref_counted&) = delete;
        ref_counted& operator=(const ref_counted&) = delete;
        virtual ~ref_counted() = default;

        void ref() const noexcept {
            [[maybe_unused]] auto before = count_.fetch_add(1, std::memory_order_relaxed);
            assert(before > 0 && "ref() on an object that is already destroyed");
        }

        void deref() const noexcept {
            auto before = count_.fetch_sub(1, std::memory_order_acq_rel);
            assert(before > 0 && "deref() without a matching ref()");
            if (before == 1) {
                delete this;
            }
        }

        size_t get_reference_count() const noexcept {
            return count_.load(std::memory_order_acquire);
        }

    private:
        mutable std::atomic<size_t> count_{1};
    };

}} // namespace actor_theta::detail
