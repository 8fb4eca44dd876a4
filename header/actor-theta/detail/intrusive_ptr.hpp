#pragma once

#include <concepts>
#include <cstddef>
#include <utility>

#include <actor-theta/detail/ref_counted.hpp>

namespace actor_theta { namespace detail {

    struct adopt_ref_t {
        explicit adopt_ref_t() = default;
    };

    /// take over a reference without incrementing the count
    inline constexpr adopt_ref_t adopt_ref{};

    /// @brief Owning pointer to a `ref_counted` object.
    template<class T>
    class intrusive_ptr final {
    public:
        intrusive_ptr() noexcept = default;

        intrusive_ptr(std::nullptr_t) noexcept {}

        explicit intrusive_ptr(T* raw) noexcept
            : ptr_(raw) {
            if (ptr_) {
                ptr_->ref();
            }
        }

        intrusive_ptr(T* raw, adopt_ref_t) noexcept
            : ptr_(raw) {}

        intrusive_ptr(const intrusive_ptr& other) noexcept
            : intrusive_ptr(other.ptr_) {}

        intrusive_ptr(intrusive_ptr&& other) noexcept
            : ptr_(std::exchange(other.ptr_, nullptr)) {}

        template<class U>
            requires std::convertible_to<U*, T*>
        intrusive_ptr(intrusive_ptr<U>&& other) noexcept
            : ptr_(other.release()) {}

        intrusive_ptr& operator=(intrusive_ptr other) noexcept {
            std::swap(ptr_, other.ptr_);
            return *this;
        }

        ~intrusive_ptr() {
            reset();
        }

        /// @return the raw pointer, whose reference now belongs to the caller
        T* release() noexcept {
            return std::exchange(ptr_, nullptr);
        }

        void reset() noexcept {
            if (auto* old = std::exchange(ptr_, nullptr)) {
                old->deref();
            }
        }

        T* get() const noexcept {
            return ptr_;
        }

        T* operator->() const noexcept {
            return ptr_;
        }

        T& operator*() const noexcept {
            return *ptr_;
        }

        explicit operator bool() const noexcept {
            return ptr_ != nullptr;
        }

        friend bool operator==(const intrusive_ptr& lhs, const intrusive_ptr& rhs) noexcept {
            return lhs.ptr_ == rhs.ptr_;
        }

    private:
        T* ptr_ = nullptr;
    };

    template<class T, class... Args>
    intrusive_ptr<T> make_counted(Args&&... args) {
        return intrusive_ptr<T>(new T(std::forward<Args>(args)...), adopt_ref);
    }

}} // namespace actor_theta::detail
