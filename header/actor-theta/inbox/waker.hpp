#pragma once

#include <cassert>
#include <utility>

namespace actor_theta { namespace inbox {

    /// @brief Type-erased handle that makes a suspended receiver runnable again.
    ///
    /// The waker owns one reference to its target; copies retain, destruction releases.
    class waker final {
    public:
        struct vtable {
            void (*wake)(void*) noexcept;
            void (*retain)(void*) noexcept;
            void (*release)(void*) noexcept;
        };

        waker() noexcept
            : data_(nullptr)
            , vtable_(nullptr) {}

        /// takes over a reference the caller already holds
        waker(void* data, const vtable* vt) noexcept
            : data_(data)
            , vtable_(vt) {
            assert((data != nullptr) == (vt != nullptr) && "waker needs both data and vtable");
        }

        waker(const waker& other) noexcept
            : data_(other.data_)
            , vtable_(other.vtable_) {
            if (data_) {
                vtable_->retain(data_);
            }
        }

        waker(waker&& other) noexcept
            : data_(std::exchange(other.data_, nullptr))
            , vtable_(std::exchange(other.vtable_, nullptr)) {}

        waker& operator=(waker other) noexcept {
            std::swap(data_, other.data_);
            std::swap(vtable_, other.vtable_);
            return *this;
        }

        ~waker() {
            if (data_) {
                vtable_->release(data_);
            }
        }

        void wake() const noexcept {
            if (data_) {
                vtable_->wake(data_);
            }
        }

        bool will_wake(const waker& other) const noexcept {
            return data_ == other.data_ && vtable_ == other.vtable_;
        }

        explicit operator bool() const noexcept {
            return data_ != nullptr;
        }

    private:
        void* data_;
        const vtable* vtable_;
    };

}} // namespace actor_theta::inbox
