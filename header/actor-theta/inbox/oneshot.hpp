#pragma once

#include <atomic>
#include <cassert>
#include <cstdint>
#include <memory_resource>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

#include <actor-theta/detail/backoff.hpp>
#include <actor-theta/detail/memory.hpp>
#include <actor-theta/inbox/channel.hpp>
#include <actor-theta/inbox/waker.hpp>

namespace actor_theta { namespace inbox {

    template<class T>
    class oneshot_sender;

    template<class T>
    class oneshot_receiver;

    template<class T>
    std::pair<oneshot_sender<T>, oneshot_receiver<T>> make_oneshot(std::pmr::memory_resource* resource = std::pmr::get_default_resource());

    namespace detail {

        /// @brief Room for a single value, shared by one sender and one receiver.
        ///
        /// The sender fills the slot before it lets go of `sender_alive`, so a
        /// receiver that sees neither a value nor a sender knows none will come.
        template<class T>
        class oneshot_channel final {
        public:
            static_assert(std::is_nothrow_move_constructible_v<T>, "oneshot values must be nothrow move constructible");

            static constexpr uint8_t sender_alive = 0b001;
            static constexpr uint8_t receiver_alive = 0b010;
            static constexpr uint8_t filled = 0b100;

            explicit oneshot_channel(std::pmr::memory_resource* resource) noexcept
                : resource_(resource) {}

            oneshot_channel(const oneshot_channel&) = delete;
            oneshot_channel& operator=(const oneshot_channel&) = delete;

            ~oneshot_channel() {
                if (state_.load(std::memory_order_acquire) & filled) {
                    value()->~T();
                }
            }

            static oneshot_channel* make(std::pmr::memory_resource* resource) {
                return pmr::allocate_ptr<oneshot_channel>(resource, resource);
            }

            bool has_receiver() const noexcept {
                return state_.load(std::memory_order_acquire) & receiver_alive;
            }

            bool has_sender() const noexcept {
                return state_.load(std::memory_order_acquire) & sender_alive;
            }

            bool has_value() const noexcept {
                return state_.load(std::memory_order_acquire) & filled;
            }

            /// sender only, at most once per sender
            send_result try_send(T& v) {
                if (!has_receiver()) {
                    return send_result::disconnected;
                }
                new (storage_) T(std::move(v));
                state_.fetch_or(filled, std::memory_order_acq_rel);
                wake_receiver();
                return send_result::success;
            }

            /// receiver only
            recv_result try_recv(std::optional<T>& out) {
                auto state = state_.load(std::memory_order_acquire);
                if (state & filled) {
                    out.emplace(std::move(*value()));
                    value()->~T();
                    state_.fetch_and(static_cast<uint8_t>(~filled), std::memory_order_acq_rel);
                    return recv_result::success;
                }
                return (state & sender_alive) ? recv_result::empty : recv_result::disconnected;
            }

            void register_waker(const waker& w) {
                lock_waker();
                if (!waker_.will_wake(w)) {
                    waker_ = w;
                }
                unlock_waker();
            }

            void clear_waker() noexcept {
                lock_waker();
                waker old = std::move(waker_);
                waker_ = waker();
                unlock_waker();
            }

            /// @brief Make the channel reusable once its sender is gone; any unread value is dropped.
            bool try_reset() noexcept {
                auto state = state_.load(std::memory_order_acquire);
                if (state & sender_alive) {
                    return false;
                }
                if (state & filled) {
                    value()->~T();
                }
                state_.store(static_cast<uint8_t>(receiver_alive | sender_alive), std::memory_order_release);
                refs_.fetch_add(1, std::memory_order_relaxed);
                return true;
            }

            void remove_sender() noexcept {
                state_.fetch_and(static_cast<uint8_t>(~sender_alive), std::memory_order_acq_rel);
                wake_receiver();
                release();
            }

            void remove_receiver() noexcept {
                clear_waker();
                state_.fetch_and(static_cast<uint8_t>(~receiver_alive), std::memory_order_acq_rel);
                release();
            }

        private:
            T* value() noexcept {
                return std::launder(reinterpret_cast<T*>(storage_));
            }

            void release() noexcept {
                if (refs_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
                    pmr::deallocate_ptr(resource_, this);
                }
            }

            void wake_receiver() noexcept {
                lock_waker();
                waker target = waker_;
                unlock_waker();
                target.wake();
            }

            void lock_waker() noexcept {
                int attempt = 0;
                while (waker_lock_.exchange(true, std::memory_order_acquire)) {
                    actor_theta::detail::exponential_backoff(++attempt);
                }
            }

            void unlock_waker() noexcept {
                waker_lock_.store(false, std::memory_order_release);
            }

            std::pmr::memory_resource* resource_;
            std::atomic<uint8_t> state_{sender_alive | receiver_alive};
            std::atomic<int> refs_{2};
            std::atomic<bool> waker_lock_{false};
            waker waker_;
            alignas(T) unsigned char storage_[sizeof(T)];
        };

    } // namespace detail

    /// @brief Sends exactly one value, typically the reply to a request.
    template<class T>
    class oneshot_sender final {
    public:
        oneshot_sender() noexcept = default;

        oneshot_sender(const oneshot_sender&) = delete;
        oneshot_sender& operator=(const oneshot_sender&) = delete;

        oneshot_sender(oneshot_sender&& other) noexcept
            : channel_(std::exchange(other.channel_, nullptr)) {}

        oneshot_sender& operator=(oneshot_sender&& other) noexcept {
            if (this != &other) {
                reset();
                channel_ = std::exchange(other.channel_, nullptr);
            }
            return *this;
        }

        ~oneshot_sender() {
            reset();
        }

        /// @brief Deliver `value` and give up the sender; on failure both stay with the caller.
        send_result try_send(T&& value) {
            if (!channel_) {
                return send_result::disconnected;
            }
            auto result = channel_->try_send(value);
            if (result == send_result::success) {
                reset();
            }
            return result;
        }

        send_result try_send(const T& value) {
            T copy(value);
            return try_send(std::move(copy));
        }

        bool is_connected() const noexcept {
            return channel_ && channel_->has_receiver();
        }

        bool valid() const noexcept {
            return channel_ != nullptr;
        }

        void reset() noexcept {
            if (auto* ch = std::exchange(channel_, nullptr)) {
                ch->remove_sender();
            }
        }

    private:
        friend class oneshot_receiver<T>;

        template<class U>
        friend std::pair<oneshot_sender<U>, oneshot_receiver<U>> make_oneshot(std::pmr::memory_resource*);

        explicit oneshot_sender(detail::oneshot_channel<T>* ch) noexcept
            : channel_(ch) {}

        detail::oneshot_channel<T>* channel_ = nullptr;
    };

    template<class T>
    class oneshot_receiver final {
    public:
        oneshot_receiver() noexcept = default;

        oneshot_receiver(const oneshot_receiver&) = delete;
        oneshot_receiver& operator=(const oneshot_receiver&) = delete;

        oneshot_receiver(oneshot_receiver&& other) noexcept
            : channel_(std::exchange(other.channel_, nullptr)) {}

        oneshot_receiver& operator=(oneshot_receiver&& other) noexcept {
            if (this != &other) {
                reset();
                channel_ = std::exchange(other.channel_, nullptr);
            }
            return *this;
        }

        ~oneshot_receiver() {
            reset();
        }

        recv_result try_recv(std::optional<T>& out) {
            if (!channel_) {
                return recv_result::disconnected;
            }
            return channel_->try_recv(out);
        }

        std::optional<T> try_recv() {
            std::optional<T> out;
            try_recv(out);
            return out;
        }

        /// @brief Receive or arrange for `w` to be woken by the send or by the sender going away.
        recv_result poll_recv(std::optional<T>& out, const waker& w) {
            auto result = try_recv(out);
            if (result != recv_result::empty) {
                return result;
            }
            channel_->register_waker(w);
            return try_recv(out);
        }

        /// true while the sender exists or its value is still unread
        bool is_connected() const noexcept {
            return channel_ && (channel_->has_sender() || channel_->has_value());
        }

        /// @brief A fresh sender for the same channel, invalid while the old sender is alive.
        oneshot_sender<T> try_reset() noexcept {
            if (!channel_ || !channel_->try_reset()) {
                return oneshot_sender<T>();
            }
            return oneshot_sender<T>(channel_);
        }

        bool valid() const noexcept {
            return channel_ != nullptr;
        }

        void reset() noexcept {
            if (auto* ch = std::exchange(channel_, nullptr)) {
                ch->remove_receiver();
            }
        }

    private:
        template<class U>
        friend std::pair<oneshot_sender<U>, oneshot_receiver<U>> make_oneshot(std::pmr::memory_resource*);

        explicit oneshot_receiver(detail::oneshot_channel<T>* ch) noexcept
            : channel_(ch) {}

        detail::oneshot_channel<T>* channel_ = nullptr;
    };

    /// @brief A channel for a single value, e.g. the reply to one request.
    template<class T>
    std::pair<oneshot_sender<T>, oneshot_receiver<T>> make_oneshot(std::pmr::memory_resource* resource) {
        auto* ch = detail::oneshot_channel<T>::make(resource);
        return {oneshot_sender<T>(ch), oneshot_receiver<T>(ch)};
    }

}} // namespace actor_theta::inbox
