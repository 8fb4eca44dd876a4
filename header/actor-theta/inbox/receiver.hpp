#pragma once

#include <optional>
#include <utility>

#include <actor-theta/inbox/channel.hpp>
#include <actor-theta/inbox/forwards.hpp>
#include <actor-theta/inbox/sender.hpp>

namespace actor_theta { namespace inbox {

    /// @brief The single consumer end of an inbox.
    template<class T>
    class receiver final {
    public:
        receiver() noexcept = default;

        receiver(const receiver&) = delete;
        receiver& operator=(const receiver&) = delete;

        receiver(receiver&& other) noexcept
            : channel_(std::exchange(other.channel_, nullptr)) {}

        receiver& operator=(receiver&& other) noexcept {
            if (this != &other) {
                reset();
                channel_ = std::exchange(other.channel_, nullptr);
            }
            return *this;
        }

        ~receiver() {
            reset();
        }

        recv_result try_recv(std::optional<T>& out) {
            if (!channel_) {
                return recv_result::disconnected;
            }
            return channel_->try_recv(out);
        }

        recv_result try_recv(T& out) {
            std::optional<T> slot;
            auto result = try_recv(slot);
            if (result == recv_result::success) {
                out = std::move(*slot);
            }
            return result;
        }

        std::optional<T> try_recv() {
            std::optional<T> slot;
            try_recv(slot);
            return slot;
        }

        /// @brief Receive or arrange to be woken.
        ///
        /// On `empty` the waker is registered and the ring checked once more,
        /// so a send racing with registration is never missed.
        recv_result poll_recv(std::optional<T>& out, const waker& w) {
            auto result = try_recv(out);
            if (result != recv_result::empty) {
                return result;
            }
            channel_->register_waker(w);
            return try_recv(out);
        }

        void register_waker(const waker& w) {
            if (channel_) {
                channel_->register_waker(w);
            }
        }

        /// true while at least one strong sender exists
        bool is_connected() const noexcept {
            return channel_ && channel_->has_senders();
        }

        bool has_manager() const noexcept {
            return channel_ && channel_->manager_alive();
        }

        size_t capacity() const noexcept {
            return channel_ ? channel_->capacity() : 0;
        }

        size_t len() const noexcept {
            return channel_ ? channel_->len() : 0;
        }

        bool valid() const noexcept {
            return channel_ != nullptr;
        }

        sender<T> new_sender() const noexcept {
            if (!channel_) {
                return sender<T>();
            }
            channel_->add_sender();
            return sender<T>(channel_, sender_kind::strong);
        }

        /// a sender that does not keep this receiver connected
        sender<T> new_weak_sender() const noexcept {
            if (!channel_) {
                return sender<T>();
            }
            channel_->add_weak();
            return sender<T>(channel_, sender_kind::weak);
        }

        void reset() noexcept {
            if (channel_) {
                std::exchange(channel_, nullptr)->remove_receiver();
            }
        }

    private:
        friend class sender<T>;
        friend class manager<T>;

        template<class U>
        friend std::pair<sender<U>, receiver<U>> with_capacity(size_t, std::pmr::memory_resource*);

        explicit receiver(detail::channel<T>* ch) noexcept
            : channel_(ch) {}

        detail::channel<T>* channel_ = nullptr;
    };

    template<class T>
    bool sender<T>::sends_to(const receiver<T>& r) const noexcept {
        return channel_ != nullptr && channel_ == r.channel_;
    }

}} // namespace actor_theta::inbox
