#pragma once

#include <cstdint>
#include <utility>

#include <actor-theta/inbox/channel.hpp>
#include <actor-theta/inbox/forwards.hpp>

namespace actor_theta { namespace inbox {

    enum class sender_kind : uint8_t {
        strong,
        weak
    };

    /// @brief Producer end of an inbox.
    ///
    /// Strong senders keep the receiver connected; weak senders can still
    /// deliver and check liveness but do not count towards it.
    template<class T>
    class sender final {
    public:
        sender() noexcept = default;

        sender(const sender&) = delete;
        sender& operator=(const sender&) = delete;

        sender(sender&& other) noexcept
            : channel_(std::exchange(other.channel_, nullptr))
            , kind_(other.kind_) {}

        sender& operator=(sender&& other) noexcept {
            if (this != &other) {
                reset();
                channel_ = std::exchange(other.channel_, nullptr);
                kind_ = other.kind_;
            }
            return *this;
        }

        ~sender() {
            reset();
        }

        send_result try_send(T&& value) {
            if (!channel_) {
                return send_result::disconnected;
            }
            return channel_->try_send(value);
        }

        send_result try_send(const T& value) {
            T copy(value);
            return try_send(std::move(copy));
        }

        bool is_connected() const noexcept {
            return channel_ && channel_->is_connected();
        }

        /// true while a manager exists that can attach a new receiver
        bool has_manager() const noexcept {
            return channel_ && channel_->manager_alive();
        }

        size_t capacity() const noexcept {
            return channel_ ? channel_->capacity() : 0;
        }

        size_t len() const noexcept {
            return channel_ ? channel_->len() : 0;
        }

        sender_kind kind() const noexcept {
            return kind_;
        }

        bool valid() const noexcept {
            return channel_ != nullptr;
        }

        sender clone() const noexcept {
            if (!channel_) {
                return sender();
            }
            if (kind_ == sender_kind::strong) {
                channel_->add_sender();
            } else {
                channel_->add_weak();
            }
            return sender(channel_, kind_);
        }

        sender downgrade() const noexcept {
            if (!channel_) {
                return sender();
            }
            channel_->add_weak();
            return sender(channel_, sender_kind::weak);
        }

        /// @brief Strong sender from any sender, invalid once every strong sender is gone.
        sender upgrade() const noexcept {
            if (!channel_ || !channel_->try_upgrade()) {
                return sender();
            }
            return sender(channel_, sender_kind::strong);
        }

        bool same_channel(const sender& other) const noexcept {
            return channel_ != nullptr && channel_ == other.channel_;
        }

        bool sends_to(const receiver<T>& r) const noexcept;

        void reset() noexcept {
            if (!channel_) {
                return;
            }
            auto* ch = std::exchange(channel_, nullptr);
            if (kind_ == sender_kind::strong) {
                ch->remove_sender();
            } else {
                ch->remove_weak();
            }
        }

    private:
        friend class receiver<T>;
        friend class manager<T>;

        template<class U>
        friend std::pair<sender<U>, receiver<U>> with_capacity(size_t, std::pmr::memory_resource*);

        // takes over a reference already accounted on the channel
        sender(detail::channel<T>* ch, sender_kind kind) noexcept
            : channel_(ch)
            , kind_(kind) {}

        detail::channel<T>* channel_ = nullptr;
        sender_kind kind_ = sender_kind::strong;
    };

}} // namespace actor_theta::inbox
