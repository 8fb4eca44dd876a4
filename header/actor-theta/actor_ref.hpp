#pragma once

#include <utility>

#include <actor-theta/inbox.hpp>

namespace actor_theta {

    using inbox::recv_result;
    using inbox::send_result;

    /// @brief Handle used to send messages of type `M` to one actor.
    ///
    /// A strong reference keeps the actor's inbox connected; once the last
    /// strong reference is gone a waiting actor observes disconnection.
    /// Copying a reference is the same as `clone()`.
    template<class M>
    class actor_ref final {
    public:
        actor_ref() noexcept = default;

        explicit actor_ref(inbox::sender<M> sender) noexcept
            : sender_(std::move(sender)) {}

        actor_ref(const actor_ref& other) noexcept
            : sender_(other.sender_.clone()) {}

        actor_ref& operator=(const actor_ref& other) noexcept {
            if (this != &other) {
                sender_ = other.sender_.clone();
            }
            return *this;
        }

        actor_ref(actor_ref&&) noexcept = default;
        actor_ref& operator=(actor_ref&&) noexcept = default;
        ~actor_ref() = default;

        /// @return false if the inbox is full or the actor is gone, `msg` is then left as it was
        bool send(M&& msg) {
            return try_send(std::move(msg)) == send_result::success;
        }

        bool send(const M& msg) {
            return try_send(msg) == send_result::success;
        }

        send_result try_send(M&& msg) {
            return sender_.try_send(std::move(msg));
        }

        send_result try_send(const M& msg) {
            return sender_.try_send(msg);
        }

        bool is_connected() const noexcept {
            return sender_.is_connected();
        }

        bool is_weak() const noexcept {
            return sender_.kind() == inbox::sender_kind::weak;
        }

        bool valid() const noexcept {
            return sender_.valid();
        }

        size_t capacity() const noexcept {
            return sender_.capacity();
        }

        actor_ref clone() const noexcept {
            return actor_ref(sender_.clone());
        }

        actor_ref downgrade() const noexcept {
            return actor_ref(sender_.downgrade());
        }

        /// invalid once the actor has no strong reference left
        actor_ref upgrade() const noexcept {
            return actor_ref(sender_.upgrade());
        }

        bool same_actor(const actor_ref& other) const noexcept {
            return sender_.same_channel(other.sender_);
        }

        /// drop this reference now
        void reset() noexcept {
            sender_.reset();
        }

    private:
        inbox::sender<M> sender_;
    };

} // namespace actor_theta
