#pragma once

#include <memory_resource>
#include <system_error>
#include <utility>

#include <actor-theta/errors.hpp>
#include <actor-theta/inbox/channel.hpp>
#include <actor-theta/inbox/receiver.hpp>
#include <actor-theta/inbox/sender.hpp>

namespace actor_theta { namespace inbox {

    /// @brief Keeps an inbox alive between receivers.
    ///
    /// Senders stay connected while the manager lives, which is what lets a
    /// restarted actor pick up the same inbox and the messages queued in it.
    template<class T>
    class manager final {
    public:
        manager() noexcept = default;

        manager(std::pmr::memory_resource* resource, size_t capacity)
            : channel_(detail::channel<T>::make(resource, capacity)) {
            channel_->attach_manager();
        }

        manager(const manager&) = delete;
        manager& operator=(const manager&) = delete;

        manager(manager&& other) noexcept
            : channel_(std::exchange(other.channel_, nullptr)) {}

        manager& operator=(manager&& other) noexcept {
            if (this != &other) {
                reset();
                channel_ = std::exchange(other.channel_, nullptr);
            }
            return *this;
        }

        ~manager() {
            reset();
        }

        sender<T> new_sender() const noexcept {
            if (!channel_) {
                return sender<T>();
            }
            channel_->add_sender();
            return sender<T>(channel_, sender_kind::strong);
        }

        /// @brief Fails with errc::receiver_connected while another receiver is alive.
        receiver<T> new_receiver(std::error_code& ec) const noexcept {
            ec.clear();
            if (!channel_) {
                ec = make_error_code(errc::disconnected);
                return receiver<T>();
            }
            if (!channel_->try_attach_receiver()) {
                ec = make_error_code(errc::receiver_connected);
                return receiver<T>();
            }
            return receiver<T>(channel_);
        }

        receiver<T> new_receiver() const noexcept {
            std::error_code ignored;
            return new_receiver(ignored);
        }

        size_t capacity() const noexcept {
            return channel_ ? channel_->capacity() : 0;
        }

        size_t len() const noexcept {
            return channel_ ? channel_->len() : 0;
        }

        bool has_senders() const noexcept {
            return channel_ && channel_->has_senders();
        }

        bool valid() const noexcept {
            return channel_ != nullptr;
        }

        void reset() noexcept {
            if (channel_) {
                std::exchange(channel_, nullptr)->remove_manager();
            }
        }

    private:
        detail::channel<T>* channel_ = nullptr;
    };

}} // namespace actor_theta::inbox
