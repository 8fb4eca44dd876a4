#pragma once

#include <cassert>
#include <memory_resource>
#include <utility>

#include <actor-theta/inbox/channel.hpp>
#include <actor-theta/inbox/manager.hpp>
#include <actor-theta/inbox/oneshot.hpp>
#include <actor-theta/inbox/receiver.hpp>
#include <actor-theta/inbox/sender.hpp>
#include <actor-theta/inbox/waker.hpp>

namespace actor_theta { namespace inbox {

    inline constexpr size_t default_capacity = 8;

    /// @brief New inbox with one strong sender and its receiver.
    template<class T>
    std::pair<sender<T>, receiver<T>> with_capacity(size_t capacity, std::pmr::memory_resource* resource) {
        auto* ch = detail::channel<T>::make(resource, capacity);
        ch->add_sender();
        bool attached = ch->try_attach_receiver();
        assert(attached && "fresh channel already has a receiver");
        (void) attached;
        return {sender<T>(ch, sender_kind::strong), receiver<T>(ch)};
    }

    template<class T>
    std::pair<sender<T>, receiver<T>> make(std::pmr::memory_resource* resource = std::pmr::get_default_resource()) {
        return with_capacity<T>(default_capacity, resource);
    }

}} // namespace actor_theta::inbox
