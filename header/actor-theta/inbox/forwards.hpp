#pragma once

#include <cstddef>
#include <memory_resource>
#include <utility>

namespace actor_theta { namespace inbox {

    template<class T>
    class sender;

    template<class T>
    class receiver;

    template<class T>
    class manager;

    class waker;

    template<class T>
    std::pair<sender<T>, receiver<T>> with_capacity(size_t capacity, std::pmr::memory_resource* resource = std::pmr::get_default_resource());

}} // namespace actor_theta::inbox
