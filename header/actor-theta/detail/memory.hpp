#pragma once

#include <cassert>
#include <memory_resource>
#include <new>
#include <utility>

namespace actor_theta { namespace pmr {

    template<class Target, class... Args>
    Target* allocate_ptr(std::pmr::memory_resource* resource, Args&&... args) {
        assert(resource);
        auto* buffer = resource->allocate(sizeof(Target), alignof(Target));
        try {
            return new (buffer) Target(std::forward<Args>(args)...);
        } catch (...) {
            resource->deallocate(buffer, sizeof(Target), alignof(Target));
            throw;
        }
    }

    template<class Target>
    void deallocate_ptr(std::pmr::memory_resource* resource, Target* target) noexcept {
        assert(resource);
        assert(target);
        target->~Target();
        resource->deallocate(target, sizeof(Target), alignof(Target));
    }

}} // namespace actor_theta::pmr
