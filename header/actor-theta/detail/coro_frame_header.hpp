#pragma once

#include <cstddef>
#include <memory_resource>
#include <new>

namespace actor_theta { namespace detail {

    // [header][padding][coroutine frame]
    struct coro_frame_header {
        std::pmr::memory_resource* resource;
        std::size_t frame_size;

        static constexpr std::size_t padded_size() noexcept {
            constexpr std::size_t header_size = sizeof(coro_frame_header);
            constexpr std::size_t align = alignof(std::max_align_t);
            return (header_size + align - 1) & ~(align - 1);
        }
    };

    inline void* allocate_coro_frame(std::pmr::memory_resource* res, std::size_t frame_size) {
        if (!res) {
            res = std::pmr::get_default_resource();
        }
        const std::size_t total_size = coro_frame_header::padded_size() + frame_size;
        void* raw = res->allocate(total_size, alignof(std::max_align_t));

        auto* header = static_cast<coro_frame_header*>(raw);
        header->resource = res;
        header->frame_size = frame_size;

        return static_cast<char*>(raw) + coro_frame_header::padded_size();
    }

    // size is recovered from the header, GCC does not always call the sized form
    inline void deallocate_coro_frame(void* frame) noexcept {
        if (!frame) {
            return;
        }

        void* raw = static_cast<char*>(frame) - coro_frame_header::padded_size();
        auto* header = static_cast<coro_frame_header*>(raw);
        const std::size_t total_size = coro_frame_header::padded_size() + header->frame_size;
        header->resource->deallocate(raw, total_size, alignof(std::max_align_t));
    }

}} // namespace actor_theta::detail
