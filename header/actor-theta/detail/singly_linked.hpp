#pragma once

namespace actor_theta { namespace detail {

    template<class T>
    struct singly_linked {
        using node_pointer = T*;

        singly_linked() noexcept = default;

        node_pointer next_node = nullptr;
    };

}} // namespace actor_theta::detail
