#pragma once

#include <atomic>

#include <actor-theta/detail/singly_linked.hpp>

namespace actor_theta { namespace detail {

    /// @brief Intrusive multi-producer stack, drained all at once by its single consumer.
    ///
    /// `T` derives from `singly_linked<T>`. A node must not be pushed again
    /// before the batch holding it has been taken.
    template<class T>
    class lifo_stack {
    public:
        lifo_stack() noexcept = default;
        lifo_stack(const lifo_stack&) = delete;
        lifo_stack& operator=(const lifo_stack&) = delete;

        void push(T* node) noexcept {
            auto* head = head_.load(std::memory_order_relaxed);
            do {
                node->next_node = head;
            } while (!head_.compare_exchange_weak(head, node, std::memory_order_release, std::memory_order_relaxed));
        }

        bool empty() const noexcept {
            return head_.load(std::memory_order_acquire) == nullptr;
        }

        /// @return the batch in push order
        T* take_all() noexcept {
            T* node = head_.exchange(nullptr, std::memory_order_acquire);
            T* reversed = nullptr;
            while (node) {
                T* next = node->next_node;
                node->next_node = reversed;
                reversed = node;
                node = next;
            }
            return reversed;
        }

    private:
        std::atomic<T*> head_{nullptr};
    };

}} // namespace actor_theta::detail
