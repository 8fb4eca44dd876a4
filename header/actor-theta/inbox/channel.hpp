#pragma once

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

#include <actor-theta/config.hpp>
#include <actor-theta/detail/backoff.hpp>
#include <actor-theta/detail/memory.hpp>
#include <actor-theta/inbox/waker.hpp>

namespace actor_theta { namespace inbox {

    enum class send_result {
        success,
        full,
        disconnected
    };

    enum class recv_result {
        success,
        empty,
        disconnected
    };

    namespace detail {

        enum class slot_state : uint64_t {
            empty = 0b00,
            writing = 0b01,
            ready = 0b10,
            reading = 0b11
        };

        // [ lap : 62 | state : 2 ]
        constexpr uint64_t make_word(uint64_t lap, slot_state state) noexcept {
            return (lap << 2) | static_cast<uint64_t>(state);
        }

        constexpr uint64_t lap_of(uint64_t word) noexcept {
            return word >> 2;
        }

        constexpr slot_state state_of(uint64_t word) noexcept {
            return static_cast<slot_state>(word & 0b11);
        }

        template<class T>
        struct slot {
            std::atomic<uint64_t> word{make_word(0, slot_state::empty)};
            alignas(T) unsigned char storage[sizeof(T)];

            T* value() noexcept {
                return std::launder(reinterpret_cast<T*>(storage));
            }
        };

        /// @brief Bounded ring shared by many producers and one consumer.
        ///
        /// Position `p` lives in slot `p % capacity` during lap `p / capacity`.
        /// A producer may only claim a slot that is empty for its own lap, so a
        /// slot still holding the previous lap's message means the ring is full
        /// and the newest message is rejected.
        ///
        /// Lifetime is governed by `refs_`, one per live handle of any kind
        /// (strong sender, weak sender, receiver, manager). `senders_` counts
        /// strong senders only and decides disconnection for the receiver.
        template<class T>
        class channel final {
        public:
            static_assert(std::is_nothrow_move_constructible_v<T>, "inbox messages must be nothrow move constructible");

            static channel* make(std::pmr::memory_resource* resource, size_t capacity) {
                assert(resource);
                return pmr::allocate_ptr<channel>(resource, resource, std::max<size_t>(capacity, 1));
            }

            channel(std::pmr::memory_resource* resource, size_t capacity)
                : resource_(resource)
                , capacity_(capacity)
                , slots_(static_cast<slot<T>*>(resource->allocate(sizeof(slot<T>) * capacity, alignof(slot<T>)))) {
                for (size_t i = 0; i < capacity_; ++i) {
                    new (&slots_[i]) slot<T>();
                }
            }

            channel(const channel&) = delete;
            channel& operator=(const channel&) = delete;

            ~channel() {
                for (size_t i = 0; i < capacity_; ++i) {
                    auto& cell = slots_[i];
                    if (state_of(cell.word.load(std::memory_order_acquire)) == slot_state::ready) {
                        cell.value()->~T();
                    }
                    cell.~slot<T>();
                }
                resource_->deallocate(slots_, sizeof(slot<T>) * capacity_, alignof(slot<T>));
            }

            size_t capacity() const noexcept {
                return capacity_;
            }

            size_t len() const noexcept {
                auto head = head_.load(std::memory_order_acquire);
                auto tail = tail_.load(std::memory_order_acquire);
                if (tail <= head) {
                    return 0;
                }
                return std::min<size_t>(tail - head, capacity_);
            }

            bool receiver_alive() const noexcept {
                return receiver_alive_.load(std::memory_order_acquire);
            }

            bool manager_alive() const noexcept {
                return manager_alive_.load(std::memory_order_acquire);
            }

            // somebody is (or may again be) reading
            bool is_connected() const noexcept {
                return receiver_alive() || manager_alive();
            }

            bool has_senders() const noexcept {
                return senders_.load(std::memory_order_acquire) > 0;
            }

            size_t sender_count() const noexcept {
                return senders_.load(std::memory_order_acquire);
            }

            /// @brief Move `value` into the ring. `value` is left untouched unless the result is success.
            ///
            /// Contention beyond kMaxCasAttempts reservation attempts is reported as `full`.
            send_result try_send(T& value) {
                if (!is_connected()) {
                    return send_result::disconnected;
                }

                auto pos = tail_.load(std::memory_order_relaxed);
                int attempt = 0;
                for (;;) {
                    auto& cell = slots_[pos % capacity_];
                    const uint64_t lap = pos / capacity_;
                    const auto word = cell.word.load(std::memory_order_acquire);

                    if (word == make_word(lap, slot_state::empty)) {
                        if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_acq_rel, std::memory_order_relaxed)) {
                            cell.word.store(make_word(lap, slot_state::writing), std::memory_order_relaxed);
                            new (cell.storage) T(std::move(value));
                            cell.word.store(make_word(lap, slot_state::ready), std::memory_order_release);
                            wake_receiver_if_waiting();
                            return send_result::success;
                        }
                        if (++attempt >= actor_theta::detail::kMaxCasAttempts) {
                            return send_result::full;
                        }
                        actor_theta::detail::exponential_backoff(attempt);
                        continue;
                    }

                    if (lap_of(word) < lap) {
                        // the previous lap still occupies the slot: full, unless the tail moved meanwhile
                        auto current = tail_.load(std::memory_order_acquire);
                        if (current == pos) {
                            return send_result::full;
                        }
                        pos = current;
                        continue;
                    }

                    // stale position, another producer claimed it
                    pos = tail_.load(std::memory_order_relaxed);
                    if (++attempt >= actor_theta::detail::kMaxCasAttempts) {
                        return send_result::full;
                    }
                    actor_theta::detail::exponential_backoff(attempt);
                }
            }

            /// single consumer only
            recv_result try_recv(std::optional<T>& out) {
                // sampled first: once no strong sender is left, every completed send is visible below
                const bool connected = has_senders();

                auto pos = head_.load(std::memory_order_relaxed);
                auto& cell = slots_[pos % capacity_];
                const uint64_t lap = pos / capacity_;
                if (cell.word.load(std::memory_order_acquire) != make_word(lap, slot_state::ready)) {
                    return connected ? recv_result::empty : recv_result::disconnected;
                }

                cell.word.store(make_word(lap, slot_state::reading), std::memory_order_relaxed);
                auto* stored = cell.value();
                out.emplace(std::move(*stored));
                stored->~T();
                cell.word.store(make_word(lap + 1, slot_state::empty), std::memory_order_release);
                head_.store(pos + 1, std::memory_order_release);
                return recv_result::success;
            }

            /// @brief Arrange for `w` to be woken by the next send or by the last strong sender leaving.
            void register_waker(const waker& w) {
                lock_waker();
                if (!waker_.will_wake(w)) {
                    waker_ = w;
                }
                unlock_waker();
                needs_wakeup_.store(true, std::memory_order_relaxed);
                std::atomic_thread_fence(std::memory_order_seq_cst);
            }

            void clear_waker() noexcept {
                needs_wakeup_.store(false, std::memory_order_relaxed);
                lock_waker();
                waker old = std::move(waker_);
                waker_ = waker();
                unlock_waker();
            }

            void add_sender() noexcept {
                senders_.fetch_add(1, std::memory_order_relaxed);
                refs_.fetch_add(1, std::memory_order_relaxed);
            }

            /// @brief Strong reference from a weak one, fails once the last strong sender is gone.
            bool try_upgrade() noexcept {
                auto current = senders_.load(std::memory_order_acquire);
                while (current != 0) {
                    if (senders_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel, std::memory_order_acquire)) {
                        refs_.fetch_add(1, std::memory_order_relaxed);
                        return true;
                    }
                }
                return false;
            }

            void remove_sender() noexcept {
                if (senders_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
                    std::atomic_thread_fence(std::memory_order_seq_cst);
                    if (needs_wakeup_.exchange(false, std::memory_order_acq_rel)) {
                        wake_receiver();
                    }
                }
                release();
            }

            void add_weak() noexcept {
                refs_.fetch_add(1, std::memory_order_relaxed);
            }

            void remove_weak() noexcept {
                release();
            }

            bool try_attach_receiver() noexcept {
                bool expected = false;
                if (!receiver_alive_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
                    return false;
                }
                refs_.fetch_add(1, std::memory_order_relaxed);
                return true;
            }

            void remove_receiver() noexcept {
                clear_waker();
                receiver_alive_.store(false, std::memory_order_release);
                release();
            }

            void attach_manager() noexcept {
                manager_alive_.store(true, std::memory_order_release);
                refs_.fetch_add(1, std::memory_order_relaxed);
            }

            void remove_manager() noexcept {
                manager_alive_.store(false, std::memory_order_release);
                release();
            }

        private:
            void release() noexcept {
                if (refs_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
                    pmr::deallocate_ptr(resource_, this);
                }
            }

            void wake_receiver_if_waiting() noexcept {
                std::atomic_thread_fence(std::memory_order_seq_cst);
                if (needs_wakeup_.load(std::memory_order_relaxed) && needs_wakeup_.exchange(false, std::memory_order_acq_rel)) {
                    wake_receiver();
                }
            }

            void wake_receiver() noexcept {
                lock_waker();
                waker target = waker_;
                unlock_waker();
                target.wake();
            }

            void lock_waker() noexcept {
                int attempt = 0;
                while (waker_lock_.exchange(true, std::memory_order_acquire)) {
                    actor_theta::detail::exponential_backoff(++attempt);
                }
            }

            void unlock_waker() noexcept {
                waker_lock_.store(false, std::memory_order_release);
            }

            std::pmr::memory_resource* resource_;
            const size_t capacity_;
            slot<T>* slots_;

            alignas(ACTOR_THETA_CACHE_LINE_SIZE) std::atomic<size_t> tail_{0};
            alignas(ACTOR_THETA_CACHE_LINE_SIZE) std::atomic<size_t> head_{0};

            alignas(ACTOR_THETA_CACHE_LINE_SIZE) std::atomic<size_t> senders_{0};
            std::atomic<size_t> refs_{0};
            std::atomic<bool> receiver_alive_{false};
            std::atomic<bool> manager_alive_{false};

            std::atomic<bool> needs_wakeup_{false};
            std::atomic<bool> waker_lock_{false};
            waker waker_;
        };

    } // namespace detail

}} // namespace actor_theta::inbox
