#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <actor-theta/scheduler/task.hpp>

namespace actor_theta { namespace scheduler {

    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;
    using duration = clock::duration;

    struct timer_token {
        time_point deadline;
        uint64_t id = 0;

        bool valid() const noexcept {
            return id != 0;
        }
    };

    /// @brief Coarse deadline registry owned by one worker.
    ///
    /// Deadlines within `slots` ticks of the current tick go into a bucket, later
    /// ones wait in an ordered overflow list and move into the wheel as it turns.
    class timer_wheel final {
    public:
        static constexpr size_t slots = 64;

        explicit timer_wheel(duration tick, time_point epoch = clock::now());

        timer_token add(time_point deadline, task_id task);

        /// @return false if the timer already fired or was cancelled
        bool cancel(const timer_token& token);

        /// @brief Remove every entry with `deadline <= now`, calling `fn(task_id)` or
        /// `fn(task_id, timer id)` for each.
        template<class F>
        size_t expire(time_point now, F&& fn) {
            std::vector<fired_timer> fired;
            collect_expired(now, fired);
            for (const auto& timer : fired) {
                if constexpr (std::is_invocable_v<F&, task_id, uint64_t>) {
                    fn(timer.task, timer.id);
                } else {
                    fn(timer.task);
                }
            }
            return fired.size();
        }

        std::optional<time_point> next_deadline() const;

        size_t size() const noexcept {
            return size_;
        }

        bool empty() const noexcept {
            return size_ == 0;
        }

        duration tick() const noexcept {
            return tick_;
        }

    private:
        struct fired_timer {
            task_id task;
            uint64_t id;
        };

        struct entry {
            time_point deadline;
            uint64_t id;
            task_id task;
        };

        uint64_t tick_of(time_point t) const noexcept;
        void place(const entry& e);
        void collect_expired(time_point now, std::vector<fired_timer>& fired);
        void migrate_overflow();

        duration tick_;
        time_point epoch_;
        uint64_t current_tick_ = 0;
        uint64_t next_id_ = 1;
        size_t size_ = 0;
        std::array<std::vector<entry>, slots> buckets_;
        std::map<std::pair<time_point, uint64_t>, task_id> overflow_;
    };

}} // namespace actor_theta::scheduler
