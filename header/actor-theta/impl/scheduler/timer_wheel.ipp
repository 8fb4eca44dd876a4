#pragma once

#include <algorithm>

#include <actor-theta/scheduler/timer_wheel.hpp>

namespace actor_theta { namespace scheduler {

    timer_wheel::timer_wheel(duration tick, time_point epoch)
        : tick_(tick > duration::zero() ? tick : std::chrono::milliseconds(1))
        , epoch_(epoch) {
    }

    uint64_t timer_wheel::tick_of(time_point t) const noexcept {
        if (t <= epoch_) {
            return 0;
        }
        return static_cast<uint64_t>((t - epoch_) / tick_);
    }

    void timer_wheel::place(const entry& e) {
        auto tick = tick_of(e.deadline);
        if (tick >= current_tick_ + slots) {
            overflow_.emplace(std::make_pair(e.deadline, e.id), e.task);
            return;
        }
        // deadlines already behind the wheel fire on the next turn
        tick = std::max(tick, current_tick_);
        buckets_[tick % slots].push_back(e);
    }

    timer_token timer_wheel::add(time_point deadline, task_id task) {
        entry e{deadline, next_id_++, task};
        place(e);
        ++size_;
        return timer_token{deadline, e.id};
    }

    bool timer_wheel::cancel(const timer_token& token) {
        if (!token.valid()) {
            return false;
        }

        if (overflow_.erase(std::make_pair(token.deadline, token.id)) > 0) {
            --size_;
            return true;
        }

        auto erase_from = [&](std::vector<entry>& bucket) {
            auto it = std::find_if(bucket.begin(), bucket.end(), [&](const entry& e) { return e.id == token.id; });
            if (it == bucket.end()) {
                return false;
            }
            *it = bucket.back();
            bucket.pop_back();
            --size_;
            return true;
        };

        return erase_from(buckets_[tick_of(token.deadline) % slots]) || erase_from(buckets_[current_tick_ % slots]);
    }

    void timer_wheel::collect_expired(time_point now, std::vector<fired_timer>& fired) {
        const auto now_tick = std::max(tick_of(now), current_tick_);
        const auto turns = std::min<uint64_t>(now_tick - current_tick_ + 1, slots);

        for (uint64_t i = 0; i < turns; ++i) {
            auto& bucket = buckets_[(current_tick_ + i) % slots];
            auto keep = std::partition(bucket.begin(), bucket.end(), [&](const entry& e) { return e.deadline > now; });
            for (auto it = keep; it != bucket.end(); ++it) {
                fired.push_back(fired_timer{it->task, it->id});
            }
            size_ -= static_cast<size_t>(bucket.end() - keep);
            bucket.erase(keep, bucket.end());
        }

        current_tick_ = now_tick;

        while (!overflow_.empty() && overflow_.begin()->first.first <= now) {
            fired.push_back(fired_timer{overflow_.begin()->second, overflow_.begin()->first.second});
            overflow_.erase(overflow_.begin());
            --size_;
        }

        migrate_overflow();
    }

    void timer_wheel::migrate_overflow() {
        while (!overflow_.empty()) {
            auto it = overflow_.begin();
            if (tick_of(it->first.first) >= current_tick_ + slots) {
                break;
            }
            place(entry{it->first.first, it->first.second, it->second});
            overflow_.erase(it);
        }
    }

    std::optional<time_point> timer_wheel::next_deadline() const {
        std::optional<time_point> result;
        for (size_t i = 0; i < slots && !result; ++i) {
            const auto& bucket = buckets_[(current_tick_ + i) % slots];
            for (const auto& e : bucket) {
                if (!result || e.deadline < *result) {
                    result = e.deadline;
                }
            }
        }
        if (!overflow_.empty()) {
            auto far = overflow_.begin()->first.first;
            if (!result || far < *result) {
                result = far;
            }
        }
        return result;
    }

}} // namespace actor_theta::scheduler
