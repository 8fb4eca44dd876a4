#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <unordered_map>

#include <sys/epoll.h>

#include <actor-theta/scheduler/task.hpp>

namespace actor_theta { namespace scheduler {

    enum class interest : uint32_t {
        readable = EPOLLIN,
        writable = EPOLLOUT
    };

    /// @brief epoll instance with an eventfd used to interrupt a blocking poll.
    ///
    /// Every fd has at most one reading and one writing waiter. Registrations
    /// are one-shot and re-armed for whichever waiter is still pending; token 0
    /// is reserved for the eventfd, an fd is registered under `fd + 1`.
    class reactor final {
    public:
        reactor() noexcept = default;
        reactor(const reactor&) = delete;
        reactor& operator=(const reactor&) = delete;
        ~reactor();

        std::error_code open();

        bool is_open() const noexcept {
            return epoll_fd_ >= 0;
        }

        /// @return `device_or_resource_busy` when another task already waits for `what` on `fd`
        std::error_code watch(int fd, interest what, task_id task);

        /// drop `task`'s interest in `fd`, the other waiter (if any) stays armed
        std::error_code unwatch(int fd, interest what, task_id task);

        size_t watched_fds() const noexcept {
            return registrations_.size();
        }

        /// interrupt a concurrent poll(), any thread
        void notify() noexcept;

        /// @brief Wait up to `timeout_ms` (-1 forever) and call `fn(task_id)` for every woken waiter.
        template<class F>
        std::error_code poll(int timeout_ms, F&& fn) {
            int count = 0;
            auto ec = wait(timeout_ms, count);
            if (ec) {
                return ec;
            }
            for (int i = 0; i < count; ++i) {
                const auto& ev = events_[static_cast<size_t>(i)];
                if (ev.data.u64 == notify_token) {
                    drain_notifications();
                    continue;
                }
                std::array<task_id, 2> woken{};
                auto n = dispatch(ev, woken);
                for (size_t j = 0; j < n; ++j) {
                    fn(woken[j]);
                }
            }
            return {};
        }

    private:
        struct registration {
            task_id reader = 0;
            task_id writer = 0;
            bool reader_fired = false;
            bool writer_fired = false;
        };

        static constexpr uint64_t notify_token = 0;
        static constexpr size_t max_events = 64;

        static uint32_t armed_events(const registration& reg) noexcept;

        std::error_code wait(int timeout_ms, int& count);
        void drain_notifications() noexcept;
        size_t dispatch(const epoll_event& ev, std::array<task_id, 2>& woken);
        std::error_code rearm(int fd, const registration& reg, bool known);

        int epoll_fd_ = -1;
        int event_fd_ = -1;
        std::array<epoll_event, max_events> events_{};
        std::unordered_map<int, registration> registrations_;
    };

}} // namespace actor_theta::scheduler
