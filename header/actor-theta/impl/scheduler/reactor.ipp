#pragma once

#include <cerrno>
#include <cstdint>

#include <sys/eventfd.h>
#include <unistd.h>

#include <actor-theta/log.hpp>
#include <actor-theta/scheduler/reactor.hpp>

namespace actor_theta { namespace scheduler {

    namespace {
        std::error_code last_error() noexcept {
            return {errno, std::system_category()};
        }
    } // namespace

    reactor::~reactor() {
        if (event_fd_ >= 0) {
            ::close(event_fd_);
        }
        if (epoll_fd_ >= 0) {
            ::close(epoll_fd_);
        }
    }

    std::error_code reactor::open() {
        epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            return last_error();
        }

        event_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (event_fd_ < 0) {
            return last_error();
        }

        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.u64 = notify_token;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, event_fd_, &ev) != 0) {
            return last_error();
        }
        return {};
    }

    uint32_t reactor::armed_events(const registration& reg) noexcept {
        uint32_t events = 0;
        if (reg.reader != 0 && !reg.reader_fired) {
            events |= EPOLLIN | EPOLLRDHUP;
        }
        if (reg.writer != 0 && !reg.writer_fired) {
            events |= EPOLLOUT;
        }
        return events;
    }

    std::error_code reactor::rearm(int fd, const registration& reg, bool known) {
        epoll_event ev{};
        ev.events = armed_events(reg) | EPOLLONESHOT;
        ev.data.u64 = static_cast<uint64_t>(fd) + 1;
        const int first = known ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
        if (::epoll_ctl(epoll_fd_, first, fd, &ev) == 0) {
            return {};
        }
        // closing an fd drops it from epoll behind our back, and a reused number may still be registered
        if (known && errno == ENOENT && ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) {
            return {};
        }
        if (!known && errno == EEXIST && ::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) == 0) {
            return {};
        }
        return last_error();
    }

    std::error_code reactor::watch(int fd, interest what, task_id task) {
        if (fd < 0) {
            return std::make_error_code(std::errc::bad_file_descriptor);
        }
        auto it = registrations_.find(fd);
        const bool known = it != registrations_.end();
        registration reg = known ? it->second : registration{};

        auto& slot = what == interest::readable ? reg.reader : reg.writer;
        auto& fired = what == interest::readable ? reg.reader_fired : reg.writer_fired;
        if (slot != 0 && slot != task) {
            return std::make_error_code(std::errc::device_or_resource_busy);
        }
        slot = task;
        fired = false;

        if (auto ec = rearm(fd, reg, known)) {
            return ec;
        }
        registrations_[fd] = reg;
        return {};
    }

    std::error_code reactor::unwatch(int fd, interest what, task_id task) {
        auto it = registrations_.find(fd);
        if (it == registrations_.end()) {
            return {};
        }
        auto& reg = it->second;
        auto& slot = what == interest::readable ? reg.reader : reg.writer;
        if (slot != task) {
            return {};
        }
        slot = 0;
        (what == interest::readable ? reg.reader_fired : reg.writer_fired) = false;

        if (reg.reader == 0 && reg.writer == 0) {
            registrations_.erase(it);
            if (::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) == 0 || errno == ENOENT) {
                return {};
            }
            return last_error();
        }
        if (armed_events(reg) == 0) {
            return {};
        }
        return rearm(fd, reg, true);
    }

    size_t reactor::dispatch(const epoll_event& ev, std::array<task_id, 2>& woken) {
        const int fd = static_cast<int>(ev.data.u64 - 1);
        auto it = registrations_.find(fd);
        if (it == registrations_.end()) {
            return 0;
        }
        auto& reg = it->second;
        size_t n = 0;
        const uint32_t failed = EPOLLERR | EPOLLHUP;
        if (reg.reader != 0 && !reg.reader_fired && (ev.events & (EPOLLIN | EPOLLRDHUP | failed))) {
            reg.reader_fired = true;
            woken[n++] = reg.reader;
        }
        if (reg.writer != 0 && !reg.writer_fired && (ev.events & (EPOLLOUT | failed))) {
            reg.writer_fired = true;
            woken[n++] = reg.writer;
        }
        // the one-shot event disarmed the whole fd, a waiter that was not woken needs it back
        if (armed_events(reg) != 0) {
            if (auto ec = rearm(fd, reg, true)) {
                ACTOR_THETA_LOG_ERROR("cannot re-arm fd {}: {}", fd, ec.message());
            }
        }
        return n;
    }

    void reactor::notify() noexcept {
        uint64_t one = 1;
        // EAGAIN means the counter is saturated and a wakeup is pending anyway
        if (::write(event_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
            ACTOR_THETA_LOG_ERROR("eventfd write failed: {}", last_error().message());
        }
    }

    std::error_code reactor::wait(int timeout_ms, int& count) {
        count = ::epoll_wait(epoll_fd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
        if (count < 0) {
            count = 0;
            if (errno == EINTR) {
                return {};
            }
            return last_error();
        }
        return {};
    }

    void reactor::drain_notifications() noexcept {
        uint64_t value = 0;
        while (::read(event_fd_, &value, sizeof(value)) > 0) {
        }
    }

}} // namespace actor_theta::scheduler
