#pragma once

#include <actor-theta/supervisor.hpp>

namespace actor_theta {

    const char* to_string(supervisor_strategy strategy) noexcept {
        switch (strategy) {
            case supervisor_strategy::restart:
                return "restart";
            case supervisor_strategy::stop:
                return "stop";
            case supervisor_strategy::propagate:
                return "propagate";
        }
        return "unknown";
    }

    std::string actor_failure::what() const {
        if (exception) {
            try {
                std::rethrow_exception(exception);
            } catch (const std::exception& e) {
                return std::string("exception: ") + e.what();
            } catch (...) {
                return "exception of unknown type";
            }
        }
        if (code) {
            return code.message();
        }
        return "no failure";
    }

    supervisor_strategy restart_supervisor::decide(const actor_failure&) {
        auto now = clock::now();
        while (!recent_.empty() && now - recent_.front() > window_) {
            recent_.pop_front();
        }
        if (recent_.size() >= max_restarts_) {
            return supervisor_strategy::stop;
        }
        recent_.push_back(now);
        ++total_;
        return supervisor_strategy::restart;
    }

} // namespace actor_theta
