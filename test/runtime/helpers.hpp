#pragma once

#include <actor-theta.hpp>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace test_helpers {

    using namespace std::chrono_literals;

    inline std::unique_ptr<actor_theta::runtime> make_runtime(size_t workers) {
        std::error_code ec;
        auto rt = actor_theta::runtime::make(actor_theta::runtime_options{}.with_workers(workers), ec);
        if (ec) {
            return nullptr;
        }
        return rt;
    }

    template<class Predicate>
    bool eventually(Predicate pred, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(1ms);
        }
        return pred();
    }

    /// values seen by an actor, read once the runtime stopped
    class recorder final {
    public:
        void push(int value) {
            std::lock_guard<std::mutex> guard(mtx_);
            values_.push_back(value);
        }

        std::vector<int> values() const {
            std::lock_guard<std::mutex> guard(mtx_);
            return values_;
        }

        size_t size() const {
            std::lock_guard<std::mutex> guard(mtx_);
            return values_.size();
        }

    private:
        mutable std::mutex mtx_;
        std::vector<int> values_;
    };

} // namespace test_helpers
