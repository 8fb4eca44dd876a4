#pragma once

#include <actor-theta/errors.hpp>

namespace actor_theta {

    namespace {

        class category_impl final : public std::error_category {
        public:
            const char* name() const noexcept override {
                return "actor-theta";
            }

            std::string message(int value) const override {
                switch (static_cast<errc>(value)) {
                    case errc::full:
                        return "inbox is full";
                    case errc::disconnected:
                        return "inbox is disconnected";
                    case errc::actor_panicked:
                        return "actor body threw an exception";
                    case errc::actor_failed:
                        return "actor body returned an error";
                    case errc::receiver_connected:
                        return "inbox already has a connected receiver";
                    case errc::no_workers:
                        return "runtime needs at least one worker";
                    case errc::runtime_not_running:
                        return "runtime is not running";
                    case errc::shutdown:
                        return "runtime is shutting down";
                }
                return "unknown actor-theta error";
            }
        };

    } // namespace

    const std::error_category& error_category() noexcept {
        static const category_impl instance;
        return instance;
    }

} // namespace actor_theta
