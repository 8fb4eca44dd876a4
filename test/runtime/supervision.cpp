#include <catch2/catch.hpp>

#include "helpers.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

using namespace actor_theta;
using namespace test_helpers;
using namespace std::chrono_literals;

namespace {

    // negative messages make the body fail
    behavior flaky(context<int>& ctx, recorder* seen, std::atomic<int>* starts) {
        starts->fetch_add(1);
        while (auto msg = co_await ctx.receive()) {
            if (*msg < 0) {
                co_return errc::actor_failed;
            }
            seen->push(*msg);
        }
        co_return {};
    }

    behavior thrower(context<int>& ctx) {
        if (co_await ctx.receive()) {
            throw std::runtime_error("boom");
        }
        co_return {};
    }

    behavior idle(context<int>& ctx) {
        while (co_await ctx.receive()) {
        }
        co_return {};
    }

    behavior failing(context<int>&) {
        co_return errc::actor_failed;
    }

    struct failure_log final {
        std::error_code code;
        std::string what;
        bool had_exception = false;
    };

} // namespace

TEST_CASE("supervision - restart keeps the inbox and the references") {
    auto rt = make_runtime(2);
    recorder seen;
    std::atomic<int> starts{0};

    auto ref = rt->spawn<int>(make_supervisor<restart_supervisor>(3, std::chrono::seconds(10)), flaky, &seen, &starts);
    auto copy = ref;

    // queued before the first start: the failure leaves 2 and 3 for the next body
    REQUIRE(ref.send(1));
    REQUIRE(ref.send(-1));
    REQUIRE(ref.send(2));
    REQUIRE(ref.send(3));

    std::error_code result = make_error_code(errc::shutdown);
    std::thread runner([&] { result = rt->run(); });

    REQUIRE(eventually([&] { return seen.size() == 3; }));
    REQUIRE(starts.load() == 2);
    REQUIRE(ref.is_connected());
    REQUIRE(copy.same_actor(ref));

    REQUIRE(copy.send(4));
    REQUIRE(eventually([&] { return seen.size() == 4; }));

    ref.reset();
    copy.reset();
    runner.join();

    REQUIRE_FALSE(result);
    REQUIRE(seen.values() == std::vector<int>{1, 2, 3, 4});
    REQUIRE(starts.load() == 2);
}

TEST_CASE("supervision - restart limit stops the actor") {
    auto rt = make_runtime(1);
    recorder seen;
    std::atomic<int> starts{0};

    auto ref = rt->spawn<int>(make_supervisor<restart_supervisor>(2, std::chrono::seconds(10)), flaky, &seen, &starts);
    auto weak = ref.downgrade();
    for (int i = 0; i < 4; ++i) {
        REQUIRE(ref.send(-1));
    }

    std::error_code result = make_error_code(errc::shutdown);
    std::thread runner([&] { result = rt->run(); });

    // two restarts granted, the third failure stops the actor for good
    REQUIRE(eventually([&] { return !weak.is_connected(); }));
    REQUIRE(starts.load() == 3);
    REQUIRE_FALSE(ref.send(5));
    REQUIRE(ref.try_send(5) == send_result::disconnected);

    ref.reset();
    runner.join();
    REQUIRE_FALSE(result);
}

TEST_CASE("supervision - an escaping exception is a failure") {
    auto rt = make_runtime(1);
    auto log = std::make_shared<failure_log>();

    auto sup = make_supervisor([log](const actor_failure& failure) {
        log->code = failure.code;
        log->what = failure.what();
        log->had_exception = static_cast<bool>(failure.exception);
        return supervisor_strategy::stop;
    });
    auto ref = rt->spawn<int>(std::move(sup), thrower);
    REQUIRE(ref.send(1));

    REQUIRE_FALSE(rt->run());
    REQUIRE(log->code == errc::actor_panicked);
    REQUIRE(log->had_exception);
    REQUIRE(log->what == "exception: boom");
    REQUIRE_FALSE(ref.is_connected());
}

TEST_CASE("supervision - propagate stops the whole runtime") {
    auto rt = make_runtime(2);

    auto bystander = rt->spawn<int>(nullptr, idle);
    auto culprit = rt->spawn<int>(std::make_unique<propagate_supervisor>(), failing);
    REQUIRE(rt->live_actors() == 2);

    // the bystander is still referenced, only the propagated failure ends run()
    auto result = rt->run();
    REQUIRE(result == errc::actor_failed);
    REQUIRE_FALSE(bystander.is_connected());
    REQUIRE_FALSE(culprit.is_connected());
    REQUIRE(rt->run() == errc::runtime_not_running);
}

TEST_CASE("supervision - external shutdown") {
    auto rt = make_runtime(2);
    auto ref = rt->spawn<int>(nullptr, idle);

    std::error_code result;
    std::thread runner([&] { result = rt->run(); });
    std::this_thread::sleep_for(10ms);
    rt->shutdown(make_error_code(errc::shutdown));
    runner.join();

    REQUIRE(result == errc::shutdown);
    REQUIRE_FALSE(ref.is_connected());
}

namespace {

    class counting_supervisor final : public supervisor {
    public:
        counting_supervisor(std::atomic<int>* decides, std::atomic<int>* restart_errors) noexcept
            : decides_(decides)
            , restart_errors_(restart_errors) {}

        supervisor_strategy decide(const actor_failure&) override {
            decides_->fetch_add(1);
            return supervisor_strategy::restart;
        }

        supervisor_strategy decide_on_restart_error(const actor_failure& failure) override {
            if (failure.code == errc::actor_panicked && failure.exception) {
                restart_errors_->fetch_add(1);
            }
            return supervisor_strategy::stop;
        }

    private:
        std::atomic<int>* decides_;
        std::atomic<int>* restart_errors_;
    };

    behavior tally(context<int>& ctx, std::atomic<int>* received) {
        while (co_await ctx.receive()) {
            received->fetch_add(1);
        }
        co_return {};
    }

    behavior generations(context<int>&, int generation, recorder* seen) {
        seen->push(generation);
        if (generation < 2) {
            co_return errc::actor_failed;
        }
        co_return {};
    }

} // namespace

TEST_CASE("supervision - a body that cannot be rebuilt goes to decide_on_restart_error") {
    auto rt = make_runtime(1);
    std::atomic<int> decides{0};
    std::atomic<int> restart_errors{0};
    auto builds = std::make_shared<std::atomic<int>>(0);

    // the first build runs a failing body, the rebuild throws before any coroutine exists
    auto body = [builds](context<int>& ctx) -> behavior {
        if (builds->fetch_add(1) > 0) {
            throw std::runtime_error("cannot rebuild");
        }
        return failing(ctx);
    };
    auto ref = rt->spawn<int>(std::make_unique<counting_supervisor>(&decides, &restart_errors), body);
    ref.reset();

    REQUIRE_FALSE(rt->run());
    REQUIRE(builds->load() == 2);
    REQUIRE(decides.load() == 1);
    REQUIRE(restart_errors.load() == 1);
    REQUIRE(rt->live_actors() == 0);
}

TEST_CASE("supervision - a throwing supervisor stops only the failed actor") {
    auto rt = make_runtime(1);
    std::atomic<int> received{0};

    auto sup = make_supervisor([](const actor_failure&) -> supervisor_strategy {
        throw std::logic_error("supervisor is broken");
    });
    auto culprit = rt->spawn<int>(std::move(sup), failing);
    auto bystander = rt->spawn<int>(nullptr, tally, &received);

    std::error_code result = make_error_code(errc::shutdown);
    std::thread runner([&] { result = rt->run(); });

    REQUIRE(eventually([&] { return !culprit.is_connected(); }));
    REQUIRE(bystander.send(1));
    REQUIRE(eventually([&] { return received.load() == 1; }));

    bystander.reset();
    culprit.reset();
    runner.join();

    REQUIRE_FALSE(result);
    REQUIRE(rt->live_actors() == 0);
}

TEST_CASE("supervision - restart with new arguments") {
    auto rt = make_runtime(1);
    recorder seen;

    auto sup = make_restart_supervisor<int, recorder*>(
        [next = 0, &seen](const actor_failure&) mutable -> std::optional<std::tuple<int, recorder*>> {
            if (++next > 2) {
                return std::nullopt;
            }
            return std::make_tuple(next, &seen);
        });
    auto ref = rt->spawn<int>(std::move(sup), generations, 0, &seen);
    ref.reset();

    REQUIRE_FALSE(rt->run());
    REQUIRE(seen.values() == std::vector<int>{0, 1, 2});
}
