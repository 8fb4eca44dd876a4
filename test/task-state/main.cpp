#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <actor-theta/detail/intrusive_ptr.hpp>
#include <actor-theta/scheduler/task.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace actor_theta;
using namespace actor_theta::scheduler;

namespace {

    class idle_task final : public task_base {
    public:
        explicit idle_task(task_id id)
            : task_base(id) {}

        step_result step() override {
            return step_result::waiting;
        }

        void teardown() noexcept override {
            ++teardowns;
        }

        int teardowns = 0;
    };

} // namespace

TEST_CASE("task state - bind decides the first state") {
    auto ready = detail::make_counted<idle_task>(1);
    auto lazy = detail::make_counted<idle_task>(2);
    REQUIRE(ready->state() == task_state::not_scheduled);

    ready->bind(nullptr, true);
    lazy->bind(nullptr, false);

    REQUIRE(ready->state() == task_state::scheduled);
    REQUIRE(ready->initially_ready());
    REQUIRE(lazy->state() == task_state::waiting);
    REQUIRE_FALSE(lazy->initially_ready());
}

TEST_CASE("task state - run, wait, wake") {
    auto task = detail::make_counted<idle_task>(1);
    task->bind(nullptr, true);

    task->begin_run();
    REQUIRE(task->state() == task_state::running);

    SECTION("suspending parks the task") {
        REQUIRE_FALSE(task->end_run(step_result::waiting));
        REQUIRE(task->state() == task_state::waiting);

        REQUIRE(task->schedule_if_waiting());
        REQUIRE(task->state() == task_state::scheduled);

        // only the first wake enqueues
        REQUIRE_FALSE(task->schedule_if_waiting());
    }

    SECTION("a wake while running is not lost") {
        REQUIRE_FALSE(task->schedule_if_waiting());
        REQUIRE(task->state() == task_state::running_notified);

        REQUIRE(task->end_run(step_result::waiting));
        REQUIRE(task->state() == task_state::scheduled);
    }

    SECTION("yield goes straight back to the ready queue") {
        REQUIRE(task->end_run(step_result::yield));
        REQUIRE(task->state() == task_state::scheduled);
    }

    SECTION("finished tasks ignore wakes") {
        REQUIRE_FALSE(task->end_run(step_result::finished));
        REQUIRE(task->state() == task_state::finished);
        REQUIRE_FALSE(task->schedule_if_waiting());
        REQUIRE(task->state() == task_state::finished);
    }
}

TEST_CASE("task state - force_finish stops further scheduling") {
    auto task = detail::make_counted<idle_task>(3);
    task->bind(nullptr, false);
    task->force_finish();
    REQUIRE_FALSE(task->schedule_if_waiting());
    REQUIRE(task->state() == task_state::finished);
}

TEST_CASE("task state - exactly one of many concurrent wakers enqueues") {
    constexpr int wakers = 8;

    for (int round = 0; round < 500; ++round) {
        auto task = detail::make_counted<idle_task>(static_cast<task_id>(round + 1));
        task->bind(nullptr, false);

        std::atomic<int> enqueued{0};
        std::atomic<bool> go{false};
        std::vector<std::thread> threads;
        for (int i = 0; i < wakers; ++i) {
            threads.emplace_back([&] {
                while (!go.load()) {
                }
                if (task->schedule_if_waiting()) {
                    enqueued.fetch_add(1);
                }
            });
        }
        go.store(true);
        for (auto& t : threads) {
            t.join();
        }

        REQUIRE(enqueued.load() == 1);
        REQUIRE(task->state() == task_state::scheduled);
    }
}

TEST_CASE("task state - wakers keep the task alive") {
    auto task = detail::make_counted<idle_task>(9);
    REQUIRE(task->get_reference_count() == 1);
    {
        auto w = task->make_waker();
        auto copy = w;
        REQUIRE(task->get_reference_count() == 3);
    }
    REQUIRE(task->get_reference_count() == 1);
}

TEST_CASE("task state - only armed timers are remembered as fired") {
    auto task = detail::make_counted<idle_task>(4);

    task->arm_timer(10);
    task->arm_timer(11);

    task->on_timer_expired(99);
    REQUIRE_FALSE(task->timer_fired());

    REQUIRE(task->disarm_timer(11));
    task->on_timer_expired(11);
    REQUIRE_FALSE(task->timer_fired());

    task->on_timer_expired(10);
    REQUIRE(task->timer_fired());
    REQUIRE(task->take_timer_fired());
    REQUIRE_FALSE(task->take_timer_fired());
    REQUIRE_FALSE(task->disarm_timer(10));

    task->arm_timer(12);
    task->disarm_all_timers();
    task->on_timer_expired(12);
    REQUIRE_FALSE(task->timer_fired());
}
