#include <benchmark/benchmark.h>

#include <actor-theta.hpp>

#include <atomic>
#include <system_error>
#include <thread>

using namespace actor_theta;

namespace {

    behavior sink(context<int>& ctx, std::atomic<int64_t>* received) {
        while (auto msg = co_await ctx.receive()) {
            received->fetch_add(1, std::memory_order_relaxed);
        }
        co_return {};
    }

    struct token final {
        int remaining;
        actor_ref<token> next;
    };

    // hands the token on to the next actor of the ring until it is used up
    behavior relay(context<token>& ctx) {
        while (auto msg = co_await ctx.receive()) {
            if (msg->remaining == 0) {
                break;
            }
            auto next = std::move(msg->next);
            next.send(token{msg->remaining - 1, ctx.self()});
        }
        co_return {};
    }

} // namespace

static void BM_Runtime_SpawnRun(benchmark::State& state) {
    auto actors = state.range(0);
    for (auto _ : state) {
        std::error_code ec;
        auto rt = runtime::make(runtime_options{}.with_workers(2), ec);
        std::atomic<int64_t> received{0};
        for (int64_t i = 0; i < actors; ++i) {
            rt->spawn<int>(nullptr, sink, &received);
        }
        benchmark::DoNotOptimize(rt->run());
    }
    state.SetItemsProcessed(state.iterations() * actors);
}

BENCHMARK(BM_Runtime_SpawnRun)->Arg(16)->Arg(256)->Arg(4096)->UseRealTime();

static void BM_Runtime_Fanin(benchmark::State& state) {
    constexpr int64_t messages = 100000;
    for (auto _ : state) {
        std::error_code ec;
        auto rt = runtime::make(runtime_options{}.with_workers(static_cast<size_t>(state.range(0))), ec);
        std::atomic<int64_t> received{0};
        auto ref = rt->spawn<int>(actor_options{}.with_inbox_capacity(1024), nullptr, sink, &received);

        std::error_code result;
        std::thread runner([&] { result = rt->run(); });
        for (int64_t i = 0; i < messages; ++i) {
            while (ref.try_send(static_cast<int>(i)) == send_result::full) {
                std::this_thread::yield();
            }
        }
        ref.reset();
        runner.join();
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * messages);
}

BENCHMARK(BM_Runtime_Fanin)->Arg(1)->Arg(4)->UseRealTime();

static void BM_Runtime_PingPong(benchmark::State& state) {
    constexpr int hops = 10000;
    for (auto _ : state) {
        std::error_code ec;
        auto rt = runtime::make(runtime_options{}.with_workers(static_cast<size_t>(state.range(0))), ec);
        auto first = rt->spawn<token>(actor_options{}.with_worker(0), nullptr, relay);
        auto second = rt->spawn<token>(actor_options{}.with_worker(state.range(0) - 1), nullptr, relay);

        first.send(token{hops, second.downgrade()});
        std::error_code result;
        std::thread runner([&] { result = rt->run(); });
        // whoever sees the last hop stops, the other one follows once both references are gone
        while (rt->live_actors() == 2) {
            std::this_thread::yield();
        }
        first.reset();
        second.reset();
        runner.join();
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * hops);
}

BENCHMARK(BM_Runtime_PingPong)->Arg(1)->Arg(2)->UseRealTime();

BENCHMARK_MAIN();
