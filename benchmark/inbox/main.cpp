#include <benchmark/benchmark.h>

#include <actor-theta/inbox.hpp>

#include <atomic>
#include <memory_resource>
#include <optional>
#include <thread>
#include <vector>

using namespace actor_theta;

static void BM_Inbox_SendRecv(benchmark::State& state) {
    auto capacity = static_cast<size_t>(state.range(0));
    auto [tx, rx] = inbox::with_capacity<int>(capacity);

    for (auto _ : state) {
        for (size_t i = 0; i < capacity; ++i) {
            benchmark::DoNotOptimize(tx.try_send(static_cast<int>(i)));
        }
        for (size_t i = 0; i < capacity; ++i) {
            auto value = rx.try_recv();
            benchmark::DoNotOptimize(value);
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(capacity));
}

BENCHMARK(BM_Inbox_SendRecv)->Arg(8)->Arg(64)->Arg(1024);

static void BM_Inbox_SendFull(benchmark::State& state) {
    auto [tx, rx] = inbox::with_capacity<int>(4);
    for (int i = 0; i < 4; ++i) {
        tx.try_send(i);
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(tx.try_send(42));
    }
}

BENCHMARK(BM_Inbox_SendFull);

static void BM_Inbox_CloneSender(benchmark::State& state) {
    auto [tx, rx] = inbox::make<int>();
    for (auto _ : state) {
        auto copy = tx.clone();
        benchmark::DoNotOptimize(copy);
    }
}

BENCHMARK(BM_Inbox_CloneSender);

static void BM_Inbox_Contended(benchmark::State& state) {
    auto producers = static_cast<int>(state.range(0));
    constexpr int per_producer = 10000;

    for (auto _ : state) {
        auto [tx, rx] = inbox::with_capacity<int>(1024);
        std::atomic<int> accepted{0};
        std::vector<std::thread> threads;
        for (int p = 0; p < producers; ++p) {
            threads.emplace_back([own = tx.clone(), &accepted]() mutable {
                for (int i = 0; i < per_producer; ++i) {
                    while (own.try_send(i) == inbox::send_result::full) {
                        std::this_thread::yield();
                    }
                    accepted.fetch_add(1, std::memory_order_relaxed);
                }
            });
        }
        tx.reset();

        int received = 0;
        std::optional<int> value;
        while (received < producers * per_producer) {
            value.reset();
            if (rx.try_recv(value) == inbox::recv_result::success) {
                ++received;
            }
        }
        for (auto& t : threads) {
            t.join();
        }
        benchmark::DoNotOptimize(received);
    }
    state.SetItemsProcessed(state.iterations() * producers * per_producer);
}

BENCHMARK(BM_Inbox_Contended)->Arg(1)->Arg(4)->Arg(8)->UseRealTime();

BENCHMARK_MAIN();
