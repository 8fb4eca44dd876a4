#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <actor-theta/inbox.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>
#include <vector>

using namespace actor_theta::inbox;

namespace {

    struct tagged {
        uint32_t producer;
        uint32_t sequence;
    };

    struct flag_waker {
        std::atomic<int> wakes{0};

        static void wake_fn(void* p) noexcept {
            static_cast<flag_waker*>(p)->wakes.fetch_add(1);
        }
        static void noop(void*) noexcept {}

        static constexpr waker::vtable vt{&wake_fn, &noop, &noop};
    };

} // namespace

TEST_CASE("inbox race - concurrent producers, no corruption, per-producer order") {
    constexpr uint32_t producers = 8;
    constexpr uint32_t per_producer = 20000;

    auto [tx, rx] = with_capacity<tagged>(64);

    std::atomic<uint32_t> finished{0};
    std::atomic<uint32_t> disconnected{0};
    std::vector<uint64_t> delivered_by(producers, 0);
    std::vector<uint64_t> rejected_by(producers, 0);
    std::vector<std::thread> threads;

    for (uint32_t p = 0; p < producers; ++p) {
        threads.emplace_back([&, p, sender = tx.clone()]() mutable {
            for (uint32_t i = 0; i < per_producer; ++i) {
                auto result = sender.try_send(tagged{p, i});
                if (result == send_result::disconnected) {
                    disconnected.fetch_add(1);
                }
                if (result == send_result::success) {
                    ++delivered_by[p];
                } else {
                    ++rejected_by[p];
                }
            }
            finished.fetch_add(1);
        });
    }
    tx.reset();

    std::vector<int64_t> last_seen(producers, -1);
    std::vector<uint64_t> received_by(producers, 0);
    for (;;) {
        tagged value{};
        auto result = rx.try_recv(value);
        if (result == recv_result::disconnected) {
            break;
        }
        if (result == recv_result::empty) {
            std::this_thread::yield();
            continue;
        }
        REQUIRE(value.producer < producers);
        REQUIRE(static_cast<int64_t>(value.sequence) > last_seen[value.producer]);
        last_seen[value.producer] = value.sequence;
        ++received_by[value.producer];
    }

    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(finished.load() == producers);
    REQUIRE(disconnected.load() == 0);
    for (uint32_t p = 0; p < producers; ++p) {
        // loss accounting: every attempt was either delivered or rejected, never lost
        REQUIRE(delivered_by[p] + rejected_by[p] == per_producer);
        REQUIRE(received_by[p] == delivered_by[p]);
    }
}

TEST_CASE("inbox race - overload never exceeds capacity") {
    constexpr size_t capacity = 16;
    constexpr uint32_t producers = 4;
    constexpr uint32_t per_producer = 5000;

    auto [tx, rx] = with_capacity<uint32_t>(capacity);
    std::atomic<uint64_t> attempted{0};
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> over_capacity{0};
    std::vector<std::thread> threads;

    for (uint32_t p = 0; p < producers; ++p) {
        threads.emplace_back([&, sender = tx.clone()]() mutable {
            for (uint32_t i = 0; i < per_producer; ++i) {
                attempted.fetch_add(1);
                if (sender.try_send(uint32_t(i)) == send_result::success) {
                    accepted.fetch_add(1);
                } else {
                    rejected.fetch_add(1);
                }
                if (sender.len() > capacity) {
                    over_capacity.fetch_add(1);
                }
            }
        });
    }
    tx.reset();

    uint64_t received = 0;
    for (;;) {
        uint32_t value = 0;
        auto result = rx.try_recv(value);
        if (result == recv_result::disconnected) {
            break;
        }
        if (result == recv_result::success) {
            ++received;
            // slow consumer
            if (received % 64 == 0) {
                std::this_thread::sleep_for(std::chrono::microseconds(50));
            }
        }
        REQUIRE(rx.len() <= capacity);
    }

    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(over_capacity.load() == 0);
    REQUIRE(attempted.load() == uint64_t(producers) * per_producer);
    REQUIRE(accepted.load() + rejected.load() == attempted.load());
    REQUIRE(received == accepted.load());
}

TEST_CASE("inbox race - last sender leaving wakes a waiting receiver") {
    for (int round = 0; round < 200; ++round) {
        flag_waker target;
        auto [tx, rx] = with_capacity<int>(4);

        std::thread dropper([sender = std::move(tx)]() mutable {
            sender.reset();
        });

        std::optional<int> value;
        auto result = rx.poll_recv(value, waker(&target, &flag_waker::vt));
        dropper.join();

        // either the receiver saw the disconnection itself or it was woken for it
        if (result == recv_result::empty) {
            REQUIRE(target.wakes.load() == 1);
            REQUIRE(rx.try_recv(value) == recv_result::disconnected);
        } else {
            REQUIRE(result == recv_result::disconnected);
        }
    }
}
