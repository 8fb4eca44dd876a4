#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <actor-theta/inbox.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <memory_resource>
#include <optional>
#include <string>

using namespace actor_theta;
using namespace actor_theta::inbox;

namespace {

    // counts wakes, keeps itself alive through the waker's references
    struct wake_counter {
        std::atomic<int> wakes{0};
        std::atomic<int> refs{0};

        static void wake_fn(void* p) noexcept {
            static_cast<wake_counter*>(p)->wakes.fetch_add(1);
        }
        static void retain_fn(void* p) noexcept {
            static_cast<wake_counter*>(p)->refs.fetch_add(1);
        }
        static void release_fn(void* p) noexcept {
            static_cast<wake_counter*>(p)->refs.fetch_sub(1);
        }

        static constexpr waker::vtable vt{&wake_fn, &retain_fn, &release_fn};

        waker make() {
            refs.fetch_add(1);
            return waker(this, &vt);
        }
    };

} // namespace

TEST_CASE("inbox - send and receive in order") {
    auto [tx, rx] = with_capacity<int>(8);

    REQUIRE(tx.capacity() == 8);
    REQUIRE(rx.capacity() == 8);
    REQUIRE(rx.len() == 0);

    for (int i = 0; i < 5; ++i) {
        REQUIRE(tx.try_send(int(i)) == send_result::success);
    }
    REQUIRE(rx.len() == 5);

    for (int i = 0; i < 5; ++i) {
        int value = -1;
        REQUIRE(rx.try_recv(value) == recv_result::success);
        REQUIRE(value == i);
    }

    int value = -1;
    REQUIRE(rx.try_recv(value) == recv_result::empty);
    REQUIRE(value == -1);
}

TEST_CASE("inbox - capacity 4 rejects the newest message") {
    auto [tx, rx] = with_capacity<int>(4);

    REQUIRE(tx.try_send(1) == send_result::success);
    REQUIRE(tx.try_send(2) == send_result::success);
    REQUIRE(tx.try_send(3) == send_result::success);
    REQUIRE(tx.try_send(4) == send_result::success);
    REQUIRE(tx.try_send(5) == send_result::full);
    REQUIRE(rx.len() == 4);

    auto first = rx.try_recv();
    REQUIRE(first.has_value());
    REQUIRE(*first == 1);

    REQUIRE(tx.try_send(6) == send_result::success);

    for (int expected : {2, 3, 4, 6}) {
        auto value = rx.try_recv();
        REQUIRE(value.has_value());
        REQUIRE(*value == expected);
    }
    REQUIRE_FALSE(rx.try_recv().has_value());
}

TEST_CASE("inbox - failed send leaves the message with the caller") {
    auto [tx, rx] = with_capacity<std::string>(1);

    std::string first = "first";
    REQUIRE(tx.try_send(std::move(first)) == send_result::success);

    std::string second = "second";
    REQUIRE(tx.try_send(std::move(second)) == send_result::full);
    REQUIRE(second == "second");

    rx.reset();
    std::string third = "third";
    REQUIRE(tx.try_send(std::move(third)) == send_result::disconnected);
    REQUIRE(third == "third");
}

TEST_CASE("inbox - many laps over a small ring") {
    auto [tx, rx] = with_capacity<int>(3);

    for (int round = 0; round < 100; ++round) {
        REQUIRE(tx.try_send(int(round)) == send_result::success);
        REQUIRE(tx.try_send(int(round + 1000)) == send_result::success);

        auto a = rx.try_recv();
        auto b = rx.try_recv();
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(*a == round);
        REQUIRE(*b == round + 1000);
    }
    REQUIRE(rx.len() == 0);
}

TEST_CASE("inbox - disconnection") {
    SECTION("receiver sees disconnected after the last strong sender is gone") {
        auto [tx, rx] = with_capacity<int>(4);
        auto tx2 = tx.clone();

        REQUIRE(tx.try_send(7) == send_result::success);
        tx.reset();
        REQUIRE(rx.is_connected());
        tx2.reset();
        REQUIRE_FALSE(rx.is_connected());

        // queued messages are still delivered before disconnection is reported
        int value = 0;
        REQUIRE(rx.try_recv(value) == recv_result::success);
        REQUIRE(value == 7);
        REQUIRE(rx.try_recv(value) == recv_result::disconnected);
    }

    SECTION("weak senders do not keep the receiver connected") {
        auto [tx, rx] = with_capacity<int>(4);
        auto weak = tx.downgrade();
        REQUIRE(weak.kind() == sender_kind::weak);

        tx.reset();
        REQUIRE_FALSE(rx.is_connected());

        // but they still deliver while the receiver lives
        REQUIRE(weak.is_connected());
        REQUIRE(weak.try_send(3) == send_result::success);

        int value = 0;
        REQUIRE(rx.try_recv(value) == recv_result::success);
        REQUIRE(value == 3);
        REQUIRE(rx.try_recv(value) == recv_result::disconnected);

        REQUIRE_FALSE(weak.upgrade().valid());
    }

    SECTION("upgrade succeeds while a strong sender exists") {
        auto [tx, rx] = with_capacity<int>(4);
        auto weak = tx.downgrade();
        auto strong = weak.upgrade();
        REQUIRE(strong.valid());
        REQUIRE(strong.kind() == sender_kind::strong);

        tx.reset();
        REQUIRE(rx.is_connected());
        strong.reset();
        REQUIRE_FALSE(rx.is_connected());
    }

    SECTION("sender sees disconnected once the receiver is dropped") {
        auto [tx, rx] = with_capacity<int>(4);
        REQUIRE(tx.is_connected());
        rx.reset();
        REQUIRE_FALSE(tx.is_connected());
        REQUIRE(tx.try_send(1) == send_result::disconnected);
    }
}

TEST_CASE("inbox - channel identity") {
    auto [tx, rx] = with_capacity<int>(2);
    auto [other_tx, other_rx] = with_capacity<int>(2);

    auto clone = tx.clone();
    auto from_receiver = rx.new_sender();

    REQUIRE(tx.same_channel(clone));
    REQUIRE(tx.same_channel(from_receiver));
    REQUIRE_FALSE(tx.same_channel(other_tx));

    REQUIRE(tx.sends_to(rx));
    REQUIRE_FALSE(tx.sends_to(other_rx));
    REQUIRE(other_tx.sends_to(other_rx));
}

TEST_CASE("inbox - waker") {
    wake_counter counter;

    SECTION("a send wakes a registered receiver once") {
        auto [tx, rx] = with_capacity<int>(4);
        std::optional<int> value;

        REQUIRE(rx.poll_recv(value, counter.make()) == recv_result::empty);
        REQUIRE(counter.wakes == 0);

        REQUIRE(tx.try_send(1) == send_result::success);
        REQUIRE(counter.wakes == 1);

        // not registered again, no second wake
        REQUIRE(tx.try_send(2) == send_result::success);
        REQUIRE(counter.wakes == 1);

        REQUIRE(rx.poll_recv(value, counter.make()) == recv_result::success);
        REQUIRE(*value == 1);
    }

    SECTION("dropping the last strong sender wakes the receiver") {
        auto [tx, rx] = with_capacity<int>(4);
        std::optional<int> value;

        REQUIRE(rx.poll_recv(value, counter.make()) == recv_result::empty);
        tx.reset();
        REQUIRE(counter.wakes == 1);
        REQUIRE(rx.poll_recv(value, counter.make()) == recv_result::disconnected);
    }

    SECTION("dropping the receiver releases the waker") {
        auto [tx, rx] = with_capacity<int>(4);
        std::optional<int> value;

        REQUIRE(rx.poll_recv(value, counter.make()) == recv_result::empty);
        REQUIRE(counter.refs == 1);
        rx.reset();
        REQUIRE(counter.refs == 0);
    }

    REQUIRE(counter.refs == 0);
}

TEST_CASE("inbox - manager") {
    manager<int> mgr(std::pmr::get_default_resource(), 4);
    auto tx = mgr.new_sender();

    SECTION("senders stay connected without a receiver") {
        REQUIRE(tx.is_connected());
        REQUIRE(tx.try_send(1) == send_result::success);
    }

    SECTION("only one receiver at a time") {
        std::error_code ec;
        auto rx = mgr.new_receiver(ec);
        REQUIRE_FALSE(ec);
        REQUIRE(rx.valid());

        auto second = mgr.new_receiver(ec);
        REQUIRE(ec == make_error_code(errc::receiver_connected));
        REQUIRE_FALSE(second.valid());
    }

    SECTION("messages survive a receiver swap") {
        auto rx = mgr.new_receiver();
        REQUIRE(tx.try_send(1) == send_result::success);
        REQUIRE(tx.try_send(2) == send_result::success);

        auto first = rx.try_recv();
        REQUIRE(first.has_value());
        REQUIRE(*first == 1);
        rx.reset();

        REQUIRE(tx.is_connected());
        REQUIRE(tx.try_send(3) == send_result::success);

        auto next = mgr.new_receiver();
        REQUIRE(next.valid());
        REQUIRE(next.try_recv() == std::optional<int>(2));
        REQUIRE(next.try_recv() == std::optional<int>(3));
    }

    SECTION("senders disconnect once manager and receiver are gone") {
        {
            auto rx = mgr.new_receiver();
        }
        mgr.reset();
        REQUIRE_FALSE(tx.is_connected());
        REQUIRE(tx.try_send(4) == send_result::disconnected);
    }
}

TEST_CASE("inbox - undelivered messages are destroyed with the channel") {
    auto tracker = std::make_shared<int>(0);
    {
        auto [tx, rx] = with_capacity<std::shared_ptr<int>>(4);
        REQUIRE(tx.try_send(tracker) == send_result::success);
        REQUIRE(tx.try_send(tracker) == send_result::success);
        REQUIRE(tracker.use_count() == 3);
    }
    REQUIRE(tracker.use_count() == 1);
}

TEST_CASE("inbox - has_manager") {
    SECTION("plain channel has none") {
        auto [tx, rx] = with_capacity<int>(4);
        REQUIRE_FALSE(tx.has_manager());
        REQUIRE_FALSE(rx.has_manager());
    }

    SECTION("reported by both ends until the manager goes") {
        manager<int> mgr(std::pmr::get_default_resource(), 4);
        auto tx = mgr.new_sender();
        auto rx = mgr.new_receiver();
        REQUIRE(tx.has_manager());
        REQUIRE(rx.has_manager());

        mgr.reset();
        REQUIRE_FALSE(tx.has_manager());
        REQUIRE_FALSE(rx.has_manager());
        REQUIRE(tx.is_connected());
    }

    SECTION("invalid handles") {
        sender<int> tx;
        receiver<int> rx;
        REQUIRE_FALSE(tx.has_manager());
        REQUIRE_FALSE(rx.has_manager());
    }
}

TEST_CASE("inbox - sending into a full inbox returns without blocking") {
    auto [tx, rx] = with_capacity<int>(2);
    REQUIRE(tx.try_send(1) == send_result::success);
    REQUIRE(tx.try_send(2) == send_result::success);

    auto started = std::chrono::steady_clock::now();
    for (int i = 0; i < 1000; ++i) {
        REQUIRE(tx.try_send(int(i)) == send_result::full);
    }
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(500));
    REQUIRE(rx.len() == 2);
}

TEST_CASE("oneshot - a single value") {
    SECTION("sent then received") {
        auto [tx, rx] = make_oneshot<std::string>();
        REQUIRE(tx.is_connected());
        REQUIRE(rx.try_recv() == std::nullopt);

        REQUIRE(tx.try_send(std::string("pong")) == send_result::success);
        REQUIRE_FALSE(tx.valid());
        REQUIRE(rx.is_connected());

        std::optional<std::string> out;
        REQUIRE(rx.try_recv(out) == recv_result::success);
        REQUIRE(out == std::optional<std::string>("pong"));
        REQUIRE(rx.try_recv(out) == recv_result::disconnected);
    }

    SECTION("sender dropped without sending") {
        auto [tx, rx] = make_oneshot<int>();
        tx.reset();
        std::optional<int> out;
        REQUIRE(rx.try_recv(out) == recv_result::disconnected);
        REQUIRE_FALSE(rx.is_connected());
    }

    SECTION("receiver dropped first") {
        auto [tx, rx] = make_oneshot<int>();
        rx.reset();
        REQUIRE_FALSE(tx.is_connected());
        REQUIRE(tx.try_send(1) == send_result::disconnected);
        REQUIRE(tx.valid());
    }

    SECTION("reset for another round") {
        auto [tx, rx] = make_oneshot<int>();
        REQUIRE_FALSE(rx.try_reset().valid());

        REQUIRE(tx.try_send(1) == send_result::success);
        auto again = rx.try_reset();
        REQUIRE(again.valid());
        REQUIRE(rx.try_recv() == std::nullopt);
        REQUIRE(again.try_send(2) == send_result::success);
        REQUIRE(rx.try_recv() == std::optional<int>(2));
    }

    SECTION("unread value is destroyed with the channel") {
        auto tracker = std::make_shared<int>(0);
        {
            auto [tx, rx] = make_oneshot<std::shared_ptr<int>>();
            REQUIRE(tx.try_send(tracker) == send_result::success);
            REQUIRE(tracker.use_count() == 2);
        }
        REQUIRE(tracker.use_count() == 1);
    }
}

TEST_CASE("oneshot - waker") {
    wake_counter counter;

    SECTION("woken by the send") {
        auto [tx, rx] = make_oneshot<int>();
        std::optional<int> out;
        REQUIRE(rx.poll_recv(out, counter.make()) == recv_result::empty);
        REQUIRE(tx.try_send(5) == send_result::success);
        REQUIRE(counter.wakes.load() >= 1);
        REQUIRE(rx.poll_recv(out, counter.make()) == recv_result::success);
        REQUIRE(out == std::optional<int>(5));
    }

    SECTION("woken when the sender goes away") {
        auto [tx, rx] = make_oneshot<int>();
        std::optional<int> out;
        REQUIRE(rx.poll_recv(out, counter.make()) == recv_result::empty);
        tx.reset();
        REQUIRE(counter.wakes.load() >= 1);
        REQUIRE(rx.poll_recv(out, counter.make()) == recv_result::disconnected);
    }
}
