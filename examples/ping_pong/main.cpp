#include <atomic>
#include <iostream>
#include <system_error>

#include <actor-theta.hpp>

using namespace actor_theta;

struct ball final {
    int hits;
    actor_ref<ball> reply_to;
};

constexpr int total_hits = 10000;

std::atomic_int count_ping{0};
std::atomic_int count_pong{0};

behavior pong(context<ball>& ctx) {
    while (auto msg = co_await ctx.receive()) {
        ++count_pong;
        auto reply_to = std::move(msg->reply_to);
        reply_to.send(ball{msg->hits + 1, ctx.self()});
    }
    co_return {};
}

behavior ping(context<ball>& ctx, actor_ref<ball> partner) {
    partner.send(ball{0, ctx.self()});
    while (auto msg = co_await ctx.receive()) {
        ++count_ping;
        if (msg->hits >= total_hits) {
            break;
        }
        msg->reply_to.send(ball{msg->hits + 1, ctx.self()});
    }
    co_return {};
}

int main() {
    std::error_code ec;
    auto rt = runtime::make(runtime_options{}.with_workers(2).with_log_level(log::level::info), ec);
    if (ec) {
        std::cerr << "cannot create runtime: " << ec.message() << std::endl;
        return 1;
    }

    auto pong_ref = rt->spawn<ball>(actor_options{}.with_worker(1), nullptr, pong);
    // balls only carry weak references, this one keeps ping's inbox open until it is done
    auto ping_ref = rt->spawn<ball>(actor_options{}.with_worker(0), nullptr, ping, pong_ref);

    // once ping finishes, its copy of pong_ref goes away and pong sees its inbox close
    pong_ref.reset();

    if (auto reason = rt->run()) {
        std::cerr << "runtime stopped: " << reason.message() << std::endl;
        return 1;
    }

    std::cout << "ping received " << count_ping << ", pong received " << count_pong << std::endl;
    return 0;
}
