#include <chrono>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>

#include <actor-theta.hpp>

using namespace actor_theta;

// a parser that gives up on anything that is not a number
behavior parser(context<std::string>& ctx, long* sum) {
    while (auto line = co_await ctx.receive()) {
        size_t used = 0;
        long value = std::stol(*line, &used);
        if (used != line->size()) {
            co_return errc::actor_failed;
        }
        *sum += value;
        std::cout << "parsed " << value << ", sum " << *sum << std::endl;
    }
    co_return {};
}

int main() {
    std::error_code ec;
    auto rt = runtime::make(runtime_options{}.with_workers(1).with_log_level(log::level::warn), ec);
    if (ec) {
        std::cerr << "cannot create runtime: " << ec.message() << std::endl;
        return 1;
    }

    long sum = 0;
    auto ref = rt->spawn<std::string>(actor_options{}.with_inbox_capacity(16),
                                      make_supervisor<restart_supervisor>(3, std::chrono::seconds(1)),
                                      parser,
                                      &sum);

    // std::stol throws on "abc", "12x" fails the body: both get the parser restarted
    for (const char* line : {"1", "2", "abc", "3", "12x", "4"}) {
        if (!ref.send(std::string(line))) {
            std::cerr << "dropped " << line << std::endl;
        }
    }
    ref.reset();

    auto reason = rt->run();
    std::cout << "sum " << sum << (reason ? ", stopped: " + reason.message() : std::string()) << std::endl;
    return reason ? 1 : 0;
}
