#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

#include <actor-theta.hpp>

using namespace actor_theta;

// reads the pipe until the writer closes it, printing what arrives
behavior reader(context<int>& ctx, int fd) {
    char buffer[256];
    for (;;) {
        if (auto ec = co_await ctx.wait_readable(fd)) {
            co_return ec;
        }
        auto n = ::read(fd, buffer, sizeof(buffer));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EAGAIN) {
                continue;
            }
            co_return std::error_code(errno, std::system_category());
        }
        std::cout << "read: " << std::string(buffer, static_cast<size_t>(n)) << std::endl;
    }
    co_return {};
}

behavior ticker(context<int>& ctx, int fd) {
    for (int i = 0; i < 5; ++i) {
        co_await ctx.sleep_for(std::chrono::milliseconds(100));
        auto text = "tick " + std::to_string(i);
        if (::write(fd, text.data(), text.size()) < 0) {
            co_return std::error_code(errno, std::system_category());
        }
    }
    ::close(fd);
    co_return {};
}

int main() {
    int fds[2];
    if (::pipe(fds) != 0 || ::fcntl(fds[0], F_SETFL, O_NONBLOCK) != 0) {
        std::cerr << "pipe: " << std::strerror(errno) << std::endl;
        return 1;
    }

    std::error_code ec;
    auto rt = runtime::make(runtime_options{}.with_workers(2), ec);
    if (ec) {
        std::cerr << "cannot create runtime: " << ec.message() << std::endl;
        return 1;
    }

    rt->spawn<int>(std::make_unique<propagate_supervisor>(), reader, fds[0]);
    rt->spawn<int>(std::make_unique<propagate_supervisor>(), ticker, fds[1]);

    auto reason = rt->run();
    ::close(fds[0]);
    if (reason) {
        std::cerr << "runtime stopped: " << reason.message() << std::endl;
        return 1;
    }
    return 0;
}
