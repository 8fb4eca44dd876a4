#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <actor-theta/errors.hpp>
#include <actor-theta/log.hpp>

#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace actor_theta;

namespace {

    struct captured_sink {
        std::vector<std::pair<log::level, std::string>> records;

        captured_sink() {
            log::set_sink([this](log::level lvl, std::string_view message) {
                records.emplace_back(lvl, std::string(message));
            });
        }

        ~captured_sink() {
            log::set_sink(nullptr);
            log::set_level(log::level::warn);
        }
    };

} // namespace

TEST_CASE("log - level filtering") {
    captured_sink sink;
    log::set_level(log::level::info);

    ACTOR_THETA_LOG_DEBUG("hidden {}", 1);
    ACTOR_THETA_LOG_INFO("worker {} started", 3);
    ACTOR_THETA_LOG_ERROR("failed: {}", "boom");

    REQUIRE(sink.records.size() == 2);
    REQUIRE(sink.records[0].first == log::level::info);
    REQUIRE(sink.records[0].second == "worker 3 started");
    REQUIRE(sink.records[1].first == log::level::error);
    REQUIRE(sink.records[1].second == "failed: boom");

    log::set_level(log::level::off);
    ACTOR_THETA_LOG_ERROR("dropped");
    REQUIRE(sink.records.size() == 2);
    REQUIRE_FALSE(log::enabled(log::level::error));
}

TEST_CASE("log - level names") {
    REQUIRE(log::to_string(log::level::trace) == "trace");
    REQUIRE(log::to_string(log::level::warn) == "warn");
    REQUIRE(log::to_string(log::level::off) == "off");
}

TEST_CASE("errors - actor-theta category") {
    std::error_code ec = errc::full;
    REQUIRE(ec.category().name() == std::string("actor-theta"));
    REQUIRE(ec == make_error_code(errc::full));
    REQUIRE(ec != make_error_code(errc::disconnected));
    REQUIRE(ec.message() == "inbox is full");
    REQUIRE(make_error_code(errc::receiver_connected).message() == "inbox already has a connected receiver");
    REQUIRE_FALSE(std::error_code{});
}
