// ProgressChannel: concurrent producers, close semantics and consumer termination.

#include <catch2/catch_test_macros.hpp>

#include <parafetch/fetcher/progress_channel.hpp>

#include "../../support/fetch_fixtures.hpp"

#include <cstdint>
#include <future>
#include <thread>
#include <vector>

using namespace parafetch;

TEST_CASE("ProgressChannel delivers reports in send order", "[fetcher][progress]") {
    ProgressChannel ch;
    ch.send(ProgressReport{100, 10});
    ch.send(ProgressReport{100, 20});
    ch.close();

    auto first = ch.receive();
    auto second = ch.receive();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->writtenBytes == 10);
    CHECK(second->writtenBytes == 20);
    CHECK_FALSE(ch.receive().has_value());
}

TEST_CASE("ProgressChannel consumer loop terminates on close", "[fetcher][progress]") {
    ProgressChannel ch;
    auto consumer = std::async(std::launch::async, [&ch] {
        std::int64_t sum = 0;
        while (auto r = ch.receive())
            sum += r->writtenBytes;
        return sum;
    });

    constexpr int kProducers = 8;
    constexpr int kReportsEach = 1000;
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&ch] {
            for (int i = 0; i < kReportsEach; ++i)
                ch.send(ProgressReport{-1, 3});
        });
    }
    for (auto& t : producers)
        t.join();
    ch.close();

    CHECK(consumer.get() == std::int64_t{kProducers} * kReportsEach * 3);
    CHECK(ch.closeCount() == 1);
    CHECK(ch.dropped() == 0);
}

TEST_CASE("ProgressChannel drops reports after close", "[fetcher][progress]") {
    ProgressChannel ch;
    ch.close();
    ch.send(ProgressReport{10, 10});
    CHECK(ch.closed());
    CHECK(ch.dropped() == 1);
    CHECK_FALSE(ch.receive().has_value());
}
