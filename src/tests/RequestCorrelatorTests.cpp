// SPDX-License-Identifier: Apache-2.0
#include <mcp/RequestCorrelator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace mcphub;

TEST_CASE("RequestCorrelator allocates increasing ids from 1", "[correlator]")
{
    auto correlator = RequestCorrelator {};

    CHECK(correlator.add([](Result<nlohmann::json>) {}) == 1);
    CHECK(correlator.add([](Result<nlohmann::json>) {}) == 2);
    CHECK(correlator.size() == 2);
    CHECK(correlator.pendingIds() == std::vector<int64_t> { 1, 2 });
}

TEST_CASE("RequestCorrelator resolves each id exactly once", "[correlator]")
{
    auto correlator = RequestCorrelator {};
    auto calls = 0;
    auto received = nlohmann::json {};

    auto const id = correlator.add([&](Result<nlohmann::json> result) {
        ++calls;
        REQUIRE(result.has_value());
        received = *result;
    });

    CHECK(correlator.resolve(id, nlohmann::json { { "ok", true } }));
    CHECK(!correlator.resolve(id, makeError(ErrorCode::TimeoutError, "late timeout")));
    CHECK(!correlator.remove(id).has_value());

    CHECK(calls == 1);
    CHECK(received["ok"] == true);
    CHECK(!correlator.contains(id));
}

TEST_CASE("RequestCorrelator ignores unknown ids", "[correlator]")
{
    auto correlator = RequestCorrelator {};
    CHECK(!correlator.resolve(99, nlohmann::json::object()));
    CHECK(correlator.size() == 0);
}

TEST_CASE("RequestCorrelator failAll drains every entry with the error", "[correlator]")
{
    auto correlator = RequestCorrelator {};
    auto errors = std::vector<ErrorCode> {};

    for (auto i = 0; i < 3; ++i)
        (void) correlator.add([&](Result<nlohmann::json> result) {
            REQUIRE(!result.has_value());
            errors.push_back(result.error().code);
        });

    CHECK(correlator.failAll(Error { ErrorCode::TransportError, "Connection closed" }) == 3);
    CHECK(errors == std::vector<ErrorCode>(3, ErrorCode::TransportError));
    CHECK(correlator.size() == 0);
    CHECK(correlator.failAll(Error { ErrorCode::TransportError, "again" }) == 0);
}

TEST_CASE("RequestCorrelator removeAll hands over the continuations", "[correlator]")
{
    auto correlator = RequestCorrelator {};
    auto const a = correlator.add([](Result<nlohmann::json>) {});
    auto const b = correlator.add([](Result<nlohmann::json>) {});

    auto drained = correlator.removeAll();
    CHECK(drained.size() == 2);
    CHECK(drained.contains(a));
    CHECK(drained.contains(b));
    CHECK(correlator.size() == 0);
}

TEST_CASE("RequestCorrelator hands out unique ids under concurrency", "[correlator]")
{
    auto correlator = RequestCorrelator {};
    constexpr auto ThreadCount = 8;
    constexpr auto PerThread = 200;

    auto ids = std::vector<std::vector<int64_t>>(ThreadCount);
    auto resolved = std::atomic<int> { 0 };
    {
        auto threads = std::vector<std::jthread> {};
        for (auto t = 0; t < ThreadCount; ++t)
        {
            threads.emplace_back([&, t] {
                for (auto i = 0; i < PerThread; ++i)
                    ids[t].push_back(correlator.add([&](Result<nlohmann::json>) { ++resolved; }));
            });
        }
    }

    auto unique = std::set<int64_t> {};
    for (auto const& batch: ids)
        unique.insert(batch.begin(), batch.end());
    CHECK(unique.size() == ThreadCount * PerThread);

    {
        auto threads = std::vector<std::jthread> {};
        for (auto t = 0; t < ThreadCount; ++t)
        {
            threads.emplace_back([&] {
                for (auto const id: unique)
                    correlator.resolve(id, nlohmann::json::object());
            });
        }
    }

    CHECK(resolved == ThreadCount * PerThread);
    CHECK(correlator.size() == 0);
}
