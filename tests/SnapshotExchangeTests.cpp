#include <catch2/catch.hpp>
#include <array>
#include <atomic>
#include <thread>
#include "dsp/SnapshotExchange.h"
#include "dsp/ParamSnapshot.h"

using namespace interleaf;

namespace
{
struct Stamp
{
    std::array<int, 32> values {};
};

Stamp makeStamp(int value)
{
    Stamp s;
    s.values.fill(value);
    return s;
}
} // namespace

TEST_CASE("Nothing is acquired until something is published", "[snapshot]")
{
    SnapshotExchange<Stamp> exchange(makeStamp(7));
    CHECK_FALSE(exchange.acquire());
    CHECK(exchange.current().values[0] == 7);
}

TEST_CASE("Reader sees the newest published value", "[snapshot]")
{
    SnapshotExchange<Stamp> exchange;
    exchange.publish(makeStamp(1));
    exchange.publish(makeStamp(2));
    exchange.publish(makeStamp(3));

    REQUIRE(exchange.acquire());
    CHECK(exchange.current().values[31] == 3);
    CHECK_FALSE(exchange.acquire());
    CHECK(exchange.current().values[0] == 3);
}

TEST_CASE("Writer slot can be filled in place", "[snapshot]")
{
    SnapshotExchange<ChainSnapshot> exchange(makeDefaultSnapshot());
    auto& slot = exchange.getWriteSlot();
    slot.bands[2].params.gainDb = 4.5f;
    slot.outputGainDb = -3.0f;
    exchange.publish();

    REQUIRE(exchange.acquire());
    CHECK(exchange.current().bands[2].params.gainDb == 4.5f);
    CHECK(exchange.current().outputGainDb == -3.0f);
}

TEST_CASE("Concurrent readers never see a torn snapshot", "[snapshot][thread]")
{
    SnapshotExchange<Stamp> exchange(makeStamp(0));
    std::atomic<bool> done { false };
    constexpr int kWrites = 200000;

    std::thread writer([&]
    {
        for (int i = 1; i <= kWrites; ++i)
            exchange.publish(makeStamp(i));
        done.store(true);
    });

    bool torn = false;
    bool wentBackwards = false;
    int last = 0;
    while (! done.load())
    {
        exchange.acquire();
        const auto& s = exchange.current();
        for (auto v : s.values)
            if (v != s.values[0])
                torn = true;
        if (s.values[0] < last)
            wentBackwards = true;
        last = s.values[0];
    }

    writer.join();
    exchange.acquire();

    CHECK_FALSE(torn);
    CHECK_FALSE(wentBackwards);
    CHECK(exchange.current().values[0] == kWrites);
}
