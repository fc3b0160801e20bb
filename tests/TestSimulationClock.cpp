#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <utility>

#include "broadcaster.hpp"
#include "registry.hpp"
#include "simulation_clock.hpp"
#include "TestSupport.hpp"

using namespace raid_server;
using namespace raid_server::test;

TEST_CASE("SimulationClock ticks at roughly the configured rate", "[clock]")
{
    auto context = MakeRecordingContext();
    Registry registry(4);
    Broadcaster broadcaster(registry);

    boost::asio::io_context io;
    SimulationClock clock(io.get_executor(), context, broadcaster);
    IoRunner runner(io);

    clock.start();
    REQUIRE(clock.isRunning());
    std::this_thread::sleep_for(1s);
    clock.stop();
    std::this_thread::sleep_for(100ms);

    REQUIRE(clock.tickCount() >= 30);
    REQUIRE(clock.tickCount() <= 64);
    REQUIRE(clock.totalDeltaTime() > 0.5);
    REQUIRE(clock.totalDeltaTime() < 1.2);

    // The game sees exactly the deltas the clock accounted for
    const auto [advances, advanced] =
        Inspect(context, [](const RecordingLogic& logic) { return std::pair{logic.advances, logic.advanced}; });
    REQUIRE(advances == clock.tickCount());
    REQUIRE(advanced == Catch::Approx(clock.totalDeltaTime()).margin(1e-6));
}

TEST_CASE("SimulationClock stops ticking after stop", "[clock]")
{
    auto context = MakeRecordingContext();
    Registry registry(4);
    Broadcaster broadcaster(registry);

    boost::asio::io_context io;
    SimulationClock clock(io.get_executor(), context, broadcaster, 5ms);
    IoRunner runner(io);

    clock.start();
    REQUIRE(WaitFor([&clock]() { return clock.tickCount() >= 5; }));
    clock.stop();
    REQUIRE_FALSE(clock.isRunning());

    std::this_thread::sleep_for(50ms);
    const auto ticks = clock.tickCount();
    std::this_thread::sleep_for(100ms);
    REQUIRE(clock.tickCount() == ticks);
}

TEST_CASE("SimulationClock keeps running when a tick fails", "[clock]")
{
    auto context = MakeRecordingContext();
    Inspect(context, [](RecordingLogic& logic) { logic.throwOnAdvance = true; });
    Registry registry(4);
    Broadcaster broadcaster(registry);

    boost::asio::io_context io;
    SimulationClock clock(io.get_executor(), context, broadcaster, 5ms);
    IoRunner runner(io);

    clock.start();
    REQUIRE(WaitFor([&clock]() { return clock.tickCount() >= 10; }));
    REQUIRE(clock.isRunning());
    clock.stop();
}
