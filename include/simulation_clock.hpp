#ifndef SIMULATION_CLOCK_HPP
#define SIMULATION_CLOCK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <utility>

#include <boost/asio.hpp>

namespace raid_server
{
    using boost::asio::awaitable;
    using boost::asio::use_awaitable;

    class Broadcaster;
    class GameContext;

    // Fixed-rate simulation loop. Each tick advances the game by the wall-clock
    // time since the previous tick, copies a snapshot under the state lock and
    // broadcasts it outside the lock. Late ticks are not made up for.
    class SimulationClock final
    {
    public:
        static constexpr std::chrono::nanoseconds DEFAULT_FRAME_INTERVAL{1'000'000'000 / 60};

        // Must outlive every thread running the executor.
        SimulationClock(const boost::asio::any_io_executor& executor, GameContext& context, Broadcaster& broadcaster,
                        std::chrono::nanoseconds frameInterval = DEFAULT_FRAME_INTERVAL);

        SimulationClock(const SimulationClock&)            = delete;
        SimulationClock& operator=(const SimulationClock&) = delete;

        void start();
        void stop();

        [[nodiscard]] bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }
        [[nodiscard]] uint64_t tickCount() const noexcept { return ticks_.load(std::memory_order_acquire); }

        // Sum of every deltaTime handed to the game so far, in seconds.
        [[nodiscard]] double totalDeltaTime() const noexcept;

    private:
        awaitable<void> run();
        void tick(double deltaTime);

        boost::asio::strand<boost::asio::any_io_executor> strand_;
        boost::asio::steady_timer timer_;

        GameContext& context_;
        Broadcaster& broadcaster_;
        std::chrono::nanoseconds frameInterval_;

        std::atomic<bool> running_{false};
        std::atomic<uint64_t> ticks_{0};
        std::atomic<int64_t> simulatedNanos_{0};
    };
} // namespace raid_server

#endif // SIMULATION_CLOCK_HPP
