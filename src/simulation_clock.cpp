#include "simulation_clock.hpp"

#include <spdlog/spdlog.h>

#include "broadcaster.hpp"
#include "game_context.hpp"

namespace raid_server
{
    using std::chrono::steady_clock;

    SimulationClock::SimulationClock(const boost::asio::any_io_executor& executor, GameContext& context,
                                     Broadcaster& broadcaster, const std::chrono::nanoseconds frameInterval) :
        strand_(boost::asio::make_strand(executor)), timer_(strand_), context_(context), broadcaster_(broadcaster),
        frameInterval_(frameInterval)
    {
    }

    void SimulationClock::start()
    {
        if (running_.exchange(true))
        {
            return;
        }

        boost::asio::co_spawn(
            strand_, [this]() -> awaitable<void> { co_await run(); }, boost::asio::detached);
    }

    void SimulationClock::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }

        boost::asio::post(strand_, [this]() { timer_.cancel(); });
    }

    double SimulationClock::totalDeltaTime() const noexcept
    {
        return std::chrono::duration<double>(std::chrono::nanoseconds(simulatedNanos_.load())).count();
    }

    awaitable<void> SimulationClock::run()
    {
        spdlog::info("Simulation running at {:.1f} Hz",
                     1.0 / std::chrono::duration<double>(frameInterval_).count());

        auto lastTick = steady_clock::now();
        while (isRunning())
        {
            const auto tickStart = steady_clock::now();
            const auto delta     = std::chrono::duration_cast<std::chrono::nanoseconds>(tickStart - lastTick);
            lastTick             = tickStart;

            tick(std::chrono::duration<double>(delta).count());
            simulatedNanos_.fetch_add(delta.count(), std::memory_order_relaxed);
            ticks_.fetch_add(1, std::memory_order_release);

            const auto spent = steady_clock::now() - tickStart;
            timer_.expires_after(spent < frameInterval_ ? frameInterval_ - spent : steady_clock::duration::zero());

            boost::system::error_code ec;
            co_await timer_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
            if (ec && ec != boost::asio::error::operation_aborted)
            {
                spdlog::error("Simulation timer failed: {}", ec.message());
                break;
            }
        }

        spdlog::info("Simulation stopped after {} ticks", tickCount());
    }

    void SimulationClock::tick(const double deltaTime)
    {
        try
        {
            const auto snapshot = context_.withState([deltaTime](GameLogic& logic) {
                logic.advance(deltaTime);
                return logic.snapshot();
            });

            broadcaster_.broadcast(snapshot);
        }
        catch (const std::exception& e)
        {
            spdlog::error("Simulation tick failed: {}", e.what());
        }
    }
} // namespace raid_server
