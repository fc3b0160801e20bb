#ifndef GAME_CONTEXT_HPP
#define GAME_CONTEXT_HPP

#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "game_logic.hpp"

namespace raid_server
{
    // Owns the game logic and the lock guarding it. Built once at startup and
    // handed by reference to everything that reads or mutates the simulation.
    class GameContext
    {
    public:
        explicit GameContext(std::unique_ptr<GameLogic> logic) : logic_(std::move(logic))
        {
            if (logic_ == nullptr)
            {
                throw std::invalid_argument("game context requires game logic");
            }
        }

        GameContext(const GameContext&)            = delete;
        GameContext& operator=(const GameContext&) = delete;

        // Runs fn(logic) under the state lock. Keep fn short and free of I/O.
        template <typename Fn>
        decltype(auto) withState(Fn&& fn)
        {
            const std::scoped_lock lock(mutex_);
            return std::forward<Fn>(fn)(*logic_);
        }

    private:
        std::mutex mutex_;
        std::unique_ptr<GameLogic> logic_;
    };
} // namespace raid_server

#endif // GAME_CONTEXT_HPP
