#ifndef GAME_LOGIC_HPP
#define GAME_LOGIC_HPP

#include <string_view>

#include "client_message.hpp"
#include "game_state.hpp"

namespace raid_server
{
    // Game rules the server drives. Every call is made with the shared state lock
    // held, so implementations need no locking of their own.
    class GameLogic
    {
    public:
        virtual ~GameLogic() = default;

        virtual void onPlayerJoined(std::string_view playerId) = 0;
        virtual void onPlayerLeft(std::string_view playerId)   = 0;

        virtual void onPlayerAction(std::string_view playerId, const PlayerAction& action) = 0;
        virtual void onSkillUse(std::string_view playerId, const SkillUse& skill)          = 0;

        virtual void advance(double deltaTime) = 0;

        [[nodiscard]] virtual GameStateSnapshot snapshot() const = 0;
    };
} // namespace raid_server

#endif // GAME_LOGIC_HPP
