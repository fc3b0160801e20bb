#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace raid_server
{
    struct Vec2
    {
        double x = 0.0;
        double y = 0.0;
    };

    struct PlayerState
    {
        std::string id;
        std::string name;
        Vec2 position;
        int32_t health    = 0;
        int32_t maxHealth = 0;
        int32_t level     = 1;
        bool isAlive      = true;
    };

    struct BossState
    {
        std::string id;
        std::string bossType;
        Vec2 position;
        int32_t health    = 0;
        int32_t maxHealth = 0;
        int32_t phase     = 1;
        bool isAlive      = true;
    };

    // Value copy of the simulation taken at one tick boundary.
    struct GameStateSnapshot
    {
        std::vector<PlayerState> players;
        std::optional<BossState> boss;
    };

    void to_json(nlohmann::json& j, const Vec2& value);
    void to_json(nlohmann::json& j, const PlayerState& value);
    void to_json(nlohmann::json& j, const BossState& value);
    void to_json(nlohmann::json& j, const GameStateSnapshot& value);
} // namespace raid_server

#endif // GAME_STATE_HPP
