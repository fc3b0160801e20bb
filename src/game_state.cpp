#include "game_state.hpp"

#include <nlohmann/json.hpp>

namespace raid_server
{
    void to_json(nlohmann::json& j, const Vec2& value)
    {
        j = nlohmann::json{{"x", value.x}, {"y", value.y}};
    }

    void to_json(nlohmann::json& j, const PlayerState& value)
    {
        j = nlohmann::json{
            {"id", value.id},
            {"name", value.name},
            {"position", value.position},
            {"health", value.health},
            {"max_health", value.maxHealth},
            {"level", value.level},
            {"is_alive", value.isAlive},
        };
    }

    void to_json(nlohmann::json& j, const BossState& value)
    {
        j = nlohmann::json{
            {"id", value.id},
            {"boss_type", value.bossType},
            {"position", value.position},
            {"health", value.health},
            {"max_health", value.maxHealth},
            {"phase", value.phase},
            {"is_alive", value.isAlive},
        };
    }

    void to_json(nlohmann::json& j, const GameStateSnapshot& value)
    {
        j = nlohmann::json::object();
        j["players"] = value.players;
        if (value.boss)
        {
            j["boss"] = *value.boss;
        }
        else
        {
            j["boss"] = nullptr;
        }
    }
} // namespace raid_server
