#ifndef GAME_WORLD_HPP
#define GAME_WORLD_HPP

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "game_logic.hpp"

namespace raid_server
{
    enum class RaidOutcome : uint8_t
    {
        Victory,
        Defeat,
    };

    // Boss raid rules: players join with a fixed skill loadout and fight a single
    // boss whose attacks escalate through three phases.
    class GameWorld final : public GameLogic
    {
    public:
        static constexpr int32_t PLAYER_MAX_HEALTH = 200;
        static constexpr double PLAYER_MAX_SPEED   = 200.0;
        static constexpr double RESPAWN_DELAY      = 10.0;
        static constexpr size_t MAX_NAME_LENGTH    = 20;
        static constexpr int32_t BOSS_MAX_HEALTH   = 50000;
        // Experience is awarded at one point per this much damage dealt to the boss.
        static constexpr int32_t DAMAGE_PER_EXPERIENCE = 10;
        static constexpr int32_t HEALTH_PER_LEVEL      = 20;

        GameWorld();
        explicit GameWorld(uint32_t seed);

        void spawnBoss(std::string_view bossType, Vec2 position, int32_t maxHealth = BOSS_MAX_HEALTH);

        void onPlayerJoined(std::string_view playerId) override;
        void onPlayerLeft(std::string_view playerId) override;
        void onPlayerAction(std::string_view playerId, const PlayerAction& action) override;
        void onSkillUse(std::string_view playerId, const SkillUse& skill) override;
        void advance(double deltaTime) override;

        [[nodiscard]] GameStateSnapshot snapshot() const override;

        [[nodiscard]] size_t playerCount() const { return players_.size(); }

        // Victory once the boss is down, defeat once every joined player is down.
        [[nodiscard]] std::optional<RaidOutcome> outcome() const;

    private:
        enum class SkillKind : uint8_t
        {
            Fireball,
            IceSpear,
            QuickHeal,
        };

        struct Skill
        {
            std::string_view name;
            SkillKind kind;
            double cooldown;
            int32_t amount;
            double remaining = 0.0;
        };

        struct Player
        {
            std::string id;
            std::string name;
            Vec2 position;
            Vec2 velocity;
            int32_t health    = PLAYER_MAX_HEALTH;
            int32_t maxHealth = PLAYER_MAX_HEALTH;
            int32_t defense   = 0;
            int32_t level     = 1;
            int32_t experience = 0;
            bool isAlive      = true;
            double respawnTimer = 0.0;
            std::vector<Skill> skills;
        };

        struct Boss
        {
            std::string id;
            std::string bossType;
            Vec2 position;
            int32_t health    = BOSS_MAX_HEALTH;
            int32_t maxHealth = BOSS_MAX_HEALTH;
            int32_t defense   = 0;
            int32_t phase     = 1;
            bool isAlive      = true;
            double abilityCooldown = 3.0;
            double sinceLastAbility = 0.0;
        };

        [[nodiscard]] Player* findPlayer(std::string_view playerId);
        [[nodiscard]] int32_t rollDamage(const Skill& skill);

        void damagePlayer(Player& player, int32_t damage);
        void gainExperience(Player& player, int32_t amount);
        void updateBoss(double deltaTime);
        void runBossAbility();

        std::vector<Player> players_;
        std::optional<Boss> boss_;
        std::optional<RaidOutcome> reportedOutcome_;
        uint32_t spawned_ = 0;
        uint32_t bossesSpawned_ = 0;
        std::mt19937 rng_;
    };
} // namespace raid_server

#endif // GAME_WORLD_HPP
