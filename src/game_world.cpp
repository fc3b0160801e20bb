#include "game_world.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace
{
    using namespace raid_server;

    constexpr Vec2 FIRST_SPAWN{100.0, 100.0};
    constexpr double SPAWN_SPACING = 50.0;

    constexpr int32_t BASIC_ATTACK_DAMAGE   = 50;
    constexpr int32_t AREA_ATTACK_DAMAGE    = 30;
    constexpr int32_t BERSERK_ATTACK_DAMAGE = 100;
    constexpr int32_t BERSERK_DEFENSE_BONUS = 50;

    int32_t MitigatedDamage(const int32_t damage, const int32_t defense)
    {
        return std::max(1, damage - defense);
    }

    // Cuts to at most maxBytes without splitting a UTF-8 sequence.
    std::string TruncateUtf8(const std::string& text, const size_t maxBytes)
    {
        if (text.size() <= maxBytes)
        {
            return text;
        }

        size_t end = maxBytes;
        while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0U) == 0x80U)
        {
            --end;
        }
        return text.substr(0, end);
    }
} // namespace

namespace raid_server
{
    GameWorld::GameWorld() : rng_(std::random_device{}()) {}

    GameWorld::GameWorld(const uint32_t seed) : rng_(seed) {}

    void GameWorld::spawnBoss(const std::string_view bossType, const Vec2 position, const int32_t maxHealth)
    {
        if (maxHealth <= 0)
        {
            throw std::invalid_argument("boss health must be positive");
        }

        boss_ = Boss{
            .id        = "boss_" + std::to_string(++bossesSpawned_),
            .bossType  = std::string(bossType),
            .position  = position,
            .health    = maxHealth,
            .maxHealth = maxHealth,
        };
        reportedOutcome_.reset();
        spdlog::info("Boss {} spawned at ({}, {}) with {} HP", bossType, position.x, position.y, maxHealth);
    }

    void GameWorld::onPlayerJoined(const std::string_view playerId)
    {
        if (findPlayer(playerId) != nullptr)
        {
            spdlog::warn("Player {} already in the world", playerId);
            return;
        }

        Player player{
            .id       = std::string(playerId),
            .name     = std::string(playerId),
            .position = {FIRST_SPAWN.x + SPAWN_SPACING * spawned_++, FIRST_SPAWN.y},
        };
        player.skills = {
            Skill{.name = "Fireball", .kind = SkillKind::Fireball, .cooldown = 2.0, .amount = 150},
            Skill{.name = "Ice Spear", .kind = SkillKind::IceSpear, .cooldown = 3.0, .amount = 200},
            Skill{.name = "Quick Heal", .kind = SkillKind::QuickHeal, .cooldown = 5.0, .amount = 80},
        };
        players_.push_back(std::move(player));
    }

    void GameWorld::onPlayerLeft(const std::string_view playerId)
    {
        std::erase_if(players_, [playerId](const Player& player) { return player.id == playerId; });
    }

    void GameWorld::onPlayerAction(const std::string_view playerId, const PlayerAction& action)
    {
        Player* player = findPlayer(playerId);
        if (player == nullptr || !player->isAlive)
        {
            return;
        }

        if (action.action == "move")
        {
            const auto& data = action.data;
            if (!data.is_object() || !data.contains("x") || !data.contains("y") || !data["x"].is_number()
                || !data["y"].is_number())
            {
                spdlog::warn("Player {} sent move without numeric x/y", playerId);
                return;
            }

            Vec2 velocity{data["x"].get<double>(), data["y"].get<double>()};
            if (const double speed = std::hypot(velocity.x, velocity.y); speed > PLAYER_MAX_SPEED)
            {
                velocity.x *= PLAYER_MAX_SPEED / speed;
                velocity.y *= PLAYER_MAX_SPEED / speed;
            }
            player->velocity = velocity;
            return;
        }

        if (action.action == "stop")
        {
            player->velocity = {};
            return;
        }

        if (action.action == "rename")
        {
            if (!action.data.is_string() || action.data.get_ref<const std::string&>().empty())
            {
                spdlog::warn("Player {} sent rename without a name", playerId);
                return;
            }
            player->name = TruncateUtf8(action.data.get_ref<const std::string&>(), MAX_NAME_LENGTH);
            return;
        }

        spdlog::debug("Ignoring action '{}' from {}", action.action, playerId);
    }

    void GameWorld::onSkillUse(const std::string_view playerId, const SkillUse& skill)
    {
        Player* caster = findPlayer(playerId);
        if (caster == nullptr || !caster->isAlive)
        {
            return;
        }

        if (skill.skillIndex < 0 || static_cast<size_t>(skill.skillIndex) >= caster->skills.size())
        {
            spdlog::debug("Player {} used unknown skill slot {}", playerId, skill.skillIndex);
            return;
        }

        auto& slot = caster->skills[static_cast<size_t>(skill.skillIndex)];
        if (slot.remaining > 0.0)
        {
            return;
        }

        if (slot.kind == SkillKind::QuickHeal)
        {
            Player* target = caster;
            if (skill.targetId)
            {
                if (Player* other = findPlayer(*skill.targetId); other != nullptr && other->isAlive)
                {
                    target = other;
                }
            }
            target->health = std::min(target->maxHealth, target->health + slot.amount);
            slot.remaining = slot.cooldown;
            return;
        }

        if (!boss_ || !boss_->isAlive)
        {
            return;
        }

        const int32_t damage = std::min(boss_->health, MitigatedDamage(rollDamage(slot), boss_->defense));
        boss_->health -= damage;
        slot.remaining = slot.cooldown;
        spdlog::debug("{} hits {} with {} for {}", caster->name, boss_->bossType, slot.name, damage);
        gainExperience(*caster, damage / DAMAGE_PER_EXPERIENCE);

        if (boss_->health == 0)
        {
            boss_->isAlive = false;
            spdlog::info("Boss {} defeated by {}", boss_->bossType, caster->name);
        }
    }

    void GameWorld::advance(const double deltaTime)
    {
        for (auto& player : players_)
        {
            if (!player.isAlive)
            {
                player.respawnTimer -= deltaTime;
                if (player.respawnTimer <= 0.0)
                {
                    player.isAlive = true;
                    player.health  = player.maxHealth;
                    player.velocity = {};
                    spdlog::info("Player {} respawned", player.name);
                }
                continue;
            }

            player.position.x += player.velocity.x * deltaTime;
            player.position.y += player.velocity.y * deltaTime;
            for (auto& skill : player.skills)
            {
                skill.remaining = std::max(0.0, skill.remaining - deltaTime);
            }
        }

        updateBoss(deltaTime);

        if (const auto result = outcome(); result != reportedOutcome_)
        {
            reportedOutcome_ = result;
            if (result == RaidOutcome::Victory)
            {
                spdlog::info("Raid won");
            }
            else if (result == RaidOutcome::Defeat)
            {
                spdlog::info("Raid lost, every player is down");
            }
        }
    }

    std::optional<RaidOutcome> GameWorld::outcome() const
    {
        if (boss_ && !boss_->isAlive)
        {
            return RaidOutcome::Victory;
        }

        if (!players_.empty()
            && std::ranges::none_of(players_, [](const Player& player) { return player.isAlive; }))
        {
            return RaidOutcome::Defeat;
        }
        return std::nullopt;
    }

    GameStateSnapshot GameWorld::snapshot() const
    {
        GameStateSnapshot snapshot;
        snapshot.players.reserve(players_.size());
        for (const auto& player : players_)
        {
            snapshot.players.push_back(PlayerState{
                .id        = player.id,
                .name      = player.name,
                .position  = player.position,
                .health    = player.health,
                .maxHealth = player.maxHealth,
                .level     = player.level,
                .isAlive   = player.isAlive,
            });
        }

        if (boss_)
        {
            snapshot.boss = BossState{
                .id        = boss_->id,
                .bossType  = boss_->bossType,
                .position  = boss_->position,
                .health    = boss_->health,
                .maxHealth = boss_->maxHealth,
                .phase     = boss_->phase,
                .isAlive   = boss_->isAlive,
            };
        }
        return snapshot;
    }

    GameWorld::Player* GameWorld::findPlayer(const std::string_view playerId)
    {
        const auto it = std::ranges::find_if(players_, [playerId](const Player& player) { return player.id == playerId; });
        return it != players_.end() ? &*it : nullptr;
    }

    int32_t GameWorld::rollDamage(const Skill& skill)
    {
        if (skill.kind != SkillKind::Fireball)
        {
            return skill.amount;
        }

        std::uniform_real_distribution<double> spread(0.8, 1.2);
        return static_cast<int32_t>(skill.amount * spread(rng_));
    }

    void GameWorld::damagePlayer(Player& player, const int32_t damage)
    {
        player.health = std::max(0, player.health - MitigatedDamage(damage, player.defense));
        if (player.health == 0)
        {
            player.isAlive      = false;
            player.respawnTimer = RESPAWN_DELAY;
            player.velocity     = {};
            spdlog::info("Player {} was defeated", player.name);
        }
    }

    void GameWorld::gainExperience(Player& player, const int32_t amount)
    {
        player.experience += amount;
        // Level N needs N * 100 experience to reach N + 1
        while (player.experience >= player.level * 100)
        {
            player.experience -= player.level * 100;
            ++player.level;
            player.maxHealth += HEALTH_PER_LEVEL;
            player.health = player.maxHealth;
            spdlog::info("{} reached level {}", player.name, player.level);
        }
    }

    void GameWorld::updateBoss(const double deltaTime)
    {
        if (!boss_ || !boss_->isAlive)
        {
            return;
        }

        const double healthRatio = static_cast<double>(boss_->health) / boss_->maxHealth;
        if (boss_->phase == 1 && healthRatio < 0.5)
        {
            boss_->phase           = 2;
            boss_->abilityCooldown = 2.0;
            spdlog::info("Boss {} enters phase 2", boss_->bossType);
        }
        else if (boss_->phase == 2 && healthRatio < 0.2)
        {
            boss_->phase           = 3;
            boss_->abilityCooldown = 1.0;
            boss_->defense += BERSERK_DEFENSE_BONUS;
            spdlog::info("Boss {} goes berserk", boss_->bossType);
        }

        boss_->sinceLastAbility += deltaTime;
        if (boss_->sinceLastAbility >= boss_->abilityCooldown)
        {
            runBossAbility();
        }
    }

    void GameWorld::runBossAbility()
    {
        std::vector<Player*> targets;
        for (auto& player : players_)
        {
            if (player.isAlive)
            {
                targets.push_back(&player);
            }
        }

        if (targets.empty())
        {
            return;
        }

        boss_->sinceLastAbility = 0.0;
        switch (boss_->phase)
        {
        case 1:
            damagePlayer(*targets.front(), BASIC_ATTACK_DAMAGE);
            break;
        case 2:
            for (Player* target : targets)
            {
                damagePlayer(*target, AREA_ATTACK_DAMAGE);
            }
            break;
        default:
            damagePlayer(*targets.front(), BERSERK_ATTACK_DAMAGE);
            break;
        }
    }
} // namespace raid_server
