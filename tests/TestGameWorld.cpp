#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "game_world.hpp"

using namespace raid_server;
using Catch::Approx;

namespace
{
    constexpr uint32_t SEED = 1234;

    const PlayerState& PlayerIn(const GameStateSnapshot& snapshot, const std::string& id)
    {
        for (const auto& player : snapshot.players)
        {
            if (player.id == id)
            {
                return player;
            }
        }
        FAIL("no player " << id);
        throw std::logic_error("unreachable");
    }

    PlayerAction Move(const double x, const double y)
    {
        return PlayerAction{.action = "move", .data = {{"x", x}, {"y", y}}};
    }

    SkillUse Skill(const int64_t index, std::optional<std::string> target = std::nullopt)
    {
        return SkillUse{.skillIndex = index, .targetId = std::move(target)};
    }
} // namespace

TEST_CASE("Joining players spawn in a row with full health", "[world]")
{
    GameWorld world(SEED);
    world.onPlayerJoined("player_1");
    world.onPlayerJoined("player_2");
    world.onPlayerJoined("player_1");

    const auto snapshot = world.snapshot();
    REQUIRE(world.playerCount() == 2);
    REQUIRE_FALSE(snapshot.boss.has_value());

    const auto& first  = PlayerIn(snapshot, "player_1");
    const auto& second = PlayerIn(snapshot, "player_2");
    REQUIRE(first.position.x == Approx(100.0));
    REQUIRE(second.position.x == Approx(150.0));
    REQUIRE(second.position.y == Approx(100.0));
    REQUIRE(first.health == GameWorld::PLAYER_MAX_HEALTH);
    REQUIRE(first.name == "player_1");
    REQUIRE(first.isAlive);

    world.onPlayerLeft("player_1");
    REQUIRE(world.playerCount() == 1);
}

TEST_CASE("spawnBoss places a full-health boss", "[world][boss]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0});

    const auto boss = world.snapshot().boss;
    REQUIRE(boss.has_value());
    REQUIRE(boss->id == "boss_1");
    REQUIRE(boss->bossType == "Dragon");
    REQUIRE(boss->health == GameWorld::BOSS_MAX_HEALTH);
    REQUIRE(boss->phase == 1);
    REQUIRE(boss->position.x == Approx(500.0));
}

TEST_CASE("Movement is clamped to the maximum speed", "[world][action]")
{
    GameWorld world(SEED);
    world.onPlayerJoined("player_1");

    world.onPlayerAction("player_1", Move(300.0, 400.0));
    world.advance(1.0);

    auto player = PlayerIn(world.snapshot(), "player_1");
    REQUIRE(player.position.x == Approx(220.0));
    REQUIRE(player.position.y == Approx(260.0));

    world.onPlayerAction("player_1", PlayerAction{.action = "stop", .data = nullptr});
    world.advance(1.0);

    player = PlayerIn(world.snapshot(), "player_1");
    REQUIRE(player.position.x == Approx(220.0));
    REQUIRE(player.position.y == Approx(260.0));
}

TEST_CASE("Move without coordinates is ignored", "[world][action]")
{
    GameWorld world(SEED);
    world.onPlayerJoined("player_1");

    world.onPlayerAction("player_1", PlayerAction{.action = "move", .data = {{"x", "left"}}});
    world.advance(1.0);

    REQUIRE(PlayerIn(world.snapshot(), "player_1").position.x == Approx(100.0));
}

TEST_CASE("Rename truncates long names", "[world][action]")
{
    GameWorld world(SEED);
    world.onPlayerJoined("player_1");

    world.onPlayerAction("player_1", PlayerAction{.action = "rename", .data = std::string(30, 'a')});
    REQUIRE(PlayerIn(world.snapshot(), "player_1").name == std::string(GameWorld::MAX_NAME_LENGTH, 'a'));

    world.onPlayerAction("player_1", PlayerAction{.action = "rename", .data = ""});
    REQUIRE(PlayerIn(world.snapshot(), "player_1").name == std::string(GameWorld::MAX_NAME_LENGTH, 'a'));
}

TEST_CASE("Ice Spear deals fixed damage and goes on cooldown", "[world][skill]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0});
    world.onPlayerJoined("player_1");

    world.onSkillUse("player_1", Skill(1));
    REQUIRE(world.snapshot().boss->health == GameWorld::BOSS_MAX_HEALTH - 200);

    world.onSkillUse("player_1", Skill(1));
    REQUIRE(world.snapshot().boss->health == GameWorld::BOSS_MAX_HEALTH - 200);

    world.advance(3.0);
    world.onSkillUse("player_1", Skill(1));
    REQUIRE(world.snapshot().boss->health == GameWorld::BOSS_MAX_HEALTH - 400);
}

TEST_CASE("Fireball damage varies within twenty percent", "[world][skill]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0});
    world.onPlayerJoined("player_1");

    int32_t previous = GameWorld::BOSS_MAX_HEALTH;
    for (int cast = 0; cast < 5; ++cast)
    {
        world.onSkillUse("player_1", Skill(0));
        const int32_t health = world.snapshot().boss->health;
        REQUIRE(previous - health >= 120);
        REQUIRE(previous - health <= 180);
        previous = health;
        world.advance(2.0);
    }
}

TEST_CASE("Out-of-range skill slots are ignored", "[world][skill]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0});
    world.onPlayerJoined("player_1");

    world.onSkillUse("player_1", Skill(3));
    world.onSkillUse("player_1", Skill(-1));
    world.onSkillUse("player_9", Skill(1));

    REQUIRE(world.snapshot().boss->health == GameWorld::BOSS_MAX_HEALTH);
}

TEST_CASE("Boss attacks the first living player every three seconds", "[world][boss]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0});
    world.onPlayerJoined("player_1");
    world.onPlayerJoined("player_2");

    world.advance(2.5);
    REQUIRE(PlayerIn(world.snapshot(), "player_1").health == 200);

    world.advance(0.5);
    const auto snapshot = world.snapshot();
    REQUIRE(PlayerIn(snapshot, "player_1").health == 150);
    REQUIRE(PlayerIn(snapshot, "player_2").health == 200);
}

TEST_CASE("Quick Heal restores health up to the maximum", "[world][skill]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0});
    world.onPlayerJoined("player_1");
    world.onPlayerJoined("player_2");

    world.advance(3.0);
    REQUIRE(PlayerIn(world.snapshot(), "player_1").health == 150);

    world.onSkillUse("player_2", Skill(2, "player_1"));
    REQUIRE(PlayerIn(world.snapshot(), "player_1").health == 200);
}

TEST_CASE("Defeated players cannot act and respawn after the delay", "[world][boss]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0});
    world.onPlayerJoined("player_1");

    for (int attack = 0; attack < 4; ++attack)
    {
        world.advance(3.0);
    }

    auto player = PlayerIn(world.snapshot(), "player_1");
    REQUIRE_FALSE(player.isAlive);
    REQUIRE(player.health == 0);

    world.onSkillUse("player_1", Skill(1));
    REQUIRE(world.snapshot().boss->health == GameWorld::BOSS_MAX_HEALTH);

    world.onPlayerAction("player_1", Move(100.0, 0.0));
    world.advance(GameWorld::RESPAWN_DELAY);

    // The boss strikes again in the same step the player comes back
    player = PlayerIn(world.snapshot(), "player_1");
    REQUIRE(player.isAlive);
    REQUIRE(player.health == 150);
    REQUIRE(player.position.x == Approx(100.0));
}

TEST_CASE("Snapshot serializes with wire field names", "[world][json]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0});
    world.onPlayerJoined("player_1");

    const nlohmann::json json = world.snapshot();

    REQUIRE(json["players"].size() == 1);
    REQUIRE(json["players"][0]["id"] == "player_1");
    REQUIRE(json["players"][0]["max_health"] == 200);
    REQUIRE(json["players"][0]["is_alive"] == true);
    REQUIRE(json["players"][0]["position"]["x"] == 100.0);
    REQUIRE(json["boss"]["boss_type"] == "Dragon");
    REQUIRE(json["boss"]["phase"] == 1);

    const nlohmann::json empty = GameWorld(SEED).snapshot();
    REQUIRE(empty["boss"].is_null());
    REQUIRE(empty["players"].empty());
}

TEST_CASE("Rename never splits a multibyte character", "[world][action]")
{
    GameWorld world(SEED);
    world.onPlayerJoined("player_1");

    // The 20-byte cut would land inside the two-byte "\xC3\xA9"
    world.onPlayerAction("player_1", PlayerAction{.action = "rename", .data = std::string(19, 'a') + "\xC3\xA9"});

    REQUIRE(PlayerIn(world.snapshot(), "player_1").name == std::string(19, 'a'));
    REQUIRE_NOTHROW(nlohmann::json(world.snapshot()).dump());

    world.onPlayerAction("player_1", PlayerAction{.action = "rename", .data = std::string(18, 'a') + "\xC3\xA9"});
    REQUIRE(PlayerIn(world.snapshot(), "player_1").name == std::string(18, 'a') + "\xC3\xA9");
}

TEST_CASE("Boss below half health enters phase two and hits everyone", "[world][boss]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0}, 1000);
    world.onPlayerJoined("player_1");
    world.onPlayerJoined("player_2");
    world.onPlayerJoined("player_3");

    world.onSkillUse("player_1", Skill(1));
    world.onSkillUse("player_2", Skill(1));
    world.onSkillUse("player_3", Skill(1));
    REQUIRE(world.snapshot().boss->health == 400);

    // Phase changes on the next step; the two second cooldown has not elapsed yet
    world.advance(0.5);
    auto snapshot = world.snapshot();
    REQUIRE(snapshot.boss->phase == 2);
    for (const auto& player : snapshot.players)
    {
        REQUIRE(player.health == 200);
    }

    world.advance(1.5);
    snapshot = world.snapshot();
    for (const auto& player : snapshot.players)
    {
        REQUIRE(player.health == 170);
    }

    world.advance(1.5);
    REQUIRE(PlayerIn(world.snapshot(), "player_1").health == 170);
    world.advance(0.5);
    REQUIRE(PlayerIn(world.snapshot(), "player_1").health == 140);
}

TEST_CASE("Boss below a fifth of its health goes berserk", "[world][boss]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0}, 1000);
    world.onPlayerJoined("player_1");
    world.onPlayerJoined("player_2");
    world.onPlayerJoined("player_3");

    world.onSkillUse("player_1", Skill(1));
    world.onSkillUse("player_2", Skill(1));
    world.onSkillUse("player_3", Skill(1));
    world.advance(0.5);
    world.advance(1.5);
    REQUIRE(world.snapshot().boss->phase == 2);

    // Two Fireballs take the remaining 400 into the 40..160 band
    world.onSkillUse("player_1", Skill(0));
    world.onSkillUse("player_2", Skill(0));
    const int32_t wounded = world.snapshot().boss->health;
    REQUIRE(wounded > 0);
    REQUIRE(wounded < 200);

    world.advance(0.5);
    auto snapshot = world.snapshot();
    REQUIRE(snapshot.boss->phase == 3);
    REQUIRE(PlayerIn(snapshot, "player_1").health == 170);

    // One second cooldown, single target for 100
    world.advance(0.5);
    snapshot = world.snapshot();
    REQUIRE(PlayerIn(snapshot, "player_1").health == 70);
    REQUIRE(PlayerIn(snapshot, "player_2").health == 170);
    REQUIRE(PlayerIn(snapshot, "player_3").health == 170);

    // Berserk defense takes 50 off the Ice Spear
    world.onSkillUse("player_3", Skill(1));
    REQUIRE(world.snapshot().boss->health == std::max(0, wounded - 150));
}

TEST_CASE("Damage dealt to the boss levels players up", "[world][progression]")
{
    GameWorld world(SEED);
    world.spawnBoss("Dragon", {500.0, 300.0});
    // The boss always strikes the first living player, so player_1 takes the hits
    world.onPlayerJoined("player_1");
    world.onPlayerJoined("player_2");

    for (int cast = 0; cast < 4; ++cast)
    {
        world.onSkillUse("player_2", Skill(1));
        world.advance(3.0);
    }
    auto caster = PlayerIn(world.snapshot(), "player_2");
    REQUIRE(caster.level == 1);
    REQUIRE(caster.maxHealth == GameWorld::PLAYER_MAX_HEALTH);

    // Fifth Ice Spear brings the total to 1000 damage, 100 experience
    world.onSkillUse("player_2", Skill(1));
    caster = PlayerIn(world.snapshot(), "player_2");
    REQUIRE(caster.level == 2);
    REQUIRE(caster.maxHealth == GameWorld::PLAYER_MAX_HEALTH + GameWorld::HEALTH_PER_LEVEL);
    REQUIRE(caster.health == caster.maxHealth);

    const nlohmann::json json = world.snapshot();
    REQUIRE(json["players"][1]["level"] == 2);
}

TEST_CASE("Raid outcome follows the boss and the players", "[world][outcome]")
{
    SECTION("victory when the boss falls")
    {
        GameWorld world(SEED);
        world.spawnBoss("Dragon", {500.0, 300.0}, 300);
        world.onPlayerJoined("player_1");
        world.onPlayerJoined("player_2");
        REQUIRE_FALSE(world.outcome().has_value());

        world.onSkillUse("player_1", Skill(1));
        world.onSkillUse("player_2", Skill(1));

        const auto boss = world.snapshot().boss;
        REQUIRE(boss->health == 0);
        REQUIRE_FALSE(boss->isAlive);
        REQUIRE(world.outcome() == RaidOutcome::Victory);
    }

    SECTION("defeat when every player is down")
    {
        GameWorld world(SEED);
        world.spawnBoss("Dragon", {500.0, 300.0});
        world.onPlayerJoined("player_1");

        for (int attack = 0; attack < 4; ++attack)
        {
            world.advance(3.0);
        }
        REQUIRE(world.outcome() == RaidOutcome::Defeat);

        world.advance(GameWorld::RESPAWN_DELAY);
        REQUIRE_FALSE(world.outcome().has_value());
    }

    SECTION("no outcome without players")
    {
        GameWorld world(SEED);
        world.spawnBoss("Dragon", {500.0, 300.0});
        REQUIRE_FALSE(world.outcome().has_value());
        REQUIRE_THROWS_AS(world.spawnBoss("Dragon", {0.0, 0.0}, 0), std::invalid_argument);
    }
}
