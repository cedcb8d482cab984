/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GameSessionTests
#include <boost/test/unit_test.hpp>

#include "core/GameConfig.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "input/InputSource.hpp"
#include <algorithm>
#include <map>
#include <vector>

using namespace Skybound;

namespace {

constexpr uint64_t RUN_SEED = 42;

FrameInput pausePress() {
    FrameInput input;
    input.pausePressed = true;
    return input;
}

bool hasEvent(const GameEventList& events, GameEventType type) {
    return std::any_of(events.begin(), events.end(),
                       [type](const GameEvent& e) { return e.type == type; });
}

} // namespace

struct SessionFixture {
    SessionFixture() {
        SKYBOUND_ENABLE_BENCHMARK_MODE();
        session.setEventHandler([this](const GameEvent& e) { events.push_back(e); });
        session.setSnapshotHandler([this](const ProgressSnapshot& p) { snapshots.push_back(p); });
    }

    GameConfig config = GameConfig::defaults();
    GameSession session{config, RUN_SEED};
    std::vector<GameEvent> events;
    std::vector<ProgressSnapshot> snapshots;

    void idle(int ticks) {
        for (int i = 0; i < ticks; ++i) {
            session.update(FrameInput{});
        }
    }

    // Moves the player's hitbox top-left, as a spawn or teleport would
    void placePlayer(float x, float y) {
        Entity* player = session.getPlayer();
        BOOST_REQUIRE(player != nullptr);
        player->position = Vector2D(x, y);
        player->velocity = Vector2D(0.0f, 0.0f);
        player->grounded = false;
        session.getWorld().refresh(PLAYER_ENTITY_ID);
    }

    std::map<EntityID, Vector2D> positions() const {
        std::map<EntityID, Vector2D> out;
        for (const auto& [id, entity] : session.getWorld().entities()) {
            out[id] = entity.position;
        }
        return out;
    }

    Entity* findProjectile() {
        for (auto& [id, entity] : session.getWorld().entities()) {
            if (entity.kind == EntityKind::Enemy &&
                entity.enemyVariant() == EnemyVariant::Projectile) {
                return &entity;
            }
        }
        return nullptr;
    }

    // Shooter on the start platform, one tick away from firing
    void addLoadedShooter(EntityID id, float centerX) {
        const SpawnTable& table = session.getGenerator().getSpawnTable();
        Entity shooter = table.makeEnemy(id, EnemyVariant::Shooter,
                                         session.getLevel().platforms.front().hitbox(), centerX, 1u);
        shooter.behavior.timer = table.enemy(EnemyVariant::Shooter).shotInterval - 1;
        session.getWorld().add(shooter);
    }

    const Entity* findFirst(EntityKind kind) const {
        for (const auto& [id, entity] : session.getWorld().entities()) {
            if (entity.kind == kind) {
                return &entity;
            }
        }
        return nullptr;
    }
};

BOOST_FIXTURE_TEST_SUITE(GameSessionTests, SessionFixture)

BOOST_AUTO_TEST_CASE(TestStartEntersPlaying) {
    BOOST_CHECK_EQUAL(session.getState(), SessionState::Loading);
    session.start();

    BOOST_CHECK_EQUAL(session.getState(), SessionState::Playing);
    BOOST_CHECK_EQUAL(session.getLevelIndex(), 1);
    BOOST_CHECK_EQUAL(session.getScore(), 0);
    BOOST_CHECK(session.getLevel().tutorial);
    BOOST_CHECK_EQUAL(session.getWorld().size(), session.getLevel().entityCount() + 1);

    const Entity* player = session.getPlayer();
    BOOST_REQUIRE(player != nullptr);
    BOOST_CHECK_EQUAL(player->position.getX(), session.getLevel().startPosition.getX());
    BOOST_CHECK_EQUAL(player->position.getY(), session.getLevel().startPosition.getY());
}

BOOST_AUTO_TEST_CASE(TestUpdateFromLoadingLoadsLevel) {
    session.update(FrameInput{});
    BOOST_CHECK_EQUAL(session.getState(), SessionState::Playing);
    BOOST_CHECK(session.getPlayer() != nullptr);
}

BOOST_AUTO_TEST_CASE(TestPlayerRestsOnStartPlatform) {
    session.start();
    idle(90);

    const Entity* player = session.getPlayer();
    BOOST_REQUIRE(player != nullptr);
    BOOST_CHECK(player->grounded);
    BOOST_CHECK_CLOSE(player->position.getY(), session.getLevel().startPosition.getY(), 0.001f);
    BOOST_CHECK_EQUAL(session.getState(), SessionState::Playing);
    BOOST_CHECK_EQUAL(session.getTick(), 90u);
}

BOOST_AUTO_TEST_CASE(TestPauseFreezesEverything) {
    session.start();
    idle(30);

    session.update(pausePress());
    BOOST_CHECK_EQUAL(session.getState(), SessionState::Paused);

    const auto before = positions();
    const uint64_t tick = session.getTick();
    idle(120);

    BOOST_CHECK_EQUAL(session.getState(), SessionState::Paused);
    BOOST_CHECK_EQUAL(session.getTick(), tick);
    const auto after = positions();
    BOOST_REQUIRE_EQUAL(before.size(), after.size());
    for (const auto& [id, position] : before) {
        BOOST_CHECK_EQUAL(after.at(id).getX(), position.getX());
        BOOST_CHECK_EQUAL(after.at(id).getY(), position.getY());
    }

    session.update(pausePress());
    BOOST_CHECK_EQUAL(session.getState(), SessionState::Playing);
    BOOST_CHECK_EQUAL(session.getTick(), tick);
}

BOOST_AUTO_TEST_CASE(TestTogglePauseTwiceIsNoOp) {
    session.start();
    idle(10);
    const auto before = positions();

    for (int i = 0; i < 6; ++i) {
        session.togglePause();
    }
    BOOST_CHECK_EQUAL(session.getState(), SessionState::Playing);
    BOOST_CHECK(before == positions());
    BOOST_CHECK_EQUAL(session.getTick(), 10u);
}

BOOST_AUTO_TEST_CASE(TestFallingCostsHealthAndRespawns) {
    session.start();
    placePlayer(30.0f, 650.0f);
    session.update(FrameInput{});

    BOOST_CHECK_EQUAL(session.getState(), SessionState::Playing);
    BOOST_CHECK_EQUAL(session.getPlayerState().getHealth(), config.session.startHealth - 1);
    const Entity* player = session.getPlayer();
    BOOST_CHECK_EQUAL(player->position.getX(), session.getLevel().startPosition.getX());
    BOOST_CHECK_EQUAL(player->position.getY(), session.getLevel().startPosition.getY());
}

BOOST_AUTO_TEST_CASE(TestGameOverWhenHealthRunsOut) {
    session.start();
    for (int life = 0; life < config.session.startHealth; ++life) {
        BOOST_REQUIRE_EQUAL(session.getState(), SessionState::Playing);
        placePlayer(30.0f, 650.0f);
        session.update(FrameInput{});
    }

    BOOST_CHECK_EQUAL(session.getState(), SessionState::GameOver);
    BOOST_CHECK(session.getPlayerState().isDead());
    BOOST_CHECK(hasEvent(session.getLastEvents(), GameEventType::PlayerDied));
    BOOST_REQUIRE_EQUAL(snapshots.size(), 1u);
    BOOST_CHECK_EQUAL(snapshots.back().levelReached, 1);
    BOOST_CHECK_EQUAL(snapshots.back().seed, RUN_SEED);

    // GameOver holds until restart
    const uint64_t tick = session.getTick();
    idle(20);
    BOOST_CHECK_EQUAL(session.getState(), SessionState::GameOver);
    BOOST_CHECK_EQUAL(session.getTick(), tick);

    session.restart();
    BOOST_CHECK_EQUAL(session.getState(), SessionState::Playing);
    BOOST_CHECK_EQUAL(session.getLevelIndex(), 1);
    BOOST_CHECK_EQUAL(session.getScore(), 0);
    BOOST_CHECK_EQUAL(session.getPlayerState().getHealth(), config.session.startHealth);
}

BOOST_AUTO_TEST_CASE(TestGoalCompletesLevel) {
    session.start();
    const Vector2D goal = session.getLevel().goalPosition;
    placePlayer(goal.getX(), goal.getY());
    session.update(FrameInput{});

    BOOST_CHECK_EQUAL(session.getState(), SessionState::LevelComplete);
    BOOST_CHECK_EQUAL(session.getScore(), 1);
    BOOST_CHECK(hasEvent(session.getLastEvents(), GameEventType::GoalReached));
    BOOST_REQUIRE_EQUAL(snapshots.size(), 1u);
    BOOST_CHECK_EQUAL(snapshots.back().score, 1);

    // Next tick builds level 2
    session.update(FrameInput{});
    BOOST_CHECK_EQUAL(session.getState(), SessionState::Playing);
    BOOST_CHECK_EQUAL(session.getLevelIndex(), 2);
    BOOST_CHECK(!session.getLevel().tutorial);
    BOOST_CHECK_EQUAL(session.getScore(), 1);
    BOOST_CHECK_EQUAL(session.getPlayerState().getHealth(), config.session.startHealth);

    const Entity* player = session.getPlayer();
    BOOST_REQUIRE(player != nullptr);
    BOOST_CHECK_EQUAL(player->position.getX(), session.getLevel().startPosition.getX());
}

BOOST_AUTO_TEST_CASE(TestCollectPowerUp) {
    session.start();
    const Entity* coin = findFirst(EntityKind::PowerUp);
    BOOST_REQUIRE(coin != nullptr);
    const EntityID coinId = coin->id;
    const Vector2D coinPos = coin->position;

    placePlayer(coinPos.getX() - 7.0f, coinPos.getY() + 1.0f);
    session.update(FrameInput{});

    BOOST_CHECK_EQUAL(session.getPlayerState().getCoins(), 1);
    BOOST_CHECK(session.getWorld().find(coinId) == nullptr);
    BOOST_CHECK(hasEvent(session.getLastEvents(), GameEventType::PowerUpCollected));
    BOOST_CHECK(std::any_of(events.begin(), events.end(), [coinId](const GameEvent& e) {
        return e.type == GameEventType::PowerUpCollected && e.other == coinId;
    }));

    // Coins carry into the next level
    const Vector2D goal = session.getLevel().goalPosition;
    placePlayer(goal.getX(), goal.getY());
    session.update(FrameInput{});
    session.update(FrameInput{});
    BOOST_CHECK_EQUAL(session.getLevelIndex(), 2);
    BOOST_CHECK_EQUAL(session.getPlayerState().getCoins(), 1);
}

BOOST_AUTO_TEST_CASE(TestEnemyContactDamagesOnce) {
    session.start();
    const Entity* enemy = findFirst(EntityKind::Enemy);
    BOOST_REQUIRE(enemy != nullptr);
    const Vector2D enemyPos = enemy->position;

    placePlayer(enemyPos.getX() + 5.0f, enemyPos.getY());
    session.update(FrameInput{});

    BOOST_CHECK_EQUAL(session.getPlayerState().getHealth(), config.session.startHealth - 1);
    BOOST_CHECK(session.getPlayerState().isInvincible());
    BOOST_CHECK(hasEvent(session.getLastEvents(), GameEventType::EnemyHit));

    // Still touching, but invincibility frames hold
    placePlayer(enemyPos.getX() + 5.0f, enemyPos.getY());
    session.update(FrameInput{});
    BOOST_CHECK_EQUAL(session.getPlayerState().getHealth(), config.session.startHealth - 1);
    BOOST_CHECK(!hasEvent(session.getLastEvents(), GameEventType::EnemyHit));
}

BOOST_AUTO_TEST_CASE(TestResumePoint) {
    session.start(ResumePoint{4, 99});

    BOOST_CHECK_EQUAL(session.getState(), SessionState::Playing);
    BOOST_CHECK_EQUAL(session.getLevelIndex(), 4);
    BOOST_CHECK_EQUAL(session.getRunSeed(), 99u);
    BOOST_CHECK_EQUAL(session.getScore(), 3);
    BOOST_CHECK_EQUAL(session.getLevel().tierName, "Hills");
}

BOOST_AUTO_TEST_CASE(TestInvalidResumeStartsFresh) {
    session.start(ResumePoint{0, 7});

    BOOST_CHECK_EQUAL(session.getState(), SessionState::Playing);
    BOOST_CHECK_EQUAL(session.getLevelIndex(), 1);
    BOOST_CHECK_EQUAL(session.getRunSeed(), RUN_SEED);
    BOOST_CHECK_EQUAL(session.getScore(), 0);
}

BOOST_AUTO_TEST_CASE(TestRenderSnapshot) {
    session.start(ResumePoint{3, 5});
    idle(5);

    const RenderSnapshot snapshot = session.buildRenderSnapshot();
    BOOST_CHECK_EQUAL(snapshot.state, SessionState::Playing);
    BOOST_CHECK_EQUAL(snapshot.levelIndex, 3);
    BOOST_CHECK_EQUAL(snapshot.tick, 5u);
    BOOST_CHECK_EQUAL(snapshot.health, config.session.startHealth);
    BOOST_CHECK_EQUAL(snapshot.score, 2);
    BOOST_REQUIRE_EQUAL(snapshot.items.size(), session.getWorld().size());
    BOOST_CHECK_EQUAL(snapshot.items.front().kind, EntityKind::Player);
    BOOST_CHECK_EQUAL(snapshot.items.front().id, PLAYER_ENTITY_ID);

    for (size_t i = 1; i < snapshot.items.size(); ++i) {
        BOOST_CHECK_LT(snapshot.items[i - 1].id, snapshot.items[i].id);
    }
    for (const RenderItem& item : snapshot.items) {
        BOOST_CHECK(item.bounds.contains(item.hitbox.center));
    }
}

BOOST_AUTO_TEST_CASE(TestSameSeedSameRun) {
    GameSession other(config, RUN_SEED);
    session.start(ResumePoint{3, RUN_SEED});
    other.start(ResumePoint{3, RUN_SEED});

    ScriptedInputSource scriptA;
    ScriptedInputSource scriptB;
    for (int i = 0; i < 400; ++i) {
        FrameInput input;
        input.moveRight = (i / 100) % 2 == 0;
        input.moveLeft = !input.moveRight && i % 7 == 0;
        input.jumpPressed = i % 37 == 0;
        input.jumpHeld = i % 37 < 10;
        scriptA.push(input);
        scriptB.push(input);
    }

    while (!scriptA.exhausted()) {
        session.update(scriptA.poll());
        other.update(scriptB.poll());

        BOOST_REQUIRE_EQUAL(session.getState(), other.getState());
        BOOST_REQUIRE_EQUAL(session.getWorld().size(), other.getWorld().size());
        const Entity* a = session.getPlayer();
        const Entity* b = other.getPlayer();
        BOOST_REQUIRE(a && b);
        BOOST_REQUIRE_EQUAL(a->position.getX(), b->position.getX());
        BOOST_REQUIRE_EQUAL(a->position.getY(), b->position.getY());
    }
}

BOOST_AUTO_TEST_CASE(TestShooterProjectileHitsPlayer) {
    session.start();
    addLoadedShooter(900, 200.0f);

    session.update(FrameInput{});
    const Entity* shot = findProjectile();
    BOOST_REQUIRE(shot != nullptr);
    const EntityID shotId = shot->id;
    BOOST_CHECK_NE(shotId, 900u);

    bool hit = false;
    for (int i = 0; i < 90 && !hit; ++i) {
        session.update(FrameInput{});
        hit = std::any_of(session.getLastEvents().begin(), session.getLastEvents().end(),
                          [shotId](const GameEvent& e) {
                              return e.type == GameEventType::EnemyHit && e.other == shotId;
                          });
    }

    BOOST_REQUIRE(hit);
    BOOST_CHECK_EQUAL(session.getPlayerState().getHealth(), config.session.startHealth - 1);
    BOOST_CHECK(session.getWorld().find(shotId) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestStrayProjectilesAreRemoved) {
    session.start();
    addLoadedShooter(900, 200.0f);
    session.update(FrameInput{});
    session.getWorld().remove(900);

    // Parked shot runs out of lifetime
    Entity* parked = findProjectile();
    BOOST_REQUIRE(parked != nullptr);
    const EntityID parkedId = parked->id;
    parked->velocity = Vector2D(0.0f, 0.0f);
    const int lifetime = session.getGenerator().getSpawnTable().enemy(EnemyVariant::Projectile).lifetimeTicks;
    idle(lifetime - 10);
    BOOST_CHECK(session.getWorld().find(parkedId) != nullptr);
    idle(20);
    BOOST_CHECK(session.getWorld().find(parkedId) == nullptr);

    // Shot leaving through the top of the level
    addLoadedShooter(901, 200.0f);
    session.update(FrameInput{});
    session.getWorld().remove(901);
    Entity* rising = findProjectile();
    BOOST_REQUIRE(rising != nullptr);
    const EntityID risingId = rising->id;
    BOOST_CHECK_GT(risingId, parkedId);
    rising->velocity = Vector2D(0.0f, -config.physics.maxVerticalSpeed);
    idle(45);
    BOOST_CHECK(session.getWorld().find(risingId) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestSetPhysicsUpdatesGeneratorAndIntegrator) {
    session.start();
    const float before = session.getGenerator().getJumpEnvelope().maxHeight();

    PhysicsConfig heavier = config.physics;
    heavier.gravity = 1.6f;
    session.setPhysics(heavier);

    BOOST_CHECK_LT(session.getGenerator().getJumpEnvelope().maxHeight(), before);
    BOOST_CHECK_EQUAL(session.getConfig().physics.gravity, 1.6f);

    // Rejected physics leave the session as it was
    PhysicsConfig broken = heavier;
    broken.gravity = 0.0f;
    BOOST_CHECK_THROW(session.setPhysics(broken), GenerationConfigError);
    BOOST_CHECK_EQUAL(session.getConfig().physics.gravity, 1.6f);

    // The player now falls with the new gravity
    placePlayer(100.0f, 300.0f);
    session.update(FrameInput{});
    BOOST_CHECK_CLOSE(session.getPlayer()->velocity.getY(), 1.6f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()
