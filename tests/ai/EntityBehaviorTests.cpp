/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityBehaviorTests
#include <boost/test/unit_test.hpp>

#include "ai/BehaviorRegistry.hpp"
#include "ai/behaviors/ChaseBehavior.hpp"
#include "ai/behaviors/JumperBehavior.hpp"
#include "ai/behaviors/PatrolBehavior.hpp"
#include "ai/behaviors/PowerUpBehavior.hpp"
#include "ai/behaviors/ProjectileBehavior.hpp"
#include "ai/behaviors/ShooterBehavior.hpp"
#include "core/GameConfig.hpp"
#include "core/Logger.hpp"
#include "entities/PlayerState.hpp"
#include "world/SpawnTable.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace Skybound;

struct BehaviorFixture {
    BehaviorFixture() { SKYBOUND_ENABLE_BENCHMARK_MODE(); }

    SpawnTable table;
    PhysicsConfig physics;
    SessionConfig session;
    AABB floor = AABB::fromTopLeft(Vector2D(0.0f, 300.0f), 1000.0f, 20.0f);

    Entity enemyAt(EnemyVariant variant, float centerX, uint32_t seed = 1u) const {
        return table.makeEnemy(200, variant, floor, centerX, seed);
    }

    // Player standing on the floor with its hitbox centred on centerX
    Entity playerAt(float centerX, float topOffset = 0.0f) const {
        return Entity::makePlayer(
            Vector2D(centerX - PLAYER_WIDTH * 0.5f, floor.top() - PLAYER_HEIGHT - topOffset));
    }

    // Applies the behavior's horizontal intent without the full physics step
    static void walk(Entity& self) { self.position.setX(self.position.getX() + self.velocity.getX()); }
};

BOOST_FIXTURE_TEST_SUITE(EntityBehaviorTests, BehaviorFixture)

BOOST_AUTO_TEST_CASE(TestPatrolTurnsAtRange) {
    const PatrolBehavior patrol(table.enemy(EnemyVariant::Patrol));
    Entity enemy = enemyAt(EnemyVariant::Patrol, 500.0f, 1u);
    const float origin = enemy.behavior.originX;
    const float range = table.enemy(EnemyVariant::Patrol).patrolRange;
    const BehaviorContext ctx(nullptr, physics, 0, 1.0f);

    float lowest = origin;
    float highest = origin;
    int turns = 0;
    float lastDirection = enemy.behavior.direction;
    for (int i = 0; i < 1600; ++i) {
        patrol.updateBehavior(enemy, ctx);
        BOOST_CHECK(enemy.horizontalInput);
        walk(enemy);
        lowest = std::min(lowest, enemy.position.getX());
        highest = std::max(highest, enemy.position.getX());
        if (enemy.behavior.direction != lastDirection) {
            ++turns;
            lastDirection = enemy.behavior.direction;
        }
    }

    const float speed = table.enemy(EnemyVariant::Patrol).moveSpeed;
    BOOST_CHECK_GE(turns, 3);
    BOOST_CHECK_LE(highest, origin + range + speed);
    BOOST_CHECK_GE(lowest, origin - range - speed);
}

BOOST_AUTO_TEST_CASE(TestPatrolStaysOnPlatform) {
    floor = AABB::fromTopLeft(Vector2D(100.0f, 300.0f), 90.0f, 20.0f);
    const PatrolBehavior patrol(table.enemy(EnemyVariant::Patrol));
    Entity enemy = enemyAt(EnemyVariant::Patrol, 145.0f, 1u);
    const BehaviorContext ctx(nullptr, physics, 0, 1.0f);

    for (int i = 0; i < 600; ++i) {
        patrol.updateBehavior(enemy, ctx);
        walk(enemy);
        BOOST_CHECK_GE(enemy.position.getX(), floor.left() - 0.001f);
        BOOST_CHECK_LE(enemy.hitbox().right(), floor.right() + 0.001f);
    }
}

BOOST_AUTO_TEST_CASE(TestChaseMovesTowardPlayer) {
    const EnemySpawn& spawn = table.enemy(EnemyVariant::Chaser);
    const ChaseBehavior chase(spawn);
    Entity enemy = enemyAt(EnemyVariant::Chaser, 500.0f);

    const Entity right = playerAt(600.0f);
    chase.updateBehavior(enemy, BehaviorContext(&right, physics, 0, 1.0f));
    BOOST_CHECK_CLOSE(enemy.velocity.getX(), spawn.moveSpeed, 0.001f);
    BOOST_CHECK(enemy.horizontalInput);

    const Entity left = playerAt(400.0f);
    chase.updateBehavior(enemy, BehaviorContext(&left, physics, 1, 1.0f));
    BOOST_CHECK_CLOSE(enemy.velocity.getX(), -spawn.moveSpeed, 0.001f);

    // Same height, nothing to jump at
    BOOST_CHECK(enemy.grounded);
    BOOST_CHECK_EQUAL(enemy.velocity.getY(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestChaseIgnoresDistantPlayer) {
    const ChaseBehavior chase(table.enemy(EnemyVariant::Chaser));
    Entity enemy = enemyAt(EnemyVariant::Chaser, 500.0f);

    const Entity near = playerAt(560.0f);
    chase.updateBehavior(enemy, BehaviorContext(&near, physics, 0, 1.0f));
    BOOST_CHECK(enemy.horizontalInput);

    const Entity far = playerAt(900.0f);
    chase.updateBehavior(enemy, BehaviorContext(&far, physics, 1, 1.0f));
    BOOST_CHECK(!enemy.horizontalInput);

    chase.updateBehavior(enemy, BehaviorContext(&near, physics, 2, 1.0f));

    chase.updateBehavior(enemy, BehaviorContext(nullptr, physics, 3, 1.0f));
    BOOST_CHECK(!enemy.horizontalInput);
}

BOOST_AUTO_TEST_CASE(TestChaseJumpsAtHigherPlayer) {
    const EnemySpawn& spawn = table.enemy(EnemyVariant::Chaser);
    const ChaseBehavior chase(spawn);
    Entity enemy = enemyAt(EnemyVariant::Chaser, 500.0f);

    const Entity above = playerAt(560.0f, 80.0f);
    chase.updateBehavior(enemy, BehaviorContext(&above, physics, 0, 1.0f));

    BOOST_CHECK_CLOSE(enemy.velocity.getY(), -spawn.jumpSpeed, 0.001f);
    BOOST_CHECK(!enemy.grounded);

    // No second jump while airborne
    enemy.velocity.setY(-2.0f);
    chase.updateBehavior(enemy, BehaviorContext(&above, physics, 1, 1.0f));
    BOOST_CHECK_EQUAL(enemy.velocity.getY(), -2.0f);
}

BOOST_AUTO_TEST_CASE(TestJumperHopsOnInterval) {
    const EnemySpawn& spawn = table.enemy(EnemyVariant::Jumper);
    const JumperBehavior jumper(spawn);
    Entity enemy = enemyAt(EnemyVariant::Jumper, 500.0f, 12345u);
    const BehaviorContext ctx(nullptr, physics, 0, 1.0f);

    const int firstInterval = enemy.behavior.interval;
    BOOST_REQUIRE_GT(firstInterval, 0);

    for (int i = 1; i < firstInterval; ++i) {
        jumper.updateBehavior(enemy, ctx);
        BOOST_CHECK(enemy.grounded);
        BOOST_CHECK_EQUAL(enemy.velocity.getX(), 0.0f);
    }

    jumper.updateBehavior(enemy, ctx);
    BOOST_CHECK(!enemy.grounded);
    BOOST_CHECK_CLOSE(enemy.velocity.getY(), -spawn.jumpSpeed, 0.001f);
    BOOST_CHECK_LE(std::abs(enemy.velocity.getX()), spawn.moveSpeed + 0.001f);
    BOOST_CHECK_EQUAL(enemy.behavior.timer, 0);
    BOOST_CHECK_GE(enemy.behavior.interval, spawn.minJumpInterval);
    BOOST_CHECK_LE(enemy.behavior.interval, spawn.maxJumpInterval);
}

BOOST_AUTO_TEST_CASE(TestJumperIsDeterministic) {
    const JumperBehavior jumper(table.enemy(EnemyVariant::Jumper));
    Entity a = enemyAt(EnemyVariant::Jumper, 500.0f, 777u);
    Entity b = enemyAt(EnemyVariant::Jumper, 500.0f, 777u);
    const BehaviorContext ctx(nullptr, physics, 0, 1.0f);

    for (int i = 0; i < 400; ++i) {
        jumper.updateBehavior(a, ctx);
        jumper.updateBehavior(b, ctx);
        // Land again straight away so the jumper keeps cycling
        a.grounded = true;
        b.grounded = true;
        BOOST_CHECK_EQUAL(a.velocity.getX(), b.velocity.getX());
        BOOST_CHECK_EQUAL(a.behavior.interval, b.behavior.interval);
    }
}

BOOST_AUTO_TEST_CASE(TestPowerUpBobs) {
    const PowerUpBehavior behavior{};
    Entity coin = table.makePowerUp(300, PowerUpVariant::Coin, floor, 500.0f, 25.0f, 1);
    const float baseY = coin.behavior.baseY;

    float lowest = baseY;
    float highest = baseY;
    for (uint64_t tick = 0; tick < 120; ++tick) {
        behavior.updateBehavior(coin, BehaviorContext(nullptr, physics, tick, 1.0f));
        lowest = std::min(lowest, coin.position.getY());
        highest = std::max(highest, coin.position.getY());
    }

    BOOST_CHECK_GE(lowest, baseY - PowerUpBehavior::BOB_AMPLITUDE - 0.001f);
    BOOST_CHECK_LE(highest, baseY + PowerUpBehavior::BOB_AMPLITUDE + 0.001f);
    BOOST_CHECK_GT(highest - lowest, 1.0f);

    // Position is a function of the tick only
    behavior.updateBehavior(coin, BehaviorContext(nullptr, physics, 37, 1.0f));
    const float first = coin.position.getY();
    behavior.updateBehavior(coin, BehaviorContext(nullptr, physics, 37, 1.0f));
    BOOST_CHECK_EQUAL(coin.position.getY(), first);
}

BOOST_AUTO_TEST_CASE(TestPowerUpAppliesEffect) {
    const PowerUpBehavior behavior{};
    PlayerState state(session);
    Entity player = playerAt(500.0f);
    GameEvent event;
    event.type = GameEventType::PowerUpCollected;

    Entity coin = table.makePowerUp(300, PowerUpVariant::Coin, floor, 500.0f, 25.0f, 3);
    CollisionContext coinCtx(player, state, session, event);
    BOOST_CHECK(behavior.onCollision(coin, coinCtx) == CollisionOutcome::Consumed);
    BOOST_CHECK_EQUAL(state.getCoins(), 3);

    Entity shield = table.makePowerUp(301, PowerUpVariant::Shield, floor, 500.0f, 25.0f, 1);
    CollisionContext shieldCtx(player, state, session, event);
    BOOST_CHECK(behavior.onCollision(shield, shieldCtx) == CollisionOutcome::Consumed);
    BOOST_CHECK(state.hasShield());
    BOOST_CHECK_EQUAL(state.getShieldTicks(), table.powerUp(PowerUpVariant::Shield).durationTicks);
}

BOOST_AUTO_TEST_CASE(TestEnemyContactDamagesAndKnocksBack) {
    const PatrolBehavior patrol(table.enemy(EnemyVariant::Patrol));
    PlayerState state(session);
    Entity enemy = enemyAt(EnemyVariant::Patrol, 500.0f);
    Entity player = playerAt(470.0f);
    player.grounded = true;
    GameEvent event;
    event.type = GameEventType::EnemyHit;

    CollisionContext ctx(player, state, session, event);
    BOOST_CHECK(patrol.onCollision(enemy, ctx) == CollisionOutcome::DamagedPlayer);
    BOOST_CHECK_EQUAL(state.getHealth(), session.startHealth - 1);
    BOOST_CHECK_CLOSE(player.velocity.getX(), -session.knockbackX, 0.001f);
    BOOST_CHECK_CLOSE(player.velocity.getY(), -session.knockbackY, 0.001f);
    BOOST_CHECK(!player.grounded);
    BOOST_CHECK(state.isInvincible());

    // Invincibility frames absorb the next contact
    player.velocity = Vector2D(0.0f, 0.0f);
    BOOST_CHECK(patrol.onCollision(enemy, ctx) == CollisionOutcome::Blocked);
    BOOST_CHECK_EQUAL(state.getHealth(), session.startHealth - 1);
    BOOST_CHECK_EQUAL(player.velocity.getX(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestKnockbackDirectionFollowsSide) {
    const ChaseBehavior chase(table.enemy(EnemyVariant::Chaser));
    PlayerState state(session);
    Entity enemy = enemyAt(EnemyVariant::Chaser, 500.0f);
    Entity player = playerAt(530.0f);
    GameEvent event;
    event.type = GameEventType::EnemyHit;

    CollisionContext ctx(player, state, session, event);
    BOOST_CHECK(chase.onCollision(enemy, ctx) == CollisionOutcome::DamagedPlayer);
    BOOST_CHECK_CLOSE(player.velocity.getX(), session.knockbackX, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestShooterFiresAtPlayerInRange) {
    const EnemySpawn& spawn = table.enemy(EnemyVariant::Shooter);
    const ShooterBehavior shooter(spawn);
    Entity enemy = enemyAt(EnemyVariant::Shooter, 500.0f);
    const Entity player = playerAt(600.0f);
    std::vector<ProjectileShot> shots;
    const BehaviorContext ctx(&player, physics, 0, 1.0f, &shots);

    for (int i = 1; i < spawn.shotInterval; ++i) {
        shooter.updateBehavior(enemy, ctx);
    }
    BOOST_CHECK(shots.empty());

    shooter.updateBehavior(enemy, ctx);
    BOOST_REQUIRE_EQUAL(shots.size(), 1u);
    BOOST_CHECK_EQUAL(shots[0].shooter, enemy.id);
    BOOST_CHECK_CLOSE(shots[0].origin.getX(), enemy.hitbox().center.getX(), 0.001f);
    BOOST_CHECK_CLOSE(shots[0].target.getX(), 600.0f, 0.001f);
    BOOST_CHECK_EQUAL(shots[0].facing, 1.0f);
    BOOST_CHECK_EQUAL(enemy.velocity.getX(), 0.0f);

    // Reloads before the next shot
    for (int i = 1; i < spawn.shotInterval; ++i) {
        shooter.updateBehavior(enemy, ctx);
    }
    BOOST_CHECK_EQUAL(shots.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestShooterWaitsForPlayerInSight) {
    const EnemySpawn& spawn = table.enemy(EnemyVariant::Shooter);
    const ShooterBehavior shooter(spawn);
    Entity enemy = enemyAt(EnemyVariant::Shooter, 500.0f);
    Entity player = playerAt(500.0f + spawn.sightRange + 50.0f);
    std::vector<ProjectileShot> shots;
    const BehaviorContext ctx(&player, physics, 0, 1.0f, &shots);

    for (int i = 0; i < spawn.shotInterval * 3; ++i) {
        shooter.updateBehavior(enemy, ctx);
    }
    BOOST_CHECK(shots.empty());

    // Loaded while waiting, so it fires on the first tick in range
    player = playerAt(400.0f);
    shooter.updateBehavior(enemy, ctx);
    BOOST_REQUIRE_EQUAL(shots.size(), 1u);
    BOOST_CHECK_EQUAL(shots[0].facing, -1.0f);

    // No outlet for shots, no firing
    Entity quiet = enemyAt(EnemyVariant::Shooter, 500.0f);
    const BehaviorContext noOutlet(&player, physics, 0, 1.0f);
    for (int i = 0; i < spawn.shotInterval * 2; ++i) {
        BOOST_CHECK_NO_THROW(shooter.updateBehavior(quiet, noOutlet));
    }
}

BOOST_AUTO_TEST_CASE(TestProjectileFliesStraightAndExpires) {
    const EnemySpawn& spawn = table.enemy(EnemyVariant::Projectile);
    const ProjectileBehavior projectile(spawn);
    const Entity player = playerAt(0.0f);
    const BehaviorContext ctx(&player, physics, 0, 1.0f);

    Entity shot = table.makeProjectile(201, Vector2D(100.0f, 100.0f), Vector2D(130.0f, 140.0f), 1.0f);
    BOOST_CHECK(shot.kind == EntityKind::Enemy);
    BOOST_CHECK(shot.enemyVariant() == EnemyVariant::Projectile);
    BOOST_CHECK(!shot.isStatic);
    BOOST_CHECK_EQUAL(shot.gravityScale, 0.0f);
    BOOST_CHECK_CLOSE(shot.hitbox().center.getX(), 100.0f, 0.001f);
    BOOST_CHECK_CLOSE(shot.hitbox().center.getY(), 100.0f, 0.001f);
    BOOST_CHECK_CLOSE(shot.velocity.getX(), spawn.moveSpeed * 0.6f, 0.001f);
    BOOST_CHECK_CLOSE(shot.velocity.getY(), spawn.moveSpeed * 0.8f, 0.001f);

    for (int i = 1; i < spawn.lifetimeTicks; ++i) {
        projectile.updateBehavior(shot, ctx);
        BOOST_CHECK(shot.horizontalInput);
    }
    BOOST_CHECK(!shot.behavior.expired);
    projectile.updateBehavior(shot, ctx);
    BOOST_CHECK(shot.behavior.expired);

    // Aiming at its own origin fires along the shooter's facing
    const Entity flat = table.makeProjectile(202, Vector2D(50.0f, 50.0f), Vector2D(50.0f, 50.0f), -1.0f);
    BOOST_CHECK_CLOSE(flat.velocity.getX(), -spawn.moveSpeed, 0.001f);
    BOOST_CHECK_EQUAL(flat.velocity.getY(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestProjectileSpentOnContact) {
    const ProjectileBehavior projectile(table.enemy(EnemyVariant::Projectile));
    PlayerState state(session);
    Entity player = playerAt(500.0f);
    GameEvent event;
    event.type = GameEventType::EnemyHit;
    CollisionContext ctx(player, state, session, event);

    Entity first = table.makeProjectile(201, Vector2D(480.0f, 280.0f), Vector2D(500.0f, 280.0f), 1.0f);
    BOOST_CHECK(projectile.onCollision(first, ctx) == CollisionOutcome::DamagedPlayer);
    BOOST_CHECK(first.behavior.expired);
    BOOST_CHECK_EQUAL(state.getHealth(), session.startHealth - 1);

    // Absorbed by invincibility frames, still gone
    Entity second = table.makeProjectile(202, Vector2D(480.0f, 280.0f), Vector2D(500.0f, 280.0f), 1.0f);
    BOOST_CHECK(projectile.onCollision(second, ctx) == CollisionOutcome::Blocked);
    BOOST_CHECK(second.behavior.expired);
    BOOST_CHECK_EQUAL(state.getHealth(), session.startHealth - 1);
}

BOOST_AUTO_TEST_CASE(TestRegistryMapping) {
    const BehaviorRegistry registry(table);

    const Entity player = playerAt(100.0f);
    const Entity platform = Entity::makePlatform(100, 0.0f, 0.0f, 50.0f, 20.0f);
    const Entity goal = Entity::makeGoal(101, Vector2D(0.0f, 0.0f));
    BOOST_CHECK(registry.behaviorFor(player) == nullptr);
    BOOST_CHECK(registry.behaviorFor(platform) == nullptr);
    BOOST_CHECK(registry.behaviorFor(goal) == nullptr);

    const IEntityBehavior* chaser = registry.behaviorFor(enemyAt(EnemyVariant::Chaser, 100.0f));
    const IEntityBehavior* patrol = registry.behaviorFor(enemyAt(EnemyVariant::Patrol, 100.0f));
    const IEntityBehavior* jumper = registry.behaviorFor(enemyAt(EnemyVariant::Jumper, 100.0f));
    BOOST_REQUIRE(chaser && patrol && jumper);
    BOOST_CHECK_EQUAL(chaser->getName(), "Chase");
    BOOST_CHECK_EQUAL(patrol->getName(), "Patrol");
    BOOST_CHECK_EQUAL(jumper->getName(), "Jumper");

    const IEntityBehavior* shooter = registry.behaviorFor(enemyAt(EnemyVariant::Shooter, 100.0f));
    const Entity shot = table.makeProjectile(201, Vector2D(), Vector2D(10.0f, 0.0f), 1.0f);
    const IEntityBehavior* projectile = registry.behaviorFor(shot);
    BOOST_REQUIRE(shooter && projectile);
    BOOST_CHECK_EQUAL(shooter->getName(), "Shooter");
    BOOST_CHECK_EQUAL(projectile->getName(), "Projectile");

    const Entity coin = table.makePowerUp(300, PowerUpVariant::Coin, floor, 100.0f, 25.0f, 1);
    const IEntityBehavior* powerUp = registry.behaviorFor(coin);
    BOOST_REQUIRE(powerUp);
    BOOST_CHECK_EQUAL(powerUp->getName(), "PowerUp");

    BOOST_CHECK_THROW(registry.enemyBehavior(static_cast<EnemyVariant>(9)), std::out_of_range);
}

BOOST_AUTO_TEST_SUITE_END()
