/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "entities/PlayerController.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace Skybound {

namespace {
// One fixed update, in ticks
constexpr float TICK = 1.0f;
} // namespace

const char* toString(SessionState state) {
    switch (state) {
    case SessionState::Loading:
        return "Loading";
    case SessionState::Playing:
        return "Playing";
    case SessionState::Paused:
        return "Paused";
    case SessionState::LevelComplete:
        return "LevelComplete";
    case SessionState::GameOver:
        return "GameOver";
    }
    return "Unknown";
}

GameSession::GameSession(const GameConfig& config, uint64_t runSeed)
    : m_config(config),
      m_generator(config.generation, config.physics),
      m_integrator(config.physics),
      m_resolver(),
      m_behaviors(m_generator.getSpawnTable()),
      m_world(),
      m_playerState(config.session),
      m_runSeed(runSeed) {}

void GameSession::start(std::optional<ResumePoint> resume) {
    int levelIndex = 1;
    if (resume) {
        if (resume->levelIndex >= 1) {
            levelIndex = resume->levelIndex;
            m_runSeed = resume->seed;
        } else {
            SESSION_WARN(std::format("Ignoring resume point at level {}, starting fresh",
                                     resume->levelIndex));
        }
    }

    m_playerState.reset();
    m_score = levelIndex - 1;
    m_tick = 0;
    SESSION_INFO(std::format("Starting run at level {} (seed {})", levelIndex, m_runSeed));
    loadLevel(levelIndex);
}

void GameSession::restart() {
    start(ResumePoint{1, m_runSeed});
}

void GameSession::update(const FrameInput& input) {
    m_lastEvents.clear();

    switch (m_state) {
    case SessionState::Loading:
        loadLevel(m_levelIndex);
        break;
    case SessionState::Playing:
        if (input.pausePressed) {
            togglePause();
            break;
        }
        tickPlaying(input);
        break;
    case SessionState::Paused:
        if (input.pausePressed) {
            togglePause();
        }
        break;
    case SessionState::LevelComplete:
        loadLevel(m_levelIndex + 1);
        break;
    case SessionState::GameOver:
        break;
    }
}

void GameSession::togglePause() {
    if (m_state == SessionState::Playing) {
        m_state = SessionState::Paused;
        SESSION_DEBUG("Paused");
    } else if (m_state == SessionState::Paused) {
        m_state = SessionState::Playing;
        SESSION_DEBUG("Resumed");
    }
}

void GameSession::setPhysics(const PhysicsConfig& physics) {
    // Built first so a rejected config leaves everything as it was
    LevelGenerator generator(m_config.generation, physics, m_generator.getSpawnTable());

    m_generator = std::move(generator);
    m_integrator = PhysicsIntegrator(physics);
    m_config.physics = physics;

    const JumpEnvelope& envelope = m_generator.getJumpEnvelope();
    SESSION_INFO(std::format("Physics changed, jump envelope {:.1f} high, {:.1f} far",
                             envelope.maxHeight(), envelope.maxDistance()));
}

ProgressSnapshot GameSession::getProgress() const {
    return ProgressSnapshot{m_score, m_playerState.getCoins(), m_levelIndex, m_runSeed};
}

RenderSnapshot GameSession::buildRenderSnapshot() const {
    RenderSnapshot snapshot;
    snapshot.tick = m_tick;
    snapshot.state = m_state;
    snapshot.levelIndex = m_levelIndex;
    snapshot.tierName = m_level.tierName;
    snapshot.levelBounds = m_level.bounds;
    snapshot.health = m_playerState.getHealth();
    snapshot.coins = m_playerState.getCoins();
    snapshot.score = m_score;
    snapshot.playerInvincible = m_playerState.isInvincible();

    snapshot.items.reserve(m_world.size());
    for (const auto& [id, entity] : m_world.entities()) {
        snapshot.items.push_back(
            RenderItem{id, entity.kind, entity.variant, entity.renderBounds(), entity.hitbox()});
    }
    return snapshot;
}

void GameSession::loadLevel(int levelIndex) {
    m_state = SessionState::Loading;

    try {
        m_level = m_generator.generate(levelIndex, m_runSeed);
    } catch (const std::exception& e) {
        SESSION_CRITICAL(std::format("Level {} generation failed: {}", levelIndex, e.what()));
        throw;
    }

    m_world.clear();
    for (const Entity& platform : m_level.platforms) {
        m_world.add(platform);
    }
    for (const Entity& enemy : m_level.enemies) {
        m_world.add(enemy);
    }
    for (const Entity& powerUp : m_level.powerUps) {
        m_world.add(powerUp);
    }
    m_world.add(m_level.goal);
    m_world.add(Entity::makePlayer(m_level.startPosition));
    m_nextEntityId = m_world.entities().rbegin()->first + 1;

    m_levelIndex = m_level.index;
    m_goalReached = false;
    m_state = SessionState::Playing;

    SESSION_INFO(std::format("Level {} ({}) ready with {} entities", m_levelIndex,
                             m_level.tierName, m_world.size()));
}

void GameSession::tickPlaying(const FrameInput& input) {
    m_playerState.tick();

    Entity* player = getPlayer();
    if (!player) {
        SESSION_ERROR("Player missing from the world, reloading level");
        loadLevel(m_levelIndex);
        return;
    }
    PlayerController::applyInput(*player, m_playerState, input, m_config.physics);

    updateBehaviors();
    moveEnemies();
    movePlayer();
    enforceBounds();

    ++m_tick;

    if (m_playerState.isDead()) {
        enterGameOver();
    } else if (m_goalReached) {
        finishLevel();
    }
}

void GameSession::updateBehaviors() {
    m_actors.clear(); // expired entities
    m_shots.clear();
    const BehaviorContext context(getPlayer(), m_config.physics, m_tick, TICK, &m_shots);

    for (auto& [id, entity] : m_world.entities()) {
        const IEntityBehavior* behavior = m_behaviors.behaviorFor(entity);
        if (!behavior) {
            continue;
        }
        behavior->updateBehavior(entity, context);
        if (entity.behavior.expired) {
            m_actors.push_back(id);
        } else if (entity.isStatic) {
            // Power-ups move themselves; keep the broad phase in sync
            m_world.refresh(id);
        }
    }

    for (EntityID id : m_actors) {
        m_world.remove(id);
    }
    spawnProjectiles();
}

void GameSession::spawnProjectiles() {
    const SpawnTable& table = m_generator.getSpawnTable();
    for (const ProjectileShot& shot : m_shots) {
        const EntityID id = m_nextEntityId++;
        m_world.add(table.makeProjectile(id, shot.origin, shot.target, shot.facing));
        SESSION_DEBUG(std::format("Shooter {} launched projectile {}", shot.shooter, id));
    }
}

void GameSession::moveEnemies() {
    m_actors.clear();

    for (auto& [id, enemy] : m_world.entities()) {
        if (enemy.kind != EntityKind::Enemy) {
            continue;
        }
        const IntegrationResult motion = m_integrator.integrate(enemy, TICK);

        if (enemy.enemyVariant() == EnemyVariant::Projectile) {
            // Shots fly through platforms and vanish once they leave the level
            enemy.position += motion.delta;
            enemy.velocity = motion.velocity;
            m_world.refresh(id);
            if (!enemy.hitbox().intersects(m_level.bounds)) {
                m_actors.push_back(id);
            }
            continue;
        }

        const ResolveResult resolved =
            m_resolver.resolve(enemy, motion.velocity, motion.delta, m_world);

        enemy.position += resolved.correctedDelta;
        enemy.velocity = resolved.velocity;
        enemy.grounded = resolved.grounded;
        m_world.refresh(id);

        if (enemy.position.getY() > m_level.bounds.bottom()) {
            m_actors.push_back(id);
        }
    }

    for (EntityID id : m_actors) {
        SESSION_DEBUG(std::format("Enemy {} left the level", id));
        m_world.remove(id);
    }
}

void GameSession::movePlayer() {
    Entity* player = getPlayer();
    const IntegrationResult motion = m_integrator.integrate(*player, TICK);
    const ResolveResult resolved =
        m_resolver.resolve(*player, motion.velocity, motion.delta, m_world);

    player->position += resolved.correctedDelta;
    player->velocity = resolved.velocity;
    player->grounded = resolved.grounded;
    m_world.refresh(PLAYER_ENTITY_ID);

    handlePlayerContacts(resolved.events);
}

void GameSession::handlePlayerContacts(const GameEventList& contacts) {
    m_actors.clear(); // consumed power-ups and spent shots, removed once iteration is done

    for (const GameEvent& contact : contacts) {
        switch (contact.type) {
        case GameEventType::PlatformLanding:
            emit(contact);
            break;
        case GameEventType::GoalReached:
            if (!m_goalReached) {
                m_goalReached = true;
                emit(contact);
            }
            break;
        case GameEventType::EnemyHit:
        case GameEventType::PowerUpCollected: {
            Entity* other = m_world.find(contact.other);
            Entity* player = getPlayer();
            const IEntityBehavior* behavior = other ? m_behaviors.behaviorFor(*other) : nullptr;
            if (!behavior || !player) {
                break;
            }
            CollisionContext context(*player, m_playerState, m_config.session, contact);
            const CollisionOutcome outcome = behavior->onCollision(*other, context);
            if (outcome == CollisionOutcome::Consumed || other->behavior.expired) {
                m_actors.push_back(contact.other);
            }
            if (outcome == CollisionOutcome::Consumed ||
                outcome == CollisionOutcome::DamagedPlayer) {
                emit(contact);
            }
            break;
        }
        case GameEventType::PlayerDied:
            break;
        }
    }

    for (EntityID id : m_actors) {
        m_world.remove(id);
    }
}

void GameSession::enforceBounds() {
    Entity* player = getPlayer();
    const AABB& bounds = m_level.bounds;

    // Horizontal world edges are walls
    const float minX = bounds.left();
    const float maxX = bounds.right() - player->hitboxSize.getX();
    const float x = player->position.getX();
    if (x < minX || x > maxX) {
        player->position.setX(std::clamp(x, minX, std::max(minX, maxX)));
        player->velocity.setX(0.0f);
        m_world.refresh(PLAYER_ENTITY_ID);
    }

    if (player->position.getY() > bounds.bottom()) {
        m_playerState.takeDamage(1, true);
        SESSION_INFO(std::format("Player fell out of level {}, health {}", m_levelIndex,
                                 m_playerState.getHealth()));
        if (!m_playerState.isDead()) {
            respawnPlayer();
        }
    }
}

void GameSession::respawnPlayer() {
    Entity* player = getPlayer();
    player->position = m_level.startPosition;
    player->velocity = Vector2D(0.0f, 0.0f);
    player->acceleration = Vector2D(0.0f, 0.0f);
    player->grounded = false;
    m_world.refresh(PLAYER_ENTITY_ID);
}

void GameSession::finishLevel() {
    ++m_score;
    m_state = SessionState::LevelComplete;
    SESSION_INFO(std::format("Level {} complete, score {}", m_levelIndex, m_score));
    publishProgress();
}

void GameSession::enterGameOver() {
    const Entity* player = getPlayer();

    GameEvent died;
    died.type = GameEventType::PlayerDied;
    died.subject = PLAYER_ENTITY_ID;
    died.otherKind = EntityKind::Player;
    died.position = player ? player->position : m_level.startPosition;
    emit(died);

    m_state = SessionState::GameOver;
    SESSION_INFO(std::format("Game over on level {}, score {}", m_levelIndex, m_score));
    publishProgress();
}

void GameSession::emit(const GameEvent& event) {
    m_lastEvents.push_back(event);
    if (m_eventHandler) {
        m_eventHandler(event);
    }
}

void GameSession::publishProgress() {
    if (m_snapshotHandler) {
        m_snapshotHandler(getProgress());
    }
}

} // namespace Skybound
