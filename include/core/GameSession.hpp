/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_SESSION_HPP
#define GAME_SESSION_HPP

#include "ai/BehaviorRegistry.hpp"
#include "collisions/CollisionResolver.hpp"
#include "collisions/CollisionWorld.hpp"
#include "core/GameConfig.hpp"
#include "entities/PlayerState.hpp"
#include "events/GameEvent.hpp"
#include "input/InputSource.hpp"
#include "physics/PhysicsIntegrator.hpp"
#include "world/LevelData.hpp"
#include "world/LevelGenerator.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <vector>

namespace Skybound {

enum class SessionState : uint8_t { Loading, Playing, Paused, LevelComplete, GameOver };

const char* toString(SessionState state);
inline std::ostream& operator<<(std::ostream& os, SessionState s) { return os << toString(s); }

// Where a run starts; supplied by external persistence
struct ResumePoint {
    int levelIndex{1};
    uint64_t seed{0};
};

// Emitted on LevelComplete and GameOver for external storage
struct ProgressSnapshot {
    int score{0};
    int coins{0};
    int levelReached{1};
    uint64_t seed{0};
};

struct RenderItem {
    EntityID id{INVALID_ENTITY_ID};
    EntityKind kind{EntityKind::Platform};
    uint8_t variant{0};
    AABB bounds; // render bounds, hitbox plus margins
    AABB hitbox;
};

struct RenderSnapshot {
    uint64_t tick{0};
    SessionState state{SessionState::Loading};
    int levelIndex{1};
    std::string tierName;
    AABB levelBounds;
    int health{0};
    int coins{0};
    int score{0};
    bool playerInvincible{false};
    std::vector<RenderItem> items; // ascending id, player first
};

/**
 * Explicit game state for one run: the current level's working set, the
 * player, score and the session state machine.
 *
 * update() advances exactly one fixed tick:
 *   input/AI -> integrate -> resolve -> commit -> terminal checks -> events
 *
 * Paused ticks compute nothing. LevelComplete lasts one tick and the next
 * update() generates the following level. GameOver holds until restart().
 */
class GameSession {
public:
    using EventHandler = std::function<void(const GameEvent&)>;
    using SnapshotHandler = std::function<void(const ProgressSnapshot&)>;

    /**
     * @throws GenerationConfigError if the config can't produce a level
     */
    GameSession(const GameConfig& config, uint64_t runSeed);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /**
     * Loads the first level and enters Playing. An invalid resume point
     * falls back to a fresh start at level 1.
     */
    void start(std::optional<ResumePoint> resume = std::nullopt);

    // Fresh run on the same seed from level 1
    void restart();

    void update(const FrameInput& input);

    // Playing <-> Paused; ignored in other states
    void togglePause();

    /**
     * Swaps the physics constants for the integrator and the generator
     * together. The current level keeps its layout; later levels are built
     * for the new jump envelope.
     * @throws GenerationConfigError and leaves the session unchanged if the
     * new physics can't produce a level
     */
    void setPhysics(const PhysicsConfig& physics);

    SessionState getState() const { return m_state; }
    int getLevelIndex() const { return m_levelIndex; }
    uint64_t getRunSeed() const { return m_runSeed; }
    int getScore() const { return m_score; }
    uint64_t getTick() const { return m_tick; }

    const Level& getLevel() const { return m_level; }
    const CollisionWorld& getWorld() const { return m_world; }
    CollisionWorld& getWorld() { return m_world; }
    const PlayerState& getPlayerState() const { return m_playerState; }
    PlayerState& getPlayerState() { return m_playerState; }
    const Entity* getPlayer() const { return m_world.find(PLAYER_ENTITY_ID); }
    Entity* getPlayer() { return m_world.find(PLAYER_ENTITY_ID); }
    const GameConfig& getConfig() const { return m_config; }
    const LevelGenerator& getGenerator() const { return m_generator; }

    // Events raised during the most recent update()
    const GameEventList& getLastEvents() const { return m_lastEvents; }

    ProgressSnapshot getProgress() const;
    RenderSnapshot buildRenderSnapshot() const;

    void setEventHandler(EventHandler handler) { m_eventHandler = std::move(handler); }
    void setSnapshotHandler(SnapshotHandler handler) { m_snapshotHandler = std::move(handler); }

private:
    GameConfig m_config;
    LevelGenerator m_generator;
    PhysicsIntegrator m_integrator;
    CollisionResolver m_resolver;
    BehaviorRegistry m_behaviors;

    CollisionWorld m_world;
    Level m_level;
    PlayerState m_playerState;

    SessionState m_state{SessionState::Loading};
    uint64_t m_runSeed{0};
    int m_levelIndex{1};
    int m_score{0};
    uint64_t m_tick{0};
    bool m_goalReached{false};

    GameEventList m_lastEvents;
    std::vector<EntityID> m_actors; // enemies and power-ups, reused per tick
    std::vector<ProjectileShot> m_shots;
    EntityID m_nextEntityId{INVALID_ENTITY_ID}; // for entities created mid-level
    EventHandler m_eventHandler;
    SnapshotHandler m_snapshotHandler;

    void loadLevel(int levelIndex);
    void tickPlaying(const FrameInput& input);
    void updateBehaviors();
    void spawnProjectiles();
    void moveEnemies();
    void movePlayer();
    void handlePlayerContacts(const GameEventList& contacts);
    void enforceBounds();
    void respawnPlayer();
    void finishLevel();
    void enterGameOver();

    void emit(const GameEvent& event);
    void publishProgress();
};

} // namespace Skybound

#endif // GAME_SESSION_HPP
