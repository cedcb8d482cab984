/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_EVENT_HPP
#define GAME_EVENT_HPP

#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <ostream>

namespace Skybound {

enum class GameEventType : uint8_t {
    PlatformLanding,
    EnemyHit,
    PowerUpCollected,
    GoalReached,
    PlayerDied
};

inline const char* toString(GameEventType type) {
    switch (type) {
    case GameEventType::PlatformLanding:
        return "PlatformLanding";
    case GameEventType::EnemyHit:
        return "EnemyHit";
    case GameEventType::PowerUpCollected:
        return "PowerUpCollected";
    case GameEventType::GoalReached:
        return "GoalReached";
    case GameEventType::PlayerDied:
        return "PlayerDied";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, GameEventType type) {
    return os << toString(type);
}

/**
 * Classified collision or session outcome. The resolver and session only
 * emit these; audio, effects and the session's own pickup/damage handling
 * consume them afterwards.
 */
struct GameEvent {
    GameEventType type{GameEventType::PlatformLanding};
    EntityID subject{INVALID_ENTITY_ID}; // entity the event happened to
    EntityID other{INVALID_ENTITY_ID};   // platform, enemy, power-up or goal involved
    EntityKind otherKind{EntityKind::Platform};
    uint8_t otherVariant{0};
    Vector2D position;                   // subject position at the time of the event
};

// Typical frame produces at most a landing plus a couple of trigger hits
using GameEventList = boost::container::small_vector<GameEvent, 8>;

} // namespace Skybound

#endif // GAME_EVENT_HPP
