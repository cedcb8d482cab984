/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_GENERATOR_HPP
#define LEVEL_GENERATOR_HPP

#include "core/GameConfig.hpp"
#include "physics/JumpEnvelope.hpp"
#include "world/DifficultyScaler.hpp"
#include "world/LevelData.hpp"
#include "world/SpawnTable.hpp"
#include <cstdint>
#include <stdexcept>

namespace Skybound {

/**
 * Thrown when the physics or generation parameters make a solvable level
 * impossible (non-positive jump reach, gravity or speeds, no difficulty
 * tiers). This is the only failure the generator reports.
 */
class GenerationConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * Builds levels from (index, seed). Output is a pure function of the inputs
 * and the configuration passed at construction.
 *
 * Level 1 is the hand-authored tutorial. Later levels place platforms left
 * to right; every gap and height change is drawn inside the jump envelope
 * derived from the physics constants, so each platform is reachable from the
 * previous one. Draws outside the allowed range are clamped, never rejected.
 */
class LevelGenerator {
public:
    /**
     * @throws GenerationConfigError for degenerate physics or generation config
     */
    LevelGenerator(const GenerationConfig& generation, const PhysicsConfig& physics,
                   SpawnTable spawnTable = SpawnTable());

    /**
     * Generates using the difficulty scaler's parameters for levelIndex.
     * Indices below 1 are clamped to 1.
     */
    Level generate(int levelIndex, uint64_t seed) const;

    // Generates with explicit difficulty parameters (ignored for the tutorial)
    Level generate(int levelIndex, uint64_t seed, const DifficultyParams& params) const;

    static Level buildTutorial(uint64_t seed);

    /**
     * @throws GenerationConfigError describing the first problem found
     */
    static void validate(const GenerationConfig& generation, const PhysicsConfig& physics);

    const JumpEnvelope& getJumpEnvelope() const { return m_envelope; }
    const DifficultyScaler& getDifficultyScaler() const { return m_scaler; }
    const SpawnTable& getSpawnTable() const { return m_spawnTable; }

    // Largest horizontal gap and rise the generator may use
    float reachDistance() const;
    float reachHeight() const;

private:
    GenerationConfig m_generation;
    PhysicsConfig m_physics;
    SpawnTable m_spawnTable;
    JumpEnvelope m_envelope;
    DifficultyScaler m_scaler;
};

} // namespace Skybound

#endif // LEVEL_GENERATOR_HPP
