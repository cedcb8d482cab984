/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include <format>
#include <fstream>
#include <span>

namespace Skybound {

namespace {

template <typename T> struct FloatKey {
    const char* key;
    float T::*member;
};

template <typename T> struct IntKey {
    const char* key;
    int T::*member;
};

constexpr FloatKey<PhysicsConfig> PHYSICS_FLOATS[] = {
    {"gravity", &PhysicsConfig::gravity},
    {"run_acceleration", &PhysicsConfig::runAcceleration},
    {"friction", &PhysicsConfig::friction},
    {"max_horizontal_speed", &PhysicsConfig::maxHorizontalSpeed},
    {"max_vertical_speed", &PhysicsConfig::maxVerticalSpeed},
    {"jump_speed", &PhysicsConfig::jumpSpeed},
    {"boosted_jump_speed", &PhysicsConfig::boostedJumpSpeed},
    {"double_jump_min_velocity_y", &PhysicsConfig::doubleJumpMinVelocityY},
    {"max_jump_height", &PhysicsConfig::maxJumpHeight},
    {"max_jump_distance", &PhysicsConfig::maxJumpDistance},
};

constexpr FloatKey<GenerationConfig> GENERATION_FLOATS[] = {
    {"world_height", &GenerationConfig::worldHeight},
    {"top_margin", &GenerationConfig::topMargin},
    {"ground_y", &GenerationConfig::groundY},
    {"platform_height", &GenerationConfig::platformHeight},
    {"start_platform_width", &GenerationConfig::startPlatformWidth},
    {"reach_fraction", &GenerationConfig::reachFraction},
    {"landing_margin", &GenerationConfig::landingMargin},
    {"power_up_hover", &GenerationConfig::powerUpHover},
    {"world_end_padding", &GenerationConfig::worldEndPadding},
};

constexpr IntKey<GenerationConfig> GENERATION_INTS[] = {
    {"extra_platform_every", &GenerationConfig::extraPlatformEvery},
    {"max_extra_platforms", &GenerationConfig::maxExtraPlatforms},
};

constexpr FloatKey<SessionConfig> SESSION_FLOATS[] = {
    {"knockback_x", &SessionConfig::knockbackX},
    {"knockback_y", &SessionConfig::knockbackY},
    {"speed_boost_multiplier", &SessionConfig::speedBoostMultiplier},
    {"fixed_timestep", &SessionConfig::fixedTimestep},
    {"target_fps", &SessionConfig::targetFPS},
};

constexpr IntKey<SessionConfig> SESSION_INTS[] = {
    {"start_health", &SessionConfig::startHealth},
    {"max_health", &SessionConfig::maxHealth},
    {"invincibility_ticks", &SessionConfig::invincibilityTicks},
    {"speed_boost_ticks", &SessionConfig::speedBoostTicks},
    {"jump_boost_ticks", &SessionConfig::jumpBoostTicks},
    {"shield_ticks", &SessionConfig::shieldTicks},
    {"double_jump_ticks", &SessionConfig::doubleJumpTicks},
};

constexpr FloatKey<DifficultyTier> TIER_FLOATS[] = {
    {"gap_min", &DifficultyTier::gapMin},
    {"gap_max", &DifficultyTier::gapMax},
    {"max_rise", &DifficultyTier::maxRise},
    {"enemy_density", &DifficultyTier::enemyDensity},
    {"power_up_density", &DifficultyTier::powerUpDensity},
    {"platform_width_min", &DifficultyTier::platformWidthMin},
    {"platform_width_max", &DifficultyTier::platformWidthMax},
};

constexpr IntKey<DifficultyTier> TIER_INTS[] = {
    {"start_level", &DifficultyTier::startLevel},
    {"max_enemies", &DifficultyTier::maxEnemies},
    {"base_platform_count", &DifficultyTier::basePlatformCount},
};

template <typename T>
void overlay(const JsonValue& section, [[maybe_unused]] std::string_view category, T& target,
             std::span<const FloatKey<T>> floats, std::span<const IntKey<T>> ints) {
    for (const auto& field : floats) {
        if (!section.hasKey(field.key)) {
            continue;
        }
        if (auto value = section[field.key].tryAsNumber()) {
            target.*field.member = static_cast<float>(*value);
        } else {
            CONFIG_WARN(std::format("{}.{} is not a number, keeping {}", category, field.key,
                                    target.*field.member));
        }
    }
    for (const auto& field : ints) {
        if (!section.hasKey(field.key)) {
            continue;
        }
        if (auto value = section[field.key].tryAsInt()) {
            target.*field.member = *value;
        } else {
            CONFIG_WARN(std::format("{}.{} is not a number, keeping {}", category, field.key,
                                    target.*field.member));
        }
    }
}

template <typename T>
void store(JsonObject& out, const T& source, std::span<const FloatKey<T>> floats,
           std::span<const IntKey<T>> ints) {
    for (const auto& field : floats) {
        out[field.key] = JsonValue(static_cast<double>(source.*field.member));
    }
    for (const auto& field : ints) {
        out[field.key] = JsonValue(source.*field.member);
    }
}

const JsonValue* section(const JsonValue& root, const char* name) {
    if (!root.hasKey(name)) {
        return nullptr;
    }
    const JsonValue& value = root[name];
    if (!value.isObject()) {
        CONFIG_WARN(std::format("'{}' is a {}, expected Object", name, toString(value.getType())));
        return nullptr;
    }
    return &value;
}

void applyTiers(const JsonValue& root, GenerationConfig& generation) {
    if (!root.hasKey("difficulty_tiers")) {
        return;
    }
    const JsonArray* array = root["difficulty_tiers"].tryAsArray();
    if (!array) {
        CONFIG_WARN("'difficulty_tiers' is not an array, keeping existing tiers");
        return;
    }

    std::vector<DifficultyTier> tiers;
    tiers.reserve(array->size());
    for (size_t i = 0; i < array->size(); ++i) {
        const JsonValue& entry = (*array)[i];
        if (!entry.isObject()) {
            CONFIG_WARN(std::format("difficulty_tiers[{}] is not an object, skipped", i));
            continue;
        }
        DifficultyTier tier;
        tier.name = entry["name"].tryAsString().value_or(std::format("Tier {}", i + 1));
        overlay<DifficultyTier>(entry, std::format("difficulty_tiers[{}]", i), tier, TIER_FLOATS,
                                TIER_INTS);
        tiers.push_back(std::move(tier));
    }

    if (tiers.empty()) {
        CONFIG_WARN("'difficulty_tiers' has no usable entries, keeping existing tiers");
        return;
    }
    generation.tiers = std::move(tiers);
}

} // namespace

bool ConfigLoader::loadFromFile(const std::string& path, GameConfig& config) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        CONFIG_ERROR(std::format("Failed to load {}: {}", path, reader.getLastError()));
        return false;
    }
    if (!apply(reader.getRoot(), config)) {
        CONFIG_ERROR(std::format("{}: root must be an object", path));
        return false;
    }
    CONFIG_INFO(std::format("Loaded configuration from {}", path));
    return true;
}

bool ConfigLoader::loadFromString(std::string_view json, GameConfig& config) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONFIG_ERROR(std::format("Invalid configuration: {}", reader.getLastError()));
        return false;
    }
    return apply(reader.getRoot(), config);
}

bool ConfigLoader::apply(const JsonValue& root, GameConfig& config) {
    if (!root.isObject()) {
        return false;
    }

    GameConfig result = config;
    if (const JsonValue* physics = section(root, "physics")) {
        overlay<PhysicsConfig>(*physics, "physics", result.physics, PHYSICS_FLOATS, {});
    }
    if (const JsonValue* generation = section(root, "generation")) {
        overlay<GenerationConfig>(*generation, "generation", result.generation,
                                  GENERATION_FLOATS, GENERATION_INTS);
    }
    if (const JsonValue* session = section(root, "session")) {
        overlay<SessionConfig>(*session, "session", result.session, SESSION_FLOATS,
                               SESSION_INTS);
    }
    applyTiers(root, result.generation);

    config = std::move(result);
    return true;
}

JsonValue ConfigLoader::toJson(const GameConfig& config) {
    JsonObject physics;
    store<PhysicsConfig>(physics, config.physics, PHYSICS_FLOATS, {});

    JsonObject generation;
    store<GenerationConfig>(generation, config.generation, GENERATION_FLOATS, GENERATION_INTS);

    JsonObject session;
    store<SessionConfig>(session, config.session, SESSION_FLOATS, SESSION_INTS);

    JsonArray tiers;
    for (const DifficultyTier& tier : config.generation.tiers) {
        JsonObject entry;
        entry["name"] = JsonValue(tier.name);
        store<DifficultyTier>(entry, tier, TIER_FLOATS, TIER_INTS);
        tiers.emplace_back(std::move(entry));
    }

    JsonObject root;
    root["physics"] = JsonValue(std::move(physics));
    root["generation"] = JsonValue(std::move(generation));
    root["session"] = JsonValue(std::move(session));
    root["difficulty_tiers"] = JsonValue(std::move(tiers));
    return JsonValue(std::move(root));
}

bool ConfigLoader::saveToFile(const std::string& path, const GameConfig& config) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        CONFIG_ERROR(std::format("Could not open {} for writing", path));
        return false;
    }
    file << toJson(config).toString(2) << '\n';
    if (!file) {
        CONFIG_ERROR(std::format("Write to {} failed", path));
        return false;
    }
    CONFIG_INFO(std::format("Saved configuration to {}", path));
    return true;
}

} // namespace Skybound
