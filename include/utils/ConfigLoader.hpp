/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "core/GameConfig.hpp"
#include "utils/JsonReader.hpp"
#include <string>
#include <string_view>

namespace Skybound {

/**
 * Reads and writes GameConfig as JSON.
 *
 * File layout:
 *   { "physics": {...}, "generation": {...}, "session": {...},
 *     "difficulty_tiers": [ {...}, ... ] }
 *
 * Keys that are present overlay the values already in the target config.
 * Unknown keys are ignored and keys with the wrong type are skipped with a
 * warning. A file that can't be opened or parsed leaves the target untouched.
 */
class ConfigLoader {
public:
    static bool loadFromFile(const std::string& path, GameConfig& config);
    static bool loadFromString(std::string_view json, GameConfig& config);
    static bool saveToFile(const std::string& path, const GameConfig& config);

    // Overlays a parsed document; false if the root isn't an object
    static bool apply(const JsonValue& root, GameConfig& config);
    static JsonValue toJson(const GameConfig& config);
};

} // namespace Skybound

#endif // CONFIG_LOADER_HPP
