/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE DifficultyScalerTests
#include <boost/test/unit_test.hpp>

#include "core/GameConfig.hpp"
#include "core/Logger.hpp"
#include "world/DifficultyScaler.hpp"
#include <stdexcept>

using namespace Skybound;

struct ScalerFixture {
    ScalerFixture() { SKYBOUND_ENABLE_BENCHMARK_MODE(); }

    DifficultyScaler scaler{defaultDifficultyTiers()};
};

BOOST_FIXTURE_TEST_SUITE(DifficultyScalerTests, ScalerFixture)

BOOST_AUTO_TEST_CASE(TestTierSelection) {
    BOOST_CHECK_EQUAL(scaler.paramsFor(2).tierName, "Meadow");
    BOOST_CHECK_EQUAL(scaler.paramsFor(3).tierName, "Meadow");
    BOOST_CHECK_EQUAL(scaler.paramsFor(4).tierName, "Hills");
    BOOST_CHECK_EQUAL(scaler.paramsFor(7).tierName, "Cliffs");
    BOOST_CHECK_EQUAL(scaler.paramsFor(10).tierName, "Peaks");
    BOOST_CHECK_EQUAL(scaler.paramsFor(2).levelIndex, 2);
}

BOOST_AUTO_TEST_CASE(TestParametersNeverDecrease) {
    DifficultyParams previous = scaler.paramsFor(2);
    for (int level = 3; level <= 60; ++level) {
        const DifficultyParams current = scaler.paramsFor(level);
        BOOST_TEST_CONTEXT("level " << level) {
            BOOST_CHECK_GE(current.gapMin, previous.gapMin);
            BOOST_CHECK_GE(current.gapMax, previous.gapMax);
            BOOST_CHECK_GE(current.maxRise, previous.maxRise);
            BOOST_CHECK_GE(current.enemyDensity, previous.enemyDensity);
            BOOST_CHECK_GE(current.maxEnemies, previous.maxEnemies);
            BOOST_CHECK_GE(current.platformCount, previous.platformCount);
        }
        previous = current;
    }
}

BOOST_AUTO_TEST_CASE(TestCappedAtLastTier) {
    const DifficultyParams late = scaler.paramsFor(40);
    const DifficultyParams later = scaler.paramsFor(4000);

    BOOST_CHECK_EQUAL(later.tierName, "Peaks");
    BOOST_CHECK_EQUAL(later.gapMax, late.gapMax);
    BOOST_CHECK_EQUAL(later.enemyDensity, late.enemyDensity);
    BOOST_CHECK_EQUAL(later.maxEnemies, late.maxEnemies);
    // Base 8 plus the extra-platform ceiling of 4
    BOOST_CHECK_EQUAL(later.platformCount, 12);
    BOOST_CHECK_EQUAL(late.platformCount, 12);
}

BOOST_AUTO_TEST_CASE(TestIndicesBeforeFirstTier) {
    BOOST_CHECK_EQUAL(scaler.paramsFor(1).tierName, "Meadow");
    BOOST_CHECK_EQUAL(scaler.paramsFor(0).tierName, "Meadow");
    BOOST_CHECK_EQUAL(scaler.paramsFor(-5).tierName, "Meadow");
    BOOST_CHECK_EQUAL(scaler.paramsFor(-5).platformCount, 5);
}

BOOST_AUTO_TEST_CASE(TestPlatformCountGrowth) {
    BOOST_CHECK_EQUAL(scaler.paramsFor(2).platformCount, 5);
    BOOST_CHECK_EQUAL(scaler.paramsFor(3).platformCount, 6);
    BOOST_CHECK_EQUAL(scaler.paramsFor(4).platformCount, 7); // Hills base 6 + 1
    BOOST_CHECK_EQUAL(scaler.paramsFor(6).platformCount, 8);
}

BOOST_AUTO_TEST_CASE(TestNormalizeSortsTiers) {
    std::vector<DifficultyTier> tiers = defaultDifficultyTiers();
    std::swap(tiers[0], tiers[3]);
    std::swap(tiers[1], tiers[2]);

    const std::vector<DifficultyTier> sorted = DifficultyScaler::normalize(tiers);
    BOOST_REQUIRE_EQUAL(sorted.size(), 4u);
    BOOST_CHECK_EQUAL(sorted[0].name, "Meadow");
    BOOST_CHECK_EQUAL(sorted[1].name, "Hills");
    BOOST_CHECK_EQUAL(sorted[2].name, "Cliffs");
    BOOST_CHECK_EQUAL(sorted[3].name, "Peaks");
}

BOOST_AUTO_TEST_CASE(TestNormalizeRaisesEasierLaterTier) {
    DifficultyTier early;
    early.name = "Hard";
    early.startLevel = 2;
    early.gapMin = 80.0f;
    early.gapMax = 140.0f;
    early.enemyDensity = 0.5f;
    early.maxEnemies = 3;

    DifficultyTier late;
    late.name = "Soft";
    late.startLevel = 5;
    late.gapMin = 20.0f;
    late.gapMax = 60.0f;
    late.enemyDensity = 0.1f;
    late.maxEnemies = 1;

    const DifficultyScaler repaired({early, late});
    const DifficultyParams params = repaired.paramsFor(5);
    BOOST_CHECK_EQUAL(params.tierName, "Soft");
    BOOST_CHECK_EQUAL(params.gapMin, 80.0f);
    BOOST_CHECK_EQUAL(params.gapMax, 140.0f);
    BOOST_CHECK_EQUAL(params.enemyDensity, 0.5f);
    BOOST_CHECK_EQUAL(params.maxEnemies, 3);
}

BOOST_AUTO_TEST_CASE(TestNormalizeSanitisesRanges) {
    DifficultyTier tier;
    tier.name = "Odd";
    tier.gapMin = 120.0f;
    tier.gapMax = 50.0f;
    tier.enemyDensity = 4.0f;
    tier.powerUpDensity = -1.0f;
    tier.basePlatformCount = 0;
    tier.platformWidthMin = 150.0f;
    tier.platformWidthMax = 90.0f;

    const std::vector<DifficultyTier> fixed = DifficultyScaler::normalize({tier});
    BOOST_REQUIRE_EQUAL(fixed.size(), 1u);
    BOOST_CHECK_EQUAL(fixed[0].gapMin, 50.0f);
    BOOST_CHECK_EQUAL(fixed[0].gapMax, 120.0f);
    BOOST_CHECK_EQUAL(fixed[0].enemyDensity, 1.0f);
    BOOST_CHECK_EQUAL(fixed[0].powerUpDensity, 0.0f);
    BOOST_CHECK_EQUAL(fixed[0].basePlatformCount, 2);
    BOOST_CHECK_LE(fixed[0].platformWidthMin, fixed[0].platformWidthMax);
}

BOOST_AUTO_TEST_CASE(TestEmptyTiersThrow) {
    BOOST_CHECK_THROW(DifficultyScaler::normalize({}), std::invalid_argument);
    BOOST_CHECK_THROW(DifficultyScaler(std::vector<DifficultyTier>{}), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
