/**
 * @file game_config.hpp
 * @brief Tunable parameters for the coin pusher core.
 */

#pragma once

/**
 * @struct EconomyConfig
 * @brief Score, cash, bonus meter and round progression parameters.
 */
struct EconomyConfig {
    int startingCash = 100;
    int startingTargetScore = 2000;
    int startingAnte = 1;

    double bonusPerCoin = 4.0;          // Flat meter gain per collected coin (25 coins to fill)
    double bonusMax = 100.0;
    double bonusLevelStep = 0.1;        // bonusMultiplier = 1 + step * (bonusLevel - 1)
    double bonusDecayGraceSeconds = 2.0;
    double bonusDecayPerSecond = 20.0;

    double targetScoreGrowth = 1.5;
    int coinPackSize = 5;
    double artifactCostGrowth = 1.5;
    double scoreMultiplierPerLevel = 1.5;
};

/**
 * @struct ReactionConfig
 * @brief Thresholds used when turning contacts into reactions.
 */
struct ReactionConfig {
    double splitSpawnClearance = 1.0;      // Clone spawns this far above the contact point
    double explosionImpactSpeedSq = 25.0;  // Squared relative speed needed to detonate
};

/**
 * @struct ExplosionConfig
 * @brief Radial blast parameters for bomb detonation.
 */
struct ExplosionConfig {
    double radius = 8.0;
    double force = 8.0;
    double upwardBias = 0.5;
};

/**
 * @struct MachineConfig
 * @brief Bed geometry and spawn zones.
 */
struct MachineConfig {
    double baseWidth = 10.0;
    double widthPerLevel = 4.0;
    double bedLength = 14.0;
    double baseDropWidth = 8.0;
    double dropDepth = 3.0;
    double dropHeightMin = 8.0;
    double dropHeightRange = 2.0;

    double baseDamping = 2.0;
    double dampingPerLevel = 2.0;

    int initialFillCount = 60;
    double fillHalfWidth = 4.0;
    double fillHeightMin = 2.0;
    double fillHeightRange = 5.0;
    double fillDepth = 7.0;
};

/**
 * @struct JackpotConfig
 * @brief Sizing of the burst spawned when the bonus meter fills.
 */
struct JackpotConfig {
    double baseCoins = 10.0;    // Scaled by the bonus multiplier
    double baseCap = 12.0;      // Scaled by bed area
};

/**
 * @struct GameConfig
 * @brief Holds every configuration section for a game session.
 */
struct GameConfig {
    EconomyConfig economy;
    ReactionConfig reactions;
    ExplosionConfig explosion;
    MachineConfig machine;
    JackpotConfig jackpot;
};

/**
 * @brief Asserts that a configuration is usable.
 *
 * Called once when a session is created; a bad value is a programming error.
 */
void validateConfig(const GameConfig &cfg);
