#include "coinpusher/core/constants.hpp"

#include <cassert>

namespace GameConstants {

    const double Pi = 3.141592654;

    GameConfig defaultConfig() {
        // Member initializers already hold the shipped values
        return GameConfig{};
    }

} // namespace GameConstants

void validateConfig(const GameConfig &cfg) {
    const auto &eco = cfg.economy;
    assert(eco.startingCash >= 0 && "Starting cash must be non-negative.");
    assert(eco.startingTargetScore > 0 && "Target score must be positive.");
    assert(eco.startingAnte >= 1 && "Ante starts at 1 or above.");
    assert(eco.bonusPerCoin > 0.0 && eco.bonusPerCoin <= eco.bonusMax && "Bonus gain must be in (0, max].");
    assert(eco.bonusMax > 0.0 && "Bonus meter needs a positive capacity.");
    assert(eco.bonusDecayGraceSeconds >= 0.0 && "Grace window must be non-negative.");
    assert(eco.bonusDecayPerSecond >= 0.0 && "Decay rate must be non-negative.");
    assert(eco.targetScoreGrowth >= 1.0 && "Targets never shrink between rounds.");
    assert(eco.coinPackSize > 0 && "Coin packs must contain coins.");
    assert(eco.artifactCostGrowth >= 1.0 && "Artifact costs never shrink.");

    assert(cfg.reactions.splitSpawnClearance >= 0.0 && "Split clearance must be non-negative.");
    assert(cfg.reactions.explosionImpactSpeedSq >= 0.0 && "Impact threshold must be non-negative.");

    assert(cfg.explosion.radius > 0.0 && "Explosion radius must be positive.");
    assert(cfg.explosion.force >= 0.0 && "Explosion force must be non-negative.");

    assert(cfg.machine.baseWidth > 0.0 && cfg.machine.bedLength > 0.0 && "Bed must have an area.");
    assert(cfg.machine.baseDropWidth > 0.0 && "Drop zone must have a width.");
    assert(cfg.machine.initialFillCount >= 0 && "Fill count must be non-negative.");

    assert(cfg.jackpot.baseCoins > 0.0 && cfg.jackpot.baseCap > 0.0 && "Jackpot must spawn coins.");

    // assert compiles out under NDEBUG
    (void)eco;
}
