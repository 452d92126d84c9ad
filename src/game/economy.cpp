/**
 * @file economy.cpp
 * @brief Implementation of the economy and round state machine
 */

#include "coinpusher/game/economy.hpp"

#include <algorithm>
#include <cmath>

#include "coinpusher/core/debug.hpp"

namespace Economy {

namespace {

// Guards floor() against products like 179.99999999999997
constexpr double kFloorSlack = 1e-9;

std::int64_t floorAmount(double value) {
    return static_cast<std::int64_t>(std::floor(value + kFloorSlack));
}

} // namespace

GameState initialState(const EconomyConfig &config) {
    GameState state;
    state.phase = GamePhase::Menu;
    state.score = 0;
    state.targetScore = config.startingTargetScore;
    state.cash = config.startingCash;
    state.ante = config.startingAnte;
    state.bonus = 0.0;
    state.bonusLevel = 1;
    state.deck = Deck::initial();
    return state;
}

bool startGame(GameState &state, const EconomyConfig &config) {
    if (state.phase != GamePhase::Menu) {
        return false;
    }
    state = initialState(config);
    state.phase = GamePhase::Playing;
    return true;
}

bool restart(GameState &state, const EconomyConfig &config) {
    if (state.phase != GamePhase::GameOver) {
        return false;
    }
    state = initialState(config);
    return true;
}

CollectResult collect(GameState &state, CoinType type, const GameConfig &config, PendingEffects &effects) {
    CollectResult result;
    if (state.phase != GamePhase::Playing && state.phase != GamePhase::Shop) {
        return result;
    }

    const EconomyConfig &eco = config.economy;
    const CoinSpec &spec = CoinCatalog::spec(type);

    state.clock.lastCollectTime = state.clock.simTime;

    result.applied = true;
    result.cashGained = spec.value;
    result.scoreGained = floorAmount(spec.score * scoreMultiplier(state, eco) * bonusMultiplier(state.bonusLevel, eco));

    state.cash += result.cashGained;
    state.score += result.scoreGained;

    double nextBonus = state.bonus + eco.bonusPerCoin;
    if (nextBonus >= eco.bonusMax) {
        nextBonus = 0.0;
        state.bonusLevel += 1;
        result.jackpot = true;
        effects.pushJackpot(JackpotBurst{state.bonusLevel});
        COINPUSHER_DEBUG_MSG(COINPUSHER_DEBUG_LEVEL_BASIC,
            "[Economy] jackpot, bonus level " << state.bonusLevel << "\n");
    }
    state.bonus = nextBonus;
    return result;
}

std::optional<GamePhase> endRound(GameState &state) {
    if (state.phase != GamePhase::Playing) {
        return std::nullopt;
    }
    if (state.score >= state.targetScore) {
        state.phase = GamePhase::Shop;
        state.score = 0;
        state.bonus = 0.0;
        state.bonusLevel = 1;
    } else {
        state.phase = GamePhase::GameOver;
    }
    return state.phase;
}

bool nextRound(GameState &state, const EconomyConfig &config) {
    if (state.phase != GamePhase::Shop) {
        return false;
    }
    state.phase = GamePhase::Playing;
    state.ante += 1;
    state.targetScore = floorAmount(static_cast<double>(state.targetScore) * config.targetScoreGrowth);
    state.clock.resetTo(state.clock.simTime);
    return true;
}

void advanceClock(GameState &state, double dt, bool sessionActive, const EconomyConfig &config) {
    BonusClock &clock = state.clock;
    clock.simTime += std::max(0.0, dt);
    double const now = clock.simTime;

    // Paused decay does not catch up once the session comes back
    if (state.phase != GamePhase::Playing || !sessionActive) {
        clock.lastDecayTime = now;
        return;
    }

    if (now - clock.lastCollectTime <= config.bonusDecayGraceSeconds) {
        clock.lastDecayTime = now;
        return;
    }

    double const decayStart = std::max(clock.lastDecayTime,
                                       clock.lastCollectTime + config.bonusDecayGraceSeconds);
    double const decayDelta = now - decayStart;
    if (decayDelta <= 0.0) {
        return;
    }
    clock.lastDecayTime = now;

    if (state.bonus <= 0.0) {
        return;
    }
    state.bonus = std::max(0.0, state.bonus - config.bonusDecayPerSecond * decayDelta);
    if (state.bonus == 0.0) {
        state.bonusLevel = 1;
    }
}

bool purchaseCoins(GameState &state, CoinType type, const EconomyConfig &config) {
    if (state.phase != GamePhase::Shop) {
        return false;
    }
    std::int64_t const cost = CoinCatalog::spec(type).cost;
    if (state.cash < cost) {
        return false;
    }
    state.cash -= cost;
    state.deck.add(type, config.coinPackSize);
    return true;
}

std::int64_t artifactCost(const ArtifactSpec &spec, int level, const EconomyConfig &config) {
    return floorAmount(spec.baseCost * std::pow(config.artifactCostGrowth, level));
}

std::optional<std::int64_t> nextArtifactCost(const GameState &state, const std::string &id, const EconomyConfig &config) {
    auto spec = ArtifactCatalog::find(id);
    if (!spec) {
        return std::nullopt;
    }
    return artifactCost(*spec, state.artifactLevel(id), config);
}

bool purchaseArtifact(GameState &state, const std::string &id, const EconomyConfig &config) {
    if (state.phase != GamePhase::Shop) {
        return false;
    }
    auto cost = nextArtifactCost(state, id, config);
    if (!cost || state.cash < *cost) {
        return false;
    }
    state.cash -= *cost;

    auto owned = std::find_if(state.artifacts.begin(), state.artifacts.end(),
                              [&id](const OwnedArtifact &a) { return a.id == id; });
    if (owned != state.artifacts.end()) {
        owned->level += 1;
    } else {
        state.artifacts.push_back(OwnedArtifact{id, 1});
    }
    return true;
}

double scoreMultiplier(const GameState &state, const EconomyConfig &config) {
    return std::pow(config.scoreMultiplierPerLevel, state.artifactLevel(ArtifactCatalog::Mult));
}

double bonusMultiplier(int bonusLevel, const EconomyConfig &config) {
    return 1.0 + config.bonusLevelStep * (bonusLevel - 1);
}

int jackpotCoinCount(int bonusLevel, int extenderLevel, const GameConfig &config) {
    double const bedAreaScale = Machine::bedWidth(extenderLevel, config.machine) / config.machine.baseWidth;
    long const cap = std::max(1L, std::lround(config.jackpot.baseCap * bedAreaScale));
    long const wanted = std::max(1L, std::lround(config.jackpot.baseCoins * bonusMultiplier(bonusLevel, config.economy)));
    return static_cast<int>(std::min(cap, wanted));
}

} // namespace Economy

namespace Machine {

double bedWidth(int extenderLevel, const MachineConfig &config) {
    return config.baseWidth + extenderLevel * config.widthPerLevel;
}

double dropWidth(int extenderLevel, const MachineConfig &config) {
    return config.baseDropWidth + extenderLevel * config.widthPerLevel;
}

double coinDamping(int magnetLevel, const MachineConfig &config) {
    return config.baseDamping + magnetLevel * config.dampingPerLevel;
}

} // namespace Machine
