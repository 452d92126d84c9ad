/**
 * @file economy.hpp
 * @brief Score, cash, bonus meter and round transitions
 *
 * Phase machine:
 *   MENU -> PLAYING -> SHOP | GAME_OVER
 *   SHOP -> PLAYING
 *   GAME_OVER -> MENU (restart)
 *
 * Every transition takes the state explicitly and returns whether it
 * applied; an illegal or unaffordable request leaves the state untouched.
 */

#ifndef COINPUSHER_ECONOMY_HPP
#define COINPUSHER_ECONOMY_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "coinpusher/core/game_config.hpp"
#include "coinpusher/game/game_state.hpp"
#include "coinpusher/game/pending_effects.hpp"
#include "coinpusher/rules/artifact_catalog.hpp"

namespace Economy {

/**
 * @brief Outcome of collecting one coin.
 */
struct CollectResult {
    bool applied = false;
    std::int64_t cashGained = 0;
    std::int64_t scoreGained = 0;
    bool jackpot = false;       ///< Meter filled; a burst was queued
};

/**
 * @brief Snapshot a run starts from (phase MENU).
 */
GameState initialState(const EconomyConfig &config);

/**
 * @brief MENU -> PLAYING from a fresh snapshot.
 */
bool startGame(GameState &state, const EconomyConfig &config);

/**
 * @brief GAME_OVER -> MENU, back to the initial snapshot.
 */
bool restart(GameState &state, const EconomyConfig &config);

/**
 * @brief Credits a coin that fell off the bed.
 *
 * Fills the bonus meter; when it reaches the top the meter resets, the
 * bonus level goes up and a jackpot burst is queued on effects.
 */
CollectResult collect(GameState &state, CoinType type, const GameConfig &config, PendingEffects &effects);

/**
 * @brief Ends the round: SHOP if the target was met, otherwise GAME_OVER.
 * @return The new phase, or nullopt if not PLAYING
 */
std::optional<GamePhase> endRound(GameState &state);

/**
 * @brief SHOP -> PLAYING with the next ante and a higher target.
 */
bool nextRound(GameState &state, const EconomyConfig &config);

/**
 * @brief Advances simulated time and decays the bonus meter.
 * @param dt Simulated seconds (already time-scaled)
 * @param sessionActive False while the session is in the background
 */
void advanceClock(GameState &state, double dt, bool sessionActive, const EconomyConfig &config);

/**
 * @brief Buys one pack of coins. Only in SHOP and only if affordable.
 */
bool purchaseCoins(GameState &state, CoinType type, const EconomyConfig &config);

/**
 * @brief Buys the next level of an upgrade. Only in SHOP and only if affordable.
 */
bool purchaseArtifact(GameState &state, const std::string &id, const EconomyConfig &config);

/**
 * @brief floor(baseCost * growth^level)
 */
std::int64_t artifactCost(const ArtifactSpec &spec, int level, const EconomyConfig &config);

/**
 * @brief Cost of the next level given what the player owns.
 */
std::optional<std::int64_t> nextArtifactCost(const GameState &state, const std::string &id, const EconomyConfig &config);

double scoreMultiplier(const GameState &state, const EconomyConfig &config);
double bonusMultiplier(int bonusLevel, const EconomyConfig &config);

/**
 * @brief Coins spawned by a burst at the given bonus level.
 */
int jackpotCoinCount(int bonusLevel, int extenderLevel, const GameConfig &config);

} // namespace Economy

namespace Machine {

    double bedWidth(int extenderLevel, const MachineConfig &config);
    double dropWidth(int extenderLevel, const MachineConfig &config);

    /**
     * @brief Linear and angular damping for coin bodies.
     */
    double coinDamping(int magnetLevel, const MachineConfig &config);

} // namespace Machine

#endif
