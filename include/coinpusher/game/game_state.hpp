/**
 * @file game_state.hpp
 * @brief Plain data for one run: phase, economy, deck and upgrades
 */

#ifndef COINPUSHER_GAME_STATE_HPP
#define COINPUSHER_GAME_STATE_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "coinpusher/rules/coin_catalog.hpp"

enum class GamePhase {
    Menu,
    Playing,
    Shop,
    GameOver
};

std::string phaseName(GamePhase phase);

/**
 * @class Deck
 * @brief Unspent coins per type. Counts never go negative.
 */
class Deck {
public:
    Deck();

    int count(CoinType type) const;

    void add(CoinType type, int amount);

    /**
     * @brief Removes one coin. Returns false if none are left.
     */
    bool take(CoinType type);

    int total() const;

    /**
     * @brief The deck a fresh run starts with.
     */
    static Deck initial();

private:
    std::array<int, CoinTypeCount> counts;
};

/**
 * @struct OwnedArtifact
 * @brief An upgrade the player has bought at least once.
 */
struct OwnedArtifact {
    std::string id;
    int level = 1;
};

/**
 * @struct BonusClock
 * @brief Simulated-time bookkeeping for bonus meter decay.
 */
struct BonusClock {
    double simTime = 0.0;
    double lastCollectTime = 0.0;
    double lastDecayTime = 0.0;

    void resetTo(double now) {
        lastCollectTime = now;
        lastDecayTime = now;
    }
};

struct GameState {
    GamePhase phase = GamePhase::Menu;
    std::int64_t score = 0;
    std::int64_t targetScore = 0;
    std::int64_t cash = 0;
    int ante = 1;
    double bonus = 0.0;         ///< Meter in [0, bonusMax]
    int bonusLevel = 1;         ///< >= 1, raises score and jackpot size
    Deck deck;
    std::vector<OwnedArtifact> artifacts;
    BonusClock clock;

    /**
     * @brief Level of an upgrade, 0 if not owned.
     */
    int artifactLevel(const std::string &id) const;
};

#endif
