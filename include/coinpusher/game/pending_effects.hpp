/**
 * @file pending_effects.hpp
 * @brief Effects produced by a state transition and run right after it
 *
 * A transition only records what it wants to happen. The caller drains
 * the queue once the transition has returned, so an effect never mutates
 * state while that state is being updated, and runs exactly once.
 */

#pragma once

#include <vector>

struct JackpotBurst {
    int bonusLevel;     ///< Bonus level reached when the meter filled
};

class PendingEffects {
public:
    void pushJackpot(const JackpotBurst &burst) { jackpots.push_back(burst); }

    std::vector<JackpotBurst> drainJackpots() {
        std::vector<JackpotBurst> out;
        out.swap(jackpots);
        return out;
    }

    bool empty() const { return jackpots.empty(); }
    std::size_t size() const { return jackpots.size(); }
    void clear() { jackpots.clear(); }

private:
    std::vector<JackpotBurst> jackpots;
};
