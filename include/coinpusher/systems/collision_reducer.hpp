/**
 * @file collision_reducer.hpp
 * @brief Turns raw contact callbacks into at most one queued reaction each
 *
 * Runs inside the physics contact callback, so it never mutates the
 * registry. It only reads coin state and records what should happen when
 * the tick is drained.
 */

#ifndef COINPUSHER_COLLISION_REDUCER_HPP
#define COINPUSHER_COLLISION_REDUCER_HPP

#include "coinpusher/core/game_config.hpp"
#include "coinpusher/entities/coin_registry.hpp"
#include "coinpusher/systems/collision_events.hpp"

namespace Systems {

/**
 * @brief What happened to one contact notification.
 */
enum class ReduceOutcome {
    Rejected,    ///< Self is unknown or takes part in no reaction
    NoReaction,  ///< Participating coin, but the contact does not qualify
    Duplicate,   ///< Qualified, but the same event is already queued this tick
    Enqueued
};

class CollisionReducer {
public:
    explicit CollisionReducer(const ReactionConfig &config = ReactionConfig{});

    void setConfig(const ReactionConfig &config) { reactionConfig = config; }
    const ReactionConfig &getConfig() const { return reactionConfig; }

    /**
     * @brief Classifies a contact and queues the matching reaction.
     * @param coins Current registry, read only
     * @param contact The contact from the reporting coin's point of view
     */
    ReduceOutcome onContactBegin(const CoinRegistry &coins, const ContactNotification &contact);

    /**
     * @brief Hands over this tick's events and opens a fresh tick.
     */
    TickEvents drainTick();

    /**
     * @brief Drops anything queued (used when a round is torn down).
     */
    void clear();

    std::size_t pendingCount() const;

private:
    ReduceOutcome reduceCombine(const CoinRegistry &coins, const CoinData &self, const ContactNotification &contact);
    ReduceOutcome reduceSplit(const CoinData &self, const ContactNotification &contact);
    ReduceOutcome reduceTransmute(const CoinRegistry &coins, const CoinData &self, const ContactNotification &contact);
    ReduceOutcome reduceExplosion(const CoinData &self, const ContactNotification &contact);

    ReactionConfig reactionConfig;

    DedupQueue<CombineKey, CombineEvent, CombineKeyHash> combineQueue;
    DedupQueue<CoinId, SplitEvent> splitQueue;
    DedupQueue<CoinId, TransmuteEvent> transmuteQueue;
    DedupQueue<CoinId, ExplosionEvent> explosionQueue;
};

} // namespace Systems

#endif
