/**
 * @file event_batch_processor.hpp
 * @brief End-of-tick application of queued reactions to the coin registry
 *
 * Drains one tick of events in a fixed order:
 *   combine -> split -> transmute -> explosion
 * An event whose coin was already consumed earlier in the same drain is
 * skipped. Visible side effects leave through CoinEventHooks only.
 */

#ifndef COINPUSHER_EVENT_BATCH_PROCESSOR_HPP
#define COINPUSHER_EVENT_BATCH_PROCESSOR_HPP

#include <functional>

#include "coinpusher/core/game_config.hpp"
#include "coinpusher/entities/body_table.hpp"
#include "coinpusher/entities/coin_registry.hpp"
#include "coinpusher/systems/collision_events.hpp"
#include "coinpusher/systems/collision_reducer.hpp"
#include "coinpusher/systems/i_physics_world.hpp"

/**
 * @struct CoinEventHooks
 * @brief One-shot notifications for animation and audio.
 *
 * Unset hooks are simply not called.
 */
struct CoinEventHooks {
    std::function<void(const CoinData &)> onSpawn;
    std::function<void(CoinId)> onRemove;
    std::function<void(CoinId, CoinType)> onMutate;
};

/**
 * @struct ReactionStats
 * @brief Counters for one drain.
 */
struct ReactionStats {
    int merges = 0;
    int splits = 0;
    int transmutes = 0;
    int explosions = 0;
    int skipped = 0;    ///< Stale or duplicate events dropped

    void reset() { *this = ReactionStats{}; }
    int applied() const { return merges + splits + transmutes + explosions; }
    void print() const;
};

namespace Systems {

class EventBatchProcessor {
public:
    EventBatchProcessor(IPhysicsWorld &world,
                        const BodyTable &bodies,
                        const ExplosionConfig &config = ExplosionConfig{});

    void setHooks(const CoinEventHooks &hooks) { eventHooks = hooks; }
    void setExplosionConfig(const ExplosionConfig &config) { explosionConfig = config; }

    /**
     * @brief Drains the reducer's current tick into the registry.
     */
    ReactionStats drain(CoinRegistry &coins, CollisionReducer &reducer);

    /**
     * @brief Applies an explicit batch of events.
     */
    ReactionStats process(CoinRegistry &coins, const TickEvents &events);

    const ReactionStats &lastStats() const { return stats; }

private:
    void applyCombine(CoinRegistry &coins, const CombineEvent &event);
    void applySplit(CoinRegistry &coins, const SplitEvent &event);
    void applyTransmute(CoinRegistry &coins, const TransmuteEvent &event);
    void applyExplosion(CoinRegistry &coins, const ExplosionEvent &event);

    void notifySpawn(const CoinRegistry &coins, CoinId id);
    void notifyRemove(CoinId id);

    IPhysicsWorld &world;
    const BodyTable &bodies;
    ExplosionConfig explosionConfig;
    CoinEventHooks eventHooks;
    ReactionStats stats;
};

} // namespace Systems

#endif
