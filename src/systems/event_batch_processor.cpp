/**
 * @file event_batch_processor.cpp
 * @brief Implementation of the end-of-tick reaction drain
 */

#include "coinpusher/systems/event_batch_processor.hpp"

#include "coinpusher/core/debug.hpp"
#include "coinpusher/rules/interaction_rules.hpp"
#include "coinpusher/systems/explosion_resolver.hpp"

void ReactionStats::print() const {
    COINPUSHER_DEBUG_MSG(COINPUSHER_DEBUG_LEVEL_BASIC,
        "Reaction stats:\n"
        "  Merges: " << merges << "\n"
        "  Splits: " << splits << "\n"
        "  Transmutes: " << transmutes << "\n"
        "  Explosions: " << explosions << "\n"
        "  Skipped: " << skipped << "\n"
    );
}

namespace Systems {

EventBatchProcessor::EventBatchProcessor(IPhysicsWorld &world,
                                         const BodyTable &bodies,
                                         const ExplosionConfig &config)
    : world(world)
    , bodies(bodies)
    , explosionConfig(config)
{
}

ReactionStats EventBatchProcessor::drain(CoinRegistry &coins, CollisionReducer &reducer) {
    return process(coins, reducer.drainTick());
}

ReactionStats EventBatchProcessor::process(CoinRegistry &coins, const TickEvents &events) {
    stats.reset();

    for (const auto &event : events.combines) {
        applyCombine(coins, event);
    }
    for (const auto &event : events.splits) {
        applySplit(coins, event);
    }
    for (const auto &event : events.transmutes) {
        applyTransmute(coins, event);
    }
    for (const auto &event : events.explosions) {
        applyExplosion(coins, event);
    }

    if (!events.empty()) {
        stats.print();
    }
    return stats;
}

void EventBatchProcessor::applyCombine(CoinRegistry &coins, const CombineEvent &event) {
    auto first = coins.find(event.first);
    auto second = coins.find(event.second);
    if (!first || !second) {
        ++stats.skipped;
        return;
    }

    coins.remove(event.first);
    notifyRemove(event.first);
    coins.remove(event.second);
    notifyRemove(event.second);

    CoinId const product = coins.spawn(event.product,
                                       midpoint(first->position, second->position),
                                       Vector3());
    notifySpawn(coins, product);
    ++stats.merges;
}

void EventBatchProcessor::applySplit(CoinRegistry &coins, const SplitEvent &event) {
    auto source = coins.find(event.source);
    if (!source || source->hasSplit || !Rules::isSplitter(source->type)) {
        ++stats.skipped;
        return;
    }

    coins.markSplit(event.source);
    // Clone starts pre-split so it can never clone itself in turn
    CoinId const clone = coins.spawn(source->type, event.spawnPoint, source->rotation, true);
    notifySpawn(coins, clone);
    ++stats.splits;
}

void EventBatchProcessor::applyTransmute(CoinRegistry &coins, const TransmuteEvent &event) {
    CoinType const terminal = Rules::transmuteRule().terminal;
    auto type = coins.typeOf(event.target);
    if (!type || *type == terminal) {
        ++stats.skipped;
        return;
    }

    coins.setType(event.target, terminal);
    if (eventHooks.onMutate) {
        eventHooks.onMutate(event.target, terminal);
    }
    ++stats.transmutes;
}

void EventBatchProcessor::applyExplosion(CoinRegistry &coins, const ExplosionEvent &event) {
    auto bomb = coins.find(event.bomb);
    if (!bomb) {
        ++stats.skipped;
        return;
    }

    std::size_t const pushed = ExplosionResolver::detonate(world, bomb->position, explosionConfig,
                                                           bodies.handleOf(event.bomb));
    COINPUSHER_DEBUG_MSG(COINPUSHER_DEBUG_LEVEL_VERBOSE,
        "[Batch] bomb " << event.bomb << " pushed " << pushed << " bodies\n");
    (void)pushed;

    coins.remove(event.bomb);
    notifyRemove(event.bomb);
    ++stats.explosions;
}

void EventBatchProcessor::notifySpawn(const CoinRegistry &coins, CoinId id) {
    if (!eventHooks.onSpawn) {
        return;
    }
    auto coin = coins.find(id);
    if (coin) {
        eventHooks.onSpawn(*coin);
    }
}

void EventBatchProcessor::notifyRemove(CoinId id) {
    if (eventHooks.onRemove) {
        eventHooks.onRemove(id);
    }
}

} // namespace Systems
