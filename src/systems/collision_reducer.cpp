/**
 * @file collision_reducer.cpp
 * @brief Classification and deduplication of contact callbacks
 */

#include "coinpusher/systems/collision_reducer.hpp"

#include "coinpusher/core/debug.hpp"
#include "coinpusher/rules/interaction_rules.hpp"

namespace Systems {

namespace {

ReduceOutcome queued(bool pushed) {
    return pushed ? ReduceOutcome::Enqueued : ReduceOutcome::Duplicate;
}

} // namespace

CollisionReducer::CollisionReducer(const ReactionConfig &config)
    : reactionConfig(config)
{
}

ReduceOutcome CollisionReducer::onContactBegin(const CoinRegistry &coins, const ContactNotification &contact) {
    auto self = coins.find(contact.selfId);
    if (!self || !Rules::participates(self->type)) {
        return ReduceOutcome::Rejected;
    }

    // Collision classes are disjoint, so at most one branch applies
    if (Rules::isReactive(self->type)) {
        return reduceCombine(coins, *self, contact);
    }
    if (Rules::isSplitter(self->type)) {
        return reduceSplit(*self, contact);
    }
    if (Rules::isTransmuter(self->type)) {
        return reduceTransmute(coins, *self, contact);
    }
    if (Rules::isExplosive(self->type)) {
        return reduceExplosion(*self, contact);
    }
    return ReduceOutcome::NoReaction;
}

ReduceOutcome CollisionReducer::reduceCombine(const CoinRegistry &coins,
                                              const CoinData &self,
                                              const ContactNotification &contact)
{
    if (contact.otherKind != BodyKind::Coin || !contact.otherId) {
        return ReduceOutcome::NoReaction;
    }
    // The mirrored callback from the other coin queues the pair instead
    if (!(self.id < *contact.otherId)) {
        return ReduceOutcome::NoReaction;
    }

    auto otherType = coins.typeOf(*contact.otherId);
    if (!otherType || !Rules::isReactive(*otherType)) {
        return ReduceOutcome::NoReaction;
    }

    auto product = Rules::combine(self.type, *otherType);
    if (!product) {
        return ReduceOutcome::NoReaction;
    }

    CombineKey key{self.id, *contact.otherId, *product};
    COINPUSHER_DEBUG_MSG(COINPUSHER_DEBUG_LEVEL_VERBOSE,
        "[Reducer] combine " << self.id << " + " << *contact.otherId
        << " -> " << CoinCatalog::typeName(*product) << "\n");
    return queued(combineQueue.push(key, CombineEvent{self.id, *contact.otherId, *product}));
}

ReduceOutcome CollisionReducer::reduceSplit(const CoinData &self, const ContactNotification &contact) {
    if (self.hasSplit || contact.otherKind != BodyKind::Pusher || !contact.contactPoint) {
        return ReduceOutcome::NoReaction;
    }

    Vector3 spawnPoint = *contact.contactPoint;
    spawnPoint.y += reactionConfig.splitSpawnClearance;
    return queued(splitQueue.push(self.id, SplitEvent{self.id, spawnPoint}));
}

ReduceOutcome CollisionReducer::reduceTransmute(const CoinRegistry &coins,
                                                const CoinData &self,
                                                const ContactNotification &contact)
{
    (void)self;
    if (contact.otherKind != BodyKind::Coin || !contact.otherId) {
        return ReduceOutcome::NoReaction;
    }
    auto otherType = coins.typeOf(*contact.otherId);
    if (!otherType || *otherType != Rules::transmuteRule().base) {
        return ReduceOutcome::NoReaction;
    }
    return queued(transmuteQueue.push(*contact.otherId, TransmuteEvent{*contact.otherId}));
}

ReduceOutcome CollisionReducer::reduceExplosion(const CoinData &self, const ContactNotification &contact) {
    double const speedSq = contact.relativeVelocity.lengthSquared();
    if (speedSq <= reactionConfig.explosionImpactSpeedSq) {
        return ReduceOutcome::NoReaction;
    }
    COINPUSHER_DEBUG_MSG(COINPUSHER_DEBUG_LEVEL_VERBOSE,
        "[Reducer] bomb " << self.id << " impact speed^2=" << speedSq << "\n");
    return queued(explosionQueue.push(self.id, ExplosionEvent{self.id}));
}

TickEvents CollisionReducer::drainTick() {
    TickEvents events;
    events.combines = combineQueue.drain();
    events.splits = splitQueue.drain();
    events.transmutes = transmuteQueue.drain();
    events.explosions = explosionQueue.drain();
    return events;
}

void CollisionReducer::clear() {
    combineQueue.clear();
    splitQueue.clear();
    transmuteQueue.clear();
    explosionQueue.clear();
}

std::size_t CollisionReducer::pendingCount() const {
    return combineQueue.size() + splitQueue.size() + transmuteQueue.size() + explosionQueue.size();
}

} // namespace Systems
