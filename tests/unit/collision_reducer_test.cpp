#include <gtest/gtest.h>

#include "coinpusher/entities/coin_registry.hpp"
#include "coinpusher/systems/collision_reducer.hpp"

using Systems::CollisionReducer;
using Systems::ReduceOutcome;

class CollisionReducerTest : public ::testing::Test {
protected:
    CoinRegistry coins;
    CollisionReducer reducer;

    CoinId spawn(CoinType type, bool hasSplit = false) {
        return coins.spawn(type, Vector3(), Vector3(), hasSplit);
    }

    static ContactNotification coinContact(CoinId self, CoinId other,
                                           const Vector3 &relVel = Vector3()) {
        return ContactNotification{self, BodyKind::Coin, other, relVel, std::nullopt};
    }

    static ContactNotification fixtureContact(CoinId self, BodyKind kind,
                                              const Vector3 &relVel = Vector3(),
                                              std::optional<Vector3> point = std::nullopt) {
        return ContactNotification{self, kind, std::nullopt, relVel, point};
    }
};

TEST_F(CollisionReducerTest, MirroredCombineCallbacksQueueOnePair) {
    CoinId seed = spawn(CoinType::Seed);
    CoinId water = spawn(CoinType::Water);

    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(seed, water)), ReduceOutcome::Enqueued);
    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(water, seed)), ReduceOutcome::NoReaction);

    TickEvents events = reducer.drainTick();
    ASSERT_EQ(events.combines.size(), 1u);
    EXPECT_EQ(events.combines[0].first, seed);
    EXPECT_EQ(events.combines[0].second, water);
    EXPECT_EQ(events.combines[0].product, CoinType::Tree);
}

TEST_F(CollisionReducerTest, HigherIdSideStillQueuesWhenItIsTheLowerId) {
    CoinId ice = spawn(CoinType::Ice);
    CoinId magma = spawn(CoinType::Magma);

    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(magma, ice)), ReduceOutcome::NoReaction);
    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(ice, magma)), ReduceOutcome::Enqueued);

    TickEvents events = reducer.drainTick();
    ASSERT_EQ(events.combines.size(), 1u);
    EXPECT_EQ(events.combines[0].product, CoinType::Obsidian);
}

TEST_F(CollisionReducerTest, RepeatedContactWithinTickIsDuplicate) {
    CoinId key = spawn(CoinType::Key);
    CoinId chest = spawn(CoinType::Chest);

    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(key, chest)), ReduceOutcome::Enqueued);
    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(key, chest)), ReduceOutcome::Duplicate);
    EXPECT_EQ(reducer.pendingCount(), 1u);

    reducer.drainTick();
    EXPECT_EQ(reducer.pendingCount(), 0u);
    // A new tick starts with fresh dedup sets
    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(key, chest)), ReduceOutcome::Enqueued);
}

TEST_F(CollisionReducerTest, MismatchedReactivePairsDoNothing) {
    CoinId seed = spawn(CoinType::Seed);
    CoinId magma = spawn(CoinType::Magma);
    CoinId standard = spawn(CoinType::Standard);

    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(seed, magma)), ReduceOutcome::NoReaction);
    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(seed, standard)), ReduceOutcome::NoReaction);
    EXPECT_EQ(reducer.onContactBegin(coins, fixtureContact(seed, BodyKind::Pusher)), ReduceOutcome::NoReaction);
    EXPECT_TRUE(reducer.drainTick().empty());
}

TEST_F(CollisionReducerTest, InertOrMissingSelfIsRejected) {
    CoinId standard = spawn(CoinType::Standard);
    CoinId heavy = spawn(CoinType::Heavy);

    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(standard, heavy)), ReduceOutcome::Rejected);
    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(heavy, standard)), ReduceOutcome::Rejected);
    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(999, standard)), ReduceOutcome::Rejected);
}

TEST_F(CollisionReducerTest, SplitterNeedsPusherAndContactPoint) {
    CoinId splitter = spawn(CoinType::Splitter);
    CoinId other = spawn(CoinType::Standard);

    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(splitter, other)), ReduceOutcome::NoReaction);
    EXPECT_EQ(reducer.onContactBegin(coins, fixtureContact(splitter, BodyKind::Static, Vector3(), Vector3())),
              ReduceOutcome::NoReaction);
    EXPECT_EQ(reducer.onContactBegin(coins, fixtureContact(splitter, BodyKind::Pusher)), ReduceOutcome::NoReaction);

    Vector3 point(1.0, 0.5, -2.0);
    EXPECT_EQ(reducer.onContactBegin(coins, fixtureContact(splitter, BodyKind::Pusher, Vector3(), point)),
              ReduceOutcome::Enqueued);
    EXPECT_EQ(reducer.onContactBegin(coins, fixtureContact(splitter, BodyKind::Pusher, Vector3(), point)),
              ReduceOutcome::Duplicate);

    TickEvents events = reducer.drainTick();
    ASSERT_EQ(events.splits.size(), 1u);
    EXPECT_EQ(events.splits[0].source, splitter);
    EXPECT_DOUBLE_EQ(events.splits[0].spawnPoint.x, 1.0);
    EXPECT_DOUBLE_EQ(events.splits[0].spawnPoint.y, 1.5);
    EXPECT_DOUBLE_EQ(events.splits[0].spawnPoint.z, -2.0);
}

TEST_F(CollisionReducerTest, SpentSplitterNeverQueues) {
    CoinId clone = spawn(CoinType::Splitter, true);
    auto contact = fixtureContact(clone, BodyKind::Pusher, Vector3(), Vector3(0.0, 0.0, 0.0));
    EXPECT_EQ(reducer.onContactBegin(coins, contact), ReduceOutcome::NoReaction);
}

TEST_F(CollisionReducerTest, TransmuteIsKeyedByTarget) {
    CoinId goldA = spawn(CoinType::Gold);
    CoinId goldB = spawn(CoinType::Gold);
    CoinId standard = spawn(CoinType::Standard);
    CoinId heavy = spawn(CoinType::Heavy);

    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(goldA, standard)), ReduceOutcome::Enqueued);
    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(goldB, standard)), ReduceOutcome::Duplicate);
    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(goldA, heavy)), ReduceOutcome::NoReaction);
    EXPECT_EQ(reducer.onContactBegin(coins, coinContact(goldA, goldB)), ReduceOutcome::NoReaction);

    TickEvents events = reducer.drainTick();
    ASSERT_EQ(events.transmutes.size(), 1u);
    EXPECT_EQ(events.transmutes[0].target, standard);
}

TEST_F(CollisionReducerTest, BombNeedsStrictlyFasterImpact) {
    CoinId bomb = spawn(CoinType::Bomb);

    // speed^2 == 25 is not enough
    EXPECT_EQ(reducer.onContactBegin(coins, fixtureContact(bomb, BodyKind::Static, Vector3(3.0, 4.0, 0.0))),
              ReduceOutcome::NoReaction);
    EXPECT_EQ(reducer.onContactBegin(coins, fixtureContact(bomb, BodyKind::Static, Vector3(0.0, -5.1, 0.0))),
              ReduceOutcome::Enqueued);
    EXPECT_EQ(reducer.onContactBegin(coins, fixtureContact(bomb, BodyKind::Pusher, Vector3(0.0, -9.0, 0.0))),
              ReduceOutcome::Duplicate);

    TickEvents events = reducer.drainTick();
    ASSERT_EQ(events.explosions.size(), 1u);
    EXPECT_EQ(events.explosions[0].bomb, bomb);
}

TEST_F(CollisionReducerTest, ClearDropsPendingEvents) {
    CoinId bomb = spawn(CoinType::Bomb);
    reducer.onContactBegin(coins, fixtureContact(bomb, BodyKind::Static, Vector3(10.0, 0.0, 0.0)));
    EXPECT_EQ(reducer.pendingCount(), 1u);

    reducer.clear();
    EXPECT_EQ(reducer.pendingCount(), 0u);
    EXPECT_TRUE(reducer.drainTick().empty());
}
