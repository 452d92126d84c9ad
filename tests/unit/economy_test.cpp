#include <gtest/gtest.h>

#include "coinpusher/core/constants.hpp"
#include "coinpusher/game/economy.hpp"

class EconomyTest : public ::testing::Test {
protected:
    GameConfig config = GameConstants::defaultConfig();
    GameState state;
    PendingEffects effects;

    void SetUp() override {
        state = Economy::initialState(config.economy);
        ASSERT_TRUE(Economy::startGame(state, config.economy));
    }

    void enterShop(std::int64_t cash) {
        state.score = state.targetScore;
        ASSERT_EQ(Economy::endRound(state), GamePhase::Shop);
        state.cash = cash;
    }

    void tick(double dt, bool active = true) {
        Economy::advanceClock(state, dt, active, config.economy);
    }
};

TEST_F(EconomyTest, FreshRun) {
    EXPECT_EQ(state.phase, GamePhase::Playing);
    EXPECT_EQ(state.cash, 100);
    EXPECT_EQ(state.score, 0);
    EXPECT_EQ(state.targetScore, 2000);
    EXPECT_EQ(state.ante, 1);
    EXPECT_EQ(state.bonusLevel, 1);
    EXPECT_EQ(state.deck.count(CoinType::Standard), 30);
    EXPECT_EQ(state.deck.total(), 39);
    EXPECT_TRUE(state.artifacts.empty());

    EXPECT_FALSE(Economy::startGame(state, config.economy));
}

TEST_F(EconomyTest, CollectingStandardCoin) {
    auto result = Economy::collect(state, CoinType::Standard, config, effects);

    EXPECT_TRUE(result.applied);
    EXPECT_EQ(result.cashGained, 10);
    EXPECT_EQ(result.scoreGained, 100);
    EXPECT_FALSE(result.jackpot);
    EXPECT_EQ(state.cash, 110);
    EXPECT_EQ(state.score, 100);
    EXPECT_DOUBLE_EQ(state.bonus, 4.0);
    EXPECT_TRUE(effects.empty());
}

TEST_F(EconomyTest, CollectOutsideRoundIsIgnored) {
    state = Economy::initialState(config.economy);
    auto result = Economy::collect(state, CoinType::Gold, config, effects);

    EXPECT_FALSE(result.applied);
    EXPECT_EQ(state.cash, 100);
    EXPECT_EQ(state.score, 0);
    EXPECT_DOUBLE_EQ(state.bonus, 0.0);
}

TEST_F(EconomyTest, FullMeterTriggersOneJackpot) {
    for (int i = 0; i < 24; ++i) {
        EXPECT_FALSE(Economy::collect(state, CoinType::Standard, config, effects).jackpot);
    }
    EXPECT_DOUBLE_EQ(state.bonus, 96.0);
    EXPECT_EQ(state.bonusLevel, 1);

    auto result = Economy::collect(state, CoinType::Standard, config, effects);
    EXPECT_TRUE(result.jackpot);
    EXPECT_DOUBLE_EQ(state.bonus, 0.0);
    EXPECT_EQ(state.bonusLevel, 2);
    EXPECT_EQ(state.score, 2500);

    auto bursts = effects.drainJackpots();
    ASSERT_EQ(bursts.size(), 1u);
    EXPECT_EQ(bursts[0].bonusLevel, 2);

    // Level 2 scores with a 1.1 bonus multiplier
    EXPECT_EQ(Economy::collect(state, CoinType::Standard, config, effects).scoreGained, 110);
}

TEST_F(EconomyTest, BonusDecaysAfterGracePeriod) {
    Economy::collect(state, CoinType::Standard, config, effects);
    state.bonusLevel = 3;

    tick(1.0);
    tick(1.0);
    EXPECT_DOUBLE_EQ(state.bonus, 4.0);

    tick(0.1);
    EXPECT_NEAR(state.bonus, 2.0, 1e-9);
    EXPECT_EQ(state.bonusLevel, 3);

    tick(1.0);
    EXPECT_DOUBLE_EQ(state.bonus, 0.0);
    EXPECT_EQ(state.bonusLevel, 1);
}

TEST_F(EconomyTest, LongStepOnlyDecaysPastGrace) {
    for (int i = 0; i < 20; ++i) {
        Economy::collect(state, CoinType::Standard, config, effects);
    }
    EXPECT_DOUBLE_EQ(state.bonus, 80.0);

    // 2 s of grace then 1 s of decay at 20/s
    tick(3.0);
    EXPECT_NEAR(state.bonus, 60.0, 1e-9);
}

TEST_F(EconomyTest, InactiveSessionPausesDecayWithoutCatchUp) {
    for (int i = 0; i < 10; ++i) {
        Economy::collect(state, CoinType::Standard, config, effects);
    }
    tick(10.0, false);
    EXPECT_DOUBLE_EQ(state.bonus, 40.0);

    tick(0.5);
    EXPECT_NEAR(state.bonus, 30.0, 1e-9);
}

TEST_F(EconomyTest, MeetingTargetOpensShop) {
    state.score = 2000;
    state.bonus = 50.0;
    state.bonusLevel = 4;

    EXPECT_EQ(Economy::endRound(state), GamePhase::Shop);
    EXPECT_EQ(state.score, 0);
    EXPECT_DOUBLE_EQ(state.bonus, 0.0);
    EXPECT_EQ(state.bonusLevel, 1);
    EXPECT_EQ(state.cash, 100);
}

TEST_F(EconomyTest, MissingTargetEndsRun) {
    state.score = 1999;
    EXPECT_EQ(Economy::endRound(state), GamePhase::GameOver);
    EXPECT_FALSE(Economy::endRound(state).has_value());

    EXPECT_TRUE(Economy::restart(state, config.economy));
    EXPECT_EQ(state.phase, GamePhase::Menu);
    EXPECT_EQ(state.cash, 100);
    EXPECT_FALSE(Economy::restart(state, config.economy));
}

TEST_F(EconomyTest, NextRoundRaisesTarget) {
    enterShop(100);
    EXPECT_TRUE(Economy::nextRound(state, config.economy));
    EXPECT_EQ(state.phase, GamePhase::Playing);
    EXPECT_EQ(state.ante, 2);
    EXPECT_EQ(state.targetScore, 3000);

    EXPECT_FALSE(Economy::nextRound(state, config.economy));

    enterShop(100);
    EXPECT_TRUE(Economy::nextRound(state, config.economy));
    EXPECT_EQ(state.targetScore, 4500);
}

TEST_F(EconomyTest, ArtifactCostsGrowPerLevel) {
    enterShop(10000);

    EXPECT_EQ(Economy::nextArtifactCost(state, ArtifactCatalog::Mult, config.economy), 800);
    EXPECT_TRUE(Economy::purchaseArtifact(state, ArtifactCatalog::Mult, config.economy));
    EXPECT_EQ(state.cash, 9200);
    EXPECT_EQ(state.artifactLevel(ArtifactCatalog::Mult), 1);

    EXPECT_EQ(Economy::nextArtifactCost(state, ArtifactCatalog::Mult, config.economy), 1200);
    EXPECT_TRUE(Economy::purchaseArtifact(state, ArtifactCatalog::Mult, config.economy));
    EXPECT_EQ(state.cash, 8000);
    EXPECT_EQ(state.artifactLevel(ArtifactCatalog::Mult), 2);
    ASSERT_EQ(state.artifacts.size(), 1u);

    EXPECT_EQ(Economy::nextArtifactCost(state, ArtifactCatalog::Mult, config.economy), 1800);
    EXPECT_DOUBLE_EQ(Economy::scoreMultiplier(state, config.economy), 2.25);
}

TEST_F(EconomyTest, UnaffordableOrUnknownPurchaseChangesNothing) {
    enterShop(100);

    EXPECT_FALSE(Economy::purchaseArtifact(state, ArtifactCatalog::Extender, config.economy));
    EXPECT_FALSE(Economy::purchaseArtifact(state, "warp-drive", config.economy));
    EXPECT_FALSE(Economy::nextArtifactCost(state, "warp-drive", config.economy).has_value());
    EXPECT_FALSE(Economy::purchaseCoins(state, CoinType::Gold, config.economy));
    EXPECT_EQ(state.cash, 100);
    EXPECT_TRUE(state.artifacts.empty());
}

TEST_F(EconomyTest, CoinPackAddsToDeck) {
    EXPECT_FALSE(Economy::purchaseCoins(state, CoinType::Seed, config.economy));

    enterShop(100);
    EXPECT_TRUE(Economy::purchaseCoins(state, CoinType::Seed, config.economy));
    EXPECT_EQ(state.cash, 60);
    EXPECT_EQ(state.deck.count(CoinType::Seed), 8);
}

TEST_F(EconomyTest, MultiplierRaisesCollectedScore) {
    state.artifacts.push_back(OwnedArtifact{ArtifactCatalog::Mult, 2});
    auto result = Economy::collect(state, CoinType::Standard, config, effects);
    EXPECT_EQ(result.scoreGained, 225);
}

TEST_F(EconomyTest, JackpotSizeIsCappedByBedWidth) {
    EXPECT_EQ(Economy::jackpotCoinCount(1, 0, config), 10);
    EXPECT_EQ(Economy::jackpotCoinCount(2, 0, config), 11);
    EXPECT_EQ(Economy::jackpotCoinCount(20, 0, config), 12);
    EXPECT_EQ(Economy::jackpotCoinCount(20, 1, config), 17);
    EXPECT_EQ(Economy::jackpotCoinCount(20, 2, config), 22);
}

TEST_F(EconomyTest, MachineUpgrades) {
    EXPECT_DOUBLE_EQ(Machine::bedWidth(0, config.machine), 10.0);
    EXPECT_DOUBLE_EQ(Machine::bedWidth(2, config.machine), 18.0);
    EXPECT_DOUBLE_EQ(Machine::dropWidth(1, config.machine), 12.0);
    EXPECT_DOUBLE_EQ(Machine::coinDamping(0, config.machine), 2.0);
    EXPECT_DOUBLE_EQ(Machine::coinDamping(1, config.machine), 4.0);
}

TEST(DeckTest, TakeStopsAtZero) {
    Deck deck;
    EXPECT_FALSE(deck.take(CoinType::Bomb));
    deck.add(CoinType::Bomb, 1);
    EXPECT_TRUE(deck.take(CoinType::Bomb));
    EXPECT_FALSE(deck.take(CoinType::Bomb));
    deck.add(CoinType::Bomb, -3);
    EXPECT_EQ(deck.count(CoinType::Bomb), 0);
}
