/**
 * @file game_session.cpp
 * @brief Implementation of GameSession.
 */

#include "coinpusher/core/game_session.hpp"

#include "coinpusher/core/debug.hpp"
#include "coinpusher/rules/interaction_rules.hpp"

GameSession::GameSession(IPhysicsWorld &world, const GameConfig &config, unsigned int seed)
    : gameConfig(config)
    , gameState(Economy::initialState(config.economy))
    , reducer(config.reactions)
    , processor(world, bodies, config.explosion)
    , rng(seed)
    , timeScale(1.0)
    , sessionActive(true)
{
    validateConfig(gameConfig);
    CoinCatalog::validateCatalog();
    Rules::validateRuleTable();

    CoinEventHooks internal;
    internal.onSpawn = [this](const CoinData &coin) { recordSpawn(coin); };
    internal.onRemove = [this](CoinId id) { recordRemove(id); };
    internal.onMutate = [this](CoinId id, CoinType type) {
        bodies.updateCoinType(id, type);
        recordMutate(id, type);
    };
    processor.setHooks(internal);
}

bool GameSession::startGame() {
    if (!Economy::startGame(gameState, gameConfig.economy)) {
        return false;
    }
    clearBoard();
    fillBed();
    COINPUSHER_DEBUG_MSG(COINPUSHER_DEBUG_LEVEL_BASIC,
        "GameSession::startGame() filled " << registry.size() << " coins\n");
    return true;
}

bool GameSession::restart() {
    if (!Economy::restart(gameState, gameConfig.economy)) {
        return false;
    }
    clearBoard();
    return true;
}

std::optional<GamePhase> GameSession::endRound() {
    auto phase = Economy::endRound(gameState);
    if (phase) {
        COINPUSHER_DEBUG_MSG(COINPUSHER_DEBUG_LEVEL_BASIC,
            "GameSession::endRound() -> " << phaseName(*phase) << "\n");
    }
    return phase;
}

bool GameSession::nextRound() {
    return Economy::nextRound(gameState, gameConfig.economy);
}

std::optional<CoinId> GameSession::dropCoin(CoinType type) {
    if (gameState.phase != GamePhase::Playing) {
        return std::nullopt;
    }
    if (!gameState.deck.take(type)) {
        return std::nullopt;
    }
    return spawnCoin(type, randomDropPoint(), randomYaw(), false);
}

bool GameSession::buyCoins(CoinType type) {
    return Economy::purchaseCoins(gameState, type, gameConfig.economy);
}

bool GameSession::buyArtifact(const std::string &id) {
    return Economy::purchaseArtifact(gameState, id, gameConfig.economy);
}

bool GameSession::attachCoinBody(BodyHandle handle, CoinId id) {
    auto type = registry.typeOf(id);
    if (!type) {
        return false;
    }
    bodies.attachCoin(handle, id, *type);
    return true;
}

void GameSession::attachFixtureBody(BodyHandle handle, BodyKind kind) {
    bodies.attachFixture(handle, kind);
}

void GameSession::detachBody(BodyHandle handle) {
    bodies.detach(handle);
}

Systems::ReduceOutcome GameSession::onContactBegin(BodyHandle self,
                                                   BodyHandle other,
                                                   const Vector3 &relativeVelocity,
                                                   const std::optional<Vector3> &contactPoint)
{
    auto selfInfo = bodies.lookup(self);
    if (!selfInfo) {
        COINPUSHER_WARN("contact from unknown body handle " << self);
        return Systems::ReduceOutcome::Rejected;
    }
    if (selfInfo->kind != BodyKind::Coin || !selfInfo->coinId) {
        return Systems::ReduceOutcome::Rejected;
    }
    auto otherInfo = bodies.lookup(other);
    if (!otherInfo) {
        COINPUSHER_WARN("contact with unknown body handle " << other);
        return Systems::ReduceOutcome::Rejected;
    }

    ContactNotification contact;
    contact.selfId = *selfInfo->coinId;
    contact.otherKind = otherInfo->kind;
    contact.otherId = otherInfo->coinId;
    contact.relativeVelocity = relativeVelocity;
    contact.contactPoint = contactPoint;
    return reducer.onContactBegin(registry, contact);
}

Economy::CollectResult GameSession::onSensorEnter(BodyHandle handle) {
    auto info = bodies.lookup(handle);
    if (!info) {
        COINPUSHER_WARN("sensor hit by unknown body handle " << handle);
        return Economy::CollectResult{};
    }
    if (info->kind != BodyKind::Coin || !info->coinId) {
        COINPUSHER_WARN("sensor hit by non-coin body " << handle);
        return Economy::CollectResult{};
    }

    // A repeat hit for a coin already collected is a no-op
    auto type = registry.typeOf(*info->coinId);
    if (!type) {
        return Economy::CollectResult{};
    }

    removeCoin(*info->coinId);
    auto result = Economy::collect(gameState, *type, gameConfig, effects);
    runPendingEffects();
    return result;
}

bool GameSession::syncTransform(CoinId id, const Vector3 &position, const Vector3 &rotation) {
    return registry.updateTransform(id, position, rotation);
}

ReactionStats GameSession::tick(double frameSeconds) {
    Economy::advanceClock(gameState, frameSeconds * timeScale, sessionActive, gameConfig.economy);
    ReactionStats stats = processor.drain(registry, reducer);
    runPendingEffects();
    return stats;
}

void GameSession::setTimeScale(double scale) {
    if (scale <= 0.0) {
        COINPUSHER_WARN("ignoring non-positive time scale " << scale);
        return;
    }
    timeScale = scale;
}

std::vector<CoinNotification> GameSession::takeNotifications() {
    std::vector<CoinNotification> out;
    out.swap(notifications);
    return out;
}

CoinBodyProperties GameSession::bodyPropertiesFor(CoinType type) const {
    const CoinSpec &spec = CoinCatalog::spec(type);
    double const damping = Machine::coinDamping(gameState.artifactLevel(ArtifactCatalog::Magnet), gameConfig.machine);
    return CoinBodyProperties{spec.mass, spec.friction, spec.restitution, damping, damping, spec.visualScale};
}

double GameSession::currentBedWidth() const {
    return Machine::bedWidth(gameState.artifactLevel(ArtifactCatalog::Extender), gameConfig.machine);
}

CoinId GameSession::spawnCoin(CoinType type, const Vector3 &position, const Vector3 &rotation, bool isBonus) {
    CoinId const id = registry.spawn(type, position, rotation, false, isBonus);
    if (auto coin = registry.find(id)) {
        recordSpawn(*coin);
    }
    return id;
}

void GameSession::removeCoin(CoinId id) {
    if (registry.remove(id)) {
        recordRemove(id);
    }
}

void GameSession::clearBoard() {
    // Copy: removeCoin edits the ordered list
    std::vector<CoinId> const ids = registry.orderedIds();
    for (CoinId id : ids) {
        removeCoin(id);
    }
    reducer.clear();
    effects.clear();
}

void GameSession::fillBed() {
    const MachineConfig &m = gameConfig.machine;
    std::uniform_real_distribution<double> xDist(-m.fillHalfWidth, m.fillHalfWidth);
    std::uniform_real_distribution<double> yDist(m.fillHeightMin, m.fillHeightMin + m.fillHeightRange);
    std::uniform_real_distribution<double> zDist(0.0, m.fillDepth);

    for (int i = 0; i < m.initialFillCount; ++i) {
        Vector3 const position(xDist(rng), yDist(rng), zDist(rng));
        spawnCoin(CoinType::Standard, position, randomYaw(), false);
    }
}

void GameSession::runPendingEffects() {
    for (const auto &burst : effects.drainJackpots()) {
        spawnJackpot(burst);
    }
}

void GameSession::spawnJackpot(const JackpotBurst &burst) {
    int const extender = gameState.artifactLevel(ArtifactCatalog::Extender);
    int const count = Economy::jackpotCoinCount(burst.bonusLevel, extender, gameConfig);
    for (int i = 0; i < count; ++i) {
        spawnCoin(CoinType::Standard, randomDropPoint(), randomYaw(), true);
    }
    COINPUSHER_DEBUG_MSG(COINPUSHER_DEBUG_LEVEL_BASIC,
        "[Jackpot] level " << burst.bonusLevel << " spawned " << count << " coins\n");
}

Vector3 GameSession::randomDropPoint() {
    const MachineConfig &m = gameConfig.machine;
    double const width = Machine::dropWidth(gameState.artifactLevel(ArtifactCatalog::Extender), m);
    std::uniform_real_distribution<double> xDist(-0.5 * width, 0.5 * width);
    std::uniform_real_distribution<double> yDist(m.dropHeightMin, m.dropHeightMin + m.dropHeightRange);
    std::uniform_real_distribution<double> zDist(-0.5 * m.dropDepth, 0.5 * m.dropDepth);
    double const x = xDist(rng);
    double const y = yDist(rng);
    double const z = zDist(rng);
    return Vector3(x, y, z);
}

Vector3 GameSession::randomYaw() {
    std::uniform_real_distribution<double> yawDist(0.0, 2.0 * GameConstants::Pi);
    return Vector3(0.0, yawDist(rng), 0.0);
}

void GameSession::recordSpawn(const CoinData &coin) {
    notifications.push_back({CoinNotification::Kind::Spawned, coin.id, coin.type});
    if (userHooks.onSpawn) {
        userHooks.onSpawn(coin);
    }
}

void GameSession::recordRemove(CoinId id) {
    notifications.push_back({CoinNotification::Kind::Removed, id, std::nullopt});
    if (userHooks.onRemove) {
        userHooks.onRemove(id);
    }
}

void GameSession::recordMutate(CoinId id, CoinType type) {
    notifications.push_back({CoinNotification::Kind::Mutated, id, type});
    if (userHooks.onMutate) {
        userHooks.onMutate(id, type);
    }
}
