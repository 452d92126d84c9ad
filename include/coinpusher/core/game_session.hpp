/**
 * @file game_session.hpp
 * @brief Owns one play session and bridges it to the physics collaborator.
 */

#pragma once

#include <optional>
#include <random>
#include <string>
#include <vector>

#include "coinpusher/core/constants.hpp"
#include "coinpusher/entities/body_table.hpp"
#include "coinpusher/entities/coin_registry.hpp"
#include "coinpusher/game/economy.hpp"
#include "coinpusher/game/pending_effects.hpp"
#include "coinpusher/systems/collision_reducer.hpp"
#include "coinpusher/systems/event_batch_processor.hpp"
#include "coinpusher/systems/i_physics_world.hpp"

/**
 * @struct CoinNotification
 * @brief One-shot change record for animation and audio.
 */
struct CoinNotification {
    enum class Kind {
        Spawned,
        Removed,
        Mutated
    };

    Kind kind;
    CoinId id;
    std::optional<CoinType> type;   ///< New type for Spawned and Mutated
};

/**
 * @struct CoinBodyProperties
 * @brief What the physics layer needs to build a coin body.
 */
struct CoinBodyProperties {
    double mass;
    double friction;
    double restitution;
    double linearDamping;
    double angularDamping;
    double visualScale;
};

/**
 * @class GameSession
 * @brief Main controller: coin registry, reactions, economy and effects.
 *
 * All calls happen on the game-logic thread. Contact and sensor callbacks
 * only queue work or touch the economy; registry reactions are applied in
 * tick().
 */
class GameSession {
public:
    explicit GameSession(IPhysicsWorld &world,
                         const GameConfig &config = GameConstants::defaultConfig(),
                         unsigned int seed = 5489u);

    GameSession(const GameSession &) = delete;
    GameSession &operator=(const GameSession &) = delete;

    /**
     * @brief MENU -> PLAYING, clears the bed and pre-fills it.
     */
    bool startGame();

    /**
     * @brief GAME_OVER -> MENU, clears the bed.
     */
    bool restart();

    /**
     * @brief Ends the round; see Economy::endRound.
     */
    std::optional<GamePhase> endRound();

    /**
     * @brief SHOP -> PLAYING for the next ante.
     */
    bool nextRound();

    /**
     * @brief Drops one coin from the deck into the machine.
     * @return Id of the new coin, or nullopt if not playing or none left
     */
    std::optional<CoinId> dropCoin(CoinType type);

    bool buyCoins(CoinType type);
    bool buyArtifact(const std::string &id);

    // --- physics bridge ---------------------------------------------------

    /**
     * @brief Registers the body created for a coin.
     */
    bool attachCoinBody(BodyHandle handle, CoinId id);

    void attachFixtureBody(BodyHandle handle, BodyKind kind);

    void detachBody(BodyHandle handle);

    /**
     * @brief Raw contact callback, reported from the self body's side.
     */
    Systems::ReduceOutcome onContactBegin(BodyHandle self,
                                          BodyHandle other,
                                          const Vector3 &relativeVelocity,
                                          const std::optional<Vector3> &contactPoint);

    /**
     * @brief A body entered the collection zone below the bed.
     */
    Economy::CollectResult onSensorEnter(BodyHandle handle);

    /**
     * @brief Mirrors a live body transform into the registry.
     */
    bool syncTransform(CoinId id, const Vector3 &position, const Vector3 &rotation);

    /**
     * @brief Per-frame step, after the physics world has advanced.
     * @param frameSeconds Real frame time; scaled by the time scale
     */
    ReactionStats tick(double frameSeconds);

    void setTimeScale(double scale);
    double getTimeScale() const { return timeScale; }

    void setSessionActive(bool active) { sessionActive = active; }
    bool isSessionActive() const { return sessionActive; }

    // --- views ------------------------------------------------------------

    std::vector<CoinData> activeCoins() const { return registry.snapshot(); }

    /**
     * @brief Returns and clears notifications gathered since the last call.
     */
    std::vector<CoinNotification> takeNotifications();

    /**
     * @brief Extra listeners, called as changes happen.
     */
    void setHooks(const CoinEventHooks &hooks) { userHooks = hooks; }

    CoinBodyProperties bodyPropertiesFor(CoinType type) const;
    double currentBedWidth() const;

    const GameState &getState() const { return gameState; }
    const CoinRegistry &getCoins() const { return registry; }
    const BodyTable &getBodies() const { return bodies; }
    const GameConfig &getConfig() const { return gameConfig; }
    std::size_t pendingEventCount() const { return reducer.pendingCount(); }

private:
    CoinId spawnCoin(CoinType type, const Vector3 &position, const Vector3 &rotation, bool isBonus);
    void removeCoin(CoinId id);
    void clearBoard();
    void fillBed();
    void runPendingEffects();
    void spawnJackpot(const JackpotBurst &burst);

    Vector3 randomDropPoint();
    Vector3 randomYaw();

    void recordSpawn(const CoinData &coin);
    void recordRemove(CoinId id);
    void recordMutate(CoinId id, CoinType type);

    GameConfig gameConfig;
    GameState gameState;
    CoinRegistry registry;
    BodyTable bodies;
    Systems::CollisionReducer reducer;
    Systems::EventBatchProcessor processor;
    PendingEffects effects;

    std::mt19937 rng;
    double timeScale;
    bool sessionActive;

    CoinEventHooks userHooks;
    std::vector<CoinNotification> notifications;
};
