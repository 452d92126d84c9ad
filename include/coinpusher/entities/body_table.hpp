/**
 * @file body_table.hpp
 * @brief Side table from physics body handles to game identities
 *
 * Filled when the physics collaborator creates a body and emptied when it
 * destroys one, so collision handling never has to recover identity from
 * anything but a handle lookup.
 */

#ifndef COINPUSHER_BODY_TABLE_HPP
#define COINPUSHER_BODY_TABLE_HPP

#include <optional>
#include <unordered_map>

#include "coinpusher/components/coin.hpp"
#include "coinpusher/systems/i_physics_world.hpp"

enum class BodyKind {
    Coin,
    Pusher,
    Sensor,
    Static
};

struct BodyInfo {
    BodyKind kind = BodyKind::Static;
    std::optional<CoinId> coinId;
    std::optional<CoinType> coinType;
};

class BodyTable {
public:
    /**
     * @brief Binds a coin body. Rebinding a handle replaces the old entry.
     */
    void attachCoin(BodyHandle handle, CoinId id, CoinType type);

    /**
     * @brief Binds a machine body (pusher, sensor, walls).
     */
    void attachFixture(BodyHandle handle, BodyKind kind);

    /**
     * @brief Forgets a handle. Returns false if it was not bound.
     */
    bool detach(BodyHandle handle);

    std::optional<BodyInfo> lookup(BodyHandle handle) const;

    /**
     * @brief Reverse lookup for a coin's body.
     */
    std::optional<BodyHandle> handleOf(CoinId id) const;

    /**
     * @brief Keeps the cached type current after an in-place transmute.
     */
    bool updateCoinType(CoinId id, CoinType type);

    void clear();

    std::size_t size() const { return bodies.size(); }

private:
    std::unordered_map<BodyHandle, BodyInfo> bodies;
    std::unordered_map<CoinId, BodyHandle> coinBodies;
};

#endif
