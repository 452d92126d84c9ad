/**
 * @file coin_registry.hpp
 * @brief Authoritative store of the coins currently in play
 *
 * Coins live as entities in an EnTT registry. The registry keeps two
 * indexes in lockstep with it:
 * - id -> entity, for O(1) lookups by coin id
 * - an insertion-ordered id list, the order the render layer draws in
 *
 * Every id in the ordered list has exactly one entity and vice versa.
 */

#ifndef COINPUSHER_COIN_REGISTRY_HPP
#define COINPUSHER_COIN_REGISTRY_HPP

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "coinpusher/components/coin.hpp"

class CoinRegistry {
public:
    CoinRegistry();

    /**
     * @brief Creates a coin under a freshly minted id.
     * @return The new id
     */
    CoinId spawn(CoinType type,
                 const Vector3 &position,
                 const Vector3 &rotation,
                 bool hasSplit = false,
                 bool isBonus = false);

    /**
     * @brief Destroys a coin. Returns false if the id is not live.
     */
    bool remove(CoinId id);

    bool contains(CoinId id) const;

    /**
     * @brief Copy of a live coin, or nullopt.
     */
    std::optional<CoinData> find(CoinId id) const;

    std::optional<CoinType> typeOf(CoinId id) const;

    /**
     * @brief Changes a coin's type in place, keeping its id.
     */
    bool setType(CoinId id, CoinType type);

    /**
     * @brief Latches the split flag. Returns false if missing or already split.
     */
    bool markSplit(CoinId id);

    /**
     * @brief Mirrors a transform reported by the physics collaborator.
     */
    bool updateTransform(CoinId id, const Vector3 &position, const Vector3 &rotation);

    /**
     * @brief Removes every coin. Ids are not recycled afterwards.
     */
    void clear();

    std::size_t size() const { return order.size(); }
    bool empty() const { return order.empty(); }

    const std::vector<CoinId> &orderedIds() const { return order; }

    /**
     * @brief All live coins in insertion order.
     */
    std::vector<CoinData> snapshot() const;

    /**
     * @brief Checks that the ordered list, the id index and the ECS agree.
     */
    bool isConsistent() const;

    entt::registry &getRegistry() { return registry; }
    const entt::registry &getRegistry() const { return registry; }

private:
    std::optional<entt::entity> entityOf(CoinId id) const;
    CoinData toCoinData(entt::entity entity) const;

    entt::registry registry;
    std::unordered_map<CoinId, entt::entity> index;
    std::vector<CoinId> order;
    CoinId nextId;
};

#endif
