/**
 * @file coin_registry.cpp
 * @brief Implementation of the coin entity store
 */

#include "coinpusher/entities/coin_registry.hpp"

#include <algorithm>
#include <unordered_set>

CoinRegistry::CoinRegistry()
    : nextId(1)
{
}

CoinId CoinRegistry::spawn(CoinType type,
                           const Vector3 &position,
                           const Vector3 &rotation,
                           bool hasSplit,
                           bool isBonus)
{
    CoinId const id = nextId++;

    auto entity = registry.create();
    registry.emplace<Components::CoinIdentity>(entity, Components::CoinIdentity{id});
    registry.emplace<Components::CoinKind>(entity, Components::CoinKind{type});
    registry.emplace<Components::Position>(entity, position);
    registry.emplace<Components::Rotation>(entity, Components::Rotation{rotation});
    registry.emplace<Components::SplitState>(entity, Components::SplitState{hasSplit});
    registry.emplace<Components::Activity>(entity);
    if (isBonus) {
        registry.emplace<Components::BonusCoin>(entity);
    }

    index.emplace(id, entity);
    order.push_back(id);
    return id;
}

bool CoinRegistry::remove(CoinId id) {
    auto it = index.find(id);
    if (it == index.end()) {
        return false;
    }
    registry.destroy(it->second);
    index.erase(it);
    order.erase(std::find(order.begin(), order.end(), id));
    return true;
}

bool CoinRegistry::contains(CoinId id) const {
    return index.find(id) != index.end();
}

std::optional<entt::entity> CoinRegistry::entityOf(CoinId id) const {
    auto it = index.find(id);
    if (it == index.end()) {
        return std::nullopt;
    }
    return it->second;
}

CoinData CoinRegistry::toCoinData(entt::entity entity) const {
    CoinData data;
    data.id = registry.get<Components::CoinIdentity>(entity).id;
    data.type = registry.get<Components::CoinKind>(entity).type;
    data.position = registry.get<Components::Position>(entity);
    data.rotation = registry.get<Components::Rotation>(entity).euler;
    data.hasSplit = registry.get<Components::SplitState>(entity).hasSplit;
    data.isActive = registry.get<Components::Activity>(entity).isActive;
    data.isBonus = registry.all_of<Components::BonusCoin>(entity);
    return data;
}

std::optional<CoinData> CoinRegistry::find(CoinId id) const {
    auto entity = entityOf(id);
    if (!entity) {
        return std::nullopt;
    }
    return toCoinData(*entity);
}

std::optional<CoinType> CoinRegistry::typeOf(CoinId id) const {
    auto entity = entityOf(id);
    if (!entity) {
        return std::nullopt;
    }
    return registry.get<Components::CoinKind>(*entity).type;
}

bool CoinRegistry::setType(CoinId id, CoinType type) {
    auto entity = entityOf(id);
    if (!entity) {
        return false;
    }
    registry.get<Components::CoinKind>(*entity).type = type;
    return true;
}

bool CoinRegistry::markSplit(CoinId id) {
    auto entity = entityOf(id);
    if (!entity) {
        return false;
    }
    auto &split = registry.get<Components::SplitState>(*entity);
    if (split.hasSplit) {
        return false;
    }
    split.hasSplit = true;
    return true;
}

bool CoinRegistry::updateTransform(CoinId id, const Vector3 &position, const Vector3 &rotation) {
    auto entity = entityOf(id);
    if (!entity) {
        return false;
    }
    registry.get<Components::Position>(*entity) = position;
    registry.get<Components::Rotation>(*entity).euler = rotation;
    return true;
}

void CoinRegistry::clear() {
    registry.clear();
    index.clear();
    order.clear();
}

std::vector<CoinData> CoinRegistry::snapshot() const {
    std::vector<CoinData> coins;
    coins.reserve(order.size());
    for (CoinId id : order) {
        coins.push_back(toCoinData(index.at(id)));
    }
    return coins;
}

bool CoinRegistry::isConsistent() const {
    if (order.size() != index.size()) {
        return false;
    }

    std::unordered_set<CoinId> seen;
    for (CoinId id : order) {
        if (!seen.insert(id).second) {
            return false;  // duplicate in ordered list
        }
        auto it = index.find(id);
        if (it == index.end() || !registry.valid(it->second)) {
            return false;
        }
        if (registry.get<Components::CoinIdentity>(it->second).id != id) {
            return false;
        }
    }

    // No ECS coin without an index entry
    auto view = registry.view<const Components::CoinIdentity>();
    std::size_t live = 0;
    for (auto entity : view) {
        (void)entity;
        ++live;
    }
    return live == order.size();
}
