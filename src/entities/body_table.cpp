#include "coinpusher/entities/body_table.hpp"

void BodyTable::attachCoin(BodyHandle handle, CoinId id, CoinType type) {
    detach(handle);
    BodyInfo info;
    info.kind = BodyKind::Coin;
    info.coinId = id;
    info.coinType = type;
    bodies[handle] = info;
    coinBodies[id] = handle;
}

void BodyTable::attachFixture(BodyHandle handle, BodyKind kind) {
    detach(handle);
    BodyInfo info;
    info.kind = kind;
    bodies[handle] = info;
}

bool BodyTable::detach(BodyHandle handle) {
    auto it = bodies.find(handle);
    if (it == bodies.end()) {
        return false;
    }
    if (it->second.coinId) {
        auto coinIt = coinBodies.find(*it->second.coinId);
        if (coinIt != coinBodies.end() && coinIt->second == handle) {
            coinBodies.erase(coinIt);
        }
    }
    bodies.erase(it);
    return true;
}

std::optional<BodyInfo> BodyTable::lookup(BodyHandle handle) const {
    auto it = bodies.find(handle);
    if (it == bodies.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<BodyHandle> BodyTable::handleOf(CoinId id) const {
    auto it = coinBodies.find(id);
    if (it == coinBodies.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool BodyTable::updateCoinType(CoinId id, CoinType type) {
    auto handle = handleOf(id);
    if (!handle) {
        return false;
    }
    bodies[*handle].coinType = type;
    return true;
}

void BodyTable::clear() {
    bodies.clear();
    coinBodies.clear();
}
