/**
 * @file collision_events.hpp
 * @brief Logical reaction events and the per-tick queues that deduplicate them
 *
 * A physics step can report the same contact many times (both sides of a
 * pair, several sub-steps, several contact points). Each reaction is
 * queued under a natural key, and a key seen earlier in the same tick is
 * ignored, so every logical event is applied exactly once at the end of
 * the tick.
 */

#ifndef COINPUSHER_COLLISION_EVENTS_HPP
#define COINPUSHER_COLLISION_EVENTS_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

#include "coinpusher/components/coin.hpp"
#include "coinpusher/entities/body_table.hpp"

/**
 * @brief Contact as seen from one coin, after handle translation.
 */
struct ContactNotification {
    CoinId selfId = 0;
    BodyKind otherKind = BodyKind::Static;
    std::optional<CoinId> otherId;          ///< Set when the other body is a coin
    Vector3 relativeVelocity;               ///< Self velocity minus other velocity
    std::optional<Vector3> contactPoint;
};

struct CombineEvent {
    CoinId first;       ///< Smaller id of the pair
    CoinId second;
    CoinType product;
};

struct SplitEvent {
    CoinId source;
    Vector3 spawnPoint; ///< Contact point lifted by the split clearance
};

struct TransmuteEvent {
    CoinId target;
};

struct ExplosionEvent {
    CoinId bomb;
};

/**
 * @brief Dedup key of a combine reaction.
 */
struct CombineKey {
    CoinId first;
    CoinId second;
    CoinType product;

    bool operator==(const CombineKey &o) const {
        return first == o.first && second == o.second && product == o.product;
    }
};

struct CombineKeyHash {
    size_t operator()(const CombineKey &key) const {
        size_t h1 = std::hash<CoinId>{}(key.first);
        size_t h2 = std::hash<CoinId>{}(key.second);
        size_t h3 = std::hash<int>{}(static_cast<int>(key.product));
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2)) ^ (h3 << 1);
    }
};

/**
 * @class DedupQueue
 * @brief Insertion-ordered queue that accepts each key at most once per drain.
 */
template<typename Key, typename Event, typename Hash = std::hash<Key>>
class DedupQueue {
public:
    /**
     * @brief Queues an event unless its key is already pending.
     * @return true if queued, false if it was a duplicate
     */
    bool push(const Key &key, const Event &event) {
        if (!keys.insert(key).second) {
            return false;
        }
        events.push_back(event);
        return true;
    }

    bool contains(const Key &key) const {
        return keys.find(key) != keys.end();
    }

    /**
     * @brief Hands over the pending events and resets the key set.
     */
    std::vector<Event> drain() {
        std::vector<Event> out;
        out.swap(events);
        keys.clear();
        return out;
    }

    void clear() {
        events.clear();
        keys.clear();
    }

    std::size_t size() const { return events.size(); }
    bool empty() const { return events.empty(); }

private:
    std::vector<Event> events;
    std::unordered_set<Key, Hash> keys;
};

/**
 * @brief Everything queued during one tick, in drain priority order.
 */
struct TickEvents {
    std::vector<CombineEvent> combines;
    std::vector<SplitEvent> splits;
    std::vector<TransmuteEvent> transmutes;
    std::vector<ExplosionEvent> explosions;

    bool empty() const {
        return combines.empty() && splits.empty() && transmutes.empty() && explosions.empty();
    }
};

#endif
