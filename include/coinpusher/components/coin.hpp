#ifndef COINPUSHER_COMPONENTS_COIN_HPP
#define COINPUSHER_COMPONENTS_COIN_HPP

#include <cstdint>
#include "coinpusher/math/vector_math.hpp"
#include "coinpusher/rules/coin_catalog.hpp"

/**
 * @brief Globally unique coin identity. Never reused within a session.
 */
using CoinId = std::uint64_t;

namespace Components {

    using Position = ::Vector3;

    // Euler angles; only y carries meaning for a coin lying flat
    struct Rotation {
        Vector3 euler;
    };

    struct CoinIdentity {
        CoinId id = 0;
    };

    struct CoinKind {
        CoinType type = CoinType::Standard;
    };

    // Latched the first time a splitter clones itself
    struct SplitState {
        bool hasSplit = false;
    };

    // Reserved for the render collaborator
    struct Activity {
        bool isActive = true;
    };

    // Tag: spawned by a jackpot burst
    struct BonusCoin {};

} // namespace Components

/**
 * @struct CoinData
 * @brief Flat copy of one coin, handed to collaborators.
 */
struct CoinData {
    CoinId id = 0;
    CoinType type = CoinType::Standard;
    Vector3 position;
    Vector3 rotation;
    bool hasSplit = false;
    bool isActive = true;
    bool isBonus = false;
};

#endif
