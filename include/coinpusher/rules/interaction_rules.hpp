/**
 * @file interaction_rules.hpp
 * @brief Declarative table of coin reactions and collision classes
 *
 * Combine reactions fuse two coins into a product. Every other reaction
 * is decided by the collision class of the coin that reports the contact:
 * - Splitter: clones itself once when struck by the pusher
 * - Transmuter: turns a base coin into the terminal type in place
 * - Explosive: detonates on a hard enough impact
 */

#ifndef COINPUSHER_INTERACTION_RULES_HPP
#define COINPUSHER_INTERACTION_RULES_HPP

#include <array>
#include <cstdint>
#include <optional>

#include "coinpusher/rules/coin_catalog.hpp"

namespace Rules {

/**
 * @brief One row of the combine table. Order of a and b is irrelevant.
 */
struct CombineRule {
    CoinType a;
    CoinType b;
    CoinType product;
};

/**
 * @brief Bit flags describing which reactions a coin type takes part in.
 */
enum CollisionClass : std::uint8_t {
    CLASS_NONE       = 0,
    CLASS_REACTIVE   = 1 << 0,
    CLASS_SPLITTER   = 1 << 1,
    CLASS_TRANSMUTER = 1 << 2,
    CLASS_EXPLOSIVE  = 1 << 3,
};

/**
 * @brief Catalyst, target and result of the transmute reaction.
 */
struct TransmuteRule {
    CoinType catalyst;
    CoinType base;
    CoinType terminal;
};

/**
 * @brief The declared combine reactions.
 */
const std::array<CombineRule, 3> &combineRules();

/**
 * @brief The declared transmute reaction.
 */
const TransmuteRule &transmuteRule();

/**
 * @brief Product of fusing a and b, or nullopt if the pair does not react.
 *
 * Symmetric: combine(a, b) == combine(b, a).
 */
std::optional<CoinType> combine(CoinType a, CoinType b);

/**
 * @brief Collision class flags for a type.
 */
std::uint8_t classOf(CoinType type);

bool isReactive(CoinType type);
bool isSplitter(CoinType type);
bool isTransmuter(CoinType type);
bool isExplosive(CoinType type);

/**
 * @brief True if the type takes part in any reaction at all.
 *
 * Contacts reported by a non-participating coin are dropped before any
 * other work is done.
 */
bool participates(CoinType type);

/**
 * @brief Asserts the table is consistent (symmetric, no self-overlap,
 *        products are not reactants).
 */
void validateRuleTable();

} // namespace Rules

#endif
