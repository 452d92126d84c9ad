/**
 * @file coin_catalog.hpp
 * @brief Fixed enumeration of coin kinds and their economy/physics properties
 */

#ifndef COINPUSHER_COIN_CATALOG_HPP
#define COINPUSHER_COIN_CATALOG_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @enum CoinType
 * @brief Every kind of coin that can exist on the bed.
 *
 * TREE, OBSIDIAN and DIAMOND are products of combine reactions.
 */
enum class CoinType : std::uint8_t {
    Standard,
    Splitter,
    Heavy,
    Gold,
    Bomb,
    Seed,
    Water,
    Magma,
    Ice,
    Key,
    Chest,
    Tree,
    Obsidian,
    Diamond,
};

constexpr std::size_t CoinTypeCount = 14;

/**
 * @struct CoinSpec
 * @brief Static properties of one coin type.
 *
 * value/score/cost drive the economy. mass/friction/restitution/visualScale
 * are hints for the physics and render collaborators.
 */
struct CoinSpec {
    CoinType type;
    const char *name;
    int value;          ///< Cash paid out on collection
    int score;          ///< Base score before multipliers
    int cost;           ///< Shop price for one pack
    const char *description;

    double mass;
    double friction;
    double restitution;
    double visualScale;
};

namespace CoinCatalog {

    /**
     * @brief Catalog entry for a coin type.
     */
    const CoinSpec &spec(CoinType type);

    /**
     * @brief All coin types in declaration order.
     */
    const std::array<CoinType, CoinTypeCount> &allTypes();

    /**
     * @brief Index of a type, for per-type arrays.
     */
    constexpr std::size_t indexOf(CoinType type) {
        return static_cast<std::size_t>(type);
    }

    /**
     * @brief Stable upper-case name, e.g. "STANDARD".
     */
    std::string typeName(CoinType type);

    /**
     * @brief Reverse of typeName(). Unknown names yield nullopt.
     */
    std::optional<CoinType> parseTypeName(const std::string &name);

    /**
     * @brief Asserts that every enumerator has a matching catalog row.
     */
    void validateCatalog();

} // namespace CoinCatalog

#endif
