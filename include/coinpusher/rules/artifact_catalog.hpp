/**
 * @file artifact_catalog.hpp
 * @brief Permanent upgrades sold in the shop
 */

#ifndef COINPUSHER_ARTIFACT_CATALOG_HPP
#define COINPUSHER_ARTIFACT_CATALOG_HPP

#include <optional>
#include <string>
#include <vector>

/**
 * @struct ArtifactSpec
 * @brief Catalog entry. Cost at level L is floor(baseCost * growth^L).
 */
struct ArtifactSpec {
    std::string id;
    std::string name;
    std::string description;
    int baseCost;
};

namespace ArtifactCatalog {

    extern const char *const Magnet;    ///< Faster settling (damping)
    extern const char *const Extender;  ///< Wider bed
    extern const char *const Mult;      ///< Score multiplier

    const std::vector<ArtifactSpec> &all();

    std::optional<ArtifactSpec> find(const std::string &id);

} // namespace ArtifactCatalog

#endif
