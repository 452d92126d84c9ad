/**
 * @file explosion_resolver.hpp
 * @brief Radial impulse falloff for bomb detonations
 *
 * Impulse on a body at distance d from the blast centre:
 *   dir     = normalize(body - center) + (0, upwardBias, 0)
 *   impulse = dir * force * (1 - d / radius)     for d < radius
 * and nothing for d >= radius. A body sitting exactly on the centre is
 * treated as directly above it.
 */

#ifndef COINPUSHER_EXPLOSION_RESOLVER_HPP
#define COINPUSHER_EXPLOSION_RESOLVER_HPP

#include <optional>
#include <vector>

#include "coinpusher/core/game_config.hpp"
#include "coinpusher/systems/i_physics_world.hpp"

namespace Systems {

struct ImpulseCommand {
    BodyHandle handle;
    Vector3 impulse;
};

namespace ExplosionResolver {

    /**
     * @brief Impulse for one body; zero vector outside the radius.
     */
    Vector3 blastImpulse(const Vector3 &center, const Vector3 &bodyPosition, const ExplosionConfig &config);

    /**
     * @brief Impulses for every body strictly inside the radius.
     * @param exclude Handle of the detonating body itself, if it is in the list
     */
    std::vector<ImpulseCommand> computeImpulses(const Vector3 &center,
                                                const std::vector<NearbyBody> &bodies,
                                                const ExplosionConfig &config,
                                                std::optional<BodyHandle> exclude = std::nullopt);

    /**
     * @brief Queries the world around center and applies the blast.
     * @return Number of bodies pushed
     */
    std::size_t detonate(IPhysicsWorld &world,
                         const Vector3 &center,
                         const ExplosionConfig &config,
                         std::optional<BodyHandle> exclude = std::nullopt);

} // namespace ExplosionResolver

} // namespace Systems

#endif
