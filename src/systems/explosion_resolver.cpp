#include "coinpusher/systems/explosion_resolver.hpp"

namespace Systems {
namespace ExplosionResolver {

Vector3 blastImpulse(const Vector3 &center, const Vector3 &bodyPosition, const ExplosionConfig &config) {
    Vector3 const offset = bodyPosition - center;
    double const dist = offset.length();
    if (dist >= config.radius) {
        return Vector3();
    }

    Vector3 direction = (dist < EPSILON) ? Vector3(0.0, 1.0, 0.0) : offset / dist;
    direction.y += config.upwardBias;

    double const strength = config.force * (1.0 - dist / config.radius);
    return direction * strength;
}

std::vector<ImpulseCommand> computeImpulses(const Vector3 &center,
                                            const std::vector<NearbyBody> &bodies,
                                            const ExplosionConfig &config,
                                            std::optional<BodyHandle> exclude)
{
    std::vector<ImpulseCommand> commands;
    commands.reserve(bodies.size());
    for (const auto &body : bodies) {
        if (exclude && body.handle == *exclude) {
            continue;
        }
        if (body.position.dist(center) >= config.radius) {
            continue;
        }
        commands.push_back({body.handle, blastImpulse(center, body.position, config)});
    }
    return commands;
}

std::size_t detonate(IPhysicsWorld &world,
                     const Vector3 &center,
                     const ExplosionConfig &config,
                     std::optional<BodyHandle> exclude)
{
    auto commands = computeImpulses(center, world.queryNearby(center, config.radius), config, exclude);
    for (const auto &cmd : commands) {
        world.applyImpulse(cmd.handle, cmd.impulse);
    }
    return commands.size();
}

} // namespace ExplosionResolver
} // namespace Systems
