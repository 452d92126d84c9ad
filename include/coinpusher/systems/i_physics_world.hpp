/**
 * @file i_physics_world.hpp
 * @brief The narrow slice of the rigid-body simulation the core talks to
 */

#pragma once

#include <cstdint>
#include <vector>

#include "coinpusher/math/vector_math.hpp"

/**
 * @brief Opaque body handle assigned by the physics collaborator.
 */
using BodyHandle = std::uint64_t;

/**
 * @struct NearbyBody
 * @brief Result row of a radius query.
 */
struct NearbyBody {
    BodyHandle handle;
    Vector3 position;
};

/**
 * @class IPhysicsWorld
 * @brief Interface implemented by whatever simulates the bed.
 */
class IPhysicsWorld {
public:
    virtual ~IPhysicsWorld() = default;

    /**
     * @brief Bodies whose centre lies within radius of center.
     */
    virtual std::vector<NearbyBody> queryNearby(const Vector3 &center, double radius) const = 0;

    /**
     * @brief Applies an instantaneous impulse to a body.
     */
    virtual void applyImpulse(BodyHandle handle, const Vector3 &impulse) = 0;
};
