/**
 * @file vector_math.hpp
 * @brief 3D vector mathematics for coin positions, velocities and impulses
 *
 * The physics collaborator works in a y-up world:
 * - x runs across the bed
 * - y is height
 * - z runs along the bed towards the drop edge
 */

#ifndef COINPUSHER_VECTOR_MATH_HPP
#define COINPUSHER_VECTOR_MATH_HPP

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Represents a 3D vector (also used for points)
 */
class Vector3 {
public:
    double x;  ///< X component
    double y;  ///< Y component
    double z;  ///< Z component

    /** @brief Constructs a zero vector (0,0,0) */
    Vector3();

    /**
     * @brief Constructs a vector with given components
     */
    Vector3(double x, double y, double z);

    Vector3 operator-() const;
    Vector3 operator+(const Vector3& b) const;
    Vector3 operator-(const Vector3& b) const;
    Vector3 operator*(double scalar) const;
    Vector3 operator/(double scalar) const;

    Vector3& operator+=(const Vector3& v);
    Vector3& operator-=(const Vector3& v);

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoids the sqrt for threshold tests */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector3& v) const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * A vector shorter than EPSILON is returned unchanged.
     */
    Vector3 normalized() const;

    /**
     * @brief Euclidean distance between two points
     */
    double dist(const Vector3& p) const;
};

/**
 * @brief Point halfway between a and b
 */
Vector3 midpoint(const Vector3& a, const Vector3& b);

#endif
