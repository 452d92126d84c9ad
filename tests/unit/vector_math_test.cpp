#include <gtest/gtest.h>
#include "coinpusher/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector3 v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);
    EXPECT_DOUBLE_EQ(v1.z, 0.0);

    Vector3 v2(3.0, 4.0, 12.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
    EXPECT_DOUBLE_EQ(v2.z, 12.0);
}

TEST(VectorMathTest, VectorAddition) {
    Vector3 v1(1.0, 2.0, 3.0);
    Vector3 v2(3.0, 4.0, 5.0);

    Vector3 result = v1 + v2;
    EXPECT_DOUBLE_EQ(result.x, 4.0);
    EXPECT_DOUBLE_EQ(result.y, 6.0);
    EXPECT_DOUBLE_EQ(result.z, 8.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);
    EXPECT_DOUBLE_EQ(v1.z, 8.0);

    v1 -= v2;
    EXPECT_DOUBLE_EQ(v1.x, 1.0);
    EXPECT_DOUBLE_EQ(v1.z, 3.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector3 v(2.0, 3.0, -1.0);

    Vector3 mult_result = v * 2.0;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);
    EXPECT_DOUBLE_EQ(mult_result.z, -2.0);

    Vector3 div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);
    EXPECT_DOUBLE_EQ(div_result.z, -2.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector3 v(3.0, 4.0, 12.0);

    EXPECT_DOUBLE_EQ(v.length(), 13.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 169.0);

    Vector3 n = v.normalized();
    EXPECT_NEAR(n.length(), 1.0, 1e-12);
    EXPECT_NEAR(n.x, 3.0 / 13.0, 1e-12);

    EXPECT_DOUBLE_EQ(v.dotProduct(Vector3(1.0, 0.0, 1.0)), 15.0);
}

TEST(VectorMathTest, NormalizeZeroVectorStaysZero) {
    Vector3 n = Vector3().normalized();
    EXPECT_DOUBLE_EQ(n.x, 0.0);
    EXPECT_DOUBLE_EQ(n.y, 0.0);
    EXPECT_DOUBLE_EQ(n.z, 0.0);
}

TEST(VectorMathTest, DistanceAndMidpoint) {
    Vector3 a(1.0, 0.0, 2.0);
    Vector3 b(4.0, 4.0, 2.0);
    EXPECT_DOUBLE_EQ(a.dist(b), 5.0);

    Vector3 m = midpoint(a, b);
    EXPECT_DOUBLE_EQ(m.x, 2.5);
    EXPECT_DOUBLE_EQ(m.y, 2.0);
    EXPECT_DOUBLE_EQ(m.z, 2.0);

    EXPECT_TRUE(nearlyEqual(0.1 + 0.2, 0.3));
    EXPECT_FALSE(nearlyEqual(1.0, 1.001));
}
