#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "gtest/gtest.h"

#include <glm/glm.hpp>

inline void expect_vec3_near(const glm::dvec3& actual, const glm::dvec3& expected, double tolerance = 1e-9) {
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.z, expected.z, tolerance);
}

inline void expect_mat4_near(const glm::dmat4& actual, const glm::dmat4& expected, double tolerance = 1e-9) {
    for (int column = 0; column < 4; ++column) {
        for (int row = 0; row < 4; ++row) {
            EXPECT_NEAR(actual[column][row], expected[column][row], tolerance) << "at row " << row << ", column " << column;
        }
    }
}

#endif // TEST_HELPERS_HPP
