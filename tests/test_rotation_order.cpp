/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/rotation_order.hpp"
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>
#include <gtest/gtest.h>
#include <numbers>

namespace ssw::core {

    namespace {

        constexpr double EPS = 1e-9;

        const glm::dvec3 AXES[3] = {{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}};

        glm::dvec3 deg(const double x, const double y, const double z) {
            return glm::radians(glm::dvec3(x, y, z));
        }

        // Reference built from glm::rotate, first axis applied first
        glm::dmat3 reference_rotation(const glm::dvec3& euler, const RotationOrder order) {
            const auto axes = rotation_axes(order);
            glm::dmat4 m(1.0);
            for (int n = 2; n >= 0; --n)
                m = glm::rotate(m, euler[axes[n]], AXES[axes[n]]);
            return glm::dmat3(m);
        }

        void expect_near(const glm::dmat3& a, const glm::dmat3& b, const double tolerance = 1e-9) {
            for (int c = 0; c < 3; ++c)
                for (int r = 0; r < 3; ++r)
                    EXPECT_NEAR(a[c][r], b[c][r], tolerance) << "at [" << c << "][" << r << "]";
        }

    } // namespace

    // ---------------------------------------------------------------------------
    // Labels and tables
    // ---------------------------------------------------------------------------

    TEST(RotationOrder, ParsesLabelsIgnoringCaseAndSpaces) {
        EXPECT_EQ(parse_rotation_order("xyz"), RotationOrder::XYZ);
        EXPECT_EQ(parse_rotation_order(" ZyX "), RotationOrder::ZYX);
        EXPECT_EQ(parse_rotation_order("yxz"), RotationOrder::YXZ);
        EXPECT_FALSE(parse_rotation_order("xxy").has_value());
        EXPECT_FALSE(parse_rotation_order("").has_value());
    }

    TEST(RotationOrder, IndicesMatchHostEnum) {
        for (int i = 0; i < 6; ++i) {
            const auto order = rotation_order_from_index(i);
            ASSERT_TRUE(order.has_value());
            EXPECT_EQ(static_cast<int>(*order), i);
            EXPECT_EQ(parse_rotation_order(to_string(*order)), order);
        }
        EXPECT_FALSE(rotation_order_from_index(6).has_value());
        EXPECT_FALSE(rotation_order_from_index(-1).has_value());
    }

    TEST(RotationOrder, MiddleAxisTable) {
        EXPECT_EQ(middle_axis(RotationOrder::XYZ), 1);
        EXPECT_EQ(middle_axis(RotationOrder::YZX), 2);
        EXPECT_EQ(middle_axis(RotationOrder::ZXY), 0);
        EXPECT_EQ(middle_axis(RotationOrder::XZY), 2);
        EXPECT_EQ(middle_axis(RotationOrder::YXZ), 0);
        EXPECT_EQ(middle_axis(RotationOrder::ZYX), 1);
    }

    // ---------------------------------------------------------------------------
    // Euler <-> matrix
    // ---------------------------------------------------------------------------

    TEST(RotationOrder, QuarterTurnAboutZ) {
        const glm::dmat3 m = euler_to_matrix(deg(0.0, 0.0, 90.0), RotationOrder::XYZ);
        const glm::dvec3 x = m * glm::dvec3(1.0, 0.0, 0.0);
        EXPECT_NEAR(x.x, 0.0, EPS);
        EXPECT_NEAR(x.y, 1.0, EPS);
        EXPECT_NEAR(x.z, 0.0, EPS);
    }

    TEST(RotationOrder, MatchesGlmRotateForEveryOrder) {
        const glm::dvec3 euler = deg(25.0, -40.0, 70.0);
        for (const auto order : ALL_ROTATION_ORDERS) {
            SCOPED_TRACE(std::string(to_string(order)));
            expect_near(euler_to_matrix(euler, order), reference_rotation(euler, order));
        }
    }

    TEST(RotationOrder, ExtractionRoundTripsAwayFromSingularity) {
        const glm::dvec3 samples[] = {deg(10.0, 20.0, 30.0), deg(-120.0, 60.0, 170.0), deg(0.0, -80.0, -45.0)};
        for (const auto order : ALL_ROTATION_ORDERS) {
            for (const auto& euler : samples) {
                // Middle angle has to stay inside (-90, 90) for a unique answer
                glm::dvec3 e = euler;
                const int mid = middle_axis(order);
                std::swap(e[mid], e[1]);
                const glm::dvec3 back = matrix_to_euler(euler_to_matrix(e, order), order);
                for (int a = 0; a < 3; ++a)
                    EXPECT_NEAR(back[a], e[a], 1e-9) << to_string(order) << " axis " << a;
            }
        }
    }

    TEST(RotationOrder, GimbalLockedMatrixStillReconstructs) {
        for (const auto order : ALL_ROTATION_ORDERS) {
            glm::dvec3 e = deg(30.0, 30.0, 30.0);
            e[middle_axis(order)] = glm::radians(90.0);
            const glm::dmat3 m = euler_to_matrix(e, order);
            SCOPED_TRACE(std::string(to_string(order)));
            expect_near(euler_to_matrix(matrix_to_euler(m, order), order), m);
        }
    }

    TEST(RotationOrder, ReorderKeepsPhysicalRotation) {
        const glm::dvec3 euler = deg(15.0, 50.0, -35.0);
        const glm::dmat3 m = euler_to_matrix(euler, RotationOrder::XYZ);
        for (const auto order : ALL_ROTATION_ORDERS) {
            SCOPED_TRACE(std::string(to_string(order)));
            const glm::dvec3 reordered = reorder_euler(euler, RotationOrder::XYZ, order);
            expect_near(euler_to_matrix(reordered, order), m);
        }
        EXPECT_EQ(reorder_euler(euler, RotationOrder::ZXY, RotationOrder::ZXY), euler);
    }

    // ---------------------------------------------------------------------------
    // Unwrapping
    // ---------------------------------------------------------------------------

    TEST(RotationOrder, ApproachAngleShiftsByWholeTurns) {
        constexpr double PI = std::numbers::pi;
        EXPECT_NEAR(approach_angle(0.0, 1.5 * PI), -0.5 * PI, EPS);
        EXPECT_NEAR(approach_angle(2.0 * PI, 0.1), 2.0 * PI + 0.1, EPS);
        EXPECT_NEAR(approach_angle(0.0, 0.3), 0.3, EPS);
    }

    TEST(RotationOrder, ClosestEulerPrefersNearerEquivalentSolution) {
        const glm::dvec3 value = deg(10.0, 20.0, 30.0);
        const glm::dvec3 previous = deg(185.0, 165.0, 205.0);

        const glm::dvec3 picked = closest_euler(previous, value, RotationOrder::XYZ);
        EXPECT_NEAR(glm::degrees(picked.x), 190.0, 1e-9);
        EXPECT_NEAR(glm::degrees(picked.y), 160.0, 1e-9);
        EXPECT_NEAR(glm::degrees(picked.z), 210.0, 1e-9);

        expect_near(euler_to_matrix(picked, RotationOrder::XYZ), euler_to_matrix(value, RotationOrder::XYZ));
    }

    TEST(RotationOrder, AlternativeSolutionIsSameRotationForEveryOrder) {
        const glm::dvec3 value = deg(-20.0, 35.0, 80.0);
        for (const auto order : ALL_ROTATION_ORDERS) {
            const auto [i, j, k] = rotation_axes(order);
            glm::dvec3 previous;
            previous[i] = value[i] + std::numbers::pi;
            previous[j] = std::numbers::pi - value[j];
            previous[k] = value[k] + std::numbers::pi;

            SCOPED_TRACE(std::string(to_string(order)));
            const glm::dvec3 picked = closest_euler(previous, value, order);
            EXPECT_NEAR(picked[j], previous[j], 1e-9);
            expect_near(euler_to_matrix(picked, order), euler_to_matrix(value, order));
        }
    }

    // ---------------------------------------------------------------------------
    // Compose / decompose
    // ---------------------------------------------------------------------------

    TEST(RotationOrder, DecomposeRecoversComponents) {
        TransformComponents in;
        in.translate = {1.0, -2.0, 3.5};
        in.rotate = deg(30.0, -20.0, 60.0);
        in.scale = {2.0, 0.5, 1.5};

        for (const auto order : ALL_ROTATION_ORDERS) {
            const auto out = decompose_transform(compose_transform(in, order), order);
            ASSERT_TRUE(out.has_value());
            for (int a = 0; a < 3; ++a) {
                EXPECT_NEAR(out->translate[a], in.translate[a], 1e-9);
                EXPECT_NEAR(out->rotate[a], in.rotate[a], 1e-9);
                EXPECT_NEAR(out->scale[a], in.scale[a], 1e-9);
            }
        }
    }

    TEST(RotationOrder, DecomposeRejectsZeroScale) {
        TransformComponents in;
        in.scale = {1.0, 0.0, 1.0};
        EXPECT_FALSE(decompose_transform(compose_transform(in, RotationOrder::XYZ), RotationOrder::XYZ).has_value());
    }

    TEST(RotationOrder, NegativeScaleRecomposesToSameMatrix) {
        TransformComponents in;
        in.rotate = deg(10.0, 0.0, 0.0);
        in.scale = {-1.0, 1.0, 1.0};
        const glm::dmat4 m = compose_transform(in, RotationOrder::XYZ);

        const auto out = decompose_transform(m, RotationOrder::XYZ);
        ASSERT_TRUE(out.has_value());
        EXPECT_LT(out->scale.x, 0.0);
        const glm::dmat4 back = compose_transform(*out, RotationOrder::XYZ);
        for (int c = 0; c < 4; ++c)
            for (int r = 0; r < 4; ++r)
                EXPECT_NEAR(back[c][r], m[c][r], 1e-9);
    }

} // namespace ssw::core
