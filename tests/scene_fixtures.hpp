// SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "host/memory_scene.hpp"
#include <cmath>
#include <glm/glm.hpp>
#include <gtest/gtest.h>
#include <string>

namespace ssw::test {

    using host::MemoryScene;
    using host::NodeId;
    using host::NULL_NODE;

    inline void set_channels(MemoryScene& scene, const NodeId node, const glm::dvec3& translate,
                             const glm::dvec3& rotate_degrees, const glm::dvec3& scale = glm::dvec3(1.0)) {
        for (int a = 0; a < 3; ++a) {
            ASSERT_TRUE(scene.setAttribute(node, host::TRANSLATE_CHANNELS[a], translate[a]).has_value());
            ASSERT_TRUE(scene.setAttribute(node, host::ROTATE_CHANNELS[a], rotate_degrees[a]).has_value());
            ASSERT_TRUE(scene.setAttribute(node, host::SCALE_CHANNELS[a], scale[a]).has_value());
        }
    }

    inline void key_channels(MemoryScene& scene, const NodeId node, const double time, const glm::dvec3& translate,
                             const glm::dvec3& rotate_degrees) {
        for (int a = 0; a < 3; ++a) {
            ASSERT_TRUE(scene.setKeyframe(node, host::TRANSLATE_CHANNELS[a], time, translate[a]).has_value());
            ASSERT_TRUE(scene.setKeyframe(node, host::ROTATE_CHANNELS[a], time, rotate_degrees[a]).has_value());
        }
    }

    inline ::testing::AssertionResult matrices_near(const glm::dmat4& a, const glm::dmat4& b,
                                                    const double tolerance = 1e-6) {
        for (int c = 0; c < 4; ++c) {
            for (int r = 0; r < 4; ++r) {
                if (std::abs(a[c][r] - b[c][r]) > tolerance) {
                    return ::testing::AssertionFailure()
                           << "element [" << c << "][" << r << "] differs: " << a[c][r] << " vs " << b[c][r];
                }
            }
        }
        return ::testing::AssertionSuccess();
    }

    inline glm::dmat4 world_at(MemoryScene& scene, const NodeId node, const double time) {
        const double saved = scene.currentTime();
        scene.setCurrentTime(time);
        auto matrix = scene.worldMatrix(node);
        scene.setCurrentTime(saved);
        EXPECT_TRUE(matrix.has_value());
        return matrix.value_or(glm::dmat4(0.0));
    }

    // A control with a World/Local space switch. Local follows "rig:parent_ctrl".
    // The switch drives a constraint node so it counts as connected.
    class SpaceRigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            parent = scene.addNode("rig:parent_ctrl");
            set_channels(scene, parent, {5.0, 2.0, -1.0}, {0.0, 45.0, 30.0});

            ctrl = scene.addNode("rig:hand_ctrl");
            set_channels(scene, ctrl, {1.0, 2.0, 3.0}, {10.0, 20.0, 30.0});
            ASSERT_TRUE(scene.addEnumAttribute(ctrl, "space", {"World", "Local"}).has_value());
            ASSERT_TRUE(scene.bindSpace(ctrl, "space", {{0, NULL_NODE}, {1, parent}}).has_value());

            constraint = scene.addNode("rig:hand_ctrl_spaceConstraint", NULL_NODE, false);
            ASSERT_TRUE(scene.addScalarAttribute(constraint, "spaceIndex").has_value());
            ASSERT_TRUE(scene.connect({ctrl, "space"}, {constraint, "spaceIndex"}).has_value());
        }

        MemoryScene scene;
        NodeId parent = NULL_NODE;
        NodeId ctrl = NULL_NODE;
        NodeId constraint = NULL_NODE;
    };

} // namespace ssw::test
