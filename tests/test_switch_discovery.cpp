/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/switch_discovery.hpp"
#include "scene_fixtures.hpp"
#include <gtest/gtest.h>

namespace ssw::test {

    using engine::GimbalAnalyzer;
    using engine::OptionTarget;
    using engine::SwitchAttributeDiscovery;
    using engine::SwitchGroup;

    class SwitchDiscoveryTest : public SpaceRigTest {
    protected:
        // A second control whose space enum lists its options in another order
        NodeId addFootControl() {
            const NodeId foot = scene.addNode("rig:foot_ctrl");
            EXPECT_TRUE(scene.addEnumAttribute(foot, "space", {"Hips", "World", "Local"}).has_value());
            EXPECT_TRUE(scene.bindSpace(foot, "space", {{0, NULL_NODE}, {1, NULL_NODE}, {2, parent}}).has_value());
            const NodeId foot_constraint = scene.addNode("rig:foot_ctrl_spaceConstraint", NULL_NODE, false);
            EXPECT_TRUE(scene.addScalarAttribute(foot_constraint, "spaceIndex").has_value());
            EXPECT_TRUE(scene.connect({foot, "space"}, {foot_constraint, "spaceIndex"}).has_value());
            return foot;
        }

        const SwitchGroup* find(const std::vector<SwitchGroup>& groups, const std::string& attribute) {
            for (const auto& group : groups) {
                if (group.attributeName() == attribute)
                    return &group;
            }
            return nullptr;
        }

        GimbalAnalyzer analyzer{scene};
        SwitchAttributeDiscovery discovery{scene, analyzer};
        core::param::SwitchParameters params;
    };

    TEST_F(SwitchDiscoveryTest, FindsConnectedEnumAndRotateOrder) {
        const auto groups = discovery.discover({ctrl}, params);
        ASSERT_EQ(groups.size(), 2u);
        EXPECT_EQ(groups[0].attributeName(), "space");
        EXPECT_EQ(groups[0].displayLabel(), "Space");
        EXPECT_EQ(groups[1].attributeName(), "rotateOrder");
        EXPECT_EQ(groups[1].displayLabel(), "Rotate Order");
        EXPECT_EQ(groups[0].optionLabels(), (std::vector<std::string>{"World", "Local"}));
    }

    TEST_F(SwitchDiscoveryTest, RotateOrderCanBeHidden) {
        params.show_rotate_order = false;
        const auto groups = discovery.discover({ctrl}, params);
        ASSERT_EQ(groups.size(), 1u);
        EXPECT_EQ(groups[0].attributeName(), "space");
    }

    TEST_F(SwitchDiscoveryTest, UnconnectedEnumIsRejected) {
        ASSERT_TRUE(scene.addEnumAttribute(ctrl, "mode", {"IK", "FK"}).has_value());

        const auto rejected = discovery.inspect(ctrl, "mode");
        ASSERT_FALSE(rejected.has_value());
        EXPECT_EQ(rejected.error().reason, "not connected to anything");
        EXPECT_EQ(find(discovery.discover({ctrl}, params), "mode"), nullptr);
    }

    TEST_F(SwitchDiscoveryTest, RotateOrderNeedsNoConnection) {
        const auto inspected = discovery.inspect(ctrl, "rotateOrder");
        ASSERT_TRUE(inspected.has_value());
        ASSERT_TRUE(inspected->gimbal.has_value());
        EXPECT_EQ(inspected->gimbal->entries.size(), 6u);
    }

    TEST_F(SwitchDiscoveryTest, TooFewUsableLabelsIsRejected) {
        ASSERT_TRUE(scene.addEnumAttribute(ctrl, "pin", {"On", "----", "On"}).has_value());

        const auto rejected = discovery.inspect(ctrl, "pin");
        ASSERT_FALSE(rejected.has_value());
        EXPECT_EQ(rejected.error().reason, "1 usable label(s)");
    }

    TEST_F(SwitchDiscoveryTest, NonEnumsAndMissingAttributesAreRejected) {
        EXPECT_FALSE(discovery.inspect(constraint, "spaceIndex").has_value());
        EXPECT_FALSE(discovery.inspect(ctrl, "nothing").has_value());
        EXPECT_TRUE(discovery.discover({constraint}, params).empty());
    }

    TEST_F(SwitchDiscoveryTest, GroupsSameAttributeAcrossNodes) {
        const NodeId foot = addFootControl();

        const auto groups = discovery.discover({ctrl, foot}, params);
        const auto* space = find(groups, "space");
        ASSERT_NE(space, nullptr);
        EXPECT_EQ(space->members().size(), 2u);
        EXPECT_EQ(space->optionLabels(), (std::vector<std::string>{"World", "Local", "Hips"}));
        EXPECT_EQ(*space->targets("World"), (std::vector<OptionTarget>{{ctrl, 0}, {foot, 1}}));
        EXPECT_EQ(*space->targets("Local"), (std::vector<OptionTarget>{{ctrl, 1}, {foot, 2}}));
        EXPECT_EQ(*space->targets("Hips"), (std::vector<OptionTarget>{{foot, 0}}));
        EXPECT_EQ(space->controlLabel(false), "(2) Space");
    }

    TEST_F(SwitchDiscoveryTest, DuplicateAndDeletedNodesAreSkipped) {
        const NodeId foot = addFootControl();
        scene.deleteNode(foot);

        const auto groups = discovery.discover({ctrl, ctrl, foot}, params);
        const auto* space = find(groups, "space");
        ASSERT_NE(space, nullptr);
        EXPECT_EQ(space->members().size(), 1u);
        EXPECT_EQ(space->controlLabel(false), "hand_ctrl Space");
        EXPECT_EQ(space->controlLabel(true), "rig:hand_ctrl Space");
    }

    TEST_F(SwitchDiscoveryTest, MarkedValuesFollowKeys) {
        auto unkeyed = discovery.inspect(ctrl, "space");
        ASSERT_TRUE(unkeyed.has_value());
        EXPECT_EQ(unkeyed->markedValues, (std::set<int>{0}));

        ASSERT_TRUE(scene.setKeyframe(ctrl, "space", 1.0, 1.0).has_value());
        ASSERT_TRUE(scene.setKeyframe(ctrl, "space", 5.0, 1.0).has_value());
        scene.setCurrentTime(5.0);

        const auto keyed = discovery.inspect(ctrl, "space");
        ASSERT_TRUE(keyed.has_value());
        EXPECT_EQ(keyed->markedValues, (std::set<int>{1}));
        EXPECT_EQ(keyed->currentValue, 1);

        const auto groups = discovery.discover({ctrl}, params);
        const auto* space = find(groups, "space");
        ASSERT_NE(space, nullptr);
        EXPECT_TRUE(space->isMarked("Local"));
        EXPECT_FALSE(space->isMarked("World"));
        EXPECT_TRUE(space->isCurrent("Local"));
    }

} // namespace ssw::test
