/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/gimbal_analyzer.hpp"
#include "scene_fixtures.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <random>

namespace ssw::test {

    using engine::GimbalAnalyzer;
    using engine::GimbalReport;
    using engine::GimbalTier;

    namespace {

        int score_of(const GimbalReport& report, const std::string& label) {
            const auto* entry = report.find(label);
            EXPECT_NE(entry, nullptr) << label;
            return entry ? entry->score : -1;
        }

        GimbalTier tier_of(const GimbalReport& report, const std::string& label) {
            const auto* entry = report.find(label);
            return entry ? entry->tier : GimbalTier::None;
        }

    } // namespace

    TEST(GimbalScore, DistanceFromSingularity) {
        EXPECT_EQ(GimbalAnalyzer::score(0.0), 100);
        EXPECT_EQ(GimbalAnalyzer::score(90.0), 0);
        EXPECT_EQ(GimbalAnalyzer::score(-90.0), 0);
        EXPECT_EQ(GimbalAnalyzer::score(45.0), 50);
        EXPECT_EQ(GimbalAnalyzer::score(180.0), 100);
        EXPECT_EQ(GimbalAnalyzer::score(270.0), 0);
        EXPECT_EQ(GimbalAnalyzer::score(-45.0), 50);
    }

    TEST(GimbalClassify, TiersRelativeToBestScore) {
        EXPECT_EQ(GimbalAnalyzer::classify({40, 95, 12}),
                  (std::vector<GimbalTier>{GimbalTier::None, GimbalTier::Best, GimbalTier::None}));
        EXPECT_EQ(GimbalAnalyzer::classify({80, 78, 74, 73}),
                  (std::vector<GimbalTier>{GimbalTier::Best, GimbalTier::Good, GimbalTier::OK, GimbalTier::None}));
    }

    TEST(GimbalClassify, EqualScoresHaveNoTier) {
        EXPECT_EQ(GimbalAnalyzer::classify({100, 100, 100}), std::vector<GimbalTier>(3, GimbalTier::None));
        EXPECT_TRUE(GimbalAnalyzer::classify({}).empty());
    }

    TEST(GimbalClassify, MaximumIsAlwaysBest) {
        std::mt19937 rng(7);
        std::uniform_int_distribution<int> value(0, 100);
        std::uniform_int_distribution<int> count(2, 6);

        for (int round = 0; round < 200; ++round) {
            std::vector<int> scores(count(rng));
            for (auto& s : scores)
                s = value(rng);
            const auto tiers = GimbalAnalyzer::classify(scores);
            const int highest = *std::max_element(scores.begin(), scores.end());
            const bool uniform = std::all_of(scores.begin(), scores.end(), [&](int s) { return s == highest; });

            for (size_t i = 0; i < scores.size(); ++i) {
                if (uniform)
                    EXPECT_EQ(tiers[i], GimbalTier::None);
                else if (scores[i] == highest)
                    EXPECT_EQ(tiers[i], GimbalTier::Best);
                else
                    EXPECT_NE(tiers[i], GimbalTier::Best);
            }
        }
    }

    class GimbalAnalyzerTest : public ::testing::Test {
    protected:
        MemoryScene scene;
        GimbalAnalyzer analyzer{scene};
    };

    TEST_F(GimbalAnalyzerTest, CurrentPoseWithoutKeys) {
        const NodeId node = scene.addNode("arm");
        set_channels(scene, node, {0.0, 0.0, 0.0}, {0.0, 90.0, 0.0});

        const auto report = analyzer.analyze(node);
        ASSERT_EQ(report.entries.size(), 6u);
        EXPECT_EQ(score_of(report, "xyz"), 0);
        EXPECT_EQ(score_of(report, "zyx"), 0);
        EXPECT_EQ(score_of(report, "yzx"), 100);
        EXPECT_EQ(tier_of(report, "yzx"), GimbalTier::Best);
        EXPECT_EQ(tier_of(report, "xyz"), GimbalTier::None);
    }

    TEST_F(GimbalAnalyzerTest, RepeatedAnalysisIsStable) {
        const NodeId node = scene.addNode("arm");
        set_channels(scene, node, {0.0, 0.0, 0.0}, {12.0, 61.0, -33.0});

        const auto first = analyzer.analyze(node);
        const auto second = analyzer.analyze(node);
        ASSERT_EQ(first.entries.size(), second.entries.size());
        for (size_t i = 0; i < first.entries.size(); ++i) {
            EXPECT_EQ(first.entries[i].label, second.entries[i].label);
            EXPECT_EQ(first.entries[i].score, second.entries[i].score);
            EXPECT_EQ(first.entries[i].tier, second.entries[i].tier);
        }
    }

    TEST_F(GimbalAnalyzerTest, NeutralPoseHasNoPreference) {
        const NodeId node = scene.addNode("arm");
        const auto report = analyzer.analyze(node);
        ASSERT_FALSE(report.empty());
        for (const auto& entry : report.entries) {
            EXPECT_EQ(entry.score, 100);
            EXPECT_EQ(entry.tier, GimbalTier::None);
        }
    }

    TEST_F(GimbalAnalyzerTest, WorstKeyDecides) {
        const NodeId node = scene.addNode("arm");
        key_channels(scene, node, 1.0, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0});
        key_channels(scene, node, 10.0, {0.0, 0.0, 0.0}, {0.0, 90.0, 0.0});
        scene.setCurrentTime(1.0);

        const auto report = analyzer.analyze(node);
        EXPECT_EQ(score_of(report, "xyz"), 0);
        EXPECT_EQ(score_of(report, "yzx"), 100);
    }

    TEST_F(GimbalAnalyzerTest, ReadsRotationUnderActiveOrder) {
        const NodeId node = scene.addNode("arm");
        set_channels(scene, node, {0.0, 0.0, 0.0}, {0.0, 0.0, 90.0});
        ASSERT_TRUE(scene.setAttribute(node, "rotateOrder", 1.0).has_value()); // yzx

        const auto report = analyzer.analyze(node);
        EXPECT_EQ(score_of(report, "yzx"), 0);
        EXPECT_EQ(score_of(report, "xyz"), 100);
    }

    TEST_F(GimbalAnalyzerTest, NodeWithoutRotationOrderGivesEmptyReport) {
        const NodeId node = scene.addNode("constraint", NULL_NODE, false);
        EXPECT_TRUE(analyzer.analyze(node).empty());
        EXPECT_TRUE(analyzer.analyze(42).empty());
    }

} // namespace ssw::test
