/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/gimbal_analyzer.hpp"
#include "core/logger.hpp"
#include "core/rotation_order.hpp"
#include "engine/option_cleaning.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <variant>

namespace ssw::engine {

    namespace {

        constexpr int GOOD_TIER_SPREAD = 2;
        constexpr int OK_TIER_SPREAD = 6;

        struct Candidate {
            std::string label;
            core::RotationOrder order;
        };

    } // namespace

    GimbalAnalyzer::GimbalAnalyzer(const host::SceneHost& host)
        : host_(host) {}

    int GimbalAnalyzer::score(const double middle_degrees) {
        double wrapped = std::fmod(middle_degrees + 90.0, 180.0);
        if (wrapped < 0.0)
            wrapped += 180.0;
        const auto proximity = static_cast<int>(std::lround(std::abs(wrapped - 90.0) / 90.0 * 100.0));
        return 100 - std::clamp(proximity, 0, 100);
    }

    std::vector<GimbalTier> GimbalAnalyzer::classify(const std::vector<int>& scores) {
        std::vector<GimbalTier> tiers(scores.size(), GimbalTier::None);
        if (scores.empty())
            return tiers;

        const auto [lowest, highest] = std::minmax_element(scores.begin(), scores.end());
        if (*lowest == *highest)
            return tiers;

        const int best = *highest;
        for (size_t i = 0; i < scores.size(); ++i) {
            const int diff = best - scores[i];
            if (diff == 0)
                tiers[i] = GimbalTier::Best;
            else if (diff <= GOOD_TIER_SPREAD)
                tiers[i] = GimbalTier::Good;
            else if (diff <= OK_TIER_SPREAD)
                tiers[i] = GimbalTier::OK;
        }
        return tiers;
    }

    GimbalReport GimbalAnalyzer::analyze(const host::NodeId node) const {
        GimbalReport report;

        const auto kind = host_.queryAttribute(node, host::ROTATE_ORDER_ATTRIBUTE);
        if (!kind) {
            LOG_DEBUG("No gimbal data for node {}: {}", node, kind.error().describe());
            return report;
        }
        const auto* enum_attribute = std::get_if<host::EnumAttribute>(&*kind);
        if (!enum_attribute) {
            LOG_DEBUG("rotateOrder on '{}' is not an enum", host_.nodeName(node));
            return report;
        }

        const auto options = clean_enum_labels(enum_attribute->raw_labels);
        std::vector<Candidate> candidates;
        for (const auto& option : options) {
            if (const auto order = core::parse_rotation_order(option.label))
                candidates.push_back({option.label, *order});
            else
                LOG_WARN("Skipping rotate order option '{}' on '{}'", option.label, host_.nodeName(node));
        }
        if (candidates.empty())
            return report;

        // Order active at a time, mapped through the node's own option values
        const auto active_order = [&](const double value) -> std::optional<core::RotationOrder> {
            const int index = static_cast<int>(std::lround(value));
            for (const auto& option : options) {
                if (option.value == index)
                    return core::parse_rotation_order(option.label);
            }
            return core::rotation_order_from_index(index);
        };

        std::set<double> times;
        for (const char* channel : host::ROTATE_CHANNELS) {
            for (const double t : host_.keyframeTimes(node, channel))
                times.insert(t);
        }
        if (times.empty())
            times.insert(host_.currentTime());

        std::vector<int> worst(candidates.size(), 100);
        size_t sampled = 0;
        for (const double t : times) {
            glm::dvec3 euler;
            bool readable = true;
            for (int a = 0; a < 3; ++a) {
                const auto value = host_.getAttributeAt(node, host::ROTATE_CHANNELS[a], t);
                if (!value) {
                    LOG_WARN("Cannot read rotation of '{}' at {}: {}", host_.nodeName(node), t,
                             value.error().describe());
                    readable = false;
                    break;
                }
                euler[a] = glm::radians(*value);
            }
            const auto order_value = host_.getAttributeAt(node, host::ROTATE_ORDER_ATTRIBUTE, t);
            const auto order = order_value ? active_order(*order_value) : std::nullopt;
            if (!readable || !order)
                continue;

            for (size_t c = 0; c < candidates.size(); ++c) {
                const glm::dvec3 reordered = core::reorder_euler(euler, *order, candidates[c].order);
                const double middle = glm::degrees(reordered[core::middle_axis(candidates[c].order)]);
                worst[c] = std::min(worst[c], score(middle));
            }
            ++sampled;
        }
        if (sampled == 0)
            return report;

        const auto tiers = classify(worst);
        for (size_t c = 0; c < candidates.size(); ++c)
            report.entries.push_back({candidates[c].label, worst[c], tiers[c]});

        LOG_DEBUG("Gimbal report for '{}' over {} sample(s)", host_.nodeName(node), sampled);
        return report;
    }

} // namespace ssw::engine
