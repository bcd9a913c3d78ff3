/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/switch_discovery.hpp"
#include "core/logger.hpp"
#include "engine/option_cleaning.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <variant>

namespace ssw::engine {

    namespace {

        std::unexpected<DiscoveryRejected> reject(std::string reason) {
            return std::unexpected(DiscoveryRejected{std::move(reason)});
        }

    } // namespace

    SwitchAttributeDiscovery::SwitchAttributeDiscovery(const host::SceneHost& host, const GimbalAnalyzer& analyzer)
        : host_(host),
          analyzer_(analyzer) {}

    std::expected<SwitchableAttribute, DiscoveryRejected>
    SwitchAttributeDiscovery::inspect(const host::NodeId node, const std::string& attribute) const {
        const auto kind = host_.queryAttribute(node, attribute);
        if (!kind)
            return reject(kind.error().describe());

        const auto* enum_attribute = std::get_if<host::EnumAttribute>(&*kind);
        if (!enum_attribute)
            return reject("not an enum");

        auto options = clean_enum_labels(enum_attribute->raw_labels);
        if (options.size() < MIN_SWITCH_OPTIONS)
            return reject(std::format("{} usable label(s)", options.size()));

        // rotateOrder switches the node's own Euler decomposition and needs no wiring
        const bool rotate_order = attribute == host::ROTATE_ORDER_ATTRIBUTE;
        if (!rotate_order && host_.listConnections(host::Plug{node, attribute}).empty())
            return reject("not connected to anything");

        const auto current = host_.getAttribute(node, attribute);
        if (!current)
            return reject(current.error().describe());

        SwitchableAttribute result;
        result.node = node;
        result.nodeName = host_.nodeName(node);
        result.attributeName = attribute;
        result.options = std::move(options);
        result.currentValue = static_cast<int>(std::lround(*current));
        for (const double value : host_.keyframeValues(node, attribute))
            result.markedValues.insert(static_cast<int>(std::lround(value)));
        if (result.markedValues.empty())
            result.markedValues.insert(result.currentValue);

        if (rotate_order)
            result.gimbal = analyzer_.analyze(node);
        return result;
    }

    std::vector<SwitchGroup> SwitchAttributeDiscovery::discover(const std::vector<host::NodeId>& selection,
                                                                const core::param::SwitchParameters& params) const {
        LOG_TIMER_TRACE("SwitchAttributeDiscovery::discover");
        std::vector<SwitchGroup> groups;
        std::vector<host::NodeId> scanned;

        for (const host::NodeId node : selection) {
            if (std::find(scanned.begin(), scanned.end(), node) != scanned.end())
                continue;
            scanned.push_back(node);

            if (!host_.nodeExists(node)) {
                LOG_DEBUG("Skipping deleted node {}", node);
                continue;
            }

            auto attributes = host_.listUserAttributes(node);
            if (params.show_rotate_order &&
                std::find(attributes.begin(), attributes.end(), host::ROTATE_ORDER_ATTRIBUTE) == attributes.end())
                attributes.emplace_back(host::ROTATE_ORDER_ATTRIBUTE);

            for (const auto& attribute : attributes) {
                auto inspected = inspect(node, attribute);
                if (!inspected) {
                    LOG_DEBUG("'{}.{}' is not a switch: {}", host_.nodeName(node), attribute,
                              inspected.error().reason);
                    continue;
                }

                auto group = std::find_if(groups.begin(), groups.end(), [&](const SwitchGroup& g) {
                    return g.attributeName() == attribute;
                });
                if (group == groups.end()) {
                    groups.emplace_back(attribute, host_.niceName(node, attribute));
                    group = std::prev(groups.end());
                }
                group->addMember(std::move(*inspected));
            }
        }

        LOG_DEBUG("Discovered {} switch group(s) on {} node(s)", groups.size(), scanned.size());
        return groups;
    }

} // namespace ssw::engine
