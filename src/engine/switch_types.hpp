/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "host/scene_host.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ssw::engine {

    using host::NodeId;

    // A cleaned enum option and the value the host stores for it
    struct EnumOption {
        std::string label;
        int value = 0;

        bool operator==(const EnumOption&) const = default;
    };

    enum class GimbalTier : uint8_t {
        None,
        Best,
        Good,
        OK
    };

    [[nodiscard]] constexpr std::string_view to_string(const GimbalTier tier) {
        switch (tier) {
        case GimbalTier::Best: return "Best";
        case GimbalTier::Good: return "Good";
        case GimbalTier::OK: return "OK";
        case GimbalTier::None: break;
        }
        return "";
    }

    struct GimbalScore {
        std::string label; // Rotation order option label
        int score = 0;     // 0 at the singularity, 100 farthest from it
        GimbalTier tier = GimbalTier::None;
    };

    // Entries follow the node's rotateOrder option order
    struct GimbalReport {
        std::vector<GimbalScore> entries;

        [[nodiscard]] bool empty() const { return entries.empty(); }
        [[nodiscard]] const GimbalScore* find(std::string_view label) const;
    };

    struct SwitchableAttribute {
        NodeId node = host::NULL_NODE;
        std::string nodeName;
        std::string attributeName;
        std::vector<EnumOption> options; // At least two
        std::set<int> markedValues;
        int currentValue = 0;
        std::optional<GimbalReport> gimbal; // rotateOrder only

        [[nodiscard]] const EnumOption* findOption(std::string_view label) const;
    };

    struct OptionTarget {
        NodeId node = host::NULL_NODE;
        int localIndex = 0; // The node's own enum value for the label

        bool operator==(const OptionTarget&) const = default;
    };

    // Same-named switch attributes across the selection, shown as one control
    class SwitchGroup {
    public:
        SwitchGroup(std::string attribute_name, std::string display_label);

        // Replaces an existing member for the same node
        void addMember(SwitchableAttribute member);

        [[nodiscard]] const std::string& attributeName() const { return attribute_name_; }
        [[nodiscard]] const std::string& displayLabel() const { return display_label_; }
        [[nodiscard]] const std::vector<SwitchableAttribute>& members() const { return members_; }
        [[nodiscard]] const SwitchableAttribute* member(NodeId node) const;

        // Union of member options, first seen first
        [[nodiscard]] const std::vector<std::string>& optionLabels() const { return labels_; }
        [[nodiscard]] const std::map<std::string, std::vector<OptionTarget>>& optionIndex() const { return option_index_; }
        [[nodiscard]] const std::vector<OptionTarget>* targets(const std::string& label) const;

        // "hand_ctrl Space" for one member, "(3) Space" for several
        [[nodiscard]] std::string controlLabel(bool namespace_display) const;
        // "yzx (Best)" when the gimbal data tiers the label
        [[nodiscard]] std::string optionDisplayText(const std::string& label) const;
        // Accepts a label or its display text
        [[nodiscard]] std::optional<std::string> resolveLabel(std::string_view choice) const;

        [[nodiscard]] bool isMarked(const std::string& label) const;
        [[nodiscard]] bool isCurrent(const std::string& label) const;

    private:
        void rebuildIndex();

        std::string attribute_name_;
        std::string display_label_;
        std::vector<SwitchableAttribute> members_;
        std::vector<std::string> labels_;
        std::map<std::string, std::vector<OptionTarget>> option_index_;
    };

} // namespace ssw::engine
