/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/switch_types.hpp"
#include <algorithm>
#include <cctype>
#include <format>

namespace ssw::engine {

    namespace {

        constexpr size_t MAX_NAME_DISPLAY = 50;

        // Upper-cases the first letter of every word and lower-cases the rest
        std::string title_case(const std::string& text) {
            std::string out = text;
            bool after_letter = false;
            for (auto& c : out) {
                const auto uc = static_cast<unsigned char>(c);
                if (std::isalpha(uc)) {
                    c = static_cast<char>(after_letter ? std::tolower(uc) : std::toupper(uc));
                    after_letter = true;
                } else {
                    after_letter = false;
                }
            }
            return out;
        }

        std::string short_node_name(const std::string& name, const bool namespace_display) {
            std::string out = name.substr(name.rfind('|') == std::string::npos ? 0 : name.rfind('|') + 1);
            if (!namespace_display) {
                if (const auto colon = out.rfind(':'); colon != std::string::npos)
                    out = out.substr(colon + 1);
            }
            if (out.size() > MAX_NAME_DISPLAY)
                out = "..." + out.substr(0, MAX_NAME_DISPLAY);
            return out;
        }

    } // namespace

    const GimbalScore* GimbalReport::find(const std::string_view label) const {
        const auto it = std::find_if(entries.begin(), entries.end(),
                                     [label](const GimbalScore& s) { return s.label == label; });
        return it != entries.end() ? &*it : nullptr;
    }

    const EnumOption* SwitchableAttribute::findOption(const std::string_view label) const {
        const auto it = std::find_if(options.begin(), options.end(),
                                     [label](const EnumOption& o) { return o.label == label; });
        return it != options.end() ? &*it : nullptr;
    }

    SwitchGroup::SwitchGroup(std::string attribute_name, std::string display_label)
        : attribute_name_(std::move(attribute_name)),
          display_label_(std::move(display_label)) {}

    void SwitchGroup::addMember(SwitchableAttribute member) {
        const auto it = std::find_if(members_.begin(), members_.end(),
                                     [&](const SwitchableAttribute& m) { return m.node == member.node; });
        if (it != members_.end())
            *it = std::move(member);
        else
            members_.push_back(std::move(member));
        rebuildIndex();
    }

    void SwitchGroup::rebuildIndex() {
        labels_.clear();
        option_index_.clear();
        for (const auto& m : members_) {
            for (const auto& option : m.options) {
                auto& targets = option_index_[option.label];
                if (targets.empty())
                    labels_.push_back(option.label);
                targets.push_back({m.node, option.value});
            }
        }
    }

    const SwitchableAttribute* SwitchGroup::member(const NodeId node) const {
        const auto it = std::find_if(members_.begin(), members_.end(),
                                     [node](const SwitchableAttribute& m) { return m.node == node; });
        return it != members_.end() ? &*it : nullptr;
    }

    const std::vector<OptionTarget>* SwitchGroup::targets(const std::string& label) const {
        const auto it = option_index_.find(label);
        return it != option_index_.end() ? &it->second : nullptr;
    }

    std::string SwitchGroup::controlLabel(const bool namespace_display) const {
        const std::string owner = members_.size() == 1
                                      ? short_node_name(members_.front().nodeName, namespace_display)
                                      : std::format("({})", members_.size());
        return std::format("{} {}", owner, title_case(display_label_));
    }

    std::string SwitchGroup::optionDisplayText(const std::string& label) const {
        if (members_.empty() || !members_.front().gimbal)
            return label;
        const auto* score = members_.front().gimbal->find(label);
        if (!score || score->tier == GimbalTier::None)
            return label;
        return std::format("{} ({})", label, to_string(score->tier));
    }

    std::optional<std::string> SwitchGroup::resolveLabel(const std::string_view choice) const {
        const std::string text(choice);
        if (option_index_.contains(text))
            return text;

        // Strip a " (Tier)" suffix
        const auto open = text.rfind(" (");
        if (open == std::string::npos || text.back() != ')')
            return std::nullopt;
        const std::string tier = text.substr(open + 2, text.size() - open - 3);
        if (tier != to_string(GimbalTier::Best) && tier != to_string(GimbalTier::Good) &&
            tier != to_string(GimbalTier::OK))
            return std::nullopt;

        std::string label = text.substr(0, open);
        if (!option_index_.contains(label))
            return std::nullopt;
        return label;
    }

    bool SwitchGroup::isMarked(const std::string& label) const {
        return std::any_of(members_.begin(), members_.end(), [&](const SwitchableAttribute& m) {
            const auto* option = m.findOption(label);
            return option && m.markedValues.contains(option->value);
        });
    }

    bool SwitchGroup::isCurrent(const std::string& label) const {
        return std::any_of(members_.begin(), members_.end(), [&](const SwitchableAttribute& m) {
            const auto* option = m.findOption(label);
            return option && option->value == m.currentValue;
        });
    }

} // namespace ssw::engine
