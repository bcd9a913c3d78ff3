/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "engine/gimbal_analyzer.hpp"
#include "engine/switch_types.hpp"
#include "host/scene_host.hpp"
#include <expected>
#include <string>
#include <vector>

namespace ssw::engine {

    // Why an attribute does not qualify as a switch. An outcome, not an error.
    struct DiscoveryRejected {
        std::string reason;
    };

    class SwitchAttributeDiscovery {
    public:
        SwitchAttributeDiscovery(const host::SceneHost& host, const GimbalAnalyzer& analyzer);

        // Groups are in first-seen attribute order, members in selection order.
        // Always built from scratch.
        [[nodiscard]] std::vector<SwitchGroup> discover(const std::vector<host::NodeId>& selection,
                                                        const core::param::SwitchParameters& params) const;

        [[nodiscard]] std::expected<SwitchableAttribute, DiscoveryRejected> inspect(host::NodeId node,
                                                                                    const std::string& attribute) const;

    private:
        const host::SceneHost& host_;
        const GimbalAnalyzer& analyzer_;
    };

} // namespace ssw::engine
