/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "engine/switch_types.hpp"
#include "host/scene_host.hpp"
#include <vector>

namespace ssw::engine {

    // Scores every rotation order a node offers by its worst-case distance
    // from gimbal lock over the node's rotation keys.
    class GimbalAnalyzer {
    public:
        explicit GimbalAnalyzer(const host::SceneHost& host);

        // Empty when the node has no rotateOrder enum. Reads values through
        // getAttributeAt, so the host's time cursor and keys are untouched.
        [[nodiscard]] GimbalReport analyze(host::NodeId node) const;

        // 100 when the middle axis angle is 0, 0 when it is +-90 degrees
        [[nodiscard]] static int score(double middle_degrees);

        // All equal scores classify as None. Otherwise tiers are relative to
        // the maximum: Best at 0, Good within 2, OK within 6.
        [[nodiscard]] static std::vector<GimbalTier> classify(const std::vector<int>& scores);

    private:
        const host::SceneHost& host_;
    };

} // namespace ssw::engine
