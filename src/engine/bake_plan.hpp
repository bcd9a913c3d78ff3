/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "host/scene_host.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ssw::engine {

    struct BakeStep {
        double time = 0.0;
        std::vector<host::NodeId> nodes; // Deepest in the hierarchy first
    };

    // Times and nodes one apply visits. Steps are strictly ascending in time.
    class BakePlan {
    public:
        struct Request {
            std::string attribute;
            std::vector<host::NodeId> targets;
            bool all_frames = false;
            std::optional<host::TimeRange> interval;
            bool include_rotation_keys = false; // Also visit rotate channel keys
        };

        static BakePlan singleTime(const host::SceneHost& host, double time, std::vector<host::NodeId> nodes);

        // No interval and no all_frames gives the current time. Otherwise the
        // key times of each target inside the interval; when that is empty and
        // no interval was given, the current time again.
        static BakePlan resolve(const host::SceneHost& host, const Request& request);

        [[nodiscard]] bool isSingleTime() const { return single_time_; }
        [[nodiscard]] bool empty() const { return steps_.empty(); }
        [[nodiscard]] const std::vector<BakeStep>& steps() const { return steps_; }
        [[nodiscard]] const std::optional<host::TimeRange>& interval() const { return interval_; }

        // Every node visited at least once, in first-visit order
        [[nodiscard]] std::vector<host::NodeId> nodes() const;

    private:
        bool single_time_ = false;
        std::vector<BakeStep> steps_;
        std::optional<host::TimeRange> interval_;
    };

} // namespace ssw::engine
