/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/bake_plan.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace ssw::engine {

    namespace {

        void sort_deepest_first(const host::SceneHost& host, std::vector<host::NodeId>& nodes) {
            std::stable_sort(nodes.begin(), nodes.end(), [&](const host::NodeId a, const host::NodeId b) {
                return host.hierarchyDepth(a) > host.hierarchyDepth(b);
            });
        }

    } // namespace

    BakePlan BakePlan::singleTime(const host::SceneHost& host, const double time, std::vector<host::NodeId> nodes) {
        BakePlan plan;
        plan.single_time_ = true;
        sort_deepest_first(host, nodes);
        plan.steps_.push_back({time, std::move(nodes)});
        return plan;
    }

    BakePlan BakePlan::resolve(const host::SceneHost& host, const Request& request) {
        if (!request.interval && !request.all_frames)
            return singleTime(host, host.currentTime(), request.targets);

        std::map<double, std::vector<host::NodeId>> by_time;
        for (const host::NodeId node : request.targets) {
            std::set<double> times;
            for (const double t : host.keyframeTimes(node, request.attribute))
                times.insert(t);
            if (request.include_rotation_keys) {
                for (const char* channel : host::ROTATE_CHANNELS) {
                    for (const double t : host.keyframeTimes(node, channel))
                        times.insert(t);
                }
            }

            for (const double t : times) {
                if (request.interval && !request.interval->contains(t))
                    continue;
                auto& nodes = by_time[t];
                if (std::find(nodes.begin(), nodes.end(), node) == nodes.end())
                    nodes.push_back(node);
            }
        }

        if (by_time.empty() && !request.interval) {
            LOG_DEBUG("No keys on '{}', switching at the current time", request.attribute);
            return singleTime(host, host.currentTime(), request.targets);
        }

        BakePlan plan;
        plan.interval_ = request.interval;
        for (auto& [time, nodes] : by_time) {
            sort_deepest_first(host, nodes);
            plan.steps_.push_back({time, std::move(nodes)});
        }
        return plan;
    }

    std::vector<host::NodeId> BakePlan::nodes() const {
        std::vector<host::NodeId> out;
        for (const auto& step : steps_) {
            for (const host::NodeId node : step.nodes) {
                if (std::find(out.begin(), out.end(), node) == out.end())
                    out.push_back(node);
            }
        }
        return out;
    }

} // namespace ssw::engine
