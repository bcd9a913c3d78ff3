/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/parameters.hpp"
#include "engine/bake_plan.hpp"
#include "engine/switch_types.hpp"
#include "engine/transform_sampler.hpp"
#include "host/host_guards.hpp"
#include "host/listener_set.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ssw::engine {

    struct ApplyResult {
        std::string attribute;
        std::string label;
        int targetCount = 0;
        int appliedCount = 0;
        std::vector<std::string> warnings;
        std::vector<core::Error> failures; // One per failed node
        bool aborted = false;              // An EvaluationError stopped the remaining times

        [[nodiscard]] bool complete() const { return failures.empty() && !aborted; }

        // "2 of 3 targets switched" followed by one line per failure
        [[nodiscard]] std::string summary() const;
    };

    // Commits an option of a SwitchGroup while holding every target's world
    // pose at every time the plan visits.
    //
    // All captures happen before the first write, times ascending. The whole
    // operation is one host undo chunk; a partial bake is reported, not rolled
    // back.
    class SwitchApplyEngine {
    public:
        SwitchApplyEngine(host::SceneHost& host, TransformSampler& sampler);

        void setParameters(const core::param::SwitchParameters& params) { params_ = params; }

        // Detached from the host while an apply runs
        void setListeners(host::ListenerSet* listeners) { listeners_ = listeners; }

        // Called once everything has been restored
        void setRefreshCallback(std::function<void()> callback) { refresh_callback_ = std::move(callback); }

        // choice is an option label or its display text ("yzx (Best)"). An
        // unknown choice fails with AttributeMissing before anything is touched.
        [[nodiscard]] core::Result<ApplyResult> apply(const SwitchGroup& group, std::string_view choice, bool all_frames,
                                                      std::optional<host::TimeRange> interval = std::nullopt);

    private:
        struct Context {
            std::string attribute;
            std::map<host::NodeId, int> values; // Per-node enum value of the chosen label
            bool temporary_keys = false;
            ApplyResult& result;
            std::set<host::NodeId> failed;
            std::set<host::NodeId> written;
        };

        void applySingleTime(const BakePlan& plan, host::ScopedTimeCursor& cursor, Context& ctx);
        void bake(const BakePlan& plan, host::ScopedTimeCursor& cursor, Context& ctx);
        void filterRotations(Context& ctx);

        // Returns false when the error aborts the remaining bake
        bool recordFailure(Context& ctx, host::NodeId node, core::Error error);

        host::SceneHost& host_;
        TransformSampler& sampler_;
        core::param::SwitchParameters params_;
        host::ListenerSet* listeners_ = nullptr;
        std::function<void()> refresh_callback_;
    };

} // namespace ssw::engine
