/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/parameters.hpp"
#include "engine/gimbal_analyzer.hpp"
#include "engine/switch_apply_engine.hpp"
#include "engine/switch_discovery.hpp"
#include "engine/transform_sampler.hpp"
#include "host/listener_set.hpp"
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace ssw::engine {

    // What the UI layer talks to. Owns the current discovery result and keeps
    // it in sync with the host's selection, undo and scene events.
    class SwitchSession {
    public:
        using GroupsChangedCallback = std::function<void(const std::vector<SwitchGroup>&)>;

        explicit SwitchSession(host::SceneHost& host, core::param::SwitchParameters params = {});
        ~SwitchSession();

        SwitchSession(const SwitchSession&) = delete;
        SwitchSession& operator=(const SwitchSession&) = delete;

        // Rebuilds the groups from scratch for selection
        const std::vector<SwitchGroup>& discover(const std::vector<host::NodeId>& selection);

        [[nodiscard]] GimbalReport analyzeGimbal(host::NodeId node) const;

        [[nodiscard]] core::Result<ApplyResult> apply(const SwitchGroup& group, std::string_view choice, bool all_frames,
                                                      std::optional<host::TimeRange> interval = std::nullopt);

        // Uses the configured all_frames flag and the host's timeline selection
        [[nodiscard]] core::Result<ApplyResult> apply(const SwitchGroup& group, std::string_view choice);

        // Re-runs discovery when the host selection differs from the last
        // scanned one, ignoring order, or when forced. Returns whether it ran.
        bool refresh(bool force = false);

        void attachListeners();
        void detachListeners();
        [[nodiscard]] bool listenersAttached() const { return listeners_.isAttached(); }

        void setParameters(const core::param::SwitchParameters& params);
        [[nodiscard]] const core::param::SwitchParameters& parameters() const { return params_; }

        void setGroupsChangedCallback(GroupsChangedCallback callback) { groups_changed_ = std::move(callback); }

        [[nodiscard]] const std::vector<SwitchGroup>& groups() const { return groups_; }
        [[nodiscard]] const SwitchGroup* group(std::string_view attribute) const;
        [[nodiscard]] const std::vector<host::NodeId>& scannedSelection() const { return scanned_; }

    private:
        void registerListeners();

        host::SceneHost& host_;
        core::param::SwitchParameters params_;

        GimbalAnalyzer analyzer_;
        SwitchAttributeDiscovery discovery_;
        TransformSampler sampler_;
        SwitchApplyEngine engine_;
        host::ListenerSet listeners_;

        std::vector<SwitchGroup> groups_;
        std::vector<host::NodeId> scanned_;
        GroupsChangedCallback groups_changed_;
    };

} // namespace ssw::engine
