/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/switch_session.hpp"
#include "core/logger.hpp"
#include <algorithm>

namespace ssw::engine {

    namespace {

        bool same_nodes(std::vector<host::NodeId> a, std::vector<host::NodeId> b) {
            std::sort(a.begin(), a.end());
            std::sort(b.begin(), b.end());
            return a == b;
        }

    } // namespace

    SwitchSession::SwitchSession(host::SceneHost& host, core::param::SwitchParameters params)
        : host_(host),
          params_(std::move(params)),
          analyzer_(host),
          discovery_(host, analyzer_),
          sampler_(host),
          engine_(host, sampler_) {
        engine_.setParameters(params_);
        engine_.setListeners(&listeners_);
        engine_.setRefreshCallback([this] { refresh(true); });
        registerListeners();
    }

    SwitchSession::~SwitchSession() {
        listeners_.clear();
    }

    void SwitchSession::registerListeners() {
        listeners_.add(host::HostEvent::SelectionChanged, [this] { refresh(false); });
        listeners_.add(host::HostEvent::Undo, [this] { refresh(true); });
        listeners_.add(host::HostEvent::SceneOpened, [this] {
            LOG_DEBUG("Scene opened, rebuilding listeners");
            listeners_.clear();
            registerListeners();
            listeners_.attach(host_);
            refresh(true);
        });
    }

    void SwitchSession::attachListeners() {
        listeners_.attach(host_);
    }

    void SwitchSession::detachListeners() {
        listeners_.detach();
    }

    const std::vector<SwitchGroup>& SwitchSession::discover(const std::vector<host::NodeId>& selection) {
        scanned_ = selection;
        groups_ = discovery_.discover(selection, params_);
        if (groups_changed_)
            groups_changed_(groups_);
        return groups_;
    }

    GimbalReport SwitchSession::analyzeGimbal(const host::NodeId node) const {
        return analyzer_.analyze(node);
    }

    core::Result<ApplyResult> SwitchSession::apply(const SwitchGroup& group, const std::string_view choice,
                                                   const bool all_frames, std::optional<host::TimeRange> interval) {
        return engine_.apply(group, choice, all_frames, interval);
    }

    core::Result<ApplyResult> SwitchSession::apply(const SwitchGroup& group, const std::string_view choice) {
        return engine_.apply(group, choice, params_.all_frames, host_.timelineSelection());
    }

    bool SwitchSession::refresh(const bool force) {
        auto selection = host_.selection();
        if (!force && same_nodes(selection, scanned_))
            return false;

        LOG_TRACE("Refreshing switches for {} selected node(s)", selection.size());
        discover(selection);
        return true;
    }

    void SwitchSession::setParameters(const core::param::SwitchParameters& params) {
        const bool rescan = params.show_rotate_order != params_.show_rotate_order ||
                            params.namespace_display != params_.namespace_display;
        if (params.log_level != params_.log_level)
            core::Logger::get().set_level(core::parse_log_level(params.log_level));

        params_ = params;
        engine_.setParameters(params_);
        if (rescan)
            refresh(true);
    }

    const SwitchGroup* SwitchSession::group(const std::string_view attribute) const {
        const auto it = std::find_if(groups_.begin(), groups_.end(),
                                     [attribute](const SwitchGroup& g) { return g.attributeName() == attribute; });
        return it != groups_.end() ? &*it : nullptr;
    }

} // namespace ssw::engine
