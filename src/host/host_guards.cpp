/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "host/host_guards.hpp"
#include "core/logger.hpp"

namespace ssw::host {

    ScopedTimeCursor::ScopedTimeCursor(SceneHost& host)
        : host_(host),
          saved_time_(host.currentTime()) {}

    ScopedTimeCursor::~ScopedTimeCursor() {
        if (host_.currentTime() != saved_time_) {
            host_.setCurrentTime(saved_time_);
        }
    }

    void ScopedTimeCursor::moveTo(const double time) {
        if (host_.currentTime() != time) {
            host_.setCurrentTime(time);
        }
    }

    RefreshSuspendGuard::RefreshSuspendGuard(SceneHost& host)
        : host_(host),
          suspended_here_(!host.isRefreshSuspended()) {
        if (suspended_here_) {
            host_.suspendRefresh(true);
        }
    }

    RefreshSuspendGuard::~RefreshSuspendGuard() {
        if (suspended_here_) {
            host_.suspendRefresh(false);
        }
    }

    UndoChunk::UndoChunk(SceneHost& host, const std::string& name) : host_(host) {
        host_.openUndoChunk(name);
    }

    UndoChunk::~UndoChunk() {
        host_.closeUndoChunk();
    }

    SelectionGuard::SelectionGuard(SceneHost& host)
        : host_(host),
          saved_(host.selection()) {}

    SelectionGuard::~SelectionGuard() {
        std::vector<NodeId> alive;
        alive.reserve(saved_.size());
        for (const NodeId node : saved_) {
            if (host_.nodeExists(node))
                alive.push_back(node);
        }
        if (alive.size() != saved_.size()) {
            LOG_DEBUG("Restoring selection without {} deleted nodes", saved_.size() - alive.size());
        }
        if (alive != host_.selection()) {
            host_.setSelection(alive);
        }
    }

    ListenerDetachGuard::ListenerDetachGuard(ListenerSet* listeners, SceneHost& host)
        : listeners_(listeners),
          host_(host),
          was_attached_(listeners && listeners->isAttached()) {
        if (was_attached_) {
            listeners_->detach();
        }
    }

    ListenerDetachGuard::~ListenerDetachGuard() {
        if (was_attached_) {
            listeners_->attach(host_);
        }
    }

} // namespace ssw::host
