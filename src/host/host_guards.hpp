/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "host/listener_set.hpp"
#include "host/scene_host.hpp"
#include <string>
#include <vector>

namespace ssw::host {

    // Owns the host's current-time cursor for its lifetime and puts it back on
    // destruction, including when unwinding.
    class ScopedTimeCursor {
    public:
        explicit ScopedTimeCursor(SceneHost& host);
        ~ScopedTimeCursor();
        ScopedTimeCursor(const ScopedTimeCursor&) = delete;
        ScopedTimeCursor& operator=(const ScopedTimeCursor&) = delete;

        // No-op when the host is already at time
        void moveTo(double time);
        [[nodiscard]] double savedTime() const { return saved_time_; }

    private:
        SceneHost& host_;
        double saved_time_;
    };

    // Nested use is safe: only the guard that suspended refresh resumes it.
    class RefreshSuspendGuard {
    public:
        explicit RefreshSuspendGuard(SceneHost& host);
        ~RefreshSuspendGuard();
        RefreshSuspendGuard(const RefreshSuspendGuard&) = delete;
        RefreshSuspendGuard& operator=(const RefreshSuspendGuard&) = delete;

    private:
        SceneHost& host_;
        bool suspended_here_;
    };

    class UndoChunk {
    public:
        UndoChunk(SceneHost& host, const std::string& name);
        ~UndoChunk();
        UndoChunk(const UndoChunk&) = delete;
        UndoChunk& operator=(const UndoChunk&) = delete;

    private:
        SceneHost& host_;
    };

    class SelectionGuard {
    public:
        explicit SelectionGuard(SceneHost& host);
        ~SelectionGuard();
        SelectionGuard(const SelectionGuard&) = delete;
        SelectionGuard& operator=(const SelectionGuard&) = delete;

    private:
        SceneHost& host_;
        std::vector<NodeId> saved_;
    };

    // Detaches a listener set for the guard's lifetime if it was attached.
    class ListenerDetachGuard {
    public:
        ListenerDetachGuard(ListenerSet* listeners, SceneHost& host);
        ~ListenerDetachGuard();
        ListenerDetachGuard(const ListenerDetachGuard&) = delete;
        ListenerDetachGuard& operator=(const ListenerDetachGuard&) = delete;

    private:
        ListenerSet* listeners_;
        SceneHost& host_;
        bool was_attached_;
    };

} // namespace ssw::host
