/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "host/scene_host.hpp"
#include <functional>
#include <vector>

namespace ssw::host {

    // A set of callbacks owned by one client, installed on and removed from the
    // host as a unit. Registrations survive detach() so attach() can reinstall them.
    class ListenerSet {
    public:
        ListenerSet() = default;
        ~ListenerSet();

        ListenerSet(const ListenerSet&) = delete;
        ListenerSet& operator=(const ListenerSet&) = delete;

        void add(HostEvent event, std::function<void()> callback);
        void clear();

        void attach(SceneHost& host);
        void detach();

        [[nodiscard]] bool isAttached() const { return host_ != nullptr; }
        [[nodiscard]] size_t size() const { return entries_.size(); }

    private:
        struct Entry {
            HostEvent event;
            std::function<void()> callback;
            ListenerId id = 0;
        };

        std::vector<Entry> entries_;
        SceneHost* host_ = nullptr;
    };

} // namespace ssw::host
