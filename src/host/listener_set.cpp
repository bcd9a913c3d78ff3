/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "host/listener_set.hpp"
#include "core/logger.hpp"

namespace ssw::host {

    ListenerSet::~ListenerSet() {
        detach();
    }

    void ListenerSet::add(const HostEvent event, std::function<void()> callback) {
        entries_.push_back({event, std::move(callback), 0});
        if (host_) {
            entries_.back().id = host_->addListener(event, entries_.back().callback);
        }
    }

    void ListenerSet::clear() {
        detach();
        entries_.clear();
    }

    void ListenerSet::attach(SceneHost& host) {
        if (host_ == &host)
            return;
        detach();
        host_ = &host;
        for (auto& entry : entries_) {
            entry.id = host.addListener(entry.event, entry.callback);
        }
        LOG_TRACE("Attached {} listeners", entries_.size());
    }

    void ListenerSet::detach() {
        if (!host_)
            return;
        for (auto& entry : entries_) {
            host_->removeListener(entry.id);
            entry.id = 0;
        }
        host_ = nullptr;
        LOG_TRACE("Detached {} listeners", entries_.size());
    }

} // namespace ssw::host
