/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "host/undo_entry.hpp"
#include "core/logger.hpp"
#include "host/memory_scene.hpp"

namespace ssw::host {

    SceneSnapshot::SceneSnapshot(MemoryScene& scene, std::string name)
        : scene_(scene),
          name_(std::move(name)),
          before_(scene.state()) {}

    void SceneSnapshot::captureAfter() {
        after_ = scene_.state();
    }

    void SceneSnapshot::undo() {
        scene_.restoreState(before_);
    }

    void SceneSnapshot::redo() {
        if (!after_) {
            LOG_WARN("Redo of '{}' has no captured state", name_);
            return;
        }
        scene_.restoreState(*after_);
    }

} // namespace ssw::host
