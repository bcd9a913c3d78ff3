/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "host/scene_host.hpp"
#include <glm/glm.hpp>
#include <string>

namespace ssw::engine {

    // World-space reads and writes against the host. Only applyWorldMatrix
    // touches curves, and never the switch attribute's keys.
    class TransformSampler {
    public:
        explicit TransformSampler(host::SceneHost& host);

        // Moves the host to time when it is not already there. The caller owns
        // restoring the cursor, usually through a ScopedTimeCursor.
        [[nodiscard]] core::Result<glm::dmat4> captureWorldMatrix(host::NodeId node, double time);

        // Same read, but the cursor is back where it was on return
        [[nodiscard]] core::Result<glm::dmat4> sampleWorldMatrix(host::NodeId node, double time);

        // Switches the enum, then pins the node back onto matrix at the current time
        // AttributeNotSettable when any translate, rotate or scale channel of
        // node is locked or driven
        [[nodiscard]] core::Result<void> checkWritable(host::NodeId node) const;

        // Sets the enum and places node at matrix. Nothing is written when a
        // transform channel is not settable; if placement still fails the enum
        // is put back to its previous value.
        core::Result<void> applyWorldMatrix(host::NodeId node, const std::string& attribute, int value,
                                            const glm::dmat4& matrix, host::KeyMode mode);

    private:
        host::SceneHost& host_;
    };

} // namespace ssw::engine
