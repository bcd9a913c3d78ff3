/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "host/anim_curve.hpp"
#include "host/scene_host.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ssw::host {

    struct MemoryAttribute {
        double value = 0.0; // Static value, used while the attribute has no curve
        std::optional<AnimCurve> curve;
        std::vector<std::string> enum_labels; // Raw labels; empty for scalars
        std::string nice_name;                // Generated from the name when empty
        bool user = false;                    // Listed by listUserAttributes
        bool locked = false;

        [[nodiscard]] bool isEnum() const { return !enum_labels.empty(); }
        [[nodiscard]] bool isAnimated() const { return curve.has_value() && !curve->empty(); }
    };

    // An enum attribute whose value picks the node acting as parent space.
    // NULL_NODE selects world; values missing from the table fall back to the
    // hierarchy parent.
    struct SpaceBinding {
        std::string attribute;
        std::map<int, NodeId> targets;
    };

    struct MemoryNode {
        std::string name;
        NodeId parent = NULL_NODE;
        bool alive = true;
        bool has_transform = true;
        std::vector<std::string> user_order; // Declaration order of user attributes
        std::map<std::string, MemoryAttribute> attributes;
        std::optional<SpaceBinding> space;
    };

    struct Connection {
        Plug source;
        Plug destination;
    };

    // Everything an undo step restores. The time cursor is not part of it.
    struct SceneState {
        std::vector<MemoryNode> nodes; // Indexed by NodeId
        std::vector<NodeId> selection;
        std::vector<Connection> connections;
    };

} // namespace ssw::host
