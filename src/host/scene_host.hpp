/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ssw::host {

    using NodeId = int32_t;
    constexpr NodeId NULL_NODE = -1;

    using ListenerId = uint64_t;

    // Built-in channel names
    inline constexpr std::array<const char*, 3> TRANSLATE_CHANNELS = {"translateX", "translateY", "translateZ"};
    inline constexpr std::array<const char*, 3> ROTATE_CHANNELS = {"rotateX", "rotateY", "rotateZ"};
    inline constexpr std::array<const char*, 3> SCALE_CHANNELS = {"scaleX", "scaleY", "scaleZ"};
    inline constexpr const char* ROTATE_ORDER_ATTRIBUTE = "rotateOrder";
    // Compound name accepted by applyEulerFilter for the three rotate channels
    inline constexpr const char* ROTATE_ATTRIBUTE = "rotate";

    // Attribute plug: node + attribute name
    struct Plug {
        NodeId node = NULL_NODE;
        std::string attribute;

        bool operator==(const Plug&) const = default;
    };

    // Closed interval [start, end]
    struct TimeRange {
        double start = 0.0;
        double end = 0.0;

        [[nodiscard]] bool contains(const double time) const { return time >= start && time <= end; }
    };

    // Raw labels as the host declares them, e.g. "World=0", "Local"
    struct EnumAttribute {
        std::vector<std::string> raw_labels;
    };

    struct OtherAttribute {};

    // Resolved once at discovery time
    using AttributeKind = std::variant<OtherAttribute, EnumAttribute>;

    enum class HostEvent : uint8_t {
        SelectionChanged,
        TimeChanged,
        Undo,
        SceneOpened
    };

    // How a world-matrix write lands on the transform channels
    enum class KeyMode : uint8_t {
        Live, // Set values; channels that are already animated get a key at the current time
        Key   // Key every transform channel at the current time
    };

    // Scene graph of the animation host. Everything the switch engine reads or
    // writes goes through this interface. Methods that can fail return
    // core::Result and never throw.
    class SceneHost {
    public:
        virtual ~SceneHost() = default;

        // Nodes
        [[nodiscard]] virtual bool nodeExists(NodeId node) const = 0;
        [[nodiscard]] virtual std::string nodeName(NodeId node) const = 0;
        // 0 for root nodes
        [[nodiscard]] virtual int hierarchyDepth(NodeId node) const = 0;

        // Selection
        [[nodiscard]] virtual std::vector<NodeId> selection() const = 0;
        virtual void setSelection(const std::vector<NodeId>& nodes) = 0;

        // Attributes
        [[nodiscard]] virtual std::vector<std::string> listUserAttributes(NodeId node) const = 0;
        [[nodiscard]] virtual core::Result<AttributeKind> queryAttribute(NodeId node, const std::string& attribute) const = 0;
        [[nodiscard]] virtual std::string niceName(NodeId node, const std::string& attribute) const = 0;
        [[nodiscard]] virtual core::Result<double> getAttribute(NodeId node, const std::string& attribute) const = 0;
        [[nodiscard]] virtual core::Result<double> getAttributeAt(NodeId node, const std::string& attribute, double time) const = 0;
        virtual core::Result<void> setAttribute(NodeId node, const std::string& attribute, double value) = 0;
        // False for missing, locked or connection-driven attributes
        [[nodiscard]] virtual bool isSettable(const Plug& plug) const = 0;

        // Keyframes
        [[nodiscard]] virtual std::vector<double> keyframeTimes(NodeId node, const std::string& attribute) const = 0;
        [[nodiscard]] virtual std::vector<double> keyframeValues(NodeId node, const std::string& attribute) const = 0;
        virtual core::Result<void> setKeyframe(NodeId node, const std::string& attribute, double time, double value) = 0;
        virtual core::Result<void> removeKeyframe(NodeId node, const std::string& attribute, double time) = 0;

        // World transform at the current time
        [[nodiscard]] virtual core::Result<glm::dmat4> worldMatrix(NodeId node) const = 0;
        virtual core::Result<void> setWorldMatrix(NodeId node, const glm::dmat4& matrix, KeyMode mode) = 0;

        // Time
        [[nodiscard]] virtual double currentTime() const = 0;
        virtual void setCurrentTime(double time) = 0;
        [[nodiscard]] virtual std::optional<TimeRange> timelineSelection() const = 0;

        // Connections
        [[nodiscard]] virtual std::vector<Plug> listConnections(const Plug& plug) const = 0;
        [[nodiscard]] virtual bool isConnected(const Plug& source, const Plug& destination) const = 0;
        virtual core::Result<void> connect(const Plug& source, const Plug& destination) = 0;
        virtual void disconnect(const Plug& source, const Plug& destination) = 0;

        // Removes 180/360 degree discontinuities from a rotation curve. ROTATE_ATTRIBUTE
        // filters the three rotate channels together.
        virtual core::Result<void> applyEulerFilter(NodeId node, const std::string& attribute) = 0;

        // Viewport refresh
        virtual void suspendRefresh(bool suspend) = 0;
        [[nodiscard]] virtual bool isRefreshSuspended() const = 0;

        // Event listeners
        virtual ListenerId addListener(HostEvent event, std::function<void()> callback) = 0;
        virtual void removeListener(ListenerId id) = 0;

        // Undo transaction boundary
        virtual void openUndoChunk(const std::string& name) = 0;
        virtual void closeUndoChunk() = 0;
    };

} // namespace ssw::host
