/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "host/scene_host.hpp"
#include "host/scene_state.hpp"
#include "host/undo_entry.hpp"
#include <array>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ssw::host {

    enum class WorldAccessKind : uint8_t {
        Read,
        Write
    };

    struct WorldAccess {
        WorldAccessKind kind;
        NodeId node;
        double time;
    };

    // In-memory scene graph that evaluates the same way a DAG host does:
    // world = parent space world * T * R(rotateOrder) * S, rotations in degrees.
    // Curves step for enum channels and interpolate linearly otherwise.
    class MemoryScene final : public SceneHost {
    public:
        MemoryScene() = default;
        ~MemoryScene() override = default;

        MemoryScene(const MemoryScene&) = delete;
        MemoryScene& operator=(const MemoryScene&) = delete;

        // Scene construction
        NodeId addNode(const std::string& name, NodeId parent = NULL_NODE, bool has_transform = true);
        void deleteNode(NodeId node);
        core::Result<void> addEnumAttribute(NodeId node, const std::string& attribute,
                                            std::vector<std::string> raw_labels, double value = 0.0);
        core::Result<void> addScalarAttribute(NodeId node, const std::string& attribute, double value = 0.0);
        core::Result<void> setLocked(NodeId node, const std::string& attribute, bool locked);
        core::Result<void> setNiceName(NodeId node, const std::string& attribute, const std::string& nice_name);
        core::Result<void> bindSpace(NodeId node, const std::string& attribute, std::map<int, NodeId> targets);
        void setTimelineSelection(std::optional<TimeRange> range);

        // Clears the scene and notifies SceneOpened listeners
        void openScene();

        // Undo stack
        bool undo();
        bool redo();
        [[nodiscard]] size_t undoCount() const { return undo_stack_.size(); }
        [[nodiscard]] size_t redoCount() const { return redo_stack_.size(); }
        [[nodiscard]] const SceneState& state() const { return state_; }
        void restoreState(const SceneState& state);

        [[nodiscard]] size_t listenerCount() const { return listeners_.size(); }

        // Reports every world-matrix read and write with the time it happened at
        void setAccessObserver(std::function<void(const WorldAccess&)> observer);

        // SceneHost
        [[nodiscard]] bool nodeExists(NodeId node) const override;
        [[nodiscard]] std::string nodeName(NodeId node) const override;
        [[nodiscard]] int hierarchyDepth(NodeId node) const override;

        [[nodiscard]] std::vector<NodeId> selection() const override;
        void setSelection(const std::vector<NodeId>& nodes) override;

        [[nodiscard]] std::vector<std::string> listUserAttributes(NodeId node) const override;
        [[nodiscard]] core::Result<AttributeKind> queryAttribute(NodeId node, const std::string& attribute) const override;
        [[nodiscard]] std::string niceName(NodeId node, const std::string& attribute) const override;
        [[nodiscard]] core::Result<double> getAttribute(NodeId node, const std::string& attribute) const override;
        [[nodiscard]] core::Result<double> getAttributeAt(NodeId node, const std::string& attribute, double time) const override;
        core::Result<void> setAttribute(NodeId node, const std::string& attribute, double value) override;
        [[nodiscard]] bool isSettable(const Plug& plug) const override;

        [[nodiscard]] std::vector<double> keyframeTimes(NodeId node, const std::string& attribute) const override;
        [[nodiscard]] std::vector<double> keyframeValues(NodeId node, const std::string& attribute) const override;
        core::Result<void> setKeyframe(NodeId node, const std::string& attribute, double time, double value) override;
        core::Result<void> removeKeyframe(NodeId node, const std::string& attribute, double time) override;

        [[nodiscard]] core::Result<glm::dmat4> worldMatrix(NodeId node) const override;
        core::Result<void> setWorldMatrix(NodeId node, const glm::dmat4& matrix, KeyMode mode) override;

        [[nodiscard]] double currentTime() const override { return current_time_; }
        void setCurrentTime(double time) override;
        [[nodiscard]] std::optional<TimeRange> timelineSelection() const override { return timeline_selection_; }

        [[nodiscard]] std::vector<Plug> listConnections(const Plug& plug) const override;
        [[nodiscard]] bool isConnected(const Plug& source, const Plug& destination) const override;
        core::Result<void> connect(const Plug& source, const Plug& destination) override;
        void disconnect(const Plug& source, const Plug& destination) override;

        core::Result<void> applyEulerFilter(NodeId node, const std::string& attribute) override;

        void suspendRefresh(bool suspend) override { refresh_suspended_ = suspend; }
        [[nodiscard]] bool isRefreshSuspended() const override { return refresh_suspended_; }

        ListenerId addListener(HostEvent event, std::function<void()> callback) override;
        void removeListener(ListenerId id) override;

        void openUndoChunk(const std::string& name) override;
        void closeUndoChunk() override;

    private:
        struct Listener {
            HostEvent event;
            std::function<void()> callback;
        };

        [[nodiscard]] const MemoryNode* findNode(NodeId node) const;
        MemoryNode* findNode(NodeId node);
        [[nodiscard]] core::Result<const MemoryAttribute*> findAttribute(NodeId node, const std::string& attribute) const;
        [[nodiscard]] core::Result<MemoryAttribute*> writableAttribute(NodeId node, const std::string& attribute);
        [[nodiscard]] bool isDriven(const Plug& plug) const;

        [[nodiscard]] double evaluate(const MemoryAttribute& attribute, double time) const;
        [[nodiscard]] core::Result<glm::dmat4> localMatrixAt(NodeId node, double time) const;
        [[nodiscard]] core::Result<glm::dmat4> parentWorldAt(NodeId node, double time, int depth) const;
        [[nodiscard]] core::Result<glm::dmat4> worldMatrixAt(NodeId node, double time, int depth) const;

        void writeChannel(MemoryAttribute& attribute, double value, KeyMode mode);
        void filterRotation(MemoryNode& node);
        void notify(HostEvent event) const;
        void observe(WorldAccessKind kind, NodeId node) const;

        SceneState state_;
        double current_time_ = 0.0;
        std::optional<TimeRange> timeline_selection_;
        bool refresh_suspended_ = false;

        std::map<ListenerId, Listener> listeners_;
        ListenerId next_listener_id_ = 1;

        int undo_depth_ = 0;
        std::unique_ptr<SceneSnapshot> pending_undo_;
        std::vector<UndoEntryPtr> undo_stack_;
        std::vector<UndoEntryPtr> redo_stack_;

        std::function<void(const WorldAccess&)> access_observer_;
    };

} // namespace ssw::host
