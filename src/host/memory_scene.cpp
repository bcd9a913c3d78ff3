/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "host/memory_scene.hpp"
#include "core/logger.hpp"
#include "core/rotation_order.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <set>
#include <utility>

namespace ssw::host {

    namespace {

        constexpr int MAX_EVALUATION_DEPTH = 256;

        const std::vector<std::string> ROTATE_ORDER_LABELS = {"xyz", "yzx", "zxy", "xzy", "yxz", "zyx"};

        // "rotateOrder" -> "Rotate Order", "follow_space" -> "Follow Space"
        std::string generate_nice_name(const std::string& attribute) {
            std::string out;
            for (size_t i = 0; i < attribute.size(); ++i) {
                const char c = attribute[i];
                if (c == '_') {
                    if (!out.empty() && out.back() != ' ')
                        out.push_back(' ');
                    continue;
                }
                const bool upper = std::isupper(static_cast<unsigned char>(c)) != 0;
                if (upper && i > 0 && std::islower(static_cast<unsigned char>(attribute[i - 1])))
                    out.push_back(' ');
                if (out.empty() || out.back() == ' ')
                    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
                else
                    out.push_back(c);
            }
            return out;
        }

        std::string describe_node(const NodeId node) {
            return std::format("#{}", node);
        }

        bool is_rotate_channel(const std::string& attribute) {
            return std::any_of(ROTATE_CHANNELS.begin(), ROTATE_CHANNELS.end(),
                               [&](const char* channel) { return attribute == channel; });
        }

        void ensure_curve(MemoryAttribute& attribute) {
            if (!attribute.curve) {
                attribute.curve.emplace(attribute.isEnum() ? CurveInterpolation::Step
                                                           : CurveInterpolation::Linear);
            }
        }

    } // namespace

    // ---- Scene construction ----

    NodeId MemoryScene::addNode(const std::string& name, NodeId parent, const bool has_transform) {
        if (parent != NULL_NODE && !nodeExists(parent)) {
            LOG_WARN("Parent {} of '{}' does not exist, adding it as a root", parent, name);
            parent = NULL_NODE;
        }

        MemoryNode node;
        node.name = name;
        node.parent = parent;
        node.has_transform = has_transform;
        if (has_transform) {
            for (const char* channel : TRANSLATE_CHANNELS)
                node.attributes[channel] = MemoryAttribute{};
            for (const char* channel : ROTATE_CHANNELS)
                node.attributes[channel] = MemoryAttribute{};
            for (const char* channel : SCALE_CHANNELS)
                node.attributes[channel] = MemoryAttribute{.value = 1.0};
            node.attributes[ROTATE_ORDER_ATTRIBUTE] = MemoryAttribute{.enum_labels = ROTATE_ORDER_LABELS};
        }

        const auto id = static_cast<NodeId>(state_.nodes.size());
        state_.nodes.push_back(std::move(node));
        LOG_TRACE("Added node '{}' ({})", name, id);
        return id;
    }

    void MemoryScene::deleteNode(const NodeId node) {
        if (!nodeExists(node))
            return;

        // Descendants go with their parent
        std::set<NodeId> removed{node};
        bool grew = true;
        while (grew) {
            grew = false;
            for (NodeId id = 0; id < static_cast<NodeId>(state_.nodes.size()); ++id) {
                const auto& n = state_.nodes[id];
                if (n.alive && !removed.contains(id) && removed.contains(n.parent)) {
                    removed.insert(id);
                    grew = true;
                }
            }
        }

        for (const NodeId id : removed)
            state_.nodes[id].alive = false;

        std::erase_if(state_.connections, [&](const Connection& c) {
            return removed.contains(c.source.node) || removed.contains(c.destination.node);
        });
        std::erase_if(state_.selection, [&](const NodeId id) { return removed.contains(id); });
        LOG_DEBUG("Deleted {} node(s) starting at '{}'", removed.size(), state_.nodes[node].name);
    }

    core::Result<void> MemoryScene::addEnumAttribute(const NodeId node, const std::string& attribute,
                                                     std::vector<std::string> raw_labels, const double value) {
        auto* n = findNode(node);
        if (!n)
            return core::make_error(core::ErrorCode::NodeMissing, describe_node(node), "node does not exist");
        if (raw_labels.empty())
            return core::make_error(core::ErrorCode::AttributeNotSettable, n->name,
                                    std::format("enum '{}' needs at least one label", attribute));
        if (n->attributes.contains(attribute))
            return core::make_error(core::ErrorCode::AttributeNotSettable, n->name,
                                    std::format("attribute '{}' already exists", attribute));

        n->attributes[attribute] = MemoryAttribute{.value = value, .enum_labels = std::move(raw_labels), .user = true};
        n->user_order.push_back(attribute);
        return {};
    }

    core::Result<void> MemoryScene::addScalarAttribute(const NodeId node, const std::string& attribute,
                                                       const double value) {
        auto* n = findNode(node);
        if (!n)
            return core::make_error(core::ErrorCode::NodeMissing, describe_node(node), "node does not exist");
        if (n->attributes.contains(attribute))
            return core::make_error(core::ErrorCode::AttributeNotSettable, n->name,
                                    std::format("attribute '{}' already exists", attribute));

        n->attributes[attribute] = MemoryAttribute{.value = value, .user = true};
        n->user_order.push_back(attribute);
        return {};
    }

    core::Result<void> MemoryScene::setLocked(const NodeId node, const std::string& attribute, const bool locked) {
        if (auto found = findAttribute(node, attribute); !found)
            return std::unexpected(found.error());
        findNode(node)->attributes.at(attribute).locked = locked;
        return {};
    }

    core::Result<void> MemoryScene::setNiceName(const NodeId node, const std::string& attribute,
                                                const std::string& nice_name) {
        if (auto found = findAttribute(node, attribute); !found)
            return std::unexpected(found.error());
        findNode(node)->attributes.at(attribute).nice_name = nice_name;
        return {};
    }

    core::Result<void> MemoryScene::bindSpace(const NodeId node, const std::string& attribute,
                                              std::map<int, NodeId> targets) {
        auto found = findAttribute(node, attribute);
        if (!found)
            return std::unexpected(found.error());
        auto* n = findNode(node);
        if (!(*found)->isEnum())
            return core::make_error(core::ErrorCode::AttributeMissing, n->name,
                                    std::format("'{}' is not an enum attribute", attribute));
        for (const auto& [value, target] : targets) {
            if (target != NULL_NODE && !nodeExists(target))
                return core::make_error(core::ErrorCode::NodeMissing, describe_node(target),
                                        std::format("space target for value {} does not exist", value));
        }
        n->space = SpaceBinding{attribute, std::move(targets)};
        return {};
    }

    void MemoryScene::setTimelineSelection(std::optional<TimeRange> range) {
        timeline_selection_ = range;
    }

    void MemoryScene::openScene() {
        state_ = SceneState{};
        current_time_ = 0.0;
        timeline_selection_.reset();
        refresh_suspended_ = false;
        undo_depth_ = 0;
        pending_undo_.reset();
        undo_stack_.clear();
        redo_stack_.clear();
        LOG_INFO("Opened empty scene");
        notify(HostEvent::SceneOpened);
    }

    // ---- Undo ----

    bool MemoryScene::undo() {
        if (undo_depth_ > 0) {
            LOG_WARN("Cannot undo while an undo chunk is open");
            return false;
        }
        if (undo_stack_.empty())
            return false;

        auto entry = std::move(undo_stack_.back());
        undo_stack_.pop_back();
        LOG_DEBUG("Undo '{}'", entry->name());
        entry->undo();
        redo_stack_.push_back(std::move(entry));
        notify(HostEvent::Undo);
        return true;
    }

    bool MemoryScene::redo() {
        if (undo_depth_ > 0 || redo_stack_.empty())
            return false;

        auto entry = std::move(redo_stack_.back());
        redo_stack_.pop_back();
        LOG_DEBUG("Redo '{}'", entry->name());
        entry->redo();
        undo_stack_.push_back(std::move(entry));
        notify(HostEvent::Undo);
        return true;
    }

    void MemoryScene::restoreState(const SceneState& state) {
        state_ = state;
    }

    void MemoryScene::openUndoChunk(const std::string& name) {
        if (undo_depth_++ == 0)
            pending_undo_ = std::make_unique<SceneSnapshot>(*this, name);
    }

    void MemoryScene::closeUndoChunk() {
        if (undo_depth_ == 0) {
            LOG_WARN("closeUndoChunk without a matching openUndoChunk");
            return;
        }
        if (--undo_depth_ > 0)
            return;

        pending_undo_->captureAfter();
        undo_stack_.push_back(std::move(pending_undo_));
        redo_stack_.clear();
    }

    void MemoryScene::setAccessObserver(std::function<void(const WorldAccess&)> observer) {
        access_observer_ = std::move(observer);
    }

    // ---- Nodes and selection ----

    const MemoryNode* MemoryScene::findNode(const NodeId node) const {
        if (node < 0 || node >= static_cast<NodeId>(state_.nodes.size()))
            return nullptr;
        const auto& n = state_.nodes[node];
        return n.alive ? &n : nullptr;
    }

    MemoryNode* MemoryScene::findNode(const NodeId node) {
        return const_cast<MemoryNode*>(std::as_const(*this).findNode(node));
    }

    bool MemoryScene::nodeExists(const NodeId node) const {
        return findNode(node) != nullptr;
    }

    std::string MemoryScene::nodeName(const NodeId node) const {
        const auto* n = findNode(node);
        return n ? n->name : std::string{};
    }

    int MemoryScene::hierarchyDepth(const NodeId node) const {
        int depth = 0;
        const auto* n = findNode(node);
        while (n && n->parent != NULL_NODE && depth < MAX_EVALUATION_DEPTH) {
            ++depth;
            n = findNode(n->parent);
        }
        return depth;
    }

    std::vector<NodeId> MemoryScene::selection() const {
        return state_.selection;
    }

    void MemoryScene::setSelection(const std::vector<NodeId>& nodes) {
        std::vector<NodeId> filtered;
        for (const NodeId id : nodes) {
            if (nodeExists(id) && std::find(filtered.begin(), filtered.end(), id) == filtered.end())
                filtered.push_back(id);
        }
        if (filtered == state_.selection)
            return;
        state_.selection = std::move(filtered);
        notify(HostEvent::SelectionChanged);
    }

    // ---- Attributes ----

    core::Result<const MemoryAttribute*> MemoryScene::findAttribute(const NodeId node,
                                                                     const std::string& attribute) const {
        const auto* n = findNode(node);
        if (!n)
            return core::make_error(core::ErrorCode::NodeMissing, describe_node(node), "node does not exist");
        const auto it = n->attributes.find(attribute);
        if (it == n->attributes.end())
            return core::make_error(core::ErrorCode::AttributeMissing, n->name,
                                    std::format("no attribute '{}'", attribute));
        return &it->second;
    }

    core::Result<MemoryAttribute*> MemoryScene::writableAttribute(const NodeId node, const std::string& attribute) {
        auto found = findAttribute(node, attribute);
        if (!found)
            return std::unexpected(found.error());
        if ((*found)->locked)
            return core::make_error(core::ErrorCode::AttributeNotSettable, nodeName(node),
                                    std::format("'{}' is locked", attribute));
        if (isDriven(Plug{node, attribute}))
            return core::make_error(core::ErrorCode::AttributeNotSettable, nodeName(node),
                                    std::format("'{}' is driven by a connection", attribute));
        return const_cast<MemoryAttribute*>(*found);
    }

    bool MemoryScene::isDriven(const Plug& plug) const {
        return std::any_of(state_.connections.begin(), state_.connections.end(),
                           [&](const Connection& c) { return c.destination == plug; });
    }

    double MemoryScene::evaluate(const MemoryAttribute& attribute, const double time) const {
        return attribute.isAnimated() ? attribute.curve->evaluate(time) : attribute.value;
    }

    std::vector<std::string> MemoryScene::listUserAttributes(const NodeId node) const {
        const auto* n = findNode(node);
        return n ? n->user_order : std::vector<std::string>{};
    }

    core::Result<AttributeKind> MemoryScene::queryAttribute(const NodeId node, const std::string& attribute) const {
        auto found = findAttribute(node, attribute);
        if (!found)
            return std::unexpected(found.error());
        if ((*found)->isEnum())
            return AttributeKind{EnumAttribute{(*found)->enum_labels}};
        return AttributeKind{OtherAttribute{}};
    }

    std::string MemoryScene::niceName(const NodeId node, const std::string& attribute) const {
        if (auto found = findAttribute(node, attribute); found && !(*found)->nice_name.empty())
            return (*found)->nice_name;
        return generate_nice_name(attribute);
    }

    core::Result<double> MemoryScene::getAttribute(const NodeId node, const std::string& attribute) const {
        return getAttributeAt(node, attribute, current_time_);
    }

    core::Result<double> MemoryScene::getAttributeAt(const NodeId node, const std::string& attribute,
                                                     const double time) const {
        auto found = findAttribute(node, attribute);
        if (!found)
            return std::unexpected(found.error());
        return evaluate(**found, time);
    }

    core::Result<void> MemoryScene::setAttribute(const NodeId node, const std::string& attribute, const double value) {
        auto writable = writableAttribute(node, attribute);
        if (!writable)
            return std::unexpected(writable.error());
        writeChannel(**writable, value, KeyMode::Live);
        return {};
    }

    bool MemoryScene::isSettable(const Plug& plug) const {
        const auto found = findAttribute(plug.node, plug.attribute);
        return found && !(*found)->locked && !isDriven(plug);
    }

    void MemoryScene::writeChannel(MemoryAttribute& attribute, const double value, const KeyMode mode) {
        if (mode == KeyMode::Key || attribute.isAnimated()) {
            ensure_curve(attribute);
            attribute.curve->setKey(current_time_, value);
        } else {
            attribute.value = value;
        }
    }

    // ---- Keyframes ----

    std::vector<double> MemoryScene::keyframeTimes(const NodeId node, const std::string& attribute) const {
        auto found = findAttribute(node, attribute);
        if (!found || !(*found)->isAnimated())
            return {};
        return (*found)->curve->times();
    }

    std::vector<double> MemoryScene::keyframeValues(const NodeId node, const std::string& attribute) const {
        auto found = findAttribute(node, attribute);
        if (!found || !(*found)->isAnimated())
            return {};
        return (*found)->curve->values();
    }

    core::Result<void> MemoryScene::setKeyframe(const NodeId node, const std::string& attribute, const double time,
                                                const double value) {
        auto writable = writableAttribute(node, attribute);
        if (!writable)
            return std::unexpected(writable.error());
        ensure_curve(**writable);
        (*writable)->curve->setKey(time, value);
        return {};
    }

    core::Result<void> MemoryScene::removeKeyframe(const NodeId node, const std::string& attribute, const double time) {
        auto writable = writableAttribute(node, attribute);
        if (!writable)
            return std::unexpected(writable.error());

        auto& attr = **writable;
        if (!attr.curve || !attr.curve->hasKeyAt(time))
            return {};

        const double key_value = attr.curve->evaluate(time);
        attr.curve->removeKey(time);
        if (attr.curve->empty()) {
            // Last key gone: the curve is deleted and the attribute keeps the key's value
            attr.curve.reset();
            attr.value = key_value;
        }
        return {};
    }

    // ---- Transforms ----

    core::Result<glm::dmat4> MemoryScene::localMatrixAt(const NodeId node, const double time) const {
        const auto* n = findNode(node);
        if (!n)
            return core::make_error(core::ErrorCode::NodeMissing, describe_node(node), "node does not exist");
        if (!n->has_transform)
            return core::make_error(core::ErrorCode::EvaluationError, n->name, "node has no transform");

        const auto channel = [&](const char* name) { return evaluate(n->attributes.at(name), time); };

        const auto order_index = static_cast<int>(std::lround(channel(ROTATE_ORDER_ATTRIBUTE)));
        const auto order = core::rotation_order_from_index(order_index);
        if (!order)
            return core::make_error(core::ErrorCode::EvaluationError, n->name,
                                    std::format("invalid rotate order {}", order_index));

        core::TransformComponents components;
        for (int a = 0; a < 3; ++a) {
            components.translate[a] = channel(TRANSLATE_CHANNELS[a]);
            components.rotate[a] = glm::radians(channel(ROTATE_CHANNELS[a]));
            components.scale[a] = channel(SCALE_CHANNELS[a]);
        }
        return core::compose_transform(components, *order);
    }

    core::Result<glm::dmat4> MemoryScene::parentWorldAt(const NodeId node, const double time, const int depth) const {
        if (depth > MAX_EVALUATION_DEPTH)
            return core::make_error(core::ErrorCode::EvaluationError, nodeName(node), "cycle in parent spaces");

        const auto* n = findNode(node);
        if (!n)
            return core::make_error(core::ErrorCode::NodeMissing, describe_node(node), "node does not exist");

        if (n->space) {
            const auto value = static_cast<int>(std::lround(evaluate(n->attributes.at(n->space->attribute), time)));
            if (const auto it = n->space->targets.find(value); it != n->space->targets.end()) {
                if (it->second == NULL_NODE)
                    return glm::dmat4(1.0);
                if (!nodeExists(it->second))
                    return core::make_error(core::ErrorCode::EvaluationError, n->name,
                                            std::format("space target of value {} no longer exists", value));
                return worldMatrixAt(it->second, time, depth + 1);
            }
        }

        if (n->parent == NULL_NODE)
            return glm::dmat4(1.0);
        return worldMatrixAt(n->parent, time, depth + 1);
    }

    core::Result<glm::dmat4> MemoryScene::worldMatrixAt(const NodeId node, const double time, const int depth) const {
        auto parent = parentWorldAt(node, time, depth);
        if (!parent)
            return std::unexpected(parent.error());
        auto local = localMatrixAt(node, time);
        if (!local)
            return std::unexpected(local.error());
        return *parent * *local;
    }

    core::Result<glm::dmat4> MemoryScene::worldMatrix(const NodeId node) const {
        if (!nodeExists(node))
            return core::make_error(core::ErrorCode::NodeMissing, describe_node(node), "node does not exist");
        observe(WorldAccessKind::Read, node);
        return worldMatrixAt(node, current_time_, 0);
    }

    core::Result<void> MemoryScene::setWorldMatrix(const NodeId node, const glm::dmat4& matrix, const KeyMode mode) {
        auto* n = findNode(node);
        if (!n)
            return core::make_error(core::ErrorCode::NodeMissing, describe_node(node), "node does not exist");
        if (!n->has_transform)
            return core::make_error(core::ErrorCode::EvaluationError, n->name, "node has no transform");

        std::array<MemoryAttribute*, 9> channels{};
        for (int a = 0; a < 3; ++a) {
            for (const auto& [slot, names] : {std::pair{0, TRANSLATE_CHANNELS}, std::pair{3, ROTATE_CHANNELS},
                                              std::pair{6, SCALE_CHANNELS}}) {
                auto writable = writableAttribute(node, names[a]);
                if (!writable)
                    return std::unexpected(writable.error());
                channels[slot + a] = *writable;
            }
        }

        auto parent = parentWorldAt(node, current_time_, 0);
        if (!parent)
            return std::unexpected(parent.error());

        const auto order_index = static_cast<int>(std::lround(evaluate(n->attributes.at(ROTATE_ORDER_ATTRIBUTE), current_time_)));
        const auto order = core::rotation_order_from_index(order_index);
        if (!order)
            return core::make_error(core::ErrorCode::EvaluationError, n->name,
                                    std::format("invalid rotate order {}", order_index));

        const glm::dmat4 local = glm::inverse(*parent) * matrix;
        const auto components = core::decompose_transform(local, *order);
        if (!components)
            return core::make_error(core::ErrorCode::EvaluationError, n->name, "matrix has zero scale");

        glm::dvec3 current_rotation;
        for (int a = 0; a < 3; ++a)
            current_rotation[a] = glm::radians(evaluate(*channels[3 + a], current_time_));
        const glm::dvec3 rotation = core::closest_euler(current_rotation, components->rotate, *order);

        for (int a = 0; a < 3; ++a) {
            writeChannel(*channels[a], components->translate[a], mode);
            writeChannel(*channels[3 + a], glm::degrees(rotation[a]), mode);
            writeChannel(*channels[6 + a], components->scale[a], mode);
        }
        observe(WorldAccessKind::Write, node);
        return {};
    }

    void MemoryScene::setCurrentTime(const double time) {
        if (time == current_time_)
            return;
        current_time_ = time;
        notify(HostEvent::TimeChanged);
    }

    // ---- Connections ----

    std::vector<Plug> MemoryScene::listConnections(const Plug& plug) const {
        std::vector<Plug> out;
        for (const auto& c : state_.connections) {
            if (c.source == plug)
                out.push_back(c.destination);
            else if (c.destination == plug)
                out.push_back(c.source);
        }
        return out;
    }

    bool MemoryScene::isConnected(const Plug& source, const Plug& destination) const {
        return std::any_of(state_.connections.begin(), state_.connections.end(), [&](const Connection& c) {
            return c.source == source && c.destination == destination;
        });
    }

    core::Result<void> MemoryScene::connect(const Plug& source, const Plug& destination) {
        for (const auto* plug : {&source, &destination}) {
            if (auto found = findAttribute(plug->node, plug->attribute); !found)
                return std::unexpected(found.error());
        }
        if (isConnected(source, destination))
            return {};

        // A destination has a single driver
        std::erase_if(state_.connections, [&](const Connection& c) { return c.destination == destination; });
        state_.connections.push_back({source, destination});
        return {};
    }

    void MemoryScene::disconnect(const Plug& source, const Plug& destination) {
        std::erase_if(state_.connections, [&](const Connection& c) {
            return c.source == source && c.destination == destination;
        });
    }

    // ---- Euler filter ----

    core::Result<void> MemoryScene::applyEulerFilter(const NodeId node, const std::string& attribute) {
        auto* n = findNode(node);
        if (!n)
            return core::make_error(core::ErrorCode::NodeMissing, describe_node(node), "node does not exist");

        if (attribute == ROTATE_ATTRIBUTE || is_rotate_channel(attribute)) {
            if (!n->has_transform)
                return core::make_error(core::ErrorCode::AttributeMissing, n->name, "node has no rotate channels");
            filterRotation(*n);
            return {};
        }

        auto writable = writableAttribute(node, attribute);
        if (!writable)
            return std::unexpected(writable.error());
        auto& attr = **writable;
        if (!attr.isAnimated())
            return {};

        // Single angle curve: unwrap consecutive keys by whole turns
        const auto& keys = attr.curve->keys();
        double previous = glm::radians(keys.front().value);
        for (size_t i = 1; i < keys.size(); ++i) {
            previous = core::approach_angle(previous, glm::radians(keys[i].value));
            attr.curve->setKeyValue(i, glm::degrees(previous));
        }
        return {};
    }

    void MemoryScene::filterRotation(MemoryNode& node) {
        std::array<MemoryAttribute*, 3> channels{};
        std::set<double> time_set;
        bool all_animated = true;
        for (int a = 0; a < 3; ++a) {
            channels[a] = &node.attributes.at(ROTATE_CHANNELS[a]);
            if (channels[a]->isAnimated()) {
                for (const double t : channels[a]->curve->times())
                    time_set.insert(t);
            } else {
                all_animated = false;
            }
        }
        if (time_set.empty())
            return;

        const auto& order_attribute = node.attributes.at(ROTATE_ORDER_ATTRIBUTE);
        std::optional<glm::dvec3> previous;
        for (const double t : time_set) {
            glm::dvec3 sample;
            bool keyed_triple = all_animated;
            for (int a = 0; a < 3; ++a) {
                sample[a] = glm::radians(evaluate(*channels[a], t));
                keyed_triple = keyed_triple && channels[a]->curve->hasKeyAt(t);
            }

            glm::dvec3 filtered = sample;
            if (previous) {
                const auto order = core::rotation_order_from_index(static_cast<int>(std::lround(evaluate(order_attribute, t))))
                                       .value_or(core::RotationOrder::XYZ);
                if (keyed_triple) {
                    // Either Euler solution may be chosen when all three channels carry the key
                    filtered = core::closest_euler(*previous, sample, order);
                } else {
                    for (int a = 0; a < 3; ++a)
                        filtered[a] = core::approach_angle((*previous)[a], sample[a]);
                }
            }

            for (int a = 0; a < 3; ++a) {
                if (channels[a]->isAnimated() && channels[a]->curve->hasKeyAt(t))
                    channels[a]->curve->setKey(t, glm::degrees(filtered[a]));
            }
            previous = filtered;
        }
        LOG_TRACE("Euler filtered '{}' over {} samples", node.name, time_set.size());
    }

    // ---- Events ----

    ListenerId MemoryScene::addListener(const HostEvent event, std::function<void()> callback) {
        const ListenerId id = next_listener_id_++;
        listeners_.emplace(id, Listener{event, std::move(callback)});
        return id;
    }

    void MemoryScene::removeListener(const ListenerId id) {
        listeners_.erase(id);
    }

    void MemoryScene::notify(const HostEvent event) const {
        // Callbacks may add or remove listeners
        std::vector<std::function<void()>> callbacks;
        for (const auto& [id, listener] : listeners_) {
            if (listener.event == event)
                callbacks.push_back(listener.callback);
        }
        for (const auto& callback : callbacks)
            callback();
    }

    void MemoryScene::observe(const WorldAccessKind kind, const NodeId node) const {
        if (access_observer_)
            access_observer_(WorldAccess{kind, node, current_time_});
    }

} // namespace ssw::host
