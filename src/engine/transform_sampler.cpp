/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/transform_sampler.hpp"
#include "core/logger.hpp"
#include "host/host_guards.hpp"
#include <format>

namespace ssw::engine {

    TransformSampler::TransformSampler(host::SceneHost& host)
        : host_(host) {}

    core::Result<glm::dmat4> TransformSampler::captureWorldMatrix(const host::NodeId node, const double time) {
        if (!host_.nodeExists(node))
            return core::make_error(core::ErrorCode::NodeMissing, std::format("#{}", node), "node no longer exists");

        if (host_.currentTime() != time)
            host_.setCurrentTime(time);

        auto matrix = host_.worldMatrix(node);
        if (!matrix) {
            LOG_DEBUG("Capture of '{}' at {} failed: {}", host_.nodeName(node), time, matrix.error().describe());
        }
        return matrix;
    }

    core::Result<glm::dmat4> TransformSampler::sampleWorldMatrix(const host::NodeId node, const double time) {
        host::ScopedTimeCursor cursor(host_);
        return captureWorldMatrix(node, time);
    }

    core::Result<void> TransformSampler::checkWritable(const host::NodeId node) const {
        if (!host_.nodeExists(node))
            return core::make_error(core::ErrorCode::NodeMissing, std::format("#{}", node), "node no longer exists");

        for (const auto& channels : {host::TRANSLATE_CHANNELS, host::ROTATE_CHANNELS, host::SCALE_CHANNELS}) {
            for (const char* channel : channels) {
                if (!host_.isSettable(host::Plug{node, channel}))
                    return core::make_error(core::ErrorCode::AttributeNotSettable, host_.nodeName(node),
                                            std::format("'{}' is locked or driven", channel));
            }
        }
        return {};
    }

    core::Result<void> TransformSampler::applyWorldMatrix(const host::NodeId node, const std::string& attribute,
                                                          const int value, const glm::dmat4& matrix,
                                                          const host::KeyMode mode) {
        if (auto writable = checkWritable(node); !writable)
            return writable;

        const auto previous = host_.getAttribute(node, attribute);
        if (!previous)
            return std::unexpected(previous.error());

        if (auto set = host_.setAttribute(node, attribute, static_cast<double>(value)); !set)
            return set;

        auto placed = host_.setWorldMatrix(node, matrix, mode);
        if (!placed) {
            if (auto reverted = host_.setAttribute(node, attribute, *previous); !reverted) {
                LOG_WARN("Could not put '{}.{}' back to {}: {}", host_.nodeName(node), attribute, *previous,
                         reverted.error().describe());
            }
        }
        return placed;
    }

} // namespace ssw::engine
