/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/switch_apply_engine.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace ssw::engine {

    namespace {

        // Keys attribute at time for the guard's lifetime. The key is removed on
        // every exit path, so the attribute ends up with no curve again.
        class TemporaryKey {
        public:
            TemporaryKey(host::SceneHost& host, const host::NodeId node, std::string attribute, const double time,
                         std::vector<std::string>& warnings)
                : host_(host),
                  node_(node),
                  attribute_(std::move(attribute)),
                  time_(time),
                  warnings_(warnings) {
                auto value = host_.getAttributeAt(node_, attribute_, time_);
                if (!value) {
                    status_ = std::unexpected(value.error());
                    return;
                }
                status_ = host_.setKeyframe(node_, attribute_, time_, *value);
            }

            ~TemporaryKey() {
                if (!status_)
                    return;
                if (auto removed = host_.removeKeyframe(node_, attribute_, time_); !removed) {
                    LOG_WARN("Temporary key on '{}.{}' was not removed: {}", host_.nodeName(node_), attribute_,
                             removed.error().describe());
                    warnings_.push_back(std::format("temporary key on {}.{} at {} was left in place",
                                                    host_.nodeName(node_), attribute_, time_));
                }
            }

            TemporaryKey(const TemporaryKey&) = delete;
            TemporaryKey& operator=(const TemporaryKey&) = delete;

            [[nodiscard]] const core::Result<void>& status() const { return status_; }

        private:
            host::SceneHost& host_;
            host::NodeId node_;
            std::string attribute_;
            double time_;
            std::vector<std::string>& warnings_;
            core::Result<void> status_;
        };

    } // namespace

    std::string ApplyResult::summary() const {
        std::string text = std::format("{} of {} targets switched", appliedCount, targetCount);
        if (aborted)
            text += " (bake aborted)";
        for (const auto& failure : failures)
            text += std::format("\n  {}", failure.describe());
        return text;
    }

    SwitchApplyEngine::SwitchApplyEngine(host::SceneHost& host, TransformSampler& sampler)
        : host_(host),
          sampler_(sampler) {}

    bool SwitchApplyEngine::recordFailure(Context& ctx, const host::NodeId node, core::Error error) {
        if (error.node.empty())
            error.node = host_.nodeName(node);
        LOG_WARN("Switch of '{}' failed: {}", error.node, error.describe());

        const bool aborts = error.code == core::ErrorCode::EvaluationError;
        ctx.failed.insert(node);
        ctx.result.failures.push_back(std::move(error));
        if (aborts)
            ctx.result.aborted = true;
        return !aborts;
    }

    core::Result<ApplyResult> SwitchApplyEngine::apply(const SwitchGroup& group, const std::string_view choice,
                                                       bool all_frames, std::optional<host::TimeRange> interval) {
        LOG_TIMER("SwitchApplyEngine::apply");

        const auto label = group.resolveLabel(choice);
        const auto* targets = label ? group.targets(*label) : nullptr;
        if (!targets)
            return core::make_error(core::ErrorCode::AttributeMissing, "",
                                    std::format("'{}' is not an option of {}", choice, group.attributeName()));

        const std::string attribute = group.attributeName();
        const bool rotate_order = attribute == host::ROTATE_ORDER_ATTRIBUTE;
        // A partial rotate order change would desync interpolation for the rest of the curve
        all_frames = all_frames || rotate_order;

        ApplyResult result;
        result.attribute = attribute;
        result.label = *label;
        result.targetCount = static_cast<int>(targets->size());

        Context ctx{.attribute = attribute,
                    .temporary_keys = !all_frames && !interval,
                    .result = result};

        std::vector<host::NodeId> live_targets;
        for (const auto& [node, value] : *targets) {
            if (!host_.nodeExists(node)) {
                recordFailure(ctx, node,
                              core::Error{core::ErrorCode::NodeMissing, std::format("#{}", node), "node was deleted"});
                continue;
            }
            ctx.values[node] = value;
            live_targets.push_back(node);
        }

        if (live_targets.empty()) {
            LOG_WARN("{}", result.summary());
            return result;
        }

        const BakePlan plan = BakePlan::resolve(host_, {.attribute = attribute,
                                                        .targets = live_targets,
                                                        .all_frames = all_frames,
                                                        .interval = interval,
                                                        .include_rotation_keys = rotate_order});
        if (plan.empty()) {
            result.warnings.push_back(std::format("no keys on {} inside [{}, {}]", attribute, interval->start,
                                                  interval->end));
            LOG_INFO("{}", result.summary());
            return result;
        }

        {
            // Listeners come back only after time and selection are restored
            host::UndoChunk undo(host_, std::format("Switch {} to {}", attribute, *label));
            host::ListenerDetachGuard detached(listeners_, host_);
            host::SelectionGuard selection(host_);
            host::ScopedTimeCursor cursor(host_);
            host::RefreshSuspendGuard refresh(host_);

            if (plan.isSingleTime())
                applySingleTime(plan, cursor, ctx);
            else
                bake(plan, cursor, ctx);

            if (params_.euler_filter)
                filterRotations(ctx);
        }

        const auto visited = plan.nodes();
        for (const host::NodeId node : live_targets) {
            if (std::find(visited.begin(), visited.end(), node) == visited.end())
                result.warnings.push_back(std::format("{} has no keys on {} to switch", host_.nodeName(node), attribute));
        }

        result.appliedCount = static_cast<int>(std::count_if(ctx.written.begin(), ctx.written.end(),
                                                             [&](const host::NodeId node) { return !ctx.failed.contains(node); }));

        if (refresh_callback_)
            refresh_callback_();

        if (result.complete())
            LOG_INFO("{}", result.summary());
        else
            LOG_WARN("{}", result.summary());
        return result;
    }

    void SwitchApplyEngine::applySingleTime(const BakePlan& plan, host::ScopedTimeCursor& cursor, Context& ctx) {
        const auto& step = plan.steps().front();
        cursor.moveTo(step.time);

        for (const host::NodeId node : step.nodes) {
            const int value = ctx.values.at(node);

            auto matrix = sampler_.captureWorldMatrix(node, step.time);
            if (!matrix) {
                if (!recordFailure(ctx, node, matrix.error()))
                    return;
                continue;
            }

            if (auto writable = sampler_.checkWritable(node); !writable) {
                if (!recordFailure(ctx, node, writable.error()))
                    return;
                continue;
            }

            std::optional<TemporaryKey> temporary;
            if (ctx.temporary_keys && host_.keyframeTimes(node, ctx.attribute).empty()) {
                temporary.emplace(host_, node, ctx.attribute, step.time, ctx.result.warnings);
                if (!temporary->status()) {
                    const auto error = temporary->status().error();
                    temporary.reset();
                    if (!recordFailure(ctx, node, error))
                        return;
                    continue;
                }
            }

            auto applied = sampler_.applyWorldMatrix(node, ctx.attribute, value, *matrix, host::KeyMode::Live);
            if (!applied) {
                if (!recordFailure(ctx, node, applied.error()))
                    return;
                continue;
            }
            ctx.written.insert(node);
        }
    }

    void SwitchApplyEngine::bake(const BakePlan& plan, host::ScopedTimeCursor& cursor, Context& ctx) {
        const auto& steps = plan.steps();
        std::vector<std::vector<std::pair<host::NodeId, glm::dmat4>>> captures(steps.size());

        // Pass A: every capture sees the scene before any switch
        size_t reached = steps.size();
        for (size_t i = 0; i < steps.size() && reached == steps.size(); ++i) {
            cursor.moveTo(steps[i].time);
            for (const host::NodeId node : steps[i].nodes) {
                if (ctx.failed.contains(node))
                    continue;
                auto matrix = sampler_.captureWorldMatrix(node, steps[i].time);
                if (!matrix) {
                    if (!recordFailure(ctx, node, matrix.error())) {
                        reached = i;
                        break;
                    }
                    continue;
                }
                captures[i].emplace_back(node, *matrix);
            }
        }
        LOG_DEBUG("Captured {} of {} bake time(s)", reached, steps.size());

        // Pass B
        for (size_t i = 0; i < reached; ++i) {
            const double time = steps[i].time;
            cursor.moveTo(time);
            for (const auto& [node, matrix] : captures[i]) {
                if (ctx.failed.contains(node))
                    continue;
                const int value = ctx.values.at(node);

                if (auto writable = sampler_.checkWritable(node); !writable) {
                    if (!recordFailure(ctx, node, writable.error()))
                        return;
                    continue;
                }

                // Value the switch key had before, put back if placement fails
                std::optional<double> previous;
                if (!host_.keyframeTimes(node, ctx.attribute).empty()) {
                    auto prior = host_.getAttributeAt(node, ctx.attribute, time);
                    if (!prior) {
                        if (!recordFailure(ctx, node, prior.error()))
                            return;
                        continue;
                    }
                    previous = *prior;
                    if (auto keyed = host_.setKeyframe(node, ctx.attribute, time, value); !keyed) {
                        if (!recordFailure(ctx, node, keyed.error()))
                            return;
                        continue;
                    }
                }

                auto applied = sampler_.applyWorldMatrix(node, ctx.attribute, value, matrix, host::KeyMode::Key);
                if (!applied) {
                    if (previous) {
                        if (auto restored = host_.setKeyframe(node, ctx.attribute, time, *previous); !restored) {
                            LOG_WARN("Could not restore key on '{}.{}' at {}: {}", host_.nodeName(node),
                                     ctx.attribute, time, restored.error().describe());
                        }
                    }
                    if (!recordFailure(ctx, node, applied.error()))
                        return;
                    continue;
                }
                ctx.written.insert(node);
            }
        }
    }

    void SwitchApplyEngine::filterRotations(Context& ctx) {
        for (const host::NodeId node : ctx.written) {
            if (!host_.nodeExists(node))
                continue;
            if (auto filtered = host_.applyEulerFilter(node, host::ROTATE_ATTRIBUTE); !filtered) {
                LOG_WARN("Euler filter on '{}' failed: {}", host_.nodeName(node), filtered.error().describe());
                ctx.result.warnings.push_back(
                    std::format("euler filter skipped on {}: {}", host_.nodeName(node), filtered.error().message));
            }
        }
    }

} // namespace ssw::engine
