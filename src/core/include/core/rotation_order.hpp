/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <array>
#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <string_view>

namespace ssw::core {

    // Enum values match the host's rotateOrder attribute. The letters name the
    // axes in the order they are applied, so XYZ rotates about X first.
    enum class RotationOrder : uint8_t {
        XYZ = 0,
        YZX = 1,
        ZXY = 2,
        XZY = 3,
        YXZ = 4,
        ZYX = 5
    };

    inline constexpr std::array<RotationOrder, 6> ALL_ROTATION_ORDERS = {
        RotationOrder::XYZ, RotationOrder::YZX, RotationOrder::ZXY,
        RotationOrder::XZY, RotationOrder::YXZ, RotationOrder::ZYX};

    // "xyz", "yzx", ...; case-insensitive, surrounding whitespace ignored
    [[nodiscard]] SSW_CORE_API std::optional<RotationOrder> parse_rotation_order(std::string_view label);
    [[nodiscard]] SSW_CORE_API std::optional<RotationOrder> rotation_order_from_index(int index);
    [[nodiscard]] SSW_CORE_API std::string_view to_string(RotationOrder order);

    // Axis indices (0=x, 1=y, 2=z) in application order
    [[nodiscard]] SSW_CORE_API std::array<int, 3> rotation_axes(RotationOrder order);

    // Axis whose angle reaches +-90 degrees at this order's gimbal singularity
    [[nodiscard]] SSW_CORE_API int middle_axis(RotationOrder order);

    // Euler angles are stored per axis (x about X, ...) in radians.
    [[nodiscard]] SSW_CORE_API glm::dmat3 euler_to_matrix(const glm::dvec3& euler, RotationOrder order);
    [[nodiscard]] SSW_CORE_API glm::dvec3 matrix_to_euler(const glm::dmat3& rotation, RotationOrder order);

    // Same physical rotation expressed under another order
    [[nodiscard]] SSW_CORE_API glm::dvec3 reorder_euler(const glm::dvec3& euler, RotationOrder from, RotationOrder to);

    // Shift angle by whole turns so it lies within pi of reference
    [[nodiscard]] SSW_CORE_API double approach_angle(double reference, double angle);

    // Picks between the two equivalent Euler solutions the one closest to
    // previous, after unwrapping each angle towards it.
    [[nodiscard]] SSW_CORE_API glm::dvec3 closest_euler(const glm::dvec3& previous, const glm::dvec3& value,
                                                        RotationOrder order);

    struct TransformComponents {
        glm::dvec3 translate{0.0};
        glm::dvec3 rotate{0.0}; // radians
        glm::dvec3 scale{1.0};
    };

    // T * R(order) * S
    [[nodiscard]] SSW_CORE_API glm::dmat4 compose_transform(const TransformComponents& components, RotationOrder order);

    // Shear is discarded. Returns nullopt when an axis has (near) zero scale.
    [[nodiscard]] SSW_CORE_API std::optional<TransformComponents> decompose_transform(const glm::dmat4& matrix,
                                                                                      RotationOrder order);

} // namespace ssw::core
