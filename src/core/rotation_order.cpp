/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/rotation_order.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>
#include <string>

namespace ssw::core {

    namespace {

        constexpr double PI = std::numbers::pi;
        constexpr double SINGULAR_EPSILON = 1e-9;

        struct OrderInfo {
            std::string_view name;
            std::array<int, 3> axes;
            bool cyclic; // xyz, yzx, zxy
        };

        constexpr std::array<OrderInfo, 6> ORDER_TABLE = {{
            {"xyz", {0, 1, 2}, true},
            {"yzx", {1, 2, 0}, true},
            {"zxy", {2, 0, 1}, true},
            {"xzy", {0, 2, 1}, false},
            {"yxz", {1, 0, 2}, false},
            {"zyx", {2, 1, 0}, false},
        }};

        // Tabulated per order rather than derived from ORDER_TABLE
        constexpr std::array<int, 6> MIDDLE_AXIS = {
            1, // xyz -> y
            2, // yzx -> z
            0, // zxy -> x
            2, // xzy -> z
            0, // yxz -> x
            1, // zyx -> y
        };

        const OrderInfo& info(const RotationOrder order) {
            return ORDER_TABLE[static_cast<size_t>(order)];
        }

        glm::dmat3 axis_rotation(const int axis, const double angle) {
            const double c = std::cos(angle);
            const double s = std::sin(angle);
            glm::dmat3 m(1.0);
            // glm is column-major: m[col][row]
            switch (axis) {
            case 0:
                m[1][1] = c;
                m[2][1] = -s;
                m[1][2] = s;
                m[2][2] = c;
                break;
            case 1:
                m[0][0] = c;
                m[2][0] = s;
                m[0][2] = -s;
                m[2][2] = c;
                break;
            default:
                m[0][0] = c;
                m[1][0] = -s;
                m[0][1] = s;
                m[1][1] = c;
                break;
            }
            return m;
        }

        double at(const glm::dmat3& m, const int row, const int col) {
            return m[col][row];
        }

    } // namespace

    std::optional<RotationOrder> parse_rotation_order(const std::string_view label) {
        std::string cleaned;
        for (const char c : label) {
            if (!std::isspace(static_cast<unsigned char>(c)))
                cleaned.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        for (size_t i = 0; i < ORDER_TABLE.size(); ++i) {
            if (ORDER_TABLE[i].name == cleaned)
                return static_cast<RotationOrder>(i);
        }
        return std::nullopt;
    }

    std::optional<RotationOrder> rotation_order_from_index(const int index) {
        if (index < 0 || index >= static_cast<int>(ORDER_TABLE.size()))
            return std::nullopt;
        return static_cast<RotationOrder>(index);
    }

    std::string_view to_string(const RotationOrder order) {
        return info(order).name;
    }

    std::array<int, 3> rotation_axes(const RotationOrder order) {
        return info(order).axes;
    }

    int middle_axis(const RotationOrder order) {
        return MIDDLE_AXIS[static_cast<size_t>(order)];
    }

    glm::dmat3 euler_to_matrix(const glm::dvec3& euler, const RotationOrder order) {
        const auto [i, j, k] = info(order).axes;
        // First axis is applied first, so it sits rightmost for column vectors
        return axis_rotation(k, euler[k]) * axis_rotation(j, euler[j]) * axis_rotation(i, euler[i]);
    }

    glm::dvec3 matrix_to_euler(const glm::dmat3& rotation, const RotationOrder order) {
        const auto& [name, axes, cyclic] = info(order);
        const auto [i, j, k] = axes;
        const double parity = cyclic ? 1.0 : -1.0;

        glm::dvec3 euler(0.0);
        const double sin_middle = std::clamp(-parity * at(rotation, k, i), -1.0, 1.0);
        euler[j] = std::asin(sin_middle);

        if (std::abs(sin_middle) < 1.0 - SINGULAR_EPSILON) {
            euler[i] = std::atan2(parity * at(rotation, k, j), at(rotation, k, k));
            euler[k] = std::atan2(parity * at(rotation, j, i), at(rotation, i, i));
        } else {
            // Gimbal locked: first and last axes coincide, put it all on the first
            euler[i] = std::atan2(-parity * at(rotation, j, k), at(rotation, j, j));
            euler[k] = 0.0;
        }
        return euler;
    }

    glm::dvec3 reorder_euler(const glm::dvec3& euler, const RotationOrder from, const RotationOrder to) {
        if (from == to)
            return euler;
        return matrix_to_euler(euler_to_matrix(euler, from), to);
    }

    double approach_angle(const double reference, double angle) {
        while (angle - reference > PI)
            angle -= 2.0 * PI;
        while (angle - reference < -PI)
            angle += 2.0 * PI;
        return angle;
    }

    glm::dvec3 closest_euler(const glm::dvec3& previous, const glm::dvec3& value, const RotationOrder order) {
        glm::dvec3 direct = value;
        for (int a = 0; a < 3; ++a)
            direct[a] = approach_angle(previous[a], direct[a]);

        const auto [i, j, k] = info(order).axes;
        glm::dvec3 alternative;
        alternative[i] = value[i] + PI;
        alternative[j] = PI - value[j];
        alternative[k] = value[k] + PI;
        for (int a = 0; a < 3; ++a)
            alternative[a] = approach_angle(previous[a], alternative[a]);

        const glm::dvec3 d0 = direct - previous;
        const glm::dvec3 d1 = alternative - previous;
        return glm::dot(d1, d1) < glm::dot(d0, d0) ? alternative : direct;
    }

    glm::dmat4 compose_transform(const TransformComponents& components, const RotationOrder order) {
        const glm::dmat3 rotation = euler_to_matrix(components.rotate, order);
        glm::dmat4 m(1.0);
        for (int c = 0; c < 3; ++c)
            m[c] = glm::dvec4(rotation[c] * components.scale[c], 0.0);
        m[3] = glm::dvec4(components.translate, 1.0);
        return m;
    }

    std::optional<TransformComponents> decompose_transform(const glm::dmat4& matrix, const RotationOrder order) {
        TransformComponents out;
        out.translate = glm::dvec3(matrix[3]);

        glm::dmat3 basis(matrix);
        for (int c = 0; c < 3; ++c) {
            out.scale[c] = glm::length(basis[c]);
            if (out.scale[c] < SINGULAR_EPSILON)
                return std::nullopt;
            basis[c] /= out.scale[c];
        }
        if (glm::determinant(basis) < 0.0) {
            out.scale.x = -out.scale.x;
            basis[0] = -basis[0];
        }

        out.rotate = matrix_to_euler(basis, order);
        return out;
    }

} // namespace ssw::core
