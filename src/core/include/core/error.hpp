/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace ssw::core {

    enum class ErrorCode : uint8_t {
        NodeMissing,          // Node deleted or never existed
        AttributeMissing,     // Attribute or option label not present on the node
        AttributeNotSettable, // Locked or driven by a connection
        EvaluationError       // Host could not resolve a value or transform
    };

    [[nodiscard]] constexpr std::string_view to_string(const ErrorCode code) {
        switch (code) {
        case ErrorCode::NodeMissing: return "NodeMissing";
        case ErrorCode::AttributeMissing: return "AttributeMissing";
        case ErrorCode::AttributeNotSettable: return "AttributeNotSettable";
        case ErrorCode::EvaluationError: return "EvaluationError";
        }
        return "Unknown";
    }

    struct Error {
        ErrorCode code = ErrorCode::EvaluationError;
        std::string node; // Node name when known, empty otherwise
        std::string message;

        [[nodiscard]] std::string describe() const {
            if (node.empty())
                return std::format("{}: {}", to_string(code), message);
            return std::format("{} ({}): {}", to_string(code), node, message);
        }
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    [[nodiscard]] inline std::unexpected<Error> make_error(const ErrorCode code, std::string node, std::string message) {
        return std::unexpected(Error{code, std::move(node), std::move(message)});
    }

} // namespace ssw::core
