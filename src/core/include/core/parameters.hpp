/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <expected>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace ssw::core {
    namespace param {

        struct SSW_CORE_API SwitchParameters {
            bool all_frames = false;        // Apply switches on every key of the switch attribute
            bool euler_filter = true;       // Run the Euler filter on rotation curves after an apply
            bool show_rotate_order = true;  // Offer rotateOrder as a switch
            bool namespace_display = false; // Keep namespaces in control labels
            std::string log_level = "info";

            nlohmann::json to_json() const;
            static SwitchParameters from_json(const nlohmann::json& json);
        };

        // Keys missing from the file keep their defaults. A missing file or malformed JSON is an error.
        SSW_CORE_API std::expected<SwitchParameters, std::string> read_parameters(const std::filesystem::path& path);

        SSW_CORE_API std::expected<void, std::string> save_parameters(const SwitchParameters& params,
                                                                      const std::filesystem::path& path);

    } // namespace param
} // namespace ssw::core
