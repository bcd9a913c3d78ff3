/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace ssw::core {
    namespace param {
        namespace {
            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(std::format("Config file not found: {}", path.string()));
                }

                std::ifstream file(path);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Cannot open config: {}", path.string()));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(std::format("JSON parse error in {}: {}", path.string(), e.what()));
                }
            }
        } // namespace

        nlohmann::json SwitchParameters::to_json() const {
            nlohmann::json json;
            json["all_frames"] = all_frames;
            json["euler_filter"] = euler_filter;
            json["show_rotate_order"] = show_rotate_order;
            json["namespace_display"] = namespace_display;
            json["log_level"] = log_level;
            return json;
        }

        SwitchParameters SwitchParameters::from_json(const nlohmann::json& json) {
            SwitchParameters params;
            params.all_frames = json.value("all_frames", params.all_frames);
            params.euler_filter = json.value("euler_filter", params.euler_filter);
            params.show_rotate_order = json.value("show_rotate_order", params.show_rotate_order);
            params.namespace_display = json.value("namespace_display", params.namespace_display);
            params.log_level = json.value("log_level", params.log_level);
            return params;
        }

        std::expected<SwitchParameters, std::string> read_parameters(const std::filesystem::path& path) {
            auto json = read_json_file(path);
            if (!json) {
                return std::unexpected(json.error());
            }
            if (!json->is_object()) {
                return std::unexpected(std::format("Config root must be an object: {}", path.string()));
            }

            try {
                auto params = SwitchParameters::from_json(*json);
                LOG_DEBUG("Loaded switch parameters from {}", path.string());
                return params;
            } catch (const nlohmann::json::type_error& e) {
                return std::unexpected(std::format("Invalid config value in {}: {}", path.string(), e.what()));
            }
        }

        std::expected<void, std::string> save_parameters(const SwitchParameters& params,
                                                         const std::filesystem::path& path) {
            std::ofstream file(path);
            if (!file.is_open()) {
                return std::unexpected(std::format("Cannot write config: {}", path.string()));
            }
            file << params.to_json().dump(2);
            if (!file) {
                return std::unexpected(std::format("Failed writing config: {}", path.string()));
            }
            LOG_DEBUG("Saved switch parameters to {}", path.string());
            return {};
        }

    } // namespace param
} // namespace ssw::core
