/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine/option_cleaning.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <optional>
#include <string_view>

namespace ssw::engine {

    namespace {

        std::string_view trim(std::string_view text) {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
                text.remove_prefix(1);
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
                text.remove_suffix(1);
            return text;
        }

        std::optional<int> parse_int(std::string_view text) {
            text = trim(text);
            if (text.empty())
                return std::nullopt;
            if (text.front() == '+')
                text.remove_prefix(1);
            int value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
                return std::nullopt;
            return value;
        }

        bool has_alnum(const std::string_view text) {
            return std::any_of(text.begin(), text.end(),
                               [](const char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; });
        }

    } // namespace

    std::vector<EnumOption> clean_enum_labels(const std::vector<std::string>& raw_labels) {
        std::vector<EnumOption> options;
        int next_value = 0;

        for (const auto& raw : raw_labels) {
            std::string_view label = raw;
            int value = next_value;

            if (const auto eq = label.rfind('='); eq != std::string_view::npos) {
                if (const auto parsed = parse_int(label.substr(eq + 1))) {
                    value = *parsed;
                    label = label.substr(0, eq);
                }
            }
            next_value = value + 1;

            label = trim(label);
            // '=' is reserved for the value suffix
            if (label.find('=') != std::string_view::npos) {
                LOG_TRACE("Dropping enum label '{}' with a stray '='", raw);
                continue;
            }
            if (!has_alnum(label)) {
                LOG_TRACE("Dropping placeholder enum label '{}'", raw);
                continue;
            }
            const bool duplicate = std::any_of(options.begin(), options.end(),
                                               [label](const EnumOption& o) { return o.label == label; });
            if (duplicate)
                continue;

            options.push_back({std::string(label), value});
        }
        return options;
    }

    std::vector<std::string> option_labels(const std::vector<EnumOption>& options) {
        std::vector<std::string> labels;
        labels.reserve(options.size());
        for (const auto& option : options)
            labels.push_back(option.label);
        return labels;
    }

    std::vector<std::string> to_raw_labels(const std::vector<EnumOption>& options) {
        std::vector<std::string> raw;
        raw.reserve(options.size());
        for (const auto& option : options)
            raw.push_back(std::format("{}={}", option.label, option.value));
        return raw;
    }

} // namespace ssw::engine
