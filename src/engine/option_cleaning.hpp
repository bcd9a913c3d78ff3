/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "engine/switch_types.hpp"
#include <string>
#include <vector>

namespace ssw::engine {

    // Minimum number of distinct labels for an enum to act as a switch
    inline constexpr size_t MIN_SWITCH_OPTIONS = 2;

    // Cleans host enum labels into options.
    //  - "World=3" carries its value; labels without one take previous value + 1,
    //    starting from 0
    //  - surrounding whitespace is trimmed
    //  - labels without any alphanumeric character are dropped, but still
    //    consume a value
    //  - repeated labels are dropped, the first one wins
    [[nodiscard]] std::vector<EnumOption> clean_enum_labels(const std::vector<std::string>& raw_labels);

    // Labels only, e.g. for re-cleaning an already cleaned list
    [[nodiscard]] std::vector<std::string> option_labels(const std::vector<EnumOption>& options);

    // Back to host form ("World=0"), so clean_enum_labels(to_raw_labels(x)) == x
    [[nodiscard]] std::vector<std::string> to_raw_labels(const std::vector<EnumOption>& options);

} // namespace ssw::engine
