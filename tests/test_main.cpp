/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <cstdlib>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    // Initialize loggers - check LOG_LEVEL env var
    auto log_level = ssw::core::LogLevel::Warn;
    if (const char* env = std::getenv("LOG_LEVEL")) {
        log_level = ssw::core::parse_log_level(env);
    }
    ssw::core::Logger::get().init(log_level);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
