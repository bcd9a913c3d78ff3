/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace ssw::core::param {

    class SwitchParametersTest : public ::testing::Test {
    protected:
        void SetUp() override {
            dir_ = std::filesystem::temp_directory_path() /
                   ("ssw_params_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
            std::filesystem::create_directories(dir_);
        }

        void TearDown() override {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }

        std::filesystem::path write(const std::string& name, const std::string& content) const {
            const auto path = dir_ / name;
            std::ofstream(path) << content;
            return path;
        }

        std::filesystem::path dir_;
    };

    TEST_F(SwitchParametersTest, Defaults) {
        const SwitchParameters params;
        EXPECT_FALSE(params.all_frames);
        EXPECT_TRUE(params.euler_filter);
        EXPECT_TRUE(params.show_rotate_order);
        EXPECT_FALSE(params.namespace_display);
        EXPECT_EQ(params.log_level, "info");
    }

    TEST_F(SwitchParametersTest, SaveThenRead) {
        SwitchParameters params;
        params.all_frames = true;
        params.euler_filter = false;
        params.namespace_display = true;
        params.log_level = "debug";

        const auto path = dir_ / "switch.json";
        ASSERT_TRUE(save_parameters(params, path).has_value());

        const auto loaded = read_parameters(path);
        ASSERT_TRUE(loaded.has_value()) << loaded.error();
        EXPECT_TRUE(loaded->all_frames);
        EXPECT_FALSE(loaded->euler_filter);
        EXPECT_TRUE(loaded->show_rotate_order);
        EXPECT_TRUE(loaded->namespace_display);
        EXPECT_EQ(loaded->log_level, "debug");
    }

    TEST_F(SwitchParametersTest, MissingKeysKeepDefaults) {
        const auto loaded = read_parameters(write("partial.json", R"({"all_frames": true})"));
        ASSERT_TRUE(loaded.has_value()) << loaded.error();
        EXPECT_TRUE(loaded->all_frames);
        EXPECT_TRUE(loaded->euler_filter);
        EXPECT_TRUE(loaded->show_rotate_order);
    }

    TEST_F(SwitchParametersTest, ToJsonUsesSnakeCaseKeys) {
        const auto json = SwitchParameters{}.to_json();
        EXPECT_TRUE(json.contains("all_frames"));
        EXPECT_TRUE(json.contains("euler_filter"));
        EXPECT_TRUE(json.contains("show_rotate_order"));
        EXPECT_TRUE(json.contains("namespace_display"));
        EXPECT_EQ(json["log_level"], "info");
    }

    TEST_F(SwitchParametersTest, MissingFileIsError) {
        const auto loaded = read_parameters(dir_ / "nope.json");
        ASSERT_FALSE(loaded.has_value());
        EXPECT_NE(loaded.error().find("not found"), std::string::npos);
    }

    TEST_F(SwitchParametersTest, MalformedJsonIsError) {
        EXPECT_FALSE(read_parameters(write("bad.json", "{ all_frames: ")).has_value());
        EXPECT_FALSE(read_parameters(write("array.json", "[1, 2]")).has_value());
        EXPECT_FALSE(read_parameters(write("typed.json", R"({"all_frames": "yes"})")).has_value());
    }

} // namespace ssw::core::param
