#include <xdot_loaders/viewer_config.hpp>
#include <gtest/gtest.h>
#include <sstream>

using xdot_loaders::ViewerConfig;
using xdot_loaders::load_viewer_config_from_json;

namespace {

std::optional<ViewerConfig> parse(const std::string& text) {
    std::istringstream in(text);
    return load_viewer_config_from_json(in);
}

} // namespace

TEST(ViewerConfigTest, EmptyObjectGivesDefaults) {
    auto config = parse("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->layout_program, "dot");
    EXPECT_EQ(config->layout_format, "xdot");
    EXPECT_EQ(config->window_width, 512);
    EXPECT_EQ(config->window_height, 512);
    EXPECT_EQ(config->log_level, "info");
    EXPECT_FALSE(config->log_to_file);
    EXPECT_TRUE(config->font_path.empty());
}

TEST(ViewerConfigTest, ReadsAllFields) {
    auto config = parse(R"({
        "layout_program": "neato",
        "layout_format": "xdot1.4",
        "window_width": 1024,
        "window_height": 768,
        "log_level": "debug",
        "log_to_file": true,
        "font_path": "/usr/share/fonts/x.ttf",
        "unknown_key": [1, 2, 3]
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->layout_program, "neato");
    EXPECT_EQ(config->layout_format, "xdot1.4");
    EXPECT_EQ(config->window_width, 1024);
    EXPECT_EQ(config->window_height, 768);
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_TRUE(config->log_to_file);
    EXPECT_EQ(config->font_path, "/usr/share/fonts/x.ttf");
}

TEST(ViewerConfigTest, WrongTypesFallBackToDefaults) {
    auto config = parse(R"({"layout_program": 3, "window_width": "wide", "window_height": -5, "log_to_file": "yes"})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->layout_program, "dot");
    EXPECT_EQ(config->window_width, 512);
    EXPECT_EQ(config->window_height, 512);
    EXPECT_FALSE(config->log_to_file);
}

TEST(ViewerConfigTest, MalformedJsonIsRejected) {
    EXPECT_FALSE(parse("{\"layout_program\": ").has_value());
    EXPECT_FALSE(parse("[1, 2]").has_value());
    EXPECT_FALSE(parse("").has_value());
}

TEST(ViewerConfigTest, MissingFileIsRejected) {
    EXPECT_FALSE(xdot_loaders::load_viewer_config_from_json_file("/nonexistent/xdotview.json").has_value());
}
