#include <gtest/gtest.h>
#include <scroll_loaders/default_viewer_config.hpp>
#include <scroll_loaders/json_loader.hpp>
#include <sstream>

using scroll_loaders::load_viewer_config_from_json;

namespace {

std::optional<scroll_model::ViewerConfig> parse(const std::string& text) {
    std::istringstream in(text);
    return load_viewer_config_from_json(in);
}

} // namespace

TEST(JsonLoader, ParsesFullConfig) {
    const auto config = parse(R"({
        "name": "Three lists",
        "log_level": "debug",
        "fling": { "linear_damping": 2.5, "min_fling_velocity": 60, "stop_velocity": 4 },
        "panes": [
            { "id": "left", "label": "Left", "row_count": 300, "row_height": 20 },
            { "id": "right", "row_count": 12 }
        ]
    })");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->name, "Three lists");
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_DOUBLE_EQ(config->fling.linear_damping, 2.5);
    EXPECT_DOUBLE_EQ(config->fling.min_fling_velocity, 60.0);
    EXPECT_DOUBLE_EQ(config->fling.stop_velocity, 4.0);
    ASSERT_EQ(config->panes.size(), 2u);
    EXPECT_EQ(config->panes[0].id, "left");
    EXPECT_EQ(config->panes[0].label, "Left");
    EXPECT_EQ(config->panes[0].row_count, 300);
    EXPECT_DOUBLE_EQ(config->panes[0].row_height, 20.0);
    EXPECT_EQ(config->panes[1].label, "right");
    EXPECT_EQ(config->panes[1].row_count, 12);
    EXPECT_DOUBLE_EQ(config->panes[1].row_height, 24.0);
}

TEST(JsonLoader, FillsDefaultsForOptionalFields) {
    const auto config = parse(R"({ "panes": [ { "id": "only", "row_count": -5, "row_height": 0 } ] })");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->name, "");
    EXPECT_EQ(config->log_level, "info");
    EXPECT_DOUBLE_EQ(config->fling.linear_damping, 2.0);
    ASSERT_EQ(config->panes.size(), 1u);
    EXPECT_EQ(config->panes[0].row_count, 0);
    EXPECT_DOUBLE_EQ(config->panes[0].row_height, 24.0);
}

TEST(JsonLoader, RejectsMissingPanes) {
    EXPECT_FALSE(parse(R"({ "name": "nothing" })").has_value());
    EXPECT_FALSE(parse(R"({ "panes": {} })").has_value());
}

TEST(JsonLoader, RejectsPaneWithoutId) {
    EXPECT_FALSE(parse(R"({ "panes": [ { "label": "nameless" } ] })").has_value());
    EXPECT_FALSE(parse(R"({ "panes": [ { "id": 7 } ] })").has_value());
}

TEST(JsonLoader, RejectsMalformedJson) {
    EXPECT_FALSE(parse("{ \"panes\": [ ").has_value());
    EXPECT_FALSE(parse("").has_value());
}

TEST(JsonLoader, MissingFileGivesNothing) {
    EXPECT_FALSE(scroll_loaders::load_viewer_config_from_json_file("/nonexistent/linked_views.json").has_value());
}

TEST(JsonLoader, DefaultConfigHasThreePanes) {
    const auto config = scroll_loaders::default_viewer_config();

    ASSERT_EQ(config.panes.size(), 3u);
    EXPECT_EQ(config.panes[0].id, "timeline");
    EXPECT_EQ(config.panes[2].row_count, 250);
    EXPECT_FALSE(config.name.empty());
}
