/**
 * @file test_vector_scene.cpp
 * @brief Path data and style parser tests
 */

#include "core/VectorScene.hpp"
#include "core/RenderError.hpp"
#include <gtest/gtest.h>

using namespace prefmap;

TEST(PathDataParserTest, ParsesMoveLineClose) {
    auto subpaths = parse_path_data("M10.0 20.0 L30.5 20.0 L30.5 40.0 Z");

    ASSERT_EQ(subpaths.size(), 1u);
    ASSERT_EQ(subpaths[0].size(), 3u);
    EXPECT_DOUBLE_EQ(subpaths[0][1].x, 30.5);
    EXPECT_DOUBLE_EQ(subpaths[0][2].y, 40.0);
}

TEST(PathDataParserTest, EachMoveStartsSubpath) {
    auto subpaths = parse_path_data("M0 0 L1 0 L1 1 Z M5 5 L6 5 L6 6 Z ");
    ASSERT_EQ(subpaths.size(), 2u);
    EXPECT_DOUBLE_EQ(subpaths[1][0].x, 5.0);
}

TEST(PathDataParserTest, AcceptsSeparatorVariants) {
    auto subpaths = parse_path_data("M 1,2 L 3 , 4 L-5 -6 z");
    ASSERT_EQ(subpaths.size(), 1u);
    ASSERT_EQ(subpaths[0].size(), 3u);
    EXPECT_DOUBLE_EQ(subpaths[0][1].y, 4.0);
    EXPECT_DOUBLE_EQ(subpaths[0][2].x, -5.0);
}

TEST(PathDataParserTest, EmptyInputHasNoSubpaths) {
    EXPECT_TRUE(parse_path_data("").empty());
    EXPECT_TRUE(parse_path_data("   ").empty());
}

TEST(PathDataParserTest, RejectsMalformedData) {
    EXPECT_THROW(parse_path_data("C1 2 3 4 5 6"), RenderingError);
    EXPECT_THROW(parse_path_data("L1 2"), RenderingError);
    EXPECT_THROW(parse_path_data("Z"), RenderingError);
    EXPECT_THROW(parse_path_data("M1"), RenderingError);
    EXPECT_THROW(parse_path_data("M1 x"), RenderingError);
}

TEST(StyleParserTest, ParsesRegionStyle) {
    SceneStyle style = parse_style("fill:#dc2626;stroke:#a1a1aa;stroke-width:0.4;fill-opacity:0.8");

    ASSERT_TRUE(style.fill.has_value());
    EXPECT_EQ(*style.fill, "#dc2626");
    ASSERT_TRUE(style.stroke.has_value());
    EXPECT_EQ(*style.stroke, "#a1a1aa");
    EXPECT_DOUBLE_EQ(style.stroke_width, 0.4);
    EXPECT_DOUBLE_EQ(style.fill_opacity, 0.8);
}

TEST(StyleParserTest, DefaultsWhenUnset) {
    SceneStyle style = parse_style("fill:#18181b");

    EXPECT_EQ(style.fill.value_or(""), "#18181b");
    EXPECT_FALSE(style.stroke.has_value());
    EXPECT_DOUBLE_EQ(style.stroke_width, 1.0);
    EXPECT_DOUBLE_EQ(style.fill_opacity, 1.0);
}

TEST(StyleParserTest, NoneAndUnknownNames) {
    SceneStyle style = parse_style(" fill : none ; opacity:0.1; stroke:#ffffff ;");

    EXPECT_FALSE(style.fill.has_value());
    EXPECT_EQ(style.stroke.value_or(""), "#ffffff");
    EXPECT_DOUBLE_EQ(style.fill_opacity, 1.0);
}

TEST(StyleParserTest, RejectsMalformedDeclarations) {
    EXPECT_THROW(parse_style("fill"), RenderingError);
    EXPECT_THROW(parse_style("stroke-width:thick"), RenderingError);
    EXPECT_THROW(parse_style("fill-opacity:0.5x"), RenderingError);
}
