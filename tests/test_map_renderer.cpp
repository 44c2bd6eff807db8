/**
 * @file test_map_renderer.cpp
 * @brief End-to-end rendering pipeline tests
 */

#include "prefmap.hpp"
#include "core/ColorRamp.hpp"
#include "core/SceneComposer.hpp"
#include "core/VectorScene.hpp"
#include "core/RenderError.hpp"
#include "RenderTestUtils.hpp"
#include "TestDatasets.hpp"
#include <gtest/gtest.h>

using namespace prefmap;
using namespace prefmap::test;

class MapRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        dataset_ = sample_dataset();
    }

    GeoDataset dataset_;
    MapRenderer renderer_;
};

TEST_F(MapRendererTest, CanvasSizes) {
    EXPECT_EQ(renderer_.canvas_size(SizeClass::STANDARD), std::make_pair(1280, 720));
    EXPECT_EQ(renderer_.canvas_size(SizeClass::LARGE), std::make_pair(2560, 1440));
    EXPECT_EQ(renderer_.canvas_size(SizeClass::EXTRA_LARGE), std::make_pair(5120, 2880));
}

TEST_F(MapRendererTest, SceneColorsActiveRegion) {
    ComposedMap composed = renderer_.compose_scene(dataset_, {{13, 5}}, RenderOptions{});

    ASSERT_EQ(composed.scene.elements.size(), 4u);
    EXPECT_EQ(composed.scene.elements[1].region_id, 13);
    EXPECT_EQ(parse_style(composed.scene.elements[1].style).fill.value_or(""), "#dc2626");
    EXPECT_EQ(parse_style(composed.scene.elements[0].style).fill.value_or(""),
              ColorRamp::inactive_color());
    EXPECT_TRUE(composed.labels.empty());
    EXPECT_DOUBLE_EQ(composed.view_bounds.min_lon, 139.0);
}

TEST_F(MapRendererTest, LabelsOnlyWhenRequested) {
    RenderOptions options;
    options.show_scale_labels = true;
    ComposedMap composed = renderer_.compose_scene(dataset_, {{13, 5}, {27, 2}}, options);

    ASSERT_EQ(composed.labels.size(), 2u);
    EXPECT_EQ(composed.labels[0].text, "5");
    EXPECT_EQ(composed.labels[1].text, "2");
}

TEST_F(MapRendererTest, EmptyAssignmentShowsWholeDataset) {
    ComposedMap composed = renderer_.compose_scene(dataset_, {}, RenderOptions{});

    EXPECT_DOUBLE_EQ(composed.view_bounds.min_lon, 127.0);
    EXPECT_DOUBLE_EQ(composed.view_bounds.max_lat, 44.0);
    for (const auto& element : composed.scene.elements) {
        EXPECT_EQ(parse_style(element.style).fill.value_or(""), "#27272a");
    }
}

TEST_F(MapRendererTest, LargeSizeScalesStroke) {
    RenderOptions options;
    options.size_class = SizeClass::LARGE;
    ComposedMap composed = renderer_.compose_scene(dataset_, {{1, 3}}, options);

    EXPECT_EQ(composed.scene.width, 2560);
    EXPECT_EQ(composed.scene.height, 1440);
    EXPECT_DOUBLE_EQ(composed.size_multiplier, 2.0);
    EXPECT_DOUBLE_EQ(parse_style(composed.scene.elements[0].style).stroke_width, 0.8);
}

TEST_F(MapRendererTest, EmptyDatasetIsRenderingError) {
    GeoDataset empty;
    EXPECT_THROW(renderer_.compose_scene(empty, {}, RenderOptions{}), RenderingError);
}

TEST_F(MapRendererTest, SvgContainsEveryRegion) {
    RenderOptions options;
    options.show_scale_labels = true;
    options.footer_text = "Test & footer";
    std::string svg = renderer_.render_svg(dataset_, {{13, 5}}, options);

    EXPECT_NE(svg.find("<svg"), std::string::npos);
    EXPECT_NE(svg.find("width=\"1280\""), std::string::npos);
    EXPECT_NE(svg.find("id=\"region-1\""), std::string::npos);
    EXPECT_NE(svg.find("id=\"region-47\""), std::string::npos);
    EXPECT_NE(svg.find("fill:#dc2626"), std::string::npos);
    EXPECT_NE(svg.find("Test &amp; footer"), std::string::npos);
}

TEST_F(MapRendererTest, PngHasStandardSize) {
    if (!font_available()) {
        GTEST_SKIP() << "no TrueType font installed";
    }

    RenderedImage image = renderer_.render(dataset_, {{13, 5}}, RenderOptions{});

    EXPECT_EQ(image.width, 1280);
    EXPECT_EQ(image.height, 720);
    ASSERT_TRUE(has_png_signature(image.bytes));
    EXPECT_EQ(png_header_field(image.bytes, 16), 1280u);
    EXPECT_EQ(png_header_field(image.bytes, 20), 720u);
}

TEST_F(MapRendererTest, PngLargeSize) {
    if (!font_available()) {
        GTEST_SKIP() << "no TrueType font installed";
    }

    RenderOptions options;
    options.size_class = SizeClass::LARGE;
    options.show_scale_labels = true;
    RenderedImage image = renderer_.render(dataset_, {{13, 5}, {47, 7}}, options);

    ASSERT_TRUE(has_png_signature(image.bytes));
    EXPECT_EQ(png_header_field(image.bytes, 16), 2560u);
    EXPECT_EQ(png_header_field(image.bytes, 20), 1440u);
}

TEST_F(MapRendererTest, RenderingIsDeterministic) {
    if (!font_available()) {
        GTEST_SKIP() << "no TrueType font installed";
    }

    RenderOptions options;
    options.show_scale_labels = true;
    RenderedImage first = renderer_.render(dataset_, {{13, 5}, {27, 3}}, options);
    RenderedImage second = renderer_.render(dataset_, {{13, 5}, {27, 3}}, options);

    EXPECT_EQ(first.bytes, second.bytes);
}

TEST_F(MapRendererTest, EmptyAssignmentStillRenders) {
    if (!font_available()) {
        GTEST_SKIP() << "no TrueType font installed";
    }

    RenderedImage image = renderer_.render(dataset_, {}, RenderOptions{});
    EXPECT_TRUE(has_png_signature(image.bytes));
}
