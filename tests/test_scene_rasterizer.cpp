/**
 * @file test_scene_rasterizer.cpp
 * @brief Raster canvas, fill, stroke and text tests
 */

#include "export/SceneRasterizer.hpp"
#include "core/RenderError.hpp"
#include "RenderTestUtils.hpp"
#include <gtest/gtest.h>

using namespace prefmap;
using namespace prefmap::test;

namespace {

const RGBA BACKGROUND = {24, 24, 27, 255};

VectorScene framed_square_scene(const std::string& style) {
    VectorScene scene;
    scene.width = 100;
    scene.height = 100;
    scene.background_style = "fill:#18181b";

    SceneElement element;
    element.region_id = 13;
    element.path_data = "M10.0 10.0 L90.0 10.0 L90.0 90.0 L10.0 90.0 Z "
                        "M40.0 40.0 L60.0 40.0 L60.0 60.0 L40.0 60.0 Z ";
    element.style = style;
    scene.elements.push_back(element);
    return scene;
}

} // namespace

TEST(RasterCanvasTest, HexColorParsing) {
    EXPECT_EQ(parse_hex_color("#18181b"), (RGBA{24, 24, 27, 255}));
    EXPECT_EQ(parse_hex_color("DC2626", 128), (RGBA{220, 38, 38, 128}));
    EXPECT_THROW(parse_hex_color("#fff"), RenderingError);
    EXPECT_THROW(parse_hex_color("#gggggg"), RenderingError);
}

TEST(RasterCanvasTest, BackgroundAndBlend) {
    RasterCanvas canvas(4, 3, BACKGROUND);

    EXPECT_EQ(canvas.pixel(3, 2), BACKGROUND);
    EXPECT_EQ(canvas.pixel(4, 0), (RGBA{0, 0, 0, 0}));
    EXPECT_EQ(canvas.data().size(), 4u * 3u * 4u);

    canvas.blend_pixel(1, 1, parse_hex_color("#dc2626"), 0.8);
    EXPECT_EQ(canvas.pixel(1, 1), (RGBA{181, 35, 36, 255}));

    canvas.blend_pixel(2, 1, parse_hex_color("#ffffff"), 1.0);
    EXPECT_EQ(canvas.pixel(2, 1), (RGBA{255, 255, 255, 255}));
}

TEST(RasterCanvasTest, RejectsEmptyCanvas) {
    EXPECT_THROW(RasterCanvas(0, 10, BACKGROUND), RenderingError);
}

TEST(SceneRasterizerTest, FillUsesOpacityAndEvenOddRule) {
    SceneRasterizer rasterizer;
    RasterCanvas canvas = rasterizer.paint_scene(framed_square_scene("fill:#dc2626;fill-opacity:0.8"), 100, 100);

    EXPECT_EQ(canvas.width(), 100);
    EXPECT_EQ(canvas.height(), 100);
    EXPECT_EQ(canvas.pixel(2, 2), BACKGROUND);
    EXPECT_EQ(canvas.pixel(20, 20), (RGBA{181, 35, 36, 255}));
    EXPECT_EQ(canvas.pixel(80, 70), (RGBA{181, 35, 36, 255}));
    // Inner subpath is a hole
    EXPECT_EQ(canvas.pixel(50, 50), BACKGROUND);
}

TEST(SceneRasterizerTest, StrokeFollowsOutline) {
    SceneRasterizer rasterizer;
    RasterCanvas canvas = rasterizer.paint_scene(
        framed_square_scene("fill:none;stroke:#ffffff;stroke-width:1"), 100, 100);

    EXPECT_EQ(canvas.pixel(50, 10), (RGBA{255, 255, 255, 255}));
    EXPECT_EQ(canvas.pixel(10, 50), (RGBA{255, 255, 255, 255}));
    EXPECT_EQ(canvas.pixel(40, 50), (RGBA{255, 255, 255, 255}));
    EXPECT_EQ(canvas.pixel(20, 20), BACKGROUND);
}

TEST(SceneRasterizerTest, ThinStrokeIsBlended) {
    SceneRasterizer rasterizer;
    RasterCanvas canvas = rasterizer.paint_scene(
        framed_square_scene("fill:none;stroke:#ffffff;stroke-width:0.5"), 100, 100);

    RGBA edge = canvas.pixel(50, 10);
    EXPECT_GT(edge[0], BACKGROUND[0]);
    EXPECT_LT(edge[0], 255);
}

TEST(SceneRasterizerTest, ElementErrorsNameTheRegion) {
    SceneRasterizer rasterizer;
    VectorScene scene = framed_square_scene("fill:#dc2626");
    scene.elements[0].path_data = "M10 10 Q20 20";

    try {
        rasterizer.paint_scene(scene, 100, 100);
        FAIL() << "bad path accepted";
    } catch (const RenderingError& e) {
        EXPECT_EQ(e.detail().rfind("region 13: ", 0), 0u) << e.detail();
    }
}

TEST(SceneRasterizerTest, BackgroundWithoutFillRejected) {
    SceneRasterizer rasterizer;
    VectorScene scene = framed_square_scene("fill:#dc2626");
    scene.background_style = "fill:none";
    EXPECT_THROW(rasterizer.paint_scene(scene, 100, 100), RenderingError);
}

TEST(SceneRasterizerTest, EncodesRequestedSize) {
    SceneRasterizer rasterizer;
    RasterCanvas canvas = rasterizer.paint_scene(framed_square_scene("fill:#4ade80"), 100, 100);
    std::vector<uint8_t> png = rasterizer.encode_png(canvas);

    ASSERT_TRUE(has_png_signature(png));
    EXPECT_EQ(png_header_field(png, 16), 100u);
    EXPECT_EQ(png_header_field(png, 20), 100u);
}

TEST(RasterAnnotatorTest, DecodesUtf8) {
    auto code_points = RasterAnnotator::decode_utf8("A\xE6\x9D\xB1\xFF");

    ASSERT_EQ(code_points.size(), 3u);
    EXPECT_EQ(code_points[0], U'A');
    EXPECT_EQ(code_points[1], U'\u6771');
    EXPECT_EQ(code_points[2], U'\uFFFD');
}

TEST(RasterAnnotatorTest, MissingExplicitFontFallsBack) {
    AnnotationConfig config;
    config.font_directory = "/nonexistent/prefmap-fonts";
    RasterAnnotator annotator(config);

    std::string path = annotator.resolve_font_path();
    EXPECT_EQ(path.find("/nonexistent/"), std::string::npos);
}

TEST(RasterAnnotatorTest, TextChangesPixels) {
    if (!font_available()) {
        GTEST_SKIP() << "no TrueType font installed";
    }

    RasterAnnotator annotator;
    RasterCanvas canvas(120, 40, BACKGROUND);
    ASSERT_TRUE(annotator.draw_text(canvas, "5", 10, 30, 20, parse_hex_color("#fafafa")));
    EXPECT_GT(annotator.measure_text_width("55", 20), annotator.measure_text_width("5", 20));

    bool changed = false;
    for (int y = 0; y < canvas.height() && !changed; ++y) {
        for (int x = 0; x < canvas.width(); ++x) {
            if (canvas.pixel(x, y) != BACKGROUND) {
                changed = true;
                break;
            }
        }
    }
    EXPECT_TRUE(changed);
}

TEST(SceneRasterizerTest, FooterDrawnAboveBottomEdge) {
    if (!font_available()) {
        GTEST_SKIP() << "no TrueType font installed";
    }

    RasterizerConfig config;
    config.default_footer = "Footer";
    SceneRasterizer rasterizer(config);
    RasterCanvas canvas(200, 60, BACKGROUND);
    rasterizer.draw_footer(canvas, "");

    bool changed = false;
    for (int y = 20; y < 60 && !changed; ++y) {
        for (int x = 8; x < 100; ++x) {
            if (canvas.pixel(x, y) != BACKGROUND) {
                changed = true;
                break;
            }
        }
    }
    EXPECT_TRUE(changed);
    for (int x = 0; x < 200; ++x) {
        EXPECT_EQ(canvas.pixel(x, 59), BACKGROUND);
    }
}
