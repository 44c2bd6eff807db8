/**
 * @file test_bounds_calculator.cpp
 * @brief Active-region bounds tests
 */

#include "core/BoundsCalculator.hpp"
#include "core/RenderError.hpp"
#include "TestDatasets.hpp"
#include <gtest/gtest.h>

using namespace prefmap;
using namespace prefmap::test;

TEST(BoundsCalculatorTest, SingleActiveRegionDefinesBounds) {
    GeoDataset dataset = sample_dataset();
    ViewBounds bounds = BoundsCalculator::compute_bounds(dataset.regions, {{13, 5}});

    ASSERT_TRUE(bounds.is_valid());
    EXPECT_DOUBLE_EQ(bounds.min_lon, 139.0);
    EXPECT_DOUBLE_EQ(bounds.max_lon, 139.5);
    EXPECT_DOUBLE_EQ(bounds.min_lat, 35.5);
    EXPECT_DOUBLE_EQ(bounds.max_lat, 36.0);
}

TEST(BoundsCalculatorTest, BoundsContainEveryActiveVertex) {
    GeoDataset dataset = sample_dataset();
    IntensityAssignment intensities = {{1, 2}, {47, 7}};
    ViewBounds bounds = BoundsCalculator::compute_bounds(dataset.regions, intensities);

    for (const auto& region : dataset.regions) {
        if (level_of(intensities, region.id) == 0) continue;
        for (const auto& polygon : region.geometry.polygons) {
            for (const auto& ring : polygon.rings) {
                for (const auto& point : ring) {
                    EXPECT_TRUE(bounds.contains(point));
                }
            }
        }
    }
    EXPECT_DOUBLE_EQ(bounds.min_lon, 127.0);
    EXPECT_DOUBLE_EQ(bounds.max_lat, 44.0);
}

TEST(BoundsCalculatorTest, ZeroLevelEntriesAreInactive) {
    GeoDataset dataset = sample_dataset();
    ViewBounds with_zero = BoundsCalculator::compute_bounds(dataset.regions, {{13, 5}, {1, 0}});
    ViewBounds without = BoundsCalculator::compute_bounds(dataset.regions, {{13, 5}});
    EXPECT_EQ(with_zero, without);
}

TEST(BoundsCalculatorTest, WideningInactiveRegionDoesNotChangeBounds) {
    GeoDataset dataset = sample_dataset();
    ViewBounds before = BoundsCalculator::compute_bounds(dataset.regions, {{13, 5}});

    dataset.regions[0] = polygon_region(1, 100.0, 10.0, 60.0);
    ViewBounds after = BoundsCalculator::compute_bounds(dataset.regions, {{13, 5}});

    EXPECT_EQ(before, after);
}

TEST(BoundsCalculatorTest, NoActiveRegionGivesInvertedBounds) {
    GeoDataset dataset = sample_dataset();
    ViewBounds bounds = BoundsCalculator::compute_bounds(dataset.regions, {});

    EXPECT_FALSE(bounds.is_valid());
    EXPECT_DOUBLE_EQ(bounds.min_lon, 180.0);
    EXPECT_DOUBLE_EQ(bounds.min_lat, 90.0);
    EXPECT_DOUBLE_EQ(bounds.max_lon, -180.0);
    EXPECT_DOUBLE_EQ(bounds.max_lat, -90.0);
}

TEST(BoundsCalculatorTest, UnknownIdsDoNotActivateAnything) {
    GeoDataset dataset = sample_dataset();
    ViewBounds bounds = BoundsCalculator::compute_bounds(dataset.regions, {{999, 4}});
    EXPECT_FALSE(bounds.is_valid());
}

TEST(BoundsCalculatorTest, ResolveFallsBackToDatasetBounds) {
    GeoDataset dataset = sample_dataset();
    ViewBounds bounds = BoundsCalculator::resolve_view_bounds(dataset.regions, {});

    EXPECT_EQ(bounds, BoundsCalculator::compute_dataset_bounds(dataset.regions));
    EXPECT_DOUBLE_EQ(bounds.min_lon, 127.0);
    EXPECT_DOUBLE_EQ(bounds.min_lat, 26.0);
    EXPECT_DOUBLE_EQ(bounds.max_lon, 143.0);
    EXPECT_DOUBLE_EQ(bounds.max_lat, 44.0);
}

TEST(BoundsCalculatorTest, ResolveKeepsActiveBounds) {
    GeoDataset dataset = sample_dataset();
    EXPECT_EQ(BoundsCalculator::resolve_view_bounds(dataset.regions, {{27, 1}}),
              BoundsCalculator::compute_bounds(dataset.regions, {{27, 1}}));
}

TEST(BoundsCalculatorTest, ResolveOnEmptyDatasetThrows) {
    std::vector<Region> regions;
    EXPECT_THROW(BoundsCalculator::resolve_view_bounds(regions, {}), RenderingError);
}
