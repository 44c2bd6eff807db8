/**
 * @file BoundsCalculator.hpp
 * @brief View extent of the active regions
 *
 * The visible extent auto-fits to regions with a non-zero intensity level,
 * so a request touching a few prefectures zooms onto them while the rest of
 * the dataset is still drawn (inactive) around them.
 */

#pragma once

#include "prefmap.hpp"
#include <vector>

namespace prefmap {

class BoundsCalculator {
public:
    /**
     * @brief Bounds of every vertex of every region with level > 0
     * @param regions Dataset regions
     * @param intensities Per-request levels (absent ids are level 0)
     * @return Bounds; inverted (is_valid() == false) when no region is active
     */
    static ViewBounds compute_bounds(const std::vector<Region>& regions,
                                     const IntensityAssignment& intensities);

    /**
     * @brief Bounds of every vertex of every region, ignoring intensities
     */
    static ViewBounds compute_dataset_bounds(const std::vector<Region>& regions);

    /**
     * @brief Bounds used for projection
     *
     * Same as compute_bounds(); when that yields inverted bounds (no active
     * region) the whole-dataset bounds are substituted.
     *
     * @throws RenderingError if the dataset has no vertices at all
     */
    static ViewBounds resolve_view_bounds(const std::vector<Region>& regions,
                                          const IntensityAssignment& intensities);

private:
    static void extend_with_geometry(ViewBounds& bounds, const Geometry& geometry);
};

} // namespace prefmap
