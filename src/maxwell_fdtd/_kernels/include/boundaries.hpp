#pragma once
/**
 * @file boundaries.hpp
 * @brief Open (extrapolating) boundary handling
 *
 * Pre-computes the mirror-cell band for efficient enforcement. In the
 * non-reflective mode every cell within kMirrorBandWidth cells of an edge
 * takes the previous value of the cell one step further inward instead of
 * running the curl update, which damps outgoing waves. The reflective mode
 * uses no band at all.
 */

#include "fields.hpp"

#include <vector>

namespace maxwell {

constexpr int kMirrorBandWidth = 2;

/**
 * @brief Pre-computed mirror cell indices
 *
 * dst_indices[n] receives the value read from src_indices[n].
 */
struct MirrorCells {
    std::vector<int> dst_indices;  // Cells inside the boundary band
    std::vector<int> src_indices;  // Inward cell each band cell copies

    bool empty() const { return dst_indices.empty(); }

    size_t size() const { return dst_indices.size(); }
};

/**
 * @brief Inward displacement for a cell, zero outside the band.
 *
 * +1 near the low edge, -1 near the high edge, summed when both bands
 * overlap on a very small grid.
 *
 * @return true if (i, j) is a mirror cell
 */
bool mirror_offset(int i, int j, const GridShape& shape, int& di, int& dj);

/**
 * @brief Pre-compute mirror cell indices for a grid
 *
 * Depends only on the grid shape, so it is rebuilt on resize only.
 *
 * @param shape Grid dimensions
 * @return MirrorCells structure with pre-computed indices
 */
MirrorCells precompute_mirror_cells(const GridShape& shape);

/**
 * @brief Overwrite the band of one channel using pre-computed indices
 *
 * @param src Previous buffer of the channel (read)
 * @param dst Current buffer of the channel (written)
 * @param mc Pre-computed mirror cells
 */
void apply_mirror_cells(
    const float* __restrict__ src,
    float* __restrict__ dst,
    const MirrorCells& mc
);

/**
 * @brief Overwrite the band of all three components of a vector field
 */
void apply_mirror_cells(
    const VectorField& src,
    VectorField& dst,
    const MirrorCells& mc
);

}  // namespace maxwell
