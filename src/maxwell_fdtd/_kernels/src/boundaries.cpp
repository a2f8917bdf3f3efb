/**
 * @file boundaries.cpp
 * @brief Open boundary (mirror band) implementations
 */

#include "boundaries.hpp"

namespace maxwell {

bool mirror_offset(int i, int j, const GridShape& shape, int& di, int& dj) {
    di = 0;
    dj = 0;
    bool in_band = false;

    if (i < kMirrorBandWidth) {
        di += 1;
        in_band = true;
    }
    if (i >= shape.nx - kMirrorBandWidth) {
        di -= 1;
        in_band = true;
    }
    if (j < kMirrorBandWidth) {
        dj += 1;
        in_band = true;
    }
    if (j >= shape.ny - kMirrorBandWidth) {
        dj -= 1;
        in_band = true;
    }

    return in_band;
}

MirrorCells precompute_mirror_cells(const GridShape& shape) {
    MirrorCells mc;
    const int nx = shape.nx;
    const int ny = shape.ny;

    for (int j = 0; j < ny; j++) {
        for (int i = 0; i < nx; i++) {
            int di = 0;
            int dj = 0;
            if (!mirror_offset(i, j, shape, di, dj)) {
                continue;
            }

            // di, dj never step outside the grid: a cell in both bands of an
            // axis gets a zero offset on that axis
            mc.dst_indices.push_back(idx(i, j, nx));
            mc.src_indices.push_back(idx(i + di, j + dj, nx));
        }
    }

    return mc;
}

void apply_mirror_cells(
    const float* __restrict__ src,
    float* __restrict__ dst,
    const MirrorCells& mc
) {
    const int n = static_cast<int>(mc.size());
    const int* dst_idx = mc.dst_indices.data();
    const int* src_idx = mc.src_indices.data();

    MAXWELL_PARALLEL_FOR
    for (int m = 0; m < n; m++) {
        dst[dst_idx[m]] = src[src_idx[m]];
    }
}

void apply_mirror_cells(
    const VectorField& src,
    VectorField& dst,
    const MirrorCells& mc
) {
    apply_mirror_cells(src.x.data(), dst.x.data(), mc);
    apply_mirror_cells(src.y.data(), dst.y.data(), mc);
    apply_mirror_cells(src.z.data(), dst.z.data(), mc);
}

}  // namespace maxwell
