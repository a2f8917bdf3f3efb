/**
 * @file fields.cpp
 * @brief Field storage implementations
 */

#include "fields.hpp"

#include <algorithm>

namespace maxwell {

void VectorField::resize(const GridShape& shape) {
    const size_t n = static_cast<size_t>(shape.size());
    x.assign(n, 0.0f);
    y.assign(n, 0.0f);
    z.assign(n, 0.0f);
}

void VectorField::clear() {
    std::fill(x.begin(), x.end(), 0.0f);
    std::fill(y.begin(), y.end(), 0.0f);
    std::fill(z.begin(), z.end(), 0.0f);
}

std::vector<float> resample_channel(
    const std::vector<float>& src,
    const GridShape& src_shape,
    const GridShape& dst_shape,
    float fill_value
) {
    std::vector<float> dst(static_cast<size_t>(dst_shape.size()), fill_value);

    const int copy_nx = std::min(src_shape.nx, dst_shape.nx);
    const int copy_ny = std::min(src_shape.ny, dst_shape.ny);

    for (int j = 0; j < copy_ny; j++) {
        const float* src_row = src.data() + idx(0, j, src_shape);
        float* dst_row = dst.data() + idx(0, j, dst_shape);
        std::copy(src_row, src_row + copy_nx, dst_row);
    }

    return dst;
}

}  // namespace maxwell
