/**
 * @file drawing.cpp
 * @brief Brush rasterization implementations
 */

#include "drawing.hpp"

#include <algorithm>
#include <cmath>

namespace maxwell {

namespace {

// Clamp a bounding-box coordinate to [0, n-1] before converting to int
inline int clamp_to_axis(float v, int n) {
    return static_cast<int>(std::min(static_cast<float>(n - 1), std::max(0.0f, v)));
}

}  // namespace

DrawInfo make_draw_square_info(const Vec2& center, const Vec2& half_size, float value) {
    DrawInfo info;
    info.shape = DrawShape::Square;
    info.center = center;
    info.extent = half_size;
    info.value = value;
    return info;
}

DrawInfo make_draw_ellipse_info(const Vec2& center, const Vec2& radius, float value) {
    DrawInfo info;
    info.shape = DrawShape::Ellipse;
    info.center = center;
    info.extent = radius;
    info.value = value;
    return info;
}

Vec2 snap_to_grid(const Vec2& center) {
    Vec2 snapped;
    for (int a = 0; a < 2; a++) {
        const float residual = center[a] - std::floor(center[a]);
        snapped[a] = center[a] - residual;
        if (residual > 0.5f) {
            snapped[a] += 1.0f;
        }
    }
    return snapped;
}

bool draw_contains(const DrawInfo& info, const Vec2& snapped_center, int i, int j) {
    const float dx = static_cast<float>(i) - snapped_center[0];
    const float dy = static_cast<float>(j) - snapped_center[1];

    if (info.shape == DrawShape::Square) {
        return std::abs(dx) < info.extent[0] && std::abs(dy) < info.extent[1];
    }

    const float rx = info.extent[0];
    const float ry = info.extent[1];
    if (!(rx > 0.0f) || !(ry > 0.0f)) {
        return false;
    }

    const float nx = dx / rx;
    const float ny = dy / ry;
    // Relaxed threshold for sub-cell radii
    const float threshold = (rx < 1.0f || ry < 1.0f) ? 2.0f : 1.0f;
    return nx * nx + ny * ny <= threshold;
}

int draw_on_channel(
    const float* __restrict__ src,
    float* __restrict__ dst,
    const GridShape& shape,
    const DrawInfo& info,
    float value,
    float keep
) {
    const int n = shape.size();
    std::copy(src, src + n, dst);

    const Vec2 c = snap_to_grid(info.center);

    // Bounding box of the shape, the relaxed ellipse test reaches sqrt(2) radii
    const float reach = info.shape == DrawShape::Ellipse ? 1.5f : 1.0f;
    const int i0 = clamp_to_axis(std::floor(c[0] - reach * info.extent[0]), shape.nx);
    const int i1 = clamp_to_axis(std::ceil(c[0] + reach * info.extent[0]), shape.nx);
    const int j0 = clamp_to_axis(std::floor(c[1] - reach * info.extent[1]), shape.ny);
    const int j1 = clamp_to_axis(std::ceil(c[1] + reach * info.extent[1]), shape.ny);

    int included = 0;
    for (int j = j0; j <= j1; j++) {
        for (int i = i0; i <= i1; i++) {
            if (draw_contains(info, c, i, j)) {
                const int cell = idx(i, j, shape);
                dst[cell] = value + keep * src[cell];
                included++;
            }
        }
    }

    return included;
}

}  // namespace maxwell
