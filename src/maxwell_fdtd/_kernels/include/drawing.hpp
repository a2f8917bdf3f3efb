#pragma once
/**
 * @file drawing.hpp
 * @brief Brush rasterization onto field and material channels
 *
 * One primitive serves every paintable channel: material edits and point
 * source injection both go through draw_on_channel().
 *
 * Positions are in cell units with cell (i, j) centered at (i, j).
 */

#include "maxwell_types.hpp"

#include <array>

namespace maxwell {

enum class DrawShape {
    Square,
    Ellipse
};

using Vec2 = std::array<float, 2>;

/**
 * @brief What to draw and where.
 *
 * extent is the per-axis half-size for squares and the per-axis radius for
 * ellipses.
 */
struct DrawInfo {
    DrawShape shape = DrawShape::Square;
    Vec2 center = {0.0f, 0.0f};
    Vec2 extent = {0.5f, 0.5f};
    float value = 0.0f;
};

DrawInfo make_draw_square_info(const Vec2& center, const Vec2& half_size, float value);

DrawInfo make_draw_ellipse_info(const Vec2& center, const Vec2& radius, float value);

/**
 * @brief Snap a position to the nearest cell center.
 *
 * Subtracts the residual center mod 1 and rounds up when the residual
 * exceeds half a cell.
 */
Vec2 snap_to_grid(const Vec2& center);

/**
 * @brief Inclusion test of cell (i, j) for a shape at an already snapped center.
 *
 * Square: |i - cx| < sx and |j - cy| < sy. Ellipse: normalized distance
 * squared <= 1, or <= 2 when a radius is below one cell.
 */
bool draw_contains(const DrawInfo& info, const Vec2& snapped_center, int i, int j);

/**
 * @brief Rasterize a shape from a read buffer into a write buffer.
 *
 * Included cells become value + keep * src, all others are copied from src
 * unchanged. keep = 0 overwrites, keep = 1 accumulates.
 *
 * @param src Channel read buffer
 * @param dst Channel write buffer
 * @param shape Grid dimensions
 * @param info Shape, center and extent (info.value is ignored)
 * @param value Value written into included cells
 * @param keep Blend factor applied to the old value of included cells
 * @return Number of cells included
 */
int draw_on_channel(
    const float* __restrict__ src,
    float* __restrict__ dst,
    const GridShape& shape,
    const DrawInfo& info,
    float value,
    float keep
);

}  // namespace maxwell
