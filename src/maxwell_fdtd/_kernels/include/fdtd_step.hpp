#pragma once
/**
 * @file fdtd_step.hpp
 * @brief Core FDTD time-stepping kernels
 *
 * Implements the electric and magnetic half-step updates of Maxwell's
 * equations on a 2D staggered Yee grid, plus the source injection and decay
 * kernels of the electric half-step.
 *
 * Every kernel reads from "previous" buffers and writes to a distinct
 * "current" buffer; none of them updates in place. Neighbor reads outside
 * the grid are zero.
 */

#include "fields.hpp"
#include "materials.hpp"

namespace maxwell {

// Base of the per-unit-time source accumulator decay: S *= kSourceDecayBase^dt
constexpr float kSourceDecayBase = 0.1f;

/**
 * @brief Update electric field from the curl of the magnetic field
 *
 * Implements, with all z-derivatives zero:
 *   Ex' = aE*Ex + bE*(Hz(x,y) - Hz(x,y-1))
 *   Ey' = aE*Ey - bE*(Hz(x,y) - Hz(x-1,y))
 *   Ez' = aE*Ez + bE*((Hy(x,y) - Hy(x-1,y)) - (Hx(x,y) - Hx(x,y-1)))
 *
 * H is offset by +1/2 cell in x and y, so E reads backward neighbors.
 *
 * @param ex_prev, ey_prev, ez_prev Electric field read buffer
 * @param hx, hy, hz Current magnetic field
 * @param alpha_e, beta_e Electric lossy-medium coefficients
 * @param ex, ey, ez Electric field write buffer
 * @param shape Grid dimensions
 */
void update_electric(
    const float* __restrict__ ex_prev,
    const float* __restrict__ ey_prev,
    const float* __restrict__ ez_prev,
    const float* __restrict__ hx,
    const float* __restrict__ hy,
    const float* __restrict__ hz,
    const float* __restrict__ alpha_e,
    const float* __restrict__ beta_e,
    float* __restrict__ ex,
    float* __restrict__ ey,
    float* __restrict__ ez,
    const GridShape& shape
);

/**
 * @brief Update magnetic field from the curl of the electric field
 *
 * Implements:
 *   Hx' = aH*Hx - bH*(Ez(x,y+1) - Ez(x,y))
 *   Hy' = aH*Hy + bH*(Ez(x+1,y) - Ez(x,y))
 *   Hz' = aH*Hz - bH*((Ey(x+1,y) - Ey(x,y)) - (Ex(x,y+1) - Ex(x,y)))
 *
 * @param hx_prev, hy_prev, hz_prev Magnetic field read buffer
 * @param ex, ey, ez Current electric field
 * @param alpha_h, beta_h Magnetic lossy-medium coefficients
 * @param hx, hy, hz Magnetic field write buffer
 * @param shape Grid dimensions
 */
void update_magnetic(
    const float* __restrict__ hx_prev,
    const float* __restrict__ hy_prev,
    const float* __restrict__ hz_prev,
    const float* __restrict__ ex,
    const float* __restrict__ ey,
    const float* __restrict__ ez,
    const float* __restrict__ alpha_h,
    const float* __restrict__ beta_h,
    float* __restrict__ hx,
    float* __restrict__ hy,
    float* __restrict__ hz,
    const GridShape& shape
);

/**
 * @brief Add the accumulated forcing into a field: out = field + dt * source
 *
 * @param field Field read buffer (n values)
 * @param source Source accumulator read buffer (n values)
 * @param out Field write buffer (n values)
 * @param n Number of values
 * @param dt Timestep
 */
void inject_source(
    const float* __restrict__ field,
    const float* __restrict__ source,
    float* __restrict__ out,
    int n,
    float dt
);

/**
 * @brief Exponentially decay the source accumulator: out = source * 0.1^dt
 */
void decay_source(
    const float* __restrict__ source,
    float* __restrict__ out,
    int n,
    float dt
);

// =============================================================================
// Vector field convenience overloads
// =============================================================================

void update_electric(
    const VectorField& e_prev,
    const VectorField& h,
    const AlphaBetaData& coeffs,
    VectorField& e_out,
    const GridShape& shape
);

void update_magnetic(
    const VectorField& h_prev,
    const VectorField& e,
    const AlphaBetaData& coeffs,
    VectorField& h_out,
    const GridShape& shape
);

void inject_source(
    const VectorField& field,
    const VectorField& source,
    VectorField& out,
    float dt
);

void decay_source(
    const VectorField& source,
    VectorField& out,
    float dt
);

}  // namespace maxwell
