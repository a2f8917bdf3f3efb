#pragma once
/**
 * @file diagnostics.hpp
 * @brief Field energy reductions and per-cell energy density
 *
 * Read-only helpers over the current field buffers, for tests, monitoring
 * and renderers. Sums accumulate in double and are parallelized over cells.
 */

#include "fields.hpp"
#include "materials.hpp"

#include <vector>

namespace maxwell {

struct FieldEnergy {
    double electric = 0.0;  // sum |E|^2
    double magnetic = 0.0;  // sum |H|^2

    double total() const { return electric + magnetic; }
};

/**
 * @brief Sum of squared field magnitudes over the grid.
 */
FieldEnergy compute_field_energy(const VectorField& e, const VectorField& h);

/**
 * @brief Discrete energy conserved by the leapfrog scheme.
 *
 *   sum |E^n|^2 + sum H^(n-1/2) . H^(n+1/2)
 *
 * Constant up to rounding on a lossless vacuum grid with the reflective
 * boundary. Evaluate right after a magnetic half-step, with h_prev the
 * magnetic field before it.
 */
double compute_leapfrog_energy(
    const VectorField& e,
    const VectorField& h_prev,
    const VectorField& h_curr
);

/**
 * @brief Energy of the cells in [i0, i1) x [j0, j1), clipped to the grid.
 */
FieldEnergy compute_region_energy(
    const VectorField& e,
    const VectorField& h,
    const GridShape& shape,
    int i0, int j0, int i1, int j1
);

/**
 * @brief Per-cell energy density as consumed by the renderer.
 *
 * electric[c] = eps[c] * |E[c]|^2 (zero unless show_electric)
 * magnetic[c] = mu[c] * |H[c]|^2 (zero unless show_magnetic)
 */
struct EnergyDensity {
    std::vector<float> electric;
    std::vector<float> magnetic;
};

EnergyDensity compute_energy_density(
    const VectorField& e,
    const VectorField& h,
    const MaterialField& material,
    bool show_electric,
    bool show_magnetic
);

}  // namespace maxwell
