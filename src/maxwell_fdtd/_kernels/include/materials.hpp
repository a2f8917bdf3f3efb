#pragma once
/**
 * @file materials.hpp
 * @brief Per-cell material model and lossy-medium update coefficients
 *
 * Each cell carries (permittivity, permeability, conductivity). The stepper
 * never reads them directly; it reads the alpha/beta coefficients derived
 * from them, which are pre-computed once per (material, dt, cell size)
 * combination and reused across many steps.
 */

#include "maxwell_types.hpp"

#include <vector>

namespace maxwell {

constexpr float kDefaultPermittivity = 1.0f;
constexpr float kDefaultPermeability = 1.0f;
constexpr float kDefaultConductivity = 0.0f;

enum class MaterialType {
    Permittivity,
    Permeability,
    Conductivity
};

const char* material_type_name(MaterialType type);

/**
 * @brief Per-cell material triple (structure of arrays, row-major).
 */
struct MaterialField {
    std::vector<float> permittivity;  // epsilon, > 0
    std::vector<float> permeability;  // mu, > 0
    std::vector<float> conductivity;  // sigma, >= 0

    /// Reallocate to the grid size, filled with the default material.
    void resize(const GridShape& shape);

    /// Set every cell back to the default material.
    void reset();

    std::vector<float>& channel(MaterialType type);
    const std::vector<float>& channel(MaterialType type) const;

    size_t size() const { return permittivity.size(); }
};

/**
 * @brief Standalone copy of a grid's material, the unit of load and save.
 */
struct MaterialMap {
    GridShape shape{0, 0};
    std::vector<float> permittivity;
    std::vector<float> permeability;
    std::vector<float> conductivity;
};

/// Material map of the given shape filled with the default material.
MaterialMap default_material_map(const GridShape& shape);

/**
 * @brief Check a material triple for shape and physical validity.
 *
 * @throws std::invalid_argument on length mismatch, non-positive or
 *         non-finite permittivity/permeability, or negative conductivity
 */
void validate_material(
    const std::vector<float>& permittivity,
    const std::vector<float>& permeability,
    const std::vector<float>& conductivity,
    const GridShape& shape
);

/**
 * @brief Check a single value for a material channel.
 *
 * @throws std::invalid_argument unless permittivity/permeability > 0 and
 *         conductivity >= 0 (all finite)
 */
void check_material_value(MaterialType type, float value);

/**
 * @brief Coefficients of a lossy-medium update: f' = alpha * f + beta * curl
 */
struct LossyCoeffs {
    float alpha;    // Fraction of the previous value retained (1 - c) / (1 + c)
    float beta;     // Coupling to the curl term dt / (kappa * cell_size) / (1 + c)
};

/**
 * @brief Lossy-medium coefficients for damping sigma and medium constant kappa.
 *
 *   c     = sigma * dt / (2 * kappa)
 *   alpha = (1 - c) / (1 + c)
 *   beta  = dt / (kappa * cell_size) / (1 + c)
 *
 * kappa is the permittivity for the electric update and the permeability
 * for the magnetic update.
 */
LossyCoeffs lossy_coeffs(float sigma, float kappa, float dt, float cell_size);

/**
 * @brief Cached per-cell alpha/beta coefficients for both half-steps.
 *
 * Tagged with the dt and cell size they were computed for.
 */
struct AlphaBetaData {
    std::vector<float> alpha_e;  // Electric update, kappa = permittivity
    std::vector<float> beta_e;
    std::vector<float> alpha_h;  // Magnetic update, kappa = permeability
    std::vector<float> beta_h;

    float dt = 0.0f;
    float cell_size = 0.0f;
    bool valid = false;

    void resize(const GridShape& shape);

    void invalidate() { valid = false; }

    bool is_current_for(float requested_dt) const {
        return valid && dt == requested_dt;
    }
};

/**
 * @brief Recompute all alpha/beta coefficients from the material.
 *
 * O(cells), parallelized over cells. Stores dt and cell_size as the cache
 * tag and marks the data valid.
 *
 * @param material Per-cell material triple
 * @param shape Grid dimensions
 * @param dt Timestep
 * @param cell_size Physical length of one cell
 * @param out Coefficient cache, must already be sized to the grid
 */
void update_alpha_beta(
    const MaterialField& material,
    const GridShape& shape,
    float dt,
    float cell_size,
    AlphaBetaData& out
);

}  // namespace maxwell
