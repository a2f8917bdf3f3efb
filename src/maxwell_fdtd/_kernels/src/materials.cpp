/**
 * @file materials.cpp
 * @brief Material model and alpha/beta coefficient implementations
 */

#include "materials.hpp"

#include <algorithm>
#include <cmath>

namespace maxwell {

const char* material_type_name(MaterialType type) {
    switch (type) {
    case MaterialType::Permittivity: return "permittivity";
    case MaterialType::Permeability: return "permeability";
    case MaterialType::Conductivity: return "conductivity";
    }
    return "unknown";
}

void MaterialField::resize(const GridShape& shape) {
    const size_t n = static_cast<size_t>(shape.size());
    permittivity.assign(n, kDefaultPermittivity);
    permeability.assign(n, kDefaultPermeability);
    conductivity.assign(n, kDefaultConductivity);
}

void MaterialField::reset() {
    std::fill(permittivity.begin(), permittivity.end(), kDefaultPermittivity);
    std::fill(permeability.begin(), permeability.end(), kDefaultPermeability);
    std::fill(conductivity.begin(), conductivity.end(), kDefaultConductivity);
}

std::vector<float>& MaterialField::channel(MaterialType type) {
    switch (type) {
    case MaterialType::Permittivity: return permittivity;
    case MaterialType::Permeability: return permeability;
    case MaterialType::Conductivity: break;
    }
    return conductivity;
}

const std::vector<float>& MaterialField::channel(MaterialType type) const {
    switch (type) {
    case MaterialType::Permittivity: return permittivity;
    case MaterialType::Permeability: return permeability;
    case MaterialType::Conductivity: break;
    }
    return conductivity;
}

MaterialMap default_material_map(const GridShape& shape) {
    check_grid_shape(shape);
    const size_t n = static_cast<size_t>(shape.size());
    MaterialMap map;
    map.shape = shape;
    map.permittivity.assign(n, kDefaultPermittivity);
    map.permeability.assign(n, kDefaultPermeability);
    map.conductivity.assign(n, kDefaultConductivity);
    return map;
}

void validate_material(
    const std::vector<float>& permittivity,
    const std::vector<float>& permeability,
    const std::vector<float>& conductivity,
    const GridShape& shape
) {
    const size_t n = static_cast<size_t>(shape.size());
    if (permittivity.size() != n || permeability.size() != n || conductivity.size() != n) {
        throw std::invalid_argument(
            "material arrays must have " + std::to_string(n) + " cells for a " +
            std::to_string(shape.nx) + "x" + std::to_string(shape.ny) + " grid");
    }

    for (size_t i = 0; i < n; i++) {
        if (!(permittivity[i] > 0.0f) || !std::isfinite(permittivity[i])) {
            throw std::invalid_argument(
                "permittivity must be positive at cell " + std::to_string(i));
        }
        if (!(permeability[i] > 0.0f) || !std::isfinite(permeability[i])) {
            throw std::invalid_argument(
                "permeability must be positive at cell " + std::to_string(i));
        }
        if (!(conductivity[i] >= 0.0f) || !std::isfinite(conductivity[i])) {
            throw std::invalid_argument(
                "conductivity must be non-negative at cell " + std::to_string(i));
        }
    }
}

void check_material_value(MaterialType type, float value) {
    const bool ok = type == MaterialType::Conductivity ? value >= 0.0f : value > 0.0f;
    if (!ok || !std::isfinite(value)) {
        throw std::invalid_argument(
            std::string("invalid ") + material_type_name(type) + " value " +
            std::to_string(value));
    }
}

LossyCoeffs lossy_coeffs(float sigma, float kappa, float dt, float cell_size) {
    const float c = sigma * dt / (2.0f * kappa);
    const float d = 1.0f / (1.0f + c);
    return LossyCoeffs{(1.0f - c) * d, dt / (kappa * cell_size) * d};
}

void AlphaBetaData::resize(const GridShape& shape) {
    const size_t n = static_cast<size_t>(shape.size());
    alpha_e.assign(n, 0.0f);
    beta_e.assign(n, 0.0f);
    alpha_h.assign(n, 0.0f);
    beta_h.assign(n, 0.0f);
    valid = false;
}

void update_alpha_beta(
    const MaterialField& material,
    const GridShape& shape,
    float dt,
    float cell_size,
    AlphaBetaData& out
) {
    const int n = shape.size();
    const float* __restrict__ eps = material.permittivity.data();
    const float* __restrict__ mu = material.permeability.data();
    const float* __restrict__ sigma = material.conductivity.data();
    float* __restrict__ alpha_e = out.alpha_e.data();
    float* __restrict__ beta_e = out.beta_e.data();
    float* __restrict__ alpha_h = out.alpha_h.data();
    float* __restrict__ beta_h = out.beta_h.data();

    MAXWELL_PARALLEL_FOR
    for (int c = 0; c < n; c++) {
        const LossyCoeffs el = lossy_coeffs(sigma[c], eps[c], dt, cell_size);
        const LossyCoeffs mag = lossy_coeffs(sigma[c], mu[c], dt, cell_size);
        alpha_e[c] = el.alpha;
        beta_e[c] = el.beta;
        alpha_h[c] = mag.alpha;
        beta_h[c] = mag.beta;
    }

    out.dt = dt;
    out.cell_size = cell_size;
    out.valid = true;
}

}  // namespace maxwell
