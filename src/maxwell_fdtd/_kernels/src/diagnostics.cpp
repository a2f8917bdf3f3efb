/**
 * @file diagnostics.cpp
 * @brief Field energy diagnostics implementation
 */

#include "diagnostics.hpp"

#include <algorithm>

namespace maxwell {

namespace {

double sum_squares(const VectorField& f) {
    const int n = static_cast<int>(f.size());
    const float* __restrict__ x = f.x.data();
    const float* __restrict__ y = f.y.data();
    const float* __restrict__ z = f.z.data();

    double sum = 0.0;
#if MAXWELL_HAS_OPENMP
    #pragma omp parallel for reduction(+:sum) schedule(static)
#endif
    for (int c = 0; c < n; c++) {
        sum += static_cast<double>(x[c]) * x[c] +
               static_cast<double>(y[c]) * y[c] +
               static_cast<double>(z[c]) * z[c];
    }
    return sum;
}

double sum_products(const VectorField& a, const VectorField& b) {
    const int n = static_cast<int>(std::min(a.size(), b.size()));

    double sum = 0.0;
#if MAXWELL_HAS_OPENMP
    #pragma omp parallel for reduction(+:sum) schedule(static)
#endif
    for (int c = 0; c < n; c++) {
        sum += static_cast<double>(a.x[c]) * b.x[c] +
               static_cast<double>(a.y[c]) * b.y[c] +
               static_cast<double>(a.z[c]) * b.z[c];
    }
    return sum;
}

inline float magnitude_squared(const VectorField& f, int c) {
    return f.x[c] * f.x[c] + f.y[c] * f.y[c] + f.z[c] * f.z[c];
}

}  // namespace

FieldEnergy compute_field_energy(const VectorField& e, const VectorField& h) {
    FieldEnergy energy;
    energy.electric = sum_squares(e);
    energy.magnetic = sum_squares(h);
    return energy;
}

double compute_leapfrog_energy(
    const VectorField& e,
    const VectorField& h_prev,
    const VectorField& h_curr
) {
    return sum_squares(e) + sum_products(h_prev, h_curr);
}

FieldEnergy compute_region_energy(
    const VectorField& e,
    const VectorField& h,
    const GridShape& shape,
    int i0, int j0, int i1, int j1
) {
    i0 = std::max(i0, 0);
    j0 = std::max(j0, 0);
    i1 = std::min(i1, shape.nx);
    j1 = std::min(j1, shape.ny);

    FieldEnergy energy;
    for (int j = j0; j < j1; j++) {
        for (int i = i0; i < i1; i++) {
            const int c = idx(i, j, shape);
            energy.electric += magnitude_squared(e, c);
            energy.magnetic += magnitude_squared(h, c);
        }
    }
    return energy;
}

EnergyDensity compute_energy_density(
    const VectorField& e,
    const VectorField& h,
    const MaterialField& material,
    bool show_electric,
    bool show_magnetic
) {
    const int n = static_cast<int>(e.size());
    if (h.size() != e.size() || material.size() != e.size()) {
        throw std::invalid_argument("energy density inputs must have the same number of cells");
    }

    EnergyDensity density;
    density.electric.assign(n, 0.0f);
    density.magnetic.assign(n, 0.0f);
    float* __restrict__ electric = density.electric.data();
    float* __restrict__ magnetic = density.magnetic.data();
    const float* __restrict__ eps = material.permittivity.data();
    const float* __restrict__ mu = material.permeability.data();

    MAXWELL_PARALLEL_FOR
    for (int c = 0; c < n; c++) {
        if (show_electric) {
            electric[c] = eps[c] * magnitude_squared(e, c);
        }
        if (show_magnetic) {
            magnetic[c] = mu[c] * magnitude_squared(h, c);
        }
    }

    return density;
}

}  // namespace maxwell
