#pragma once
/**
 * @file simulator.hpp
 * @brief Stateful 2D FDTD simulator
 *
 * Owns the double-buffered E, H, source and material fields of one grid,
 * the cached alpha/beta coefficients and the mirror band, and sequences the
 * kernels of each half-step:
 *
 *   step_electric: swap E, S -> inject S into E -> swap E -> decay S
 *                  -> curl update of E -> mirror band -> t += dt/2
 *   step_magnetic: swap H -> curl update of H -> mirror band -> t += dt/2
 *
 * All mutations are issued from a single host thread between steps.
 */

#include "boundaries.hpp"
#include "drawing.hpp"
#include "fields.hpp"
#include "materials.hpp"

#include <vector>

namespace maxwell {

class Simulator {
public:
    /**
     * @brief Allocate all fields and pre-compute coefficients for dt.
     *
     * @throws std::invalid_argument for non-positive grid dimensions,
     *         cell size or dt
     */
    Simulator(const GridShape& shape, float cell_size, bool reflective_boundary, float dt);

    /// Electric half-step (source injection, decay, curl update, boundary).
    void step_electric(float dt);

    /// Magnetic half-step (curl update, boundary).
    void step_magnetic(float dt);

    /// Zero E, H and the source accumulator in both slots, time = 0.
    void reset_fields();

    /// Set every cell back to the default material.
    void reset_materials();

    /**
     * @brief Accumulate forcing into the Ez channel of the source field.
     *
     * Included cells receive info.value * dt on top of their current value.
     *
     * @return Number of cells written
     */
    int inject_signal(const DrawInfo& info, float dt);

    /**
     * @brief Overwrite one material channel inside a shape with info.value.
     *
     * @throws std::invalid_argument if the value is not a valid material
     *         value for the channel
     * @return Number of cells written
     */
    int draw_material(MaterialType type, const DrawInfo& info);

    /**
     * @brief Replace the material of the whole grid.
     *
     * @throws std::invalid_argument if the map shape differs from the grid
     *         or a value is invalid
     */
    void load_material(const MaterialMap& map);

    void load_material(
        const std::vector<float>& permittivity,
        const std::vector<float>& permeability,
        const std::vector<float>& conductivity
    );

    MaterialMap get_material() const;

    /**
     * @brief Reallocate every field for a new grid and reset the fields.
     *
     * With preserve_material the material is cropped, and padded with the
     * default material where the grid grows; otherwise it is reset.
     * Reallocates the fields, invalidating pointers into their storage.
     */
    void set_grid_size(const GridShape& shape, bool preserve_material = true);

    /// Change the cell size; resets the fields.
    void set_cell_size(float cell_size);

    /// Switch between the reflective and the open boundary. No reset.
    void set_reflective_boundary(bool reflective);

    const GridShape& grid_size() const { return shape_; }
    float cell_size() const { return cell_size_; }
    bool reflective_boundary() const { return reflective_; }
    double time() const { return time_; }

    // Number of alpha/beta recomputations since construction
    int coefficient_updates() const { return coefficient_updates_; }

    const AlphaBetaData& alpha_beta() const { return alpha_beta_; }

    // Current (authoritative) buffers
    const VectorField& electric_field() const { return e_.current(); }
    const VectorField& magnetic_field() const { return h_.current(); }
    const VectorField& electric_source_field() const { return s_.current(); }
    const MaterialField& material() const { return materials_.current(); }

    // Writable current buffers for seeding initial conditions between steps
    VectorField& electric_field() { return e_.current(); }
    VectorField& magnetic_field() { return h_.current(); }

    // H half a step before magnetic_field(), valid after step_magnetic()
    const VectorField& previous_magnetic_field() const { return h_.previous(); }

private:
    void allocate_fields();
    void ensure_alpha_beta(float dt);

    GridShape shape_;
    float cell_size_;
    bool reflective_;
    double time_ = 0.0;

    DoubleBuffer<VectorField> e_;
    DoubleBuffer<VectorField> h_;
    DoubleBuffer<VectorField> s_;
    DoubleBuffer<MaterialField> materials_;

    AlphaBetaData alpha_beta_;
    MirrorCells mirror_cells_;
    int coefficient_updates_ = 0;
};

/**
 * @brief Reject a non-positive or non-finite cell size or timestep.
 *
 * @throws std::invalid_argument naming the offending parameter
 */
void check_positive(float value, const char* name);

}  // namespace maxwell
