/**
 * @file simulator.cpp
 * @brief Stateful 2D FDTD simulator implementation
 */

#include "simulator.hpp"

#include "fdtd_step.hpp"
#include "logging.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace maxwell {

namespace {

constexpr const char* kComponent = "simulator";

constexpr MaterialType kMaterialTypes[] = {
    MaterialType::Permittivity,
    MaterialType::Permeability,
    MaterialType::Conductivity,
};

}  // namespace

void check_positive(float value, const char* name) {
    if (!(value > 0.0f) || !std::isfinite(value)) {
        throw std::invalid_argument(
            std::string(name) + " must be positive, got " + std::to_string(value));
    }
}

Simulator::Simulator(const GridShape& shape, float cell_size, bool reflective_boundary, float dt)
    : shape_(shape), cell_size_(cell_size), reflective_(reflective_boundary) {
    check_grid_shape(shape);
    check_positive(cell_size, "cell size");
    check_positive(dt, "dt");

    allocate_fields();
    materials_.for_each([&](MaterialField& m) { m.resize(shape_); });
    ensure_alpha_beta(dt);

    MAXWELL_LOG_INFO(kComponent, "created " << shape_.nx << "x" << shape_.ny
                     << " grid, cell size " << cell_size_
                     << (reflective_ ? ", reflective boundary" : ", open boundary"));
}

void Simulator::allocate_fields() {
    e_.for_each([&](VectorField& f) { f.resize(shape_); });
    h_.for_each([&](VectorField& f) { f.resize(shape_); });
    s_.for_each([&](VectorField& f) { f.resize(shape_); });
    alpha_beta_.resize(shape_);
    mirror_cells_ = precompute_mirror_cells(shape_);
    time_ = 0.0;
}

void Simulator::ensure_alpha_beta(float dt) {
    if (alpha_beta_.is_current_for(dt) && alpha_beta_.cell_size == cell_size_) {
        return;
    }

    update_alpha_beta(materials_.current(), shape_, dt, cell_size_, alpha_beta_);
    coefficient_updates_++;
    MAXWELL_LOG_DEBUG(kComponent, "recomputed alpha/beta for dt " << dt
                      << ", cell size " << cell_size_);
}

// =============================================================================
// Time stepping
// =============================================================================

void Simulator::step_electric(float dt) {
    ensure_alpha_beta(dt);

    // Add the source accumulator into E
    e_.swap();
    s_.swap();
    inject_source(e_.previous(), s_.previous(), e_.current(), dt);

    // The injected field becomes the read buffer of the curl update
    e_.swap();
    decay_source(s_.previous(), s_.current(), dt);

    update_electric(e_.previous(), h_.current(), alpha_beta_, e_.current(), shape_);
    if (!reflective_) {
        apply_mirror_cells(e_.previous(), e_.current(), mirror_cells_);
    }

    time_ += 0.5 * static_cast<double>(dt);
}

void Simulator::step_magnetic(float dt) {
    ensure_alpha_beta(dt);

    h_.swap();
    update_magnetic(h_.previous(), e_.current(), alpha_beta_, h_.current(), shape_);
    if (!reflective_) {
        apply_mirror_cells(h_.previous(), h_.current(), mirror_cells_);
    }

    time_ += 0.5 * static_cast<double>(dt);
}

void Simulator::reset_fields() {
    e_.for_each([](VectorField& f) { f.clear(); });
    h_.for_each([](VectorField& f) { f.clear(); });
    s_.for_each([](VectorField& f) { f.clear(); });
    time_ = 0.0;
}

void Simulator::reset_materials() {
    materials_.for_each([](MaterialField& m) { m.reset(); });
    alpha_beta_.invalidate();
}

// =============================================================================
// Editing
// =============================================================================

int Simulator::inject_signal(const DrawInfo& info, float dt) {
    s_.swap();
    const VectorField& src = s_.previous();
    VectorField& dst = s_.current();

    dst.x = src.x;
    dst.y = src.y;
    return draw_on_channel(src.z.data(), dst.z.data(), shape_, info, info.value * dt, 1.0f);
}

int Simulator::draw_material(MaterialType type, const DrawInfo& info) {
    check_material_value(type, info.value);

    materials_.swap();
    const MaterialField& src = materials_.previous();
    MaterialField& dst = materials_.current();

    int included = 0;
    for (MaterialType t : kMaterialTypes) {
        if (t == type) {
            included = draw_on_channel(
                src.channel(t).data(), dst.channel(t).data(), shape_, info, info.value, 0.0f);
        } else {
            dst.channel(t) = src.channel(t);
        }
    }

    alpha_beta_.invalidate();
    return included;
}

void Simulator::load_material(const MaterialMap& map) {
    if (map.shape != shape_) {
        throw std::invalid_argument(
            "material map is " + std::to_string(map.shape.nx) + "x" +
            std::to_string(map.shape.ny) + " but the grid is " +
            std::to_string(shape_.nx) + "x" + std::to_string(shape_.ny));
    }
    load_material(map.permittivity, map.permeability, map.conductivity);
}

void Simulator::load_material(
    const std::vector<float>& permittivity,
    const std::vector<float>& permeability,
    const std::vector<float>& conductivity
) {
    validate_material(permittivity, permeability, conductivity, shape_);

    MaterialField& m = materials_.current();
    m.permittivity = permittivity;
    m.permeability = permeability;
    m.conductivity = conductivity;
    alpha_beta_.invalidate();
}

MaterialMap Simulator::get_material() const {
    const MaterialField& m = materials_.current();
    MaterialMap map;
    map.shape = shape_;
    map.permittivity = m.permittivity;
    map.permeability = m.permeability;
    map.conductivity = m.conductivity;
    return map;
}

// =============================================================================
// Configuration
// =============================================================================

void Simulator::set_grid_size(const GridShape& shape, bool preserve_material) {
    check_grid_shape(shape);

    const GridShape old_shape = shape_;
    const MaterialField& old_material = materials_.current();

    MaterialField material;
    if (preserve_material) {
        material.permittivity = resample_channel(
            old_material.permittivity, old_shape, shape, kDefaultPermittivity);
        material.permeability = resample_channel(
            old_material.permeability, old_shape, shape, kDefaultPermeability);
        material.conductivity = resample_channel(
            old_material.conductivity, old_shape, shape, kDefaultConductivity);
    } else {
        material.resize(shape);
    }

    shape_ = shape;
    allocate_fields();
    materials_.current() = material;
    materials_.previous() = std::move(material);

    MAXWELL_LOG_INFO(kComponent, "grid resized from " << old_shape.nx << "x" << old_shape.ny
                     << " to " << shape_.nx << "x" << shape_.ny
                     << (preserve_material ? ", material preserved" : ", material reset"));
}

void Simulator::set_cell_size(float cell_size) {
    check_positive(cell_size, "cell size");

    cell_size_ = cell_size;
    reset_fields();
    alpha_beta_.invalidate();

    MAXWELL_LOG_INFO(kComponent, "cell size set to " << cell_size_);
}

void Simulator::set_reflective_boundary(bool reflective) {
    reflective_ = reflective;
    alpha_beta_.invalidate();

    MAXWELL_LOG_INFO(kComponent, (reflective_ ? "reflective" : "open") << " boundary");
}

}  // namespace maxwell
