/**
 * @file session.cpp
 * @brief Host-facing simulation session implementation
 */

#include "session.hpp"

#include "logging.hpp"

#include <utility>

namespace maxwell {

namespace {

constexpr const char* kComponent = "session";

// Validates before the simulator is constructed from the settings
const SimulationSettings& checked(const SimulationSettings& settings) {
    validate_settings(settings);
    return settings;
}

// Validates map, then crops or pads it to shape
MaterialMap fit_material_map(const MaterialMap& map, const GridShape& shape) {
    check_grid_shape(map.shape);
    validate_material(map.permittivity, map.permeability, map.conductivity, map.shape);
    if (map.shape == shape) {
        return map;
    }

    MaterialMap fitted;
    fitted.shape = shape;
    fitted.permittivity = resample_channel(map.permittivity, map.shape, shape, kDefaultPermittivity);
    fitted.permeability = resample_channel(map.permeability, map.shape, shape, kDefaultPermeability);
    fitted.conductivity = resample_channel(map.conductivity, map.shape, shape, kDefaultConductivity);
    return fitted;
}

}  // namespace

Session::Session(const SimulationSettings& settings, bool reflective_boundary)
    : settings_(checked(settings)),
      simulator_(settings.grid_size, settings.cell_size, reflective_boundary, settings.dt) {}

void Session::inject_sources(float dt) {
    const double t = simulator_.time();
    for (const SignalSource& source : sources_) {
        if (const std::optional<DrawInfo> info = source_draw_info(source, t)) {
            simulator_.inject_signal(*info, dt);
        }
    }
}

void Session::step_sim(float dt) {
    inject_sources(dt);
    simulator_.step_magnetic(dt);
    simulator_.step_electric(dt);
}

int Session::tick() {
    pending_steps_ += settings_.simulation_speed;

    int steps = 0;
    while (pending_steps_ >= 1.0) {
        step_sim(settings_.dt);
        pending_steps_ -= 1.0;
        steps++;
    }
    return steps;
}

void Session::set_sources(std::vector<SignalSource> sources) {
    sources_ = std::move(sources);
}

void Session::add_source(const SignalSource& source) {
    sources_.push_back(source);
}

void Session::clear_sources() {
    sources_.clear();
}

void Session::apply_settings(const SimulationSettings& settings) {
    validate_settings(settings);

    if (settings.grid_size != simulator_.grid_size()) {
        simulator_.set_grid_size(settings.grid_size, true);
    }
    if (settings.cell_size != simulator_.cell_size()) {
        simulator_.set_cell_size(settings.cell_size);
    }

    settings_ = settings;
    pending_steps_ = 0.0;
}

void Session::load_map(const SimulatorMap& map) {
    // Nothing is applied until the whole map has been checked
    validate_settings(map.settings);
    const GridShape& shape = map.settings.grid_size;
    const MaterialMap material = fit_material_map(map.material_map, shape);
    if (map.material_map.shape != shape) {
        MAXWELL_LOG_INFO(kComponent, "fitting " << map.material_map.shape.nx << "x"
                         << map.material_map.shape.ny << " material map to the "
                         << shape.nx << "x" << shape.ny << " grid");
    }

    apply_settings(map.settings);
    simulator_.load_material(material);
    simulator_.reset_fields();
    sources_ = map.sources;

    MAXWELL_LOG_INFO(kComponent, "loaded map with " << sources_.size() << " source(s)");
}

SimulatorMap Session::to_map() const {
    SimulatorMap map;
    map.material_map = simulator_.get_material();
    map.settings = settings_;
    map.sources = sources_;
    return map;
}

}  // namespace maxwell
