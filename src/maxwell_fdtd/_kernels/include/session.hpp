#pragma once
/**
 * @file session.hpp
 * @brief Host-facing simulation session
 *
 * A Session owns one Simulator, the active signal sources and the current
 * settings. The host calls step_sim() or tick() on a timer and forwards
 * editing and configuration events between calls.
 */

#include "serialization.hpp"
#include "settings.hpp"
#include "simulator.hpp"
#include "sources.hpp"

#include <vector>

namespace maxwell {

class Session {
public:
    /**
     * @throws std::invalid_argument if the settings are invalid
     */
    explicit Session(const SimulationSettings& settings = SimulationSettings{},
                     bool reflective_boundary = false);

    /**
     * @brief One full cycle: inject every source at the current time, then
     * the magnetic half-step, then the electric half-step.
     */
    void step_sim(float dt);

    /**
     * @brief Advance by the simulation speed, using the settings' dt.
     *
     * Fractional speeds accumulate across ticks, so a speed of 0.5 steps
     * once every other tick.
     *
     * @return Number of full steps taken
     */
    int tick();

    void set_sources(std::vector<SignalSource> sources);
    const std::vector<SignalSource>& sources() const { return sources_; }
    void add_source(const SignalSource& source);
    void clear_sources();

    /**
     * @brief Apply new settings.
     *
     * A grid-size change resizes the simulator (material preserved), a
     * cell-size change resets the fields; dt and speed take effect on the
     * next step.
     *
     * @throws std::invalid_argument if the settings are invalid
     */
    void apply_settings(const SimulationSettings& settings);
    const SimulationSettings& settings() const { return settings_; }

    /**
     * @brief Replace settings, material and sources with a saved scene.
     *
     * A material map whose shape differs from the scene grid is cropped or
     * padded to fit. Fields are reset.
     *
     * @throws std::invalid_argument if the settings or material are invalid;
     *         the session is left unchanged
     */
    void load_map(const SimulatorMap& map);

    SimulatorMap to_map() const;

    void reset_fields() { simulator_.reset_fields(); }
    void reset_materials() { simulator_.reset_materials(); }

    int draw_material(MaterialType type, const DrawInfo& info) {
        return simulator_.draw_material(type, info);
    }

    int inject_signal(const DrawInfo& info, float dt) {
        return simulator_.inject_signal(info, dt);
    }

    void set_reflective_boundary(bool reflective) {
        simulator_.set_reflective_boundary(reflective);
    }

    double time() const { return simulator_.time(); }

    Simulator& simulator() { return simulator_; }
    const Simulator& simulator() const { return simulator_; }

private:
    void inject_sources(float dt);

    SimulationSettings settings_;
    Simulator simulator_;
    std::vector<SignalSource> sources_;
    double pending_steps_ = 0.0;
};

}  // namespace maxwell
