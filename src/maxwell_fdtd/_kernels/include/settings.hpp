#pragma once
/**
 * @file settings.hpp
 * @brief Simulation settings and runtime configuration
 */

#include "maxwell_types.hpp"

#include <nlohmann/json.hpp>

namespace maxwell {

/**
 * @brief User-facing simulation parameters.
 *
 * JSON keys: dt, gridSize ([width, height]), simulationSpeed, cellSize.
 */
struct SimulationSettings {
    float dt = 0.02f;
    GridShape grid_size{500, 500};
    float simulation_speed = 1.0f;  // Steps per tick, may be fractional
    float cell_size = 0.03f;
};

/**
 * @brief Check settings before they reach the simulator.
 *
 * @throws std::invalid_argument for non-positive dt, cell size or grid
 *         dimensions, or a negative or non-finite simulation speed
 */
void validate_settings(const SimulationSettings& settings);

nlohmann::json settings_to_json(const SimulationSettings& settings);

/**
 * @brief Parse settings; missing keys keep their defaults.
 *
 * @throws DecodeError if a present key has the wrong JSON type
 */
SimulationSettings settings_from_json(const nlohmann::json& j);

// =============================================================================
// Threading
// =============================================================================

/// Number of OpenMP threads available (1 without OpenMP).
int get_num_threads();

/**
 * @brief Set the number of OpenMP threads used by every kernel.
 *
 * @throws std::invalid_argument if n < 1
 * @throws std::runtime_error if OpenMP is not available and n != 1
 */
void set_num_threads(int n);

}  // namespace maxwell
