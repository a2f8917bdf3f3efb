/**
 * @file settings.cpp
 * @brief Simulation settings implementation
 */

#include "settings.hpp"

#include "simulator.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace maxwell {

namespace {

int read_grid_dimension(const nlohmann::json& value) {
    if (!value.is_number_integer()) {
        throw DecodeError("gridSize entries must be integers");
    }
    const int64_t n = value.get<int64_t>();
    if (n < 1 || n > std::numeric_limits<int>::max()) {
        throw DecodeError("gridSize entry " + value.dump() + " is out of range");
    }
    return static_cast<int>(n);
}

}  // namespace

void validate_settings(const SimulationSettings& settings) {
    check_positive(settings.dt, "dt");
    check_positive(settings.cell_size, "cell size");
    check_grid_shape(settings.grid_size);
    if (!(settings.simulation_speed >= 0.0f) || !std::isfinite(settings.simulation_speed)) {
        throw std::invalid_argument(
            "simulation speed must be non-negative, got " +
            std::to_string(settings.simulation_speed));
    }
}

nlohmann::json settings_to_json(const SimulationSettings& settings) {
    return nlohmann::json{
        {"dt", settings.dt},
        {"gridSize", {settings.grid_size.nx, settings.grid_size.ny}},
        {"simulationSpeed", settings.simulation_speed},
        {"cellSize", settings.cell_size},
    };
}

SimulationSettings settings_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw DecodeError("simulation settings must be a JSON object");
    }

    SimulationSettings settings;
    try {
        if (j.contains("dt")) {
            settings.dt = j.at("dt").get<float>();
        }
        if (j.contains("gridSize")) {
            const nlohmann::json& size = j.at("gridSize");
            if (!size.is_array() || size.size() != 2) {
                throw DecodeError("gridSize must be a [width, height] array");
            }
            settings.grid_size = GridShape{read_grid_dimension(size[0]), read_grid_dimension(size[1])};
        }
        if (j.contains("simulationSpeed")) {
            settings.simulation_speed = j.at("simulationSpeed").get<float>();
        }
        if (j.contains("cellSize")) {
            settings.cell_size = j.at("cellSize").get<float>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(std::string("invalid simulation settings: ") + e.what());
    }

    return settings;
}

int get_num_threads() {
#if MAXWELL_HAS_OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

void set_num_threads(int n) {
    if (n < 1) {
        throw std::invalid_argument("thread count must be at least 1");
    }
#if MAXWELL_HAS_OPENMP
    omp_set_num_threads(n);
#else
    if (n != 1) {
        throw std::runtime_error("OpenMP not available, cannot set thread count");
    }
#endif
}

}  // namespace maxwell
