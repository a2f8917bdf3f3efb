#pragma once
/**
 * @file maps.hpp
 * @brief Built-in example scenes
 *
 * All built-in maps use a 500x500 grid, dt 0.02, cell size 0.03 and
 * simulation speed 1.
 */

#include "serialization.hpp"

#include <string>
#include <vector>

namespace maxwell {

/// Vacuum everywhere, no sources.
SimulatorMap empty_map();

/// High-permittivity wall with two slits, one point source below it.
SimulatorMap double_slit_map();

/// Curved permittivity-2 fiber fed by a point source that turns off at t = 0.5.
SimulatorMap fiber_optics_map();

/// Names accepted by builtin_map().
std::vector<std::string> builtin_map_names();

/// @throws std::invalid_argument for an unknown name
SimulatorMap builtin_map(const std::string& name);

}  // namespace maxwell
