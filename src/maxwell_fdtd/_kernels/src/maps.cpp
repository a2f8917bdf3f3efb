/**
 * @file maps.cpp
 * @brief Built-in example scenes
 */

#include "maps.hpp"

#include <cmath>
#include <cstdlib>

namespace maxwell {

namespace {

constexpr int kMapSize = 500;
constexpr float kMapSourceAmplitude = 2000000.0f;
constexpr float kMapSourceFrequency = 3.0f;

SimulatorMap base_map() {
    SimulatorMap map;
    map.settings.dt = 0.02f;
    map.settings.cell_size = 0.03f;
    map.settings.grid_size = GridShape{kMapSize, kMapSize};
    map.settings.simulation_speed = 1.0f;
    map.material_map = default_material_map(map.settings.grid_size);
    return map;
}

// Center line of the fiber, parameterized by t in [0, 1)
Vec2 fiber_curve_point(float t) {
    const double pi = 3.14159265358979323846;
    const double x = 30.0 + kMapSize / 10.0 * 0.5 / (2.0 * t + 1.0) *
                     (1.0 - std::sin(2.0 * pi * t));
    const double y = 30.0 + t * kMapSize / 3.0;
    return {static_cast<float>(std::round(x)), static_cast<float>(std::round(y))};
}

}  // namespace

SimulatorMap empty_map() {
    return base_map();
}

SimulatorMap double_slit_map() {
    SimulatorMap map = base_map();
    MaterialMap& m = map.material_map;
    const GridShape& shape = m.shape;

    const int wall_y = shape.ny / 10;
    const int slit_x = shape.nx / 5;
    for (int j = 0; j < shape.ny; j++) {
        if (std::abs(j - wall_y) >= 2) {
            continue;
        }
        for (int i = 0; i < shape.nx; i++) {
            m.permittivity[idx(i, j, shape)] = 100.0f;
        }
        // Two 5-cell openings either side of the source column
        for (int i = slit_x - 10; i < slit_x - 5; i++) {
            m.permittivity[idx(i, j, shape)] = 1.0f;
        }
        for (int i = slit_x + 10; i > slit_x + 5; i--) {
            m.permittivity[idx(i, j, shape)] = 1.0f;
        }
    }

    PointSource source;
    source.position = {std::round(shape.nx / 5.0f), std::round(shape.ny / 15.0f)};
    source.amplitude = kMapSourceAmplitude;
    source.frequency = kMapSourceFrequency;
    map.sources.push_back(source);
    return map;
}

SimulatorMap fiber_optics_map() {
    SimulatorMap map = base_map();
    MaterialMap& m = map.material_map;
    const GridShape& shape = m.shape;

    constexpr int num_points = 100;
    constexpr int thickness = 2;
    for (int t = 0; t < num_points; t++) {
        const Vec2 pos = fiber_curve_point(static_cast<float>(t) / num_points);
        const int px = static_cast<int>(pos[0]);
        const int py = static_cast<int>(pos[1]);

        for (int i = px - thickness; i < px + thickness; i++) {
            for (int j = py - thickness; j < py + thickness; j++) {
                if (shape.contains(i, j)) {
                    m.permittivity[idx(i, j, shape)] = 2.0f;
                }
            }
        }
    }

    PointSource source;
    source.position = fiber_curve_point(0.0f);
    source.amplitude = kMapSourceAmplitude;
    source.frequency = kMapSourceFrequency;
    source.turn_off_time = 0.5f;
    map.sources.push_back(source);
    return map;
}

std::vector<std::string> builtin_map_names() {
    return {"empty", "double_slit", "fiber_optics"};
}

SimulatorMap builtin_map(const std::string& name) {
    if (name == "empty") {
        return empty_map();
    }
    if (name == "double_slit") {
        return double_slit_map();
    }
    if (name == "fiber_optics") {
        return fiber_optics_map();
    }
    throw std::invalid_argument("unknown map '" + name + "'");
}

}  // namespace maxwell
