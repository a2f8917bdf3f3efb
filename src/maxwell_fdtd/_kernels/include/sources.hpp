#pragma once
/**
 * @file sources.hpp
 * @brief Signal sources injected into the electric source accumulator
 *
 * Sources form a closed set of variants. Each one only answers "what is
 * the forcing at time t, if any"; the session turns that answer into a
 * draw into the source field.
 */

#include "drawing.hpp"

#include <optional>
#include <variant>
#include <vector>

namespace maxwell {

/**
 * @brief Oscillating point source: -A * cos(2 pi f t) for 0 <= t <= T.
 */
struct PointSource {
    Vec2 position = {0.0f, 0.0f};       // Cell coordinates
    float amplitude = 0.0f;
    float frequency = 0.0f;             // Cycles per unit simulation time
    std::optional<float> turn_off_time; // Unset: never turns off
};

using SignalSource = std::variant<PointSource>;

// Half-size of the square a point source is splatted into (one cell)
constexpr float kPointSourceHalfSize = 0.5f;

/**
 * @brief Forcing value of a point source at simulation time t.
 *
 * @return std::nullopt before t = 0 and after the turn-off time
 */
std::optional<float> source_value(const PointSource& source, double t);

std::optional<float> source_value(const SignalSource& source, double t);

/**
 * @brief Draw to perform into the source field at time t, if any.
 *
 * The draw value is the unscaled forcing; the simulator scales it by dt.
 */
std::optional<DrawInfo> source_draw_info(const SignalSource& source, double t);

const char* source_type_name(const SignalSource& source);

}  // namespace maxwell
