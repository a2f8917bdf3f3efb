/**
 * @file sources.cpp
 * @brief Signal source implementations
 */

#include "sources.hpp"

#include <cmath>

namespace maxwell {

namespace {

constexpr double kTwoPi = 6.283185307179586;

struct DrawInfoVisitor {
    double t;

    std::optional<DrawInfo> operator()(const PointSource& source) const {
        const std::optional<float> value = source_value(source, t);
        if (!value) {
            return std::nullopt;
        }
        return make_draw_square_info(
            source.position, {kPointSourceHalfSize, kPointSourceHalfSize}, *value);
    }
};

}  // namespace

std::optional<float> source_value(const PointSource& source, double t) {
    if (t < 0.0) {
        return std::nullopt;
    }
    if (source.turn_off_time && t > *source.turn_off_time) {
        return std::nullopt;
    }

    const double phase = kTwoPi * static_cast<double>(source.frequency) * t;
    return static_cast<float>(-static_cast<double>(source.amplitude) * std::cos(phase));
}

std::optional<float> source_value(const SignalSource& source, double t) {
    return std::visit([t](const auto& s) { return source_value(s, t); }, source);
}

std::optional<DrawInfo> source_draw_info(const SignalSource& source, double t) {
    return std::visit(DrawInfoVisitor{t}, source);
}

const char* source_type_name(const SignalSource& source) {
    if (std::holds_alternative<PointSource>(source)) {
        return "point";
    }
    return "unknown";
}

}  // namespace maxwell
