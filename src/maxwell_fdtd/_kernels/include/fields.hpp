#pragma once
/**
 * @file fields.hpp
 * @brief Grid field storage: vector fields and double buffering
 *
 * Every field the stepper touches lives in a DoubleBuffer. A pass reads the
 * previous slot and writes the current slot, then the slots swap, so no
 * kernel ever reads a value it is overwriting in the same pass.
 */

#include "maxwell_types.hpp"

#include <array>
#include <vector>

namespace maxwell {

/**
 * @brief Three-component field sampled once per cell (structure of arrays).
 *
 * Used for the electric field (Ex, Ey, Ez), the magnetic field (Hx, Hy, Hz)
 * and the electric source accumulator.
 */
struct VectorField {
    std::vector<float> x;
    std::vector<float> y;
    std::vector<float> z;

    /// Reallocate to the grid size, all components zeroed.
    void resize(const GridShape& shape);

    /// Set every sample to zero.
    void clear();

    size_t size() const { return x.size(); }
};

/**
 * @brief Two named buffer slots behind an index swap.
 */
template <typename T>
class DoubleBuffer {
public:
    T& current() { return slots_[current_index_]; }
    const T& current() const { return slots_[current_index_]; }

    T& previous() { return slots_[1 - current_index_]; }
    const T& previous() const { return slots_[1 - current_index_]; }

    void swap() { current_index_ = 1 - current_index_; }

    // Apply f to both slots, e.g. for resizing
    template <typename F>
    void for_each(F&& f) {
        f(slots_[0]);
        f(slots_[1]);
    }

private:
    std::array<T, 2> slots_{};
    int current_index_ = 0;
};

/**
 * @brief Read a scalar channel with the zero out-of-bounds convention.
 */
inline float sample(const float* __restrict__ field, int i, int j, const GridShape& shape) {
    return shape.contains(i, j) ? field[idx(i, j, shape)] : 0.0f;
}

/**
 * @brief Copy a scalar channel, cropping or padding with fill_value.
 *
 * Cells of dst_shape that exist in src_shape are copied; the rest are set to
 * fill_value.
 */
std::vector<float> resample_channel(
    const std::vector<float>& src,
    const GridShape& src_shape,
    const GridShape& dst_shape,
    float fill_value
);

}  // namespace maxwell
