#pragma once
/**
 * @file maxwell_types.hpp
 * @brief Common type definitions for the 2D Maxwell FDTD kernels
 */

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// OpenMP configuration - include outside namespace to avoid scope issues
#if MAXWELL_HAS_OPENMP
    #include <omp.h>
    #define MAXWELL_PARALLEL_FOR _Pragma("omp parallel for schedule(static)")
    #define MAXWELL_PARALLEL_FOR_SIMD _Pragma("omp parallel for simd schedule(static)")
    #define MAXWELL_SIMD _Pragma("omp simd")
#else
    #define MAXWELL_PARALLEL_FOR
    #define MAXWELL_PARALLEL_FOR_SIMD
    #define MAXWELL_SIMD
#endif

namespace maxwell {

// Grid dimensions in cells
struct GridShape {
    int nx;  // width
    int ny;  // height

    int size() const { return nx * ny; }

    bool contains(int i, int j) const {
        return i >= 0 && j >= 0 && i < nx && j < ny;
    }

    bool operator==(const GridShape& other) const {
        return nx == other.nx && ny == other.ny;
    }
    bool operator!=(const GridShape& other) const { return !(*this == other); }
};

// Inline helper for 2D -> 1D index conversion (row-major, C-contiguous)
// Layout: [j, i] -> j * nx + i, i.e. rows of constant y
inline int idx(int i, int j, int nx) {
    return j * nx + i;
}

inline int idx(int i, int j, const GridShape& shape) {
    return j * shape.nx + i;
}

// Largest grid accepted anywhere, keeps nx * ny within int
constexpr int64_t kMaxGridCells = int64_t{1} << 26;

/**
 * @brief Reject non-positive or oversized grid dimensions at the
 * configuration boundary.
 *
 * @throws std::invalid_argument if either dimension is < 1 or the cell
 *         count exceeds kMaxGridCells
 */
inline void check_grid_shape(const GridShape& shape) {
    if (shape.nx < 1 || shape.ny < 1) {
        throw std::invalid_argument(
            "grid dimensions must be positive, got " +
            std::to_string(shape.nx) + "x" + std::to_string(shape.ny));
    }
    if (static_cast<int64_t>(shape.nx) * shape.ny > kMaxGridCells) {
        throw std::invalid_argument(
            "grid of " + std::to_string(shape.nx) + "x" + std::to_string(shape.ny) +
            " cells exceeds the limit of " + std::to_string(kMaxGridCells) + " cells");
    }
}

/**
 * @brief Thrown when external data (material payloads, source descriptors,
 * simulator maps) violates its wire contract.
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace maxwell
