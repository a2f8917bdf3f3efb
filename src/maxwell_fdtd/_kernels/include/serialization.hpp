#pragma once
/**
 * @file serialization.hpp
 * @brief Material map wire format, source descriptors and simulator maps
 *
 * Encoded material map (all integers and floats little-endian):
 *
 *   offset 0  uint32  version (1 = permittivity/permeability, 2 = + conductivity)
 *   offset 4  uint32  flags   (bit 0 = payload is zlib-deflated)
 *   offset 8  payload float32 run [width, height, per-cell channel tuples...]
 *
 * Cells are row-major, one tuple per cell: (eps, mu) for version 1 and
 * (eps, mu, sigma) for version 2.
 */

#include "materials.hpp"
#include "settings.hpp"
#include "sources.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace maxwell {

constexpr uint32_t kMaterialMapVersionLegacy = 1;
constexpr uint32_t kMaterialMapVersion = 2;
constexpr uint32_t kMaterialMapFlagDeflate = 1u << 0;
constexpr size_t kMaterialMapHeaderSize = 8;

/**
 * @brief Encode a material map.
 *
 * @param map Material to encode, arrays must match map.shape
 * @param compress Deflate the payload
 * @param version kMaterialMapVersion, or kMaterialMapVersionLegacy to drop
 *        the conductivity channel
 * @throws std::invalid_argument on inconsistent arrays or unknown version
 */
std::vector<uint8_t> encode_material_map(
    const MaterialMap& map,
    bool compress = true,
    uint32_t version = kMaterialMapVersion
);

/**
 * @brief Decode and validate an encoded material map.
 *
 * Legacy payloads decode with zero conductivity.
 *
 * @throws DecodeError on a short header, unknown version or flags, inflate
 *         failure, truncated payload, bad dimensions or invalid values
 */
MaterialMap decode_material_map(const uint8_t* data, size_t size);

MaterialMap decode_material_map(const std::vector<uint8_t>& data);

// =============================================================================
// Base64 (RFC 4648, padded)
// =============================================================================

std::string base64_encode(const std::vector<uint8_t>& data);

/// @throws DecodeError on characters outside the alphabet or bad padding
std::vector<uint8_t> base64_decode(const std::string& text);

// =============================================================================
// Source descriptors
// =============================================================================

/// {"type": "point", "position": [x, y], "amplitude", "frequency", "turnOffTime"?}
nlohmann::json source_to_json(const SignalSource& source);

/// @throws DecodeError on an unknown type or missing/mistyped fields
SignalSource source_from_json(const nlohmann::json& j);

// =============================================================================
// Simulator maps
// =============================================================================

/**
 * @brief Everything needed to restore a scene: material, settings, sources.
 */
struct SimulatorMap {
    MaterialMap material_map;
    SimulationSettings settings;
    std::vector<SignalSource> sources;
};

/**
 * @brief Serialize a scene.
 *
 * {"materialMap": base64(encoded map), "simulationSettings": {...},
 *  "sourceDescriptors": [...]}
 */
nlohmann::json simulator_map_to_json(const SimulatorMap& map, bool compress = true);

/// @throws DecodeError on any malformed part
SimulatorMap simulator_map_from_json(const nlohmann::json& j);

std::string dump_simulator_map(const SimulatorMap& map, bool compress = true);

/// @throws DecodeError on malformed JSON text or any malformed part
SimulatorMap parse_simulator_map(const std::string& text);

}  // namespace maxwell
