/**
 * @file serialization.cpp
 * @brief Material map codec, source descriptor and simulator map JSON
 */

#include "serialization.hpp"

#include "logging.hpp"

#include <zlib.h>

#include <cmath>
#include <cstring>
#include <limits>

namespace maxwell {

namespace {

constexpr const char* kComponent = "serialization";

// Upper bound on decoded width * height, guards the allocation
constexpr uint64_t kMaxDecodedCells = static_cast<uint64_t>(kMaxGridCells);
constexpr size_t kMaxInflatedBytes = (2 + kMaxDecodedCells * 3) * sizeof(float);

[[noreturn]] void decode_fail(const std::string& message) {
    MAXWELL_LOG_WARNING(kComponent, message);
    throw DecodeError(message);
}

void write_u32_le(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xff));
}

uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void write_f32_le(std::vector<uint8_t>& out, float f) {
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    write_u32_le(out, bits);
}

float read_f32_le(const uint8_t* p) {
    const uint32_t bits = read_u32_le(p);
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

int channel_count(uint32_t version) {
    return version == kMaterialMapVersionLegacy ? 2 : 3;
}

std::vector<uint8_t> deflate_bytes(const std::vector<uint8_t>& raw) {
    uLongf bound = compressBound(static_cast<uLong>(raw.size()));
    std::vector<uint8_t> out(bound);
    const int rc = compress2(out.data(), &bound, raw.data(),
                             static_cast<uLong>(raw.size()), Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) {
        MAXWELL_LOG_ERROR(kComponent, "compress2 failed on " << raw.size() << " bytes, code " << rc);
        throw std::runtime_error("zlib compress2 failed with code " + std::to_string(rc));
    }
    out.resize(bound);
    return out;
}

std::vector<uint8_t> inflate_bytes(const uint8_t* data, size_t size) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    if (inflateInit(&stream) != Z_OK) {
        decode_fail("zlib inflateInit failed");
    }

    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(size);

    std::vector<uint8_t> out;
    uint8_t chunk[16384];
    int rc = Z_OK;
    while (rc == Z_OK) {
        stream.next_out = chunk;
        stream.avail_out = sizeof(chunk);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            break;
        }
        out.insert(out.end(), chunk, chunk + (sizeof(chunk) - stream.avail_out));
        if (out.size() > kMaxInflatedBytes) {
            inflateEnd(&stream);
            decode_fail("material map payload inflates past the size limit");
        }
    }

    const uInt trailing = stream.avail_in;
    inflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        decode_fail("material map payload failed to inflate (zlib code " +
                    std::to_string(rc) + ")");
    }
    if (trailing != 0) {
        decode_fail("material map has trailing bytes after the deflate stream");
    }
    return out;
}

// Positive integer stored as a float
int read_dimension(float v, const char* name) {
    if (!std::isfinite(v) || v < 1.0f || v != std::floor(v) ||
        v > static_cast<float>(std::numeric_limits<int>::max() / 2)) {
        decode_fail(std::string("material map ") + name + " is not a positive integer");
    }
    return static_cast<int>(v);
}

template <typename T>
T required(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        decode_fail(std::string("missing field '") + key + "'");
    }
    return j.at(key).get<T>();
}

const char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

}  // namespace

// =============================================================================
// Material map codec
// =============================================================================

std::vector<uint8_t> encode_material_map(const MaterialMap& map, bool compress, uint32_t version) {
    if (version != kMaterialMapVersion && version != kMaterialMapVersionLegacy) {
        throw std::invalid_argument("unknown material map version " + std::to_string(version));
    }
    check_grid_shape(map.shape);
    validate_material(map.permittivity, map.permeability, map.conductivity, map.shape);

    const int channels = channel_count(version);
    const size_t n = static_cast<size_t>(map.shape.size());

    std::vector<uint8_t> payload;
    payload.reserve((2 + n * channels) * sizeof(float));
    write_f32_le(payload, static_cast<float>(map.shape.nx));
    write_f32_le(payload, static_cast<float>(map.shape.ny));
    for (size_t c = 0; c < n; c++) {
        write_f32_le(payload, map.permittivity[c]);
        write_f32_le(payload, map.permeability[c]);
        if (channels == 3) {
            write_f32_le(payload, map.conductivity[c]);
        }
    }

    std::vector<uint8_t> out;
    write_u32_le(out, version);
    write_u32_le(out, compress ? kMaterialMapFlagDeflate : 0u);
    if (compress) {
        const std::vector<uint8_t> packed = deflate_bytes(payload);
        out.insert(out.end(), packed.begin(), packed.end());
    } else {
        out.insert(out.end(), payload.begin(), payload.end());
    }
    return out;
}

MaterialMap decode_material_map(const uint8_t* data, size_t size) {
    if (data == nullptr || size < kMaterialMapHeaderSize) {
        decode_fail("material map is shorter than its header");
    }

    const uint32_t version = read_u32_le(data);
    const uint32_t flags = read_u32_le(data + 4);
    if (version != kMaterialMapVersion && version != kMaterialMapVersionLegacy) {
        decode_fail("unsupported material map version " + std::to_string(version));
    }
    if ((flags & ~kMaterialMapFlagDeflate) != 0) {
        decode_fail("unknown material map flags " + std::to_string(flags));
    }

    std::vector<uint8_t> inflated;
    const uint8_t* payload = data + kMaterialMapHeaderSize;
    size_t payload_size = size - kMaterialMapHeaderSize;
    if (flags & kMaterialMapFlagDeflate) {
        inflated = inflate_bytes(payload, payload_size);
        payload = inflated.data();
        payload_size = inflated.size();
    }

    if (payload_size % sizeof(float) != 0) {
        decode_fail("material map payload is not a whole number of float32 values");
    }
    const size_t count = payload_size / sizeof(float);
    if (count < 2) {
        decode_fail("material map payload has no dimensions");
    }

    const int width = read_dimension(read_f32_le(payload), "width");
    const int height = read_dimension(read_f32_le(payload + 4), "height");
    const uint64_t cells = static_cast<uint64_t>(width) * static_cast<uint64_t>(height);
    if (cells > kMaxDecodedCells) {
        decode_fail("material map of " + std::to_string(width) + "x" +
                    std::to_string(height) + " cells is too large");
    }

    const int channels = channel_count(version);
    if (count - 2 != cells * static_cast<uint64_t>(channels)) {
        decode_fail("material map holds " + std::to_string(count - 2) + " values, expected " +
                    std::to_string(cells * channels) + " for " + std::to_string(width) +
                    "x" + std::to_string(height));
    }

    MaterialMap map;
    map.shape = GridShape{width, height};
    map.permittivity.resize(cells);
    map.permeability.resize(cells);
    map.conductivity.assign(cells, kDefaultConductivity);

    const uint8_t* p = payload + 2 * sizeof(float);
    for (size_t c = 0; c < cells; c++) {
        map.permittivity[c] = read_f32_le(p);
        map.permeability[c] = read_f32_le(p + 4);
        if (channels == 3) {
            map.conductivity[c] = read_f32_le(p + 8);
        }
        p += channels * sizeof(float);
    }

    try {
        validate_material(map.permittivity, map.permeability, map.conductivity, map.shape);
    } catch (const std::invalid_argument& e) {
        decode_fail(std::string("material map: ") + e.what());
    }

    return map;
}

MaterialMap decode_material_map(const std::vector<uint8_t>& data) {
    return decode_material_map(data.data(), data.size());
}

// =============================================================================
// Base64
// =============================================================================

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const uint32_t v = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(kBase64Alphabet[(v >> 18) & 0x3f]);
        out.push_back(kBase64Alphabet[(v >> 12) & 0x3f]);
        out.push_back(kBase64Alphabet[(v >> 6) & 0x3f]);
        out.push_back(kBase64Alphabet[v & 0x3f]);
    }

    const size_t rest = data.size() - i;
    if (rest == 1) {
        const uint32_t v = data[i] << 16;
        out.push_back(kBase64Alphabet[(v >> 18) & 0x3f]);
        out.push_back(kBase64Alphabet[(v >> 12) & 0x3f]);
        out += "==";
    } else if (rest == 2) {
        const uint32_t v = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(kBase64Alphabet[(v >> 18) & 0x3f]);
        out.push_back(kBase64Alphabet[(v >> 12) & 0x3f]);
        out.push_back(kBase64Alphabet[(v >> 6) & 0x3f]);
        out.push_back('=');
    }

    return out;
}

std::vector<uint8_t> base64_decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        decode_fail("base64 text length is not a multiple of 4");
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        int pad = 0;
        uint32_t v = 0;
        for (size_t k = 0; k < 4; k++) {
            const char c = text[i + k];
            if (c == '=' && last && k >= 2) {
                pad++;
                v <<= 6;
                continue;
            }
            const int d = base64_value(c);
            if (d < 0 || pad > 0) {
                decode_fail("invalid base64 character at offset " + std::to_string(i + k));
            }
            v = (v << 6) | static_cast<uint32_t>(d);
        }

        out.push_back(static_cast<uint8_t>((v >> 16) & 0xff));
        if (pad < 2) {
            out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
        }
        if (pad < 1) {
            out.push_back(static_cast<uint8_t>(v & 0xff));
        }
    }

    return out;
}

// =============================================================================
// Source descriptors
// =============================================================================

nlohmann::json source_to_json(const SignalSource& source) {
    const PointSource& point = std::get<PointSource>(source);

    nlohmann::json j{
        {"type", source_type_name(source)},
        {"position", {point.position[0], point.position[1]}},
        {"amplitude", point.amplitude},
        {"frequency", point.frequency},
    };
    if (point.turn_off_time) {
        j["turnOffTime"] = *point.turn_off_time;
    }
    return j;
}

SignalSource source_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        decode_fail("source descriptor must be a JSON object");
    }

    try {
        const std::string type = required<std::string>(j, "type");
        if (type != "point") {
            decode_fail("unsupported source type '" + type + "'");
        }

        const nlohmann::json& position = j.at("position");
        if (!position.is_array() || position.size() != 2) {
            decode_fail("source position must be an [x, y] array");
        }

        PointSource point;
        point.position = {position[0].get<float>(), position[1].get<float>()};
        point.amplitude = required<float>(j, "amplitude");
        point.frequency = required<float>(j, "frequency");
        if (j.contains("turnOffTime") && !j.at("turnOffTime").is_null()) {
            point.turn_off_time = j.at("turnOffTime").get<float>();
        }
        return point;
    } catch (const nlohmann::json::exception& e) {
        decode_fail(std::string("invalid source descriptor: ") + e.what());
    }
}

// =============================================================================
// Simulator maps
// =============================================================================

nlohmann::json simulator_map_to_json(const SimulatorMap& map, bool compress) {
    nlohmann::json sources = nlohmann::json::array();
    for (const SignalSource& source : map.sources) {
        sources.push_back(source_to_json(source));
    }

    return nlohmann::json{
        {"materialMap", base64_encode(encode_material_map(map.material_map, compress))},
        {"simulationSettings", settings_to_json(map.settings)},
        {"sourceDescriptors", sources},
    };
}

SimulatorMap simulator_map_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        decode_fail("simulator map must be a JSON object");
    }

    SimulatorMap map;
    try {
        map.material_map = decode_material_map(
            base64_decode(required<std::string>(j, "materialMap")));
        map.settings = settings_from_json(j.at("simulationSettings"));
        try {
            validate_settings(map.settings);
        } catch (const std::invalid_argument& e) {
            decode_fail(std::string("simulation settings: ") + e.what());
        }

        // Older maps spell the key "sourcesDescriptors"
        const char* key = j.contains("sourceDescriptors") ? "sourceDescriptors"
                                                          : "sourcesDescriptors";
        if (j.contains(key)) {
            const nlohmann::json& descriptors = j.at(key);
            if (!descriptors.is_array()) {
                decode_fail(std::string(key) + " must be an array");
            }
            for (const nlohmann::json& d : descriptors) {
                map.sources.push_back(source_from_json(d));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        decode_fail(std::string("invalid simulator map: ") + e.what());
    }

    return map;
}

std::string dump_simulator_map(const SimulatorMap& map, bool compress) {
    return simulator_map_to_json(map, compress).dump();
}

SimulatorMap parse_simulator_map(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        decode_fail(std::string("malformed simulator map JSON: ") + e.what());
    }
    return simulator_map_from_json(j);
}

}  // namespace maxwell
