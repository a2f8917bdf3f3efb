// test_serialization.cpp - Unit tests for the material map wire format and
// scene JSON
//
// Validates:
// 1. Material map round trip with and without compression
// 2. Legacy two-channel payloads decode with zero conductivity
// 3. Every malformed-payload path raises DecodeError
// 4. Base64, source descriptor and simulator map JSON

#include "test_harness.hpp"

#include "logging.hpp"
#include "maps.hpp"
#include "serialization.hpp"

#include <algorithm>
#include <cstring>
#include <utility>
#include <variant>

using namespace maxwell;

namespace {

MaterialMap sample_map() {
    const GridShape shape{4, 4};
    MaterialMap map = default_material_map(shape);
    for (int c = 0; c < shape.size(); c++) {
        map.permittivity[c] = 1.0f + 0.5f * c;
        map.permeability[c] = 2.0f + 0.25f * (c % 3);
        map.conductivity[c] = 0.125f * (c % 5);
    }
    return map;
}

bool same_material(const MaterialMap& a, const MaterialMap& b) {
    return a.shape == b.shape && a.permittivity == b.permittivity &&
           a.permeability == b.permeability && a.conductivity == b.conductivity;
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int k = 0; k < 4; k++) out.push_back(static_cast<uint8_t>((v >> (8 * k)) & 0xff));
}

void put_f32(std::vector<uint8_t>& out, float f) {
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    put_u32(out, bits);
}

// Uncompressed payload with arbitrary dimensions and values
std::vector<uint8_t> raw_payload(uint32_t version, float w, float h, const std::vector<float>& values) {
    std::vector<uint8_t> out;
    put_u32(out, version);
    put_u32(out, 0);
    put_f32(out, w);
    put_f32(out, h);
    for (float v : values) put_f32(out, v);
    return out;
}

template <typename F>
bool decode_error(F&& f) {
    return throws<DecodeError>(std::forward<F>(f));
}

}  // namespace

void test_material_round_trip() {
    const MaterialMap map = sample_map();

    std::vector<uint8_t> plain = encode_material_map(map, false);
    report_test("uncompressed layout is header + float32 run",
                plain.size() == 8 + (2 + 16 * 3) * 4 && plain[0] == 2 && plain[4] == 0);
    report_test("uncompressed map round-trips exactly", same_material(decode_material_map(plain), map));

    std::vector<uint8_t> packed = encode_material_map(map, true);
    report_test("compressed map sets the deflate flag", packed[4] == 1);
    report_test("compressed map round-trips exactly", same_material(decode_material_map(packed), map));

    std::vector<uint8_t> legacy = encode_material_map(map, false, kMaterialMapVersionLegacy);
    MaterialMap decoded = decode_material_map(legacy);
    bool sigma_zero = std::all_of(decoded.conductivity.begin(), decoded.conductivity.end(),
                                  [](float s) { return s == 0.0f; });
    report_test("legacy version decodes with zero conductivity",
                legacy.size() == 8 + (2 + 16 * 2) * 4 && sigma_zero &&
                decoded.permittivity == map.permittivity && decoded.permeability == map.permeability);

    std::vector<uint8_t> legacy_packed = encode_material_map(map, true, kMaterialMapVersionLegacy);
    report_test("compressed legacy map decodes",
                decode_material_map(legacy_packed).permeability == map.permeability);
}

void test_material_decode_errors() {
    const MaterialMap map = sample_map();
    std::vector<uint8_t> good = encode_material_map(map, false);

    report_test("short header is rejected",
                decode_error([] { decode_material_map(std::vector<uint8_t>{2, 0, 0, 0, 0}); }));

    std::vector<uint8_t> bad_version = good;
    bad_version[0] = 7;
    report_test("unknown version is rejected", decode_error([&] { decode_material_map(bad_version); }));

    std::vector<uint8_t> bad_flags = good;
    bad_flags[4] = 2;
    report_test("unknown flags are rejected", decode_error([&] { decode_material_map(bad_flags); }));

    std::vector<uint8_t> truncated(good.begin(), good.end() - 4);
    report_test("missing values are rejected", decode_error([&] { decode_material_map(truncated); }));

    std::vector<uint8_t> ragged(good.begin(), good.end() - 1);
    report_test("partial float is rejected", decode_error([&] { decode_material_map(ragged); }));

    std::vector<uint8_t> extra = good;
    put_f32(extra, 1.0f);
    put_f32(extra, 1.0f);
    put_f32(extra, 0.0f);
    report_test("extra values are rejected", decode_error([&] { decode_material_map(extra); }));

    std::vector<uint8_t> corrupt = encode_material_map(map, true);
    for (size_t k = 10; k < corrupt.size(); k++) corrupt[k] ^= 0x5a;
    report_test("corrupt deflate stream is rejected", decode_error([&] { decode_material_map(corrupt); }));

    std::vector<uint8_t> cut = encode_material_map(map, true);
    cut.resize(cut.size() / 2);
    report_test("truncated deflate stream is rejected", decode_error([&] { decode_material_map(cut); }));

    report_test("fractional width is rejected",
                decode_error([] { decode_material_map(raw_payload(2, 1.5f, 1.0f, {1, 1, 0})); }));
    report_test("zero height is rejected",
                decode_error([] { decode_material_map(raw_payload(2, 1.0f, 0.0f, {})); }));
    report_test("non-positive permittivity is rejected",
                decode_error([] { decode_material_map(raw_payload(2, 1.0f, 1.0f, {0, 1, 0})); }));
    report_test("well-formed 1x1 payload decodes",
                decode_material_map(raw_payload(1, 1.0f, 1.0f, {3, 4})).permittivity[0] == 3.0f);

    MaterialMap inconsistent = map;
    inconsistent.conductivity.pop_back();
    report_test("encoding inconsistent arrays is rejected",
                throws<std::invalid_argument>([&] { encode_material_map(inconsistent); }));
}

void test_base64() {
    const std::string text = "Maxwell!";
    std::vector<uint8_t> bytes(text.begin(), text.end());

    report_test("base64 encodes with padding",
                base64_encode(std::vector<uint8_t>{'M', 'a'}) == "TWE=" &&
                base64_encode(std::vector<uint8_t>{'M'}) == "TQ==" &&
                base64_encode(std::vector<uint8_t>{'M', 'a', 'n'}) == "TWFu");

    report_test("base64 round-trips", base64_decode(base64_encode(bytes)) == bytes &&
                base64_decode("").empty());

    report_test("base64 rejects bad characters and lengths",
                decode_error([] { base64_decode("TW*u"); }) &&
                decode_error([] { base64_decode("TWF"); }) &&
                decode_error([] { base64_decode("T=Fu"); }));
}

void test_source_descriptors() {
    PointSource p;
    p.position = {10.0f, 20.0f};
    p.amplitude = 5.0f;
    p.frequency = 3.0f;
    p.turn_off_time = 0.5f;

    nlohmann::json j = source_to_json(p);
    report_test("point source JSON uses the descriptor keys",
                j["type"] == "point" && j["position"][1] == 20.0 && j["turnOffTime"] == 0.5);

    PointSource back = std::get<PointSource>(source_from_json(j));
    report_test("source descriptor round-trips",
                back.position == p.position && back.amplitude == 5.0f && back.frequency == 3.0f &&
                back.turn_off_time && *back.turn_off_time == 0.5f);

    nlohmann::json forever = {{"type", "point"}, {"position", {1, 2}}, {"amplitude", 1}, {"frequency", 2}};
    report_test("missing turnOffTime means never off",
                !std::get<PointSource>(source_from_json(forever)).turn_off_time);

    nlohmann::json unknown = forever;
    unknown["type"] = "plane_wave";
    report_test("unknown source type is a decode error", decode_error([&] { source_from_json(unknown); }));

    nlohmann::json missing = forever;
    missing.erase("amplitude");
    report_test("missing field is a decode error", decode_error([&] { source_from_json(missing); }));

    nlohmann::json mistyped = forever;
    mistyped["frequency"] = "fast";
    report_test("mistyped field is a decode error", decode_error([&] { source_from_json(mistyped); }));
}

void test_simulator_map_json() {
    SimulatorMap map;
    map.material_map = sample_map();
    map.settings.grid_size = GridShape{4, 4};
    map.settings.dt = 0.01f;
    map.settings.simulation_speed = 0.5f;
    PointSource p;
    p.position = {1.0f, 2.0f};
    p.amplitude = 3.0f;
    p.frequency = 4.0f;
    map.sources.push_back(p);

    const std::string text = dump_simulator_map(map);
    nlohmann::json j = nlohmann::json::parse(text);
    report_test("simulator map JSON has the scene keys",
                j.contains("materialMap") && j["materialMap"].is_string() &&
                j["simulationSettings"]["gridSize"][0] == 4 &&
                j["sourceDescriptors"].size() == 1);

    SimulatorMap back = parse_simulator_map(text);
    report_test("simulator map round-trips",
                same_material(back.material_map, map.material_map) &&
                back.settings.dt == 0.01f && back.settings.simulation_speed == 0.5f &&
                back.sources.size() == 1 &&
                std::get<PointSource>(back.sources[0]).frequency == 4.0f);

    j["sourcesDescriptors"] = j["sourceDescriptors"];
    j.erase("sourceDescriptors");
    report_test("older sourcesDescriptors key is accepted",
                simulator_map_from_json(j).sources.size() == 1);

    report_test("malformed JSON text is a decode error",
                decode_error([] { parse_simulator_map("{\"materialMap\": "); }));
    report_test("bad material payload is a decode error",
                decode_error([] {
                    parse_simulator_map(R"({"materialMap": "AAAA", "simulationSettings": {}})");
                }));
    report_test("invalid settings are a decode error",
                decode_error([&] {
                    nlohmann::json bad = nlohmann::json::parse(text);
                    bad["simulationSettings"]["dt"] = -1.0;
                    simulator_map_from_json(bad);
                }));
    report_test("missing settings is a decode error",
                decode_error([&] {
                    nlohmann::json partial = nlohmann::json::parse(text);
                    partial.erase("simulationSettings");
                    simulator_map_from_json(partial);
                }));
}

void test_builtin_maps() {
    SimulatorMap slit = double_slit_map();
    const GridShape& s = slit.material_map.shape;
    report_test("built-in maps use the default scene settings",
                s == (GridShape{500, 500}) && slit.settings.dt == 0.02f &&
                slit.settings.cell_size == 0.03f && slit.settings.simulation_speed == 1.0f);

    report_test("double slit has a wall with two openings",
                slit.material_map.permittivity[idx(0, 50, s)] == 100.0f &&
                slit.material_map.permittivity[idx(92, 50, s)] == 1.0f &&
                slit.material_map.permittivity[idx(108, 49, s)] == 1.0f &&
                slit.material_map.permittivity[idx(100, 51, s)] == 100.0f &&
                slit.material_map.permittivity[idx(100, 52, s)] == 1.0f);

    const PointSource& src = std::get<PointSource>(slit.sources.at(0));
    report_test("double slit source sits below the wall",
                src.position[0] == 100.0f && src.position[1] == 33.0f && !src.turn_off_time);

    SimulatorMap fiber = fiber_optics_map();
    const PointSource& fsrc = std::get<PointSource>(fiber.sources.at(0));
    report_test("fiber source starts at the fiber entry and turns off",
                fsrc.position[0] == 55.0f && fsrc.position[1] == 30.0f &&
                fsrc.turn_off_time && *fsrc.turn_off_time == 0.5f &&
                fiber.material_map.permittivity[idx(55, 30, fiber.material_map.shape)] == 2.0f);

    report_test("empty map is vacuum without sources",
                empty_map().sources.empty() && empty_map().material_map.permittivity[0] == 1.0f);

    report_test("built-in maps survive the JSON round trip",
                same_material(parse_simulator_map(dump_simulator_map(fiber)).material_map,
                              fiber.material_map));

    report_test("unknown map name is rejected",
                throws<std::invalid_argument>([] { builtin_map("moon"); }) &&
                builtin_map_names().size() == 3);
}

int main() {
    print_banner("SERIALIZATION - UNIT TEST SUITE");

    // Decode failures log warnings; keep the test output clean
    set_log_level(LogLevel::Error);

    run_guarded("material round trip", test_material_round_trip);
    run_guarded("material decode errors", test_material_decode_errors);
    run_guarded("base64", test_base64);
    run_guarded("source descriptors", test_source_descriptors);
    run_guarded("simulator map JSON", test_simulator_map_json);
    run_guarded("built-in maps", test_builtin_maps);

    return finish_tests();
}
