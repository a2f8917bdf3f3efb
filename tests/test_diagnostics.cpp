// test_diagnostics.cpp - Unit tests for field energy and settings helpers
//
// Validates:
// 1. Field, leapfrog and region energy sums
// 2. Per-cell energy density and its show flags
// 3. Simulation settings validation and JSON
// 4. Log level filtering and error output

#include "test_harness.hpp"

#include "diagnostics.hpp"
#include "logging.hpp"
#include "settings.hpp"

#include <iostream>
#include <sstream>

using namespace maxwell;

namespace {

const GridShape kShape{4, 3};

VectorField ramp_field(float scale) {
    VectorField f;
    f.resize(kShape);
    for (int c = 0; c < kShape.size(); c++) {
        f.x[c] = scale * c;
        f.y[c] = scale;
        f.z[c] = 0.0f;
    }
    return f;
}

}  // namespace

void test_field_energy() {
    VectorField e = ramp_field(1.0f);
    VectorField h;
    h.resize(kShape);
    h.z[idx(1, 1, kShape)] = 2.0f;

    // sum c^2 for c < 12 is 506, plus 12 * 1
    FieldEnergy energy = compute_field_energy(e, h);
    report_test("field energy sums squared magnitudes",
                near(energy.electric, 518.0, 1e-9) && near(energy.magnetic, 4.0, 1e-9) &&
                near(energy.total(), 522.0, 1e-9));

    VectorField h_next = h;
    h_next.z[idx(1, 1, kShape)] = 3.0f;
    h_next.x[0] = 5.0f;
    report_test("leapfrog energy uses the product of successive H",
                near(compute_leapfrog_energy(e, h, h_next), 518.0 + 6.0, 1e-9));

    VectorField empty;
    empty.resize(kShape);
    FieldEnergy zero = compute_field_energy(empty, empty);
    report_test("zero fields have zero energy", zero.total() == 0.0);
}

void test_region_energy() {
    VectorField e = ramp_field(1.0f);
    VectorField h;
    h.resize(kShape);
    h.y[idx(3, 2, kShape)] = 1.0f;

    // cells (1,1) and (2,1): c = 5, 6
    FieldEnergy box = compute_region_energy(e, h, kShape, 1, 1, 3, 2);
    report_test("region energy covers the half-open box",
                near(box.electric, 25.0 + 1.0 + 36.0 + 1.0, 1e-9) && box.magnetic == 0.0);

    FieldEnergy clipped = compute_region_energy(e, h, kShape, -5, -5, 100, 100);
    FieldEnergy whole = compute_field_energy(e, h);
    report_test("region is clipped to the grid",
                near(clipped.electric, whole.electric, 1e-9) &&
                near(clipped.magnetic, 1.0, 1e-9));

    FieldEnergy inverted = compute_region_energy(e, h, kShape, 3, 2, 1, 1);
    report_test("empty region has zero energy", inverted.total() == 0.0);
}

void test_energy_density() {
    VectorField e = ramp_field(1.0f);
    VectorField h;
    h.resize(kShape);
    h.z[idx(2, 0, kShape)] = 2.0f;

    MaterialField material;
    material.resize(kShape);
    material.permittivity[idx(1, 0, kShape)] = 3.0f;
    material.permeability[idx(2, 0, kShape)] = 0.5f;

    EnergyDensity both = compute_energy_density(e, h, material, true, true);
    report_test("electric density is eps * |E|^2",
                both.electric.size() == 12 &&
                both.electric[idx(1, 0, kShape)] == 3.0f * (1.0f + 1.0f) &&
                both.electric[idx(3, 0, kShape)] == 9.0f + 1.0f);
    report_test("magnetic density is mu * |H|^2",
                both.magnetic[idx(2, 0, kShape)] == 0.5f * 4.0f &&
                both.magnetic[idx(0, 0, kShape)] == 0.0f);

    EnergyDensity electric_only = compute_energy_density(e, h, material, true, false);
    bool magnetic_zero = true;
    for (float v : electric_only.magnetic) magnetic_zero = magnetic_zero && v == 0.0f;
    report_test("hidden magnetic density is zero",
                magnetic_zero && electric_only.electric == both.electric);

    EnergyDensity none = compute_energy_density(e, h, material, false, false);
    bool all_zero = true;
    for (float v : none.electric) all_zero = all_zero && v == 0.0f;
    report_test("hidden electric density is zero", all_zero && none.electric.size() == 12);

    VectorField wrong;
    wrong.resize(GridShape{2, 2});
    report_test("mismatched inputs are rejected",
                throws<std::invalid_argument>([&] {
                    compute_energy_density(e, wrong, material, true, true);
                }));
}

void test_settings() {
    SimulationSettings defaults;
    report_test("default settings are valid",
                defaults.dt == 0.02f && defaults.cell_size == 0.03f &&
                defaults.grid_size == (GridShape{500, 500}) && defaults.simulation_speed == 1.0f &&
                !throws<std::invalid_argument>([&] { validate_settings(defaults); }));

    SimulationSettings bad = defaults;
    bad.cell_size = -1.0f;
    report_test("non-positive cell size is invalid",
                throws<std::invalid_argument>([&] { validate_settings(bad); }));

    nlohmann::json j = settings_to_json(defaults);
    report_test("settings JSON uses the scene keys",
                j["gridSize"][1] == 500 && j.contains("simulationSpeed") && j.contains("cellSize"));

    SimulationSettings partial = settings_from_json(nlohmann::json{{"dt", 0.5}});
    report_test("missing settings keys keep their defaults",
                partial.dt == 0.5f && partial.grid_size == defaults.grid_size);

    report_test("malformed settings are a decode error",
                throws<DecodeError>([] { settings_from_json(nlohmann::json{{"gridSize", {1}}}); }) &&
                throws<DecodeError>([] { settings_from_json(nlohmann::json{{"dt", "x"}}); }) &&
                throws<DecodeError>([] { settings_from_json(nlohmann::json::array()); }));

    report_test("grid dimensions must be in-range integers",
                throws<DecodeError>([] {
                    settings_from_json(nlohmann::json::parse(R"({"gridSize": [5000000000, 2]})"));
                }) &&
                throws<DecodeError>([] {
                    settings_from_json(nlohmann::json::parse(R"({"gridSize": [2.5, 4]})"));
                }) &&
                throws<DecodeError>([] {
                    settings_from_json(nlohmann::json::parse(R"({"gridSize": [0, 4]})"));
                }));

    SimulationSettings huge = defaults;
    huge.grid_size = GridShape{70000, 70000};
    report_test("oversized grid settings are invalid",
                throws<std::invalid_argument>([&] { validate_settings(huge); }));

    report_test("thread count below one is rejected",
                get_num_threads() >= 1 &&
                throws<std::invalid_argument>([] { set_num_threads(0); }));
}

void test_log_levels() {
    report_test("default log level is warning",
                log_level() == LogLevel::Warning && log_enabled(LogLevel::Error) &&
                log_enabled(LogLevel::Warning) && !log_enabled(LogLevel::Info));

    set_log_level(LogLevel::Debug);
    const bool debug_on = log_enabled(LogLevel::Debug);
    set_log_level(LogLevel::Error);
    const bool warning_off = !log_enabled(LogLevel::Warning);

    int evaluated = 0;
    MAXWELL_LOG_INFO("diagnostics", "skipped " << ++evaluated);
    report_test("level filters messages and skips their formatting",
                debug_on && warning_off && evaluated == 0);

    std::ostringstream captured;
    std::streambuf* saved = std::cerr.rdbuf(captured.rdbuf());
    MAXWELL_LOG_ERROR("diagnostics", "failed " << ++evaluated);
    std::cerr.rdbuf(saved);
    report_test("errors are logged at the strictest level",
                evaluated == 1 && captured.str() == "[ERROR] [diagnostics] failed 1\n");

    set_log_level(LogLevel::Warning);
}

int main() {
    print_banner("FIELD DIAGNOSTICS - UNIT TEST SUITE");

    run_guarded("field energy", test_field_energy);
    run_guarded("region energy", test_region_energy);
    run_guarded("energy density", test_energy_density);
    run_guarded("settings", test_settings);
    run_guarded("log levels", test_log_levels);

    return finish_tests();
}
