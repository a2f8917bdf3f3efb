// test_materials.cpp - Unit tests for the material model
//
// Validates:
// 1. Default material and channel selection
// 2. Material validation errors
// 3. Lossy-medium coefficient formulas
// 4. Per-cell alpha/beta computation and the cache tag

#include "test_harness.hpp"

#include "materials.hpp"

using namespace maxwell;

void test_default_material() {
    MaterialField m;
    m.resize(GridShape{2, 2});
    bool ok = m.size() == 4;
    for (int c = 0; c < 4; c++) {
        ok = ok && m.permittivity[c] == 1.0f && m.permeability[c] == 1.0f &&
             m.conductivity[c] == 0.0f;
    }
    report_test("MaterialField resize fills the default material", ok);

    m.channel(MaterialType::Conductivity)[1] = 3.0f;
    m.channel(MaterialType::Permittivity)[2] = 4.0f;
    report_test("channel() selects the matching array",
                m.conductivity[1] == 3.0f && m.permittivity[2] == 4.0f);

    m.reset();
    report_test("reset restores the default material",
                m.conductivity[1] == 0.0f && m.permittivity[2] == 1.0f);

    MaterialMap map = default_material_map(GridShape{3, 2});
    report_test("default_material_map has the grid shape",
                map.shape == (GridShape{3, 2}) && map.permeability.size() == 6 &&
                map.conductivity[5] == 0.0f);
}

void test_validation() {
    const GridShape shape{2, 1};
    std::vector<float> ones = {1.0f, 1.0f};
    std::vector<float> zeros = {0.0f, 0.0f};

    report_test("valid material passes",
                !throws<std::invalid_argument>([&] { validate_material(ones, ones, zeros, shape); }));

    report_test("length mismatch is rejected",
                throws<std::invalid_argument>([&] {
                    validate_material(ones, std::vector<float>{1.0f}, zeros, shape);
                }));

    report_test("zero permittivity is rejected",
                throws<std::invalid_argument>([&] { validate_material(zeros, ones, zeros, shape); }));

    report_test("negative conductivity is rejected",
                throws<std::invalid_argument>([&] {
                    validate_material(ones, ones, std::vector<float>{0.0f, -0.5f}, shape);
                }));

    report_test("check_material_value accepts zero conductivity only",
                !throws<std::invalid_argument>([] { check_material_value(MaterialType::Conductivity, 0.0f); }) &&
                throws<std::invalid_argument>([] { check_material_value(MaterialType::Permeability, 0.0f); }));
}

void test_lossy_coeffs() {
    LossyCoeffs lossless = lossy_coeffs(0.0f, 1.0f, 0.02f, 0.03f);
    report_test("lossless medium has alpha = 1, beta = dt / cell size",
                near(lossless.alpha, 1.0, 1e-7) && near(lossless.beta, 0.02 / 0.03, 1e-6));

    // c = 2 * 0.1 / (2 * 2) = 0.05
    LossyCoeffs lossy = lossy_coeffs(2.0f, 2.0f, 0.1f, 0.5f);
    const double c = 0.05;
    report_test("lossy medium follows (1 - c) / (1 + c)",
                near(lossy.alpha, (1.0 - c) / (1.0 + c), 1e-6) &&
                near(lossy.beta, 0.1 / (2.0 * 0.5) / (1.0 + c), 1e-6));
}

void test_update_alpha_beta() {
    const GridShape shape{2, 2};
    MaterialField m;
    m.resize(shape);
    m.permittivity[1] = 4.0f;
    m.permeability[2] = 2.0f;
    m.conductivity[3] = 1.0f;

    AlphaBetaData ab;
    ab.resize(shape);
    report_test("fresh coefficient cache is invalid", !ab.valid && !ab.is_current_for(0.1f));

    update_alpha_beta(m, shape, 0.1f, 0.5f, ab);

    bool ok = ab.is_current_for(0.1f) && !ab.is_current_for(0.2f) && ab.cell_size == 0.5f;
    report_test("update_alpha_beta tags the cache with dt and cell size", ok);

    report_test("electric coefficients use permittivity",
                near(ab.beta_e[1], 0.1 / (4.0 * 0.5), 1e-6) && near(ab.beta_h[1], 0.1 / 0.5, 1e-6));

    report_test("magnetic coefficients use permeability",
                near(ab.beta_h[2], 0.1 / (2.0 * 0.5), 1e-6) && near(ab.beta_e[2], 0.1 / 0.5, 1e-6));

    LossyCoeffs expected = lossy_coeffs(1.0f, 1.0f, 0.1f, 0.5f);
    report_test("conductivity damps both half-steps",
                ab.alpha_e[3] == expected.alpha && ab.alpha_h[3] == expected.alpha &&
                ab.alpha_e[3] < 1.0f);

    ab.invalidate();
    report_test("invalidate marks the cache stale", !ab.is_current_for(0.1f));
}

int main() {
    print_banner("MATERIAL MODEL - UNIT TEST SUITE");

    test_default_material();
    test_validation();
    test_lossy_coeffs();
    test_update_alpha_beta();

    return finish_tests();
}
