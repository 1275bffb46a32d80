/**
 * @file light_test.cpp
 * @brief Tests for the power-weighted light distribution
 *
 * Verifies:
 * - Selection probability proportional to emitted power
 * - Next-event pdf agrees with sample_li() and with the solid angle of the light
 * - Point light falloff and delta flags
 * - Emission sampling densities
 * - Empty distributions
 */

#include "engine/light.hpp"
#include "engine/scene.hpp"
#include "engine/sampling.hpp"
#include <iostream>
#include <cmath>
#include <cassert>
#include <vector>

using namespace lumen;

bool approx_equal(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

/**
 * @brief Scene with a 1x1 quad light at y = 2 facing down, and an optional second light
 */
Scene quad_light_scene(color emission, bool second_light) {
    Scene scene;
    int light = scene.add_material(Material::emissive(emission));
    scene.add_quad({-0.5, 2.0, -0.5}, {1, 0, 0}, {0, 0, 1}, light);
    if (second_light) {
        int dim = scene.add_material(Material::emissive(vec3_scale(emission, 0.25)));
        scene.add_quad({2.0, 2.0, -0.5}, {1, 0, 0}, {0, 0, 1}, dim);
    }
    scene.build();
    return scene;
}

void test_power_weighting() {
    std::cout << "Testing power-weighted selection...\n";

    Scene scene = quad_light_scene({4.0, 4.0, 4.0}, true);
    const LightDistribution& lights = scene.lights();
    assert(lights.size() == 4);

    double total = 0.0;
    for (int i = 0; i < lights.size(); ++i) {
        total += lights.pmf(i);
    }
    assert(approx_equal(total, 1.0));

    // Same area, a quarter of the radiance: a quarter of the probability
    assert(approx_equal(lights.pmf(0), 0.4));
    assert(approx_equal(lights.pmf(2), 0.1));

    Sampler sampler(1);
    std::vector<int> counts(lights.size(), 0);
    const int n = 100000;
    for (int i = 0; i < n; ++i) {
        double pmf = 0.0;
        int index = lights.choose(sampler.next(), pmf);
        assert(index >= 0 && index < lights.size());
        assert(approx_equal(pmf, lights.pmf(index)));
        counts[index]++;
    }
    for (int i = 0; i < lights.size(); ++i) {
        double measured = static_cast<double>(counts[i]) / n;
        assert(std::abs(measured - lights.pmf(i)) < 0.01);
    }

    // Power of a point light against an area light
    Scene mixed;
    int mat = mixed.add_material(Material::emissive({1.0, 1.0, 1.0}));
    mixed.add_quad({0, 0, 0}, {1, 0, 0}, {0, 0, 1}, mat);
    mixed.add_point_light({0, 5, 0}, {0.5, 0.5, 0.5});
    mixed.build();
    // Area: pi * 1 * 1, point: 4 pi * 0.5
    assert(mixed.lights().size() == 3);
    assert(approx_equal(mixed.lights().pmf(2), 2.0 / 3.0));

    std::cout << "  PASSED\n";
}

void test_sample_li_pdf() {
    std::cout << "Testing next-event pdf consistency...\n";

    Scene scene = quad_light_scene({2.0, 2.0, 2.0}, true);
    const LightDistribution& lights = scene.lights();
    point3 p = {0.3, 0.0, 0.2};

    Sampler sampler(2);
    for (int i = 0; i < 2000; ++i) {
        LightSample ls;
        if (!lights.sample_li(p, sampler, ls)) continue;
        assert(!ls.is_delta);
        assert(ls.wi.y > 0.0);
        assert(approx_equal(vec3_length(ls.wi), 1.0, 1e-12));
        point3 reached = vec3_fma(p, ls.wi, ls.distance);
        assert(approx_equal(vec3_length(vec3_sub(reached, ls.position)), 0.0, 1e-9));

        int prim = lights.light(ls.light_index).prim_id;
        double pdf = lights.pdf_li(p, prim, ls.position);
        assert(std::abs(pdf - ls.pdf) <= 1e-9 * ls.pdf);
    }

    // Points above the one-sided emitters get no sample
    LightSample above;
    Sampler other(3);
    for (int i = 0; i < 100; ++i) {
        assert(!lights.sample_li({0.0, 3.0, 0.0}, other, above));
    }

    std::cout << "  PASSED\n";
}

void test_solid_angle() {
    std::cout << "Testing light sampling against the analytic solid angle...\n";

    // E[1 / pdf] over next-event samples is the solid angle of the only light
    Scene scene = quad_light_scene({1.0, 1.0, 1.0}, false);
    point3 p = {0.0, 0.0, 0.0};

    Sampler sampler(4);
    const int n = 200000;
    double sum = 0.0;
    for (int i = 0; i < n; ++i) {
        LightSample ls;
        if (scene.lights().sample_li(p, sampler, ls)) {
            sum += 1.0 / ls.pdf;
        }
    }
    double estimate = sum / n;

    // Rectangle of half extents a, b centered at distance d
    double a = 0.5;
    double b = 0.5;
    double d = 2.0;
    double expected = 4.0 * std::asin(a * b / std::sqrt((a * a + d * d) * (b * b + d * d)));
    std::cout << "  Solid angle " << estimate << " (expected " << expected << ")\n";
    assert(std::abs(estimate - expected) < 0.01 * expected);

    std::cout << "  PASSED\n";
}

void test_point_light() {
    std::cout << "Testing point light sampling...\n";

    Scene scene;
    scene.add_material(Material::diffuse({0.5, 0.5, 0.5}));
    scene.add_point_light({0.0, 4.0, 0.0}, {8.0, 8.0, 8.0});
    scene.build();

    Sampler sampler(5);
    LightSample ls;
    assert(scene.lights().sample_li({0.0, 0.0, 0.0}, sampler, ls));
    assert(ls.is_delta);
    assert(approx_equal(ls.pdf, 1.0));
    assert(approx_equal(ls.distance, 4.0));
    assert(approx_equal(ls.radiance.x, 0.5));
    assert(approx_equal(ls.wi.y, 1.0));

    // Uniform sphere emission
    EmissionSample es;
    assert(scene.lights().sample_le(sampler, es));
    assert(approx_equal(es.pdf_dir, INV_4PI));
    assert(approx_equal(es.pdf_pos, 1.0));
    assert(approx_equal(es.pdf_choice, 1.0));

    std::cout << "  PASSED\n";
}

void test_emission_sampling() {
    std::cout << "Testing emission sampling densities...\n";

    Scene scene = quad_light_scene({3.0, 3.0, 3.0}, true);
    const LightDistribution& lights = scene.lights();

    Sampler sampler(6);
    for (int i = 0; i < 1000; ++i) {
        EmissionSample es;
        if (!lights.sample_le(sampler, es)) continue;
        const Light& light = lights.light(es.light_index);
        assert(approx_equal(es.pdf_choice, lights.pmf(es.light_index)));
        // Emitted downwards from the front side
        assert(es.r.direction.y < 0.0);
        assert(approx_equal(es.position.y, 2.0, 1e-12));
        assert(es.r.origin.y < 2.0);

        double pdf_pos = 0.0;
        double pdf_dir = 0.0;
        lights.pdf_le(es.light_index, es.r.direction, pdf_pos, pdf_dir);
        assert(approx_equal(pdf_pos, es.pdf_pos));
        assert(approx_equal(pdf_dir, es.pdf_dir, 1e-12));
        assert(approx_equal(pdf_pos, 1.0 / light.area));
    }

    std::cout << "  PASSED\n";
}

void test_empty_distribution() {
    std::cout << "Testing empty light distribution...\n";

    Scene scene;
    scene.add_material(Material::diffuse({0.5, 0.5, 0.5}));
    scene.add_quad({0, 0, 0}, {1, 0, 0}, {0, 0, 1}, 0);
    scene.build();

    const LightDistribution& lights = scene.lights();
    assert(lights.empty());
    assert(lights.light_of_prim(0) == -1);

    Sampler sampler(7);
    LightSample ls;
    EmissionSample es;
    double pmf = 1.0;
    assert(lights.choose(0.5, pmf) == -1);
    assert(pmf == 0.0);
    assert(!lights.sample_li({0, 1, 0}, sampler, ls));
    assert(!lights.sample_le(sampler, es));
    assert(lights.pdf_li({0, 1, 0}, 0, {0, 0, 0}) == 0.0);

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== Light Tests ===\n\n";

    test_power_weighting();
    test_sample_li_pdf();
    test_solid_angle();
    test_point_light();
    test_emission_sampling();
    test_empty_distribution();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
