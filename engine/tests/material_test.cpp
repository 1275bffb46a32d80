/**
 * @file material_test.cpp
 * @brief Tests for the BSDF variants
 *
 * Verifies:
 * - Mirror law and Lambertian reflectance
 * - Sampled value and pdf agree with evaluate() and pdf()
 * - Directional albedo never exceeds one
 * - Fresnel reflectance, Snell refraction and total internal reflection
 */

#include "engine/material.hpp"
#include "engine/sampling.hpp"
#include <iostream>
#include <cmath>
#include <cassert>

using namespace lumen;

constexpr double EPSILON = 1e-9;

bool approx_equal(double a, double b, double eps = EPSILON) {
    return std::abs(a - b) < eps;
}

bool approx_equal_rel(double a, double b, double rel) {
    return std::abs(a - b) <= rel * std::max(std::abs(a), std::abs(b));
}

vec3 direction(double theta, double phi) {
    return {std::sin(theta) * std::cos(phi), std::sin(theta) * std::sin(phi), std::cos(theta)};
}

/**
 * @brief Monte Carlo directional albedo: E[f cos / pdf] over sampled directions
 */
color directional_albedo(const Material& mat, vec3 wo, int samples, TransportMode mode, uint64_t seed) {
    Sampler sampler(seed);
    color sum = {0, 0, 0};
    for (int i = 0; i < samples; ++i) {
        BSDFSample bs;
        if (!mat.sample(wo, sampler, bs, mode)) continue;
        sum = vec3_add(sum, vec3_scale(bs.value, abs_cos_theta(bs.wi) / bs.pdf));
    }
    return vec3_scale(sum, 1.0 / samples);
}

void test_diffuse() {
    std::cout << "Testing diffuse BSDF...\n";

    Material mat = Material::diffuse({0.8, 0.5, 0.2});
    Sampler sampler(1);
    vec3 wo = vec3_normalize({0.3, -0.2, 0.9});

    for (int i = 0; i < 1000; ++i) {
        BSDFSample bs;
        assert(mat.sample(wo, sampler, bs));
        assert(!bs.is_discrete);
        assert(bs.wi.z > 0.0);
        assert(approx_equal(bs.pdf, mat.pdf(wo, bs.wi)));
        // Cosine sampling makes every sample weigh exactly the albedo
        color weight = vec3_scale(bs.value, abs_cos_theta(bs.wi) / bs.pdf);
        assert(approx_equal(weight.x, 0.8, 1e-9));
        assert(approx_equal(weight.y, 0.5, 1e-9));
        assert(approx_equal(weight.z, 0.2, 1e-9));
    }

    // Two-sided: a viewer below the surface gets directions below it
    vec3 below = {0.0, 0.0, -1.0};
    BSDFSample bs;
    assert(mat.sample(below, sampler, bs));
    assert(bs.wi.z < 0.0);

    // No transmission
    assert(vec3_is_black(mat.evaluate({0, 0, 1}, {0, 0, -1})));
    assert(mat.pdf({0, 0, 1}, {0, 0, -1}) == 0.0);

    std::cout << "  PASSED\n";
}

void test_mirror() {
    std::cout << "Testing mirror reflection...\n";

    Material mat = Material::mirror({0.9, 0.9, 0.9});
    Sampler sampler(2);
    vec3 wo = vec3_normalize({0.4, 0.1, 0.7});

    BSDFSample bs;
    assert(mat.sample(wo, sampler, bs));
    assert(bs.is_discrete);
    assert(approx_equal(bs.pdf, 1.0));
    assert(approx_equal(bs.wi.x, -wo.x));
    assert(approx_equal(bs.wi.y, -wo.y));
    assert(approx_equal(bs.wi.z, wo.z));

    color weight = vec3_scale(bs.value, abs_cos_theta(bs.wi) / bs.pdf);
    assert(approx_equal(weight.x, 0.9));

    // Dirac variants have no density and no value for arbitrary pairs
    assert(mat.pdf(wo, bs.wi) == 0.0);
    assert(vec3_is_black(mat.evaluate(wo, bs.wi)));
    assert(mat.is_discrete());

    std::cout << "  PASSED\n";
}

void test_fresnel() {
    std::cout << "Testing Fresnel reflectance...\n";

    // Normal incidence: ((n - 1) / (n + 1))^2
    assert(approx_equal(fresnel_dielectric(1.0, 1.5), 0.04, 1e-12));
    // Same value from inside
    assert(approx_equal(fresnel_dielectric(-1.0, 1.5), 0.04, 1e-12));
    // Grazing incidence reflects everything
    assert(approx_equal(fresnel_dielectric(0.0, 1.5), 1.0, 1e-12));

    // Beyond the critical angle from inside: total internal reflection
    double critical = std::asin(1.0 / 1.5);
    assert(approx_equal(fresnel_dielectric(-std::cos(critical + 0.05), 1.5), 1.0));
    assert(fresnel_dielectric(-std::cos(critical - 0.05), 1.5) < 1.0);

    std::cout << "  PASSED\n";
}

void test_refraction() {
    std::cout << "Testing smooth dielectric refraction...\n";

    Material glass = Material::glass(1.5);
    vec3 wo = direction(0.6, 0.3);
    double fr = fresnel_dielectric(wo.z, 1.5);

    Sampler sampler(4);
    int reflected = 0;
    int refracted = 0;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
        BSDFSample bs;
        assert(glass.sample(wo, sampler, bs, TransportMode::Importance));
        assert(bs.is_discrete);

        color weight = vec3_scale(bs.value, abs_cos_theta(bs.wi) / bs.pdf);
        if (bs.wi.z > 0.0) {
            ++reflected;
            assert(approx_equal(bs.pdf, fr));
            assert(approx_equal(weight.x, 1.0));
        } else {
            ++refracted;
            assert(approx_equal(bs.pdf, 1.0 - fr));
            // Snell's law
            double sin_i = std::sqrt(wo.x * wo.x + wo.y * wo.y);
            double sin_t = std::sqrt(bs.wi.x * bs.wi.x + bs.wi.y * bs.wi.y);
            assert(approx_equal(sin_i, 1.5 * sin_t, 1e-9));
            // Transmitted direction stays in the plane of incidence, on the far side
            assert(bs.wi.x * wo.x <= 0.0 && bs.wi.y * wo.y <= 0.0);
            assert(approx_equal(weight.x, 1.0));
        }
    }
    double measured = static_cast<double>(reflected) / n;
    assert(std::abs(measured - fr) < 0.01);
    assert(refracted > 0);

    // Radiance is compressed by 1/eta^2 when entering the denser medium
    Sampler radiance_sampler(5);
    for (int i = 0; i < 100; ++i) {
        BSDFSample bs;
        assert(glass.sample(wo, radiance_sampler, bs, TransportMode::Radiance));
        if (bs.wi.z < 0.0) {
            double weight = bs.value.x * abs_cos_theta(bs.wi) / bs.pdf;
            assert(approx_equal(weight, 1.0 / (1.5 * 1.5)));
        }
    }

    std::cout << "  PASSED\n";
}

void test_total_internal_reflection() {
    std::cout << "Testing total internal reflection...\n";

    Material glass = Material::glass(1.5);
    double critical = std::asin(1.0 / 1.5);

    // Inside the glass (below the surface), beyond the critical angle
    vec3 wo = direction(PI - (critical + 0.1), 1.0);
    assert(wo.z < 0.0);

    double etap = 0.0;
    vec3 wt;
    assert(!refract(wo, {0, 0, 1}, 1.5, etap, wt));

    Sampler sampler(6);
    for (int i = 0; i < 100; ++i) {
        BSDFSample bs;
        assert(glass.sample(wo, sampler, bs));
        assert(bs.wi.z < 0.0);
        assert(approx_equal(bs.pdf, 1.0));
    }

    std::cout << "  PASSED\n";
}

void test_glossy_consistency() {
    std::cout << "Testing glossy sample/pdf consistency...\n";

    for (double roughness : {0.05, 0.3, 0.8}) {
        Material mats[2] = {Material::glossy({1.0, 1.0, 1.0}, roughness),
                            Material::rough_glass(1.5, roughness)};
        for (const Material& mat : mats) {
            for (double theta : {0.1, 0.8, 1.3}) {
                vec3 wo = direction(theta, 0.7);
                Sampler sampler(static_cast<uint64_t>(roughness * 1000 + theta * 10));
                for (int i = 0; i < 2000; ++i) {
                    BSDFSample bs;
                    if (!mat.sample(wo, sampler, bs)) continue;
                    assert(!bs.is_discrete);
                    assert(bs.pdf > 0.0);
                    assert(approx_equal_rel(bs.pdf, mat.pdf(wo, bs.wi), 1e-6));
                    color f = mat.evaluate(wo, bs.wi);
                    assert(approx_equal_rel(bs.value.x, f.x, 1e-6));
                    if (mat.type == MaterialType::GlossyReflect) {
                        // Visible normal sampling: the weight is G(wo, wi) / G1(wo) <= 1
                        double weight = bs.value.x * abs_cos_theta(bs.wi) / bs.pdf;
                        assert(weight <= 1.0 + 1e-9);
                    }
                }
            }
        }
    }

    std::cout << "  PASSED\n";
}

void test_glossy_pdf_normalization() {
    std::cout << "Testing glossy pdf normalization...\n";

    // Integrate pdf over the sphere with uniform directions: the result is the
    // probability that sample() succeeds, which is measured separately
    Material mat = Material::glossy({1.0, 1.0, 1.0}, 0.5);
    vec3 wo = direction(0.3, 0.0);
    Sampler sampler(8);
    const int n = 400000;
    double sum = 0.0;
    for (int i = 0; i < n; ++i) {
        vec3 wi = sample_uniform_sphere(sampler.next(), sampler.next());
        sum += mat.pdf(wo, wi) * 4.0 * PI;
    }
    double integral = sum / n;

    int accepted = 0;
    for (int i = 0; i < n; ++i) {
        BSDFSample bs;
        if (mat.sample(wo, sampler, bs)) ++accepted;
    }
    double success_rate = static_cast<double>(accepted) / n;

    std::cout << "  Integral of pdf: " << integral << ", success rate: " << success_rate << "\n";
    assert(std::abs(integral - success_rate) < 0.01);
    assert(success_rate > 0.5 && success_rate <= 1.0);

    std::cout << "  PASSED\n";
}

void test_energy_conservation() {
    std::cout << "Testing directional albedo <= 1...\n";

    for (double roughness : {0.01, 0.2, 0.6, 1.0}) {
        for (double theta : {0.0, 0.7, 1.4}) {
            vec3 wo = direction(theta, 0.4);

            color glossy = directional_albedo(Material::glossy({1.0, 1.0, 1.0}, roughness), wo,
                                              50000, TransportMode::Radiance, 10);
            assert(glossy.x <= 1.02);
            assert(glossy.x > 0.1);

            color rough = directional_albedo(Material::rough_glass(1.5, roughness), wo,
                                             50000, TransportMode::Importance, 11);
            assert(rough.x <= 1.02);
            assert(rough.x > 0.1);

            vec3 inside = {wo.x, wo.y, -wo.z};
            color from_inside = directional_albedo(Material::rough_glass(1.5, roughness), inside,
                                                   50000, TransportMode::Importance, 12);
            assert(from_inside.x <= 1.02);
        }
    }

    color diffuse = directional_albedo(Material::diffuse({0.5, 0.5, 0.5}), direction(0.5, 0.0),
                                       1000, TransportMode::Radiance, 13);
    assert(approx_equal(diffuse.x, 0.5, 1e-9));

    std::cout << "  PASSED\n";
}

void test_shininess_mapping() {
    std::cout << "Testing shininess to roughness mapping...\n";

    assert(approx_equal(Material::shininess_to_roughness(0.0), 1.0));
    assert(Material::shininess_to_roughness(1000.0) < 0.05);
    assert(Material::shininess_to_roughness(10.0) > Material::shininess_to_roughness(100.0));

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== Material Tests ===\n\n";

    test_diffuse();
    test_mirror();
    test_fresnel();
    test_refraction();
    test_total_internal_reflection();
    test_glossy_consistency();
    test_glossy_pdf_normalization();
    test_energy_conservation();
    test_shininess_mapping();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
