/**
 * @file texture_test.cpp
 * @brief Tests for image textures and normal mapping
 *
 * Verifies:
 * - Bilinear lookup, repeat wrapping and the v flip
 * - Height maps convert to tangent-space normal maps
 * - Normal maps perturb shading normals and can be switched off
 * - Textured albedo reaches the BSDF and the rendered image
 */

#include "engine/renderer.hpp"
#include "engine/texture.hpp"
#include <iostream>
#include <cmath>
#include <cassert>
#include <limits>
#include <memory>

using namespace lumen;

bool approx_equal(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

bool approx_equal(vec3 a, vec3 b, double eps = 1e-9) {
    return approx_equal(a.x, b.x, eps) && approx_equal(a.y, b.y, eps) && approx_equal(a.z, b.z, eps);
}

// 2x2 texture: red, green on the top row; blue, white on the bottom row
Texture checker() {
    return Texture::from_pixels(2, 2, {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}, {1, 1, 1}});
}

void test_sampling() {
    std::cout << "Testing texture sampling...\n";

    Texture tex = checker();
    assert(tex.valid());

    // Texel centers return the texel itself; v = 0 is the bottom row
    assert(approx_equal(tex.sample(0.25, 0.75), {1, 0, 0}));
    assert(approx_equal(tex.sample(0.75, 0.75), {0, 1, 0}));
    assert(approx_equal(tex.sample(0.25, 0.25), {0, 0, 1}));
    assert(approx_equal(tex.sample(0.75, 0.25), {1, 1, 1}));

    // Halfway between red and green
    assert(approx_equal(tex.sample(0.5, 0.75), {0.5, 0.5, 0}));

    // Repeat wrapping
    assert(approx_equal(tex.sample(1.25, 0.75), {1, 0, 0}));
    assert(approx_equal(tex.sample(-0.75, -0.75), {0, 0, 1}));
    // The left edge blends with the right column
    assert(approx_equal(tex.sample(0.0, 0.75), {0.5, 0.5, 0}));

    // Degenerate input
    const double nan = std::numeric_limits<double>::quiet_NaN();
    assert(approx_equal(tex.sample(nan, 0.5), {1, 0, 0}));
    Texture empty;
    assert(!empty.valid());
    assert(approx_equal(empty.sample(0.5, 0.5), {1, 0, 1}));

    std::cout << "  PASSED\n";
}

void test_height_to_normal() {
    std::cout << "Testing height map conversion...\n";

    Texture flat = Texture::from_pixels(3, 3, std::vector<color>(9, vec3_splat(0.4)));
    Texture flat_normals = Texture::height_to_normal(flat);
    assert(flat_normals.valid());
    for (const color& c : flat_normals.texels) {
        assert(approx_equal(c, {0.5, 0.5, 1.0}));
    }
    assert(approx_equal(flat_normals.sample_normal(0.5, 0.5), {0, 0, 1}));

    // Height rising with x tilts the normal towards -x
    std::vector<color> ramp;
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            ramp.push_back(vec3_splat(0.1 * x));
        }
    }
    Texture ramp_normals = Texture::height_to_normal(Texture::from_pixels(4, 4, ramp));
    vec3 n = ramp_normals.sample_normal(0.5, 0.5);
    assert(n.x < -0.5);
    assert(approx_equal(n.y, 0.0, 1e-6));
    assert(n.z > 0.0);
    assert(approx_equal(vec3_length(n), 1.0, 1e-6));

    std::cout << "  PASSED\n";
}

/**
 * @brief Quad in the z = 0 plane facing +z with a uniform normal map
 */
Scene mapped_quad(vec3 tangent_normal) {
    color encoded = vec3_add(vec3_scale(tangent_normal, 0.5), vec3_splat(0.5));
    Material mat = Material::diffuse({0.5, 0.5, 0.5});
    mat.normal_map = std::make_shared<Texture>(Texture::from_pixels(1, 1, {encoded}));

    Scene scene;
    int id = scene.add_material(mat);
    scene.add_quad({-1, -1, 0}, {2, 0, 0}, {0, 2, 0}, id);
    scene.build();
    return scene;
}

void test_normal_mapping() {
    std::cout << "Testing normal mapping...\n";

    // Tangent follows u (+x), bitangent follows v (+y)
    Scene scene = mapped_quad({0.6, 0.0, 0.8});
    for (point3 origin : {point3{0.3, -0.4, 2.0}, point3{-0.5, 0.5, 1.0}}) {
        ray r = ray_create(origin, {0, 0, -1});
        hit_record rec;
        assert(scene.intersect(r, rec));
        assert(approx_equal(rec.geo_normal, {0, 0, 1}));
        assert(approx_equal(rec.normal, {0.6, 0.0, 0.8}, 1e-6));
    }

    Scene tilted_v = mapped_quad({0.0, -0.6, 0.8});
    hit_record rec_v;
    assert(tilted_v.intersect(ray_create({0.2, 0.2, 1.0}, {0, 0, -1}), rec_v));
    assert(approx_equal(rec_v.normal, {0.0, -0.6, 0.8}, 1e-6));

    // Switched off
    scene.normal_mapping = false;
    hit_record plain;
    assert(scene.intersect(ray_create({0.3, -0.4, 2.0}, {0, 0, -1}), plain));
    assert(approx_equal(plain.normal, {0, 0, 1}));

    // A mapped normal below the surface is ignored
    Scene flipped = mapped_quad({0.98, 0.0, -0.2});
    hit_record below;
    assert(flipped.intersect(ray_create({0.1, -0.2, 1.0}, {0, 0, -1}), below));
    assert(approx_equal(below.normal, {0, 0, 1}));

    std::cout << "  PASSED\n";
}

void test_textured_albedo() {
    std::cout << "Testing textured albedo...\n";

    // Left half red, right half blue
    auto tex = std::make_shared<Texture>(Texture::from_pixels(2, 1, {{0.8, 0.0, 0.0}, {0.0, 0.0, 0.8}}));
    Material mat = Material::diffuse_textured(tex);
    assert(mat.type == MaterialType::Diffuse);
    assert(approx_equal(mat.albedo_at(0.25, 0.5), {0.8, 0.0, 0.0}));
    assert(approx_equal(mat.albedo_at(0.75, 0.5), {0.0, 0.0, 0.8}));

    Material plain = Material::diffuse({0.3, 0.3, 0.3});
    assert(approx_equal(plain.albedo_at(0.9, 0.1), {0.3, 0.3, 0.3}));

    // The lookup feeds the Lambertian lobe
    vec3 wo = vec3_normalize({0.2, 0.1, 1.0});
    vec3 wi = vec3_normalize({-0.3, 0.4, 1.0});
    color f = mat.evaluate(wo, wi, mat.albedo_at(0.75, 0.5), TransportMode::Radiance);
    assert(approx_equal(f.z, 0.8 * INV_PI));
    assert(approx_equal(f.x, 0.0));

    // Rendered under the camera flash, image columns follow the texture
    Scene scene;
    int id = scene.add_material(mat);
    scene.add_quad({-1, -1, 0}, {2, 0, 0}, {0, 2, 0}, id);
    scene.build();
    Camera camera({0.0, 0.0, 2.0}, {0.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, 30.0, 8, 8);

    Renderer::Settings settings;
    settings.passes = 2;
    settings.samples_per_dir = 2;
    settings.tile_size = 4;
    settings.verbose = false;
    settings.light_mode = LightMode::Camera;
    Film film(camera.width(), camera.height());
    Renderer renderer(settings);
    assert(renderer.render(scene, camera, film) == 2);
    Image image = film.snapshot();

    color left = {0, 0, 0};
    color right = {0, 0, 0};
    for (int y = 0; y < image.height; ++y) {
        left = vec3_add(left, image.pixels[static_cast<size_t>(y) * image.width]);
        right = vec3_add(right, image.pixels[static_cast<size_t>(y) * image.width + image.width - 1]);
    }
    assert(left.x > 2.0 * left.z);
    assert(right.z > 2.0 * right.x);
    assert(left.y == 0.0 && right.y == 0.0);

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== Texture Tests ===\n\n";

    test_sampling();
    test_height_to_normal();
    test_normal_mapping();
    test_textured_albedo();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
