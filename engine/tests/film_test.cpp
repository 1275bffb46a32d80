/**
 * @file film_test.cpp
 * @brief Tests for the progressive film, the renderer and the render session
 *
 * Verifies:
 * - Tile merge, normalization and splat scaling
 * - Non-finite samples are counted but contribute nothing
 * - Pass accounting and cancellation
 * - Background session with scene switching
 */

#include "engine/film.hpp"
#include "engine/renderer.hpp"
#include "engine/cornell_box.hpp"
#include <iostream>
#include <cmath>
#include <cassert>
#include <limits>
#include <memory>

using namespace lumen;

bool approx_equal(double a, double b, double eps = 1e-12) {
    return std::abs(a - b) < eps;
}

void test_tile_merge() {
    std::cout << "Testing tile merge and normalization...\n";

    Film film(4, 2);

    FilmTile left(0, 0, 2, 2);
    left.add_sample(0, 0, {1.0, 2.0, 3.0});
    left.add_sample(0, 0, {3.0, 2.0, 1.0});
    left.add_sample(1, 1, {4.0, 4.0, 4.0});
    film.add_tile(left);

    FilmTile right(2, 0, 4, 2);
    right.add_sample(3, 1, {0.5, 0.5, 0.5});
    film.add_tile(right);

    assert(film.total_samples() == 4);

    Image image = film.snapshot();
    assert(image.width == 4 && image.height == 2);
    assert(approx_equal(image.get_pixel(0, 0).x, 2.0));
    assert(approx_equal(image.get_pixel(0, 0).z, 2.0));
    assert(approx_equal(image.get_pixel(1, 1).y, 4.0));
    assert(approx_equal(image.get_pixel(3, 1).x, 0.5));
    // Pixels without samples stay black
    assert(vec3_is_black(image.get_pixel(2, 0)));

    // Merging the same tile twice keeps the average
    film.add_tile(right);
    assert(approx_equal(film.snapshot().get_pixel(3, 1).x, 0.5));

    film.clear();
    assert(film.total_samples() == 0);
    assert(vec3_is_black(film.snapshot().get_pixel(0, 0)));

    std::cout << "  PASSED\n";
}

void test_splats() {
    std::cout << "Testing splat normalization...\n";

    Film film(2, 2);
    FilmTile tile(0, 0, 2, 2);
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 2; ++x) {
            tile.add_sample(x, y, {0.0, 0.0, 0.0});
            tile.add_sample(x, y, {0.0, 0.0, 0.0});
        }
    }
    // A splat may land outside the tile that produced it
    tile.add_splat({1.5, 0.25, {8.0, 8.0, 8.0}});
    tile.add_splat({-1.0, 0.5, {100.0, 100.0, 100.0}});    // Off the film: dropped
    film.add_tile(tile);

    // 8 samples over 4 pixels: splats are scaled by 4 / 8
    Image image = film.snapshot();
    assert(approx_equal(image.get_pixel(1, 0).x, 4.0));
    assert(vec3_is_black(image.get_pixel(0, 0)));
    assert(vec3_is_black(image.get_pixel(0, 1)));

    std::cout << "  PASSED\n";
}

void test_non_finite_samples() {
    std::cout << "Testing non-finite samples...\n";

    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    Film film(1, 1);
    FilmTile tile(0, 0, 1, 1);
    tile.add_sample(0, 0, {2.0, 2.0, 2.0});
    tile.add_sample(0, 0, {inf, 0.0, 0.0});
    tile.add_sample(0, 0, {nan, nan, nan});
    tile.add_splat({0.5, 0.5, {nan, 1.0, 1.0}});
    film.add_tile(tile);

    assert(film.total_samples() == 3);
    color c = film.snapshot().get_pixel(0, 0);
    assert(vec3_is_finite(c));
    assert(approx_equal(c.x, 2.0 / 3.0));

    std::cout << "  PASSED\n";
}

void test_renderer_passes() {
    std::cout << "Testing progressive passes...\n";

    CornellBoxOptions options;
    options.width = 12;
    options.height = 10;
    CornellBox box = make_cornell_box(options);
    box.scene.build();

    Renderer::Settings settings;
    settings.passes = 3;
    settings.samples_per_dir = 2;
    settings.tile_size = 4;
    settings.verbose = false;
    settings.path.max_depth = 3;

    Film film(options.width, options.height);
    Renderer renderer(settings);
    int passes = renderer.render(box.scene, box.camera, film);
    assert(passes == 3);
    assert(film.total_samples() == static_cast<uint64_t>(12 * 10 * 4 * 3));

    Image image = film.snapshot();
    double sum = 0.0;
    for (const color& c : image.pixels) {
        assert(vec3_is_finite(c));
        sum += vec3_luminance(c);
    }
    assert(sum > 0.0);

    // A film of the wrong size is rejected without touching it
    Film wrong(5, 5);
    renderer.render_pass(box.scene, box.camera, wrong, 0);
    assert(wrong.total_samples() == 0);

    // Cancellation before the first pass renders nothing
    Film cancelled_film(options.width, options.height);
    renderer.cancel();
    assert(renderer.render(box.scene, box.camera, cancelled_film) == 0);
    assert(cancelled_film.total_samples() == 0);
    renderer.reset_cancel();
    assert(!renderer.cancelled());

    // Unbuilt scenes are refused
    CornellBox unbuilt = make_cornell_box(options);
    assert(renderer.render(unbuilt.scene, unbuilt.camera, cancelled_film) == 0);

    std::cout << "  PASSED\n";
}

void test_render_session() {
    std::cout << "Testing render session and scene switching...\n";

    Renderer::Settings settings;
    settings.passes = 4;
    settings.samples_per_dir = 1;
    settings.tile_size = 8;
    settings.verbose = false;
    settings.path.max_depth = 2;

    RenderSession session(settings);
    assert(!session.start());    // No scene yet

    CornellBoxOptions options;
    options.width = 16;
    options.height = 16;
    CornellBox box = make_cornell_box(options);
    auto unbuilt = std::make_shared<const Scene>(box.scene);
    session.set_scene(unbuilt, box.camera);
    assert(!session.start());    // Scene not built

    box.scene.build();
    auto scene = std::make_shared<const Scene>(box.scene);
    session.set_scene(scene, box.camera);
    assert(session.start());
    session.wait();
    assert(!session.running());
    assert(session.completed_passes() == 4);

    Image first = session.snapshot();
    assert(first.width == 16 && first.height == 16);
    double sum = 0.0;
    for (const color& c : first.pixels) sum += vec3_luminance(c);
    assert(sum > 0.0);

    // Switch to a different scene and resolution; the film restarts empty
    CornellBoxOptions other;
    other.width = 8;
    other.height = 6;
    other.contents = CornellContents::Empty;
    CornellBox second = make_cornell_box(other);
    second.scene.build();
    session.set_scene(std::make_shared<const Scene>(second.scene), second.camera);
    assert(session.completed_passes() == 0);
    Image empty = session.snapshot();
    assert(empty.width == 8 && empty.height == 6);
    for (const color& c : empty.pixels) assert(vec3_is_black(c));

    // Unlimited passes until stopped
    session.settings().passes = 0;
    assert(session.start());
    assert(session.start());     // Already running
    session.stop();
    assert(!session.running());
    Image partial = session.snapshot();
    for (const color& c : partial.pixels) assert(vec3_is_finite(c));

    // Switching while a render is running stops it first
    assert(session.start());
    session.set_scene(scene, box.camera);
    assert(!session.running());
    assert(session.snapshot().width == 16);

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== Film Tests ===\n\n";

    test_tile_merge();
    test_splats();
    test_non_finite_samples();
    test_renderer_passes();
    test_render_session();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
