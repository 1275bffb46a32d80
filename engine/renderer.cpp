/**
 * @file renderer.cpp
 * @brief Tiled progressive rendering
 */

#include "renderer.hpp"
#include "profiler.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace lumen {

namespace {

int tile_count(int extent, int tile_size) {
    return (extent + tile_size - 1) / tile_size;
}

const char* mode_name(const Renderer::Settings& settings) {
    if (settings.mode == RenderMode::BDPT) return "Bidirectional Path Tracing";
    switch (settings.path.color_mode) {
        case ColorMode::DebugNormals: return "Debug Normals";
        case ColorMode::ForwardNormals: return "Forward Normals";
        default: return "Path Tracing";
    }
}

} // namespace

void Renderer::render_pass(const Scene& scene, const Camera& camera, Film& film, int pass) const {
    if (film.width() != camera.width() || film.height() != camera.height()) {
        std::cerr << "Error: film is " << film.width() << "x" << film.height()
                  << " but the camera renders " << camera.width() << "x" << camera.height() << std::endl;
        return;
    }

    Timer pass_timer;

    const int tile_size = std::max(1, settings_.tile_size);
    const int tiles_x = tile_count(camera.width(), tile_size);
    const int tiles_y = tile_count(camera.height(), tile_size);
    const int num_tiles = tiles_x * tiles_y;

    PathTracer path_tracer(settings_.path);
    BDPTIntegrator bdpt(settings_.bdpt);

    LightDistribution flash;
    const LightDistribution& lights = active_lights(scene, camera, flash);

#ifdef _OPENMP
    int threads = settings_.threads > 0 ? settings_.threads : omp_get_max_threads();
#else
    int threads = 1;
#endif
    (void)threads;

    #pragma omp parallel for schedule(dynamic, 1) num_threads(threads)
    for (int tile = 0; tile < num_tiles; ++tile) {
        if (cancelled()) continue;
        render_tile(scene, lights, camera, film, path_tracer, bdpt, tile, pass);
    }

    Profiler::instance().record("Render Pass", Profiler::Duration(pass_timer.elapsed_ms()));
}

void Renderer::render_tile(const Scene& scene, const LightDistribution& lights, const Camera& camera,
                           Film& film, const PathTracer& path_tracer, const BDPTIntegrator& bdpt,
                           int tile, int pass) const {
    const int tile_size = std::max(1, settings_.tile_size);
    const int tiles_x = tile_count(camera.width(), tile_size);
    const int x0 = (tile % tiles_x) * tile_size;
    const int y0 = (tile / tiles_x) * tile_size;
    const int x1 = std::min(x0 + tile_size, camera.width());
    const int y1 = std::min(y0 + tile_size, camera.height());

    FilmTile film_tile(x0, y0, x1, y1);
    Sampler sampler(settings_.seed, (static_cast<uint64_t>(pass) << 32) | static_cast<uint32_t>(tile));
    std::vector<Splat> splats;
    PathBuffers buffers;
    if (settings_.mode == RenderMode::BDPT) {
        buffers.camera_path.reserve(bdpt.settings().max_depth + 2);
        buffers.light_path.reserve(bdpt.light_depth() + 1);
    }

    const int n = std::max(1, settings_.samples_per_dir);
    const double inv_n = 1.0 / n;

    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            for (int sy = 0; sy < n; ++sy) {
                for (int sx = 0; sx < n; ++sx) {
                    // Stratified jitter inside the pixel
                    double raster_x = x + (sx + sampler.next()) * inv_n;
                    double raster_y = y + (sy + sampler.next()) * inv_n;

                    color L;
                    if (settings_.mode == RenderMode::BDPT) {
                        splats.clear();
                        L = bdpt.Li(scene, lights, camera, raster_x, raster_y, sampler, buffers, splats);
                        film_tile.add_splats(splats);
                    } else {
                        L = path_tracer.Li(camera.generate_ray(raster_x, raster_y), scene, lights, sampler);
                    }
                    film_tile.add_sample(x, y, L);
                }
            }
        }
    }

    film.add_tile(film_tile);
    Profiler::instance().count("Camera Samples", static_cast<uint64_t>(x1 - x0) * (y1 - y0) * n * n);
}

PointLight Renderer::camera_flash(const Scene& scene, const Camera& camera) const {
    double intensity = settings_.flash_intensity;
    if (intensity <= 0.0) {
        AABB bounds = scene.bounds();
        double scale = bounds.is_empty() ? 1.0 : vec3_length(vec3_sub(bounds.max_pt, bounds.min_pt));
        if (!(scale > 0.0) || !std::isfinite(scale)) scale = 1.0;
        intensity = 10.0 * std::pow(scale, 1.4);
    }
    return {camera.position(), vec3_splat(intensity)};
}

const LightDistribution& Renderer::active_lights(const Scene& scene, const Camera& camera,
                                                 LightDistribution& flash) const {
    if (settings_.light_mode == LightMode::Scene && !scene.lights().empty()) {
        return scene.lights();
    }
    PointLight light = camera_flash(scene, camera);
    flash = LightDistribution::single_point(light.position, light.intensity);
    return flash;
}

int Renderer::render(const Scene& scene, const Camera& camera, Film& film) const {
    if (!scene.is_built()) {
        std::cerr << "Error: scene must be built before rendering" << std::endl;
        return 0;
    }

    Timer total_timer;
    const int spp = std::max(1, settings_.samples_per_dir) * std::max(1, settings_.samples_per_dir);

    if (settings_.verbose) {
        std::cout << "Rendering " << camera.width() << "x" << camera.height()
                  << " image (" << mode_name(settings_);
        if (settings_.mode == RenderMode::PathTrace && settings_.path.color_mode == ColorMode::Radiance) {
            std::cout << ", NEE=" << (settings_.path.use_nee ? "on" : "off")
                      << ", MIS=" << (settings_.path.use_mis ? "on" : "off")
                      << ", depth=" << settings_.path.max_depth;
        }
        if (settings_.mode == RenderMode::BDPT) {
            std::cout << ", MIS=" << (settings_.bdpt.use_mis ? "on" : "off")
                      << ", light tracing=" << (settings_.bdpt.light_tracing ? "on" : "off")
                      << ", depth=" << settings_.bdpt.max_depth;
        }
        if (settings_.light_mode == LightMode::Camera || scene.lights().empty()) {
            std::cout << ", camera flash";
        }
        std::cout << ", " << spp << " spp/pass)";
#ifdef _OPENMP
        std::cout << " using " << (settings_.threads > 0 ? settings_.threads : omp_get_max_threads()) << " threads";
#endif
        std::cout << "..." << std::endl;
    }

    int completed = 0;
    for (int pass = 0; settings_.passes <= 0 || pass < settings_.passes; ++pass) {
        if (cancelled()) break;
        render_pass(scene, camera, film, pass);
        if (cancelled()) break;
        ++completed;

        if (settings_.verbose) {
            std::cout << "\rPass " << completed;
            if (settings_.passes > 0) std::cout << "/" << settings_.passes;
            std::cout << " (" << completed * spp << " spp)" << std::flush;
        }
    }

    Profiler::instance().record("Total Render", Profiler::Duration(total_timer.elapsed_ms()));

    if (settings_.verbose) {
        std::cout << "\n" << (cancelled() ? "Cancelled" : "Done") << " after " << completed << " passes in "
                  << total_timer.elapsed_sec() << " s" << std::endl;
    }
    return completed;
}

// ==================== RenderSession ====================

RenderSession::RenderSession(const Renderer::Settings& settings)
    : renderer_(settings) {}

RenderSession::~RenderSession() {
    stop();
}

void RenderSession::set_scene(std::shared_ptr<const Scene> scene, const Camera& camera) {
    stop();

    std::lock_guard<std::mutex> lock(mutex_);
    scene_ = std::move(scene);
    camera_ = camera;
    if (!film_ || film_->width() != camera.width() || film_->height() != camera.height()) {
        film_ = std::make_unique<Film>(camera.width(), camera.height());
    } else {
        film_->clear();
    }
    next_pass_ = 0;
    completed_passes_ = 0;
}

bool RenderSession::start() {
    if (running_) return true;
    if (worker_.joinable()) worker_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!scene_ || !film_) {
        std::cerr << "Error: render session has no scene" << std::endl;
        return false;
    }
    if (!scene_->is_built()) {
        std::cerr << "Error: scene must be built before rendering" << std::endl;
        return false;
    }

    renderer_.reset_cancel();
    running_ = true;

    std::shared_ptr<const Scene> scene = scene_;
    Camera camera = camera_;
    Film* film = film_.get();

    worker_ = std::thread([this, scene, camera, film]() {
        const int passes = renderer_.settings().passes;
        while (!renderer_.cancelled() && (passes <= 0 || next_pass_ < passes)) {
            renderer_.render_pass(*scene, camera, *film, next_pass_);
            ++next_pass_;
            if (!renderer_.cancelled()) ++completed_passes_;
        }
        running_ = false;
    });
    return true;
}

void RenderSession::stop() {
    renderer_.cancel();
    if (worker_.joinable()) worker_.join();
    running_ = false;
}

void RenderSession::wait() {
    if (worker_.joinable()) worker_.join();
}

Image RenderSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!film_) return Image();
    return film_->snapshot();
}

} // namespace lumen
