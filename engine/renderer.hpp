/**
 * @file renderer.hpp
 * @brief Progressive tiled renderer and background render session
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
}

#include "scene.hpp"
#include "camera.hpp"
#include "film.hpp"
#include "path_tracer.hpp"
#include "bdpt.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace lumen {

/**
 * @brief Rendering mode
 */
enum class RenderMode {
    PathTrace,  // Unidirectional path tracing (also the debug normal views)
    BDPT        // Bidirectional path tracing
};

/**
 * @brief Which lights the integrators sample
 *
 * The camera flash is a point light at the camera position. Scene mode
 * falls back to it when the scene has no lights. Emissive surfaces stay
 * visible in both modes.
 */
enum class LightMode {
    Scene,      // Emissive triangles and point lights of the scene
    Camera      // Only the camera flash
};

/**
 * @brief Progressive renderer
 *
 * A pass renders samples_per_dir^2 stratified samples for every pixel.
 * The image is cut into square tiles handed out to OpenMP workers; every
 * tile owns its random stream and a private FilmTile merged into the
 * shared film when the tile is done.
 */
class Renderer {
public:
    /**
     * @brief Render settings
     */
    struct Settings {
        RenderMode mode = RenderMode::PathTrace;
        int passes = 16;            // Progressive passes (<= 0 = until cancelled)
        int samples_per_dir = 1;    // Stratified samples per pixel and pass, per axis
        int tile_size = 32;
        int threads = 0;            // Worker threads (0 = OpenMP default)
        uint64_t seed = 0;
        bool verbose = true;        // Log configuration and per-pass progress
        LightMode light_mode = LightMode::Scene;
        double flash_intensity = 0.0;   // Flash intensity (<= 0 = scaled to the scene size)

        PathTracer::Settings path;
        BDPTIntegrator::Settings bdpt;
    };

    Renderer() = default;
    explicit Renderer(const Settings& settings) : settings_(settings) {}

    /**
     * @brief Run one progressive pass over every tile
     *
     * The stream of every tile depends only on (seed, pass, tile), so a pass
     * produces the same film regardless of thread count and tile order.
     */
    void render_pass(const Scene& scene, const Camera& camera, Film& film, int pass) const;

    /**
     * @brief Run passes until settings().passes is reached or cancel() is called
     * @return Number of passes completed
     */
    int render(const Scene& scene, const Camera& camera, Film& film) const;

    /**
     * @brief Request cancellation; checked between tiles and between passes
     */
    void cancel() { cancel_.store(true, std::memory_order_relaxed); }
    void reset_cancel() { cancel_.store(false, std::memory_order_relaxed); }
    bool cancelled() const { return cancel_.load(std::memory_order_relaxed); }

    Settings& settings() { return settings_; }
    const Settings& settings() const { return settings_; }

    /**
     * @brief The camera flash for a scene: 10 * diagonal^1.4 unless set explicitly
     */
    PointLight camera_flash(const Scene& scene, const Camera& camera) const;

    /**
     * @brief Lights sampled under the current light mode
     * @param flash Storage for the flash distribution when it is used
     */
    const LightDistribution& active_lights(const Scene& scene, const Camera& camera,
                                           LightDistribution& flash) const;

private:
    Settings settings_;
    std::atomic<bool> cancel_{false};

    void render_tile(const Scene& scene, const LightDistribution& lights, const Camera& camera, Film& film,
                     const PathTracer& path_tracer, const BDPTIntegrator& bdpt,
                     int tile, int pass) const;
};

/**
 * @brief Renderer running on a background thread
 *
 * The film can be read with snapshot() at any time. set_scene() stops and
 * joins the worker before the previous scene is released, so the worker
 * never observes a scene being destroyed.
 */
class RenderSession {
public:
    explicit RenderSession(const Renderer::Settings& settings = Renderer::Settings());
    ~RenderSession();

    RenderSession(const RenderSession&) = delete;
    RenderSession& operator=(const RenderSession&) = delete;

    /**
     * @brief Replace the scene and camera and clear the film
     */
    void set_scene(std::shared_ptr<const Scene> scene, const Camera& camera);

    /**
     * @brief Start or resume rendering
     * @return false if there is no scene to render
     */
    bool start();

    /**
     * @brief Cancel and join the worker; accumulated samples are kept
     */
    void stop();

    /**
     * @brief Block until the configured number of passes is done
     */
    void wait();

    bool running() const { return running_.load(); }
    int completed_passes() const { return completed_passes_.load(); }

    Image snapshot() const;

    Renderer::Settings& settings() { return renderer_.settings(); }

private:
    Renderer renderer_;
    std::shared_ptr<const Scene> scene_;
    Camera camera_;
    std::unique_ptr<Film> film_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<int> completed_passes_{0};
    int next_pass_ = 0;
    mutable std::mutex mutex_;
};

} // namespace lumen
