/**
 * @file bdpt.hpp
 * @brief Bidirectional Path Tracing (BDPT) implementation
 *
 * BDPT traces paths from both the camera and light sources, then connects
 * them to form complete light transport paths. This is more efficient than
 * unidirectional path tracing for:
 * - Caustics (light focused through glass onto diffuse surfaces)
 * - Small or indirect light sources
 * - Interior scenes with complex light bounces
 *
 * The algorithm:
 * 1. Trace a path from the camera (camera subpath, t vertices)
 * 2. Trace a path from a light source (light subpath, s vertices)
 * 3. Connect vertices from both subpaths in all valid (s, t) combinations
 * 4. Weight each connection with the power heuristic over every strategy
 *    that could have produced a path of the same length
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "scene.hpp"
#include "camera.hpp"
#include "film.hpp"
#include "material.hpp"
#include "sampling.hpp"
#include <vector>
#include <algorithm>

namespace lumen {

/**
 * @brief Vertex type in a light transport path
 */
enum class VertexType {
    Camera,     // Pinhole (first vertex of the camera subpath)
    Light,      // Point on a light (first vertex of the light subpath)
    Surface     // Surface interaction
};

/**
 * @brief A vertex in a light transport path
 *
 * Densities are stored in area measure at this vertex. pdf_fwd is the
 * density of sampling this vertex from the subpath it belongs to,
 * pdf_rev the density of sampling it from the opposite direction.
 */
struct PathVertex {
    VertexType type = VertexType::Surface;

    // Geometry
    point3 position = {0, 0, 0};
    vec3 normal = {0, 0, 0};        // Shading normal (zero off-surface)
    vec3 geo_normal = {0, 0, 0};    // Geometric normal (zero off-surface)
    vec3 wo = {0, 0, 0};            // Unit direction towards the previous vertex
    double epsilon = 0.0;           // Offset for rays leaving this vertex

    // References
    int material_id = -1;
    color albedo = {0, 0, 0};       // Material albedo at this vertex
    int light_index = -1;           // Light at this vertex (light vertices, emitters hit)

    // Path state
    color beta = {1, 1, 1};         // Throughput up to and including this vertex
    color le = {0, 0, 0};           // Emitted radiance or intensity (light vertices)
    double pdf_fwd = 0.0;
    double pdf_rev = 0.0;
    bool delta = false;             // Sampled by a Dirac event

    bool is_on_surface() const {
        return vec3_length_squared(geo_normal) > 0.0;
    }

    /**
     * @brief Delta distributions cannot be connected (infinite PDF)
     */
    bool is_connectible(const Scene& scene) const {
        switch (type) {
            case VertexType::Camera:
            case VertexType::Light:
                return true;
            case VertexType::Surface:
            default:
                return !scene.material(material_id).is_discrete();
        }
    }

    bool is_light() const {
        return type == VertexType::Light || light_index >= 0;
    }

    bool is_delta_light(const LightDistribution& lights) const {
        return type == VertexType::Light && light_index >= 0 &&
               lights.light(light_index).is_delta();
    }
};

/**
 * @brief Subpath storage reused by all samples of one worker
 */
struct PathBuffers {
    std::vector<PathVertex> camera_path;
    std::vector<PathVertex> light_path;
};

/**
 * @brief Bidirectional Path Tracer
 */
class BDPTIntegrator {
public:
    /**
     * @brief BDPT settings
     */
    struct Settings {
        int max_depth = 8;          // Maximum number of bounces of a full path (s + t - 2)
        int max_light_depth = -1;   // Bounces of the light subpath (-1 = max_depth)
        bool use_mis = true;        // Power heuristic; false = uniform weights
        bool light_tracing = true;  // Enable t = 1 strategies (splatted to the film)
        double clamp_max = 0.0;     // Per-strategy luminance clamp (0 = disabled)
        int debug_s = -1;           // Debug: only use strategies with this s
        int debug_t = -1;           // Debug: only use strategies with this t
    };

    BDPTIntegrator() = default;
    explicit BDPTIntegrator(const Settings& settings) : settings_(settings) {}

    /**
     * @brief Estimate radiance for one camera sample
     * @param scene The scene
     * @param lights Lights the light subpaths start from
     * @param camera Camera the subpaths start from
     * @param raster_x,raster_y Raster position of the camera sample
     * @param sampler Random stream of the calling worker
     * @param buffers Vertex storage of the calling worker, overwritten
     * @param splats Receives light tracing contributions for arbitrary pixels
     * @return Radiance for the sampled pixel
     */
    color Li(const Scene& scene, const LightDistribution& lights, const Camera& camera,
             double raster_x, double raster_y, Sampler& sampler, PathBuffers& buffers,
             std::vector<Splat>& splats) const;

    Settings& settings() { return settings_; }
    const Settings& settings() const { return settings_; }

    int light_depth() const {
        return settings_.max_light_depth < 0 ? settings_.max_depth
                                             : std::min(settings_.max_light_depth, settings_.max_depth);
    }

private:
    Settings settings_;

    /**
     * @brief Camera subpath, up to max_depth + 2 vertices
     * @param background Receives the background seen by an escaping path
     */
    int generate_camera_subpath(const Scene& scene, const LightDistribution& lights, const Camera& camera,
                                double raster_x, double raster_y, Sampler& sampler,
                                std::vector<PathVertex>& path, color& background) const;

    /**
     * @brief Light subpath, up to light_depth() + 1 vertices
     */
    int generate_light_subpath(const Scene& scene, const LightDistribution& lights, Sampler& sampler,
                               std::vector<PathVertex>& path) const;

    /**
     * @brief Extend a subpath by BSDF sampling
     * @return Number of surface vertices appended
     */
    int random_walk(const Scene& scene, const LightDistribution& lights, ray r, Sampler& sampler,
                    color beta, double pdf,
                    int max_bounces, TransportMode mode, std::vector<PathVertex>& path,
                    color* background) const;

    /**
     * @brief MIS-weighted contribution of strategy (s, t)
     * @param raster_x,raster_y Receive the splat position for t = 1
     */
    color connect(const Scene& scene, const LightDistribution& lights, const Camera& camera,
                  const std::vector<PathVertex>& light_path, const std::vector<PathVertex>& camera_path,
                  int s, int t, Sampler& sampler, double& raster_x, double& raster_y) const;

    double mis_weight(const Scene& scene, const LightDistribution& lights, const Camera& camera,
                      const std::vector<PathVertex>& light_path, const std::vector<PathVertex>& camera_path,
                      const PathVertex& sampled, int s, int t) const;

    bool strategy_enabled(int s, int t) const;
};

} // namespace lumen
