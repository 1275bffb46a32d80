/**
 * @file path_tracer.hpp
 * @brief Unidirectional path tracer with next-event estimation and MIS
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "scene.hpp"
#include "sampling.hpp"

namespace lumen {

/**
 * @brief What a camera ray evaluates to
 */
enum class ColorMode {
    Radiance,       // Full light transport
    DebugNormals,   // Shading normal of the first hit mapped to [0, 1]
    ForwardNormals  // Like DebugNormals, but only where the shading normal faces away from the viewer
};

/**
 * @brief Path tracer
 *
 * Each call traces one camera path. Emission found by BSDF sampling is
 * combined with light sampling at every non-discrete vertex using the
 * power heuristic. Paths are terminated by Russian roulette after
 * rr_depth bounces and unconditionally after max_depth bounces.
 */
class PathTracer {
public:
    struct Settings {
        int max_depth = 8;            // Maximum number of bounces
        int rr_depth = 3;             // Bounces before Russian roulette starts
        bool use_nee = true;          // Next Event Estimation (direct light sampling)
        bool use_mis = true;          // Weight NEE and BSDF sampling with the power heuristic
        double clamp_max = 0.0;       // Per-sample luminance clamp (0 = disabled)
        ColorMode color_mode = ColorMode::Radiance;
    };

    PathTracer() = default;
    explicit PathTracer(const Settings& settings) : settings_(settings) {}

    /**
     * @brief Estimate the radiance arriving along a camera ray
     * @param lights Lights sampled for next-event estimation; emitters outside
     *        this distribution are still seen when a path hits them
     */
    color Li(const ray& r, const Scene& scene, const LightDistribution& lights, Sampler& sampler) const;

    color Li(const ray& r, const Scene& scene, Sampler& sampler) const {
        return Li(r, scene, scene.lights(), sampler);
    }

    Settings& settings() { return settings_; }
    const Settings& settings() const { return settings_; }

private:
    Settings settings_;

    color trace(ray r, const Scene& scene, const LightDistribution& lights, Sampler& sampler) const;

    color trace_normals(ray r, const Scene& scene, bool forward_only) const;

    /**
     * @brief Light sampling at a surface vertex, MIS-weighted against the BSDF
     */
    color sample_direct(const hit_record& rec, const Frame& frame, vec3 wo, const Material& mat,
                        color albedo, const Scene& scene, const LightDistribution& lights,
                        Sampler& sampler) const;
};

/**
 * @brief Clamp a sample's luminance to max_luminance (0 = no clamp)
 */
color clamp_luminance(color c, double max_luminance);

} // namespace lumen
