/**
 * @file light.hpp
 * @brief Light sources and the power-weighted light distribution
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
}

#include "primitives.hpp"
#include "material.hpp"
#include "sampling.hpp"
#include <vector>

namespace lumen {

enum class LightType {
    Area,   // Emissive triangle, emits from its front side
    Point   // Isotropic point light (delta position)
};

/**
 * @brief Point light description as authored in the scene
 */
struct PointLight {
    point3 position;
    color intensity;   // Radiant intensity (W/sr per channel)
};

/**
 * @brief A light in the sampling distribution
 *
 * Area lights keep a copy of their triangle so the distribution does not
 * point back into the scene.
 */
struct Light {
    LightType type = LightType::Area;
    int prim_id = -1;             // Emissive triangle, -1 for point lights
    point3 v0 = {0, 0, 0};
    vec3 edge1 = {0, 0, 0};
    vec3 edge2 = {0, 0, 0};
    vec3 normal = {0, 0, 1};
    double area = 0.0;
    point3 position = {0, 0, 0};  // Point lights
    color radiance = {0, 0, 0};   // Emitted radiance (area) or intensity (point)

    bool is_delta() const { return type == LightType::Point; }

    /**
     * @brief Emitted power used to weight selection
     */
    double power() const {
        if (type == LightType::Point) {
            return 4.0 * PI * vec3_luminance(radiance);
        }
        return PI * vec3_luminance(radiance) * area;
    }

    point3 sample_position(double u1, double u2) const {
        double su = std::sqrt(u1);
        double b1 = u2 * su;
        double b2 = 1.0 - (1.0 - su) - b1;
        return vec3_add(v0, vec3_add(vec3_scale(edge1, b1), vec3_scale(edge2, b2)));
    }
};

/**
 * @brief Light sample for next-event estimation
 */
struct LightSample {
    vec3 wi = {0, 0, 1};          // Unit direction from the reference point to the light
    double distance = 0.0;
    color radiance = {0, 0, 0};   // Incident radiance (intensity / d^2 for point lights)
    double pdf = 0.0;             // Solid angle density including selection
    point3 position = {0, 0, 0};
    vec3 normal = {0, 0, 0};      // Light surface normal (zero for point lights)
    int light_index = -1;
    bool is_delta = false;
};

/**
 * @brief Emission sample seeding a light subpath
 */
struct EmissionSample {
    ray r;                        // Leaves the light, origin offset off the surface
    point3 position = {0, 0, 0};  // Sampled point on the light
    vec3 normal = {0, 0, 0};      // Surface normal, or the ray direction for point lights
    color radiance = {0, 0, 0};   // Emitted radiance (area) or intensity (point)
    double pdf_pos = 0.0;         // Area density of the origin (1 for point lights)
    double pdf_dir = 0.0;         // Solid angle density of the direction
    double pdf_choice = 0.0;      // Selection probability
    int light_index = -1;
};

/**
 * @brief Discrete distribution over all lights weighted by emitted power
 */
class LightDistribution {
public:
    /**
     * @brief Collect emissive triangles and point lights
     */
    void build(const std::vector<Triangle>& triangles, const std::vector<Material>& materials,
               const std::vector<PointLight>& point_lights);

    /**
     * @brief Distribution holding only one point light (the camera flash)
     */
    static LightDistribution single_point(point3 position, color intensity);

    bool empty() const { return lights_.empty(); }
    int size() const { return static_cast<int>(lights_.size()); }
    const Light& light(int index) const { return lights_[index]; }

    /**
     * @brief Light index of an emissive triangle, -1 if it is not a light
     */
    int light_of_prim(int prim_id) const {
        if (prim_id < 0 || prim_id >= static_cast<int>(prim_to_light_.size())) return -1;
        return prim_to_light_[prim_id];
    }

    /**
     * @brief Pick a light proportional to power
     * @return Light index, or -1 when there are no lights
     */
    int choose(double u, double& pmf) const;

    double pmf(int index) const;

    /**
     * @brief Sample incident light at a point (next-event estimation)
     */
    bool sample_li(point3 p, Sampler& sampler, LightSample& out) const;

    /**
     * @brief Solid angle density of sample_li hitting a point on an emissive triangle
     */
    double pdf_li(point3 p, int prim_id, point3 light_point) const;

    /**
     * @brief Sample an emitted ray for a light subpath
     */
    bool sample_le(Sampler& sampler, EmissionSample& out) const;

    /**
     * @brief Positional and directional densities of sample_le for a given light
     */
    void pdf_le(int light_index, vec3 dir, double& pdf_pos, double& pdf_dir) const;

private:
    std::vector<Light> lights_;
    std::vector<double> cdf_;           // Normalized, cdf_.back() == 1
    std::vector<int> prim_to_light_;
};

} // namespace lumen
