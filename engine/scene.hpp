/**
 * @file scene.hpp
 * @brief Scene description and ray queries
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "bvh.hpp"
#include "primitives.hpp"
#include "material.hpp"
#include "light.hpp"
#include <vector>

namespace lumen {

/**
 * @brief Triangle scene with materials and lights
 *
 * The scene is filled through the add_* functions and frozen by build().
 * After build() it is treated as an immutable snapshot: the BVH, the
 * materials and the light distribution are shared read-only by every
 * render thread.
 */
class Scene {
public:
    std::vector<Triangle> triangles;
    std::vector<Material> materials;
    std::vector<PointLight> point_lights;
    color background = {0.0, 0.0, 0.0};
    bool normal_mapping = true;     // Perturb shading normals of materials with a normal map

    /**
     * @brief Add a material and return its ID
     */
    int add_material(const Material& mat) {
        materials.push_back(mat);
        return static_cast<int>(materials.size()) - 1;
    }

    /**
     * @brief Add a triangle; the winding a, b, c defines its front side
     */
    int add_triangle(point3 a, point3 b, point3 c, int material_id) {
        triangles.emplace_back(a, b, c, material_id);
        built_ = false;
        return static_cast<int>(triangles.size()) - 1;
    }

    int add_triangle(const Triangle& tri) {
        triangles.push_back(tri);
        built_ = false;
        return static_cast<int>(triangles.size()) - 1;
    }

    /**
     * @brief Add a parallelogram as two triangles facing cross(edge_u, edge_v)
     */
    void add_quad(point3 corner, vec3 edge_u, vec3 edge_v, int material_id);

    /**
     * @brief Add an axis-aligned box with outward-facing sides
     */
    void add_box(point3 box_min, point3 box_max, int material_id);

    void add_point_light(point3 position, color intensity) {
        point_lights.push_back({position, intensity});
        built_ = false;
    }

    /**
     * @brief Validate the primitives and build the BVH and light distribution
     */
    void build(const BVH::Settings& settings = BVH::Settings());

    bool is_built() const { return built_; }

    /**
     * @brief Closest hit inside [r.t_min, r.t_max]
     */
    bool intersect(const ray& r, hit_record& rec) const;

    /**
     * @brief True if anything blocks r inside [r.t_min, r.t_max]
     */
    bool occluded(const ray& r) const;

    /**
     * @brief Mutual visibility of two points already offset off their surfaces
     */
    bool visible(point3 from, point3 to) const;

    /**
     * @brief Bounds of all primitives (empty before build())
     */
    AABB bounds() const {
        return bvh_.nodes.empty() ? AABB() : bvh_.nodes[0].bounds;
    }

    const BVH& bvh() const { return bvh_; }
    const LightDistribution& lights() const { return lights_; }

    const Material& material(int id) const { return materials[id]; }
    const Material& material(const hit_record& rec) const { return materials[rec.material_id]; }

    /**
     * @brief Radiance emitted from a hit point towards w_out
     */
    color emitted(const hit_record& rec, vec3 w_out) const {
        return materials[rec.material_id].emitted(vec3_dot(rec.geo_normal, w_out));
    }

private:
    void apply_normal_map(const Triangle& tri, const Texture& map, hit_record& rec) const;

    BVH bvh_;
    LightDistribution lights_;
    bool built_ = false;
};

} // namespace lumen
