/**
 * @file scene.cpp
 * @brief Scene construction and ray queries
 */

#include "scene.hpp"
#include "profiler.hpp"
#include <cmath>
#include <iostream>

namespace lumen {

void Scene::add_quad(point3 corner, vec3 edge_u, vec3 edge_v, int material_id) {
    point3 p1 = vec3_add(corner, edge_u);
    point3 p2 = vec3_add(p1, edge_v);
    point3 p3 = vec3_add(corner, edge_v);

    Triangle a(corner, p1, p2, material_id);
    Triangle b(corner, p2, p3, material_id);
    a.set_uvs({0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0});
    b.set_uvs({0.0, 0.0}, {1.0, 1.0}, {0.0, 1.0});
    add_triangle(a);
    add_triangle(b);
}

void Scene::add_box(point3 box_min, point3 box_max, int material_id) {
    vec3 d = vec3_sub(box_max, box_min);
    vec3 dx = {d.x, 0.0, 0.0};
    vec3 dy = {0.0, d.y, 0.0};
    vec3 dz = {0.0, 0.0, d.z};

    add_quad(box_min, dy, dx, material_id);                             // -z
    add_quad(vec3_add(box_min, dz), dx, dy, material_id);               // +z
    add_quad(box_min, dz, dy, material_id);                             // -x
    add_quad(vec3_add(box_min, dx), dy, dz, material_id);               // +x
    add_quad(box_min, dx, dz, material_id);                             // -y
    add_quad(vec3_add(box_min, dy), dz, dx, material_id);               // +y
}

void Scene::build(const BVH::Settings& settings) {
    Timer timer;

    if (materials.empty()) {
        add_material(Material::diffuse({0.5, 0.5, 0.5}));
    }

    // Reject geometry the core cannot handle
    std::vector<Triangle> valid;
    valid.reserve(triangles.size());
    int dropped = 0;
    int remapped = 0;
    for (Triangle tri : triangles) {
        if (!tri.is_finite()) {
            ++dropped;
            continue;
        }
        if (tri.material_id < 0 || tri.material_id >= static_cast<int>(materials.size())) {
            tri.material_id = 0;
            ++remapped;
        }
        valid.push_back(tri);
    }
    if (dropped > 0) {
        std::cerr << "Warning: dropped " << dropped << " triangles with non-finite vertices" << std::endl;
    }
    if (remapped > 0) {
        std::cerr << "Warning: " << remapped << " triangles referenced an invalid material, using material 0" << std::endl;
    }
    triangles = std::move(valid);

    std::vector<BVHPrimitive> prims;
    prims.reserve(triangles.size());
    for (size_t i = 0; i < triangles.size(); ++i) {
        BVHPrimitive p;
        p.bounds = triangles[i].bounds();
        p.centroid = triangles[i].centroid();
        p.index = static_cast<int>(i);
        prims.push_back(p);
    }

    bvh_ = BVH(settings);
    bvh_.build(std::move(prims));
    lights_.build(triangles, materials, point_lights);
    built_ = true;

    double ms = timer.elapsed_ms();
    Profiler::instance().record("BVH Build", Profiler::Duration(ms));

    std::cout << "Scene: " << triangles.size() << " triangles, "
              << bvh_.nodes.size() << " BVH nodes (" << bvh_.leaf_count() << " leaves, depth "
              << bvh_.depth() << ", SAH cost " << bvh_.sah_cost() << "), "
              << lights_.size() << " lights, built in " << ms << " ms" << std::endl;
}

bool Scene::intersect(const ray& r, hit_record& rec) const {
    bool found = bvh_.closest_hit(r, rec,
        [this](int prim, const ray& query, double t_min, double t_max, hit_record& hit) {
            if (triangles[prim].intersect(query, t_min, t_max, hit)) {
                hit.prim_id = prim;
                return true;
            }
            return false;
        });

    if (found && normal_mapping) {
        const Material& mat = materials[rec.material_id];
        if (mat.normal_map) {
            apply_normal_map(triangles[rec.prim_id], *mat.normal_map, rec);
        }
    }
    return found;
}

void Scene::apply_normal_map(const Triangle& tri, const Texture& map, hit_record& rec) const {
    vec3 n = rec.normal;

    // Tangent along increasing u, from the UV parameterization
    double du1 = tri.t1.u - tri.t0.u;
    double dv1 = tri.t1.v - tri.t0.v;
    double du2 = tri.t2.u - tri.t0.u;
    double dv2 = tri.t2.v - tri.t0.v;
    double det = du1 * dv2 - dv1 * du2;
    if (std::fabs(det) < 1e-12) return;

    double inv_det = 1.0 / det;
    vec3 dpdu = vec3_scale(vec3_sub(vec3_scale(tri.edge1, dv2), vec3_scale(tri.edge2, dv1)), inv_det);
    vec3 dpdv = vec3_scale(vec3_sub(vec3_scale(tri.edge2, du1), vec3_scale(tri.edge1, du2)), inv_det);

    vec3 tangent = vec3_sub(dpdu, vec3_scale(n, vec3_dot(n, dpdu)));
    double len2 = vec3_length_squared(tangent);
    if (!(len2 > 0.0)) return;
    tangent = vec3_scale(tangent, 1.0 / std::sqrt(len2));
    vec3 bitangent = vec3_cross(n, tangent);
    if (vec3_dot(bitangent, dpdv) < 0.0) bitangent = vec3_negate(bitangent);

    vec3 m = map.sample_normal(rec.u, rec.v);
    vec3 mapped = vec3_add(vec3_add(vec3_scale(tangent, m.x), vec3_scale(bitangent, m.y)), vec3_scale(n, m.z));
    len2 = vec3_length_squared(mapped);
    if (!(len2 > 0.0)) return;
    mapped = vec3_scale(mapped, 1.0 / std::sqrt(len2));

    // Keep the interpolated normal where the mapped one leaves its hemisphere
    if (vec3_dot(mapped, rec.geo_normal) * vec3_dot(n, rec.geo_normal) <= 0.0) return;
    rec.normal = mapped;
}

bool Scene::occluded(const ray& r) const {
    return bvh_.any_hit(r,
        [this](int prim, const ray& query, double t_min, double t_max) {
            return triangles[prim].intersects(query, t_min, t_max);
        });
}

bool Scene::visible(point3 from, point3 to) const {
    ray shadow = ray_between(from, to, 1e-7);
    if (shadow.t_max <= 0.0) return true;
    return !occluded(shadow);
}

} // namespace lumen
