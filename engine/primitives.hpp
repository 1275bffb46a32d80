/**
 * @file primitives.hpp
 * @brief Triangle primitive with precomputed differential data
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "bvh.hpp"
#include <cmath>

namespace lumen {

/**
 * @brief Texture coordinate pair
 */
struct TexCoord {
    double u = 0.0;
    double v = 0.0;
};

/**
 * @brief Triangle with optional per-vertex shading normals and UVs
 *
 * Edges, the unit geometric normal and the area are computed once at
 * construction. Winding (v0, v1, v2) defines the outward side.
 */
struct Triangle {
    point3 v0, v1, v2;
    vec3 n0, n1, n2;              // Shading normals (outward)
    TexCoord t0, t1, t2;
    int material_id = 0;
    bool has_normals = false;

    vec3 edge1 = {0, 0, 0};
    vec3 edge2 = {0, 0, 0};
    vec3 geo_normal = {0, 0, 1};  // Unit, from winding
    double area = 0.0;

    Triangle() = default;

    Triangle(point3 a, point3 b, point3 c, int mat_id = 0)
        : v0(a), v1(b), v2(c), material_id(mat_id) {
        t0 = {0.0, 0.0};
        t1 = {1.0, 0.0};
        t2 = {0.0, 1.0};
        precompute();
        n0 = n1 = n2 = geo_normal;
    }

    /**
     * @brief Attach interpolated shading normals
     */
    void set_normals(vec3 a, vec3 b, vec3 c) {
        n0 = vec3_normalize(a);
        n1 = vec3_normalize(b);
        n2 = vec3_normalize(c);
        has_normals = true;
    }

    void set_uvs(TexCoord a, TexCoord b, TexCoord c) {
        t0 = a;
        t1 = b;
        t2 = c;
    }

    bool is_finite() const {
        return vec3_is_finite(v0) && vec3_is_finite(v1) && vec3_is_finite(v2);
    }

    AABB bounds() const {
        AABB box;
        box.expand(v0);
        box.expand(v1);
        box.expand(v2);
        return box;
    }

    point3 centroid() const {
        return vec3_scale(vec3_add(vec3_add(v0, v1), v2), 1.0 / 3.0);
    }

    /**
     * @brief Möller–Trumbore intersection
     *
     * Fills the geometric part of the record; prim_id is left to the caller.
     */
    bool intersect(const ray& r, double t_min, double t_max, hit_record& rec) const {
        const double EPSILON = 1e-12;

        vec3 h = vec3_cross(r.direction, edge2);
        double a = vec3_dot(edge1, h);

        // Parallel or degenerate
        if (std::fabs(a) < EPSILON) {
            return false;
        }

        double f = 1.0 / a;
        vec3 s = vec3_sub(r.origin, v0);
        double b1 = f * vec3_dot(s, h);
        if (b1 < 0.0 || b1 > 1.0) {
            return false;
        }

        vec3 q = vec3_cross(s, edge1);
        double b2 = f * vec3_dot(r.direction, q);
        if (b2 < 0.0 || b1 + b2 > 1.0) {
            return false;
        }

        double t = f * vec3_dot(edge2, q);
        if (!(t >= t_min && t <= t_max)) {
            return false;
        }

        rec.t = t;
        rec.b1 = b1;
        rec.b2 = b2;
        rec.point = ray_at(r, t);
        hit_record_set_face_normal(&rec, r, geo_normal);
        rec.normal = shading_normal(b1, b2);
        TexCoord uv = interpolate_uv(b1, b2);
        rec.u = uv.u;
        rec.v = uv.v;
        rec.material_id = material_id;
        hit_record_set_epsilon(&rec);
        return true;
    }

    /**
     * @brief Occlusion-only intersection test
     */
    bool intersects(const ray& r, double t_min, double t_max) const {
        vec3 h = vec3_cross(r.direction, edge2);
        double a = vec3_dot(edge1, h);
        if (std::fabs(a) < 1e-12) return false;

        double f = 1.0 / a;
        vec3 s = vec3_sub(r.origin, v0);
        double b1 = f * vec3_dot(s, h);
        if (b1 < 0.0 || b1 > 1.0) return false;

        vec3 q = vec3_cross(s, edge1);
        double b2 = f * vec3_dot(r.direction, q);
        if (b2 < 0.0 || b1 + b2 > 1.0) return false;

        double t = f * vec3_dot(edge2, q);
        return t >= t_min && t <= t_max;
    }

    vec3 shading_normal(double b1, double b2) const {
        if (!has_normals) {
            return geo_normal;
        }
        double b0 = 1.0 - b1 - b2;
        vec3 n = vec3_add(vec3_add(vec3_scale(n0, b0), vec3_scale(n1, b1)), vec3_scale(n2, b2));
        double len2 = vec3_length_squared(n);
        return len2 > 0.0 ? vec3_scale(n, 1.0 / std::sqrt(len2)) : geo_normal;
    }

    TexCoord interpolate_uv(double b1, double b2) const {
        double b0 = 1.0 - b1 - b2;
        return {b0 * t0.u + b1 * t1.u + b2 * t2.u, b0 * t0.v + b1 * t1.v + b2 * t2.v};
    }

    /**
     * @brief Uniformly sample a point on the triangle
     * @param u1,u2 Uniform numbers in [0, 1)
     */
    point3 sample_point(double u1, double u2) const {
        double su = std::sqrt(u1);
        double b0 = 1.0 - su;
        double b1 = u2 * su;
        return vec3_add(v0, vec3_add(vec3_scale(edge1, b1), vec3_scale(edge2, 1.0 - b0 - b1)));
    }

private:
    void precompute() {
        edge1 = vec3_sub(v1, v0);
        edge2 = vec3_sub(v2, v0);
        vec3 c = vec3_cross(edge1, edge2);
        double len = vec3_length(c);
        if (len > 0.0 && std::isfinite(len)) {
            geo_normal = vec3_scale(c, 1.0 / len);
            area = 0.5 * len;
        } else {
            geo_normal = {0.0, 0.0, 1.0};
            area = 0.0;
        }
    }
};

} // namespace lumen
