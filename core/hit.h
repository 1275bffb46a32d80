/**
 * @file hit.h
 * @brief Hit record structure for ray-triangle intersections
 */

#ifndef HIT_H
#define HIT_H

#include "vec3.h"
#include "ray.h"
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Relative scale of the self-intersection offset
 *
 * The offset applied to secondary ray origins is this factor times the
 * magnitude of the hit point coordinates plus the hit distance.
 */
#define RAY_EPSILON_SCALE 1e-7

/**
 * @brief Hit record containing intersection information
 *
 * Normals are stored as authored (outward); front_face tells which side
 * the ray arrived from.
 */
typedef struct hit_record {
    point3 point;      /**< Point of intersection */
    vec3 normal;       /**< Interpolated shading normal (outward) */
    vec3 geo_normal;   /**< Geometric normal (outward) */
    double t;          /**< Ray parameter at intersection */
    double b1;         /**< Barycentric weight of vertex 1 */
    double b2;         /**< Barycentric weight of vertex 2 */
    double u;          /**< Texture U coordinate */
    double v;          /**< Texture V coordinate */
    double epsilon;    /**< Offset for re-originating rays off the surface */
    bool front_face;   /**< True if ray hit the side the geometric normal faces */
    int prim_id;       /**< Index of the hit primitive */
    int material_id;   /**< Material identifier for the hit surface */
} hit_record;

/**
 * @brief Initialize a hit record
 * @return Default hit record (no primitive)
 */
hit_record hit_record_init(void);

/**
 * @brief Record which side of the surface the ray arrived from
 * @param rec Hit record to modify
 * @param r The ray
 * @param outward_normal The outward-pointing geometric normal
 */
void hit_record_set_face_normal(hit_record* rec, ray r, vec3 outward_normal);

/**
 * @brief Compute the self-intersection epsilon for the current hit
 */
void hit_record_set_epsilon(hit_record* rec);

/**
 * @brief Offset a surface point so a ray leaving along dir clears the surface
 * @param p Surface point
 * @param shading_normal Shading normal used for the offset
 * @param geo_normal Geometric normal deciding the side
 * @param epsilon Offset distance
 * @param dir Direction the new ray will travel
 */
point3 offset_ray_origin(point3 p, vec3 shading_normal, vec3 geo_normal, double epsilon, vec3 dir);

/**
 * @brief Spawn a ray leaving the hit surface in direction dir
 */
ray hit_record_spawn_ray(const hit_record* rec, vec3 dir);

#ifdef __cplusplus
}
#endif

#endif /* HIT_H */
