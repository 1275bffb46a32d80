/**
 * @file ray.h
 * @brief Ray structure and operations
 */

#ifndef RAY_H
#define RAY_H

#include "vec3.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Ray with origin, unit direction and valid parametric interval
 */
typedef struct ray {
    point3 origin;
    vec3 direction;
    double t_min;
    double t_max;
} ray;

/**
 * @brief Create a ray covering [0, infinity)
 * @param origin Ray origin point
 * @param direction Ray direction vector (normalized by the caller)
 * @return New ray
 */
ray ray_create(point3 origin, vec3 direction);

/**
 * @brief Create a ray restricted to [t_min, t_max]
 */
ray ray_create_interval(point3 origin, vec3 direction, double t_min, double t_max);

/**
 * @brief Create the segment ray from one point towards another
 *
 * The direction is normalized and t_max is the distance between the
 * points shortened by the given relative epsilon.
 */
ray ray_between(point3 from, point3 to, double shorten);

/**
 * @brief Get point along ray at parameter t
 * @param r The ray
 * @param t Parameter value (distance along ray)
 * @return Point at r.origin + t * r.direction
 */
point3 ray_at(ray r, double t);

#ifdef __cplusplus
}
#endif

#endif /* RAY_H */
