/**
 * @file vec3.h
 * @brief 3D vector mathematics for light transport
 *
 * Provides a vec3 structure and the vector operations shared by
 * geometry, sampling and shading code.
 */

#ifndef VEC3_H
#define VEC3_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief 3D vector structure
 */
typedef struct vec3 {
    double x;
    double y;
    double z;
} vec3;

/**
 * @brief Color alias for vec3 (r, g, b stored in x, y, z)
 */
typedef vec3 color;

/**
 * @brief Point alias for vec3
 */
typedef vec3 point3;

/* Construction */
vec3 vec3_create(double x, double y, double z);
vec3 vec3_zero(void);
vec3 vec3_splat(double v);

/* Basic operations */
vec3 vec3_add(vec3 a, vec3 b);
vec3 vec3_sub(vec3 a, vec3 b);
vec3 vec3_mul(vec3 a, vec3 b);
vec3 vec3_scale(vec3 v, double t);
vec3 vec3_negate(vec3 v);
vec3 vec3_fma(vec3 a, vec3 b, double t); /* a + b * t */

/* Vector products */
double vec3_dot(vec3 a, vec3 b);
vec3 vec3_cross(vec3 a, vec3 b);

/* Length operations */
double vec3_length(vec3 v);
double vec3_length_squared(vec3 v);
vec3 vec3_normalize(vec3 v);

/* Component access (axis 0=x, 1=y, 2=z) */
double vec3_axis(vec3 v, int axis);
vec3 vec3_min(vec3 a, vec3 b);
vec3 vec3_max(vec3 a, vec3 b);
double vec3_max_component(vec3 v);
double vec3_max_abs_component(vec3 v);

/* Reflection about a unit normal */
vec3 vec3_reflect(vec3 v, vec3 n);

/* Color helpers */
double vec3_luminance(color c);
bool vec3_is_black(color c);
bool vec3_is_finite(vec3 v);

/* Utility */
vec3 vec3_lerp(vec3 a, vec3 b, double t);
vec3 vec3_clamp(vec3 v, double min_val, double max_val);

#ifdef __cplusplus
}
#endif

#endif /* VEC3_H */
