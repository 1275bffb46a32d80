/**
 * @file sampling.hpp
 * @brief Random number streams, shading frames and sampling warps
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include <random>
#include <cmath>
#include <cstdint>
#include <algorithm>

namespace lumen {

constexpr double PI = 3.14159265358979323846;
constexpr double INV_PI = 0.31830988618379067;
constexpr double INV_4PI = 0.07957747154594767;

/**
 * @brief Seeded random stream owned by one worker
 *
 * Streams created with the same (seed, stream) pair produce the same
 * sequence, so renders are reproducible regardless of thread scheduling.
 */
class Sampler {
public:
    explicit Sampler(uint64_t seed = 0, uint64_t stream = 0) {
        std::seed_seq seq{
            static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
            static_cast<uint32_t>(stream), static_cast<uint32_t>(stream >> 32)
        };
        rng_.seed(seq);
    }

    /**
     * @brief Uniform number in [0, 1)
     */
    double next() {
        // Some standard libraries can round up to exactly 1
        return std::min(dist_(rng_), 0x1.fffffffffffffp-1);
    }

private:
    std::mt19937 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

/**
 * @brief Orthonormal basis with n as the local z axis
 */
struct Frame {
    vec3 s, t, n;

    Frame() : s{1, 0, 0}, t{0, 1, 0}, n{0, 0, 1} {}

    /**
     * @brief Build a frame around a unit normal (Duff et al. 2017)
     */
    explicit Frame(vec3 normal) : n(normal) {
        double sign = std::copysign(1.0, n.z);
        double a = -1.0 / (sign + n.z);
        double b = n.x * n.y * a;
        s = {1.0 + sign * n.x * n.x * a, sign * b, -sign * n.x};
        t = {b, sign + n.y * n.y * a, -n.y};
    }

    vec3 to_local(vec3 v) const {
        return {vec3_dot(v, s), vec3_dot(v, t), vec3_dot(v, n)};
    }

    vec3 to_world(vec3 v) const {
        return vec3_add(vec3_add(vec3_scale(s, v.x), vec3_scale(t, v.y)), vec3_scale(n, v.z));
    }
};

// Local shading frame helpers (z is the normal)
inline double cos_theta(vec3 w) { return w.z; }
inline double abs_cos_theta(vec3 w) { return std::fabs(w.z); }
inline bool same_hemisphere(vec3 a, vec3 b) { return a.z * b.z > 0.0; }

/**
 * @brief Cosine-weighted direction on the upper hemisphere (Malley)
 */
inline vec3 sample_cosine_hemisphere(double u1, double u2) {
    double r = std::sqrt(u1);
    double phi = 2.0 * PI * u2;
    double z = std::sqrt(std::max(0.0, 1.0 - u1));
    return {r * std::cos(phi), r * std::sin(phi), z};
}

inline double cosine_hemisphere_pdf(double cos_theta) {
    return cos_theta > 0.0 ? cos_theta * INV_PI : 0.0;
}

inline vec3 sample_uniform_sphere(double u1, double u2) {
    double z = 1.0 - 2.0 * u1;
    double r = std::sqrt(std::max(0.0, 1.0 - z * z));
    double phi = 2.0 * PI * u2;
    return {r * std::cos(phi), r * std::sin(phi), z};
}

/**
 * @brief Power heuristic with exponent 2 for one sample of each strategy
 */
inline double power_heuristic(double pdf_a, double pdf_b) {
    double a2 = pdf_a * pdf_a;
    double b2 = pdf_b * pdf_b;
    if (a2 + b2 <= 0.0) return 0.0;
    return a2 / (a2 + b2);
}

/**
 * @brief Convert an area density at `to` into a solid-angle density seen from `from`
 */
inline double area_to_solid_angle(double pdf_area, point3 from, point3 to, vec3 normal_at_to) {
    vec3 d = vec3_sub(to, from);
    double dist2 = vec3_length_squared(d);
    if (dist2 <= 0.0) return 0.0;
    double cos = std::fabs(vec3_dot(normal_at_to, d)) / std::sqrt(dist2);
    if (cos <= 0.0) return 0.0;
    return pdf_area * dist2 / cos;
}

} // namespace lumen
