/**
 * @file material.cpp
 * @brief BSDF evaluation, sampling and densities
 */

#include "material.hpp"
#include <cmath>
#include <algorithm>

namespace lumen {

namespace {

constexpr double kMinAlpha = 1e-3;

inline double effective_alpha(double roughness) {
    return std::clamp(roughness, kMinAlpha, 1.0);
}

inline double sqr(double x) { return x * x; }

inline vec3 mirror_local(vec3 w) {
    return {-w.x, -w.y, w.z};
}

inline vec3 reflect_about(vec3 w, vec3 h) {
    return vec3_sub(vec3_scale(h, 2.0 * vec3_dot(w, h)), w);
}

/**
 * @brief Microfacet normal for a (wo, wi) pair of the rough dielectric
 *
 * Returns false for pairs the BSDF cannot connect (backfacing microfacet,
 * grazing directions).
 */
bool dielectric_half(vec3 wo, vec3 wi, double ior, bool& is_reflect, double& etap, vec3& wm) {
    double cos_o = cos_theta(wo);
    double cos_i = cos_theta(wi);
    if (cos_o == 0.0 || cos_i == 0.0) return false;

    is_reflect = cos_o * cos_i > 0.0;
    etap = 1.0;
    if (!is_reflect) {
        etap = cos_o > 0.0 ? ior : 1.0 / ior;
    }

    wm = vec3_add(vec3_scale(wi, etap), wo);
    if (vec3_length_squared(wm) == 0.0) return false;
    wm = vec3_normalize(wm);
    if (wm.z < 0.0) wm = vec3_negate(wm);

    // Discard backfacing microfacets
    if (vec3_dot(wm, wi) * cos_i < 0.0 || vec3_dot(wm, wo) * cos_o < 0.0) return false;
    return true;
}

} // namespace

// ==================== Microfacet distribution ====================

namespace microfacet {

double ggx_d(vec3 h, double alpha) {
    double cos2 = h.z * h.z;
    if (h.z <= 0.0) return 0.0;
    double a2 = alpha * alpha;
    double d = cos2 * (a2 - 1.0) + 1.0;
    return a2 / (PI * d * d);
}

double smith_lambda(vec3 w, double alpha) {
    double cos2 = w.z * w.z;
    if (cos2 >= 1.0) return 0.0;
    if (cos2 <= 0.0) return HUGE_VAL;
    double tan2 = (1.0 - cos2) / cos2;
    return 0.5 * (std::sqrt(1.0 + alpha * alpha * tan2) - 1.0);
}

double smith_g(vec3 wo, vec3 wi, double alpha) {
    return 1.0 / (1.0 + smith_lambda(wo, alpha) + smith_lambda(wi, alpha));
}

double smith_g1(vec3 w, double alpha) {
    return 1.0 / (1.0 + smith_lambda(w, alpha));
}

vec3 sample_visible(vec3 w, double u1, double u2, double alpha) {
    // Stretch the view direction to the hemisphere configuration
    vec3 wh = vec3_normalize({alpha * w.x, alpha * w.y, w.z});
    if (wh.z < 0.0) wh = vec3_negate(wh);

    vec3 t1 = wh.z < 0.99999 ? vec3_normalize(vec3_cross({0.0, 0.0, 1.0}, wh)) : vec3{1.0, 0.0, 0.0};
    vec3 t2 = vec3_cross(wh, t1);

    // Uniform disk point, warped onto the visible part of the hemisphere
    double r = std::sqrt(u1);
    double phi = 2.0 * PI * u2;
    double px = r * std::cos(phi);
    double py = r * std::sin(phi);
    double h = std::sqrt(std::max(0.0, 1.0 - px * px));
    double s = 0.5 * (1.0 + wh.z);
    py = (1.0 - s) * h + s * py;
    double pz = std::sqrt(std::max(0.0, 1.0 - px * px - py * py));

    vec3 nh = vec3_add(vec3_add(vec3_scale(t1, px), vec3_scale(t2, py)), vec3_scale(wh, pz));
    return vec3_normalize({alpha * nh.x, alpha * nh.y, std::max(1e-6, nh.z)});
}

double visible_pdf(vec3 w, vec3 h, double alpha) {
    double cos_w = std::fabs(w.z);
    if (cos_w == 0.0) return 0.0;
    return smith_g1(w, alpha) / cos_w * ggx_d(h, alpha) * std::fabs(vec3_dot(w, h));
}

} // namespace microfacet

// ==================== Fresnel ====================

double fresnel_dielectric(double cos_i, double eta) {
    cos_i = std::clamp(cos_i, -1.0, 1.0);
    if (cos_i < 0.0) {
        eta = 1.0 / eta;
        cos_i = -cos_i;
    }

    double sin2_i = 1.0 - cos_i * cos_i;
    double sin2_t = sin2_i / (eta * eta);
    if (sin2_t >= 1.0) return 1.0;  // Total internal reflection

    double cos_t = std::sqrt(std::max(0.0, 1.0 - sin2_t));
    double r_parl = (eta * cos_i - cos_t) / (eta * cos_i + cos_t);
    double r_perp = (cos_i - eta * cos_t) / (cos_i + eta * cos_t);
    return 0.5 * (r_parl * r_parl + r_perp * r_perp);
}

bool refract(vec3 w, vec3 n, double eta, double& etap, vec3& wt) {
    double cos_i = vec3_dot(n, w);
    if (cos_i < 0.0) {
        eta = 1.0 / eta;
        cos_i = -cos_i;
        n = vec3_negate(n);
    }

    double sin2_i = std::max(0.0, 1.0 - cos_i * cos_i);
    double sin2_t = sin2_i / (eta * eta);
    if (sin2_t >= 1.0) return false;

    double cos_t = std::sqrt(1.0 - sin2_t);
    wt = vec3_add(vec3_scale(vec3_negate(w), 1.0 / eta), vec3_scale(n, cos_i / eta - cos_t));
    etap = eta;
    return true;
}

// ==================== Evaluation ====================

color Material::evaluate(vec3 wo, vec3 wi, color base, TransportMode mode) const {
    const color black = {0.0, 0.0, 0.0};

    switch (type) {
        case MaterialType::Diffuse:
            if (!same_hemisphere(wo, wi)) return black;
            return vec3_scale(base, INV_PI);

        case MaterialType::SpecularReflect:
        case MaterialType::SpecularTransmit:
            return black;

        case MaterialType::GlossyReflect: {
            if (!same_hemisphere(wo, wi)) return black;
            double cos_o = abs_cos_theta(wo);
            double cos_i = abs_cos_theta(wi);
            if (cos_o == 0.0 || cos_i == 0.0) return black;

            vec3 h = vec3_add(wo, wi);
            if (vec3_length_squared(h) == 0.0) return black;
            h = vec3_normalize(h);
            if (h.z < 0.0) h = vec3_negate(h);

            double alpha = effective_alpha(roughness);
            double f = microfacet::ggx_d(h, alpha) * microfacet::smith_g(wo, wi, alpha) / (4.0 * cos_o * cos_i);
            return vec3_scale(base, f);
        }

        case MaterialType::GlossyTransmit: {
            bool is_reflect = false;
            double etap = 1.0;
            vec3 wm;
            if (!dielectric_half(wo, wi, ior, is_reflect, etap, wm)) return black;

            double alpha = effective_alpha(roughness);
            double d = microfacet::ggx_d(wm, alpha);
            double g = microfacet::smith_g(wo, wi, alpha);
            double fr = fresnel_dielectric(vec3_dot(wo, wm), ior);
            double cos_o = cos_theta(wo);
            double cos_i = cos_theta(wi);

            if (is_reflect) {
                return vec3_scale(base, d * g * fr / std::fabs(4.0 * cos_i * cos_o));
            }

            double denom = sqr(vec3_dot(wi, wm) + vec3_dot(wo, wm) / etap) * cos_i * cos_o;
            if (denom == 0.0) return black;
            double ft = d * (1.0 - fr) * g * std::fabs(vec3_dot(wi, wm) * vec3_dot(wo, wm) / denom);
            if (mode == TransportMode::Radiance) {
                ft /= sqr(etap);
            }
            return vec3_scale(base, ft);
        }
    }
    return black;
}

// ==================== Sampling ====================

bool Material::sample(vec3 wo, color base, Sampler& sampler, BSDFSample& out, TransportMode mode) const {
    switch (type) {
        case MaterialType::Diffuse: {
            vec3 wi = sample_cosine_hemisphere(sampler.next(), sampler.next());
            if (wo.z < 0.0) wi.z = -wi.z;
            if (wi.z == 0.0) return false;
            out.wi = wi;
            out.value = vec3_scale(base, INV_PI);
            out.pdf = abs_cos_theta(wi) * INV_PI;
            out.is_discrete = false;
            return out.pdf > 0.0;
        }

        case MaterialType::SpecularReflect: {
            if (wo.z == 0.0) return false;
            out.wi = mirror_local(wo);
            out.value = vec3_scale(base, 1.0 / abs_cos_theta(out.wi));
            out.pdf = 1.0;
            out.is_discrete = true;
            return true;
        }

        case MaterialType::SpecularTransmit: {
            if (wo.z == 0.0) return false;
            double fr = fresnel_dielectric(cos_theta(wo), ior);

            if (sampler.next() < fr) {
                out.wi = mirror_local(wo);
                out.value = vec3_scale(base, fr / abs_cos_theta(out.wi));
                out.pdf = fr;
                out.is_discrete = true;
                return true;
            }

            double etap = 1.0;
            vec3 wt;
            if (!refract(wo, {0.0, 0.0, 1.0}, ior, etap, wt) || wt.z == 0.0) return false;

            double ft = (1.0 - fr) / abs_cos_theta(wt);
            if (mode == TransportMode::Radiance) {
                ft /= sqr(etap);
            }
            out.wi = wt;
            out.value = vec3_scale(base, ft);
            out.pdf = 1.0 - fr;
            out.is_discrete = true;
            return out.pdf > 0.0;
        }

        case MaterialType::GlossyReflect: {
            if (wo.z == 0.0) return false;
            double alpha = effective_alpha(roughness);
            vec3 h = microfacet::sample_visible(wo, sampler.next(), sampler.next(), alpha);
            if (vec3_dot(wo, h) == 0.0) return false;

            vec3 wi = reflect_about(wo, h);
            if (!same_hemisphere(wo, wi)) return false;

            out.wi = wi;
            out.value = evaluate(wo, wi, base, mode);
            out.pdf = pdf(wo, wi);
            out.is_discrete = false;
            return out.pdf > 0.0 && !vec3_is_black(out.value);
        }

        case MaterialType::GlossyTransmit: {
            if (wo.z == 0.0) return false;
            double alpha = effective_alpha(roughness);
            vec3 wm = microfacet::sample_visible(wo, sampler.next(), sampler.next(), alpha);
            double fr = fresnel_dielectric(vec3_dot(wo, wm), ior);

            vec3 wi;
            if (sampler.next() < fr) {
                wi = reflect_about(wo, wm);
                if (!same_hemisphere(wo, wi)) return false;
            } else {
                double etap = 1.0;
                if (!refract(wo, wm, ior, etap, wi)) return false;
                if (same_hemisphere(wo, wi) || wi.z == 0.0) return false;
            }

            out.wi = wi;
            out.value = evaluate(wo, wi, base, mode);
            out.pdf = pdf(wo, wi);
            out.is_discrete = false;
            return out.pdf > 0.0 && !vec3_is_black(out.value);
        }
    }
    return false;
}

// ==================== Densities ====================

double Material::pdf(vec3 wo, vec3 wi) const {
    switch (type) {
        case MaterialType::Diffuse:
            if (!same_hemisphere(wo, wi)) return 0.0;
            return abs_cos_theta(wi) * INV_PI;

        case MaterialType::SpecularReflect:
        case MaterialType::SpecularTransmit:
            return 0.0;

        case MaterialType::GlossyReflect: {
            if (!same_hemisphere(wo, wi)) return 0.0;
            vec3 h = vec3_add(wo, wi);
            if (vec3_length_squared(h) == 0.0) return 0.0;
            h = vec3_normalize(h);
            if (h.z < 0.0) h = vec3_negate(h);
            double wo_h = std::fabs(vec3_dot(wo, h));
            if (wo_h == 0.0) return 0.0;
            return microfacet::visible_pdf(wo, h, effective_alpha(roughness)) / (4.0 * wo_h);
        }

        case MaterialType::GlossyTransmit: {
            bool is_reflect = false;
            double etap = 1.0;
            vec3 wm;
            if (!dielectric_half(wo, wi, ior, is_reflect, etap, wm)) return 0.0;

            double alpha = effective_alpha(roughness);
            double fr = fresnel_dielectric(vec3_dot(wo, wm), ior);
            double pdf_h = microfacet::visible_pdf(wo, wm, alpha);

            if (is_reflect) {
                double wo_m = std::fabs(vec3_dot(wo, wm));
                if (wo_m == 0.0) return 0.0;
                return pdf_h / (4.0 * wo_m) * fr;
            }

            double denom = sqr(vec3_dot(wi, wm) + vec3_dot(wo, wm) / etap);
            if (denom == 0.0) return 0.0;
            double dwm_dwi = std::fabs(vec3_dot(wi, wm)) / denom;
            return pdf_h * dwm_dwi * (1.0 - fr);
        }
    }
    return 0.0;
}

} // namespace lumen
