/**
 * @file material.hpp
 * @brief Material definitions and BSDF evaluation
 *
 * Materials are a tagged union dispatched by a switch at every query.
 * All BSDF queries work in the local shading frame (z = shading normal):
 * wo points towards the viewer (or the previous path vertex) and wi
 * towards the light (or the next vertex).
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "sampling.hpp"
#include "texture.hpp"
#include <memory>
#include <string>

namespace lumen {

/**
 * @brief Material types supported by the renderer
 */
enum class MaterialType {
    Diffuse,          // Lambertian reflection
    SpecularReflect,  // Ideal mirror
    SpecularTransmit, // Smooth dielectric (Fresnel reflect/refract)
    GlossyReflect,    // GGX microfacet reflection
    GlossyTransmit    // GGX microfacet reflection and refraction
};

/**
 * @brief Which quantity a path carries
 *
 * Camera paths carry radiance, light paths carry importance. They only
 * differ in the 1/eta^2 scaling of refraction.
 */
enum class TransportMode {
    Radiance,
    Importance
};

/**
 * @brief Result of sampling a BSDF
 */
struct BSDFSample {
    vec3 wi = {0, 0, 1};        // Sampled direction (local frame)
    color value = {0, 0, 0};    // BSDF value for (wo, wi)
    double pdf = 0.0;           // Solid angle density, or discrete probability
    bool is_discrete = false;   // Dirac event: skip MIS and light connections
};

/**
 * @brief Material properties
 */
struct Material {
    MaterialType type = MaterialType::Diffuse;
    color albedo = {0.5, 0.5, 0.5};   // Reflectance, or transmission tint for dielectrics
    color emission = {0.0, 0.0, 0.0}; // Radiance emitted from the front side
    double roughness = 0.1;           // GGX alpha of the glossy variants
    double ior = 1.5;                 // Index of refraction inside the surface
    std::string name;

    std::shared_ptr<const Texture> texture;     // Albedo map, replaces albedo where set
    std::shared_ptr<const Texture> normal_map;  // Tangent-space normal map

    static Material diffuse(color albedo) {
        Material m;
        m.type = MaterialType::Diffuse;
        m.albedo = albedo;
        return m;
    }

    static Material mirror(color tint = {1.0, 1.0, 1.0}) {
        Material m;
        m.type = MaterialType::SpecularReflect;
        m.albedo = tint;
        return m;
    }

    static Material glass(double ior, color tint = {1.0, 1.0, 1.0}) {
        Material m;
        m.type = MaterialType::SpecularTransmit;
        m.albedo = tint;
        m.ior = ior;
        return m;
    }

    static Material glossy(color albedo, double roughness) {
        Material m;
        m.type = MaterialType::GlossyReflect;
        m.albedo = albedo;
        m.roughness = roughness;
        return m;
    }

    static Material rough_glass(double ior, double roughness, color tint = {1.0, 1.0, 1.0}) {
        Material m;
        m.type = MaterialType::GlossyTransmit;
        m.albedo = tint;
        m.ior = ior;
        m.roughness = roughness;
        return m;
    }

    static Material emissive(color emission, color albedo = {0.0, 0.0, 0.0}) {
        Material m;
        m.type = MaterialType::Diffuse;
        m.albedo = albedo;
        m.emission = emission;
        return m;
    }

    static Material diffuse_textured(std::shared_ptr<const Texture> tex) {
        Material m;
        m.type = MaterialType::Diffuse;
        m.texture = std::move(tex);
        return m;
    }

    /**
     * @brief GGX alpha from a Phong-style shininess exponent
     */
    static double shininess_to_roughness(double shininess) {
        return std::sqrt(2.0 / (shininess + 2.0));
    }

    /**
     * @brief Check if material is emissive
     */
    bool is_emissive() const {
        return emission.x > 0.0 || emission.y > 0.0 || emission.z > 0.0;
    }

    /**
     * @brief True if every scattering event is a Dirac event
     */
    bool is_discrete() const {
        return type == MaterialType::SpecularReflect || type == MaterialType::SpecularTransmit;
    }

    /**
     * @brief Radiance emitted towards a direction with cosine cos_ng to the geometric normal
     */
    color emitted(double cos_ng) const {
        return cos_ng > 0.0 ? emission : color{0.0, 0.0, 0.0};
    }

    /**
     * @brief Albedo at texture coordinates (u, v)
     */
    color albedo_at(double u, double v) const {
        return texture ? texture->sample(u, v) : albedo;
    }

    /**
     * @brief BSDF value; zero outside the variant's support and for Dirac variants
     */
    color evaluate(vec3 wo, vec3 wi, TransportMode mode = TransportMode::Radiance) const {
        return evaluate(wo, wi, albedo, mode);
    }

    /**
     * @brief BSDF value with the albedo looked up at the shading point
     */
    color evaluate(vec3 wo, vec3 wi, color base, TransportMode mode) const;

    /**
     * @brief Sample wi for a given wo
     * @return false if the sample was absorbed or numerically degenerate
     */
    bool sample(vec3 wo, Sampler& sampler, BSDFSample& out,
                TransportMode mode = TransportMode::Radiance) const {
        return sample(wo, albedo, sampler, out, mode);
    }

    bool sample(vec3 wo, color base, Sampler& sampler, BSDFSample& out, TransportMode mode) const;

    /**
     * @brief Solid angle density of sample() producing wi; zero for Dirac variants
     */
    double pdf(vec3 wo, vec3 wi) const;
};

// ==================== Microfacet and Fresnel helpers ====================

namespace microfacet {

/**
 * @brief GGX normal distribution for a half vector with positive z
 */
double ggx_d(vec3 h, double alpha);

/**
 * @brief Smith Lambda for GGX
 */
double smith_lambda(vec3 w, double alpha);

/**
 * @brief Height-correlated Smith masking-shadowing
 */
double smith_g(vec3 wo, vec3 wi, double alpha);

/**
 * @brief Smith masking for a single direction
 */
double smith_g1(vec3 w, double alpha);

/**
 * @brief Sample a microfacet normal visible from w, D_w(h) = G1(w) max(0, w.h) D(h) / |w.z|
 *
 * w may lie in either hemisphere; the returned normal always has positive z.
 */
vec3 sample_visible(vec3 w, double u1, double u2, double alpha);

/**
 * @brief Density of sample_visible over microfacet normals
 */
double visible_pdf(vec3 w, vec3 h, double alpha);

} // namespace microfacet

/**
 * @brief Unpolarized Fresnel reflectance of a dielectric interface
 * @param cos_i Cosine to the normal on the incident side (negative from inside)
 * @param eta Index of refraction of the inside relative to the outside
 */
double fresnel_dielectric(double cos_i, double eta);

/**
 * @brief Refract w about n; the side of w decides which medium it is in
 * @param eta Relative index of refraction (inside / outside)
 * @param etap Receives the ratio actually used (eta or 1/eta)
 * @return false on total internal reflection
 */
bool refract(vec3 w, vec3 n, double eta, double& etap, vec3& wt);

} // namespace lumen
