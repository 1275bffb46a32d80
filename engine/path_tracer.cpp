/**
 * @file path_tracer.cpp
 * @brief Path tracing with next-event estimation and Russian roulette
 */

#include "path_tracer.hpp"
#include "profiler.hpp"
#include <algorithm>
#include <cmath>

namespace lumen {

color clamp_luminance(color c, double max_luminance) {
    if (max_luminance <= 0.0) return c;
    double lum = vec3_luminance(c);
    if (lum > max_luminance) {
        return vec3_scale(c, max_luminance / lum);
    }
    return c;
}

color PathTracer::Li(const ray& r, const Scene& scene, const LightDistribution& lights,
                     Sampler& sampler) const {
    LUMEN_PROFILE_SCOPE("Path Sample");
    switch (settings_.color_mode) {
        case ColorMode::DebugNormals:
            return trace_normals(r, scene, false);
        case ColorMode::ForwardNormals:
            return trace_normals(r, scene, true);
        case ColorMode::Radiance:
        default:
            return clamp_luminance(trace(r, scene, lights, sampler), settings_.clamp_max);
    }
}

color PathTracer::trace_normals(ray r, const Scene& scene, bool forward_only) const {
    hit_record rec = hit_record_init();
    if (!scene.intersect(r, rec)) {
        return vec3_zero();
    }
    if (forward_only && vec3_dot(rec.normal, r.direction) <= 0.0) {
        return vec3_zero();
    }
    return vec3_add(vec3_scale(rec.normal, 0.5), vec3_splat(0.5));
}

color PathTracer::trace(ray r, const Scene& scene, const LightDistribution& lights,
                        Sampler& sampler) const {
    const bool nee = settings_.use_nee && !lights.empty();

    color throughput = {1.0, 1.0, 1.0};
    color accumulated = {0.0, 0.0, 0.0};
    bool specular_bounce = false;
    double bsdf_pdf = 0.0;          // Density of the direction that produced r
    point3 prev_point = r.origin;

    for (int depth = 0; ; ++depth) {
        hit_record rec = hit_record_init();

        if (!scene.intersect(r, rec)) {
            accumulated = vec3_add(accumulated, vec3_mul(throughput, scene.background));
            break;
        }

        vec3 wo_world = vec3_negate(r.direction);
        const Material& mat = scene.material(rec);
        color albedo = mat.albedo_at(rec.u, rec.v);

        // Emission: full weight where light sampling could not have found it
        color le = scene.emitted(rec, wo_world);
        if (!vec3_is_black(le)) {
            if (depth == 0 || specular_bounce || !nee || lights.light_of_prim(rec.prim_id) < 0) {
                accumulated = vec3_add(accumulated, vec3_mul(throughput, le));
            } else if (settings_.use_mis) {
                double light_pdf = lights.pdf_li(prev_point, rec.prim_id, rec.point);
                double w = power_heuristic(bsdf_pdf, light_pdf);
                accumulated = vec3_add(accumulated, vec3_scale(vec3_mul(throughput, le), w));
            }
        }

        if (depth >= settings_.max_depth) break;

        Frame frame(rec.normal);
        vec3 wo = frame.to_local(wo_world);
        if (wo.z == 0.0) break;

        if (nee && !mat.is_discrete()) {
            color direct = sample_direct(rec, frame, wo, mat, albedo, scene, lights, sampler);
            accumulated = vec3_add(accumulated, vec3_mul(throughput, direct));
        }

        BSDFSample bs;
        if (!mat.sample(wo, albedo, sampler, bs, TransportMode::Radiance)) break;

        throughput = vec3_mul(throughput, vec3_scale(bs.value, abs_cos_theta(bs.wi) / bs.pdf));
        if (vec3_is_black(throughput) || !vec3_is_finite(throughput)) break;

        specular_bounce = bs.is_discrete;
        bsdf_pdf = bs.pdf;
        prev_point = rec.point;

        // Russian roulette
        if (depth + 1 >= settings_.rr_depth) {
            double p = std::min(0.95, vec3_max_component(throughput));
            if (sampler.next() >= p) break;
            throughput = vec3_scale(throughput, 1.0 / p);
        }

        r = hit_record_spawn_ray(&rec, frame.to_world(bs.wi));
    }

    return accumulated;
}

color PathTracer::sample_direct(const hit_record& rec, const Frame& frame, vec3 wo, const Material& mat,
                                color albedo, const Scene& scene, const LightDistribution& lights,
                                Sampler& sampler) const {
    const color black = {0.0, 0.0, 0.0};

    LightSample ls;
    if (!lights.sample_li(rec.point, sampler, ls)) return black;
    if (vec3_is_black(ls.radiance)) return black;

    vec3 wi = frame.to_local(ls.wi);
    color f = mat.evaluate(wo, wi, albedo, TransportMode::Radiance);
    if (vec3_is_black(f)) return black;

    point3 origin = offset_ray_origin(rec.point, rec.normal, rec.geo_normal, rec.epsilon, ls.wi);
    if (!scene.visible(origin, ls.position)) return black;

    double w = 1.0;
    if (!ls.is_delta && settings_.use_mis) {
        w = power_heuristic(ls.pdf, mat.pdf(wo, wi));
    }

    return vec3_scale(vec3_mul(f, ls.radiance), abs_cos_theta(wi) * w / ls.pdf);
}

} // namespace lumen
