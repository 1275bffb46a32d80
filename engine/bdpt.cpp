/**
 * @file bdpt.cpp
 * @brief Bidirectional Path Tracing implementation
 */

#include "bdpt.hpp"
#include "path_tracer.hpp"
#include "profiler.hpp"
#include <algorithm>
#include <cmath>

namespace lumen {

// ============================================================================
// Helper functions
// ============================================================================

namespace {

const color kBlack = {0.0, 0.0, 0.0};

inline double remap0(double f) {
    return f != 0.0 ? f : 1.0;
}

inline double surface_epsilon(point3 p) {
    return RAY_EPSILON_SCALE * (1.0 + vec3_max_abs_component(p));
}

/**
 * @brief Adjoint BSDF correction for interpolated shading normals
 */
double correct_shading_normal(const PathVertex& v, vec3 wo, vec3 wi, TransportMode mode) {
    if (mode != TransportMode::Importance) return 1.0;
    double num = std::fabs(vec3_dot(wo, v.normal)) * std::fabs(vec3_dot(wi, v.geo_normal));
    double denom = std::fabs(vec3_dot(wo, v.geo_normal)) * std::fabs(vec3_dot(wi, v.normal));
    if (denom == 0.0) return 0.0;
    return num / denom;
}

/**
 * @brief BSDF at a surface vertex for light travelling between its predecessor and next
 */
color vertex_f(const Scene& scene, const PathVertex& v, const PathVertex& next, TransportMode mode) {
    vec3 d = vec3_sub(next.position, v.position);
    double len2 = vec3_length_squared(d);
    if (len2 == 0.0) return kBlack;
    vec3 wi = vec3_scale(d, 1.0 / std::sqrt(len2));

    Frame frame(v.normal);
    color f = scene.material(v.material_id).evaluate(frame.to_local(v.wo), frame.to_local(wi), v.albedo, mode);
    return vec3_scale(f, correct_shading_normal(v, v.wo, wi, mode));
}

/**
 * @brief Solid angle density at `from` to area density at `next`
 */
double convert_density(const PathVertex& from, double pdf, const PathVertex& next) {
    vec3 w = vec3_sub(next.position, from.position);
    double len2 = vec3_length_squared(w);
    if (len2 == 0.0) return 0.0;
    double inv_dist2 = 1.0 / len2;
    if (next.is_on_surface()) {
        pdf *= std::fabs(vec3_dot(next.geo_normal, vec3_scale(w, std::sqrt(inv_dist2))));
    }
    return pdf * inv_dist2;
}

/**
 * @brief Area density at `next` of leaving the light at v by emission sampling
 */
double pdf_light(const LightDistribution& lights, const PathVertex& v, const PathVertex& next) {
    vec3 w = vec3_sub(next.position, v.position);
    double len2 = vec3_length_squared(w);
    if (len2 == 0.0) return 0.0;
    w = vec3_scale(w, 1.0 / std::sqrt(len2));

    double pdf_pos = 0.0;
    double pdf_dir = 0.0;
    lights.pdf_le(v.light_index, w, pdf_pos, pdf_dir);
    double pdf = pdf_dir / len2;
    if (next.is_on_surface()) {
        pdf *= std::fabs(vec3_dot(next.geo_normal, w));
    }
    return pdf;
}

/**
 * @brief Area density of choosing the light at v and the point v on it
 */
double pdf_light_origin(const LightDistribution& lights, const PathVertex& v, const PathVertex& next) {
    vec3 w = vec3_normalize(vec3_sub(next.position, v.position));
    double pdf_pos = 0.0;
    double pdf_dir = 0.0;
    lights.pdf_le(v.light_index, w, pdf_pos, pdf_dir);
    return pdf_pos * lights.pmf(v.light_index);
}

/**
 * @brief Area density at `next` of sampling it from v, arriving at v from prev
 */
double vertex_pdf(const Scene& scene, const LightDistribution& lights, const Camera& camera,
                  const PathVertex& v, const PathVertex* prev, const PathVertex& next) {
    if (v.type == VertexType::Light) {
        return pdf_light(lights, v, next);
    }

    vec3 wn = vec3_sub(next.position, v.position);
    double len2 = vec3_length_squared(wn);
    if (len2 == 0.0) return 0.0;
    wn = vec3_scale(wn, 1.0 / std::sqrt(len2));

    double pdf = 0.0;
    if (v.type == VertexType::Camera) {
        double pdf_pos = 0.0;
        camera.pdf_we(wn, pdf_pos, pdf);
    } else {
        if (prev == nullptr) return 0.0;
        vec3 wp = vec3_normalize(vec3_sub(prev->position, v.position));
        Frame frame(v.normal);
        pdf = scene.material(v.material_id).pdf(frame.to_local(wp), frame.to_local(wn));
    }
    return convert_density(v, pdf, next);
}

/**
 * @brief Origin for a ray leaving a vertex towards dir
 */
point3 spawn_point(const PathVertex& v, vec3 dir) {
    if (!v.is_on_surface()) return v.position;
    return offset_ray_origin(v.position, v.normal, v.geo_normal, v.epsilon, dir);
}

bool mutually_visible(const Scene& scene, const PathVertex& a, const PathVertex& b) {
    vec3 d = vec3_sub(b.position, a.position);
    return scene.visible(spawn_point(a, d), spawn_point(b, vec3_negate(d)));
}

/**
 * @brief Geometry term G(a <-> b) including visibility
 */
double geometry_term(const Scene& scene, const PathVertex& a, const PathVertex& b) {
    vec3 d = vec3_sub(a.position, b.position);
    double len2 = vec3_length_squared(d);
    if (len2 == 0.0) return 0.0;

    double g = 1.0 / len2;
    d = vec3_scale(d, std::sqrt(g));
    if (a.is_on_surface()) g *= std::fabs(vec3_dot(a.normal, d));
    if (b.is_on_surface()) g *= std::fabs(vec3_dot(b.normal, d));
    if (g == 0.0) return 0.0;

    return mutually_visible(scene, a, b) ? g : 0.0;
}

} // namespace

// ============================================================================
// BDPTIntegrator implementation
// ============================================================================

color BDPTIntegrator::Li(const Scene& scene, const LightDistribution& lights, const Camera& camera,
                         double raster_x, double raster_y, Sampler& sampler, PathBuffers& buffers,
                         std::vector<Splat>& splats) const {
    LUMEN_PROFILE_SCOPE("BDPT Sample");

    std::vector<PathVertex>& camera_path = buffers.camera_path;
    std::vector<PathVertex>& light_path = buffers.light_path;

    color background = kBlack;
    int num_camera = generate_camera_subpath(scene, lights, camera, raster_x, raster_y, sampler,
                                             camera_path, background);
    int num_light = generate_light_subpath(scene, lights, sampler, light_path);

    color L = kBlack;

    // An escaped camera path sees the background; no other strategy samples it
    if (strategy_enabled(0, num_camera + 1)) {
        L = vec3_add(L, clamp_luminance(background, settings_.clamp_max));
    }

    // s = 1 samples the light directly and does not need a light subpath
    int max_s = std::max(num_light, lights.empty() ? 0 : 1);

    for (int t = 1; t <= num_camera; ++t) {
        for (int s = 0; s <= max_s; ++s) {
            int depth = s + t - 2;
            if ((s == 1 && t == 1) || depth < 0 || depth > settings_.max_depth) continue;
            if (!strategy_enabled(s, t)) continue;

            double splat_x = raster_x;
            double splat_y = raster_y;
            color contrib = connect(scene, lights, camera, light_path, camera_path, s, t, sampler,
                                    splat_x, splat_y);
            if (vec3_is_black(contrib)) continue;

            contrib = clamp_luminance(contrib, settings_.clamp_max);
            if (t == 1) {
                splats.push_back({splat_x, splat_y, contrib});
            } else {
                L = vec3_add(L, contrib);
            }
        }
    }

    return L;
}

bool BDPTIntegrator::strategy_enabled(int s, int t) const {
    if (t == 1 && !settings_.light_tracing) return false;
    if (settings_.debug_s >= 0 && s != settings_.debug_s) return false;
    if (settings_.debug_t >= 0 && t != settings_.debug_t) return false;
    return true;
}

int BDPTIntegrator::generate_camera_subpath(const Scene& scene, const LightDistribution& lights,
                                            const Camera& camera, double raster_x, double raster_y,
                                            Sampler& sampler,
                                            std::vector<PathVertex>& path, color& background) const {
    path.clear();

    ray r = camera.generate_ray(raster_x, raster_y);

    PathVertex cam_vertex;
    cam_vertex.type = VertexType::Camera;
    cam_vertex.position = r.origin;
    cam_vertex.beta = {1.0, 1.0, 1.0};
    path.push_back(cam_vertex);

    double pdf_pos = 0.0;
    double pdf_dir = 0.0;
    camera.pdf_we(r.direction, pdf_pos, pdf_dir);
    if (pdf_dir <= 0.0) return 1;

    random_walk(scene, lights, r, sampler, cam_vertex.beta, pdf_dir,
                settings_.max_depth + 1, TransportMode::Radiance, path, &background);
    return static_cast<int>(path.size());
}

int BDPTIntegrator::generate_light_subpath(const Scene& scene, const LightDistribution& lights,
                                           Sampler& sampler, std::vector<PathVertex>& path) const {
    path.clear();
    if (lights.empty()) return 0;

    EmissionSample es;
    if (!lights.sample_le(sampler, es)) return 0;
    if (es.pdf_pos <= 0.0 || es.pdf_dir <= 0.0 || es.pdf_choice <= 0.0 || vec3_is_black(es.radiance)) {
        return 0;
    }

    const Light& light = lights.light(es.light_index);

    PathVertex light_vertex;
    light_vertex.type = VertexType::Light;
    light_vertex.position = es.position;
    light_vertex.light_index = es.light_index;
    light_vertex.le = es.radiance;
    light_vertex.beta = es.radiance;
    light_vertex.pdf_fwd = es.pdf_pos * es.pdf_choice;
    if (!light.is_delta()) {
        light_vertex.normal = es.normal;
        light_vertex.geo_normal = es.normal;
        light_vertex.epsilon = surface_epsilon(es.position);
    }
    path.push_back(light_vertex);

    double cos_light = light.is_delta() ? 1.0 : std::fabs(vec3_dot(es.normal, es.r.direction));
    color beta = vec3_scale(es.radiance, cos_light / (es.pdf_choice * es.pdf_pos * es.pdf_dir));

    random_walk(scene, lights, es.r, sampler, beta, es.pdf_dir, light_depth(),
                TransportMode::Importance, path, nullptr);
    return static_cast<int>(path.size());
}

int BDPTIntegrator::random_walk(const Scene& scene, const LightDistribution& lights, ray r,
                                Sampler& sampler, color beta, double pdf, int max_bounces, TransportMode mode, std::vector<PathVertex>& path,
                                color* background) const {
    if (max_bounces <= 0) return 0;

    int bounces = 0;
    double pdf_fwd = pdf;
    double pdf_rev = 0.0;

    while (true) {
        hit_record rec = hit_record_init();
        if (!scene.intersect(r, rec)) {
            if (background != nullptr) {
                *background = vec3_mul(beta, scene.background);
            }
            break;
        }

        PathVertex vertex;
        vertex.type = VertexType::Surface;
        vertex.position = rec.point;
        vertex.normal = rec.normal;
        vertex.geo_normal = rec.geo_normal;
        vertex.wo = vec3_negate(r.direction);
        vertex.epsilon = rec.epsilon;
        vertex.material_id = rec.material_id;
        vertex.albedo = scene.material(rec).albedo_at(rec.u, rec.v);
        vertex.light_index = lights.light_of_prim(rec.prim_id);
        vertex.beta = beta;
        vertex.pdf_fwd = convert_density(path.back(), pdf_fwd, vertex);
        path.push_back(vertex);

        if (++bounces >= max_bounces) break;

        const Material& mat = scene.material(vertex.material_id);
        Frame frame(vertex.normal);
        vec3 wo = frame.to_local(vertex.wo);

        BSDFSample bs;
        if (!mat.sample(wo, vertex.albedo, sampler, bs, mode)) break;

        vec3 wi_world = frame.to_world(bs.wi);
        beta = vec3_mul(beta, vec3_scale(bs.value, abs_cos_theta(bs.wi) / bs.pdf));
        pdf_fwd = bs.pdf;
        pdf_rev = mat.pdf(bs.wi, wo);
        if (bs.is_discrete) {
            path.back().delta = true;
            pdf_fwd = 0.0;
            pdf_rev = 0.0;
        }
        beta = vec3_scale(beta, correct_shading_normal(vertex, vertex.wo, wi_world, mode));

        PathVertex& current = path.back();
        PathVertex& previous = path[path.size() - 2];
        previous.pdf_rev = convert_density(current, pdf_rev, previous);

        if (vec3_is_black(beta) || !vec3_is_finite(beta)) break;

        r = hit_record_spawn_ray(&rec, wi_world);
    }

    return bounces;
}

color BDPTIntegrator::connect(const Scene& scene, const LightDistribution& lights, const Camera& camera,
                              const std::vector<PathVertex>& light_path,
                              const std::vector<PathVertex>& camera_path,
                              int s, int t, Sampler& sampler, double& raster_x, double& raster_y) const {
    color L = kBlack;
    PathVertex sampled;

    if (s == 0) {
        // Camera subpath ends on a light
        const PathVertex& pt = camera_path[t - 1];
        if (pt.type != VertexType::Surface) return kBlack;
        color le = scene.material(pt.material_id).emitted(vec3_dot(pt.geo_normal, pt.wo));
        if (vec3_is_black(le)) return kBlack;
        L = vec3_mul(pt.beta, le);
        // No other strategy samples emitters missing from the distribution
        if (!pt.is_light()) return L;
    } else if (t == 1) {
        // Light tracing: connect the light subpath to the pinhole
        const PathVertex& qs = light_path[s - 1];
        if (!qs.is_connectible(scene)) return kBlack;

        vec3 wi;
        double distance = 0.0;
        double pdf = 0.0;
        double importance = camera.sample_wi(qs.position, wi, distance, pdf, raster_x, raster_y);
        if (pdf <= 0.0 || importance <= 0.0) return kBlack;

        sampled.type = VertexType::Camera;
        sampled.position = camera.position();
        sampled.beta = vec3_splat(importance / pdf);

        L = vec3_mul(vec3_mul(qs.beta, vertex_f(scene, qs, sampled, TransportMode::Importance)), sampled.beta);
        if (qs.is_on_surface()) L = vec3_scale(L, std::fabs(vec3_dot(wi, qs.normal)));
        if (!vec3_is_black(L) && !mutually_visible(scene, qs, sampled)) L = kBlack;
    } else if (s == 1) {
        // Next event estimation from the camera subpath endpoint
        const PathVertex& pt = camera_path[t - 1];
        if (!pt.is_connectible(scene)) return kBlack;

        LightSample ls;
        if (!lights.sample_li(pt.position, sampler, ls)) return kBlack;
        if (ls.pdf <= 0.0 || vec3_is_black(ls.radiance)) return kBlack;

        const Light& light = lights.light(ls.light_index);
        sampled.type = VertexType::Light;
        sampled.position = ls.position;
        sampled.light_index = ls.light_index;
        sampled.le = light.radiance;
        if (!light.is_delta()) {
            sampled.normal = ls.normal;
            sampled.geo_normal = ls.normal;
            sampled.epsilon = surface_epsilon(ls.position);
        }
        sampled.beta = vec3_scale(ls.radiance, 1.0 / ls.pdf);
        sampled.pdf_fwd = pdf_light_origin(lights, sampled, pt);

        L = vec3_mul(vec3_mul(pt.beta, vertex_f(scene, pt, sampled, TransportMode::Radiance)), sampled.beta);
        if (pt.is_on_surface()) L = vec3_scale(L, std::fabs(vec3_dot(ls.wi, pt.normal)));
        if (!vec3_is_black(L) && !mutually_visible(scene, pt, sampled)) L = kBlack;
    } else {
        // General case: connect light vertex s-1 to camera vertex t-1
        const PathVertex& qs = light_path[s - 1];
        const PathVertex& pt = camera_path[t - 1];
        if (!qs.is_connectible(scene) || !pt.is_connectible(scene)) return kBlack;

        L = vec3_mul(vec3_mul(qs.beta, vertex_f(scene, qs, pt, TransportMode::Importance)),
                     vec3_mul(vertex_f(scene, pt, qs, TransportMode::Radiance), pt.beta));
        if (!vec3_is_black(L)) {
            L = vec3_scale(L, geometry_term(scene, qs, pt));
        }
    }

    if (vec3_is_black(L)) return kBlack;
    return vec3_scale(L, mis_weight(scene, lights, camera, light_path, camera_path, sampled, s, t));
}

double BDPTIntegrator::mis_weight(const Scene& scene, const LightDistribution& lights, const Camera& camera,
                                  const std::vector<PathVertex>& light_path,
                                  const std::vector<PathVertex>& camera_path,
                                  const PathVertex& sampled, int s, int t) const {
    if (s + t == 2) return 1.0;

    // An isolated strategy without MIS is its own unweighted estimator
    if (!settings_.use_mis && (settings_.debug_s >= 0 || settings_.debug_t >= 0)) return 1.0;

    // Copies of the connection vertices updated for this strategy
    PathVertex qs;
    PathVertex pt = (t == 1) ? sampled : camera_path[t - 1];
    PathVertex qs_minus;
    PathVertex pt_minus;
    if (s > 0) qs = (s == 1) ? sampled : light_path[s - 1];
    if (s > 1) qs_minus = light_path[s - 2];
    if (t > 1) pt_minus = camera_path[t - 2];

    // Connection vertices are never degenerate
    pt.delta = false;
    qs.delta = false;

    if (s > 0) {
        pt.pdf_rev = vertex_pdf(scene, lights, camera, qs, s > 1 ? &qs_minus : nullptr, pt);
        qs.pdf_rev = vertex_pdf(scene, lights, camera, pt, t > 1 ? &pt_minus : nullptr, qs);
    } else {
        pt.pdf_rev = pdf_light_origin(lights, pt, pt_minus);
    }
    if (t > 1) {
        pt_minus.pdf_rev = s > 0 ? vertex_pdf(scene, lights, camera, pt, &qs, pt_minus)
                                 : pdf_light(lights, pt, pt_minus);
    }
    if (s > 1) {
        qs_minus.pdf_rev = vertex_pdf(scene, lights, camera, qs, &pt, qs_minus);
    }

    auto camera_vertex = [&](int i) -> const PathVertex& {
        if (i == t - 1) return pt;
        if (i == t - 2) return pt_minus;
        return camera_path[i];
    };
    auto light_vertex = [&](int i) -> const PathVertex& {
        if (i == s - 1) return qs;
        if (i == s - 2) return qs_minus;
        return light_path[i];
    };

    const int max_light_vertices = light_depth() + 1;
    double sum_ri = 0.0;

    // Hypothetical strategies with fewer camera vertices
    double ri = 1.0;
    for (int i = t - 1; i > 0; --i) {
        ri *= remap0(camera_vertex(i).pdf_rev) / remap0(camera_vertex(i).pdf_fwd);
        bool available = (s + t - i) <= max_light_vertices && (i > 1 || settings_.light_tracing);
        if (available && !camera_vertex(i).delta && !camera_vertex(i - 1).delta) {
            sum_ri += settings_.use_mis ? ri * ri : 1.0;
        }
    }

    // Hypothetical strategies with fewer light vertices
    ri = 1.0;
    for (int i = s - 1; i >= 0; --i) {
        ri *= remap0(light_vertex(i).pdf_rev) / remap0(light_vertex(i).pdf_fwd);
        bool delta_light_vertex = i > 0 ? light_vertex(i - 1).delta
                                        : light_vertex(0).is_delta_light(lights);
        if (!light_vertex(i).delta && !delta_light_vertex) {
            sum_ri += settings_.use_mis ? ri * ri : 1.0;
        }
    }

    return 1.0 / (1.0 + sum_ri);
}

} // namespace lumen
