/**
 * @file light.cpp
 * @brief Light distribution sampling
 */

#include "light.hpp"
#include <algorithm>

namespace lumen {

void LightDistribution::build(const std::vector<Triangle>& triangles, const std::vector<Material>& materials,
                              const std::vector<PointLight>& point_lights) {
    lights_.clear();
    cdf_.clear();
    prim_to_light_.assign(triangles.size(), -1);

    std::vector<Light> candidates;
    for (int i = 0; i < static_cast<int>(triangles.size()); ++i) {
        const Triangle& tri = triangles[i];
        if (tri.material_id < 0 || tri.material_id >= static_cast<int>(materials.size())) continue;
        const Material& mat = materials[tri.material_id];
        if (!mat.is_emissive() || tri.area <= 0.0) continue;

        Light light;
        light.type = LightType::Area;
        light.prim_id = i;
        light.v0 = tri.v0;
        light.edge1 = tri.edge1;
        light.edge2 = tri.edge2;
        light.normal = tri.geo_normal;
        light.area = tri.area;
        light.radiance = mat.emission;
        candidates.push_back(light);
    }

    for (const PointLight& pl : point_lights) {
        Light light;
        light.type = LightType::Point;
        light.position = pl.position;
        light.radiance = pl.intensity;
        candidates.push_back(light);
    }

    double total = 0.0;
    for (const Light& light : candidates) {
        double p = light.power();
        if (!(p > 0.0) || !std::isfinite(p)) continue;
        total += p;
        if (light.prim_id >= 0) {
            prim_to_light_[light.prim_id] = static_cast<int>(lights_.size());
        }
        lights_.push_back(light);
        cdf_.push_back(total);
    }

    for (double& c : cdf_) {
        c /= total;
    }
    if (!cdf_.empty()) {
        cdf_.back() = 1.0;
    }
}

LightDistribution LightDistribution::single_point(point3 position, color intensity) {
    LightDistribution distribution;
    distribution.build({}, {}, {PointLight{position, intensity}});
    return distribution;
}

int LightDistribution::choose(double u, double& pmf) const {
    if (lights_.empty()) {
        pmf = 0.0;
        return -1;
    }
    auto it = std::upper_bound(cdf_.begin(), cdf_.end(), u);
    int index = static_cast<int>(std::min<std::ptrdiff_t>(it - cdf_.begin(), cdf_.size() - 1));
    pmf = this->pmf(index);
    return index;
}

double LightDistribution::pmf(int index) const {
    if (index < 0 || index >= static_cast<int>(cdf_.size())) return 0.0;
    return index == 0 ? cdf_[0] : cdf_[index] - cdf_[index - 1];
}

bool LightDistribution::sample_li(point3 p, Sampler& sampler, LightSample& out) const {
    double pmf = 0.0;
    int index = choose(sampler.next(), pmf);
    if (index < 0 || pmf <= 0.0) return false;

    const Light& light = lights_[index];
    double u1 = sampler.next();
    double u2 = sampler.next();

    out.light_index = index;
    out.is_delta = light.is_delta();

    if (light.type == LightType::Point) {
        vec3 d = vec3_sub(light.position, p);
        double dist2 = vec3_length_squared(d);
        if (dist2 <= 0.0) return false;
        out.distance = std::sqrt(dist2);
        out.wi = vec3_scale(d, 1.0 / out.distance);
        out.position = light.position;
        out.normal = vec3_zero();
        out.radiance = vec3_scale(light.radiance, 1.0 / dist2);
        out.pdf = pmf;
        return true;
    }

    point3 pos = light.sample_position(u1, u2);
    vec3 d = vec3_sub(pos, p);
    double dist2 = vec3_length_squared(d);
    if (dist2 <= 0.0) return false;
    out.distance = std::sqrt(dist2);
    out.wi = vec3_scale(d, 1.0 / out.distance);

    // One-sided emitter facing away
    double cos_light = -vec3_dot(light.normal, out.wi);
    if (cos_light <= 0.0) return false;

    out.position = pos;
    out.normal = light.normal;
    out.radiance = light.radiance;
    out.pdf = pmf * dist2 / (cos_light * light.area);
    return std::isfinite(out.pdf) && out.pdf > 0.0;
}

double LightDistribution::pdf_li(point3 p, int prim_id, point3 light_point) const {
    int index = light_of_prim(prim_id);
    if (index < 0) return 0.0;
    const Light& light = lights_[index];
    return pmf(index) * area_to_solid_angle(1.0 / light.area, p, light_point, light.normal);
}

bool LightDistribution::sample_le(Sampler& sampler, EmissionSample& out) const {
    double pmf = 0.0;
    int index = choose(sampler.next(), pmf);
    if (index < 0 || pmf <= 0.0) return false;

    const Light& light = lights_[index];
    double u1 = sampler.next();
    double u2 = sampler.next();
    double u3 = sampler.next();
    double u4 = sampler.next();

    out.light_index = index;
    out.pdf_choice = pmf;
    out.radiance = light.radiance;

    if (light.type == LightType::Point) {
        vec3 dir = sample_uniform_sphere(u1, u2);
        out.r = ray_create(light.position, dir);
        out.position = light.position;
        out.normal = dir;
        out.pdf_pos = 1.0;
        out.pdf_dir = INV_4PI;
        return true;
    }

    point3 pos = light.sample_position(u1, u2);
    vec3 local = sample_cosine_hemisphere(u3, u4);
    if (local.z <= 0.0) return false;

    Frame frame(light.normal);
    vec3 dir = frame.to_world(local);
    double eps = RAY_EPSILON_SCALE * (1.0 + vec3_max_abs_component(pos));

    out.r = ray_create(vec3_fma(pos, light.normal, eps), dir);
    out.position = pos;
    out.normal = light.normal;
    out.pdf_pos = 1.0 / light.area;
    out.pdf_dir = cosine_hemisphere_pdf(local.z);
    return out.pdf_dir > 0.0;
}

void LightDistribution::pdf_le(int light_index, vec3 dir, double& pdf_pos, double& pdf_dir) const {
    pdf_pos = 0.0;
    pdf_dir = 0.0;
    if (light_index < 0 || light_index >= size()) return;

    const Light& light = lights_[light_index];
    if (light.type == LightType::Point) {
        pdf_dir = INV_4PI;
        return;
    }
    pdf_pos = 1.0 / light.area;
    pdf_dir = cosine_hemisphere_pdf(vec3_dot(light.normal, dir));
}

} // namespace lumen
