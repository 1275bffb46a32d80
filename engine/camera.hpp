/**
 * @file camera.hpp
 * @brief Pinhole camera with ray generation and importance queries
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
}

#include "sampling.hpp"
#include <cmath>

namespace lumen {

/**
 * @brief Pinhole camera
 *
 * Raster coordinates run over [0, width) x [0, height) with (0, 0) at the
 * top-left corner. The importance function is normalized over the image
 * plane so that camera rays carry unit weight and light tracing splats
 * are comparable with camera samples.
 */
class Camera {
public:
    Camera() : Camera({0, 0, 1}, {0, 0, 0}, {0, 1, 0}, 60.0, 1, 1) {}

    /**
     * @brief Create a camera with the given parameters
     * @param lookfrom Camera position
     * @param lookat Point to look at
     * @param vup View up vector
     * @param vfov Vertical field of view in degrees
     * @param width,height Film resolution in pixels
     */
    Camera(point3 lookfrom, point3 lookat, vec3 vup, double vfov, int width, int height)
        : width_(width), height_(height) {
        double theta = vfov * PI / 180.0;
        double h = std::tan(theta / 2.0);
        double aspect = static_cast<double>(width) / static_cast<double>(height);
        double viewport_height = 2.0 * h;
        double viewport_width = aspect * viewport_height;

        vec3 w = vec3_normalize(vec3_sub(lookfrom, lookat));
        u_ = vec3_normalize(vec3_cross(vup, w));
        v_ = vec3_cross(w, u_);
        forward_ = vec3_negate(w);

        origin_ = lookfrom;
        half_width_ = viewport_width / 2.0;
        half_height_ = viewport_height / 2.0;
        horizontal_ = vec3_scale(u_, viewport_width);
        vertical_down_ = vec3_scale(v_, -viewport_height);

        // upper_left = origin + forward - horizontal/2 + vertical/2 (at unit distance)
        upper_left_corner_ = vec3_sub(
            vec3_add(vec3_add(origin_, forward_), vec3_scale(v_, half_height_)),
            vec3_scale(u_, half_width_)
        );
        image_area_ = viewport_width * viewport_height;
    }

    int width() const { return width_; }
    int height() const { return height_; }
    point3 position() const { return origin_; }
    vec3 forward() const { return forward_; }

    /**
     * @brief Ray through a raster position
     */
    ray generate_ray(double raster_x, double raster_y) const {
        double s = raster_x / width_;
        double t = raster_y / height_;
        point3 target = vec3_add(
            vec3_add(upper_left_corner_, vec3_scale(horizontal_, s)),
            vec3_scale(vertical_down_, t)
        );
        return ray_create(origin_, vec3_normalize(vec3_sub(target, origin_)));
    }

    /**
     * @brief Project a world direction leaving the camera to raster coordinates
     * @return false if the direction does not pass through the image
     */
    bool raster_position(vec3 dir, double& raster_x, double& raster_y) const {
        double cos_theta = vec3_dot(dir, forward_);
        if (cos_theta <= 0.0) return false;

        double x = vec3_dot(dir, u_) / cos_theta;
        double y = vec3_dot(dir, v_) / cos_theta;
        raster_x = (x + half_width_) / (2.0 * half_width_) * width_;
        raster_y = (half_height_ - y) / (2.0 * half_height_) * height_;
        return raster_x >= 0.0 && raster_x < width_ && raster_y >= 0.0 && raster_y < height_;
    }

    /**
     * @brief Importance emitted along a direction leaving the camera
     */
    double we(vec3 dir, double& raster_x, double& raster_y) const {
        if (!raster_position(dir, raster_x, raster_y)) return 0.0;
        double cos_theta = vec3_dot(dir, forward_);
        double cos2 = cos_theta * cos_theta;
        return 1.0 / (image_area_ * cos2 * cos2);
    }

    /**
     * @brief Densities of generate_ray for a direction (pinhole: position is a delta)
     */
    void pdf_we(vec3 dir, double& pdf_pos, double& pdf_dir) const {
        double raster_x = 0.0;
        double raster_y = 0.0;
        pdf_pos = 0.0;
        pdf_dir = 0.0;
        if (!raster_position(dir, raster_x, raster_y)) return;
        double cos_theta = vec3_dot(dir, forward_);
        pdf_pos = 1.0;
        pdf_dir = 1.0 / (image_area_ * cos_theta * cos_theta * cos_theta);
    }

    /**
     * @brief Connect a scene point to the pinhole
     * @param ref Point in the scene
     * @param wi Receives the unit direction from ref towards the camera
     * @param distance Receives the distance to the camera
     * @param pdf Receives the density of this connection in solid angle at ref
     * @return Importance arriving at ref, zero if the point is not visible on the film
     */
    double sample_wi(point3 ref, vec3& wi, double& distance, double& pdf,
                     double& raster_x, double& raster_y) const {
        vec3 d = vec3_sub(origin_, ref);
        double dist2 = vec3_length_squared(d);
        if (dist2 <= 0.0) return 0.0;
        distance = std::sqrt(dist2);
        wi = vec3_scale(d, 1.0 / distance);

        vec3 dir_from_camera = vec3_negate(wi);
        double cos_theta = vec3_dot(dir_from_camera, forward_);
        if (cos_theta <= 0.0) return 0.0;

        pdf = dist2 / cos_theta;
        return we(dir_from_camera, raster_x, raster_y);
    }

private:
    int width_ = 1;
    int height_ = 1;
    point3 origin_ = {0, 0, 0};
    vec3 u_ = {1, 0, 0};
    vec3 v_ = {0, 1, 0};
    vec3 forward_ = {0, 0, -1};
    point3 upper_left_corner_ = {0, 0, 0};
    vec3 horizontal_ = {0, 0, 0};
    vec3 vertical_down_ = {0, 0, 0};
    double half_width_ = 1.0;
    double half_height_ = 1.0;
    double image_area_ = 1.0;
};

} // namespace lumen
