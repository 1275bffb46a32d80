/**
 * @file texture.hpp
 * @brief Image textures for albedo and normal maps
 *
 * Texels are stored as linear colors, row 0 at the top of the image.
 * Lookups are bilinear and repeat outside [0, 1]; v = 0 is the bottom
 * row, matching the usual OBJ/glTF convention.
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include <cmath>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lumen {

/**
 * @brief Image texture
 */
struct Texture {
    int width = 0;
    int height = 0;
    std::vector<color> texels;

    /**
     * @brief Wrap linear texels given in row-major order
     */
    static Texture from_pixels(int width, int height, std::vector<color> texels) {
        Texture tex;
        tex.width = width;
        tex.height = height;
        tex.texels = std::move(texels);
        return tex;
    }

    /**
     * @brief Load an albedo map (PNG, JPG, BMP, TGA, ...) and decode sRGB to linear
     * @return nullptr if the file cannot be read
     */
    static std::shared_ptr<const Texture> load_image(const std::string& filename);

    /**
     * @brief Load a tangent-space normal map
     *
     * Gray scale images are treated as bump (height) maps and converted
     * to normal maps.
     * @return nullptr if the file cannot be read
     */
    static std::shared_ptr<const Texture> load_normal_map(const std::string& filename);

    /**
     * @brief Normal map from a height map using central differences
     * @param height Height in the x channel
     * @param z_scale Z component before normalization; smaller values give stronger relief
     */
    static Texture height_to_normal(const Texture& height, double z_scale = 0.1) {
        Texture nm;
        nm.width = height.width;
        nm.height = height.height;
        nm.texels.resize(height.texels.size());
        if (!height.valid()) return nm;

        auto h = [&height](int x, int y) { return height.texel(x, y).x; };

        for (int y = 0; y < height.height; ++y) {
            for (int x = 0; x < height.width; ++x) {
                int xl = x > 0 ? x - 1 : x;
                int xr = x < height.width - 1 ? x + 1 : x;
                int yu = y > 0 ? y - 1 : y;
                int yd = y < height.height - 1 ? y + 1 : y;
                double dx = xr > xl ? (h(xr, y) - h(xl, y)) / (xr - xl) : 0.0;
                double dy = yd > yu ? (h(x, yd) - h(x, yu)) / (yd - yu) : 0.0;

                vec3 n = vec3_normalize({-dx, -dy, z_scale});
                nm.texels[static_cast<size_t>(y) * nm.width + x] = vec3_add(vec3_scale(n, 0.5), vec3_splat(0.5));
            }
        }
        return nm;
    }

    bool valid() const {
        return width > 0 && height > 0 && texels.size() == static_cast<size_t>(width) * height;
    }

    color texel(int x, int y) const {
        return texels[static_cast<size_t>(y) * width + x];
    }

    /**
     * @brief Bilinear lookup with repeat wrapping
     */
    color sample(double u, double v) const {
        if (!valid()) {
            return {1.0, 0.0, 1.0};  // Magenta for missing data
        }
        if (!std::isfinite(u) || !std::isfinite(v)) {
            return texel(0, 0);
        }

        double fx = u * width - 0.5;
        double fy = (1.0 - v) * height - 0.5;  // Flip V for image rows
        double x_floor = std::floor(fx);
        double y_floor = std::floor(fy);
        double tx = fx - x_floor;
        double ty = fy - y_floor;

        int x0 = wrap(x_floor, width);
        int y0 = wrap(y_floor, height);
        int x1 = x0 + 1 < width ? x0 + 1 : 0;
        int y1 = y0 + 1 < height ? y0 + 1 : 0;

        color c0 = vec3_lerp(texel(x0, y0), texel(x1, y0), tx);
        color c1 = vec3_lerp(texel(x0, y1), texel(x1, y1), tx);
        return vec3_lerp(c0, c1, ty);
    }

    /**
     * @brief Tangent-space normal stored as (n + 1) / 2
     */
    vec3 sample_normal(double u, double v) const {
        vec3 n = vec3_sub(vec3_scale(sample(u, v), 2.0), vec3_splat(1.0));
        double len2 = vec3_length_squared(n);
        if (!(len2 > 0.0)) return {0.0, 0.0, 1.0};
        return vec3_scale(n, 1.0 / std::sqrt(len2));
    }

private:
    static int wrap(double i, int n) {
        double m = std::fmod(i, static_cast<double>(n));
        if (m < 0.0) m += n;
        int k = static_cast<int>(m);
        return k < n ? k : 0;
    }
};

} // namespace lumen
