/**
 * @file texture.cpp
 * @brief Texture loading through stb_image
 */

#include "texture.hpp"
#include "stb_image.h"
#include <iostream>

namespace lumen {

namespace {

double decode_srgb(unsigned char value) {
    double c = value / 255.0;
    return c <= 0.04045 ? c / 12.92 : std::pow((c + 0.055) / 1.055, 2.4);
}

/**
 * @brief Read an 8-bit image as RGB
 * @param gray Receives true if the file has a single (or gray plus alpha) channel
 */
bool read_rgb(const std::string& filename, bool srgb, Texture& tex, bool& gray) {
    int width = 0;
    int height = 0;
    int channels = 0;
    unsigned char* data = stbi_load(filename.c_str(), &width, &height, &channels, 3);
    if (!data) {
        std::cerr << "Error: Could not load texture: " << filename
                  << " (" << stbi_failure_reason() << ")" << std::endl;
        return false;
    }

    tex.width = width;
    tex.height = height;
    tex.texels.resize(static_cast<size_t>(width) * height);
    for (size_t i = 0; i < tex.texels.size(); ++i) {
        const unsigned char* p = data + i * 3;
        if (srgb) {
            tex.texels[i] = {decode_srgb(p[0]), decode_srgb(p[1]), decode_srgb(p[2])};
        } else {
            tex.texels[i] = {p[0] / 255.0, p[1] / 255.0, p[2] / 255.0};
        }
    }
    stbi_image_free(data);

    gray = channels <= 2;
    std::cout << "Loaded texture: " << filename << " (" << width << "x" << height << ")" << std::endl;
    return true;
}

/**
 * @brief RGB files whose sampled pixels are all gray are bump maps too
 */
bool looks_gray(const Texture& tex) {
    const int points[3][2] = {{0, 0}, {tex.width / 2, tex.height / 2}, {tex.width / 4, tex.height / 3}};
    for (const auto& p : points) {
        color c = tex.texel(p[0], p[1]);
        if (c.x != c.y || c.y != c.z) return false;
    }
    return true;
}

} // namespace

std::shared_ptr<const Texture> Texture::load_image(const std::string& filename) {
    auto tex = std::make_shared<Texture>();
    bool gray = false;
    if (!read_rgb(filename, true, *tex, gray)) return nullptr;
    return tex;
}

std::shared_ptr<const Texture> Texture::load_normal_map(const std::string& filename) {
    Texture tex;
    bool gray = false;
    if (!read_rgb(filename, false, tex, gray)) return nullptr;

    if (gray || looks_gray(tex)) {
        std::cout << "Converting bump map to normal map: " << filename << std::endl;
        return std::make_shared<Texture>(height_to_normal(tex));
    }
    return std::make_shared<Texture>(std::move(tex));
}

} // namespace lumen
