/**
 * @file image.cpp
 * @brief Tone mapping operators and PPM/PNG output
 */

#include "image.hpp"
#include "stb_image_write.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <vector>

namespace lumen {

namespace {

// ==================== Tone Mapping Operators ====================

inline double reinhard(double x) {
    return x / (1.0 + x);
}

/**
 * @brief ACES Filmic approximation (Krzysztof Narkowicz)
 */
inline double aces_filmic(double x) {
    const double a = 2.51;
    const double b = 0.03;
    const double c = 2.43;
    const double d = 0.59;
    const double e = 0.14;
    return std::clamp((x * (a * x + b)) / (x * (c * x + d) + e), 0.0, 1.0);
}

color tone_map(color c, ToneMapper mapper) {
    switch (mapper) {
        case ToneMapper::Reinhard:
            return {reinhard(c.x), reinhard(c.y), reinhard(c.z)};
        case ToneMapper::ACES:
            return {aces_filmic(c.x), aces_filmic(c.y), aces_filmic(c.z)};
        case ToneMapper::None:
        default:
            return vec3_clamp(c, 0.0, 1.0);
    }
}

inline unsigned char encode_srgb(double linear) {
    double v = std::clamp(linear, 0.0, 1.0);
    v = v <= 0.0031308 ? 12.92 * v : 1.055 * std::pow(v, 1.0 / 2.4) - 0.055;
    return static_cast<unsigned char>(std::min(255.0, 256.0 * v));
}

std::vector<unsigned char> to_rgb8(const Image& image) {
    std::vector<unsigned char> data(static_cast<size_t>(image.width) * image.height * 3);
    for (size_t i = 0; i < image.pixels.size(); ++i) {
        color c = image.pixels[i];
        data[i * 3 + 0] = encode_srgb(c.x);
        data[i * 3 + 1] = encode_srgb(c.y);
        data[i * 3 + 2] = encode_srgb(c.z);
    }
    return data;
}

} // namespace

void apply_tone_mapping(Image& image, ToneMapper mapper, double exposure) {
    for (color& c : image.pixels) {
        c = tone_map(vec3_scale(c, exposure), mapper);
    }
}

// ==================== Image Output ====================

bool write_ppm(const Image& image, const std::string& filename) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    // Rows are stored top to bottom, as PPM expects
    std::vector<unsigned char> data = to_rgb8(image);
    file << "P6\n" << image.width << ' ' << image.height << "\n255\n";
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(file);
}

bool write_png(const Image& image, const std::string& filename) {
    std::vector<unsigned char> data = to_rgb8(image);
    return stbi_write_png(filename.c_str(), image.width, image.height, 3, data.data(), image.width * 3) != 0;
}

bool write_image(const Image& image, const std::string& filename) {
    if (filename.size() >= 4 && filename.substr(filename.size() - 4) == ".png") {
        return write_png(image, filename);
    }
    return write_ppm(image, filename);
}

} // namespace lumen
