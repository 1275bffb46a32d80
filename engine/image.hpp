/**
 * @file image.hpp
 * @brief Tone mapping and image file output
 */

#pragma once

#include "film.hpp"
#include <string>

namespace lumen {

/**
 * @brief Tone mapping operators
 */
enum class ToneMapper {
    None,       // Clamp to [0, 1]
    Reinhard,   // L / (1 + L)
    ACES        // ACES filmic approximation
};

/**
 * @brief Apply exposure and tone mapping to all pixels (in-place)
 */
void apply_tone_mapping(Image& image, ToneMapper mapper, double exposure = 1.0);

/**
 * @brief Write a tone-mapped image as binary PPM with sRGB encoding
 */
bool write_ppm(const Image& image, const std::string& filename);

/**
 * @brief Write a tone-mapped image as PNG with sRGB encoding
 */
bool write_png(const Image& image, const std::string& filename);

/**
 * @brief Pick the writer from the file extension (.png, otherwise PPM)
 */
bool write_image(const Image& image, const std::string& filename);

} // namespace lumen
