/**
 * @file film.hpp
 * @brief Progressive, thread-safe radiance accumulator
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include <vector>
#include <mutex>
#include <cstdint>

namespace lumen {

/**
 * @brief Light tracing contribution for an arbitrary pixel
 */
struct Splat {
    double x;       // Raster position
    double y;
    color value;
};

/**
 * @brief Image buffer of linear radiance
 */
struct Image {
    int width = 0;
    int height = 0;
    std::vector<color> pixels;

    Image() = default;
    Image(int w, int h) : width(w), height(h), pixels(static_cast<size_t>(w) * h, color{0.0, 0.0, 0.0}) {}

    void set_pixel(int x, int y, color c) {
        pixels[static_cast<size_t>(y) * width + x] = c;
    }

    color get_pixel(int x, int y) const {
        return pixels[static_cast<size_t>(y) * width + x];
    }
};

/**
 * @brief Private accumulation buffer for one rectangle of pixels
 *
 * A worker fills a tile without synchronization and hands it to
 * Film::add_tile(). Splats may land anywhere on the film, so they are
 * collected separately and carry their own raster position.
 */
class FilmTile {
public:
    FilmTile(int x0, int y0, int x1, int y1)
        : x0_(x0), y0_(y0), x1_(x1), y1_(y1),
          sums_(static_cast<size_t>(x1 - x0) * (y1 - y0), color{0.0, 0.0, 0.0}),
          counts_(static_cast<size_t>(x1 - x0) * (y1 - y0), 0) {}

    /**
     * @brief Add a camera sample to a pixel inside the tile
     *
     * Non-finite samples are counted but contribute nothing.
     */
    void add_sample(int x, int y, color L) {
        size_t i = index(x, y);
        if (vec3_is_finite(L)) {
            sums_[i] = vec3_add(sums_[i], L);
        }
        ++counts_[i];
    }

    void add_splat(const Splat& splat) {
        if (vec3_is_finite(splat.value)) {
            splats_.push_back(splat);
        }
    }

    void add_splats(const std::vector<Splat>& splats) {
        for (const Splat& s : splats) add_splat(s);
    }

    int x0() const { return x0_; }
    int y0() const { return y0_; }
    int x1() const { return x1_; }
    int y1() const { return y1_; }

private:
    friend class Film;

    size_t index(int x, int y) const {
        return static_cast<size_t>(y - y0_) * (x1_ - x0_) + (x - x0_);
    }

    int x0_, y0_, x1_, y1_;
    std::vector<color> sums_;
    std::vector<uint32_t> counts_;
    std::vector<Splat> splats_;
};

/**
 * @brief Film shared by all render workers
 *
 * Camera samples are averaged per pixel. Light tracing splats are summed
 * and scaled by pixel_count / total_samples, since every camera sample
 * traced one light subpath that could splat anywhere on the image.
 */
class Film {
public:
    Film(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    /**
     * @brief Merge a finished tile (thread-safe)
     */
    void add_tile(const FilmTile& tile);

    /**
     * @brief Consistent normalized image (thread-safe)
     */
    Image snapshot() const;

    /**
     * @brief Reset all accumulated samples (thread-safe)
     */
    void clear();

    uint64_t total_samples() const;

private:
    int width_;
    int height_;
    mutable std::mutex mutex_;
    std::vector<color> sums_;
    std::vector<uint64_t> counts_;
    std::vector<color> splats_;
    uint64_t total_samples_ = 0;
};

} // namespace lumen
