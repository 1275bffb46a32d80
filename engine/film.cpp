/**
 * @file film.cpp
 * @brief Film accumulation and normalization
 */

#include "film.hpp"
#include <algorithm>
#include <cmath>

namespace lumen {

Film::Film(int width, int height)
    : width_(std::max(width, 1)), height_(std::max(height, 1)) {
    size_t n = static_cast<size_t>(width_) * height_;
    sums_.assign(n, color{0.0, 0.0, 0.0});
    counts_.assign(n, 0);
    splats_.assign(n, color{0.0, 0.0, 0.0});
}

void Film::add_tile(const FilmTile& tile) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (int y = tile.y0_; y < tile.y1_; ++y) {
        for (int x = tile.x0_; x < tile.x1_; ++x) {
            size_t src = tile.index(x, y);
            size_t dst = static_cast<size_t>(y) * width_ + x;
            sums_[dst] = vec3_add(sums_[dst], tile.sums_[src]);
            counts_[dst] += tile.counts_[src];
            total_samples_ += tile.counts_[src];
        }
    }

    for (const Splat& splat : tile.splats_) {
        int x = static_cast<int>(std::floor(splat.x));
        int y = static_cast<int>(std::floor(splat.y));
        if (x < 0 || x >= width_ || y < 0 || y >= height_) continue;
        size_t dst = static_cast<size_t>(y) * width_ + x;
        splats_[dst] = vec3_add(splats_[dst], splat.value);
    }
}

Image Film::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Image image(width_, height_);
    double splat_scale = total_samples_ > 0
        ? static_cast<double>(width_) * height_ / static_cast<double>(total_samples_)
        : 0.0;

    for (size_t i = 0; i < image.pixels.size(); ++i) {
        color c = {0.0, 0.0, 0.0};
        if (counts_[i] > 0) {
            c = vec3_scale(sums_[i], 1.0 / static_cast<double>(counts_[i]));
        }
        image.pixels[i] = vec3_fma(c, splats_[i], splat_scale);
    }
    return image;
}

void Film::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fill(sums_.begin(), sums_.end(), color{0.0, 0.0, 0.0});
    std::fill(counts_.begin(), counts_.end(), 0);
    std::fill(splats_.begin(), splats_.end(), color{0.0, 0.0, 0.0});
    total_samples_ = 0;
}

uint64_t Film::total_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_samples_;
}

} // namespace lumen
