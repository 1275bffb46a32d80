/**
 * @file bvh.cpp
 * @brief BVH construction
 */

#include "bvh.hpp"
#include <array>

namespace lumen {

void BVH::build(std::vector<BVHPrimitive> prims) {
    nodes.clear();
    prim_indices.clear();
    depth_ = 0;

    if (prims.empty()) {
        nodes.emplace_back();
        return;
    }

    nodes.reserve(prims.size() * 2);
    build_recursive(prims, 0, static_cast<int>(prims.size()), 0);

    prim_indices.reserve(prims.size());
    for (const BVHPrimitive& p : prims) {
        prim_indices.push_back(p.index);
    }
}

int BVH::build_recursive(std::vector<BVHPrimitive>& prims, int start, int end, int depth) {
    int node_idx = static_cast<int>(nodes.size());
    nodes.emplace_back();

    AABB bounds;
    AABB centroid_bounds;
    for (int i = start; i < end; ++i) {
        bounds.expand(prims[i].bounds);
        centroid_bounds.expand(prims[i].centroid);
    }
    nodes[node_idx].bounds = bounds;
    depth_ = std::max(depth_, depth);

    int count = end - start;
    auto make_leaf = [&]() {
        nodes[node_idx].prim_offset = start;
        nodes[node_idx].prim_count = count;
        return node_idx;
    };

    if (count <= std::max(1, settings_.max_leaf_size)) {
        return make_leaf();
    }

    int axis = centroid_bounds.longest_axis();
    double extent = vec3_axis(centroid_bounds.max_pt, axis) - vec3_axis(centroid_bounds.min_pt, axis);

    int mid;
    if (!(extent > 0.0)) {
        // Coincident (or non-finite) centroids: nothing to sort by
        mid = start + count / 2;
    } else if (depth >= kMedianDepth) {
        mid = split_object_median(prims, start, end, axis);
    } else {
        switch (settings_.split_mode) {
            case SplitMode::ObjectMedian:
                mid = split_object_median(prims, start, end, axis);
                break;
            case SplitMode::SpatialMedian:
                mid = split_spatial_median(prims, start, end, centroid_bounds, axis);
                break;
            case SplitMode::SAH:
            default: {
                bool leaf = false;
                mid = split_sah(prims, start, end, bounds, centroid_bounds, axis, leaf);
                if (leaf) return make_leaf();
                break;
            }
        }
    }

    int left_idx = build_recursive(prims, start, mid, depth + 1);
    int right_idx = build_recursive(prims, mid, end, depth + 1);

    // Re-index: the vector may have reallocated during recursion
    nodes[node_idx].left = left_idx;
    nodes[node_idx].right = right_idx;
    nodes[node_idx].axis = axis;
    return node_idx;
}

int BVH::split_sah(std::vector<BVHPrimitive>& prims, int start, int end,
                   const AABB& bounds, const AABB& centroid_bounds, int axis, bool& make_leaf) const {
    int count = end - start;
    double parent_area = bounds.surface_area();
    if (!(parent_area > 0.0)) {
        // Zero-area node (degenerate or collinear triangles)
        return split_object_median(prims, start, end, axis);
    }

    const int bucket_count = std::clamp(settings_.bucket_count, 2, kMaxBuckets);
    const double cmin = vec3_axis(centroid_bounds.min_pt, axis);
    const double extent = vec3_axis(centroid_bounds.max_pt, axis) - cmin;

    auto bucket_of = [&](const BVHPrimitive& p) {
        double offset = (vec3_axis(p.centroid, axis) - cmin) / extent;
        if (!(offset >= 0.0)) offset = 0.0;
        if (offset > 1.0) offset = 1.0;
        return std::min(bucket_count - 1, static_cast<int>(offset * bucket_count));
    };

    struct Bucket {
        int count = 0;
        AABB bounds;
    };
    std::array<Bucket, kMaxBuckets> buckets{};
    for (int i = start; i < end; ++i) {
        Bucket& b = buckets[bucket_of(prims[i])];
        b.count++;
        b.bounds.expand(prims[i].bounds);
    }

    // Sweep from the right to get the area and count of every right side
    std::array<double, kMaxBuckets> right_area{};
    std::array<int, kMaxBuckets> right_count{};
    AABB acc;
    int acc_count = 0;
    for (int i = bucket_count - 1; i > 0; --i) {
        acc.expand(buckets[i].bounds);
        acc_count += buckets[i].count;
        right_area[i] = acc.surface_area();
        right_count[i] = acc_count;
    }

    double best_cost = std::numeric_limits<double>::infinity();
    int best_split = -1;
    AABB left;
    int left_count = 0;
    for (int i = 0; i < bucket_count - 1; ++i) {
        left.expand(buckets[i].bounds);
        left_count += buckets[i].count;
        if (left_count == 0 || right_count[i + 1] == 0) continue;

        double cost = settings_.traversal_cost +
            (left.surface_area() * left_count + right_area[i + 1] * right_count[i + 1]) / parent_area;
        if (cost < best_cost) {
            best_cost = cost;
            best_split = i;
        }
    }

    double leaf_cost = static_cast<double>(count);
    if (best_split < 0 || (best_cost >= leaf_cost && count <= settings_.max_sah_leaf_size)) {
        if (count <= settings_.max_sah_leaf_size) {
            make_leaf = true;
            return start;
        }
        return split_object_median(prims, start, end, axis);
    }

    auto it = std::partition(prims.begin() + start, prims.begin() + end,
        [&](const BVHPrimitive& p) { return bucket_of(p) <= best_split; });
    int mid = static_cast<int>(it - prims.begin());
    if (mid == start || mid == end) {
        return split_object_median(prims, start, end, axis);
    }
    return mid;
}

int BVH::split_object_median(std::vector<BVHPrimitive>& prims, int start, int end, int axis) const {
    int mid = start + (end - start) / 2;
    std::nth_element(
        prims.begin() + start,
        prims.begin() + mid,
        prims.begin() + end,
        [axis](const BVHPrimitive& a, const BVHPrimitive& b) {
            return vec3_axis(a.centroid, axis) < vec3_axis(b.centroid, axis);
        }
    );
    return mid;
}

int BVH::split_spatial_median(std::vector<BVHPrimitive>& prims, int start, int end,
                              const AABB& centroid_bounds, int axis) const {
    double pivot = vec3_axis(centroid_bounds.centroid(), axis);
    auto it = std::partition(prims.begin() + start, prims.begin() + end,
        [&](const BVHPrimitive& p) { return vec3_axis(p.centroid, axis) < pivot; });
    int mid = static_cast<int>(it - prims.begin());
    if (mid == start || mid == end) {
        return split_object_median(prims, start, end, axis);
    }
    return mid;
}

double BVH::sah_cost() const {
    if (nodes.empty()) return 0.0;
    double root_area = nodes[0].bounds.surface_area();
    if (root_area <= 0.0) return 0.0;

    double cost = 0.0;
    for (const BVHNode& node : nodes) {
        double rel = node.bounds.surface_area() / root_area;
        if (node.is_leaf()) {
            cost += rel * node.prim_count;
        } else {
            cost += settings_.traversal_cost * rel;
        }
    }
    return cost;
}

int BVH::leaf_count() const {
    int leaves = 0;
    for (const BVHNode& node : nodes) {
        if (node.is_leaf()) ++leaves;
    }
    return leaves;
}

} // namespace lumen
