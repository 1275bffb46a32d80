/**
 * @file bvh.hpp
 * @brief Bounding Volume Hierarchy for ray tracing acceleration
 *
 * The tree is a flat array of nodes addressed by index. Leaves own a
 * contiguous range of prim_indices, which maps back to the caller's
 * primitive ids. The structure is geometry agnostic: traversal takes a
 * callable that intersects one primitive.
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include <vector>
#include <algorithm>
#include <cmath>
#include <limits>

namespace lumen {

/**
 * @brief Axis-Aligned Bounding Box
 */
struct AABB {
    point3 min_pt = {1e30, 1e30, 1e30};
    point3 max_pt = {-1e30, -1e30, -1e30};

    AABB() = default;
    AABB(point3 a, point3 b) : min_pt(a), max_pt(b) {}

    /**
     * @brief Slab test against [t_min, t_max]
     *
     * The far distance of every slab is widened by a few ulps so that
     * flat boxes and primitives lying on a box face are not missed.
     * @param inv_dir Component-wise reciprocal of the ray direction
     * @param t_entry Receives the entry distance on a hit
     */
    bool hit(const ray& r, vec3 inv_dir, double t_min, double t_max, double& t_entry) const {
        constexpr double eps = std::numeric_limits<double>::epsilon() * 0.5;
        constexpr double widen = 1.0 + 2.0 * (3.0 * eps) / (1.0 - 3.0 * eps);

        for (int axis = 0; axis < 3; ++axis) {
            double inv_d = vec3_axis(inv_dir, axis);
            double o = vec3_axis(r.origin, axis);
            double t0 = (vec3_axis(min_pt, axis) - o) * inv_d;
            double t1 = (vec3_axis(max_pt, axis) - o) * inv_d;
            if (inv_d < 0.0) std::swap(t0, t1);
            t1 *= widen;
            t_min = t0 > t_min ? t0 : t_min;
            t_max = t1 < t_max ? t1 : t_max;
            if (t_min > t_max) return false;
        }
        t_entry = t_min;
        return true;
    }

    /**
     * @brief Expand this AABB to include a point
     */
    void expand(point3 p) {
        min_pt = vec3_min(min_pt, p);
        max_pt = vec3_max(max_pt, p);
    }

    /**
     * @brief Expand this AABB to include another AABB
     */
    void expand(const AABB& other) {
        min_pt = vec3_min(min_pt, other.min_pt);
        max_pt = vec3_max(max_pt, other.max_pt);
    }

    bool is_empty() const {
        return min_pt.x > max_pt.x || min_pt.y > max_pt.y || min_pt.z > max_pt.z;
    }

    bool contains(const AABB& other) const {
        return min_pt.x <= other.min_pt.x && min_pt.y <= other.min_pt.y && min_pt.z <= other.min_pt.z &&
               max_pt.x >= other.max_pt.x && max_pt.y >= other.max_pt.y && max_pt.z >= other.max_pt.z;
    }

    /**
     * @brief Get centroid of the AABB
     */
    point3 centroid() const {
        return vec3_scale(vec3_add(min_pt, max_pt), 0.5);
    }

    double surface_area() const {
        if (is_empty()) return 0.0;
        vec3 d = vec3_sub(max_pt, min_pt);
        return 2.0 * (d.x * d.y + d.y * d.z + d.z * d.x);
    }

    /**
     * @brief Get the longest axis (0=x, 1=y, 2=z)
     */
    int longest_axis() const {
        double dx = max_pt.x - min_pt.x;
        double dy = max_pt.y - min_pt.y;
        double dz = max_pt.z - min_pt.z;
        if (dx > dy && dx > dz) return 0;
        if (dy > dz) return 1;
        return 2;
    }
};

/**
 * @brief Primitive reference for BVH building
 */
struct BVHPrimitive {
    AABB bounds;
    point3 centroid;
    int index;      // Caller's primitive id
};

/**
 * @brief BVH Node
 */
struct BVHNode {
    AABB bounds;
    int left = -1;       // Index of left child (-1 if leaf)
    int right = -1;      // Index of right child
    int prim_offset = 0; // Start index in prim_indices
    int prim_count = 0;  // Number of primitives in a leaf
    int axis = 0;        // Split axis of an interior node

    bool is_leaf() const { return left < 0; }
};

/**
 * @brief How interior nodes choose their split plane
 */
enum class SplitMode {
    SAH,            // Bucketed surface area heuristic
    ObjectMedian,   // Equal primitive counts on both sides
    SpatialMedian   // Midpoint of the centroid bounds
};

/**
 * @brief BVH acceleration structure
 */
class BVH {
public:
    /**
     * @brief Build settings
     */
    struct Settings {
        SplitMode split_mode = SplitMode::SAH;
        int max_leaf_size = 4;        // Nodes with at most this many primitives become leaves
        int max_sah_leaf_size = 32;   // Nodes above this size are always split
        int bucket_count = 12;        // SAH candidate buckets
        double traversal_cost = 0.125;// Split overhead relative to one intersection
    };

    static constexpr int kMaxBuckets = 32;
    static constexpr int kMedianDepth = 48;   // Forced median splits below this depth
    static constexpr int kStackSize = 128;

    std::vector<BVHNode> nodes;
    std::vector<int> prim_indices;

    BVH() = default;
    explicit BVH(const Settings& settings) : settings_(settings) {}

    /**
     * @brief Build the tree; an empty input yields a single empty leaf
     */
    void build(std::vector<BVHPrimitive> prims);

    /**
     * @brief Closest intersection along the ray
     *
     * intersect(prim_id, ray, t_min, t_max, rec) must return true and fill
     * rec only for a hit inside [t_min, t_max].
     */
    template <typename IntersectFn>
    bool closest_hit(const ray& r, hit_record& rec, IntersectFn&& intersect) const {
        if (nodes.empty()) return false;

        vec3 inv_dir = {1.0 / r.direction.x, 1.0 / r.direction.y, 1.0 / r.direction.z};
        const bool dir_neg[3] = {inv_dir.x < 0.0, inv_dir.y < 0.0, inv_dir.z < 0.0};

        struct StackEntry {
            int node;
            double t_entry;
        };
        StackEntry stack[kStackSize];
        int sp = 0;

        double closest = r.t_max;
        bool hit_anything = false;

        double t_entry = 0.0;
        if (!nodes[0].bounds.hit(r, inv_dir, r.t_min, closest, t_entry)) {
            return false;
        }
        stack[sp++] = {0, t_entry};

        while (sp > 0) {
            StackEntry entry = stack[--sp];
            if (entry.t_entry > closest) continue;

            const BVHNode& node = nodes[entry.node];
            if (node.is_leaf()) {
                for (int i = 0; i < node.prim_count; ++i) {
                    int prim = prim_indices[node.prim_offset + i];
                    if (intersect(prim, r, r.t_min, closest, rec)) {
                        hit_anything = true;
                        closest = rec.t;
                    }
                }
                continue;
            }

            // Near child first: with a positive direction the left (lower) child is nearer
            int near_child = dir_neg[node.axis] ? node.right : node.left;
            int far_child = dir_neg[node.axis] ? node.left : node.right;

            double t_near = 0.0;
            double t_far = 0.0;
            bool hit_near = nodes[near_child].bounds.hit(r, inv_dir, r.t_min, closest, t_near);
            bool hit_far = nodes[far_child].bounds.hit(r, inv_dir, r.t_min, closest, t_far);

            if (hit_far) stack[sp++] = {far_child, t_far};
            if (hit_near) stack[sp++] = {near_child, t_near};
        }

        return hit_anything;
    }

    /**
     * @brief Any intersection inside [r.t_min, r.t_max]
     *
     * intersects(prim_id, ray, t_min, t_max) is a boolean test.
     */
    template <typename OcclusionFn>
    bool any_hit(const ray& r, OcclusionFn&& intersects) const {
        if (nodes.empty()) return false;

        vec3 inv_dir = {1.0 / r.direction.x, 1.0 / r.direction.y, 1.0 / r.direction.z};

        int stack[kStackSize];
        int sp = 0;
        stack[sp++] = 0;

        while (sp > 0) {
            const BVHNode& node = nodes[stack[--sp]];
            double t_entry = 0.0;
            if (!node.bounds.hit(r, inv_dir, r.t_min, r.t_max, t_entry)) continue;

            if (node.is_leaf()) {
                for (int i = 0; i < node.prim_count; ++i) {
                    if (intersects(prim_indices[node.prim_offset + i], r, r.t_min, r.t_max)) {
                        return true;
                    }
                }
                continue;
            }
            stack[sp++] = node.right;
            stack[sp++] = node.left;
        }
        return false;
    }

    /**
     * @brief SAH cost of the built tree relative to its root area
     */
    double sah_cost() const;

    int depth() const { return depth_; }
    int leaf_count() const;

    Settings& settings() { return settings_; }
    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
    int depth_ = 0;

    int build_recursive(std::vector<BVHPrimitive>& prims, int start, int end, int depth);
    int split_sah(std::vector<BVHPrimitive>& prims, int start, int end,
                  const AABB& bounds, const AABB& centroid_bounds, int axis, bool& make_leaf) const;
    int split_object_median(std::vector<BVHPrimitive>& prims, int start, int end, int axis) const;
    int split_spatial_median(std::vector<BVHPrimitive>& prims, int start, int end,
                             const AABB& centroid_bounds, int axis) const;
};

} // namespace lumen
