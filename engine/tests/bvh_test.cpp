/**
 * @file bvh_test.cpp
 * @brief Tests for BVH construction and traversal
 *
 * Verifies:
 * - Leaf ranges partition the primitive set (0, 1 and N primitives)
 * - Node bounds contain their children
 * - Closest hit and occlusion agree with brute force for every split mode
 * - Degenerate input (coincident and flat triangles)
 */

#include "engine/bvh.hpp"
#include "engine/primitives.hpp"
#include "engine/sampling.hpp"
#include <iostream>
#include <cmath>
#include <cassert>
#include <vector>

using namespace lumen;

namespace {

std::vector<Triangle> random_triangles(int count, uint64_t seed) {
    Sampler sampler(seed);
    std::vector<Triangle> tris;
    for (int i = 0; i < count; ++i) {
        point3 c = {sampler.next() * 20.0 - 10.0, sampler.next() * 20.0 - 10.0, sampler.next() * 20.0 - 10.0};
        auto jitter = [&]() {
            return vec3{sampler.next() - 0.5, sampler.next() - 0.5, sampler.next() - 0.5};
        };
        tris.emplace_back(vec3_add(c, jitter()), vec3_add(c, jitter()), vec3_add(c, jitter()), 0);
    }
    return tris;
}

BVH build_bvh(const std::vector<Triangle>& tris, BVH::Settings settings = BVH::Settings()) {
    std::vector<BVHPrimitive> prims;
    for (size_t i = 0; i < tris.size(); ++i) {
        prims.push_back({tris[i].bounds(), tris[i].centroid(), static_cast<int>(i)});
    }
    BVH bvh(settings);
    bvh.build(prims);
    return bvh;
}

bool bvh_intersect(const BVH& bvh, const std::vector<Triangle>& tris, const ray& r, hit_record& rec) {
    return bvh.closest_hit(r, rec,
        [&](int prim, const ray& q, double t_min, double t_max, hit_record& hit) {
            if (tris[prim].intersect(q, t_min, t_max, hit)) {
                hit.prim_id = prim;
                return true;
            }
            return false;
        });
}

bool bvh_occluded(const BVH& bvh, const std::vector<Triangle>& tris, const ray& r) {
    return bvh.any_hit(r, [&](int prim, const ray& q, double t_min, double t_max) {
        return tris[prim].intersects(q, t_min, t_max);
    });
}

bool brute_force(const std::vector<Triangle>& tris, const ray& r, hit_record& rec) {
    bool hit = false;
    double closest = r.t_max;
    for (size_t i = 0; i < tris.size(); ++i) {
        hit_record tmp = hit_record_init();
        if (tris[i].intersect(r, r.t_min, closest, tmp)) {
            tmp.prim_id = static_cast<int>(i);
            rec = tmp;
            closest = tmp.t;
            hit = true;
        }
    }
    return hit;
}

ray random_ray(Sampler& sampler) {
    point3 origin = {sampler.next() * 30.0 - 15.0, sampler.next() * 30.0 - 15.0, sampler.next() * 30.0 - 15.0};
    vec3 dir = sample_uniform_sphere(sampler.next(), sampler.next());
    return ray_create(origin, dir);
}

/**
 * @brief Leaves cover every primitive exactly once and bounds nest
 */
void check_structure(const BVH& bvh, int prim_count) {
    assert(!bvh.nodes.empty());
    assert(static_cast<int>(bvh.prim_indices.size()) == prim_count);

    std::vector<int> seen(prim_count, 0);
    int covered = 0;
    for (const BVHNode& node : bvh.nodes) {
        if (node.is_leaf()) {
            assert(node.prim_offset >= 0);
            assert(node.prim_offset + node.prim_count <= prim_count);
            covered += node.prim_count;
            for (int i = 0; i < node.prim_count; ++i) {
                seen[bvh.prim_indices[node.prim_offset + i]]++;
            }
        } else {
            assert(node.right >= 0);
            assert(node.bounds.contains(bvh.nodes[node.left].bounds));
            assert(node.bounds.contains(bvh.nodes[node.right].bounds));
        }
    }
    assert(covered == prim_count);
    for (int count : seen) {
        assert(count == 1);
    }
}

} // namespace

void test_empty_and_single() {
    std::cout << "Testing BVH with 0 and 1 primitives...\n";

    std::vector<Triangle> none;
    BVH empty = build_bvh(none);
    assert(empty.nodes.size() == 1);
    assert(empty.nodes[0].is_leaf());
    assert(empty.nodes[0].prim_count == 0);
    check_structure(empty, 0);

    hit_record rec = hit_record_init();
    ray r = ray_create({0, 0, -5}, {0, 0, 1});
    assert(!bvh_intersect(empty, none, r, rec));
    assert(!bvh_occluded(empty, none, r));

    std::vector<Triangle> one = {Triangle({-1, -1, 0}, {1, -1, 0}, {0, 1, 0})};
    BVH single = build_bvh(one);
    check_structure(single, 1);
    assert(bvh_intersect(single, one, r, rec));
    assert(std::fabs(rec.t - 5.0) < 1e-9);
    assert(rec.prim_id == 0);
    assert(bvh_occluded(single, one, r));

    std::cout << "  PASSED\n";
}

void test_partition_covers_primitives() {
    std::cout << "Testing BVH leaf partition...\n";

    std::vector<Triangle> tris = random_triangles(1000, 7);
    for (SplitMode mode : {SplitMode::SAH, SplitMode::ObjectMedian, SplitMode::SpatialMedian}) {
        BVH::Settings settings;
        settings.split_mode = mode;
        BVH bvh = build_bvh(tris, settings);
        check_structure(bvh, static_cast<int>(tris.size()));
        assert(bvh.leaf_count() > 1);
        assert(bvh.depth() < BVH::kStackSize / 2);
    }

    std::cout << "  PASSED\n";
}

void test_closest_hit_matches_brute_force() {
    std::cout << "Testing closest hit against brute force...\n";

    std::vector<Triangle> tris = random_triangles(2000, 11);
    Sampler sampler(3);

    for (SplitMode mode : {SplitMode::SAH, SplitMode::ObjectMedian, SplitMode::SpatialMedian}) {
        BVH::Settings settings;
        settings.split_mode = mode;
        BVH bvh = build_bvh(tris, settings);

        int hits = 0;
        for (int i = 0; i < 2000; ++i) {
            ray r = random_ray(sampler);
            hit_record a = hit_record_init();
            hit_record b = hit_record_init();
            bool hit_bvh = bvh_intersect(bvh, tris, r, a);
            bool hit_ref = brute_force(tris, r, b);
            assert(hit_bvh == hit_ref);
            if (hit_bvh) {
                ++hits;
                assert(std::fabs(a.t - b.t) < 1e-9);
                assert(a.prim_id == b.prim_id);
            }
        }
        assert(hits > 100);
    }

    std::cout << "  PASSED\n";
}

void test_occlusion() {
    std::cout << "Testing any-hit occlusion...\n";

    std::vector<Triangle> tris = random_triangles(300, 5);
    BVH bvh = build_bvh(tris);
    Sampler sampler(9);

    for (int i = 0; i < 2000; ++i) {
        ray r = random_ray(sampler);
        r.t_max = sampler.next() * 20.0;
        hit_record rec = hit_record_init();
        bool expected = brute_force(tris, r, rec);
        assert(bvh_occluded(bvh, tris, r) == expected);
    }

    // A segment stopping short of the only triangle is unoccluded
    std::vector<Triangle> wall = {Triangle({-1, -1, 0}, {1, -1, 0}, {0, 1, 0})};
    BVH wall_bvh = build_bvh(wall);
    ray short_ray = ray_create_interval({0, 0, -2}, {0, 0, 1}, 0.0, 1.9);
    assert(!bvh_occluded(wall_bvh, wall, short_ray));
    short_ray.t_max = 2.1;
    assert(bvh_occluded(wall_bvh, wall, short_ray));

    std::cout << "  PASSED\n";
}

void test_degenerate_input() {
    std::cout << "Testing degenerate input...\n";

    // Many copies of one triangle: coincident centroids must not recurse forever
    std::vector<Triangle> copies(200, Triangle({0, 0, 0}, {1, 0, 0}, {0, 1, 0}));
    BVH bvh = build_bvh(copies);
    check_structure(bvh, 200);

    ray r = ray_create({0.25, 0.25, 1.0}, {0, 0, -1});
    hit_record rec = hit_record_init();
    assert(bvh_intersect(bvh, copies, r, rec));
    assert(std::fabs(rec.t - 1.0) < 1e-9);

    // Coplanar floor: every box is flat in y and must still be hit
    std::vector<Triangle> floor;
    for (int x = 0; x < 16; ++x) {
        for (int z = 0; z < 16; ++z) {
            point3 p = {static_cast<double>(x), 0.0, static_cast<double>(z)};
            floor.emplace_back(p, vec3_add(p, {0, 0, 1}), vec3_add(p, {1, 0, 0}));
            floor.emplace_back(vec3_add(p, {1, 0, 0}), vec3_add(p, {0, 0, 1}), vec3_add(p, {1, 0, 1}));
        }
    }
    BVH floor_bvh = build_bvh(floor);
    check_structure(floor_bvh, static_cast<int>(floor.size()));
    Sampler sampler(21);
    for (int i = 0; i < 500; ++i) {
        point3 o = {0.01 + sampler.next() * 15.98, 3.0, 0.01 + sampler.next() * 15.98};
        ray down = ray_create(o, {0, -1, 0});
        hit_record hit = hit_record_init();
        assert(bvh_intersect(floor_bvh, floor, down, hit));
        assert(std::fabs(hit.t - 3.0) < 1e-9);
    }

    // Zero-area triangles build and are never hit
    std::vector<Triangle> lines(10, Triangle({0, 0, 0}, {1, 1, 1}, {2, 2, 2}));
    BVH line_bvh = build_bvh(lines);
    check_structure(line_bvh, 10);
    ray across = ray_create({1, 0, 1}, vec3_normalize({0, 1, 0}));
    assert(!bvh_intersect(line_bvh, lines, across, rec));

    std::cout << "  PASSED\n";
}

void test_sah_beats_median() {
    std::cout << "Testing SAH cost...\n";

    // Clustered geometry: SAH should not do worse than splitting in the middle
    std::vector<Triangle> tris = random_triangles(200, 17);
    std::vector<Triangle> far = random_triangles(20, 19);
    for (Triangle& t : far) {
        tris.emplace_back(vec3_add(t.v0, {100, 0, 0}), vec3_add(t.v1, {100, 0, 0}), vec3_add(t.v2, {100, 0, 0}));
    }

    BVH::Settings sah;
    BVH::Settings median;
    median.split_mode = SplitMode::ObjectMedian;
    double sah_cost = build_bvh(tris, sah).sah_cost();
    double median_cost = build_bvh(tris, median).sah_cost();
    std::cout << "  SAH cost " << sah_cost << ", object median cost " << median_cost << "\n";
    assert(sah_cost > 0.0);
    assert(sah_cost <= median_cost * 1.05);

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== BVH Tests ===\n\n";

    test_empty_and_single();
    test_partition_covers_primitives();
    test_closest_hit_matches_brute_force();
    test_occlusion();
    test_degenerate_input();
    test_sah_beats_median();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
