/**
 * @file cornell_box.cpp
 * @brief Built-in Cornell box
 */

#include "cornell_box.hpp"

namespace lumen {

CornellBox make_cornell_box(const CornellBoxOptions& options) {
    CornellBox box;
    Scene& scene = box.scene;

    int white = scene.add_material(Material::diffuse({0.725, 0.725, 0.725}));
    int red = scene.add_material(Material::diffuse({0.63, 0.065, 0.05}));
    int green = scene.add_material(Material::diffuse({0.14, 0.45, 0.091}));

    scene.add_quad({-1, 0, -1}, {0, 0, 2}, {2, 0, 0}, white);   // Floor
    scene.add_quad({-1, 2, -1}, {2, 0, 0}, {0, 0, 2}, white);   // Ceiling
    scene.add_quad({-1, 0, -1}, {2, 0, 0}, {0, 2, 0}, white);   // Back
    scene.add_quad({-1, 0, 1}, {0, 2, 0}, {2, 0, 0}, white);    // Front (behind the camera)
    scene.add_quad({-1, 0, -1}, {0, 2, 0}, {0, 0, 2}, red);     // Left
    scene.add_quad({1, 0, -1}, {0, 0, 2}, {0, 2, 0}, green);    // Right

    if (options.point_light) {
        scene.add_point_light({0.0, 1.9, 0.0}, options.light_emission);
    } else {
        double s = options.light_size;
        int light = scene.add_material(Material::emissive(options.light_emission));
        scene.add_quad({-s / 2, 1.999, -s / 2}, {s, 0, 0}, {0, 0, s}, light);
    }

    if (options.contents != CornellContents::Empty) {
        int tall = white;
        if (options.contents == CornellContents::GlossyBlocks) {
            tall = scene.add_material(Material::glossy({0.8, 0.8, 0.8}, 0.2));
        } else if (options.contents == CornellContents::MirrorBlock) {
            tall = scene.add_material(Material::mirror({0.9, 0.9, 0.9}));
        }
        scene.add_box({0.05, 0.0, -0.1}, {0.65, 0.6, 0.5}, white);
        scene.add_box({-0.7, 0.0, -0.75}, {-0.1, 1.2, -0.15}, tall);
    }

    box.camera = Camera({0.0, 1.0, 0.9}, {0.0, 1.0, -1.0}, {0.0, 1.0, 0.0}, 60.0,
                        options.width, options.height);
    return box;
}

} // namespace lumen
