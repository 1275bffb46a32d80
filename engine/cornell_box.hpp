/**
 * @file cornell_box.hpp
 * @brief Built-in Cornell box used as demo scene and test fixture
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "scene.hpp"
#include "camera.hpp"

namespace lumen {

/**
 * @brief What goes inside the box
 */
enum class CornellContents {
    Empty,
    DiffuseBlocks,  // Short and tall white box
    GlossyBlocks,   // Short white box, tall glossy box
    MirrorBlock     // Short white box, tall mirror box
};

struct CornellBoxOptions {
    int width = 64;
    int height = 64;
    CornellContents contents = CornellContents::DiffuseBlocks;
    double light_size = 0.5;                  // Edge length of the square ceiling light
    color light_emission = {17.0, 12.0, 4.0};
    bool point_light = false;                 // Replace the area light by a point light below the ceiling
};

struct CornellBox {
    Scene scene;
    Camera camera;
};

/**
 * @brief Closed box spanning [-1, 1] x [0, 2] x [-1, 1] with inward-facing walls
 *
 * Left wall red, right wall green, the others white. The camera sits just
 * inside the front wall looking down -z. The returned scene is not built.
 */
CornellBox make_cornell_box(const CornellBoxOptions& options = CornellBoxOptions());

} // namespace lumen
