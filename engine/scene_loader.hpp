/**
 * @file scene_loader.hpp
 * @brief JSON scene file loading
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "scene.hpp"
#include "camera.hpp"
#include "renderer.hpp"
#include "image.hpp"
#include <optional>
#include <string>

namespace lumen {

/**
 * @brief Load a scene and its render settings from JSON
 *
 * Layout of a scene file:
 *   materials   name -> {type, color, emission, intensity, roughness, shininess, ior,
 *                        texture, normal_map}
 *   objects     [{type: triangle | quad | box | mesh, material, ...}]
 *               meshes take vertices, indices and optional normals and uvs
 *   lights      [{type: point | quad, color, intensity, ...}]
 *   camera      {position, look_at, up, fov}
 *   render      {width, height, passes, samples_per_dir, integrator, ...}
 *   background  [r, g, b]
 *
 * Missing keys take the defaults of SceneData and of the Settings structs.
 * Relative texture paths are resolved against the scene file's directory.
 */
class SceneLoader {
public:
    struct SceneData {
        Scene scene;

        // Camera settings
        point3 camera_position = {0, 1, 5};
        point3 camera_target = {0, 0, 0};
        vec3 camera_up = {0, 1, 0};
        double camera_fov = 60.0;

        // Render settings
        int width = 640;
        int height = 480;
        Renderer::Settings render;
        BVH::Settings bvh;
        ToneMapper tone_mapper = ToneMapper::ACES;
        double exposure = 1.0;

        std::string output_file = "output.png";

        Camera camera() const {
            return Camera(camera_position, camera_target, camera_up, camera_fov, width, height);
        }
    };

    /**
     * @brief Load scene from a JSON file
     * @return SceneData with an unbuilt scene, or std::nullopt on failure
     */
    static std::optional<SceneData> load(const std::string& filename);

    /**
     * @brief Load scene from JSON text
     * @param base_dir Directory relative texture paths are resolved against
     */
    static std::optional<SceneData> load_from_string(const std::string& text,
                                                     const std::string& base_dir = "");
};

} // namespace lumen
