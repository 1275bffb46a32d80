/**
 * @file main.cpp
 * @brief Entry point for the lumen command line renderer
 *
 * Renders scenes from JSON files or the built-in Cornell box.
 */

#include "renderer.hpp"
#include "scene.hpp"
#include "scene_loader.hpp"
#include "cornell_box.hpp"
#include "image.hpp"
#include "profiler.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace lumen;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [scene.json] [options]" << std::endl;
    std::cout << "  scene.json          - Scene file to render (optional, uses the Cornell box if not provided)" << std::endl;
    std::cout << "  --pathtrace, -p     - Unidirectional path tracing" << std::endl;
    std::cout << "  --bdpt, -b          - Bidirectional path tracing" << std::endl;
    std::cout << "  --normals           - Visualize shading normals" << std::endl;
    std::cout << "  --forward-normals   - Visualize shading normals facing away from the viewer" << std::endl;
    std::cout << "  --passes N          - Progressive passes" << std::endl;
    std::cout << "  --spp-dir N         - Stratified samples per pixel and pass, per axis" << std::endl;
    std::cout << "  --depth N           - Maximum path depth" << std::endl;
    std::cout << "  --threads N         - Worker threads (0 = all cores)" << std::endl;
    std::cout << "  --seed N            - Random seed" << std::endl;
    std::cout << "  --nee, --no-nee     - Toggle next event estimation (path tracing)" << std::endl;
    std::cout << "  --mis, --no-mis     - Toggle multiple importance sampling" << std::endl;
    std::cout << "  --no-light-tracing  - Disable light tracing strategies (BDPT)" << std::endl;
    std::cout << "  --light-mode MODE   - scene (scene lights, flash if none) or camera (flash only)" << std::endl;
    std::cout << "  --flash X           - Camera flash intensity (0 = scaled to the scene)" << std::endl;
    std::cout << "  --no-normal-maps    - Ignore normal maps" << std::endl;
    std::cout << "  --output FILE       - Output file (.png or .ppm)" << std::endl;
    std::cout << "  --exposure X        - Exposure multiplier before tone mapping" << std::endl;
    std::cout << "  --tonemapper NAME   - none, reinhard or aces" << std::endl;
    std::cout << "  --profile           - Print timing statistics" << std::endl;
}

namespace {

bool is_scene_file(const std::string& arg) {
    return arg.size() > 5 && arg.substr(arg.size() - 5) == ".json";
}

bool takes_value(const std::string& arg) {
    return arg == "--passes" || arg == "--spp-dir" || arg == "--depth" || arg == "--threads" ||
           arg == "--seed" || arg == "--output" || arg == "--exposure" || arg == "--tonemapper" ||
           arg == "--light-mode" || arg == "--flash";
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "=== lumen ===" << std::endl;

    // The scene file provides the defaults; flags override it regardless of order
    SceneLoader::SceneData data;
    bool loaded_scene = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (takes_value(arg)) {
            ++i;
            continue;
        }
        if (is_scene_file(arg)) {
            auto loaded = SceneLoader::load(arg);
            if (!loaded) {
                return 1;
            }
            data = std::move(*loaded);
            loaded_scene = true;
        }
    }

    if (!loaded_scene) {
        std::cout << "Using built-in Cornell box" << std::endl;
        CornellBoxOptions options;
        options.width = 512;
        options.height = 512;
        CornellBox box = make_cornell_box(options);
        data.scene = std::move(box.scene);
        data.camera_position = {0.0, 1.0, 0.9};
        data.camera_target = {0.0, 1.0, -1.0};
        data.camera_fov = 60.0;
        data.width = options.width;
        data.height = options.height;
    }

    Renderer::Settings& settings = data.render;
    bool profile = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--pathtrace" || arg == "-p") {
                settings.mode = RenderMode::PathTrace;
                settings.path.color_mode = ColorMode::Radiance;
            }
            else if (arg == "--bdpt" || arg == "-b") {
                settings.mode = RenderMode::BDPT;
            }
            else if (arg == "--normals") {
                settings.mode = RenderMode::PathTrace;
                settings.path.color_mode = ColorMode::DebugNormals;
            }
            else if (arg == "--forward-normals") {
                settings.mode = RenderMode::PathTrace;
                settings.path.color_mode = ColorMode::ForwardNormals;
            }
            else if (arg == "--nee") settings.path.use_nee = true;
            else if (arg == "--no-nee") settings.path.use_nee = false;
            else if (arg == "--mis") {
                settings.path.use_mis = true;
                settings.bdpt.use_mis = true;
            }
            else if (arg == "--no-mis") {
                settings.path.use_mis = false;
                settings.bdpt.use_mis = false;
            }
            else if (arg == "--no-light-tracing") settings.bdpt.light_tracing = false;
            else if (arg == "--no-normal-maps") data.scene.normal_mapping = false;
            else if (arg == "--profile") profile = true;
            else if (takes_value(arg)) {
                if (i + 1 >= argc) {
                    std::cerr << "Error: " << arg << " needs a value" << std::endl;
                    return 1;
                }
                std::string val = argv[++i];
                if (arg == "--passes") settings.passes = std::stoi(val);
                else if (arg == "--spp-dir") settings.samples_per_dir = std::stoi(val);
                else if (arg == "--depth") {
                    settings.path.max_depth = std::stoi(val);
                    settings.bdpt.max_depth = settings.path.max_depth;
                }
                else if (arg == "--threads") settings.threads = std::stoi(val);
                else if (arg == "--seed") settings.seed = std::stoull(val);
                else if (arg == "--output") data.output_file = val;
                else if (arg == "--exposure") data.exposure = std::stod(val);
                else if (arg == "--flash") settings.flash_intensity = std::stod(val);
                else if (arg == "--light-mode") {
                    if (val == "scene") settings.light_mode = LightMode::Scene;
                    else if (val == "camera") settings.light_mode = LightMode::Camera;
                    else std::cerr << "Warning: Unknown light mode '" << val << "'" << std::endl;
                }
                else if (arg == "--tonemapper") {
                    if (val == "none") data.tone_mapper = ToneMapper::None;
                    else if (val == "reinhard") data.tone_mapper = ToneMapper::Reinhard;
                    else if (val == "aces") data.tone_mapper = ToneMapper::ACES;
                    else std::cerr << "Warning: Unknown tone mapper '" << val << "'" << std::endl;
                }
            }
            else if (!is_scene_file(arg)) {
                std::cerr << "Warning: Ignoring unknown argument '" << arg << "'" << std::endl;
            }
        }
    } catch (const std::logic_error& e) {
        // std::stoi and friends report malformed numbers as invalid_argument / out_of_range
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    Profiler::instance().set_enabled(profile);

    data.scene.build(data.bvh);
    Camera camera = data.camera();

    Film film(camera.width(), camera.height());
    Renderer renderer(settings);
    int passes = renderer.render(data.scene, camera, film);
    if (passes == 0) {
        std::cerr << "Error: Nothing was rendered" << std::endl;
        return 1;
    }

    Image image = film.snapshot();
    apply_tone_mapping(image, data.tone_mapper, data.exposure);

    if (!write_image(image, data.output_file)) {
        std::cerr << "Error: Failed to write " << data.output_file << std::endl;
        return 1;
    }
    std::cout << "Wrote " << data.output_file << std::endl;

    if (profile) {
        Profiler::instance().report();
    }
    return 0;
}
