/**
 * @file scene_loader.cpp
 * @brief JSON scene file loading
 */

#include "scene_loader.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace lumen {

using json = nlohmann::json;

namespace {

/**
 * @brief Malformed scene content that the JSON library itself accepts
 */
class SceneError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

vec3 to_vec3(const json& value, const std::string& what) {
    if (!value.is_array() || value.size() != 3) {
        throw SceneError("'" + what + "' must be an array of 3 numbers");
    }
    return {value[0].get<double>(), value[1].get<double>(), value[2].get<double>()};
}

vec3 get_vec3(const json& obj, const std::string& key, vec3 fallback) {
    if (!obj.contains(key)) return fallback;
    return to_vec3(obj[key], key);
}

vec3 require_vec3(const json& obj, const std::string& key, const std::string& context) {
    if (!obj.contains(key)) {
        throw SceneError(context + " is missing '" + key + "'");
    }
    return to_vec3(obj[key], key);
}

/**
 * @brief Resolve a path from the scene file against the scene's directory
 */
std::string resolve_path(const std::string& path, const std::string& base_dir) {
    if (base_dir.empty() || path.empty() || path[0] == '/') return path;
    return base_dir + "/" + path;
}

Material parse_material(const std::string& name, const json& mat, const std::string& base_dir) {
    Material m;
    std::string type = mat.value("type", "diffuse");
    color c = get_vec3(mat, "color", {0.5, 0.5, 0.5});

    if (type == "diffuse" || type == "lambertian") {
        m = Material::diffuse(c);
    }
    else if (type == "mirror" || type == "metal") {
        m = Material::mirror(get_vec3(mat, "color", {1.0, 1.0, 1.0}));
    }
    else if (type == "glass" || type == "dielectric") {
        m = Material::glass(mat.value("ior", 1.5), get_vec3(mat, "color", {1.0, 1.0, 1.0}));
    }
    else if (type == "glossy") {
        double roughness = mat.contains("shininess")
            ? Material::shininess_to_roughness(mat["shininess"].get<double>())
            : mat.value("roughness", 0.1);
        m = Material::glossy(c, roughness);
    }
    else if (type == "rough_glass") {
        m = Material::rough_glass(mat.value("ior", 1.5), mat.value("roughness", 0.1),
                                  get_vec3(mat, "color", {1.0, 1.0, 1.0}));
    }
    else if (type == "emissive") {
        color e = get_vec3(mat, "emission", {1.0, 1.0, 1.0});
        double intensity = mat.value("intensity", 1.0);
        m = Material::emissive(vec3_scale(e, intensity), get_vec3(mat, "color", {0.0, 0.0, 0.0}));
    }
    else {
        throw SceneError("material '" + name + "' has unknown type '" + type + "'");
    }

    // Any variant may also emit
    if (type != "emissive" && mat.contains("emission")) {
        m.emission = vec3_scale(to_vec3(mat["emission"], "emission"), mat.value("intensity", 1.0));
    }
    if (mat.contains("texture")) {
        std::string path = resolve_path(mat["texture"].get<std::string>(), base_dir);
        m.texture = Texture::load_image(path);
        if (!m.texture) {
            throw SceneError("material '" + name + "' could not load texture '" + path + "'");
        }
    }
    if (mat.contains("normal_map")) {
        std::string path = resolve_path(mat["normal_map"].get<std::string>(), base_dir);
        m.normal_map = Texture::load_normal_map(path);
        if (!m.normal_map) {
            throw SceneError("material '" + name + "' could not load normal map '" + path + "'");
        }
    }

    m.name = name;
    return m;
}

void parse_mesh(const json& obj, int mat_id, Scene& scene) {
    if (!obj.contains("vertices") || !obj.contains("indices")) {
        throw SceneError("mesh needs 'vertices' and 'indices'");
    }

    std::vector<point3> vertices;
    for (const auto& v : obj["vertices"]) {
        vertices.push_back(to_vec3(v, "vertices"));
    }
    std::vector<vec3> normals;
    if (obj.contains("normals")) {
        for (const auto& n : obj["normals"]) {
            normals.push_back(to_vec3(n, "normals"));
        }
        if (normals.size() != vertices.size()) {
            throw SceneError("mesh has " + std::to_string(normals.size()) + " normals for "
                             + std::to_string(vertices.size()) + " vertices");
        }
    }

    std::vector<TexCoord> uvs;
    if (obj.contains("uvs")) {
        for (const auto& t : obj["uvs"]) {
            if (!t.is_array() || t.size() != 2) {
                throw SceneError("'uvs' entries must be arrays of 2 numbers");
            }
            uvs.push_back({t[0].get<double>(), t[1].get<double>()});
        }
        if (uvs.size() != vertices.size()) {
            throw SceneError("mesh has " + std::to_string(uvs.size()) + " uvs for "
                             + std::to_string(vertices.size()) + " vertices");
        }
    }

    auto indices = obj["indices"].get<std::vector<int>>();
    if (indices.size() % 3 != 0) {
        throw SceneError("mesh index count is not a multiple of 3");
    }

    const int count = static_cast<int>(vertices.size());
    for (size_t i = 0; i < indices.size(); i += 3) {
        int a = indices[i];
        int b = indices[i + 1];
        int c = indices[i + 2];
        if (a < 0 || b < 0 || c < 0 || a >= count || b >= count || c >= count) {
            throw SceneError("mesh index out of range at triangle " + std::to_string(i / 3));
        }
        Triangle tri(vertices[a], vertices[b], vertices[c], mat_id);
        if (!normals.empty()) {
            tri.set_normals(normals[a], normals[b], normals[c]);
        }
        if (!uvs.empty()) {
            tri.set_uvs(uvs[a], uvs[b], uvs[c]);
        }
        scene.add_triangle(tri);
    }
}

void parse_render(const json& r, SceneLoader::SceneData& data) {
    Renderer::Settings& settings = data.render;

    data.width = r.value("width", data.width);
    data.height = r.value("height", data.height);
    if (data.width <= 0 || data.height <= 0) {
        throw SceneError("image size must be positive");
    }

    settings.passes = r.value("passes", settings.passes);
    settings.samples_per_dir = r.value("samples_per_dir", settings.samples_per_dir);
    settings.tile_size = r.value("tile_size", settings.tile_size);
    settings.threads = r.value("threads", settings.threads);
    settings.seed = r.value("seed", settings.seed);

    int max_depth = r.value("max_depth", settings.path.max_depth);
    settings.path.max_depth = max_depth;
    settings.bdpt.max_depth = max_depth;
    settings.bdpt.max_light_depth = r.value("max_light_depth", settings.bdpt.max_light_depth);
    settings.path.rr_depth = r.value("rr_depth", settings.path.rr_depth);

    settings.path.use_nee = r.value("nee", settings.path.use_nee);
    bool use_mis = r.value("mis", settings.path.use_mis);
    settings.path.use_mis = use_mis;
    settings.bdpt.use_mis = use_mis;
    settings.bdpt.light_tracing = r.value("light_tracing", settings.bdpt.light_tracing);

    double clamp_max = r.value("clamp_max", settings.path.clamp_max);
    settings.path.clamp_max = clamp_max;
    settings.bdpt.clamp_max = clamp_max;
    settings.bdpt.debug_s = r.value("debug_s", settings.bdpt.debug_s);
    settings.bdpt.debug_t = r.value("debug_t", settings.bdpt.debug_t);

    std::string integrator = r.value("integrator", "path");
    if (integrator == "path" || integrator == "pathtrace") {
        settings.mode = RenderMode::PathTrace;
    } else if (integrator == "bdpt" || integrator == "bidirectional") {
        settings.mode = RenderMode::BDPT;
    } else if (integrator == "normals") {
        settings.mode = RenderMode::PathTrace;
        settings.path.color_mode = ColorMode::DebugNormals;
    } else if (integrator == "forward_normals") {
        settings.mode = RenderMode::PathTrace;
        settings.path.color_mode = ColorMode::ForwardNormals;
    } else {
        std::cerr << "Warning: Unknown integrator '" << integrator << "', using path tracing" << std::endl;
    }

    std::string split = r.value("bvh_split", "sah");
    if (split == "sah") data.bvh.split_mode = SplitMode::SAH;
    else if (split == "object_median") data.bvh.split_mode = SplitMode::ObjectMedian;
    else if (split == "spatial_median") data.bvh.split_mode = SplitMode::SpatialMedian;
    else std::cerr << "Warning: Unknown bvh_split '" << split << "', using sah" << std::endl;
    data.bvh.max_leaf_size = r.value("max_leaf_size", data.bvh.max_leaf_size);

    std::string light_mode = r.value("light_mode", "scene");
    if (light_mode == "scene") settings.light_mode = LightMode::Scene;
    else if (light_mode == "camera") settings.light_mode = LightMode::Camera;
    else std::cerr << "Warning: Unknown light_mode '" << light_mode << "', using scene" << std::endl;
    settings.flash_intensity = r.value("flash_intensity", settings.flash_intensity);
    data.scene.normal_mapping = r.value("normal_mapping", data.scene.normal_mapping);

    data.exposure = r.value("exposure", data.exposure);
    data.output_file = r.value("output", data.output_file);

    std::string tm_str = r.value("tonemapper", "aces");
    if (tm_str == "none") data.tone_mapper = ToneMapper::None;
    else if (tm_str == "reinhard") data.tone_mapper = ToneMapper::Reinhard;
    else data.tone_mapper = ToneMapper::ACES;
}

SceneLoader::SceneData parse_scene(const json& j, const std::string& base_dir) {
    if (!j.is_object()) {
        throw SceneError("scene root must be an object");
    }

    SceneLoader::SceneData data;

    // Material name -> ID mapping
    std::unordered_map<std::string, int> material_ids;

    if (j.contains("materials")) {
        for (auto& [name, mat] : j["materials"].items()) {
            material_ids[name] = data.scene.add_material(parse_material(name, mat, base_dir));
        }
    }

    // Objects without a usable material get a neutral grey, registered on first use
    int default_id = -1;
    auto default_material = [&]() -> int {
        if (default_id < 0) {
            Material m = Material::diffuse({0.5, 0.5, 0.5});
            m.name = "default";
            default_id = data.scene.add_material(m);
        }
        return default_id;
    };

    auto get_material = [&](const json& obj) -> int {
        if (obj.contains("material")) {
            std::string name = obj["material"].get<std::string>();
            auto it = material_ids.find(name);
            if (it != material_ids.end()) {
                return it->second;
            }
            std::cerr << "Warning: Unknown material '" << name << "', using default" << std::endl;
        }
        return default_material();
    };

    if (j.contains("objects")) {
        for (auto& obj : j["objects"]) {
            std::string type = obj.value("type", "");
            int mat_id = get_material(obj);

            if (type == "triangle") {
                data.scene.add_triangle(require_vec3(obj, "v0", "triangle"),
                                        require_vec3(obj, "v1", "triangle"),
                                        require_vec3(obj, "v2", "triangle"), mat_id);
            }
            else if (type == "quad") {
                data.scene.add_quad(require_vec3(obj, "corner", "quad"),
                                    require_vec3(obj, "edge_u", "quad"),
                                    require_vec3(obj, "edge_v", "quad"), mat_id);
            }
            else if (type == "box") {
                data.scene.add_box(require_vec3(obj, "min", "box"),
                                   require_vec3(obj, "max", "box"), mat_id);
            }
            else if (type == "mesh") {
                parse_mesh(obj, mat_id, data.scene);
            }
            else {
                std::cerr << "Warning: Skipping object of unknown type '" << type << "'" << std::endl;
            }
        }
    }

    if (j.contains("lights")) {
        for (auto& light : j["lights"]) {
            std::string type = light.value("type", "point");
            color col = get_vec3(light, "color", {1.0, 1.0, 1.0});
            color emission = vec3_scale(col, light.value("intensity", 1.0));

            if (type == "point") {
                data.scene.add_point_light(get_vec3(light, "position", {0.0, 5.0, 0.0}), emission);
            }
            else if (type == "quad") {
                // Emits towards cross(edge_u, edge_v)
                Material m = Material::emissive(emission);
                m.name = "quad_light";
                int mat_id = data.scene.add_material(m);
                data.scene.add_quad(require_vec3(light, "corner", "quad light"),
                                    require_vec3(light, "edge_u", "quad light"),
                                    require_vec3(light, "edge_v", "quad light"), mat_id);
            }
            else {
                std::cerr << "Warning: Skipping light of unknown type '" << type << "'" << std::endl;
            }
        }
    }

    if (j.contains("camera")) {
        auto& cam = j["camera"];
        data.camera_position = get_vec3(cam, "position", data.camera_position);
        data.camera_target = get_vec3(cam, "look_at", data.camera_target);
        data.camera_up = get_vec3(cam, "up", data.camera_up);
        data.camera_fov = cam.value("fov", data.camera_fov);
    }

    if (j.contains("render")) {
        parse_render(j["render"], data);
    }

    data.scene.background = get_vec3(j, "background", data.scene.background);

    std::cout << "Loaded scene: " << data.scene.materials.size() << " materials, "
              << data.scene.triangles.size() << " triangles, "
              << data.scene.point_lights.size() << " point lights" << std::endl;
    return data;
}

} // namespace

std::optional<SceneLoader::SceneData> SceneLoader::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open scene file: " << filename << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    size_t slash = filename.find_last_of('/');
    std::string base_dir = slash == std::string::npos ? "" : filename.substr(0, slash);
    return load_from_string(buffer.str(), base_dir);
}

std::optional<SceneLoader::SceneData> SceneLoader::load_from_string(const std::string& text,
                                                                    const std::string& base_dir) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "Error parsing JSON: " << e.what() << std::endl;
        return std::nullopt;
    }

    try {
        return parse_scene(j, base_dir);
    } catch (const json::exception& e) {
        std::cerr << "Error: Invalid scene: " << e.what() << std::endl;
    } catch (const SceneError& e) {
        std::cerr << "Error: Invalid scene: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace lumen
