#include "SysObjLoader.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <glm/glm.hpp>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "SysMesh.hpp"

// -------------------------------------------------------------------------------
// @return an initialized material
ObjMaterial new_material(const std::string& name)
{
    ObjMaterial def_mat = {};
    def_mat.name        = name;
    def_mat.Ka          = glm::vec3(0.2f, 0.2f, 0.2f);
    def_mat.Kd          = glm::vec3(0.8f, 0.8f, 0.8f);
    def_mat.Ks          = glm::vec3(0.0f, 0.0f, 0.0f);
    def_mat.Ns          = 0.0f;
    def_mat.d           = 1.0f;
    return def_mat;
}

// -------------------------------------------------------------------------------
// Add a material to the list if it doesn't exist or return the index of existing.
// Names are case-sensitive: "Skin" and "skin" are different materials.
static uint32_t add_material(const std::string& name, ObjMaterials& materials)
{
    for (uint32_t i = 0; i < materials.size(); ++i)
    {
        if (name == materials[i].name)
        {
            return i;
        }
    }
    materials.push_back(new_material(name));
    return static_cast<uint32_t>(materials.size() - 1);
}

// -------------------------------------------------------------------------------
// Parse one face index. Negative indices are relative to the current count.
// @return false if the token is not an integer or resolves out of range.
static bool parse_index(const std::string& token, int32_t count, int32_t& out)
{
    int32_t value = 0;

    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size() || value == 0)
        return false;

    out = value > 0 ? value - 1 : count + value;
    return out >= 0 && out < count;
}

static std::string trim(const std::string& str)
{
    const size_t first = str.find_first_not_of(" \t\r");
    if (first == std::string::npos)
        return {};
    const size_t last = str.find_last_not_of(" \t\r");
    return str.substr(first, last - first + 1);
}

// -------------------------------------------------------------------------------
static bool loadObjMaterialsFromFile(const std::string& filename, ObjMaterials& materials);
static bool writeObjMaterialsToFile(const std::string& filename, const ObjMaterials& materials);
// -------------------------------------------------------------------------------

bool loadObjToMesh(const std::string& filepath, SysMesh* mesh, ObjMaterials& materials)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        std::cerr << "Failed to open OBJ file: " << filepath << std::endl;
        return false;
    }

    uint32_t mat_index = kSysNoMaterial;
    int32_t  text_map  = -1;

    std::vector<int32_t>   verts;
    std::vector<glm::vec2> texts;
    std::vector<int32_t>   groups; // Poly pick maps of the current "g" statement

    std::string mat_lib;
    std::string line;
    int32_t     line_number = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        std::istringstream sstream(line);
        std::string        prefix;
        sstream >> prefix;

        if (prefix == "mtllib")
        {
            std::getline(sstream, mat_lib);
            mat_lib = trim(mat_lib);
        }
        else if (prefix == "usemtl")
        {
            std::string mat_name;
            std::getline(sstream, mat_name);
            mat_index = add_material(trim(mat_name), materials);
        }
        else if (prefix == "v")
        {
            glm::vec3 pos{0.f};
            sstream >> pos.x >> pos.y >> pos.z;
            verts.push_back(mesh->create_vert(pos));
        }
        else if (prefix == "vt")
        {
            glm::vec2 uv{0.f};
            sstream >> uv.x >> uv.y;
            texts.push_back(uv);
        }
        else if (prefix == "g")
        {
            groups.clear();
            std::string group_name;
            while (sstream >> group_name)
            {
                if (group_name == "default")
                    continue;

                int32_t map = mesh->map_find(SysMapType::PolyPick, group_name);
                if (map == -1)
                    map = mesh->map_create(group_name, SysMapType::PolyPick);
                groups.push_back(map);
            }
        }
        else if (prefix == "f")
        {
            SysPolyVerts pv, pt;
            std::string  vertex;
            bool         valid = true;

            while (sstream >> vertex)
            {
                std::istringstream vertexStream(vertex);
                std::string        indexStr;
                int32_t            index = 0;

                // Parse vertex data (position, texture); normals are not kept
                if (std::getline(vertexStream, indexStr, '/'))
                {
                    if (!parse_index(indexStr, static_cast<int32_t>(verts.size()), index))
                    {
                        valid = false;
                        break;
                    }
                    pv.push_back(verts[index]);
                }
                if (std::getline(vertexStream, indexStr, '/') && !indexStr.empty())
                {
                    if (!parse_index(indexStr, static_cast<int32_t>(texts.size()), index))
                    {
                        valid = false;
                        break;
                    }
                    pt.push_back(index);
                }
            }

            if (!valid || pv.size() < 3)
            {
                std::cerr << "Skipping invalid face on line " << line_number << " of " << filepath << std::endl;
                continue;
            }

            const int32_t poly_index = mesh->create_poly(pv, mat_index);

            if (pt.size() == pv.size())
            {
                if (text_map == -1)
                    text_map = mesh->map_create(kObjTextureMapName, SysMapType::Texture);

                for (int32_t corner = 0; corner < static_cast<int32_t>(pt.size()); ++corner)
                    mesh->map_set_corner_value(text_map, poly_index, corner, &texts[pt[corner]][0]);
            }

            for (int32_t map : groups)
                mesh->map_set_poly_tag(map, poly_index, true);
        }
    }

    file.close();

    // Load material library if defined
    if (!mat_lib.empty())
    {
        const std::filesystem::path mtlPath = std::filesystem::path(filepath).parent_path() / mat_lib;
        if (!loadObjMaterialsFromFile(mtlPath.string(), materials))
            std::cerr << "Material library not loaded, using default material values." << std::endl;
    }

    return true;
}

bool saveMeshToObj(const std::string& filepath, const SysMesh* mesh, const ObjMaterials& materials)
{
    std::filesystem::path filePath   = filepath;
    const std::string     mtlDstPath = std::filesystem::path(filePath).replace_extension(".mtl").string();
    const std::string     mtlLib     = filePath.filename().replace_extension(".mtl").string();

    std::ofstream out(filepath);
    if (!out.is_open())
    {
        std::cerr << "Cannot open file for writing: " << filepath << std::endl;
        return false;
    }

    out.precision(9);

    if (!materials.empty())
        out << "mtllib " << mtlLib << "\n";

    int32_t text_map = mesh->map_find(SysMapType::Texture, kObjTextureMapName);
    if (text_map == -1)
    {
        const std::vector<int32_t> uv_maps = mesh->maps_of_type(SysMapType::Texture);
        if (!uv_maps.empty())
            text_map = uv_maps.front();
    }

    const std::vector<int32_t> group_maps = mesh->maps_of_type(SysMapType::PolyPick);

    std::vector<glm::vec2> texts;

    struct PolyData
    {
        SysPolyVerts pv;
        SysPolyVerts pt;
        std::string  groups;
    };

    // Polygons bucketed by material; -1 holds polygons without a material
    std::map<int64_t, std::vector<PolyData>> poly_map;

    // OBJ indices are 1-based and dense
    std::map<int32_t, int32_t> vert_numbers;
    for (int32_t vert_index : mesh->all_verts())
    {
        const int32_t number      = static_cast<int32_t>(vert_numbers.size()) + 1;
        vert_numbers[vert_index] = number;
    }

    for (int32_t poly_index : mesh->all_polys())
    {
        const SysPolyVerts& pv      = mesh->poly_verts(poly_index);
        const uint32_t      mat_id  = mesh->poly_material(poly_index);
        const int64_t       mat_key = mat_id < materials.size() ? static_cast<int64_t>(mat_id) : -1;

        PolyData poly_data;

        for (int32_t vert_index : pv)
            poly_data.pv.push_back(vert_numbers[vert_index]);

        if (text_map != -1)
        {
            for (int32_t corner = 0; corner < static_cast<int32_t>(pv.size()); ++corner)
            {
                const float* uv = mesh->map_corner_value(text_map, poly_index, corner);
                if (!uv)
                {
                    poly_data.pt.clear();
                    break;
                }
                texts.emplace_back(uv[0], uv[1]);
                poly_data.pt.push_back(static_cast<int32_t>(texts.size()));
            }
        }

        for (int32_t map : group_maps)
        {
            if (!mesh->map_poly_tagged(map, poly_index))
                continue;
            if (!poly_data.groups.empty())
                poly_data.groups += ' ';
            poly_data.groups += mesh->map_name(map);
        }

        poly_map[mat_key].push_back(std::move(poly_data));
    }

    // Output vertex positions
    for (int32_t index : mesh->all_verts())
    {
        const glm::vec3& pos = mesh->vert_position(index);
        out << "v " << pos.x << " " << pos.y << " " << pos.z << "\n";
    }

    // Output UV coordinates
    for (const glm::vec2& vt : texts)
    {
        out << "vt " << vt.x << " " << vt.y << "\n";
    }

    // Output faces
    std::string current_groups;
    for (auto& [mat_key, polys] : poly_map)
    {
        if (mat_key >= 0)
            out << "usemtl " << materials[static_cast<size_t>(mat_key)].name << "\n";

        for (const PolyData& data : polys)
        {
            if (data.groups != current_groups)
            {
                out << "g " << (data.groups.empty() ? std::string("default") : data.groups) << "\n";
                current_groups = data.groups;
            }

            out << "f";
            for (size_t i = 0; i < data.pv.size(); ++i)
            {
                out << " " << data.pv[i];
                if (!data.pt.empty())
                    out << "/" << data.pt[i];
            }
            out << "\n";
        }
    }

    out.close();
    if (!out)
    {
        std::cerr << "Failed writing OBJ file: " << filepath << std::endl;
        return false;
    }

    if (!materials.empty())
        return writeObjMaterialsToFile(mtlDstPath, materials);

    return true;
}

static bool loadObjMaterialsFromFile(const std::string& filename, ObjMaterials& materials)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file " << filename << "\n";
        return false;
    }

    int64_t     mat_index = -1;
    std::string line;

    while (std::getline(file, line))
    {
        line = trim(line);

        // Ignore empty lines and comments
        if (line.empty() || line[0] == '#')
        {
            continue;
        }

        std::istringstream stream(line);
        std::string        key;
        stream >> key;

        if (key == "newmtl")
        {
            std::string mat_name;
            std::getline(stream, mat_name);
            mat_index = add_material(trim(mat_name), materials);
            continue;
        }

        // Statements before the first newmtl have nothing to apply to
        if (mat_index < 0)
            continue;

        ObjMaterial& mat = materials[static_cast<size_t>(mat_index)];

        if (key == "Ka")
            stream >> mat.Ka.r >> mat.Ka.g >> mat.Ka.b;
        else if (key == "Kd")
            stream >> mat.Kd.r >> mat.Kd.g >> mat.Kd.b;
        else if (key == "Ks")
            stream >> mat.Ks.r >> mat.Ks.g >> mat.Ks.b;
        else if (key == "Ns")
            stream >> mat.Ns;
        else if (key == "d")
            stream >> mat.d;
        else if (key == "map_Kd")
        {
            std::getline(stream, mat.map_Kd);
            mat.map_Kd = trim(mat.map_Kd);
        }
    }

    file.close();
    return true;
}

static bool writeObjMaterialsToFile(const std::string& filename, const ObjMaterials& materials)
{
    std::ofstream outFile(filename);

    if (!outFile)
    {
        std::cerr << "Error: Could not open file " << filename << " for writing.\n";
        return false;
    }

    for (const auto& mtl : materials)
    {
        outFile << "newmtl " << mtl.name << "\n";
        outFile << "Ka " << mtl.Ka.r << " " << mtl.Ka.g << " " << mtl.Ka.b << "\n";
        outFile << "Kd " << mtl.Kd.r << " " << mtl.Kd.g << " " << mtl.Kd.b << "\n";

        if (mtl.Ks != glm::vec3(0.0f))
        {
            outFile << "Ks " << mtl.Ks.r << " " << mtl.Ks.g << " " << mtl.Ks.b << "\n";
        }

        if (mtl.Ns != 0.0f)
        {
            outFile << "Ns " << mtl.Ns << "\n";
        }

        // 1.f is fully opaque
        if (mtl.d != 1.0f)
        {
            outFile << "d " << mtl.d << "\n";
        }

        if (!mtl.map_Kd.empty())
        {
            outFile << "map_Kd " << mtl.map_Kd << "\n";
        }

        outFile << "\n";
    }

    outFile.close();
    return static_cast<bool>(outFile);
}
