#include "SnapshotCodec.hpp"

#include <algorithm>
#include <cmath>
#include <glm/common.hpp>
#include <limits>
#include <nlohmann/json.hpp>

#include "ClipboardReport.hpp"

using Json = nlohmann::ordered_json;

namespace
{
    // -----------------------------------------------------------------
    // Encoding
    // -----------------------------------------------------------------

    Json vecToJson(const float* v, size_t n)
    {
        Json arr = Json::array();
        for (size_t i = 0; i < n; ++i)
            arr.push_back(v[i]);
        return arr;
    }

    Json edgeToJson(const EdgeKey& edge)
    {
        return Json::array({edge.first, edge.second});
    }

    const char* colorKindName(ColorKind kind) noexcept
    {
        return kind == ColorKind::Rgba ? "RGBA" : "RGB";
    }

    const char* morphKindName(MorphKind kind) noexcept
    {
        return kind == MorphKind::Absolute ? "absolute" : "relative";
    }

    const char* selectionKindName(SelectionKind kind) noexcept
    {
        switch (kind)
        {
            case SelectionKind::Vertex:
                return "vertex";
            case SelectionKind::Edge:
                return "edge";
            case SelectionKind::Polygon:
                return "polygon";
        }
        return "vertex";
    }

    // -----------------------------------------------------------------
    // Decoding
    // -----------------------------------------------------------------

    /// Typed field access that reports the first mismatch as ParseError.
    class JsonReader
    {
    public:
        explicit JsonReader(ClipboardReport& report) : m_report{report}
        {
        }

        bool fail(const std::string& where, const std::string& what)
        {
            m_report.error(ClipboardStatus::ParseError, where + ": " + what);
            return false;
        }

        /// Optional array member: absent or null leaves @p out null.
        bool optionalArray(const Json& parent, const char* key, const Json*& out, const std::string& where)
        {
            out           = nullptr;
            const auto it = parent.find(key);
            if (it == parent.end() || it->is_null())
                return true;
            if (!it->is_array())
                return fail(where + "." + key, "expected an array");
            out = &*it;
            return true;
        }

        bool object(const Json& j, const std::string& where)
        {
            return j.is_object() ? true : fail(where, "expected an object");
        }

        bool number(const Json& j, const std::string& where, float& out)
        {
            if (!j.is_number())
                return fail(where, "expected a number");

            const auto value = j.get<double>();
            if (!std::isfinite(value) || std::abs(value) > std::numeric_limits<float>::max())
                return fail(where, "number out of range");
            out = static_cast<float>(value);
            return true;
        }

        bool integer(const Json& j, const std::string& where, int32_t& out)
        {
            if (!j.is_number_integer())
                return fail(where, "expected an integer");

            // Out-of-range ids are kept out of range for validation to reject
            if (j.is_number_unsigned())
            {
                const auto value = j.get<uint64_t>();
                out = value > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())
                          ? std::numeric_limits<int32_t>::max()
                          : static_cast<int32_t>(value);
                return true;
            }

            const auto value = j.get<int64_t>();
            if (value < 0)
                out = -1;
            else if (value > std::numeric_limits<int32_t>::max())
                out = std::numeric_limits<int32_t>::max();
            else
                out = static_cast<int32_t>(value);
            return true;
        }

        bool string(const Json& j, const std::string& where, std::string& out)
        {
            if (!j.is_string())
                return fail(where, "expected a string");
            out = j.get<std::string>();
            return true;
        }

        bool boolean(const Json& j, const std::string& where, bool& out)
        {
            if (!j.is_boolean())
                return fail(where, "expected a boolean");
            out = j.get<bool>();
            return true;
        }

        /// Required member of an object.
        const Json* member(const Json& parent, const char* key, const std::string& where)
        {
            const auto it = parent.find(key);
            if (it == parent.end())
            {
                fail(where, std::string("missing '") + key + "'");
                return nullptr;
            }
            return &*it;
        }

        bool vec(const Json& j, const std::string& where, float* out, size_t n)
        {
            if (!j.is_array() || j.size() != n)
                return fail(where, "expected an array of " + std::to_string(n) + " numbers");
            for (size_t i = 0; i < n; ++i)
            {
                if (!number(j[i], where, out[i]))
                    return false;
            }
            return true;
        }

        bool edge(const Json& j, const std::string& where, EdgeKey& out)
        {
            if (!j.is_array() || j.size() != 2)
                return fail(where, "expected an edge [a, b]");
            int32_t a = 0;
            int32_t b = 0;
            if (!integer(j[0], where, a) || !integer(j[1], where, b))
                return false;
            out = makeEdgeKey(a, b);
            return true;
        }

        bool corner(const Json& j, const std::string& where, CornerRef& out)
        {
            const Json* poly   = member(j, "polygon", where);
            const Json* corner = poly ? member(j, "corner", where) : nullptr;
            return corner && integer(*poly, where + ".polygon", out.polygon) &&
                   integer(*corner, where + ".corner", out.corner);
        }

    private:
        ClipboardReport& m_report;
    };

    std::string at(const std::string& where, size_t index)
    {
        return where + "[" + std::to_string(index) + "]";
    }

    bool readVersion(const Json& root, ClipboardReport& report)
    {
        const auto it = root.find("schemaVersion");
        if (it == root.end())
        {
            report.error(ClipboardStatus::UnsupportedVersion, "payload has no schemaVersion");
            return false;
        }
        if (!it->is_number_integer())
        {
            report.error(ClipboardStatus::UnsupportedVersion, "schemaVersion is not an integer");
            return false;
        }

        const int64_t version = it->is_number_unsigned() ? static_cast<int64_t>(std::min<uint64_t>(
                                                               it->get<uint64_t>(), std::numeric_limits<int64_t>::max()))
                                                         : it->get<int64_t>();
        if (!SnapshotCodec::supportedVersion(version))
        {
            report.error(ClipboardStatus::UnsupportedVersion,
                         "schemaVersion " + std::to_string(version) + " is not supported");
            return false;
        }
        return true;
    }

    bool readHeader(JsonReader& rd, const Json& root, MeshSnapshot& snap, ClipboardReport& report)
    {
        if (const auto it = root.find("format"); it != root.end())
        {
            std::string format;
            if (!rd.string(*it, "format", format))
                return false;
            if (format != SnapshotCodec::kFormatTag)
                return rd.fail("format", "not a " + std::string(SnapshotCodec::kFormatTag) + " payload");
        }

        if (const auto it = root.find("coordinateConvention"); it != root.end())
        {
            std::string name;
            if (!rd.string(*it, "coordinateConvention", name))
                return false;
            const std::optional<CoordinateConvention> convention = parseConvention(name);
            if (!convention)
                return rd.fail("coordinateConvention", "unknown convention '" + name + "'");
            snap.convention = *convention;
        }
        else
        {
            report.warning("payload has no coordinateConvention, assuming RH_Yup");
        }

        if (const auto it = root.find("metadata"); it != root.end())
        {
            if (!rd.object(*it, "metadata"))
                return false;
            const Json& meta = *it;

            if (const auto m = meta.find("sourceApplication"); m != meta.end())
            {
                if (!rd.string(*m, "metadata.sourceApplication", snap.metadata.sourceApplication))
                    return false;
            }
            if (const auto m = meta.find("unitScale"); m != meta.end())
            {
                if (!rd.number(*m, "metadata.unitScale", snap.metadata.unitScale))
                    return false;
                if (!(snap.metadata.unitScale > 0.f))
                {
                    report.warning("metadata.unitScale must be positive, using 1.0");
                    snap.metadata.unitScale = 1.f;
                }
            }
            if (const auto m = meta.find("objectName"); m != meta.end())
            {
                if (!rd.string(*m, "metadata.objectName", snap.metadata.objectName))
                    return false;
            }
        }
        return true;
    }

    bool readGeometry(JsonReader& rd, const Json& root, MeshSnapshot& snap)
    {
        const Json* arr = nullptr;

        if (!rd.optionalArray(root, "vertices", arr, "root"))
            return false;
        if (arr)
        {
            snap.vertices.reserve(arr->size());
            for (size_t i = 0; i < arr->size(); ++i)
            {
                SnapshotVertex v;
                if (!rd.vec((*arr)[i], at("vertices", i), &v.position[0], 3))
                    return false;
                snap.vertices.push_back(v);
            }
        }

        if (!rd.optionalArray(root, "polygons", arr, "root"))
            return false;
        if (arr)
        {
            snap.polygons.reserve(arr->size());
            for (size_t i = 0; i < arr->size(); ++i)
            {
                const Json&       jp    = (*arr)[i];
                const std::string where = at("polygons", i);
                if (!rd.object(jp, where))
                    return false;

                SnapshotPolygon poly;

                const Json* verts = rd.member(jp, "vertices", where);
                if (!verts)
                    return false;
                if (!verts->is_array())
                    return rd.fail(where + ".vertices", "expected an array");
                for (const Json& jv : *verts)
                {
                    int32_t id = 0;
                    if (!rd.integer(jv, where + ".vertices", id))
                        return false;
                    poly.vertices.push_back(id);
                }

                if (const auto m = jp.find("material"); m != jp.end() && !m->is_null())
                {
                    int32_t material = 0;
                    if (!rd.integer(*m, where + ".material", material))
                        return false;
                    poly.material = material;
                }

                if (const auto m = jp.find("subdivision"); m != jp.end())
                {
                    if (!rd.boolean(*m, where + ".subdivision", poly.isSubdivisionSurface))
                        return false;
                }

                if (const auto m = jp.find("irregular"); m != jp.end())
                {
                    bool irregular = false;
                    if (!rd.boolean(*m, where + ".irregular", irregular))
                        return false;
                    poly.origin = irregular ? PolygonOrigin::TriangulatedFromIrregular : PolygonOrigin::Regular;
                }

                snap.polygons.push_back(std::move(poly));
            }
        }
        return true;
    }

    bool readMaterials(JsonReader& rd, const Json& root, MeshSnapshot& snap)
    {
        const Json* arr = nullptr;
        if (!rd.optionalArray(root, "materials", arr, "root"))
            return false;
        if (!arr)
            return true;

        for (size_t i = 0; i < arr->size(); ++i)
        {
            const Json&       jm    = (*arr)[i];
            const std::string where = at("materials", i);
            if (!rd.object(jm, where))
                return false;

            SnapshotMaterial mat;
            const Json*      name = rd.member(jm, "name", where);
            if (!name || !rd.string(*name, where + ".name", mat.name))
                return false;

            if (const auto m = jm.find("diffuse"); m != jm.end())
            {
                if (!rd.vec(*m, where + ".diffuse", &mat.diffuse[0], 3))
                    return false;
                mat.diffuse = glm::clamp(mat.diffuse, glm::vec3(0.f), glm::vec3(1.f));
            }

            if (const auto m = jm.find("texture"); m != jm.end() && !m->is_null())
            {
                std::string path;
                if (!rd.string(*m, where + ".texture", path))
                    return false;
                mat.texturePath = std::move(path);
            }

            snap.materials.push_back(std::move(mat));
        }
        return true;
    }

    bool readCornerMaps(JsonReader& rd, const Json& root, MeshSnapshot& snap, ClipboardReport& report)
    {
        const Json* arr = nullptr;
        if (!rd.optionalArray(root, "uvMaps", arr, "root"))
            return false;
        if (arr)
        {
            bool havePrimary = false;
            for (size_t i = 0; i < arr->size(); ++i)
            {
                const Json&       jm    = (*arr)[i];
                const std::string where = at("uvMaps", i);
                if (!rd.object(jm, where))
                    return false;

                SnapshotUvMap map;
                const Json*   name = rd.member(jm, "name", where);
                if (!name || !rd.string(*name, where + ".name", map.name))
                    return false;

                if (const auto m = jm.find("primary"); m != jm.end())
                {
                    if (!rd.boolean(*m, where + ".primary", map.primary))
                        return false;
                }
                if (map.primary && havePrimary)
                {
                    report.warning("UV map '" + map.name + "' is not the first primary UV map; primary flag dropped");
                    map.primary = false;
                }
                havePrimary |= map.primary;

                const Json* values = nullptr;
                if (!rd.optionalArray(jm, "values", values, where))
                    return false;
                for (size_t k = 0; values && k < values->size(); ++k)
                {
                    const Json&       jv     = (*values)[k];
                    const std::string vwhere = at(where + ".values", k);
                    CornerRef         ref;
                    glm::vec2         uv{0.f};
                    const Json*       juv = nullptr;
                    if (!rd.object(jv, vwhere) || !rd.corner(jv, vwhere, ref) || !(juv = rd.member(jv, "uv", vwhere)) ||
                        !rd.vec(*juv, vwhere + ".uv", &uv[0], 2))
                        return false;
                    map.values[ref] = uv;
                }

                snap.uvMaps.push_back(std::move(map));
            }
        }

        if (!rd.optionalArray(root, "colorMaps", arr, "root"))
            return false;
        if (arr)
        {
            for (size_t i = 0; i < arr->size(); ++i)
            {
                const Json&       jm    = (*arr)[i];
                const std::string where = at("colorMaps", i);
                if (!rd.object(jm, where))
                    return false;

                SnapshotColorMap map;
                const Json*      name = rd.member(jm, "name", where);
                if (!name || !rd.string(*name, where + ".name", map.name))
                    return false;

                if (const auto m = jm.find("kind"); m != jm.end())
                {
                    std::string kind;
                    if (!rd.string(*m, where + ".kind", kind))
                        return false;
                    if (kind == "RGB")
                        map.kind = ColorKind::Rgb;
                    else if (kind == "RGBA")
                        map.kind = ColorKind::Rgba;
                    else
                        return rd.fail(where + ".kind", "unknown color kind '" + kind + "'");
                }

                const size_t dim    = map.kind == ColorKind::Rgba ? 4 : 3;
                const Json*  values = nullptr;
                if (!rd.optionalArray(jm, "values", values, where))
                    return false;
                for (size_t k = 0; values && k < values->size(); ++k)
                {
                    const Json&       jv     = (*values)[k];
                    const std::string vwhere = at(where + ".values", k);
                    CornerRef         ref;
                    glm::vec4         color{0.f, 0.f, 0.f, 1.f};
                    const Json*       jc = nullptr;
                    if (!rd.object(jv, vwhere) || !rd.corner(jv, vwhere, ref) ||
                        !(jc = rd.member(jv, "color", vwhere)) || !rd.vec(*jc, vwhere + ".color", &color[0], dim))
                        return false;
                    map.values[ref] = color;
                }

                snap.colorMaps.push_back(std::move(map));
            }
        }
        return true;
    }

    bool readVertexMaps(JsonReader& rd, const Json& root, MeshSnapshot& snap)
    {
        const Json* arr = nullptr;
        if (!rd.optionalArray(root, "weightMaps", arr, "root"))
            return false;
        for (size_t i = 0; arr && i < arr->size(); ++i)
        {
            const Json&       jm    = (*arr)[i];
            const std::string where = at("weightMaps", i);
            if (!rd.object(jm, where))
                return false;

            SnapshotWeightMap map;
            const Json*       name = rd.member(jm, "name", where);
            if (!name || !rd.string(*name, where + ".name", map.name))
                return false;

            const Json* weights = nullptr;
            if (!rd.optionalArray(jm, "weights", weights, where))
                return false;
            for (size_t k = 0; weights && k < weights->size(); ++k)
            {
                const Json&       jw     = (*weights)[k];
                const std::string wwhere = at(where + ".weights", k);
                int32_t           vert   = 0;
                float             weight = 0.f;
                const Json*       jv     = nullptr;
                const Json*       jwt    = nullptr;
                if (!rd.object(jw, wwhere) || !(jv = rd.member(jw, "vertex", wwhere)) ||
                    !(jwt = rd.member(jw, "weight", wwhere)) || !rd.integer(*jv, wwhere + ".vertex", vert) ||
                    !rd.number(*jwt, wwhere + ".weight", weight))
                    return false;
                map.weights[vert] = weight;
            }

            snap.weightMaps.push_back(std::move(map));
        }

        if (!rd.optionalArray(root, "morphs", arr, "root"))
            return false;
        for (size_t i = 0; arr && i < arr->size(); ++i)
        {
            const Json&       jm    = (*arr)[i];
            const std::string where = at("morphs", i);
            if (!rd.object(jm, where))
                return false;

            SnapshotMorph morph;
            const Json*   name = rd.member(jm, "name", where);
            if (!name || !rd.string(*name, where + ".name", morph.name))
                return false;

            if (const auto m = jm.find("kind"); m != jm.end())
            {
                std::string kind;
                if (!rd.string(*m, where + ".kind", kind))
                    return false;
                if (kind == "relative")
                    morph.kind = MorphKind::Relative;
                else if (kind == "absolute")
                    morph.kind = MorphKind::Absolute;
                else
                    return rd.fail(where + ".kind", "unknown morph kind '" + kind + "'");
            }

            const Json* values = nullptr;
            if (!rd.optionalArray(jm, "values", values, where))
                return false;
            for (size_t k = 0; values && k < values->size(); ++k)
            {
                const Json&       jv     = (*values)[k];
                const std::string vwhere = at(where + ".values", k);
                int32_t           vert   = 0;
                glm::vec3         pos{0.f};
                const Json*       jid    = nullptr;
                const Json*       jpos   = nullptr;
                if (!rd.object(jv, vwhere) || !(jid = rd.member(jv, "vertex", vwhere)) ||
                    !(jpos = rd.member(jv, "position", vwhere)) || !rd.integer(*jid, vwhere + ".vertex", vert) ||
                    !rd.vec(*jpos, vwhere + ".position", &pos[0], 3))
                    return false;
                morph.values[vert] = pos;
            }

            snap.morphs.push_back(std::move(morph));
        }
        return true;
    }

    bool readEdgeData(JsonReader& rd, const Json& root, MeshSnapshot& snap)
    {
        const Json* arr = nullptr;
        if (!rd.optionalArray(root, "subdivisionWeights", arr, "root"))
            return false;
        for (size_t i = 0; arr && i < arr->size(); ++i)
        {
            const Json&       je     = (*arr)[i];
            const std::string where  = at("subdivisionWeights", i);
            EdgeKey           edge;
            float             weight = 0.f;
            const Json*       jedge  = nullptr;
            const Json*       jw     = nullptr;
            if (!rd.object(je, where) || !(jedge = rd.member(je, "edge", where)) ||
                !(jw = rd.member(je, "weight", where)) || !rd.edge(*jedge, where + ".edge", edge) ||
                !rd.number(*jw, where + ".weight", weight))
                return false;
            snap.subdivisionWeights.weights[edge] = weight;
        }

        if (!rd.optionalArray(root, "selectionSets", arr, "root"))
            return false;
        for (size_t i = 0; arr && i < arr->size(); ++i)
        {
            const Json&       js    = (*arr)[i];
            const std::string where = at("selectionSets", i);
            if (!rd.object(js, where))
                return false;

            SnapshotSelectionSet set;
            const Json*          name = rd.member(js, "name", where);
            const Json*          kind = name ? rd.member(js, "kind", where) : nullptr;
            std::string          kindName;
            if (!kind || !rd.string(*name, where + ".name", set.name) || !rd.string(*kind, where + ".kind", kindName))
                return false;

            if (kindName == "vertex")
                set.kind = SelectionKind::Vertex;
            else if (kindName == "edge")
                set.kind = SelectionKind::Edge;
            else if (kindName == "polygon")
                set.kind = SelectionKind::Polygon;
            else
                return rd.fail(where + ".kind", "unknown selection kind '" + kindName + "'");

            if (set.kind == SelectionKind::Edge)
            {
                const Json* edges = nullptr;
                if (!rd.optionalArray(js, "edges", edges, where))
                    return false;
                for (size_t k = 0; edges && k < edges->size(); ++k)
                {
                    EdgeKey edge;
                    if (!rd.edge((*edges)[k], at(where + ".edges", k), edge))
                        return false;
                    set.edges.insert(edge);
                }
            }
            else
            {
                const Json* elements = nullptr;
                if (!rd.optionalArray(js, "elements", elements, where))
                    return false;
                for (size_t k = 0; elements && k < elements->size(); ++k)
                {
                    int32_t id = 0;
                    if (!rd.integer((*elements)[k], at(where + ".elements", k), id))
                        return false;
                    set.elements.insert(id);
                }
            }

            snap.selectionSets.push_back(std::move(set));
        }
        return true;
    }
} // namespace

SnapshotCodec::SnapshotCodec(int indent) noexcept : m_indent{indent}
{
}

bool SnapshotCodec::supportedVersion(int64_t version) noexcept
{
    return std::ranges::find(kSupportedVersions, version) != kSupportedVersions.end();
}

std::string SnapshotCodec::encode(const MeshSnapshot& snapshot) const
{
    Json root;
    root["format"]               = std::string(kFormatTag);
    root["schemaVersion"]        = snapshot.schemaVersion;
    root["coordinateConvention"] = std::string(conventionName(snapshot.convention));
    root["metadata"]             = {{"sourceApplication", snapshot.metadata.sourceApplication},
                                    {"unitScale", snapshot.metadata.unitScale},
                                    {"objectName", snapshot.metadata.objectName}};

    Json& vertices = root["vertices"] = Json::array();
    for (const SnapshotVertex& v : snapshot.vertices)
        vertices.push_back(vecToJson(&v.position[0], 3));

    Json& polygons = root["polygons"] = Json::array();
    for (const SnapshotPolygon& p : snapshot.polygons)
    {
        Json jp;
        jp["vertices"]    = p.vertices;
        jp["material"]    = p.material ? Json(*p.material) : Json(nullptr);
        jp["subdivision"] = p.isSubdivisionSurface;
        jp["irregular"]   = p.origin == PolygonOrigin::TriangulatedFromIrregular;
        polygons.push_back(std::move(jp));
    }

    Json& materials = root["materials"] = Json::array();
    for (const SnapshotMaterial& m : snapshot.materials)
    {
        Json jm;
        jm["name"]    = m.name;
        jm["diffuse"] = vecToJson(&m.diffuse[0], 3);
        if (m.texturePath)
            jm["texture"] = *m.texturePath;
        materials.push_back(std::move(jm));
    }

    Json& uvMaps = root["uvMaps"] = Json::array();
    for (const SnapshotUvMap& map : snapshot.uvMaps)
    {
        Json values = Json::array();
        for (const auto& [ref, uv] : map.values)
            values.push_back({{"polygon", ref.polygon}, {"corner", ref.corner}, {"uv", vecToJson(&uv[0], 2)}});
        uvMaps.push_back({{"name", map.name}, {"primary", map.primary}, {"values", std::move(values)}});
    }

    Json& colorMaps = root["colorMaps"] = Json::array();
    for (const SnapshotColorMap& map : snapshot.colorMaps)
    {
        const size_t dim    = map.kind == ColorKind::Rgba ? 4 : 3;
        Json         values = Json::array();
        for (const auto& [ref, color] : map.values)
            values.push_back({{"polygon", ref.polygon}, {"corner", ref.corner}, {"color", vecToJson(&color[0], dim)}});
        colorMaps.push_back({{"name", map.name}, {"kind", colorKindName(map.kind)}, {"values", std::move(values)}});
    }

    Json& weightMaps = root["weightMaps"] = Json::array();
    for (const SnapshotWeightMap& map : snapshot.weightMaps)
    {
        Json weights = Json::array();
        for (const auto& [vert, weight] : map.weights)
            weights.push_back({{"vertex", vert}, {"weight", weight}});
        weightMaps.push_back({{"name", map.name}, {"weights", std::move(weights)}});
    }

    Json& morphs = root["morphs"] = Json::array();
    for (const SnapshotMorph& morph : snapshot.morphs)
    {
        Json values = Json::array();
        for (const auto& [vert, pos] : morph.values)
            values.push_back({{"vertex", vert}, {"position", vecToJson(&pos[0], 3)}});
        morphs.push_back({{"name", morph.name}, {"kind", morphKindName(morph.kind)}, {"values", std::move(values)}});
    }

    Json& creases = root["subdivisionWeights"] = Json::array();
    for (const auto& [edge, weight] : snapshot.subdivisionWeights.weights)
        creases.push_back({{"edge", edgeToJson(edge)}, {"weight", weight}});

    Json& sets = root["selectionSets"] = Json::array();
    for (const SnapshotSelectionSet& set : snapshot.selectionSets)
    {
        Json js;
        js["name"] = set.name;
        js["kind"] = selectionKindName(set.kind);
        if (set.kind == SelectionKind::Edge)
        {
            Json edges = Json::array();
            for (const EdgeKey& edge : set.edges)
                edges.push_back(edgeToJson(edge));
            js["edges"] = std::move(edges);
        }
        else
        {
            js["elements"] = set.elements;
        }
        sets.push_back(std::move(js));
    }

    return root.dump(m_indent, ' ', false, Json::error_handler_t::replace);
}

bool SnapshotCodec::decode(std::string_view text, MeshSnapshot& out, ClipboardReport& report) const
{
    const Json root = Json::parse(text.begin(), text.end(), nullptr, false);
    if (root.is_discarded())
    {
        report.error(ClipboardStatus::ParseError, "clipboard payload is not valid JSON");
        return false;
    }
    if (!root.is_object())
    {
        report.error(ClipboardStatus::ParseError, "clipboard payload is not a JSON object");
        return false;
    }

    if (!readVersion(root, report))
        return false;

    MeshSnapshot snapshot;
    JsonReader   rd{report};

    if (!readHeader(rd, root, snapshot, report) || !readGeometry(rd, root, snapshot) ||
        !readMaterials(rd, root, snapshot) || !readCornerMaps(rd, root, snapshot, report) ||
        !readVertexMaps(rd, root, snapshot) || !readEdgeData(rd, root, snapshot))
        return false;

    if (!validateSnapshot(snapshot, report))
        return false;

    clampSnapshotWeights(snapshot, report);

    out = std::move(snapshot);
    return true;
}
