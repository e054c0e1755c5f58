#include "SceneLoader.h"

#include <assimp/Importer.hpp>
#include <assimp/material.h>
#include <assimp/postprocess.h>
#include <assimp/scene.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <string>

namespace
{
    static glm::vec3 ToGlm(const aiVector3D& v) { return glm::vec3(v.x, v.y, v.z); }
    static glm::vec3 ToGlm(const aiColor3D& c) { return glm::vec3(c.r, c.g, c.b); }

    static pt::Material ConvertMaterial(const aiMaterial& src)
    {
        pt::Material m;

        aiColor4D base;
        aiColor3D diffuse;
        if (src.Get(AI_MATKEY_BASE_COLOR, base) == AI_SUCCESS)
            m.albedo = glm::vec3(base.r, base.g, base.b);
        else if (src.Get(AI_MATKEY_COLOR_DIFFUSE, diffuse) == AI_SUCCESS)
            m.albedo = ToGlm(diffuse);

        aiColor3D emissive(0.0f, 0.0f, 0.0f);
        if (src.Get(AI_MATKEY_COLOR_EMISSIVE, emissive) == AI_SUCCESS)
        {
            float strength = 1.0f;
            src.Get(AI_MATKEY_EMISSIVE_INTENSITY, strength);
            m.emission = ToGlm(emissive) * strength;
        }

        float roughness = 1.0f;
        if (src.Get(AI_MATKEY_ROUGHNESS_FACTOR, roughness) == AI_SUCCESS)
            m.roughness = roughness;

        return m;
    }

    static bool IsGltf(const std::string& path)
    {
        const std::string::size_type dot = path.find_last_of('.');
        if (dot == std::string::npos)
            return false;
        std::string ext = path.substr(dot + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        return ext == "gltf" || ext == "glb";
    }

    // The glTF importer always appends an unnamed default material after the declared ones and
    // points material-less primitives at it. Returns how many leading materials the file declared.
    static unsigned DeclaredMaterialCount(const aiScene& scene, bool gltf)
    {
        if (!gltf || scene.mNumMaterials < 2)
            return scene.mNumMaterials;

        const aiString name = scene.mMaterials[scene.mNumMaterials - 1]->GetName();
        if (name.length == 0 || std::strcmp(name.C_Str(), AI_DEFAULT_MATERIAL_NAME) == 0)
            return scene.mNumMaterials - 1;
        return scene.mNumMaterials;
    }

    static std::vector<pt::Material> CollectMaterials(const aiScene& scene, unsigned declared)
    {
        std::vector<pt::Material> out;
        out.reserve(declared);
        for (unsigned i = 0; i < declared; ++i)
        {
            const pt::Material m = ConvertMaterial(*scene.mMaterials[i]);
            std::fprintf(stderr, "[SceneLoader] material %u '%s': albedo (%.3f, %.3f, %.3f) emission (%.3f, %.3f, %.3f) roughness %.3f\n",
                i, scene.mMaterials[i]->GetName().C_Str(),
                m.albedo.x, m.albedo.y, m.albedo.z,
                m.emission.x, m.emission.y, m.emission.z, m.roughness);
            out.push_back(m);
        }

        if (out.empty())
            out.push_back(pt::Material{});
        return out;
    }

    static pt::PrimitiveData ReadPrimitive(const aiMesh& mesh, unsigned declaredMaterials)
    {
        pt::PrimitiveData prim;
        prim.positions.reserve(mesh.mNumVertices);
        for (unsigned i = 0; i < mesh.mNumVertices; ++i)
            prim.positions.push_back(ToGlm(mesh.mVertices[i]));

        if (mesh.HasNormals())
        {
            prim.normals.reserve(mesh.mNumVertices);
            for (unsigned i = 0; i < mesh.mNumVertices; ++i)
                prim.normals.push_back(ToGlm(mesh.mNormals[i]));
        }

        prim.indexed = mesh.mNumFaces > 0;
        for (unsigned f = 0; f < mesh.mNumFaces; ++f)
        {
            const aiFace& face = mesh.mFaces[f];
            for (unsigned k = 0; k < face.mNumIndices; ++k)
                prim.indices.push_back(face.mIndices[k]);
        }

        // Anything past the declared list is the importer's stand-in for "no material".
        prim.materialIndex = mesh.mMaterialIndex < declaredMaterials ? (int)mesh.mMaterialIndex : -1;
        return prim;
    }

    static pt::NodeTransform Decompose(const aiMatrix4x4& world)
    {
        aiVector3D scaling, position;
        aiQuaternion rotation;
        world.Decompose(scaling, rotation, position);

        pt::NodeTransform t;
        t.scale = ToGlm(scaling);
        t.rotation = glm::normalize(glm::quat(rotation.w, rotation.x, rotation.y, rotation.z));
        t.translation = ToGlm(position);
        return t;
    }

    static void VisitNode(const aiScene& scene, const aiNode& node, const aiMatrix4x4& parent,
        unsigned declaredMaterials, const std::vector<pt::Material>& materials, std::vector<pt::Mesh>& out)
    {
        const aiMatrix4x4 world = parent * node.mTransformation;

        if (node.mNumMeshes > 0)
        {
            const pt::NodeTransform xform = Decompose(world);
            for (unsigned i = 0; i < node.mNumMeshes; ++i)
            {
                const aiMesh& mesh = *scene.mMeshes[node.mMeshes[i]];
                if ((mesh.mPrimitiveTypes & aiPrimitiveType_TRIANGLE) == 0)
                    continue;
                out.push_back(pt::BuildMesh(ReadPrimitive(mesh, declaredMaterials), xform, materials));
            }
        }

        for (unsigned c = 0; c < node.mNumChildren; ++c)
            VisitNode(scene, *node.mChildren[c], world, declaredMaterials, materials, out);
    }
}

namespace pt
{
    std::vector<std::array<std::uint32_t, 3>> TriangulateIndexed(const std::vector<std::uint32_t>& indices)
    {
        std::vector<std::array<std::uint32_t, 3>> tris;
        tris.reserve(indices.size() / 3);
        for (std::size_t i = 0; i + 2 < indices.size(); i += 3)
            tris.push_back({ indices[i], indices[i + 1], indices[i + 2] });
        return tris;
    }

    std::vector<std::array<std::uint32_t, 3>> TriangulateSequential(std::size_t vertexCount)
    {
        std::vector<std::array<std::uint32_t, 3>> tris;
        tris.reserve(vertexCount / 3);
        for (std::size_t i = 0; i + 2 < vertexCount; i += 3)
            tris.push_back({ (std::uint32_t)i, (std::uint32_t)(i + 1), (std::uint32_t)(i + 2) });
        return tris;
    }

    Mesh BuildMesh(const PrimitiveData& prim, const NodeTransform& xform, const std::vector<Material>& materials)
    {
        Mesh mesh;
        mesh.vertices = prim.positions;
        mesh.materials = materials;
        mesh.scale = xform.scale;
        mesh.rotation = xform.rotation;
        mesh.position = xform.translation;

        std::uint32_t material = 0;
        if (prim.materialIndex >= 0 && (std::size_t)prim.materialIndex < materials.size())
            material = (std::uint32_t)prim.materialIndex;

        const bool hasNormals = prim.normals.size() == prim.positions.size();
        const auto tris = prim.indexed ? TriangulateIndexed(prim.indices)
                                       : TriangulateSequential(prim.positions.size());

        mesh.faces.reserve(tris.size());
        for (const auto& tri : tris)
        {
            Face f;
            for (int k = 0; k < 3; ++k)
            {
                if (tri[k] >= prim.positions.size())
                {
                    throw SceneLoadError("index " + std::to_string(tri[k]) + " out of range for primitive with "
                        + std::to_string(prim.positions.size()) + " vertices");
                }
                f.indices[k] = tri[k];
                f.normals[k] = hasNormals ? prim.normals[tri[k]] : glm::vec3(0.0f, 1.0f, 0.0f);
            }
            f.materialIndex = material;
            mesh.faces.push_back(f);
        }

        return mesh;
    }

    std::vector<Mesh> LoadScene(const std::string& path)
    {
        Assimp::Importer importer;
        importer.SetPropertyInteger(AI_CONFIG_PP_SBP_REMOVE, aiPrimitiveType_POINT | aiPrimitiveType_LINE);

        const aiScene* scene = importer.ReadFile(path, aiProcess_Triangulate | aiProcess_SortByPType);
        if (!scene || !scene->mRootNode || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE))
            throw SceneLoadError("failed to load '" + path + "': " + importer.GetErrorString());

        const unsigned declared = DeclaredMaterialCount(*scene, IsGltf(path));
        const std::vector<Material> materials = CollectMaterials(*scene, declared);

        std::vector<Mesh> meshes;
        VisitNode(*scene, *scene->mRootNode, aiMatrix4x4(), declared, materials, meshes);

        std::size_t faces = 0, vertices = 0;
        for (const Mesh& m : meshes)
        {
            faces += m.faces.size();
            vertices += m.vertices.size();
        }
        std::fprintf(stderr, "[SceneLoader] %s: %zu meshes, %zu vertices, %zu faces, %zu materials\n",
            path.c_str(), meshes.size(), vertices, faces, materials.size());

        return meshes;
    }
}
