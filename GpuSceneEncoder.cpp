#include "GpuSceneEncoder.h"

#include <cstdio>

namespace
{
    static void Store(float (&dst)[3], const glm::vec3& v)
    {
        dst[0] = v.x;
        dst[1] = v.y;
        dst[2] = v.z;
    }
}

namespace pt
{
    EncodedScene Encode(const std::vector<Mesh>& bakedMeshes)
    {
        EncodedScene out;

        std::size_t vertexTotal = 0, faceTotal = 0, materialTotal = 0;
        for (const Mesh& m : bakedMeshes)
        {
            vertexTotal += m.vertices.size();
            faceTotal += m.faces.size();
            materialTotal += m.materials.size();
        }
        out.vertices.reserve(vertexTotal);
        out.faces.reserve(faceTotal);
        out.materials.reserve(materialTotal);
        out.offsets.reserve(bakedMeshes.size());

        for (const Mesh& m : bakedMeshes)
        {
            MeshOffsets o;
            o.vertexOffset = (std::uint32_t)out.vertices.size();
            o.materialOffset = (std::uint32_t)out.materials.size();
            o.faceOffset = (std::uint32_t)out.faces.size();
            out.offsets.push_back(o);

            for (const Face& f : m.faces)
            {
                GpuFace g{};
                for (int k = 0; k < 3; ++k)
                    g.indices[k] = f.indices[k] + o.vertexOffset;
                g.material = f.materialIndex + o.materialOffset;
                Store(g.n0, f.normals[0]);
                Store(g.n1, f.normals[1]);
                Store(g.n2, f.normals[2]);
                out.faces.push_back(g);
            }

            for (const glm::vec3& v : m.vertices)
            {
                GpuVertex g{};
                Store(g.position, v);
                out.vertices.push_back(g);
            }

            for (const Material& mat : m.materials)
            {
                GpuMaterial g{};
                Store(g.albedo, mat.albedo);
                g.roughness = mat.roughness;
                Store(g.emission, mat.emission);
                out.materials.push_back(g);
            }
        }

        out.info.faceCount = (std::uint32_t)out.faces.size();
        out.info.materialCount = (std::uint32_t)out.materials.size();

        std::fprintf(stderr, "[Encoder] %zu meshes -> %zu vertices, %zu faces, %zu materials\n",
            bakedMeshes.size(), out.vertices.size(), out.faces.size(), out.materials.size());

        return out;
    }
}
