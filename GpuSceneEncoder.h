#pragma once

#include "SceneTypes.h"

#include <cstdint>
#include <vector>

namespace pt
{
    // std430 layouts read by Shaders/raytracer.comp. Keep in sync with the shader.
    struct GpuVertex
    {
        float position[3];
        float _pad;
    };

    struct GpuFace
    {
        std::uint32_t indices[3];
        std::uint32_t material;
        float n0[3]; float _pad0;
        float n1[3]; float _pad1;
        float n2[3]; float _pad2;
    };

    struct GpuMaterial
    {
        float albedo[3];
        float roughness;
        float emission[3];
        float _pad;
    };

    struct GpuSceneInfo
    {
        std::uint32_t faceCount;
        std::uint32_t materialCount;
        std::uint32_t _pad[2];
    };

    static_assert(sizeof(GpuVertex) == 16, "GpuVertex must be 16 bytes");
    static_assert(sizeof(GpuFace) == 64, "GpuFace must be 64 bytes");
    static_assert(sizeof(GpuMaterial) == 32, "GpuMaterial must be 32 bytes");
    static_assert(sizeof(GpuSceneInfo) == 16, "GpuSceneInfo must be 16 bytes");

    struct MeshOffsets
    {
        std::uint32_t vertexOffset = 0;
        std::uint32_t materialOffset = 0;
        std::uint32_t faceOffset = 0;
    };

    struct EncodedScene
    {
        std::vector<GpuVertex> vertices;
        std::vector<GpuFace> faces;
        std::vector<GpuMaterial> materials;
        GpuSceneInfo info{};

        // One entry per input mesh, in input order.
        std::vector<MeshOffsets> offsets;
    };

    // Flattens baked meshes into global arrays. Face vertex indices are shifted by the number of
    // vertices emitted before the mesh, material indices by the number of materials emitted before it.
    EncodedScene Encode(const std::vector<Mesh>& bakedMeshes);
}
