#pragma once

#include "SceneTypes.h"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace pt
{
    class SceneLoadError : public std::runtime_error
    {
    public:
        explicit SceneLoadError(const std::string& what) : std::runtime_error(what) {}
    };

    // One triangle primitive as read from the source file, before triangulation.
    struct PrimitiveData
    {
        std::vector<glm::vec3> positions;
        std::vector<glm::vec3> normals;        // empty or one per position
        std::vector<std::uint32_t> indices;    // empty for non-indexed primitives
        bool indexed = false;
        int materialIndex = -1;                // -1 when the primitive has none
    };

    struct NodeTransform
    {
        glm::vec3 scale = glm::vec3(1.0f);
        glm::quat rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
        glm::vec3 translation = glm::vec3(0.0f);
    };

    // Consecutive triples; a trailing group smaller than 3 is dropped.
    std::vector<std::array<std::uint32_t, 3>> TriangulateIndexed(const std::vector<std::uint32_t>& indices);
    std::vector<std::array<std::uint32_t, 3>> TriangulateSequential(std::size_t vertexCount);

    // Throws SceneLoadError if an index references a vertex past the end of the primitive.
    Mesh BuildMesh(const PrimitiveData& prim, const NodeTransform& xform, const std::vector<Material>& materials);

    // Reads any assimp-supported file (.glb/.gltf primarily). Throws SceneLoadError on failure.
    std::vector<Mesh> LoadScene(const std::string& path);
}
