#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <array>
#include <cstdint>
#include <vector>

namespace pt
{
    struct Face
    {
        // Local to the owning mesh until encoded.
        std::array<std::uint32_t, 3> indices{ 0, 0, 0 };
        std::array<glm::vec3, 3> normals{ glm::vec3(0.0f), glm::vec3(0.0f), glm::vec3(0.0f) };
        std::uint32_t materialIndex = 0;

        // edge0 = v1 - v0, edge1 = v2 - v0. Only meaningful after baking.
        std::array<glm::vec3, 2> edges{ glm::vec3(0.0f), glm::vec3(0.0f) };
    };

    struct Material
    {
        glm::vec3 albedo = glm::vec3(1.0f);
        glm::vec3 emission = glm::vec3(0.0f);
        float roughness = 1.0f;
    };

    struct Mesh
    {
        std::vector<glm::vec3> vertices;
        std::vector<Face> faces;
        std::vector<Material> materials;

        glm::vec3 scale = glm::vec3(1.0f);
        glm::quat rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
        glm::vec3 position = glm::vec3(0.0f);
    };

    struct Scene
    {
        std::vector<Mesh> meshes;
        std::vector<Mesh> bakedMeshes;

        void bake();
    };
}
