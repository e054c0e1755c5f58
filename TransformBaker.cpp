#include "TransformBaker.h"

#include <glm/gtc/quaternion.hpp>

#include <cmath>

namespace
{
    static glm::vec3 RotateNormal(const glm::quat& rotation, const glm::vec3& n)
    {
        glm::vec3 r = rotation * n;
        const float len2 = glm::dot(r, r);
        if (len2 <= 1e-20f)
            return rotation * glm::vec3(0.0f, 1.0f, 0.0f);
        return r / std::sqrt(len2);
    }
}

namespace pt
{
    Mesh Bake(const Mesh& mesh)
    {
        Mesh baked = mesh;

        for (glm::vec3& v : baked.vertices)
            v = baked.rotation * (v * baked.scale) + baked.position;

        for (Face& f : baked.faces)
        {
            for (glm::vec3& n : f.normals)
                n = RotateNormal(baked.rotation, n);

            const glm::vec3& v0 = baked.vertices[f.indices[0]];
            const glm::vec3& v1 = baked.vertices[f.indices[1]];
            const glm::vec3& v2 = baked.vertices[f.indices[2]];
            f.edges[0] = v1 - v0;
            f.edges[1] = v2 - v0;
        }

        return baked;
    }

    std::vector<Mesh> BakeAll(const std::vector<Mesh>& meshes)
    {
        std::vector<Mesh> out;
        out.reserve(meshes.size());
        for (const Mesh& m : meshes)
            out.push_back(Bake(m));
        return out;
    }

    void Scene::bake()
    {
        bakedMeshes = BakeAll(meshes);
    }
}
