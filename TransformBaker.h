#pragma once

#include "SceneTypes.h"

#include <vector>

namespace pt
{
    // world = rotation * (scale * local) + position. Normals are rotated and renormalized,
    // edges are recomputed from the baked vertices. The input mesh is left untouched.
    Mesh Bake(const Mesh& mesh);

    std::vector<Mesh> BakeAll(const std::vector<Mesh>& meshes);
}
