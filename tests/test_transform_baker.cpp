#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <glm/gtc/epsilon.hpp>
#include <glm/gtc/quaternion.hpp>

#include "TransformBaker.h"

static bool approxEqual(const glm::vec3& a, const glm::vec3& b, float eps = 0.0001f) {
    return glm::all(glm::epsilonEqual(a, b, eps));
}

static pt::Mesh makeTriangleMesh() {
    pt::Mesh m;
    m.vertices = { {0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f} };
    pt::Face f;
    f.indices = { 0, 1, 2 };
    f.normals = { glm::vec3(0, 0, 1), glm::vec3(0, 0, 1), glm::vec3(0, 0, 1) };
    m.faces.push_back(f);
    m.materials.push_back(pt::Material{});
    return m;
}

TEST_SUITE("TransformBaker") {
    TEST_CASE("identity transform leaves vertices unchanged") {
        pt::Mesh m = makeTriangleMesh();
        pt::Mesh baked = pt::Bake(m);

        REQUIRE(baked.vertices.size() == 3);
        for (size_t i = 0; i < 3; ++i)
            CHECK(approxEqual(baked.vertices[i], m.vertices[i]));
    }

    TEST_CASE("vertex is scaled, rotated then translated") {
        pt::Mesh m = makeTriangleMesh();
        m.scale = glm::vec3(2.0f, 3.0f, 4.0f);
        m.rotation = glm::angleAxis(glm::radians(90.0f), glm::vec3(0, 0, 1));
        m.position = glm::vec3(10.0f, 20.0f, 30.0f);

        pt::Mesh baked = pt::Bake(m);

        for (size_t i = 0; i < m.vertices.size(); ++i) {
            const glm::vec3 expected = m.rotation * (m.scale * m.vertices[i]) + m.position;
            CHECK(approxEqual(baked.vertices[i], expected));
        }
        // (1,0,0) scaled to (2,0,0), rotated to (0,2,0), translated.
        CHECK(approxEqual(baked.vertices[1], glm::vec3(10.0f, 22.0f, 30.0f)));
    }

    TEST_CASE("edges are recomputed from baked vertices") {
        pt::Mesh m = makeTriangleMesh();
        m.faces[0].edges = { glm::vec3(99.0f), glm::vec3(-99.0f) };
        m.scale = glm::vec3(3.0f);
        m.position = glm::vec3(1.0f, 1.0f, 1.0f);

        pt::Mesh baked = pt::Bake(m);
        const pt::Face& f = baked.faces[0];

        CHECK(approxEqual(f.edges[0], baked.vertices[1] - baked.vertices[0]));
        CHECK(approxEqual(f.edges[1], baked.vertices[2] - baked.vertices[0]));
        CHECK(approxEqual(f.edges[0], glm::vec3(3.0f, 0.0f, 0.0f)));
    }

    TEST_CASE("normals are rotated but not scaled") {
        pt::Mesh m = makeTriangleMesh();
        m.scale = glm::vec3(5.0f, 5.0f, 0.5f);
        m.rotation = glm::angleAxis(glm::radians(90.0f), glm::vec3(1, 0, 0));

        pt::Mesh baked = pt::Bake(m);
        for (const glm::vec3& n : baked.faces[0].normals) {
            CHECK(glm::length(n) == doctest::Approx(1.0f));
            CHECK(approxEqual(n, glm::vec3(0.0f, -1.0f, 0.0f)));
        }
    }

    TEST_CASE("non-unit source normals come out unit length") {
        pt::Mesh m = makeTriangleMesh();
        m.faces[0].normals = { glm::vec3(0, 0, 3), glm::vec3(2, 0, 0), glm::vec3(0, 0.5f, 0) };

        pt::Mesh baked = pt::Bake(m);
        for (const glm::vec3& n : baked.faces[0].normals)
            CHECK(glm::length(n) == doctest::Approx(1.0f));
    }

    TEST_CASE("input mesh is not modified and baking is repeatable") {
        pt::Mesh m = makeTriangleMesh();
        m.position = glm::vec3(1.0f, 2.0f, 3.0f);

        pt::Mesh a = pt::Bake(m);
        pt::Mesh b = pt::Bake(m);

        CHECK(approxEqual(m.vertices[1], glm::vec3(1.0f, 0.0f, 0.0f)));
        for (size_t i = 0; i < a.vertices.size(); ++i)
            CHECK(a.vertices[i] == b.vertices[i]);
    }

    TEST_CASE("mesh with no faces bakes vertices only") {
        pt::Mesh m;
        m.vertices = { {1.0f, 1.0f, 1.0f} };
        m.position = glm::vec3(1.0f, 0.0f, 0.0f);

        pt::Mesh baked = pt::Bake(m);
        CHECK(baked.faces.empty());
        CHECK(approxEqual(baked.vertices[0], glm::vec3(2.0f, 1.0f, 1.0f)));
    }

    TEST_CASE("Scene::bake rebuilds baked list from meshes") {
        pt::Scene scene;
        scene.meshes.push_back(makeTriangleMesh());
        scene.meshes.push_back(makeTriangleMesh());
        scene.meshes[1].position = glm::vec3(0.0f, 0.0f, 5.0f);

        scene.bake();
        REQUIRE(scene.bakedMeshes.size() == 2);
        CHECK(approxEqual(scene.bakedMeshes[1].vertices[0], glm::vec3(0.0f, 0.0f, 5.0f)));

        scene.meshes.pop_back();
        scene.bake();
        CHECK(scene.bakedMeshes.size() == 1);
    }
}
