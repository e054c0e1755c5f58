#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace pt
{
    // Pitch is kept strictly away from the poles so the basis never degenerates.
    constexpr float kPitchLimit = 1.57079632679489661923f - 0.01f;

    struct Camera
    {
        glm::vec3 position = glm::vec3(0.0f);
        float yaw = 0.0f;
        float pitch = 0.0f;

        glm::vec3 forward = glm::vec3(0.0f, 1.0f, 0.0f);
        glm::vec3 right = glm::vec3(1.0f, 0.0f, 0.0f);
        glm::vec3 up = glm::vec3(0.0f, 0.0f, 1.0f);

        float focalDistance = 4.0f;
        float apertureRadius = 0.05f;

        // Z-up world. Recomputes forward/right/up from yaw and pitch.
        void updateBasis();
    };

    struct GpuCamera
    {
        float position[3]; float _pad0;
        float forward[3];  float _pad1;
        float right[3];    float _pad2;
        float up[3];       float _pad3;
        float focalDistance;
        float apertureRadius;
        float aspectRatio;
        std::uint32_t frame;
    };

    static_assert(sizeof(GpuCamera) == 80, "GpuCamera must be 80 bytes");

    GpuCamera PackCamera(const Camera& cam, float aspectRatio, std::uint32_t frame);
}
