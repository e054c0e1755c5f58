#include "Camera.h"

#include <cmath>

namespace pt
{
    void Camera::updateBasis()
    {
        const glm::vec3 worldUp(0.0f, 0.0f, 1.0f);

        forward = glm::vec3(
            std::sin(yaw) * std::cos(pitch),
            std::cos(yaw) * std::cos(pitch),
            std::sin(pitch));
        right = glm::normalize(glm::cross(forward, worldUp));
        up = glm::normalize(glm::cross(right, forward));
    }

    GpuCamera PackCamera(const Camera& cam, float aspectRatio, std::uint32_t frame)
    {
        GpuCamera g{};
        auto store = [](float (&dst)[3], const glm::vec3& v) { dst[0] = v.x; dst[1] = v.y; dst[2] = v.z; };
        store(g.position, cam.position);
        store(g.forward, cam.forward);
        store(g.right, cam.right);
        store(g.up, cam.up);
        g.focalDistance = cam.focalDistance;
        g.apertureRadius = cam.apertureRadius;
        g.aspectRatio = aspectRatio;
        g.frame = frame;
        return g;
    }
}
