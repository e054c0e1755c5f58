#include "InputController.h"

#include <algorithm>
#include <cmath>

namespace pt
{
    InputController::InputController(const InputSettings& settings)
        : mSettings(settings)
    {
    }

    void InputController::addMouseMotion(float dx, float dy)
    {
        mMouseDelta.x += dx;
        mMouseDelta.y += dy;
    }

    bool InputController::update(float dt, Camera& camera)
    {
        camera.yaw -= mMouseDelta.x * mSettings.mouseSensitivity;
        camera.pitch -= mMouseDelta.y * mSettings.mouseSensitivity;
        // Open interval: the pitch never reaches the limit itself.
        const float limit = std::nextafter(kPitchLimit, 0.0f);
        camera.pitch = std::clamp(camera.pitch, -limit, limit);
        mMouseDelta = glm::vec2(0.0f);

        camera.updateBasis();

        if (mLocked)
            return false;

        const float step = mSettings.moveSpeed * dt;
        bool moved = false;

        auto move = [&](plat::Key key, const glm::vec3& dir) {
            if (!mHeld.contains(key)) return;
            camera.position += dir * step;
            moved = true;
        };

        move(plat::Key::W, camera.forward);
        move(plat::Key::S, -camera.forward);
        move(plat::Key::D, camera.right);
        move(plat::Key::A, -camera.right);
        move(plat::Key::Space, -camera.up);
        move(plat::Key::LeftShift, camera.up);

        return moved;
    }
}
