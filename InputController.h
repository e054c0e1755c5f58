#pragma once

#include "Camera.h"
#include "InputState.h"

#include <glm/glm.hpp>

namespace pt
{
    struct InputSettings
    {
        float moveSpeed = 2.0f;          // world units per second
        float mouseSensitivity = 0.002f; // radians per unit of motion
    };

    // Collects held keys and mouse motion between ticks and folds them into the camera.
    class InputController
    {
    public:
        explicit InputController(const InputSettings& settings = {});

        void keyDown(plat::Key key) { mHeld.insert(key); }
        void keyUp(plat::Key key) { mHeld.erase(key); }
        bool isHeld(plat::Key key) const { return mHeld.contains(key); }

        void addMouseMotion(float dx, float dy);
        glm::vec2 pendingMouseDelta() const { return mMouseDelta; }

        bool locked() const { return mLocked; }
        void setLocked(bool locked) { mLocked = locked; }
        void toggleLock() { mLocked = !mLocked; }

        const InputSettings& settings() const { return mSettings; }

        // Applies look then movement. Clears the mouse delta. Returns true if the camera moved.
        bool update(float dt, Camera& camera);

    private:
        InputSettings mSettings;
        plat::KeySet mHeld;
        glm::vec2 mMouseDelta = glm::vec2(0.0f);
        bool mLocked = false;
    };
}
