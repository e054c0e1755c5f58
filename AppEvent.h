#pragma once

#include "InputState.h"

#include <variant>

namespace plat {

    struct CloseRequested {};

    struct Resized {
        int width = 0;
        int height = 0;
    };

    struct KeyInput {
        Key key = Key::COUNT;
        bool pressed = false;
        bool repeat = false;
    };

    struct MouseMotion {
        float dx = 0.0f;
        float dy = 0.0f;
    };

    struct RedrawRequested {};

    // Closed set of events the application reacts to. Handled by a single std::visit.
    using AppEvent = std::variant<CloseRequested, Resized, KeyInput, MouseMotion, RedrawRequested>;

}
