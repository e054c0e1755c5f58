#pragma once

#include "AppEvent.h"

#include <functional>
#include <vector>

union SDL_Event;

namespace plat {

    // Translates SDL events into AppEvents. extraCallback sees every raw event first (ImGui).
    class InputBackend {
    public:
        void pumpEvents(
            std::vector<AppEvent>& out,
            const std::function<void(const SDL_Event&)>& extraCallback = {});

        // Blocks until an event arrives or timeoutMs elapses. Does not consume the event.
        void waitForEvents(int timeoutMs);
    };

    Key MapScancode(int scancode);

}
