#include "InputBackend.h"

#include <SDL3/SDL.h>

namespace plat {

    Key MapScancode(int scancode) {
        switch (static_cast<SDL_Scancode>(scancode)) {
        case SDL_SCANCODE_W:       return Key::W;
        case SDL_SCANCODE_A:       return Key::A;
        case SDL_SCANCODE_S:       return Key::S;
        case SDL_SCANCODE_D:       return Key::D;
        case SDL_SCANCODE_SPACE:   return Key::Space;
        case SDL_SCANCODE_LSHIFT:  return Key::LeftShift;
        case SDL_SCANCODE_ESCAPE:  return Key::Escape;
        case SDL_SCANCODE_L:       return Key::L;
        case SDL_SCANCODE_UP:      return Key::Up;
        case SDL_SCANCODE_DOWN:    return Key::Down;
        case SDL_SCANCODE_LEFT:    return Key::Left;
        case SDL_SCANCODE_RIGHT:   return Key::Right;
        case SDL_SCANCODE_F1:      return Key::F1;
        default:                   return Key::COUNT;
        }
    }

    void InputBackend::pumpEvents(
        std::vector<AppEvent>& out,
        const std::function<void(const SDL_Event&)>& extraCallback)
    {
        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            if (extraCallback) {
                extraCallback(ev);
            }

            switch (ev.type) {
            case SDL_EVENT_QUIT:
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                out.emplace_back(CloseRequested{});
                break;

            case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
                out.emplace_back(Resized{ ev.window.data1, ev.window.data2 });
                break;

            case SDL_EVENT_WINDOW_EXPOSED:
                out.emplace_back(RedrawRequested{});
                break;

            case SDL_EVENT_MOUSE_MOTION:
                out.emplace_back(MouseMotion{ ev.motion.xrel, ev.motion.yrel });
                break;

            case SDL_EVENT_KEY_DOWN:
            case SDL_EVENT_KEY_UP: {
                const Key key = MapScancode(ev.key.scancode);
                if (key != Key::COUNT) {
                    out.emplace_back(KeyInput{ key, ev.type == SDL_EVENT_KEY_DOWN, ev.key.repeat });
                }
                break;
            }

            default:
                break;
            }
        }
    }

    void InputBackend::waitForEvents(int timeoutMs) {
        SDL_WaitEventTimeout(nullptr, timeoutMs);
    }

}
