#include "Platform.h"

#include <SDL3/SDL.h>

#include <algorithm>
#include <iostream>

namespace plat {

    static std::uint64_t gPerfFreq = 0;
    static bool          gInitialized = false;

    bool Init() {
        if (gInitialized) {
            return true;
        }

        if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
            const char* err = SDL_GetError();
            std::cerr << "[Platform] SDL_Init failed: "
                << ((err && *err) ? err : "(no message)") << "\n";
            return false;
        }

        gPerfFreq = SDL_GetPerformanceFrequency();
        gInitialized = true;
        return true;
    }

    void Shutdown() {
        if (!gInitialized) return;
        SDL_Quit();
        gInitialized = false;
    }

    Ticks GetTicks() {
        return SDL_GetPerformanceCounter();
    }

    double TicksToSeconds(Ticks dt) {
        if (gPerfFreq == 0) {
            gPerfFreq = SDL_GetPerformanceFrequency();
        }
        return static_cast<double>(dt) / static_cast<double>(gPerfFreq);
    }

    void FrameClock::reset() {
        last_ = GetTicks();
        started_ = true;
    }

    double FrameClock::tick() {
        const Ticks now = GetTicks();
        if (!started_) {
            last_ = now;
            started_ = true;
            return 0.0;
        }
        const double dt = TicksToSeconds(now - last_);
        last_ = now;
        return std::min(dt, maxStep_);
    }

}
