#pragma once

#include <cstdint>

namespace plat {

    // SDL video + events. Idempotent.
    bool Init();
    void Shutdown();

    using Ticks = std::uint64_t;

    Ticks  GetTicks();
    double TicksToSeconds(Ticks dt);

    // Measures the time between successive tick() calls. A long stall (debugger, window drag)
    // is clamped so the camera never jumps by more than maxStep worth of movement.
    class FrameClock {
    public:
        explicit FrameClock(double maxStepSeconds = 0.25) : maxStep_(maxStepSeconds) {}

        void reset();
        double tick();

    private:
        double maxStep_;
        Ticks last_ = 0;
        bool started_ = false;
    };

}
