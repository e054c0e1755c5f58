#pragma once

#include "GpuDevice.h"

#include <array>
#include <cstdint>

namespace pt
{
    // Read/write pair for one dispatch. Only AccumulationManager can build one, always from
    // images[parity] and images[parity ^ 1], so the two roles never name the same image.
    class AccumulationBinding
    {
    public:
        TextureHandle read() const noexcept { return mRead; }
        TextureHandle write() const noexcept { return mWrite; }

    private:
        friend class AccumulationManager;
        AccumulationBinding(TextureHandle read, TextureHandle write) : mRead(read), mWrite(write) {}

        TextureHandle mRead;
        TextureHandle mWrite;
    };

    class AccumulationManager
    {
    public:
        explicit AccumulationManager(IGpuDevice& device);
        ~AccumulationManager();

        AccumulationManager(const AccumulationManager&) = delete;
        AccumulationManager& operator=(const AccumulationManager&) = delete;

        // Replaces both images with zeroed ones of the given size. Resets sample count.
        void allocate(int width, int height);

        // Sample count back to 0 and the images marked stale. Parity is kept. The device is not
        // touched until refresh(), so any number of invalidations before a dispatch cost one
        // reallocation.
        void invalidate() noexcept;

        // Recreates stale images at the current size. No-op otherwise.
        void refresh();
        bool stale() const noexcept { return mStale; }

        void resetParity() noexcept { mParity = 0; }
        void flip() noexcept { mParity ^= 1u; }
        void addSample() noexcept { ++mSampleCount; }

        AccumulationBinding binding() const noexcept
        {
            return AccumulationBinding(mImages[mParity], mImages[mParity ^ 1u]);
        }

        std::uint32_t parity() const noexcept { return mParity; }
        std::uint32_t sampleCount() const noexcept { return mSampleCount; }
        const std::array<TextureHandle, 2>& images() const noexcept { return mImages; }
        int width() const noexcept { return mWidth; }
        int height() const noexcept { return mHeight; }

    private:
        void release();

        IGpuDevice& mDevice;
        std::array<TextureHandle, 2> mImages{};
        std::uint32_t mParity = 0;
        std::uint32_t mSampleCount = 0;
        int mWidth = 0;
        int mHeight = 0;
        bool mStale = false;
    };
}
