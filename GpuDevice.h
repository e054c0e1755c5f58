#pragma once

#include <cstddef>
#include <cstdint>

namespace pt
{
    struct TextureHandle
    {
        std::uint32_t id = 0;

        bool valid() const noexcept { return id != 0; }
        friend bool operator==(TextureHandle a, TextureHandle b) noexcept { return a.id == b.id; }
        friend bool operator!=(TextureHandle a, TextureHandle b) noexcept { return a.id != b.id; }
    };

    struct BufferHandle
    {
        std::uint32_t id = 0;

        bool valid() const noexcept { return id != 0; }
        friend bool operator==(BufferHandle a, BufferHandle b) noexcept { return a.id == b.id; }
        friend bool operator!=(BufferHandle a, BufferHandle b) noexcept { return a.id != b.id; }
    };

    enum class TextureUsage : int
    {
        Accumulation = 0, // storage image, rgba32f, zeroed at creation
        RenderTarget = 1, // storage image + sampled by the display pass, undefined until first dispatch
    };

    enum class SurfaceStatus : int
    {
        Ok = 0,
        Lost,
        Outdated,
        Timeout,
        OutOfMemory,
        Other,
    };

    const char* SurfaceStatusName(SurfaceStatus s);

    // Everything the trace kernel reads or writes for one dispatch.
    struct ComputeDispatch
    {
        BufferHandle camera;
        BufferHandle sceneInfo;
        BufferHandle vertices;
        BufferHandle faces;
        BufferHandle materials;
        BufferHandle randomSeed;
        BufferHandle sampleCount;

        TextureHandle displayOutput;
        TextureHandle accumulationRead;
        TextureHandle accumulationWrite;

        std::uint32_t groupsX = 0;
        std::uint32_t groupsY = 0;
    };

    // Explicit render context. Every component that touches GPU resources is handed one of
    // these; there is no process-wide device.
    class IGpuDevice
    {
    public:
        virtual ~IGpuDevice() = default;

        virtual void configureSurface(int width, int height) = 0;

        virtual TextureHandle createTexture(int width, int height, TextureUsage usage, const char* label) = 0;
        virtual void destroyTexture(TextureHandle& tex) = 0;

        virtual BufferHandle createStorageBuffer(const void* data, std::size_t bytes, const char* label) = 0;
        virtual BufferHandle createUniformBuffer(const void* data, std::size_t bytes, const char* label) = 0;
        virtual void writeBuffer(BufferHandle buf, const void* data, std::size_t bytes) = 0;
        virtual void destroyBuffer(BufferHandle& buf) = 0;

        // Texture sampled by the full-screen display pass.
        virtual void setDisplaySource(TextureHandle tex) = 0;

        virtual void dispatchCompute(const ComputeDispatch& dispatch) = 0;

        virtual SurfaceStatus acquireSurface() = 0;
        virtual void drawDisplayPass() = 0;
        virtual void present() = 0;

        // Most recent resolved GPU time of the trace dispatch, 0 when unavailable.
        virtual float lastDispatchMs() const = 0;
    };
}
