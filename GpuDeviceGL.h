#pragma once

#include "GpuDevice.h"

#include <glad/glad.h>

#include <array>
#include <memory>
#include <string>

class Shader;
class Window;

namespace pt
{
    // OpenGL 4.3 implementation. Requires the window's context to be current for its whole lifetime.
    class GpuDeviceGL final : public IGpuDevice
    {
    public:
        explicit GpuDeviceGL(Window& window);
        ~GpuDeviceGL() override;

        GpuDeviceGL(const GpuDeviceGL&) = delete;
        GpuDeviceGL& operator=(const GpuDeviceGL&) = delete;

        // Loads raytracer.comp, display.vert and display.frag from shaderDir. Throws on failure.
        void initialize(const std::string& shaderDir);

        void configureSurface(int width, int height) override;

        TextureHandle createTexture(int width, int height, TextureUsage usage, const char* label) override;
        void destroyTexture(TextureHandle& tex) override;

        BufferHandle createStorageBuffer(const void* data, std::size_t bytes, const char* label) override;
        BufferHandle createUniformBuffer(const void* data, std::size_t bytes, const char* label) override;
        void writeBuffer(BufferHandle buf, const void* data, std::size_t bytes) override;
        void destroyBuffer(BufferHandle& buf) override;

        void setDisplaySource(TextureHandle tex) override { mDisplaySource = tex; }

        void dispatchCompute(const ComputeDispatch& dispatch) override;

        SurfaceStatus acquireSurface() override;
        void drawDisplayPass() override;
        void present() override;

        float lastDispatchMs() const override { return mTimer.lastMs; }

    private:
        struct DispatchTimer
        {
            static constexpr int kFrames = 4;

            std::array<GLuint, kFrames> qBegin{};
            std::array<GLuint, kFrames> qEnd{};
            int cursor = 0;
            float lastMs = 0.0f;
            bool valid = false;

            void init();
            void shutdown();
            void begin();
            void end();
            void resolve();
        };

        Window& mWindow;
        std::unique_ptr<Shader> mTraceProgram;
        std::unique_ptr<Shader> mDisplayProgram;
        GLuint mEmptyVao = 0;

        TextureHandle mDisplaySource;
        DispatchTimer mTimer;

        int mSurfaceWidth = 0;
        int mSurfaceHeight = 0;
        bool mPresentFailed = false;
    };
}
