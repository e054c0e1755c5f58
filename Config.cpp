#include "Config.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace
{
    static bool ParsePositiveInt(const char* text, int& out)
    {
        if (!text || !*text) return false;
        errno = 0;
        char* end = nullptr;
        const long v = std::strtol(text, &end, 10);
        if (errno != 0 || *end != '\0' || v <= 0 || v > 16384) return false;
        out = (int)v;
        return true;
    }

    static bool ParsePositiveFloat(const char* text, float& out)
    {
        if (!text || !*text) return false;
        errno = 0;
        char* end = nullptr;
        const float v = std::strtof(text, &end);
        if (errno != 0 || *end != '\0' || !(v > 0.0f)) return false;
        out = v;
        return true;
    }
}

namespace pt
{
    const char* UsageText()
    {
        return
            "usage: ptview [options] [scene.glb]\n"
            "  --width N         initial window width (default 1280)\n"
            "  --height N        initial window height (default 720)\n"
            "  --no-vsync        disable vertical sync\n"
            "  --shaders DIR     directory holding raytracer.comp / display.vert / display.frag\n"
            "  --trace FILE      write a Chrome trace JSON on exit\n"
            "  --speed X         camera speed in units per second (default 2.0)\n"
            "  --sensitivity X   mouse look radians per unit (default 0.002)\n"
            "  -h, --help        show this text\n";
    }

    bool ParseArgs(int argc, const char* const* argv, AppConfig& cfg, std::string& error)
    {
        bool haveScene = false;

        for (int i = 1; i < argc; ++i)
        {
            const char* arg = argv[i];
            const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;

            auto needValue = [&](const char* name) -> bool {
                if (next) return true;
                error = std::string("missing value for ") + name;
                return false;
            };

            if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0)
            {
                cfg.showHelp = true;
            }
            else if (std::strcmp(arg, "--no-vsync") == 0)
            {
                cfg.vsync = false;
            }
            else if (std::strcmp(arg, "--width") == 0 || std::strcmp(arg, "--height") == 0)
            {
                if (!needValue(arg)) return false;
                int& target = (arg[2] == 'w') ? cfg.width : cfg.height;
                if (!ParsePositiveInt(next, target))
                {
                    error = std::string("invalid value for ") + arg + ": '" + next + "'";
                    return false;
                }
                ++i;
            }
            else if (std::strcmp(arg, "--shaders") == 0)
            {
                if (!needValue(arg)) return false;
                cfg.shaderDir = next;
                ++i;
            }
            else if (std::strcmp(arg, "--trace") == 0)
            {
                if (!needValue(arg)) return false;
                cfg.tracePath = next;
                ++i;
            }
            else if (std::strcmp(arg, "--speed") == 0 || std::strcmp(arg, "--sensitivity") == 0)
            {
                if (!needValue(arg)) return false;
                float& target = (arg[3] == 'p') ? cfg.render.input.moveSpeed : cfg.render.input.mouseSensitivity;
                if (!ParsePositiveFloat(next, target))
                {
                    error = std::string("invalid value for ") + arg + ": '" + next + "'";
                    return false;
                }
                ++i;
            }
            else if (arg[0] == '-' && arg[1] != '\0')
            {
                error = std::string("unknown option ") + arg;
                return false;
            }
            else if (!haveScene)
            {
                cfg.scenePath = arg;
                haveScene = true;
            }
            else
            {
                error = std::string("unexpected argument ") + arg;
                return false;
            }
        }

        return true;
    }
}
