#include "App.h"
#include "Config.h"
#include "Platform.h"

#include <cstdio>
#include <exception>
#include <string>

int main(int argc, char** argv)
{
    pt::AppConfig config;
    std::string error;
    if (!pt::ParseArgs(argc, argv, config, error))
    {
        std::fprintf(stderr, "ptview: %s\n%s", error.c_str(), pt::UsageText());
        return 2;
    }
    if (config.showHelp)
    {
        std::fputs(pt::UsageText(), stdout);
        return 0;
    }

    if (!plat::Init())
        return 1;

    int rc = 0;
    try
    {
        pt::App app(config);
        rc = app.run();
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "[main] Fatal: %s\n", e.what());
        rc = 1;
    }

    plat::Shutdown();
    return rc;
}
