#include <cstdio>
#include <exception>
#include <string>

#include <spdlog/spdlog.h>

#include "app.h"

int main(int argc, char** argv)
{
    std::string config_path = (argc > 1) ? argv[1] : "xaudio.conf";

    XAudioApp& app = XAudioApp::instance();
    try
    {
        app.init(config_path);
        app.run();
    }
    catch (const std::exception& e)
    {
        spdlog::error("fatal: {}", e.what());
        app.shutdown();
        std::fprintf(stderr, "xaudio: %s\n", e.what());
        return 1;
    }

    app.shutdown();
    return 0;
}
