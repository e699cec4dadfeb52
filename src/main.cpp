#include <memory>
#include <string>

#include <SDL3/SDL_main.h>

#include "core/Application.hpp"

int main(int argc, char* args[])
{
    // Optional first argument: path of the settings file.
    std::string const kConfigPath = argc > 1 ? args[1] : "";

    auto app = std::make_unique<Application>();
    if (!app->Initialize(kConfigPath)) {
        return 1;
    }

    int const kExitCode = app->Run();
    app->Shutdown();
    return kExitCode;
}
