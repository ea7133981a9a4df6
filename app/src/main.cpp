#include "app.h"
#include "demo_scene.h"
#include "scene_renderer.h"

#include <glint/core/camera.h>
#include <glint/core/log.h>
#include <glint/raymarch/offline_render.h>
#include <glint/scene/scene_store.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static void printUsage()
{
    std::cout << "Usage: glint_editor [options]\n"
              << "  --headless          Render one CPU frame without a window, report the center pick\n"
              << "  --width <W>         Window width (default 1280)\n"
              << "  --height <H>        Window height (default 720)\n"
              << "  --cpu               Start in CPU raymarch mode\n"
              << "  --empty             Start with an empty scene\n"
              << "  --render <file>     Render the demo scene on the CPU to a PNG and exit\n";
}

static bool parseSize(const std::string& text, uint32_t& out)
{
    try
    {
        int value = std::stoi(text);
        if (value <= 0)
            return false;
        out = static_cast<uint32_t>(value);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

static bool parseArgs(int argc, char* argv[], AppOptions& options, std::string& renderPath)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == "--headless")
            options.headless = true;
        else if (args[i] == "--cpu")
            options.cpuOnly = true;
        else if (args[i] == "--empty")
            options.emptyScene = true;
        else if (args[i] == "--width" && i + 1 < args.size())
        {
            if (!parseSize(args[++i], options.engine.windowWidth))
                return false;
        }
        else if (args[i] == "--height" && i + 1 < args.size())
        {
            if (!parseSize(args[++i], options.engine.windowHeight))
                return false;
        }
        else if (args[i] == "--render" && i + 1 < args.size())
            renderPath = args[++i];
        else if (args[i] == "--help")
        {
            printUsage();
            std::exit(EXIT_SUCCESS);
        }
        else
        {
            std::cerr << "Unknown argument: " << args[i] << "\n";
            return false;
        }
    }

    return true;
}

// Single CPU frame of the demo scene, no window or GL context. Writes a PNG when
// a path is given.
static int runOffline(const AppOptions& options, const std::string& path)
{
    glint::SceneStore store;
    if (!options.emptyScene)
        buildDemoScene(store);

    glint::Camera camera;
    frameDemoScene(camera);

    glint::OfflineSettings settings;
    settings.width = options.engine.windowWidth;
    settings.height = options.engine.windowHeight;

    glint::OfflineFrame frame = glint::renderOffline(store, camera, settings);
    if (frame.pixels.empty())
        return EXIT_FAILURE;

    glint::Log::info("Rendered " + std::to_string(frame.width) + "x" + std::to_string(frame.height)
                     + " in " + std::to_string(frame.renderMs) + " ms, "
                     + std::to_string(frame.averageSteps) + " steps per pixel");

    if (frame.centerObject)
        glint::Log::info(std::string("Center pixel: ") + glint::toString(frame.centerObject->type) + " "
                         + std::to_string(frame.centerObject->slot));
    else
        glint::Log::info("Center pixel: ground or sky");

    if (path.empty())
        return EXIT_SUCCESS;

    if (!SceneRenderer::writePNG(path, frame.width, frame.height, frame.pixels))
    {
        glint::Log::error("Failed to write " + path);
        return EXIT_FAILURE;
    }

    glint::Log::info("Wrote " + path);
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    AppOptions options;
    std::string renderPath;

    if (!parseArgs(argc, argv, options, renderPath))
    {
        printUsage();
        return EXIT_FAILURE;
    }

    if (options.headless || !renderPath.empty())
        return runOffline(options, renderPath);

    App app;

    if (!app.init(options))
        return EXIT_FAILURE;

    app.run();
    app.shutdown();

    return EXIT_SUCCESS;
}
