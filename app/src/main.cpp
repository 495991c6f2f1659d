#include "app.h"

#include <prism/core/log.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

static void printUsage()
{
    std::cout << "Usage: prism_render [options]\n"
              << "  --obj <file>           Load an OBJ mesh (repeatable)\n"
              << "  --sphere               Add a mirror sphere at the origin\n"
              << "  --envmap <dir>         Cubemap directory (px/nx/py/ny/pz/nz faces)\n"
              << "  --env-color <r> <g> <b> Solid environment color (default 1 1 1)\n"
              << "  --width <W>            Image width (default 640)\n"
              << "  --height <H>           Image height (default 360)\n"
              << "  --samples <N>          Samples per pixel (default 64)\n"
              << "  --bounces <N>          Maximum path length (default 8)\n"
              << "  --contribution <F>     Russian roulette contribution factor (default 100)\n"
              << "  --ema <W>              Exponential moving average with minimum weight W\n"
              << "  --exposure <EV>        Display exposure (default 0)\n"
              << "  --gamma <G>            Display gamma (default 2.2)\n"
              << "  --no-aces              Disable ACES tone mapping\n"
              << "  --no-aa                Trace through pixel centers\n"
              << "  --random               Hash-based random sampling instead of Sobol\n"
              << "  --threads <N>          Worker threads (default: all cores)\n"
              << "  --output <file.png>    Tonemapped output (default render.png)\n"
              << "  --exr <file.exr>       Linear radiance output\n";
}

static bool parseArgs(int argc, char* argv[], AppConfig& config)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    auto need = [&](size_t i, size_t count)
    {
        if (i + count < args.size())
            return true;
        prism::Log::error("Missing value for " + args[i]);
        return false;
    };

    try
    {
        for (size_t i = 0; i < args.size(); ++i)
        {
            if (args[i] == "--obj" && need(i, 1))
                config.objPaths.push_back(args[++i]);
            else if (args[i] == "--sphere")
                config.addSphere = true;
            else if (args[i] == "--envmap" && need(i, 1))
                config.envmapDir = args[++i];
            else if (args[i] == "--env-color" && need(i, 3))
            {
                float r = std::stof(args[++i]);
                float g = std::stof(args[++i]);
                float b = std::stof(args[++i]);
                config.envColor = glm::vec3(r, g, b);
            }
            else if (args[i] == "--width" && need(i, 1))
                config.width = static_cast<uint32_t>(std::stoul(args[++i]));
            else if (args[i] == "--height" && need(i, 1))
                config.height = static_cast<uint32_t>(std::stoul(args[++i]));
            else if (args[i] == "--samples" && need(i, 1))
                config.samples = static_cast<uint32_t>(std::stoul(args[++i]));
            else if (args[i] == "--bounces" && need(i, 1))
                config.render.maxBounces = static_cast<uint32_t>(std::stoul(args[++i]));
            else if (args[i] == "--contribution" && need(i, 1))
                config.render.contributionFactor = std::stof(args[++i]);
            else if (args[i] == "--ema" && need(i, 1))
            {
                config.render.accumulation = prism::AccumulationMode::ExponentialAverage;
                config.render.emaWeight = std::stof(args[++i]);
            }
            else if (args[i] == "--exposure" && need(i, 1))
                config.render.exposure = std::stof(args[++i]);
            else if (args[i] == "--gamma" && need(i, 1))
                config.render.gamma = std::stof(args[++i]);
            else if (args[i] == "--no-aces")
                config.render.enableACES = false;
            else if (args[i] == "--no-aa")
                config.render.enableAA = false;
            else if (args[i] == "--random")
                config.render.sampler = prism::SamplerKind::Random;
            else if (args[i] == "--threads" && need(i, 1))
                config.render.threadCount = static_cast<uint32_t>(std::stoul(args[++i]));
            else if (args[i] == "--output" && need(i, 1))
                config.outputPNG = args[++i];
            else if (args[i] == "--exr" && need(i, 1))
                config.outputEXR = args[++i];
            else if (args[i] == "--help")
            {
                printUsage();
                std::exit(0);
            }
            else
            {
                prism::Log::error("Unknown or incomplete option: " + args[i]);
                return false;
            }
        }
    }
    catch (const std::exception& e)
    {
        prism::Log::error(std::string("Invalid option value: ") + e.what());
        return false;
    }

    return true;
}

int main(int argc, char* argv[])
{
    AppConfig config;
    if (!parseArgs(argc, argv, config))
    {
        printUsage();
        return EXIT_FAILURE;
    }

    App app;

    if (!app.init(config))
        return EXIT_FAILURE;

    app.run();

    return app.shutdown() ? EXIT_SUCCESS : EXIT_FAILURE;
}
