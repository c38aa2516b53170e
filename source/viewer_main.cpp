#include <SFML/Graphics.hpp>
#include <SFML/Window.hpp>
#include <SFML/System.hpp>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

#include "BenchmarkSettings.h"
#include "MazeFile.h"
#include "MazeGenerator.h"
#include "MazeView.h"

// level used for the R key mazes (9x12)
const int VIEW_LEVEL = 2;

static void printUsage()
{
    std::cout << "usage: mazeview [--maze <file>] [--config <file>] [--seed <n>]\n"
              << "  without --maze (or when it fails to load) a maze is generated from the seed" << std::endl;
}

static GridGraph generateMaze(const BenchmarkSettings &settings, uint32_t seed)
{
    auto [rows, cols] = MazeGenerator::dimensionsForLevel(VIEW_LEVEL);
    MazeGenerator::Options options;
    options.extraPassages = settings.extraPassages;
    options.oneWayPassages = 3;
    return GridGraph(MazeGenerator::generate(rows, cols, seed, options));
}

int main(int argc, char *argv[])
{
    BenchmarkSettings settings;
    std::string mazePath;
    bool seedGiven = false;
    uint32_t seed = settings.seed;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        if (i + 1 >= argc)
        {
            std::cerr << "Error: missing value for " << arg << std::endl;
            printUsage();
            return 2;
        }
        std::string value = argv[++i];
        if (arg == "--maze")
            mazePath = value;
        else if (arg == "--config")
        {
            if (!settings.loadFromFile(value))
                return 1;
        }
        else if (arg == "--seed")
        {
            try
            {
                seed = static_cast<uint32_t>(std::stoul(value));
                seedGiven = true;
            }
            catch (const std::exception &)
            {
                std::cerr << "Error: bad seed: " << value << std::endl;
                return 2;
            }
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage();
            return 2;
        }
    }
    if (!seedGiven)
        seed = settings.seed;

    sf::RenderWindow window(sf::VideoMode({static_cast<unsigned>(settings.windowWidth),
                                           static_cast<unsigned>(settings.windowHeight)}),
                            "Maze Search");
    window.setFramerateLimit(60);

    // initialize font
    sf::Font font;
    if (!font.openFromFile(settings.fontPath) &&
        !font.openFromFile("bin/DejaVuSans.ttf") &&
        !font.openFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"))
    {
        std::cout << "Warning: Could not load font file, HUD text may not display properly" << std::endl;
    }

    MazeView view(font, settings);

    try
    {
        if (!mazePath.empty())
        {
            view.setMaze(loadMaze(mazePath));
        }
        else
        {
            view.setMaze(generateMaze(settings, seed));
        }
    }
    catch (const MazeError &e)
    {
        std::cerr << "[MAZE] " << e.what() << std::endl;
        std::cerr << "[MAZE] falling back to a generated maze (seed " << seed << ")" << std::endl;
        view.setMaze(generateMaze(settings, seed));
    }

    int screenshotCount = 0;
    bool screenshotRequested = false;

    view.onRegenerate = [&]()
    {
        seed++;
        view.setMaze(generateMaze(settings, seed));
        std::cout << "[VIEW] regenerated with seed " << seed << std::endl;
    };
    // captured after the next frame is drawn
    view.onScreenshot = [&]()
    { screenshotRequested = true; };
    view.onQuit = [&]()
    { window.close(); };

    while (window.isOpen())
    {
        while (const std::optional event = window.pollEvent())
        {
            if (event->is<sf::Event::Closed>())
            {
                window.close();
            }

            if (const auto *keyPressed = event->getIf<sf::Event::KeyPressed>())
            {
                view.handleInput(keyPressed);
            }
        }

        if (!window.isOpen())
            break;

        view.draw(window);

        if (screenshotRequested)
        {
            screenshotRequested = false;
            std::error_code ec;
            std::filesystem::create_directories("screenshots", ec);
            std::string path = "screenshots/mazeview_" + std::to_string(seed) + "_" + std::to_string(++screenshotCount) + ".png";
            if (ec || !MazeView::saveScreenshot(window, path))
                std::cerr << "[VIEW] screenshot failed" << std::endl;
        }

        window.display();
    }

    return 0;
}
