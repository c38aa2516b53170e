#include <doctest/doctest.h>

#include "BenchmarkSettings.h"

#include <filesystem>
#include <fstream>

namespace
{
    std::string tempPath(const std::string &name)
    {
        return (std::filesystem::temp_directory_path() / name).string();
    }

    void writeFile(const std::string &path, const std::string &text)
    {
        std::ofstream out(path);
        out << text;
    }
}

TEST_CASE("BenchmarkSettings: save and load round trip")
{
    BenchmarkSettings settings;
    settings.mazePath = "mazes/big.txt";
    settings.outputPath = "out/table.txt";
    settings.heuristics = {"euclidean", "zero"};
    settings.computeOptimality = false;
    settings.doublingEnabled = true;
    settings.doublingLevels = 4;
    settings.doublingTrials = 7;
    settings.extraPassages = 9;
    settings.seed = 123456;
    settings.threads = 3;
    settings.cellPixels = 40;

    const std::string path = tempPath("mazesearch_settings_roundtrip.cfg");
    REQUIRE(settings.saveToFile(path));

    BenchmarkSettings loaded;
    REQUIRE(loaded.loadFromFile(path));
    CHECK(loaded.mazePath == "mazes/big.txt");
    CHECK(loaded.outputPath == "out/table.txt");
    CHECK(loaded.heuristics == std::vector<std::string>{"euclidean", "zero"});
    CHECK_FALSE(loaded.computeOptimality);
    CHECK(loaded.doublingEnabled);
    CHECK(loaded.doublingLevels == 4);
    CHECK(loaded.doublingTrials == 7);
    CHECK(loaded.extraPassages == 9);
    CHECK(loaded.seed == 123456u);
    CHECK(loaded.threads == 3);
    CHECK(loaded.cellPixels == 40);

    std::filesystem::remove(path);
}

TEST_CASE("BenchmarkSettings: comments and unknown keys are skipped")
{
    const std::string path = tempPath("mazesearch_settings_comments.cfg");
    writeFile(path,
              "# tuned for the lab machine\n"
              "\n"
              "seed = 77\n"
              "futureOption=1\n"
              "not a key value line\n"
              "heuristics= Manhattan , e \n");

    BenchmarkSettings settings;
    REQUIRE(settings.loadFromFile(path));
    CHECK(settings.seed == 77u);
    CHECK(settings.heuristics == std::vector<std::string>{"Manhattan", "e"});

    std::filesystem::remove(path);
}

TEST_CASE("BenchmarkSettings: load failures return false")
{
    BenchmarkSettings settings;
    CHECK_FALSE(settings.loadFromFile(tempPath("mazesearch_missing_settings.cfg")));

    const std::string path = tempPath("mazesearch_settings_bad.cfg");
    writeFile(path, "doublingLevels=lots\n");
    CHECK_FALSE(settings.loadFromFile(path));
    std::filesystem::remove(path);
}

TEST_CASE("BenchmarkSettings: validateAndClamp")
{
    BenchmarkSettings settings;
    settings.doublingLevels = 40;
    settings.doublingTrials = 0;
    settings.extraPassages = -3;
    settings.threads = 0;
    settings.cellPixels = 1;
    settings.heuristics = {"chebyshev", "euclidean"};
    settings.validateAndClamp();

    CHECK(settings.doublingLevels == 6);
    CHECK(settings.doublingTrials == 1);
    CHECK(settings.extraPassages == 0);
    CHECK(settings.threads == 1);
    CHECK(settings.cellPixels == 8);
    CHECK(settings.heuristics == std::vector<std::string>{"euclidean"});

    settings.heuristics = {"nope"};
    settings.validateAndClamp();
    CHECK(settings.heuristics == std::vector<std::string>{"manhattan"});
}

TEST_CASE("BenchmarkSettings: list helpers")
{
    CHECK(BenchmarkSettings::splitList(" a, b ,,c ") == std::vector<std::string>{"a", "b", "c"});
    CHECK(BenchmarkSettings::splitList("").empty());
    CHECK(BenchmarkSettings::joinList({"manhattan", "euclidean"}) == "manhattan,euclidean");
}
