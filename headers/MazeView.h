#pragma once
#include <SFML/Graphics.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "BenchmarkManager.h"
#include "BenchmarkSettings.h"
#include "GridGraph.h"

// metric shown by the bar chart view
enum class ChartMetric
{
    TimeMs = 0,
    Expanded,
    Generated,
    Explored,
    Frontier,
    PeakMemory,
    Cost,
    Count
};

const char *chartMetricName(ChartMetric metric);
double chartMetricValue(const SearchMetrics &metrics, ChartMetric metric);

/**
 * SFML front end over one maze and its comparison rows. owns a copy of the
 * graph, reruns the comparison whenever the maze changes and draws either
 * the maze with the selected algorithm's path or a bar chart of one metric
 */
class MazeView
{
public:
    MazeView(sf::Font &font, const BenchmarkSettings &settings);

    void setMaze(const GridGraph &graph);
    bool hasMaze() const { return graph_ != nullptr; }

    void handleInput(const sf::Event::KeyPressed *keyEvent);
    void draw(sf::RenderWindow &window) const;

    // callbacks for the main loop
    std::function<void()> onRegenerate;
    std::function<void()> onScreenshot;
    std::function<void()> onQuit;

    size_t getSelectedRow() const { return selectedRow_; }
    const std::vector<ComparisonRow> &getRows() const { return rows_; }

    static sf::Color rowColor(size_t index);
    static bool saveScreenshot(const sf::RenderWindow &window, const std::string &path);

private:
    sf::Font &font_;
    BenchmarkManager benchmark_;
    int cellPixels_;

    std::unique_ptr<GridGraph> graph_;
    std::vector<ComparisonRow> rows_;
    size_t selectedRow_ = 0;
    bool showChart_ = false;
    bool showHelp_ = false;
    ChartMetric chartMetric_ = ChartMetric::Expanded;

    // ui styling
    sf::Color backgroundColor_ = sf::Color(20, 20, 28);
    sf::Color wallColor_ = sf::Color(230, 230, 230);
    sf::Color oneWayColor_ = sf::Color(255, 140, 0);
    sf::Color hudBackgroundColor_ = sf::Color(0, 0, 0, 180);

    static constexpr float PANEL_WIDTH = 380.0f;
    static constexpr float MARGIN = 20.0f;

    float cellSizeFor(const sf::RenderWindow &window) const;

    void drawMaze(sf::RenderWindow &window, float cell) const;
    void drawWalls(sf::RenderWindow &window, float cell) const;
    void drawPath(sf::RenderWindow &window, float cell) const;
    void drawMarkers(sf::RenderWindow &window, float cell) const;
    void drawChart(sf::RenderWindow &window) const;
    void drawHUD(sf::RenderWindow &window) const;
    void drawHelpText(sf::RenderWindow &window) const;

    void drawText(sf::RenderWindow &window, const std::string &str, sf::Vector2f position,
                  unsigned int size, sf::Color color) const;
};
