#include "MazeView.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

// the colors for each comparison row, BFS, DFS, then the informed rows
static const sf::Color ROW_COLORS[] = {
    sf::Color(70, 130, 180),  // blue steel
    sf::Color(255, 69, 0),    // orange-ish red
    sf::Color(50, 205, 50),   // lime green
    sf::Color(0, 255, 255),   // cyan
    sf::Color(255, 20, 147),  // pink
    sf::Color(255, 255, 0),   // yellow
    sf::Color(150, 255, 150), // bright green
    sf::Color(186, 85, 211)   // orchid
};

static Direction opposite(Direction dir)
{
    switch (dir)
    {
    case Direction::North:
        return Direction::South;
    case Direction::South:
        return Direction::North;
    case Direction::East:
        return Direction::West;
    case Direction::West:
        return Direction::East;
    }
    return Direction::North;
}

const char *chartMetricName(ChartMetric metric)
{
    switch (metric)
    {
    case ChartMetric::TimeMs:
        return "Time (ms)";
    case ChartMetric::Expanded:
        return "Expanded";
    case ChartMetric::Generated:
        return "Generated";
    case ChartMetric::Explored:
        return "Explored";
    case ChartMetric::Frontier:
        return "Peak Frontier";
    case ChartMetric::PeakMemory:
        return "Peak Memory";
    case ChartMetric::Cost:
        return "Path Cost";
    default:
        return "?";
    }
}

double chartMetricValue(const SearchMetrics &metrics, ChartMetric metric)
{
    switch (metric)
    {
    case ChartMetric::TimeMs:
        return metrics.timeMs;
    case ChartMetric::Expanded:
        return metrics.expanded;
    case ChartMetric::Generated:
        return metrics.generated;
    case ChartMetric::Explored:
        return metrics.peakExplored;
    case ChartMetric::Frontier:
        return metrics.peakFrontier;
    case ChartMetric::PeakMemory:
        return metrics.peakStructures;
    case ChartMetric::Cost:
        return metrics.pathCost;
    default:
        return 0.0;
    }
}

MazeView::MazeView(sf::Font &font, const BenchmarkSettings &settings)
    : font_(font), benchmark_(settings), cellPixels_(settings.cellPixels)
{
}

sf::Color MazeView::rowColor(size_t index)
{
    const size_t count = sizeof(ROW_COLORS) / sizeof(ROW_COLORS[0]);
    return ROW_COLORS[index % count];
}

void MazeView::setMaze(const GridGraph &graph)
{
    graph_ = std::make_unique<GridGraph>(graph);
    rows_ = benchmark_.runComparison(*graph_);
    selectedRow_ = std::min(selectedRow_, rows_.empty() ? size_t(0) : rows_.size() - 1);

    std::cout << "[VIEW] maze " << graph_->rows() << "x" << graph_->cols() << " loaded, "
              << rows_.size() << " runs compared" << std::endl;
}

void MazeView::handleInput(const sf::Event::KeyPressed *keyEvent)
{
    if (!keyEvent)
        return;

    switch (keyEvent->code)
    {
    case sf::Keyboard::Key::Right:
    case sf::Keyboard::Key::Down:
        if (!rows_.empty())
            selectedRow_ = (selectedRow_ + 1) % rows_.size();
        break;
    case sf::Keyboard::Key::Left:
    case sf::Keyboard::Key::Up:
        if (!rows_.empty())
            selectedRow_ = (selectedRow_ + rows_.size() - 1) % rows_.size();
        break;
    case sf::Keyboard::Key::Tab:
        showChart_ = !showChart_;
        break;
    case sf::Keyboard::Key::M:
        chartMetric_ = static_cast<ChartMetric>((static_cast<int>(chartMetric_) + 1) % static_cast<int>(ChartMetric::Count));
        break;
    case sf::Keyboard::Key::H:
        showHelp_ = !showHelp_;
        break;
    case sf::Keyboard::Key::R:
        if (onRegenerate)
            onRegenerate();
        break;
    case sf::Keyboard::Key::P:
        if (onScreenshot)
            onScreenshot();
        break;
    case sf::Keyboard::Key::Escape:
        if (onQuit)
            onQuit();
        break;
    default:
        break;
    }
}

float MazeView::cellSizeFor(const sf::RenderWindow &window) const
{
    if (!graph_)
        return static_cast<float>(cellPixels_);

    sf::Vector2f size = static_cast<sf::Vector2f>(window.getSize());
    float fitX = (size.x - PANEL_WIDTH - 2.0f * MARGIN) / graph_->cols();
    float fitY = (size.y - 2.0f * MARGIN) / graph_->rows();
    return std::max(4.0f, std::min({static_cast<float>(cellPixels_), fitX, fitY}));
}

void MazeView::draw(sf::RenderWindow &window) const
{
    window.clear(backgroundColor_);

    if (graph_)
    {
        if (showChart_)
            drawChart(window);
        else
            drawMaze(window, cellSizeFor(window));
    }

    drawHUD(window);

    if (showHelp_)
        drawHelpText(window);
}

void MazeView::drawMaze(sf::RenderWindow &window, float cell) const
{
    // cell floor
    sf::RectangleShape floor(sf::Vector2f(cell * graph_->cols(), cell * graph_->rows()));
    floor.setPosition({MARGIN, MARGIN});
    floor.setFillColor(sf::Color(35, 35, 48));
    window.draw(floor);

    drawPath(window, cell);
    drawMarkers(window, cell);
    drawWalls(window, cell);

    // labels only when there is room for them
    if (graph_->hasLabels() && cell >= 24.0f)
    {
        unsigned int size = static_cast<unsigned int>(cell * 0.3f);
        for (int r = 0; r < graph_->rows(); ++r)
        {
            for (int c = 0; c < graph_->cols(); ++c)
            {
                char label = graph_->labelAt({r, c});
                if (label == GridGraph::LABEL_PLACEHOLDER)
                    continue;
                drawText(window, std::string(1, label),
                         {MARGIN + c * cell + cell * 0.12f, MARGIN + r * cell + cell * 0.08f},
                         size, sf::Color(160, 160, 180));
            }
        }
    }
}

void MazeView::drawWalls(sf::RenderWindow &window, float cell) const
{
    // every cell draws its own blocked sides inside its own square, so a wall
    // blocked from both sides shows as one thick line and a one way wall as
    // a thin colored line on the side that is blocked
    const float thickness = std::max(2.0f, cell * 0.06f);

    for (int r = 0; r < graph_->rows(); ++r)
    {
        for (int c = 0; c < graph_->cols(); ++c)
        {
            GridCell here{r, c};
            const CellWalls &walls = graph_->walls(here);
            float x = MARGIN + c * cell;
            float y = MARGIN + r * cell;

            for (Direction dir : ALL_DIRECTIONS)
            {
                if (!walls.isBlocked(dir))
                    continue;

                GridCell next = stepToward(here, dir);
                bool oneWay = graph_->inBounds(next) && !graph_->walls(next).isBlocked(opposite(dir));

                sf::RectangleShape wall;
                switch (dir)
                {
                case Direction::North:
                    wall.setSize({cell, thickness});
                    wall.setPosition({x, y});
                    break;
                case Direction::South:
                    wall.setSize({cell, thickness});
                    wall.setPosition({x, y + cell - thickness});
                    break;
                case Direction::East:
                    wall.setSize({thickness, cell});
                    wall.setPosition({x + cell - thickness, y});
                    break;
                case Direction::West:
                    wall.setSize({thickness, cell});
                    wall.setPosition({x, y});
                    break;
                }
                wall.setFillColor(oneWay ? oneWayColor_ : wallColor_);
                window.draw(wall);
            }
        }
    }
}

void MazeView::drawPath(sf::RenderWindow &window, float cell) const
{
    if (rows_.empty())
        return;

    const ComparisonRow &row = rows_[selectedRow_];
    if (row.path.empty())
        return;

    sf::Color color = rowColor(selectedRow_);
    sf::Color fill = color;
    fill.a = 70;

    for (const auto &step : row.path)
    {
        sf::RectangleShape tile(sf::Vector2f(cell, cell));
        tile.setPosition({MARGIN + step.col * cell, MARGIN + step.row * cell});
        tile.setFillColor(fill);
        window.draw(tile);
    }

    sf::VertexArray line(sf::PrimitiveType::LineStrip, row.path.size());
    for (size_t i = 0; i < row.path.size(); ++i)
    {
        line[i].position = {MARGIN + (row.path[i].col + 0.5f) * cell, MARGIN + (row.path[i].row + 0.5f) * cell};
        line[i].color = color;
    }
    window.draw(line);

    float dot = std::max(2.0f, cell * 0.08f);
    for (const auto &step : row.path)
    {
        sf::CircleShape node(dot);
        node.setPosition({MARGIN + (step.col + 0.5f) * cell - dot, MARGIN + (step.row + 0.5f) * cell - dot});
        node.setFillColor(color);
        window.draw(node);
    }
}

void MazeView::drawMarkers(sf::RenderWindow &window, float cell) const
{
    const GridCell &start = graph_->start();
    const GridCell &goal = graph_->goal();

    sf::RectangleShape startMarker(sf::Vector2f(cell * 0.5f, cell * 0.5f));
    startMarker.setPosition({MARGIN + (start.col + 0.25f) * cell, MARGIN + (start.row + 0.25f) * cell});
    startMarker.setFillColor(sf::Color(60, 200, 90, 200));
    startMarker.setOutlineColor(sf::Color::White);
    startMarker.setOutlineThickness(2.0f);
    window.draw(startMarker);

    // bright goal marker so it stays readable over the path overlay
    float radius = cell * 0.28f;
    sf::CircleShape goalMarker(radius);
    goalMarker.setPosition({MARGIN + (goal.col + 0.5f) * cell - radius, MARGIN + (goal.row + 0.5f) * cell - radius});
    goalMarker.setFillColor(sf::Color(255, 215, 0, 200));
    goalMarker.setOutlineColor(sf::Color::White);
    goalMarker.setOutlineThickness(2.0f);
    window.draw(goalMarker);
}

void MazeView::drawChart(sf::RenderWindow &window) const
{
    if (rows_.empty())
        return;

    sf::Vector2f size = static_cast<sf::Vector2f>(window.getSize());
    float areaWidth = size.x - PANEL_WIDTH - 2.0f * MARGIN;
    float areaHeight = size.y - 2.0f * MARGIN;

    drawText(window, std::string("Metric: ") + chartMetricName(chartMetric_) + "   [M] next metric",
             {MARGIN, MARGIN}, 18, sf::Color::White);

    double maxValue = 0.0;
    for (const auto &row : rows_)
        maxValue = std::max(maxValue, chartMetricValue(row.metrics, chartMetric_));

    const float top = MARGIN + 40.0f;
    const float barHeight = std::min(48.0f, (areaHeight - 40.0f) / rows_.size() - 10.0f);
    const float labelWidth = 170.0f;
    const float maxBar = areaWidth - labelWidth - 90.0f;

    for (size_t i = 0; i < rows_.size(); ++i)
    {
        const ComparisonRow &row = rows_[i];
        double value = chartMetricValue(row.metrics, chartMetric_);
        float y = top + i * (barHeight + 10.0f);

        drawText(window, row.label(), {MARGIN, y + barHeight * 0.25f}, 14,
                 i == selectedRow_ ? sf::Color::White : sf::Color(180, 180, 180));

        float width = maxValue > 0.0 ? static_cast<float>(value / maxValue) * maxBar : 0.0f;
        sf::RectangleShape bar(sf::Vector2f(std::max(1.0f, width), barHeight));
        bar.setPosition({MARGIN + labelWidth, y});
        bar.setFillColor(rowColor(i));
        if (i == selectedRow_)
        {
            bar.setOutlineColor(sf::Color::White);
            bar.setOutlineThickness(2.0f);
        }
        window.draw(bar);

        std::ostringstream ss;
        if (chartMetric_ == ChartMetric::TimeMs)
            ss << std::fixed << std::setprecision(3) << value;
        else if (chartMetric_ == ChartMetric::Cost && !row.metrics.found)
            ss << "-";
        else
            ss << static_cast<long long>(value);
        drawText(window, ss.str(), {MARGIN + labelWidth + width + 8.0f, y + barHeight * 0.25f}, 14,
                 sf::Color(220, 220, 220));
    }
}

void MazeView::drawHUD(sf::RenderWindow &window) const
{
    sf::Vector2f size = static_cast<sf::Vector2f>(window.getSize());
    float hudX = size.x - PANEL_WIDTH + 10.0f;
    float hudY = 10.0f;
    float lineHeight = 20.0f;

    // the background
    sf::RectangleShape bg(sf::Vector2f(PANEL_WIDTH - 10.0f, size.y - 10.0f));
    bg.setPosition({hudX - 5.0f, hudY - 5.0f});
    bg.setFillColor(hudBackgroundColor_);
    window.draw(bg);

    drawText(window, "Maze Search", {hudX, hudY}, 18, sf::Color::White);
    hudY += 28.0f;

    if (!graph_)
    {
        drawText(window, "no maze loaded", {hudX, hudY}, 14, sf::Color(200, 200, 200));
        return;
    }

    std::ostringstream info;
    info << graph_->rows() << "x" << graph_->cols() << " (N = " << graph_->cellCount() << " cells)  "
         << "S " << cellToString(graph_->start()) << "  G " << cellToString(graph_->goal());
    drawText(window, info.str(), {hudX, hudY}, 12, sf::Color(180, 180, 255));
    hudY += lineHeight + 6.0f;

    // one line per run
    for (size_t i = 0; i < rows_.size(); ++i)
    {
        const ComparisonRow &row = rows_[i];
        std::ostringstream ss;
        ss << (i == selectedRow_ ? "> " : "  ");
        ss << std::setw(18) << std::left << row.label();
        if (row.metrics.found)
            ss << " cost " << std::setw(4) << std::right << row.metrics.pathCost;
        else
            ss << " no path  ";
        ss << "  exp " << row.metrics.expanded;

        drawText(window, ss.str(), {hudX, hudY}, 13, rowColor(i));
        hudY += lineHeight;
    }

    // detail block for the selected run
    if (!rows_.empty())
    {
        const ComparisonRow &row = rows_[selectedRow_];
        const SearchMetrics &m = row.metrics;
        hudY += 10.0f;

        std::ostringstream detail;
        detail << std::fixed << std::setprecision(3);
        detail << row.label() << "\n";
        detail << "Time: " << m.timeMs << " ms\n";
        detail << "Expanded: " << m.expanded << "   Generated: " << m.generated << "\n";
        detail << "Peak frontier: " << m.peakFrontier << "   Explored: " << m.peakExplored << "\n";
        detail << "Peak memory: " << m.peakStructures << "\n";
        detail << "Complete: " << formatFlag(m.complete) << "   Optimal: " << formatFlag(m.optimal) << "\n";
        if (m.found)
            detail << "Cost: " << m.pathCost << "   Length: " << m.pathLength << "\n";
        else
            detail << "No path found\n";

        drawText(window, detail.str(), {hudX, hudY}, 13, sf::Color::White);
        hudY += lineHeight * 8.0f;
    }

    drawText(window, "Arrows: Algorithm | Tab: Chart | M: Metric", {hudX, hudY}, 11, sf::Color(150, 150, 150));
    hudY += 14.0f;
    drawText(window, "R: New maze | P: Screenshot | H: Help | Esc: Quit", {hudX, hudY}, 11, sf::Color(150, 150, 150));
    hudY += 14.0f;

    sf::RectangleShape legend(sf::Vector2f(18.0f, 4.0f));
    legend.setPosition({hudX, hudY + 7.0f});
    legend.setFillColor(oneWayColor_);
    window.draw(legend);
    drawText(window, "one way wall (blocks the side it is drawn on)", {hudX + 24.0f, hudY}, 11, sf::Color(150, 150, 150));
}

void MazeView::drawHelpText(sf::RenderWindow &window) const
{
    std::ostringstream oss;
    oss << "=== Controls ===\n";
    oss << "[Left/Right] Select algorithm\n";
    oss << "[Tab] Toggle maze / bar chart\n";
    oss << "[M] Next chart metric\n";
    oss << "[R] Generate a new maze (next seed)\n";
    oss << "[P] Save screenshot (PNG)\n";
    oss << "[H] Close help | [Esc] Quit\n";

    sf::Text text(font_, oss.str(), 16);
    text.setFillColor(sf::Color::White);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.5f);

    sf::Vector2f size = static_cast<sf::Vector2f>(window.getSize());
    sf::FloatRect bounds = text.getLocalBounds();
    sf::Vector2f pos((size.x - PANEL_WIDTH - bounds.size.x) * 0.5f, (size.y - bounds.size.y) * 0.5f);
    text.setPosition(pos);

    sf::RectangleShape background(sf::Vector2f(bounds.size.x + 30.0f, bounds.size.y + 30.0f));
    background.setPosition({pos.x - 15.0f, pos.y - 15.0f});
    background.setFillColor(hudBackgroundColor_);
    window.draw(background);
    window.draw(text);
}

void MazeView::drawText(sf::RenderWindow &window, const std::string &str, sf::Vector2f position,
                        unsigned int size, sf::Color color) const
{
    sf::Text text(font_, str, size);
    text.setFillColor(color);
    text.setPosition(position);
    window.draw(text);
}

bool MazeView::saveScreenshot(const sf::RenderWindow &window, const std::string &path)
{
    sf::Texture texture;
    if (!texture.resize(window.getSize()))
    {
        std::cerr << "[VIEW] Error: could not allocate screenshot texture" << std::endl;
        return false;
    }
    texture.update(window);

    sf::Image image = texture.copyToImage();
    if (!image.saveToFile(path))
    {
        std::cerr << "[VIEW] Error: could not save screenshot to " << path << std::endl;
        return false;
    }

    std::cout << "[VIEW] screenshot saved to " << path << std::endl;
    return true;
}
