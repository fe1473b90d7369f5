#include "board_view.hpp"

#include <algorithm>
#include <stdexcept>
#include <opencv2/opencv.hpp>

BoardView::BoardView(const Board& puzzleBoard, int cellSize)
    : puzzle(cloneBoard(puzzleBoard)),
      n(requireSupportedSize(static_cast<int>(puzzleBoard.size()), "BoardView")),
      cellPx(cellSize),
      values(cloneBoard(puzzleBoard)),
      colors(n, std::vector<cv::Scalar>(n, palette::PLAIN)) {
    for (int r = 0; r < n; ++r)
        for (int c = 0; c < n; ++c)
            if (isClue(r, c)) colors[r][c] = palette::CLUE;
}

void BoardView::setCell(int r, int c, int value, const cv::Scalar& color) {
    if (isClue(r, c)) return;
    values[r][c] = value;
    colors[r][c] = color;
}

void BoardView::setColor(int r, int c, const cv::Scalar& color) {
    if (isClue(r, c)) return;
    colors[r][c] = color;
}

void BoardView::drawFullBoard(const Board& board, const cv::Scalar& color) {
    for (int r = 0; r < n; ++r)
        for (int c = 0; c < n; ++c) setCell(r, c, board[r][c], color);
}

void BoardView::updateValues(const Board& board) {
    for (int r = 0; r < n; ++r)
        for (int c = 0; c < n; ++c)
            if (!isClue(r, c)) values[r][c] = board[r][c];
}

void BoardView::apply(const SolveStep& step) {
    switch (step.kind) {
        case StepKind::Start:
            statusText = "Solving...";
            break;

        case StepKind::Update:
            setCell(step.row, step.col1, step.value1, palette::PLACED);
            lastIteration = step.iteration;
            break;

        case StepKind::Backtrack:
            setCell(step.row, step.col1, 0, palette::CONFLICT);
            lastIteration = step.iteration;
            break;

        case StepKind::Init:
            cultural = true;
            drawFullBoard(step.board, palette::PLAIN);
            currentBad = std::set<Cell>(step.conflicts.begin(), step.conflicts.end());
            previousBad = currentBad;
            history.push_back({step.iteration, step.fitness});
            lastFitness = step.fitness;
            lastIteration = step.iteration;
            statusText = "Initializing...";
            break;

        case StepKind::Iter: {
            std::set<Cell> newBad(step.conflicts.begin(), step.conflicts.end());
            updateValues(step.board);

            // Only repaint the cells whose conflict status changed
            for (const Cell& cell : previousBad)
                if (!newBad.count(cell)) setColor(cell.row, cell.col, palette::PLAIN);
            for (const Cell& cell : newBad)
                if (!previousBad.count(cell)) setColor(cell.row, cell.col, palette::CONFLICT);

            currentBad = newBad;
            previousBad = std::move(newBad);
            history.push_back({step.iteration, step.fitness});
            lastFitness = step.fitness;
            lastIteration = step.iteration;
            statusText = "Evolving...";
            break;
        }

        case StepKind::SwapTry:
            setCell(step.row, step.col1, step.value1, palette::SWAP);
            setCell(step.row, step.col2, step.value2, palette::SWAP);
            break;

        case StepKind::SwapReset:
            for (int c : {step.col1, step.col2})
                setColor(step.row, c, currentBad.count({step.row, c}) ? palette::CONFLICT : palette::PLAIN);
            break;

        case StepKind::Done:
            drawFullBoard(step.board, palette::SOLVED);
            if (cultural) {
                history.push_back({step.iteration, 0});
                lastFitness = 0;
            }
            lastIteration = step.iteration;
            statusText = "SOLVED!";
            break;

        case StepKind::Fail:
            if (!cultural) {
                lastIteration = step.iteration;
                statusText = "No Solution Found";
                break;
            }
            drawFullBoard(step.board, palette::PLAIN);
            for (const Cell& cell : step.conflicts) setColor(cell.row, cell.col, palette::CONFLICT);
            lastFitness = step.fitness;
            lastIteration = step.iteration;
            statusText = "STUCK (Local Optima)";
            break;
    }
}

cv::Mat BoardView::render() const {
    const int margin = cellPx / 4;
    const int statusHeight = std::max(32, cellPx * 2 / 3);
    const int gridPx = n * cellPx;
    cv::Mat canvas(gridPx + 2 * margin + statusHeight, gridPx + 2 * margin, CV_8UC3, cv::Scalar(245, 245, 245));

    const double fontScale = cellPx / 48.0;
    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            cv::Rect cell(margin + c * cellPx, margin + r * cellPx, cellPx, cellPx);
            cv::rectangle(canvas, cell, colors[r][c], cv::FILLED);
            cv::rectangle(canvas, cell, cv::Scalar(160, 160, 160), 1);

            int v = values[r][c];
            if (v == 0) continue;
            std::string text = std::to_string(v);
            int baseline = 0;
            cv::Size textSize = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, fontScale, 2, &baseline);
            cv::Point origin(cell.x + (cellPx - textSize.width) / 2, cell.y + (cellPx + textSize.height) / 2);
            cv::putText(canvas, text, origin, cv::FONT_HERSHEY_SIMPLEX, fontScale,
                        isClue(r, c) ? cv::Scalar(0, 0, 0) : cv::Scalar(120, 60, 0), 2, cv::LINE_AA);
        }
    }

    // Block borders
    auto [bh, bw] = blockDims(n);
    for (int r = 0; r <= n; r += bh) {
        int y = margin + r * cellPx;
        cv::line(canvas, {margin, y}, {margin + gridPx, y}, cv::Scalar(0, 0, 0), 3);
    }
    for (int c = 0; c <= n; c += bw) {
        int x = margin + c * cellPx;
        cv::line(canvas, {x, margin}, {x, margin + gridPx}, cv::Scalar(0, 0, 0), 3);
    }

    std::string line = statusText;
    if (lastFitness >= 0) line += "  Fitness: " + std::to_string(lastFitness);
    line += (cultural ? "  Generation: " : "  Steps: ") + std::to_string(lastIteration);
    cv::putText(canvas, line, {margin, gridPx + margin + statusHeight * 2 / 3}, cv::FONT_HERSHEY_SIMPLEX,
                std::min(0.6, fontScale * 0.6), cv::Scalar(40, 40, 40), 1, cv::LINE_AA);
    return canvas;
}

cv::Mat renderFitnessPlot(const std::vector<FitnessSample>& history, cv::Size size) {
    cv::Mat canvas(size, CV_8UC3, cv::Scalar(255, 255, 255));
    const int left = 60, right = 20, top = 40, bottom = 50;
    const cv::Point origin(left, size.height - bottom);
    const int plotW = size.width - left - right;
    const int plotH = size.height - top - bottom;

    cv::putText(canvas, "Fitness Evolution (Lower is Better)", {left, top - 15}, cv::FONT_HERSHEY_SIMPLEX, 0.55,
                cv::Scalar(0, 0, 0), 1, cv::LINE_AA);
    cv::line(canvas, origin, {left, top}, cv::Scalar(0, 0, 0), 1);
    cv::line(canvas, origin, {left + plotW, origin.y}, cv::Scalar(0, 0, 0), 1);
    cv::putText(canvas, "Generation", {left + plotW / 2 - 40, size.height - 15}, cv::FONT_HERSHEY_SIMPLEX, 0.45,
                cv::Scalar(0, 0, 0), 1, cv::LINE_AA);

    if (history.empty()) {
        cv::putText(canvas, "No data", {left + plotW / 2 - 30, top + plotH / 2}, cv::FONT_HERSHEY_SIMPLEX, 0.6,
                    cv::Scalar(120, 120, 120), 1, cv::LINE_AA);
        return canvas;
    }

    int maxIter = 1, maxFit = 1;
    for (const auto& s : history) {
        maxIter = std::max(maxIter, s.iteration);
        maxFit = std::max(maxFit, s.fitness);
    }

    std::vector<cv::Point> points;
    points.reserve(history.size());
    for (const auto& s : history) {
        int x = left + static_cast<int>(static_cast<double>(s.iteration) / maxIter * plotW);
        int y = origin.y - static_cast<int>(static_cast<double>(s.fitness) / maxFit * plotH);
        points.emplace_back(x, y);
    }
    cv::polylines(canvas, points, false, cv::Scalar(180, 119, 31), 2, cv::LINE_AA);

    cv::putText(canvas, std::to_string(maxFit), {8, top + 5}, cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(0, 0, 0), 1,
                cv::LINE_AA);
    cv::putText(canvas, "0", {left - 20, origin.y + 5}, cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(0, 0, 0), 1,
                cv::LINE_AA);
    cv::putText(canvas, std::to_string(maxIter), {left + plotW - 30, origin.y + 20}, cv::FONT_HERSHEY_SIMPLEX, 0.45,
                cv::Scalar(0, 0, 0), 1, cv::LINE_AA);
    return canvas;
}

void saveImage(const std::string& path, const cv::Mat& image) {
    if (image.empty() || !cv::imwrite(path, image))
        throw std::runtime_error("Could not write image " + path);
}
