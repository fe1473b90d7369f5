#pragma once

#include <set>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "board_rules.hpp"
#include "solve_step.hpp"

struct FitnessSample {
    int iteration;
    int fitness;
};

// Cell colours (BGR)
namespace palette {
const cv::Scalar CLUE(224, 224, 224);
const cv::Scalar PLAIN(255, 255, 255);
const cv::Scalar CONFLICT(153, 153, 255);
const cv::Scalar SWAP(153, 204, 255);
const cv::Scalar SOLVED(204, 255, 204);
const cv::Scalar PLACED(153, 255, 153);
} // namespace palette

/**
 * Visual state of a solve: cell values and colours, the status line and the
 * fitness history, updated by feeding it the solver's steps in order.
 * Clue cells are never repainted.
 */
class BoardView {
public:
    explicit BoardView(const Board& puzzle, int cellPx = 56);

    void apply(const SolveStep& step);

    // Board image with block borders and a status strip underneath.
    cv::Mat render() const;

    const Board& board() const { return values; }
    cv::Scalar cellColor(int r, int c) const { return colors[r][c]; }
    const std::set<Cell>& conflictCells() const { return currentBad; }
    const std::vector<FitnessSample>& fitnessHistory() const { return history; }
    const std::string& status() const { return statusText; }

private:
    bool isClue(int r, int c) const { return puzzle[r][c] != 0; }
    void setCell(int r, int c, int value, const cv::Scalar& color);
    void setColor(int r, int c, const cv::Scalar& color);
    void drawFullBoard(const Board& board, const cv::Scalar& color);
    void updateValues(const Board& board);

    Board puzzle;
    int n;
    int cellPx;
    Board values;
    std::vector<std::vector<cv::Scalar>> colors;
    std::set<Cell> currentBad;
    std::set<Cell> previousBad;
    std::vector<FitnessSample> history;
    std::string statusText = "Ready";
    bool cultural = false;
    int lastFitness = -1;
    int lastIteration = 0;
};

// Fitness-over-iterations line chart.
cv::Mat renderFitnessPlot(const std::vector<FitnessSample>& history, cv::Size size = cv::Size(640, 400));

// Writes an image; throws std::runtime_error if it cannot be written.
void saveImage(const std::string& path, const cv::Mat& image);
