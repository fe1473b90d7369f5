#include "puzzle_generator.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace {

bool fill(Board& board, int n, std::mt19937& rng) {
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (board[i][j] != 0) continue;

            std::vector<int> nums(n);
            std::iota(nums.begin(), nums.end(), 1);
            std::shuffle(nums.begin(), nums.end(), rng);
            for (int v : nums) {
                if (validAt(board, i, j, v)) {
                    board[i][j] = v;
                    if (fill(board, n, rng)) return true;
                    board[i][j] = 0;
                }
            }
            return false;
        }
    }
    return true;
}

} // namespace

Board generateSolvedBoard(int n, std::mt19937& rng) {
    requireSupportedSize(n, "generateSolvedBoard");
    Board board = makeEmptyBoard(n);
    if (!fill(board, n, rng))
        throw std::logic_error("generateSolvedBoard: empty grid could not be filled");
    return board;
}

Board generatePuzzle(int n, std::mt19937& rng, double difficulty) {
    if (!(difficulty >= 0.0 && difficulty <= 1.0))
        throw std::invalid_argument("generatePuzzle: difficulty must be in [0, 1]");

    Board puzzle = generateSolvedBoard(n, rng);

    std::vector<Cell> cells;
    cells.reserve(n * n);
    for (int r = 0; r < n; ++r)
        for (int c = 0; c < n; ++c) cells.push_back({r, c});
    std::shuffle(cells.begin(), cells.end(), rng);

    const int removeCount = static_cast<int>(n * n * difficulty);
    for (int i = 0; i < removeCount; ++i) puzzle[cells[i].row][cells[i].col] = 0;
    return puzzle;
}
