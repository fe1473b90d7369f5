#pragma once

#include <compare>
#include <iosfwd>
#include <utility>
#include <vector>

// N x N grid, 0 marks an unassigned cell.
using Board = std::vector<std::vector<int>>;
// True where the puzzle supplied a clue.
using FixedMask = std::vector<std::vector<bool>>;

struct Cell {
    int row;
    int col;

    auto operator<=>(const Cell&) const = default;
};

bool isSupportedSize(int n);

// Returns n, or throws std::invalid_argument naming the caller.
int requireSupportedSize(int n, const char* who);

// (blockHeight, blockWidth). 6x6 uses 2x3 blocks, the square sizes use sqrt(N).
std::pair<int, int> blockDims(int n);

Board makeEmptyBoard(int n);
Board cloneBoard(const Board& board);

// True if val does not already occur in the row, column or block of (r, c).
// val == 0 is always valid.
bool validAt(const Board& board, int r, int c, int val);

FixedMask fixedMaskOf(const Board& puzzle);

// Per row, the values 1..N that the row's clues do not use.
std::vector<std::vector<int>> missingValues(const Board& puzzle);

// Every column followed by every block, each as a list of cells.
std::vector<std::vector<Cell>> constraintGroups(int n);

void printBoard(const Board& board, std::ostream& out);
