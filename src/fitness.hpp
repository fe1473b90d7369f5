#pragma once

#include <vector>

#include "board_rules.hpp"

// Number of cells taking part in a duplicate within a column or block.
// A value seen k > 1 times in one group contributes k. Rows are not
// checked: every candidate keeps its rows complete. Values must lie in [0, N].
int boardFitness(const Board& board);

class ConflictLocator {
public:
    explicit ConflictLocator(FixedMask fixed);

    // Non-fixed cells sharing their value with another cell of the same
    // column or block, sorted by (row, col).
    std::vector<Cell> conflictedCells(const Board& board) const;

private:
    int n;
    FixedMask fixed;
    std::vector<std::vector<Cell>> groups;
};
