#include "fitness.hpp"

#include <utility>

namespace {

// Occurrence count of each value inside one group. Index 0 counts blanks.
std::vector<int> valueCounts(const Board& board, const std::vector<Cell>& group, int n) {
    std::vector<int> counts(n + 1, 0);
    for (const Cell& cell : group) {
        int v = board[cell.row][cell.col];
        if (v >= 0 && v <= n) ++counts[v];
    }
    return counts;
}

} // namespace

int boardFitness(const Board& board) {
    const int n = static_cast<int>(board.size());
    auto [bh, bw] = blockDims(n);
    std::vector<int> counts(n + 1);
    int conflicts = 0;

    auto flush = [&]() {
        for (int& count : counts) {
            if (count > 1) conflicts += count;
            count = 0;
        }
    };

    for (int c = 0; c < n; ++c) {
        for (int r = 0; r < n; ++r) ++counts[board[r][c]];
        flush();
    }
    for (int br = 0; br < n; br += bh) {
        for (int bc = 0; bc < n; bc += bw) {
            for (int i = br; i < br + bh; ++i)
                for (int j = bc; j < bc + bw; ++j) ++counts[board[i][j]];
            flush();
        }
    }
    return conflicts;
}

ConflictLocator::ConflictLocator(FixedMask fixedMask)
    : n(requireSupportedSize(static_cast<int>(fixedMask.size()), "ConflictLocator")),
      fixed(std::move(fixedMask)),
      groups(constraintGroups(n)) {
}

std::vector<Cell> ConflictLocator::conflictedCells(const Board& board) const {
    std::vector<std::vector<bool>> marked(n, std::vector<bool>(n, false));

    for (const auto& group : groups) {
        std::vector<int> counts = valueCounts(board, group, n);
        for (const Cell& cell : group) {
            int v = board[cell.row][cell.col];
            if (v >= 0 && v <= n && counts[v] > 1 && !fixed[cell.row][cell.col]) marked[cell.row][cell.col] = true;
        }
    }

    std::vector<Cell> cells;
    for (int r = 0; r < n; ++r)
        for (int c = 0; c < n; ++c)
            if (marked[r][c]) cells.push_back({r, c});
    return cells;
}
