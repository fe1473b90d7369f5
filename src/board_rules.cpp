#include "board_rules.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

bool isSupportedSize(int n) {
    return n == 4 || n == 6 || n == 9;
}

int requireSupportedSize(int n, const char* who) {
    if (!isSupportedSize(n))
        throw std::invalid_argument(std::string(who) + ": unsupported grid size " + std::to_string(n));
    return n;
}

std::pair<int, int> blockDims(int n) {
    if (n == 6) return {2, 3};
    int b = static_cast<int>(std::lround(std::sqrt(static_cast<double>(n))));
    return {b, b};
}

Board makeEmptyBoard(int n) {
    return Board(n, std::vector<int>(n, 0));
}

Board cloneBoard(const Board& board) {
    Board copy;
    copy.reserve(board.size());
    for (const auto& row : board) copy.emplace_back(row.begin(), row.end());
    return copy;
}

bool validAt(const Board& board, int r, int c, int val) {
    if (val == 0) return true;
    const int n = static_cast<int>(board.size());

    for (int j = 0; j < n; ++j)
        if (board[r][j] == val) return false;
    for (int i = 0; i < n; ++i)
        if (board[i][c] == val) return false;

    auto [bh, bw] = blockDims(n);
    int startR = (r / bh) * bh;
    int startC = (c / bw) * bw;
    for (int i = startR; i < startR + bh; ++i)
        for (int j = startC; j < startC + bw; ++j)
            if (board[i][j] == val) return false;
    return true;
}

FixedMask fixedMaskOf(const Board& puzzle) {
    FixedMask mask;
    mask.reserve(puzzle.size());
    for (const auto& row : puzzle) {
        std::vector<bool> fixedRow(row.size());
        for (size_t c = 0; c < row.size(); ++c) fixedRow[c] = row[c] != 0;
        mask.push_back(std::move(fixedRow));
    }
    return mask;
}

std::vector<std::vector<int>> missingValues(const Board& puzzle) {
    const int n = static_cast<int>(puzzle.size());
    std::vector<std::vector<int>> missing(n);
    for (int r = 0; r < n; ++r) {
        std::vector<bool> present(n + 1, false);
        for (int v : puzzle[r])
            if (v >= 1 && v <= n) present[v] = true;
        for (int v = 1; v <= n; ++v)
            if (!present[v]) missing[r].push_back(v);
    }
    return missing;
}

std::vector<std::vector<Cell>> constraintGroups(int n) {
    std::vector<std::vector<Cell>> groups;
    groups.reserve(2 * n);

    for (int c = 0; c < n; ++c) {
        std::vector<Cell> column;
        column.reserve(n);
        for (int r = 0; r < n; ++r) column.push_back({r, c});
        groups.push_back(std::move(column));
    }

    auto [bh, bw] = blockDims(n);
    for (int br = 0; br < n; br += bh) {
        for (int bc = 0; bc < n; bc += bw) {
            std::vector<Cell> block;
            block.reserve(n);
            for (int i = br; i < br + bh; ++i)
                for (int j = bc; j < bc + bw; ++j) block.push_back({i, j});
            groups.push_back(std::move(block));
        }
    }
    return groups;
}

void printBoard(const Board& board, std::ostream& out) {
    const int n = static_cast<int>(board.size());
    if (n == 0) return;
    auto [bh, bw] = blockDims(n);

    // Each cell prints as "v ", each block separator as "| ".
    std::string separator;
    for (int c = 0; c < n; ++c) {
        if (c > 0 && c % bw == 0) separator += "+-";
        separator += "--";
    }
    separator.pop_back();

    for (int r = 0; r < n; ++r) {
        if (r > 0 && r % bh == 0) out << separator << "\n";
        for (int c = 0; c < n; ++c) {
            if (c > 0 && c % bw == 0) out << "| ";
            int v = board[r][c];
            out << (v == 0 ? '.' : static_cast<char>('0' + v)) << " ";
        }
        out << "\n";
    }
}
