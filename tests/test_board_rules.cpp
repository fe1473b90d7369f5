#include "board_rules.hpp"
#include "test_support.hpp"

#include <sstream>
#include <stdexcept>

int main() {
    std::vector<TestCase> tests = {
        {"block dimensions per grid size", [](TestResult& t) {
            check(t, blockDims(4) == std::make_pair(2, 2), "4x4 uses 2x2 blocks");
            check(t, blockDims(6) == std::make_pair(2, 3), "6x6 uses 2x3 blocks");
            check(t, blockDims(9) == std::make_pair(3, 3), "9x9 uses 3x3 blocks");
        }},
        {"unsupported sizes are rejected", [](TestResult& t) {
            check(t, isSupportedSize(4) && isSupportedSize(6) && isSupportedSize(9), "4, 6, 9 supported");
            check(t, !isSupportedSize(5) && !isSupportedSize(16) && !isSupportedSize(0), "others unsupported");
            check(t, throwsA<std::invalid_argument>([] { requireSupportedSize(8, "test"); }), "8 throws");
            check(t, requireSupportedSize(6, "test") == 6, "6 passes through");
        }},
        {"validAt checks row, column and block", [](TestResult& t) {
            Board board = makeEmptyBoard(4);
            board[0][0] = 1;
            check(t, !validAt(board, 0, 3, 1), "row clash");
            check(t, !validAt(board, 3, 0, 1), "column clash");
            check(t, !validAt(board, 1, 1, 1), "block clash");
            check(t, validAt(board, 1, 2, 1), "other block, row and column");
            check(t, validAt(board, 0, 1, 0), "zero is always valid");
            check(t, validAt(board, 0, 1, 2), "unused value");
        }},
        {"validAt uses 2x3 blocks on 6x6", [](TestResult& t) {
            Board board = makeEmptyBoard(6);
            board[0][0] = 5;
            check(t, !validAt(board, 1, 2, 5), "same 2x3 block");
            check(t, validAt(board, 2, 1, 5), "block below");
            check(t, validAt(board, 1, 3, 5), "block to the right");
        }},
        {"clone does not alias", [](TestResult& t) {
            Board original = fixtures::solved4();
            Board copy = cloneBoard(original);
            copy[0][0] = 9;
            check(t, original[0][0] == 1, "source unchanged");
            check(t, copy != original, "copy changed");
        }},
        {"fixed mask and missing values", [](TestResult& t) {
            Board puzzle = {{0, 2, 0, 4}, {3, 4, 1, 2}, {0, 0, 0, 0}, {4, 0, 2, 0}};
            FixedMask fixed = fixedMaskOf(puzzle);
            check(t, !fixed[0][0] && fixed[0][1] && fixed[1][2] && !fixed[2][3], "mask follows clues");
            auto missing = missingValues(puzzle);
            check(t, missing[0] == std::vector<int>({1, 3}), "row 0 misses 1 and 3");
            check(t, missing[1].empty(), "full row misses nothing");
            check(t, missing[2] == std::vector<int>({1, 2, 3, 4}), "empty row misses everything");
            check(t, missing[3] == std::vector<int>({1, 3}), "row 3 misses 1 and 3");
        }},
        {"constraint groups cover every cell twice", [](TestResult& t) {
            for (int n : {4, 6, 9}) {
                auto groups = constraintGroups(n);
                check(t, static_cast<int>(groups.size()) == 2 * n, "N columns plus N blocks");
                std::vector<std::vector<int>> hits(n, std::vector<int>(n, 0));
                for (const auto& group : groups) {
                    check(t, static_cast<int>(group.size()) == n, "groups hold N cells");
                    for (const Cell& cell : group) ++hits[cell.row][cell.col];
                }
                for (const auto& row : hits)
                    for (int h : row) check(t, h == 2, "one column and one block per cell");
            }
        }},
        {"printBoard draws block separators", [](TestResult& t) {
            Board board = fixtures::solved4();
            board[3][3] = 0;
            std::ostringstream out;
            printBoard(board, out);
            const std::string text = out.str();
            check(t, text.rfind("1 2 | 3 4 \n", 0) == 0, "first row");
            check(t, text.find("----+----\n") != std::string::npos, "block separator");
            check(t, text.find("4 3 | 2 . \n") != std::string::npos, "empty cell printed as dot");
        }},
    };
    return runTests("board_rules", tests);
}
