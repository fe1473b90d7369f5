#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "board_rules.hpp"
#include "solve_step.hpp"

/**
 * Depth-first Sudoku search, driven one event at a time.
 *
 * optimizations:
 * 1. Bitmasks: rows, cols and blocks track used values in 16-bit masks.
 * 2. MRV heuristic: always branches on the empty cell with the fewest
 *    candidates, trying its values in ascending order.
 * 3. Lookup table: block index of every cell is precomputed.
 *
 * The recursion of the classic formulation is kept as an explicit frame
 * stack so the search can pause after every placement and every undo.
 */
class BacktrackingSolver : public StepSequence {
public:
    // Throws std::invalid_argument for unsupported sizes, out-of-range values
    // and clues that already clash with each other.
    explicit BacktrackingSolver(const Board& puzzle);

    std::optional<SolveStep> next() override;

    const Board& board() const { return grid; }
    int steps() const { return stepCount; }

private:
    struct Frame {
        int cell;
        uint16_t remaining;
        int placed;
    };

    void place(int idx, int val);
    void remove(int idx, int val);
    uint16_t getCandidates(int idx) const;
    uint16_t selectCell(size_t k);

    int n;
    uint16_t fullMask;
    Board grid;
    std::vector<uint16_t> rowMask;
    std::vector<uint16_t> colMask;
    std::vector<uint16_t> boxMask;
    std::vector<int> boxIndices;
    std::vector<int> emptyCells;

    std::vector<Frame> stack;
    bool started = false;
    bool descending = true;
    bool finished = false;
    int stepCount = 0;
};

// Runs a BacktrackingSolver to the end; nullopt if the board has no solution.
std::optional<Board> backtrackSolve(const Board& puzzle);

class BacktrackingStrategy : public SolverStrategy {
public:
    std::unique_ptr<StepSequence> begin(const Board& puzzle) const override;
    std::string_view name() const override { return "Backtracking Algorithm"; }
};
