#include "backtracking_solver.hpp"

#include <bit>
#include <stdexcept>
#include <string>
#include <utility>

BacktrackingSolver::BacktrackingSolver(const Board& puzzle)
    : n(requireSupportedSize(static_cast<int>(puzzle.size()), "BacktrackingSolver")),
      fullMask(static_cast<uint16_t>((1u << n) - 1)),
      grid(makeEmptyBoard(n)),
      rowMask(n, 0),
      colMask(n, 0),
      boxMask(n, 0),
      boxIndices(n * n) {
    // Precompute block indices to avoid repetitive calculation
    auto [bh, bw] = blockDims(n);
    const int blocksPerRow = n / bw;
    for (int i = 0; i < n * n; ++i) {
        int r = i / n;
        int c = i % n;
        boxIndices[i] = (r / bh) * blocksPerRow + (c / bw);
    }

    for (int r = 0; r < n; ++r) {
        if (static_cast<int>(puzzle[r].size()) != n)
            throw std::invalid_argument("BacktrackingSolver: row " + std::to_string(r) + " has the wrong width");
        for (int c = 0; c < n; ++c) {
            int v = puzzle[r][c];
            if (v < 0 || v > n)
                throw std::invalid_argument("BacktrackingSolver: value " + std::to_string(v) + " out of range");
            if (v == 0) continue;
            int idx = r * n + c;
            if (!(getCandidates(idx) & (1u << (v - 1))))
                throw std::invalid_argument("BacktrackingSolver: clue " + std::to_string(v) + " at (" +
                                            std::to_string(r) + ", " + std::to_string(c) + ") clashes");
            place(idx, v);
        }
    }

    // Collect remaining empty cells for the search
    for (int i = 0; i < n * n; ++i)
        if (grid[i / n][i % n] == 0) emptyCells.push_back(i);
    stack.reserve(emptyCells.size());
}

// Mark a value as used in the bitmasks and grid
void BacktrackingSolver::place(int idx, int val) {
    uint16_t bit = static_cast<uint16_t>(1u << (val - 1));
    grid[idx / n][idx % n] = val;
    rowMask[idx / n] |= bit;
    colMask[idx % n] |= bit;
    boxMask[boxIndices[idx]] |= bit;
}

// Unmark a value (backtracking)
void BacktrackingSolver::remove(int idx, int val) {
    uint16_t bit = static_cast<uint16_t>(1u << (val - 1));
    grid[idx / n][idx % n] = 0;
    rowMask[idx / n] &= ~bit;
    colMask[idx % n] &= ~bit;
    boxMask[boxIndices[idx]] &= ~bit;
}

// Bitmask of values still allowed in a cell, bit v-1 set for value v
uint16_t BacktrackingSolver::getCandidates(int idx) const {
    return ~(rowMask[idx / n] | colMask[idx % n] | boxMask[boxIndices[idx]]) & fullMask;
}

// MRV: scan emptyCells[k..] for the cell with the fewest candidates and
// swap it to position k. Returns its candidate mask, 0 on a dead end.
uint16_t BacktrackingSolver::selectCell(size_t k) {
    size_t bestIdx = k;
    int minCandidates = n + 1;
    uint16_t bestMask = 0;

    for (size_t i = k; i < emptyCells.size(); ++i) {
        uint16_t mask = getCandidates(emptyCells[i]);
        int count = std::popcount(mask);
        if (count == 0) return 0;
        if (count < minCandidates) {
            minCandidates = count;
            bestMask = mask;
            bestIdx = i;
            if (count == 1) break;
        }
    }

    std::swap(emptyCells[k], emptyCells[bestIdx]);
    return bestMask;
}

std::optional<SolveStep> BacktrackingSolver::next() {
    if (finished) return std::nullopt;
    if (!started) {
        started = true;
        return SolveStep::cellChange(StepKind::Start, -1, -1, 0, 0);
    }

    while (true) {
        if (descending) {
            descending = false;
            size_t k = stack.size();
            if (k == emptyCells.size()) {
                finished = true;
                return SolveStep::progress(StepKind::Done, cloneBoard(grid), 0, stepCount);
            }
            uint16_t mask = selectCell(k);
            if (mask != 0) stack.push_back({emptyCells[k], mask, 0});
        }

        if (stack.empty()) {
            finished = true;
            SolveStep fail;
            fail.kind = StepKind::Fail;
            fail.iteration = stepCount;
            return fail;
        }

        Frame& frame = stack.back();
        const int r = frame.cell / n;
        const int c = frame.cell % n;

        // The value placed last time led nowhere
        if (frame.placed != 0) {
            remove(frame.cell, frame.placed);
            frame.placed = 0;
            return SolveStep::cellChange(StepKind::Backtrack, r, c, 0, ++stepCount);
        }

        if (frame.remaining == 0) {
            stack.pop_back();
            continue;
        }

        // Lowest remaining candidate, then clear its bit
        int val = std::countr_zero(frame.remaining) + 1;
        frame.remaining &= static_cast<uint16_t>(frame.remaining - 1);
        place(frame.cell, val);
        frame.placed = val;
        descending = true;
        return SolveStep::cellChange(StepKind::Update, r, c, val, ++stepCount);
    }
}

std::optional<Board> backtrackSolve(const Board& puzzle) {
    BacktrackingSolver solver(puzzle);
    while (auto step = solver.next()) {
        if (step->kind == StepKind::Done) return std::move(step->board);
        if (step->kind == StepKind::Fail) return std::nullopt;
    }
    return std::nullopt;
}

std::unique_ptr<StepSequence> BacktrackingStrategy::begin(const Board& puzzle) const {
    return std::make_unique<BacktrackingSolver>(puzzle);
}
