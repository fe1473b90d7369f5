#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "board_rules.hpp"

enum class StepKind {
    // Cultural solver
    Init,
    Iter,
    SwapTry,
    SwapReset,
    // Backtracking solver
    Start,
    Update,
    Backtrack,
    // Both
    Done,
    Fail,
};

std::string_view stepKindName(StepKind kind);

// One event of a solve. Which fields carry meaning depends on kind:
//   Init/Iter/Done/Fail  board, fitness, iteration, conflicts
//   SwapTry              row, col1, value1, col2, value2 (values after the swap)
//   SwapReset            row, col1, col2
//   Start                iteration (always 0)
//   Update/Backtrack     row, col1, value1, iteration (step counter)
// The backtracking Done/Fail use iteration as the step counter; its Fail
// carries no board.
struct SolveStep {
    StepKind kind = StepKind::Init;
    Board board;
    int fitness = 0;
    int iteration = 0;
    std::vector<Cell> conflicts;
    int row = -1;
    int col1 = -1;
    int value1 = 0;
    int col2 = -1;
    int value2 = 0;

    bool isTerminal() const { return kind == StepKind::Done || kind == StepKind::Fail; }

    static SolveStep progress(StepKind kind, Board board, int fitness, int iteration,
                              std::vector<Cell> conflicts = {});
    static SolveStep swapTry(int row, int col1, int value1, int col2, int value2);
    static SolveStep swapReset(int row, int col1, int col2);
    static SolveStep cellChange(StepKind kind, int row, int col, int value, int stepCount);
};

// A lazy, finite, single-pass sequence of solve events. next() does all the
// work up to the following event; once the terminal Done/Fail event has been
// returned every further call yields std::nullopt.
class StepSequence {
public:
    virtual ~StepSequence() = default;
    virtual std::optional<SolveStep> next() = 0;
};

// A solving strategy: turns a starting board into a step sequence.
class SolverStrategy {
public:
    virtual ~SolverStrategy() = default;
    virtual std::unique_ptr<StepSequence> begin(const Board& puzzle) const = 0;
    virtual std::string_view name() const = 0;
};
