#include "solve_step.hpp"

#include <utility>

std::string_view stepKindName(StepKind kind) {
    switch (kind) {
        case StepKind::Init: return "init";
        case StepKind::Iter: return "iter";
        case StepKind::SwapTry: return "swap_try";
        case StepKind::SwapReset: return "swap_reset";
        case StepKind::Start: return "start";
        case StepKind::Update: return "update";
        case StepKind::Backtrack: return "backtrack";
        case StepKind::Done: return "done";
        case StepKind::Fail: return "fail";
    }
    return "unknown";
}

SolveStep SolveStep::progress(StepKind kind, Board board, int fitness, int iteration,
                              std::vector<Cell> conflicts) {
    SolveStep step;
    step.kind = kind;
    step.board = std::move(board);
    step.fitness = fitness;
    step.iteration = iteration;
    step.conflicts = std::move(conflicts);
    return step;
}

SolveStep SolveStep::swapTry(int row, int col1, int value1, int col2, int value2) {
    SolveStep step;
    step.kind = StepKind::SwapTry;
    step.row = row;
    step.col1 = col1;
    step.value1 = value1;
    step.col2 = col2;
    step.value2 = value2;
    return step;
}

SolveStep SolveStep::swapReset(int row, int col1, int col2) {
    SolveStep step;
    step.kind = StepKind::SwapReset;
    step.row = row;
    step.col1 = col1;
    step.col2 = col2;
    return step;
}

SolveStep SolveStep::cellChange(StepKind kind, int row, int col, int value, int stepCount) {
    SolveStep step;
    step.kind = kind;
    step.row = row;
    step.col1 = col;
    step.value1 = value;
    step.iteration = stepCount;
    return step;
}
