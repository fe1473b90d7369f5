#include "backtracking_solver.hpp"
#include "fitness.hpp"
#include "puzzle_generator.hpp"
#include "test_support.hpp"

#include <random>
#include <stdexcept>

namespace {

std::vector<SolveStep> runAll(StepSequence& sequence) {
    std::vector<SolveStep> steps;
    while (auto step = sequence.next()) steps.push_back(std::move(*step));
    return steps;
}

} // namespace

int main() {
    std::vector<TestCase> tests = {
        {"solves the classic 9x9 puzzle", [](TestResult& t) {
            std::optional<Board> result = backtrackSolve(fixtures::puzzle9());
            check(t, result.has_value(), "solution found");
            if (result) check(t, *result == fixtures::solved9(), "unique solution");
        }},
        {"event stream replays onto the puzzle", [](TestResult& t) {
            Board puzzle = fixtures::puzzle9();
            BacktrackingSolver solver(puzzle);
            std::vector<SolveStep> steps = runAll(solver);
            check(t, !steps.empty() && steps.front().kind == StepKind::Start, "starts with start");
            check(t, !steps.empty() && steps.back().kind == StepKind::Done, "ends with done");
            if (steps.size() < 2) return;
            check(t, steps.front().iteration == 0, "start is step 0");

            Board replay = cloneBoard(puzzle);
            int expectedStep = 1;
            for (size_t i = 1; i + 1 < steps.size(); ++i) {
                const SolveStep& step = steps[i];
                check(t, step.kind == StepKind::Update || step.kind == StepKind::Backtrack, "cell events only");
                check(t, step.iteration == expectedStep++, "steps count up by one");
                check(t, puzzle[step.row][step.col1] == 0, "never touches a clue");
                if (step.kind == StepKind::Update) {
                    check(t, replay[step.row][step.col1] == 0, "places into an empty cell");
                    check(t, validAt(replay, step.row, step.col1, step.value1), "placement is legal");
                } else {
                    check(t, step.value1 == 0, "backtrack clears the cell");
                }
                replay[step.row][step.col1] = step.value1;
            }
            check(t, replay == steps.back().board, "replayed board equals the result");
            check(t, steps.back().iteration == solver.steps(), "done carries the step count");
            check(t, steps.back().fitness == 0, "done fitness 0");
            check(t, !solver.next().has_value(), "finished sequence stays finished");
        }},
        {"already solved board finishes at once", [](TestResult& t) {
            BacktrackingSolver solver(fixtures::solved6());
            std::vector<SolveStep> steps = runAll(solver);
            check(t, steps.size() == 2, "start and done");
            if (steps.size() == 2) {
                check(t, steps[1].kind == StepKind::Done && steps[1].iteration == 0, "done with no steps");
                check(t, steps[1].board == fixtures::solved6(), "board returned");
            }
        }},
        {"dead end without clashing clues fails", [](TestResult& t) {
            // (0, 3) needs a 4, which column 3 already holds.
            Board puzzle = {{1, 2, 3, 0},
                            {0, 0, 0, 0},
                            {0, 0, 0, 4},
                            {0, 0, 0, 0}};
            BacktrackingSolver solver(puzzle);
            std::vector<SolveStep> steps = runAll(solver);
            check(t, !steps.empty() && steps.back().kind == StepKind::Fail, "fail reported");
            if (!steps.empty()) check(t, steps.back().board.empty(), "fail carries no board");
            check(t, !backtrackSolve(puzzle).has_value(), "no solution");
        }},
        {"undo after a placement that leads nowhere", [](TestResult& t) {
            // (0, 2) and (0, 3) can both only take 4.
            Board puzzle = {{1, 2, 0, 0},
                            {0, 0, 3, 0},
                            {0, 0, 0, 3},
                            {0, 0, 0, 0}};
            BacktrackingSolver solver(puzzle);
            std::vector<SolveStep> steps = runAll(solver);
            check(t, steps.size() == 4, "start, update, backtrack, fail");
            if (steps.size() != 4) return;
            check(t, steps[1].kind == StepKind::Update && steps[1].row == 0 && steps[1].col1 == 2 &&
                         steps[1].value1 == 4 && steps[1].iteration == 1,
                  "places 4 at (0, 2)");
            check(t, steps[2].kind == StepKind::Backtrack && steps[2].row == 0 && steps[2].col1 == 2 &&
                         steps[2].value1 == 0 && steps[2].iteration == 2,
                  "takes it back");
            check(t, steps[3].kind == StepKind::Fail && steps[3].iteration == 2, "fails after two steps");
            check(t, solver.board() == puzzle, "board restored");
        }},
        {"clashing or malformed clues throw", [](TestResult& t) {
            Board clash = makeEmptyBoard(4);
            clash[0][0] = 2;
            clash[3][0] = 2;
            check(t, throwsA<std::invalid_argument>([&] { BacktrackingSolver solver(clash); }), "column clash");
            Board wide = makeEmptyBoard(6);
            wide[1][1] = 7;
            check(t, throwsA<std::invalid_argument>([&] { BacktrackingSolver solver(wide); }), "value out of range");
            check(t, throwsA<std::invalid_argument>([] { BacktrackingSolver solver(makeEmptyBoard(8)); }),
                  "unsupported size");
        }},
        {"generated puzzles of every size are solved", [](TestResult& t) {
            std::mt19937 rng(606);
            for (int n : {4, 6, 9}) {
                for (int i = 0; i < 3; ++i) {
                    Board puzzle = generatePuzzle(n, rng, 0.5);
                    BacktrackingStrategy strategy;
                    auto sequence = strategy.begin(puzzle);
                    std::vector<SolveStep> steps = runAll(*sequence);
                    check(t, !steps.empty() && steps.back().kind == StepKind::Done, "done");
                    if (steps.empty()) continue;
                    check(t, boardFitness(steps.back().board) == 0, "valid solution");
                    check(t, rowsComplete(steps.back().board), "complete rows");
                    check(t, keepsClues(steps.back().board, puzzle), "clues kept");
                }
            }
        }},
    };
    return runTests("backtracking_solver", tests);
}
