#include "cultural_solver.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

CulturalConfig CulturalConfig::forGridSize(int n) {
    CulturalConfig config;
    config.popSize = 150;
    config.maxIters = n > 6 ? 2000 : 1000;
    return config;
}

CulturalSolver::CulturalSolver(const Board& puzzleBoard, CulturalConfig config)
    : puzzle(cloneBoard(puzzleBoard)),
      n(requireSupportedSize(static_cast<int>(puzzleBoard.size()), "CulturalSolver")),
      cfg(config),
      numElite(std::max(2, static_cast<int>(std::lround(config.popSize * config.eliteFrac)))),
      fixed(fixedMaskOf(puzzleBoard)),
      missing(missingValues(puzzleBoard)),
      conflicts(fixed),
      belief(n),
      rng(config.seed ? *config.seed : std::random_device{}()) {
    int emptyCells = 0;
    for (int r = 0; r < n; ++r) {
        if (static_cast<int>(puzzle[r].size()) != n)
            throw std::invalid_argument("CulturalSolver: row " + std::to_string(r) + " has the wrong width");
        int open = 0;
        for (int v : puzzle[r]) {
            if (v < 0 || v > n)
                throw std::invalid_argument("CulturalSolver: value " + std::to_string(v) + " out of range");
            if (v == 0) ++open;
        }
        // A row repeating a clue cannot be completed to a permutation.
        if (open != static_cast<int>(missing[r].size()))
            throw std::invalid_argument("CulturalSolver: row " + std::to_string(r) + " repeats a clue");
        emptyCells += open;
    }
    if (emptyCells == 0)
        throw std::invalid_argument("CulturalSolver: puzzle has no empty cells");
    if (!(cfg.eliteFrac > 0.0 && cfg.eliteFrac <= 1.0))
        throw std::invalid_argument("CulturalSolver: elite fraction must be in (0, 1]");
    if (cfg.popSize < numElite)
        throw std::invalid_argument("CulturalSolver: population of " + std::to_string(cfg.popSize) +
                                    " is smaller than the elite count " + std::to_string(numElite));
    if (cfg.maxIters < 0)
        throw std::invalid_argument("CulturalSolver: negative iteration budget");
}

std::optional<SolveStep> CulturalSolver::next() {
    // Phases that produce no event fall through to the next phase.
    while (true) {
        switch (phase) {
            case Phase::Init:
                return initialise();
            case Phase::IterationStart:
                return beginIteration();
            case Phase::Polish:
                if (auto step = proposeSwap()) return step;
                phase = Phase::Regrow;
                break;
            case Phase::ApplySwap:
                return applySwap();
            case Phase::ScorePolish:
                if (auto step = scorePolish()) return step;
                break;
            case Phase::Regrow:
                if (auto step = regrow()) return step;
                break;
            case Phase::Finished:
                return std::nullopt;
        }
    }
}

Board CulturalSolver::randomIndividual() {
    Board board = cloneBoard(puzzle);
    for (int r = 0; r < n; ++r) {
        std::vector<int> values = missing[r];
        std::shuffle(values.begin(), values.end(), rng);
        size_t idx = 0;
        for (int c = 0; c < n; ++c)
            if (!fixed[r][c]) board[r][c] = values[idx++];
    }
    return board;
}

std::vector<int> CulturalSolver::mutableColumns(int row, int except) const {
    std::vector<int> cols;
    for (int c = 0; c < n; ++c)
        if (!fixed[row][c] && c != except) cols.push_back(c);
    return cols;
}

SolveStep CulturalSolver::finish(State outcome, SolveStep step) {
    state_ = outcome;
    phase = Phase::Finished;
    return step;
}

SolveStep CulturalSolver::initialise() {
    population_.clear();
    population_.reserve(cfg.popSize);
    for (int i = 0; i < cfg.popSize; ++i) {
        Board board = randomIndividual();
        int fit = boardFitness(board);
        population_.push_back({std::move(board), fit});
    }

    auto best = std::min_element(population_.begin(), population_.end(),
                                 [](const Candidate& a, const Candidate& b) { return a.fitness < b.fitness; });
    bestBoard_ = cloneBoard(best->board);
    bestFitness_ = best->fitness;

    state_ = State::Evolving;
    phase = Phase::IterationStart;
    return SolveStep::progress(StepKind::Init, cloneBoard(bestBoard_), bestFitness_, 0);
}

SolveStep CulturalSolver::beginIteration() {
    if (iteration_ >= cfg.maxIters) {
        return finish(State::Exhausted,
                      SolveStep::progress(StepKind::Fail, cloneBoard(bestBoard_), bestFitness_, iteration_,
                                          conflicts.conflictedCells(bestBoard_)));
    }
    ++iteration_;

    std::stable_sort(population_.begin(), population_.end(),
                     [](const Candidate& a, const Candidate& b) { return a.fitness < b.fitness; });

    belief.update(std::span<const Candidate>(population_.data(), numElite), conflicts);

    const Candidate& currBest = population_.front();
    currentConflicts = conflicts.conflictedCells(currBest.board);
    if (currBest.fitness < bestFitness_) {
        bestFitness_ = currBest.fitness;
        bestBoard_ = cloneBoard(currBest.board);
    }

    phase = Phase::Polish;
    return SolveStep::progress(StepKind::Iter, cloneBoard(bestBoard_), bestFitness_, iteration_, currentConflicts);
}

std::optional<SolveStep> CulturalSolver::proposeSwap() {
    if (currentConflicts.empty()) return std::nullopt;

    std::uniform_int_distribution<size_t> pickCell(0, currentConflicts.size() - 1);
    const Cell target = currentConflicts[pickCell(rng)];
    std::vector<int> cols = mutableColumns(target.row, target.col);
    if (cols.empty()) return std::nullopt;
    std::uniform_int_distribution<size_t> pickCol(0, cols.size() - 1);

    swapRow = target.row;
    swapCol1 = target.col;
    swapCol2 = cols[pickCol(rng)];
    polished = cloneBoard(population_.front().board);

    phase = Phase::ApplySwap;
    return SolveStep::swapTry(swapRow, swapCol1, polished[swapRow][swapCol2], swapCol2, polished[swapRow][swapCol1]);
}

SolveStep CulturalSolver::applySwap() {
    std::swap(polished[swapRow][swapCol1], polished[swapRow][swapCol2]);
    phase = Phase::ScorePolish;
    return SolveStep::swapReset(swapRow, swapCol1, swapCol2);
}

std::optional<SolveStep> CulturalSolver::scorePolish() {
    phase = Phase::Regrow;

    int newFitness = boardFitness(polished);
    if (newFitness >= population_.front().fitness) return std::nullopt;

    population_.front() = {std::move(polished), newFitness};
    polished.clear();
    if (newFitness < bestFitness_) {
        bestFitness_ = newFitness;
        bestBoard_ = cloneBoard(population_.front().board);
        if (bestFitness_ == 0)
            return finish(State::Solved, SolveStep::progress(StepKind::Done, cloneBoard(bestBoard_), 0, iteration_));
    }
    return std::nullopt;
}

std::optional<SolveStep> CulturalSolver::regrow() {
    std::vector<Candidate> nextGen;
    nextGen.reserve(cfg.popSize);

    // Elites keep the current best's fitness rather than being rescored.
    const int approxFitness = population_.front().fitness;
    for (int i = 0; i < numElite; ++i)
        nextGen.push_back({cloneBoard(population_[i].board), approxFitness});

    std::uniform_int_distribution<int> pickElite(0, numElite - 1);
    std::uniform_int_distribution<int> pickParent(0, cfg.popSize / 2 - 1);
    std::bernoulli_distribution coin(0.5);
    std::bernoulli_distribution mutate(0.4);

    while (static_cast<int>(nextGen.size()) < cfg.popSize) {
        const Board& p1 = nextGen[pickElite(rng)].board;
        const Board& p2 = population_[pickParent(rng)].board;

        // Row crossover. The whole-parent baseline is usually overwritten
        // row by row, but it still decides the rows the second pass keeps.
        Board child = coin(rng) ? cloneBoard(p1) : cloneBoard(p2);
        for (int r = 0; r < n; ++r)
            if (coin(rng)) child[r] = p2[r];

        if (mutate(rng)) {
            int r = belief.selectTargetRow(rng);
            std::vector<int> cols = mutableColumns(r);
            if (cols.size() >= 2) {
                std::uniform_int_distribution<size_t> first(0, cols.size() - 1);
                std::uniform_int_distribution<size_t> second(0, cols.size() - 2);
                size_t i = first(rng);
                size_t j = second(rng);
                if (j >= i) ++j;
                std::swap(child[r][cols[i]], child[r][cols[j]]);
            }
        }

        int fit = boardFitness(child);
        nextGen.push_back({std::move(child), fit});
    }
    population_ = std::move(nextGen);

    if (bestFitness_ == 0)
        return finish(State::Solved, SolveStep::progress(StepKind::Done, cloneBoard(bestBoard_), 0, iteration_));

    phase = Phase::IterationStart;
    return std::nullopt;
}

std::unique_ptr<StepSequence> CulturalStrategy::begin(const Board& puzzle) const {
    CulturalConfig settings = config ? *config : CulturalConfig::forGridSize(static_cast<int>(puzzle.size()));
    return std::make_unique<CulturalSolver>(puzzle, settings);
}
