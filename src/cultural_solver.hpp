#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

#include "belief_space.hpp"
#include "board_rules.hpp"
#include "fitness.hpp"
#include "solve_step.hpp"

struct CulturalConfig {
    int popSize = 100;
    double eliteFrac = 0.1;
    int maxIters = 2000;
    // Unset: seeded from std::random_device.
    std::optional<std::uint32_t> seed;

    // Settings the demonstrator runs with: a larger population, and a
    // shorter budget for the small grids.
    static CulturalConfig forGridSize(int n);
};

/**
 * Cultural-algorithm solver, driven one event at a time.
 *
 * Every individual keeps each row a permutation of 1..N with the clues in
 * place; fitness then only counts column and block duplicates. Each
 * iteration sorts the population, feeds the elites to the belief space,
 * reports progress, tries one greedy swap on the best individual and grows
 * the next generation by row crossover and belief-guided row swaps.
 *
 * Elites carried into the next generation are given the fitness of the
 * current best individual instead of their own. That value is only used
 * for sorting and can be slightly off until the individual is replaced.
 */
class CulturalSolver : public StepSequence {
public:
    enum class State { Initializing, Evolving, Solved, Exhausted };

    // Throws std::invalid_argument for an unsupported or malformed puzzle,
    // a puzzle without empty cells, or inconsistent population settings.
    explicit CulturalSolver(const Board& puzzle, CulturalConfig config = {});

    std::optional<SolveStep> next() override;

    State state() const { return state_; }
    int iteration() const { return iteration_; }
    int eliteCount() const { return numElite; }
    const ConflictLocator& locator() const { return conflicts; }
    const BeliefSpace& beliefSpace() const { return belief; }
    const std::vector<Candidate>& population() const { return population_; }
    int bestFitness() const { return bestFitness_; }

private:
    enum class Phase { Init, IterationStart, Polish, ApplySwap, ScorePolish, Regrow, Finished };

    Board randomIndividual();
    std::vector<int> mutableColumns(int row, int except = -1) const;
    SolveStep finish(State outcome, SolveStep step);

    SolveStep initialise();
    SolveStep beginIteration();
    std::optional<SolveStep> proposeSwap();
    SolveStep applySwap();
    std::optional<SolveStep> scorePolish();
    std::optional<SolveStep> regrow();

    Board puzzle;
    int n;
    CulturalConfig cfg;
    int numElite;
    FixedMask fixed;
    std::vector<std::vector<int>> missing;
    ConflictLocator conflicts;
    BeliefSpace belief;
    std::mt19937 rng;

    State state_ = State::Initializing;
    Phase phase = Phase::Init;
    int iteration_ = 0;
    std::vector<Candidate> population_;
    Board bestBoard_;
    int bestFitness_ = BeliefSpace::NO_FITNESS;

    // Current iteration's best individual: its conflicts and pending repair.
    std::vector<Cell> currentConflicts;
    Board polished;
    int swapRow = -1;
    int swapCol1 = -1;
    int swapCol2 = -1;
};

// Strategy wrapper; without an explicit config it uses
// CulturalConfig::forGridSize for the board's size.
class CulturalStrategy : public SolverStrategy {
public:
    CulturalStrategy() = default;
    explicit CulturalStrategy(CulturalConfig config) : config(config) {}

    std::unique_ptr<StepSequence> begin(const Board& puzzle) const override;
    std::string_view name() const override { return "Cultural Algorithm"; }

private:
    std::optional<CulturalConfig> config;
};
