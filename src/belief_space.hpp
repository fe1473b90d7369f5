#pragma once

#include <limits>
#include <random>
#include <span>
#include <vector>

#include "board_rules.hpp"
#include "fitness.hpp"

// One population slot: a row-complete board and the fitness cached for it.
struct Candidate {
    Board board;
    int fitness = 0;
};

/**
 * Cultural knowledge shared by the whole population.
 *
 * Situational knowledge is the best board any elite set has produced so far;
 * its fitness only ever decreases. Normative knowledge is a heat map of the
 * cells that are in conflict across the current elites, summed per row to
 * weight the row choice of the mutation operator. The heat map is rebuilt
 * from scratch on every update, it does not decay or accumulate.
 */
class BeliefSpace {
public:
    static constexpr int NO_FITNESS = std::numeric_limits<int>::max();

    explicit BeliefSpace(int n);

    // Elites are visited in order; the first of several equally fit elites
    // is the one considered for the global best.
    void update(std::span<const Candidate> elites, const ConflictLocator& locator);

    // Roulette-wheel choice over rowConflictScores(), uniform when all are 0.
    int selectTargetRow(std::mt19937& rng) const;

    bool hasGlobalBest() const { return bestFitness != NO_FITNESS; }
    const Board& globalBest() const { return bestBoard; }
    int globalBestFitness() const { return bestFitness; }
    const std::vector<std::vector<int>>& conflictMatrix() const { return heat; }
    const std::vector<int>& rowConflictScores() const { return rowScores; }
    int totalConflictScore() const;

private:
    int n;
    Board bestBoard;
    int bestFitness = NO_FITNESS;
    std::vector<std::vector<int>> heat;
    std::vector<int> rowScores;
};
