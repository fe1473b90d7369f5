#include "belief_space.hpp"

#include <algorithm>
#include <numeric>

BeliefSpace::BeliefSpace(int n)
    : n(requireSupportedSize(n, "BeliefSpace")),
      heat(n, std::vector<int>(n, 0)),
      rowScores(n, 0) {
}

void BeliefSpace::update(std::span<const Candidate> elites, const ConflictLocator& locator) {
    // Situational knowledge
    const Candidate* bestElite = nullptr;
    for (const Candidate& elite : elites) {
        if (bestElite == nullptr || elite.fitness < bestElite->fitness) bestElite = &elite;
    }
    if (bestElite != nullptr && bestElite->fitness < bestFitness) {
        bestBoard = cloneBoard(bestElite->board);
        bestFitness = bestElite->fitness;
    }

    // Normative knowledge, rebuilt from the current elites only
    for (auto& row : heat) std::fill(row.begin(), row.end(), 0);
    std::fill(rowScores.begin(), rowScores.end(), 0);

    for (const Candidate& elite : elites) {
        for (const Cell& cell : locator.conflictedCells(elite.board)) {
            ++heat[cell.row][cell.col];
            ++rowScores[cell.row];
        }
    }
}

int BeliefSpace::totalConflictScore() const {
    return std::accumulate(rowScores.begin(), rowScores.end(), 0);
}

int BeliefSpace::selectTargetRow(std::mt19937& rng) const {
    std::uniform_int_distribution<int> anyRow(0, n - 1);
    const int total = totalConflictScore();
    if (total == 0) return anyRow(rng);

    std::uniform_real_distribution<double> wheel(0.0, static_cast<double>(total));
    const double pick = wheel(rng);
    double running = 0.0;
    for (int r = 0; r < n; ++r) {
        running += rowScores[r];
        if (running > pick) return r;
    }
    return anyRow(rng);
}
