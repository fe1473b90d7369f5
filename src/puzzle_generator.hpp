#pragma once

#include <random>

#include "board_rules.hpp"

// Random complete solution: backtracking fill trying values in shuffled order.
Board generateSolvedBoard(int n, std::mt19937& rng);

// A solved board with floor(n * n * difficulty) randomly chosen cells blanked.
// difficulty must lie in [0, 1].
Board generatePuzzle(int n, std::mt19937& rng, double difficulty = 0.5);
