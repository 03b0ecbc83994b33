#pragma once

#include <opencv2/core.hpp>
#include <vector>

#include "grid.hpp"

namespace sudoku {

constexpr int DEFAULT_REMOVAL_COUNT = 75;

/**
 * Derives a playable puzzle from a solved grid by zeroing removal_count cells
 * drawn uniformly at random, with replacement. A cell drawn twice is cleared
 * once, so the puzzle has at most removal_count empty cells. The result is
 * not checked for a unique solution.
 *
 * @param solution      Fully populated grid.
 * @param removal_count Number of draws, must be >= 0.
 * @param rng           Random source owned by the caller.
 * @param drawn         Optional output: cell index of every draw, in order.
 * @return The carved puzzle.
 */
Grid carve_puzzle(const Grid& solution, int removal_count, cv::RNG& rng,
                  std::vector<int>* drawn = nullptr);

} // namespace sudoku
