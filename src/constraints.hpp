#pragma once

#include <cstdint>
#include <vector>

#include "grid.hpp"

namespace sudoku {

// True if value does not already appear in the row, column or 3x3 box of
// (row, col). The target cell itself must not hold value.
bool is_valid(const Grid& g, int row, int col, int value);

// 9 bits where bit (v-1) means "v is legal at (row, col)"
uint16_t candidate_mask(const Grid& g, int row, int col);

// Legal values at (row, col) in ascending order
std::vector<int> candidates(const Grid& g, int row, int col);

} // namespace sudoku
