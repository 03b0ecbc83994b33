#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "grid.hpp"

namespace sudoku {

class SudokuSolver {
public:
    SudokuSolver() = default;

    // Completes the puzzle, keeping every clue. std::nullopt if no completion
    // exists. Throws cv::Exception on values outside 0..9.
    std::optional<Grid> solve(const Grid& puzzle);

    // Nested-vector form. Returns false when unsolvable; throws cv::Exception
    // unless input is 9x9 with values in 0..9.
    bool solve(const std::vector<std::vector<int>>& input, std::vector<std::vector<int>>& result);

    // Cells entered by the search during the last solve (0 if rejected early)
    std::size_t last_cells_visited() const { return cells_visited; }

private:
    std::size_t cells_visited = 0;
};

} // namespace sudoku
