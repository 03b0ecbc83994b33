#include "sudoku_solver.hpp"

#include "backtracking.hpp"

namespace sudoku {

/**
 * Sudoku solver
 * Plain row-major backtracking: clues are skipped, every empty cell tries its
 * legal values in ascending order. The result only depends on the input, so
 * solving the same puzzle twice gives the same grid.
 */

std::optional<Grid> SudokuSolver::solve(const Grid& puzzle) {
    validate_grid(puzzle);
    cells_visited = 0;

    // Clashing clues can never be completed; skip the search entirely
    if (!clues_consistent(puzzle)) return std::nullopt;

    Grid working = puzzle;
    BacktrackingSearch search(SearchPolicy::solving());
    bool found = search.run(working);
    cells_visited = search.cells_visited();

    if (!found) return std::nullopt;
    return working;
}

bool SudokuSolver::solve(const std::vector<std::vector<int>>& input, std::vector<std::vector<int>>& result) {
    std::optional<Grid> solved = solve(from_rows(input));
    if (!solved) return false;

    result = to_rows(*solved);
    return true;
}

} // namespace sudoku
