#include "sudoku_puzzle.hpp"

#include "backtracking.hpp"
#include "puzzle_carver.hpp"
#include "sudoku_solver.hpp"

namespace sudoku {

Grid generate_solution(cv::RNG& rng) {
    Grid grid = empty_grid();
    BacktrackingSearch search(SearchPolicy::generation(), &rng);
    if (!search.run(grid)) {
        // Unreachable for an empty board
        CV_Error(cv::Error::StsInternal, "generation search failed on an empty board");
    }
    return grid;
}

SudokuPuzzle::SudokuPuzzle(const GeneratorConfig& config)
    : seed_used(resolve_seed(config)) {
    cv::RNG rng(*seed_used);
    build(config.removal_count, rng);
}

SudokuPuzzle::SudokuPuzzle(int removal_count, cv::RNG& rng) {
    build(removal_count, rng);
}

SudokuPuzzle SudokuPuzzle::from_puzzle(const Grid& puzzle) {
    validate_grid(puzzle);

    SudokuPuzzle adopted;
    adopted.puzzle_grid = puzzle;
    return adopted;
}

void SudokuPuzzle::build(int removal_count, cv::RNG& rng) {
    CV_Assert(removal_count >= 0);

    solution_grid = generate_solution(rng);
    puzzle_grid = carve_puzzle(*solution_grid, removal_count, rng, &drawn);
}

std::optional<Grid> SudokuPuzzle::solve() const {
    SudokuSolver solver;
    return solver.solve(puzzle_grid);
}

} // namespace sudoku
