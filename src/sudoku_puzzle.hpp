#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <vector>

#include "generator_config.hpp"
#include "grid.hpp"

namespace sudoku {

// Builds a full solution by randomized backtracking from an empty grid.
// Never fails for the empty board.
Grid generate_solution(cv::RNG& rng);

/**
 * A generated (or adopted) puzzle together with the solution it was carved
 * from. Construction does all the work: generation search, then carving.
 */
class SudokuPuzzle {
public:
    // Seeds its own generator from config (fixed seed or the clock)
    explicit SudokuPuzzle(const GeneratorConfig& config);

    // Uses the caller's generator, so a fixed seed gives a fixed puzzle
    SudokuPuzzle(int removal_count, cv::RNG& rng);

    // Wraps an existing partial grid; there is no known solution
    static SudokuPuzzle from_puzzle(const Grid& puzzle);

    const Grid& puzzle() const { return puzzle_grid; }
    const std::optional<Grid>& solution() const { return solution_grid; }

    // Cells chosen by the carver, in draw order (empty for adopted puzzles)
    const std::vector<int>& removed_cells() const { return drawn; }

    // Seed the puzzle was generated with, if it owned its generator
    const std::optional<cv::uint64>& seed() const { return seed_used; }

    // Completes the held puzzle; std::nullopt when no completion exists
    std::optional<Grid> solve() const;

private:
    SudokuPuzzle() = default;
    void build(int removal_count, cv::RNG& rng);

    Grid puzzle_grid{};
    std::optional<Grid> solution_grid;
    std::vector<int> drawn;
    std::optional<cv::uint64> seed_used;
};

} // namespace sudoku
