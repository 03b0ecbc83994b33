#include "puzzle_carver.hpp"

namespace sudoku {

Grid carve_puzzle(const Grid& solution, int removal_count, cv::RNG& rng,
                  std::vector<int>* drawn) {
    CV_Assert(removal_count >= 0);
    validate_grid(solution);

    if (drawn) {
        drawn->clear();
        drawn->reserve(removal_count);
    }

    Grid puzzle = solution;
    for (int count = 0; count < removal_count; ++count) {
        int row = rng.uniform(0, N);
        int col = rng.uniform(0, N);
        puzzle[cell_index(row, col)] = 0;
        if (drawn) drawn->push_back(cell_index(row, col));
    }
    return puzzle;
}

} // namespace sudoku
