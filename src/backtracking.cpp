#include "backtracking.hpp"

#include <utility>
#include <vector>

#include "constraints.hpp"

namespace sudoku {

void shuffle_values(std::array<int, N>& values, cv::RNG& rng) {
    for (int k = 0; k < N; ++k) {
        int j = rng.uniform(0, k + 1);
        std::swap(values[j], values[k]);
    }
}

BacktrackingSearch::BacktrackingSearch(SearchPolicy policy, cv::RNG* rng)
    : policy(policy), rng(rng) {
    if (policy.order == CandidateOrder::Shuffled && rng == nullptr) {
        CV_Error(cv::Error::StsNullPtr, "shuffled candidate order needs a random generator");
    }
}

bool BacktrackingSearch::run(Grid& grid) {
    validate_grid(grid);
    visited = 0;
    return search_from(grid, 0);
}

// Place value at idx and continue with the next cell; undo on failure
bool BacktrackingSearch::try_value(Grid& grid, int idx, int value) {
    grid[idx] = value;
    if (search_from(grid, idx + 1)) {
        return true;
    }
    grid[idx] = 0;
    return false;
}

bool BacktrackingSearch::search_from(Grid& grid, int idx) {
    if (idx == CELL_COUNT) {
        return true; // every cell holds a value
    }
    ++visited;

    if (policy.keep_prefilled && grid[idx] != 0) {
        return search_from(grid, idx + 1);
    }

    int row = row_of(idx);
    int col = col_of(idx);
    grid[idx] = 0;

    if (policy.order == CandidateOrder::Shuffled) {
        std::array<int, N> values = {1, 2, 3, 4, 5, 6, 7, 8, 9};
        shuffle_values(values, *rng);

        for (int v : values) {
            if (is_valid(grid, row, col, v) && try_value(grid, idx, v)) return true;
        }
    } else {
        for (int v : candidates(grid, row, col)) {
            if (try_value(grid, idx, v)) return true;
        }
    }

    // Dead end: the caller retries its own cell with the next value
    grid[idx] = 0;
    return false;
}

} // namespace sudoku
