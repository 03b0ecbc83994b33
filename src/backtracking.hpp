#pragma once

#include <array>
#include <cstddef>
#include <opencv2/core.hpp>

#include "grid.hpp"

namespace sudoku {

enum class CandidateOrder {
    Shuffled,   // all of 1..9 in random order, filtered by is_valid
    Ascending   // candidates() of the cell, smallest first
};

struct SearchPolicy {
    CandidateOrder order = CandidateOrder::Ascending;
    bool keep_prefilled = true; // non-zero cells are clues and are skipped

    static SearchPolicy generation() { return {CandidateOrder::Shuffled, false}; }
    static SearchPolicy solving() { return {CandidateOrder::Ascending, true}; }
};

// Unbiased sequential shuffle: position k swaps with a uniform pick from [0, k]
void shuffle_values(std::array<int, N>& values, cv::RNG& rng);

// Depth-first search over the cells in row-major order. Used both to build a
// full solution from an empty grid and to complete a partial one.
class BacktrackingSearch {
public:
    // rng is required for CandidateOrder::Shuffled and must outlive the search
    explicit BacktrackingSearch(SearchPolicy policy, cv::RNG* rng = nullptr);

    // Fills grid in place. On failure every cell the search touched is
    // cleared again and false is returned.
    bool run(Grid& grid);

    // Number of cells entered by the last run (accepting state excluded)
    std::size_t cells_visited() const { return visited; }

private:
    SearchPolicy policy;
    cv::RNG* rng;
    std::size_t visited = 0;

    bool search_from(Grid& grid, int idx);
    bool try_value(Grid& grid, int idx, int value);
};

} // namespace sudoku
