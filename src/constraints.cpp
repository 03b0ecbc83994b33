#include "constraints.hpp"

#include <bit>

namespace sudoku {

bool is_valid(const Grid& g, int row, int col, int value) {
    // Row and column
    for (int k = 0; k < N; ++k) {
        if (g[cell_index(row, k)] == value || g[cell_index(k, col)] == value) return false;
    }

    // 3x3 sector
    int sector = box_of(row, col);
    int r0 = box_origin_row(sector);
    int c0 = box_origin_col(sector);
    for (int r = r0; r < r0 + BOX; ++r) {
        for (int c = c0; c < c0 + BOX; ++c) {
            if (g[cell_index(r, c)] == value) return false;
        }
    }
    return true;
}

uint16_t candidate_mask(const Grid& g, int row, int col) {
    uint16_t mask = 0;
    for (int v = 1; v <= 9; ++v) {
        if (is_valid(g, row, col, v)) mask |= 1 << (v - 1);
    }
    return mask;
}

std::vector<int> candidates(const Grid& g, int row, int col) {
    uint16_t mask = candidate_mask(g, row, col);

    std::vector<int> values;
    values.reserve(std::popcount(mask));

    // Lowest set bit first gives ascending order
    while (mask) {
        values.push_back(std::countr_zero(mask) + 1);
        mask &= (mask - 1);
    }
    return values;
}

} // namespace sudoku
