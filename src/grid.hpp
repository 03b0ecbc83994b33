#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace sudoku {

// Board geometry shared by every module
constexpr int N = 9;
constexpr int BOX = 3;
constexpr int CELL_COUNT = N * N;

// Row-major 9x9 board, 0 = empty cell
using Grid = std::array<int, CELL_COUNT>;

inline int cell_index(int row, int col) { return row * N + col; }
inline int row_of(int idx) { return idx / N; }
inline int col_of(int idx) { return idx % N; }

// Box (sector) containing a cell, numbered 0..8 left to right, top to bottom
inline int box_of(int row, int col) { return (row / BOX) * BOX + col / BOX; }
inline int box_origin_row(int sector) { return (sector / BOX) * BOX; }
inline int box_origin_col(int sector) { return (sector % BOX) * BOX; }

Grid empty_grid();

// Throws cv::Exception if a cell holds something outside 0..9
void validate_grid(const Grid& g);

int count_empty(const Grid& g);

// True if every row, column and box holds 1..9 exactly once
bool is_complete_solution(const Grid& g);

// True if no digit is repeated inside a row, column or box (empty cells ignored)
bool clues_consistent(const Grid& g);

// Conversions to and from the nested-vector form used by the solver API.
// from_rows throws cv::Exception unless the input is 9x9 with values in 0..9.
Grid from_rows(const std::vector<std::vector<int>>& rows);
std::vector<std::vector<int>> to_rows(const Grid& g);

// 81 cell symbols, '1'..'9' for values and '0' or '.' for empty.
// Whitespace is skipped; anything else is rejected.
Grid parse_grid(std::string_view text);
std::string to_string81(const Grid& g);

} // namespace sudoku
