#pragma once

#include <iostream>
#include <string>
#include <opencv2/core.hpp>

#include "grid.hpp"

namespace sudoku {

// ASCII board with box separators, empty cells left blank
std::string render_text(const Grid& g);
void print_grid(const Grid& g, std::ostream& out = std::cout);

/**
 * Draws the board as a BGR image of (9 * cell_px + 1) pixels per side.
 * Cells that are non-zero in clues are drawn black, the other digits blue.
 * Pass the grid itself as clues to draw everything black.
 */
cv::Mat render_image(const Grid& g, const Grid& clues, int cell_px = 48);

// Writes image to path (format from the extension). False if nothing was written.
bool save_image(const cv::Mat& image, const std::string& path);

} // namespace sudoku
