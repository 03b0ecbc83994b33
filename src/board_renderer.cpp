#include "board_renderer.hpp"

#include <algorithm>
#include <sstream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace sudoku {

std::string render_text(const Grid& g) {
    const std::string horiz_bar = "+-------+-------+-------+";
    std::ostringstream out;
    out << horiz_bar << "\n";

    for (int row = 0; row < N; ++row) {
        out << "| ";
        for (int col = 0; col < N; ++col) {
            int v = g[cell_index(row, col)];
            if (v == 0) out << "  ";
            else out << v << " ";
            if (col % BOX == BOX - 1) out << "| ";
        }
        out << "\n";
        if (row % BOX == BOX - 1) out << horiz_bar << "\n";
    }
    return out.str();
}

void print_grid(const Grid& g, std::ostream& out) {
    out << render_text(g);
}

cv::Mat render_image(const Grid& g, const Grid& clues, int cell_px) {
    CV_Assert(cell_px >= 8);

    const int side = N * cell_px + 1;
    cv::Mat image(side, side, CV_8UC3, cv::Scalar(255, 255, 255));

    // Grid lines, thicker around each 3x3 box
    for (int k = 0; k <= N; ++k) {
        int pos = k * cell_px;
        int thickness = (k % BOX == 0) ? 3 : 1;
        cv::Scalar color = (k % BOX == 0) ? cv::Scalar(0, 0, 0) : cv::Scalar(160, 160, 160);
        cv::line(image, {pos, 0}, {pos, side - 1}, color, thickness);
        cv::line(image, {0, pos}, {side - 1, pos}, color, thickness);
    }

    const int font = cv::FONT_HERSHEY_SIMPLEX;
    const double scale = cell_px / 40.0;
    const int stroke = std::max(1, cell_px / 24);

    for (int idx = 0; idx < CELL_COUNT; ++idx) {
        int v = g[idx];
        if (v == 0) continue;

        std::string text(1, static_cast<char>('0' + v));
        int baseline = 0;
        cv::Size size = cv::getTextSize(text, font, scale, stroke, &baseline);

        // Center the glyph inside its cell
        cv::Point org(col_of(idx) * cell_px + (cell_px - size.width) / 2,
                      row_of(idx) * cell_px + (cell_px + size.height) / 2);
        cv::Scalar color = clues[idx] != 0 ? cv::Scalar(0, 0, 0) : cv::Scalar(200, 80, 0);
        cv::putText(image, text, org, font, scale, color, stroke, cv::LINE_AA);
    }
    return image;
}

bool save_image(const cv::Mat& image, const std::string& path) {
    if (image.empty()) {
        std::cerr << "ERROR: Empty image passed to save_image()" << std::endl;
        return false;
    }
    try {
        if (!cv::imwrite(path, image)) {
            std::cerr << "ERROR: Could not write image to " << path << std::endl;
            return false;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "ERROR: Could not write image to " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace sudoku
