#include "board_renderer.hpp"
#include "test_runner.hpp"

#include <cstdio>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

using namespace sudoku;

static const char* kPuzzle =
    "53..7...."
    "6..195..."
    ".98....6."
    "8...6...3"
    "4..8.3..1"
    "7...2...6"
    ".6....28."
    "...419..5"
    "....8..79";

int main() {
    std::vector<NamedCase> cases = {
        {"text_layout", [](std::string* why) {
            std::string text = render_text(parse_grid(kPuzzle));
            const std::string expected =
                "+-------+-------+-------+\n"
                "| 5 3   |   7   |       | \n"
                "| 6     | 1 9 5 |       | \n"
                "|   9 8 |       |   6   | \n"
                "+-------+-------+-------+\n"
                "| 8     |   6   |     3 | \n"
                "| 4     | 8   3 |     1 | \n"
                "| 7     |   2   |     6 | \n"
                "+-------+-------+-------+\n"
                "|   6   |       | 2 8   | \n"
                "|       | 4 1 9 |     5 | \n"
                "|       |   8   |   7 9 | \n"
                "+-------+-------+-------+\n";
            if (text != expected) return fail(why, "unexpected board text:\n" + text);
            return true;
        }},

        {"image_size_and_content", [](std::string* why) {
            Grid g = parse_grid(kPuzzle);
            cv::Mat image = render_image(g, g, 40);
            if (!(image.rows == 361 && image.cols == 361)) return fail(why, "image should be 361x361");
            if (image.type() != CV_8UC3) return fail(why, "image should be 8-bit BGR");

            // Inside an empty cell stays white, a clue cell gets ink
            cv::Mat empty_cell = image(cv::Rect(2 * 40 + 4, 4, 32, 32));
            cv::Mat clue_cell = image(cv::Rect(4, 4, 32, 32));
            if (cv::countNonZero(255 - empty_cell.reshape(1)) != 0) return fail(why, "empty cell has ink");
            if (cv::countNonZero(255 - clue_cell.reshape(1)) <= 0) return fail(why, "clue cell has no ink");
            return true;
        }},

        {"image_written_to_disk", [](std::string* why) {
            Grid g = parse_grid(kPuzzle);
            const std::string path = "test_board_renderer.png";
            if (!save_image(render_image(g, g), path)) return fail(why, "save_image failed");
            cv::Mat back = cv::imread(path, cv::IMREAD_COLOR);
            std::remove(path.c_str());
            if (back.rows != 9 * 48 + 1) return fail(why, "written image has the wrong size");
            if (save_image(cv::Mat(), path)) return fail(why, "empty image reported as written");
            return true;
        }},
    };

    return run_cases("board_renderer", cases);
}
