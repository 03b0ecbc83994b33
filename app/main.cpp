#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

#include "board_renderer.hpp"
#include "generator_config.hpp"
#include "sudoku_puzzle.hpp"
#include "sudoku_solver.hpp"

using namespace sudoku;

static const char* keys =
    "{help h usage ? |     | print this message }"
    "{seed s         |     | random seed (default: taken from the clock) }"
    "{remove r       |     | number of random cell removals (default: 75) }"
    "{config c       |     | generator settings file (YAML, JSON or XML) }"
    "{puzzle p       |     | solve this 81-character puzzle instead of generating one }"
    "{image i        |     | also write <prefix>_puzzle.png and <prefix>_solution.png }"
    "{verbose v      |     | print search statistics }";

int main(int argc, char* argv[]) {
    cv::CommandLineParser parser(argc, argv, keys);
    parser.about("Sudoku generator and backtracking solver");
    if (parser.has("help")) {
        parser.printMessage();
        return 0;
    }

    try {
        // defaults < config file < command line
        GeneratorConfig config;
        if (parser.has("config")) config = load_config(parser.get<std::string>("config"));
        if (parser.has("remove")) config.removal_count = parser.get<int>("remove");
        if (parser.has("seed")) {
            config.seed = parser.get<cv::uint64>("seed");
            config.has_seed = true;
        }
        std::string puzzle_text = parser.has("puzzle") ? parser.get<std::string>("puzzle") : "";
        std::string image_prefix = parser.has("image") ? parser.get<std::string>("image") : "";
        bool verbose = parser.has("verbose");

        if (!parser.check()) {
            parser.printErrors();
            return -1;
        }
        if (config.removal_count < 0) {
            std::cerr << "ERROR: --remove must not be negative" << std::endl;
            return -1;
        }

        // --- 1. Puzzle construction ---
        auto t1_start = std::chrono::high_resolution_clock::now();
        std::optional<SudokuPuzzle> game;
        if (!puzzle_text.empty()) {
            if (parser.has("seed") || parser.has("remove") || parser.has("config")) {
                std::cerr << "WARNING: --seed, --remove and --config are ignored with --puzzle" << std::endl;
            }
            game = SudokuPuzzle::from_puzzle(parse_grid(puzzle_text));
        } else {
            game.emplace(config);
            if (verbose) std::cout << "Seed: " << *game->seed() << std::endl;
        }
        auto t1_end = std::chrono::high_resolution_clock::now();
        auto t1_us = std::chrono::duration_cast<std::chrono::microseconds>(t1_end - t1_start).count();
        std::cout << "Step 1 (Puzzle Construction) took: " << t1_us << " us" << std::endl;

        const Grid& puzzle = game->puzzle();
        std::cout << "ORIGINAL BOARD" << std::endl;
        print_grid(puzzle);
        if (verbose) {
            std::cout << "Empty cells: " << count_empty(puzzle) << std::endl;
        }

        // --- 2. Solving ---
        SudokuSolver solver;
        auto t2_start = std::chrono::high_resolution_clock::now();
        std::optional<Grid> solved = solver.solve(puzzle);
        auto t2_end = std::chrono::high_resolution_clock::now();
        auto t2_us = std::chrono::duration_cast<std::chrono::microseconds>(t2_end - t2_start).count();
        std::cout << "\nStep 2 (Sudoku Solving) took: " << t2_us << " us" << std::endl;
        if (verbose) {
            std::cout << "Cells visited: " << solver.last_cells_visited() << std::endl;
        }

        if (!image_prefix.empty() && !save_image(render_image(puzzle, puzzle), image_prefix + "_puzzle.png")) {
            return -1;
        }

        if (!solved) {
            std::cout << "\nCould not solve the sudoku (no completion exists)." << std::endl;
            return 1;
        }

        std::cout << "\nSOLVED BOARD" << std::endl;
        print_grid(*solved);

        if (!image_prefix.empty() && !save_image(render_image(*solved, puzzle), image_prefix + "_solution.png")) {
            return -1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return -1;
    }

    return 0;
}
