#pragma once

#include <opencv2/core.hpp>
#include <string>

#include "puzzle_carver.hpp"

namespace sudoku {

struct GeneratorConfig {
    int removal_count = DEFAULT_REMOVAL_COUNT;
    bool has_seed = false;   // false: seed from the clock
    cv::uint64 seed = 0;
};

// Reads optional keys "removal_count" and "seed" from an OpenCV FileStorage
// document (YAML with a %YAML:1.0 header, JSON or XML). Missing keys keep
// their defaults. Throws cv::Exception on unreadable files or bad values.
GeneratorConfig load_config(const std::string& path, GeneratorConfig base = {});
GeneratorConfig load_config_from_string(const std::string& text, GeneratorConfig base = {});

// Seed for a fresh cv::RNG: the configured one, or the current tick count
cv::uint64 resolve_seed(const GeneratorConfig& config);

} // namespace sudoku
