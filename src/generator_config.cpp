#include "generator_config.hpp"

namespace sudoku {

namespace {

GeneratorConfig read_config(const cv::FileStorage& fs, GeneratorConfig config) {
    cv::FileNode removal = fs["removal_count"];
    if (!removal.empty()) {
        if (!removal.isInt()) CV_Error(cv::Error::StsBadArg, "removal_count must be an integer");
        config.removal_count = static_cast<int>(removal);
    }

    cv::FileNode seed = fs["seed"];
    if (!seed.empty()) {
        if (!seed.isInt()) CV_Error(cv::Error::StsBadArg, "seed must be an integer");
        int value = static_cast<int>(seed);
        if (value < 0) CV_Error(cv::Error::StsOutOfRange, "seed must not be negative");
        config.seed = static_cast<cv::uint64>(value);
        config.has_seed = true;
    }

    if (config.removal_count < 0) {
        CV_Error(cv::Error::StsOutOfRange,
                 cv::format("removal_count must not be negative (got %d)", config.removal_count));
    }
    return config;
}

} // namespace

GeneratorConfig load_config(const std::string& path, GeneratorConfig base) {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) {
        CV_Error(cv::Error::StsError, "could not open config file " + path);
    }
    return read_config(fs, base);
}

GeneratorConfig load_config_from_string(const std::string& text, GeneratorConfig base) {
    cv::FileStorage fs(text, cv::FileStorage::READ | cv::FileStorage::MEMORY);
    if (!fs.isOpened()) {
        CV_Error(cv::Error::StsError, "could not parse config document");
    }
    return read_config(fs, base);
}

cv::uint64 resolve_seed(const GeneratorConfig& config) {
    if (config.has_seed) return config.seed;
    return static_cast<cv::uint64>(cv::getTickCount());
}

} // namespace sudoku
