#include "grid.hpp"

#include <cstdint>
#include <opencv2/core.hpp>

namespace sudoku {

Grid empty_grid() {
    Grid g;
    g.fill(0);
    return g;
}

void validate_grid(const Grid& g) {
    for (int i = 0; i < CELL_COUNT; ++i) {
        if (g[i] < 0 || g[i] > 9) {
            CV_Error(cv::Error::StsOutOfRange,
                     cv::format("cell (%d,%d) holds %d, expected 0..9", row_of(i), col_of(i), g[i]));
        }
    }
}

int count_empty(const Grid& g) {
    int empty = 0;
    for (int v : g) {
        if (v == 0) ++empty;
    }
    return empty;
}

namespace {

// Collect the used-digit masks of every unit. Returns false on a repeated digit.
bool unit_masks(const Grid& g, std::array<uint16_t, N>& rows,
                std::array<uint16_t, N>& cols, std::array<uint16_t, N>& boxes) {
    rows.fill(0);
    cols.fill(0);
    boxes.fill(0);

    for (int idx = 0; idx < CELL_COUNT; ++idx) {
        int v = g[idx];
        if (v == 0) continue;

        int r = row_of(idx);
        int c = col_of(idx);
        int b = box_of(r, c);
        uint16_t bit = 1 << (v - 1);

        if ((rows[r] & bit) || (cols[c] & bit) || (boxes[b] & bit)) return false;

        rows[r] |= bit;
        cols[c] |= bit;
        boxes[b] |= bit;
    }
    return true;
}

} // namespace

bool is_complete_solution(const Grid& g) {
    for (int v : g) {
        if (v < 1 || v > 9) return false;
    }

    std::array<uint16_t, N> rows, cols, boxes;
    if (!unit_masks(g, rows, cols, boxes)) return false;

    // 81 distinct-per-unit digits fill every mask completely
    for (int u = 0; u < N; ++u) {
        if (rows[u] != 0x1FF || cols[u] != 0x1FF || boxes[u] != 0x1FF) return false;
    }
    return true;
}

bool clues_consistent(const Grid& g) {
    std::array<uint16_t, N> rows, cols, boxes;
    return unit_masks(g, rows, cols, boxes);
}

Grid from_rows(const std::vector<std::vector<int>>& rows) {
    CV_Assert(rows.size() == N);

    Grid g;
    for (int r = 0; r < N; ++r) {
        CV_Assert(rows[r].size() == N);
        for (int c = 0; c < N; ++c)
            g[cell_index(r, c)] = rows[r][c];
    }
    validate_grid(g);
    return g;
}

std::vector<std::vector<int>> to_rows(const Grid& g) {
    std::vector<std::vector<int>> rows(N, std::vector<int>(N));
    for (int r = 0; r < N; ++r)
        for (int c = 0; c < N; ++c)
            rows[r][c] = g[cell_index(r, c)];
    return rows;
}

Grid parse_grid(std::string_view text) {
    Grid g = empty_grid();
    int cells = 0;

    for (char ch : text) {
        if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') continue;

        if (cells == CELL_COUNT) {
            CV_Error(cv::Error::StsBadArg, "puzzle text has more than 81 cells");
        }
        if (ch >= '1' && ch <= '9') {
            g[cells++] = ch - '0';
        } else if (ch == '0' || ch == '.') {
            g[cells++] = 0;
        } else {
            CV_Error(cv::Error::StsBadArg,
                     cv::format("invalid character '%c' in puzzle text (allowed: 0-9 or .)", ch));
        }
    }

    if (cells != CELL_COUNT) {
        CV_Error(cv::Error::StsBadArg, cv::format("expected 81 cells, got %d", cells));
    }
    return g;
}

std::string to_string81(const Grid& g) {
    std::string out;
    out.reserve(CELL_COUNT);
    for (int v : g) {
        out.push_back(v == 0 ? '.' : static_cast<char>('0' + v));
    }
    return out;
}

} // namespace sudoku
