#pragma once
#include <climits>
#include <cstddef>
#include <utility>
#include <vector>
#include <string>
#include <functional>

/* POSITION: a board cell as (row, col). */
using Position = std::pair<int, int>;

// Hash function for Position (for use with unordered containers)
struct PositionHash {
    size_t operator()(const Position& p) const {
        auto [row, col] = p;
        size_t h = std::hash<int>{}(row);
        h ^= std::hash<int>{}(col) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

inline Position operator +(Position p1, Position p2) {
    auto [r1, c1] = p1;
    auto [r2, c2] = p2;
    return {r1 + r2, c1 + c2};
}

inline std::string to_string(Position p) {
    return "(" + std::to_string(p.first) + ", " + std::to_string(p.second) + ")";
}


/* BOARD SIZE: rows are [0, height), columns are [0, width).
   A valid size has positive sides and a cell count that fits in an int. */
struct BoardSize {
    int height;
    int width;

    int num_cells() const { return height * width; }
    bool valid() const { return height > 0 && width > 0 && height <= INT_MAX / width; }
};

inline bool operator ==(BoardSize a, BoardSize b) {
    return a.height == b.height && a.width == b.width;
}

inline bool in_bounds(BoardSize size, Position p) {
    auto [row, col] = p;
    return row >= 0 && row < size.height && col >= 0 && col < size.width;
}

// Offsets of the 8-neighbourhood in row-major order.
const std::vector<Position> NEIGHBOR_OFFSETS = {
    {-1, -1}, {-1, 0}, {-1, 1},
    { 0, -1},          { 0, 1},
    { 1, -1}, { 1, 0}, { 1, 1}
};

// In-bounds neighbours of p, never p itself.
inline std::vector<Position> neighbors(BoardSize size, Position p) {
    std::vector<Position> result;
    result.reserve(NEIGHBOR_OFFSETS.size());
    for (const auto& offset : NEIGHBOR_OFFSETS) {
        Position q = p + offset;
        if (in_bounds(size, q))
            result.push_back(q);
    }
    return result;
}

inline std::vector<Position> all_positions(BoardSize size) {
    std::vector<Position> result;
    if (!size.valid()) return result;
    result.reserve(size.num_cells());
    for (int row = 0; row < size.height; row++)
        for (int col = 0; col < size.width; col++)
            result.emplace_back(row, col);
    return result;
}
