#pragma once
/*
Board: the hidden mine layout of one game.

Answers the three questions the game loop needs (dimensions, is this cell a
mine, how many mines touch it) and tracks the mines the player has flagged.
The InferenceEngine never talks to a Board directly.
*/

#include <vector>
#include <ostream>
#include "geometry.hpp"
#include "constraint.hpp"
#include "random_source.hpp"

class InferenceEngine;

class Board {
    private:
        BoardSize board_size;
        std::vector<std::vector<bool>> has_mine; // has_mine[row][col]
        CellSet mine_set;
        CellSet flagged;

        void check_size() const;

    public:
        // Places exactly mine_count mines uniformly at random.
        // Throws std::invalid_argument for a bad size or mine count.
        Board(BoardSize size, int mine_count, RandomSource& random);

        // Fixed layout. Throws std::invalid_argument for out-of-bounds or
        // repeated positions.
        Board(BoardSize size, const std::vector<Position>& mines);

        BoardSize size() const { return board_size; }
        int mine_count() const { return static_cast<int>(mine_set.size()); }
        const CellSet& mines() const { return mine_set; }

        bool is_mine(Position p) const;

        // Mines among the 8 neighbours of p, not counting p itself.
        int nearby_mines(Position p) const;

        // Record p as a mine found by the player.
        void flag(Position p);
        const CellSet& flagged_mines() const { return flagged; }

        // True once the flagged cells are exactly the mines.
        bool won() const { return flagged == mine_set; }

        // X marks a mine. With an engine, revealed cells show their clue and
        // cells the engine inferred to be mines show F.
        void render(std::ostream& out, const InferenceEngine* engine = nullptr) const;
};
