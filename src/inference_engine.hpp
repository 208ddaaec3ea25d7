#pragma once
/*
InferenceEngine: the automated player's knowledge.

Receives (cell, clue) pairs for revealed cells and maintains:
- moves_made: cells already revealed
- safes / mines: cells proven safe / proven to be mines (always disjoint)
- knowledge: constraints over the still-unresolved cells

Each add_knowledge call stores the new clue as a constraint, runs one round of
subset elimination (A.cells within B.cells gives B - A = B.count - A.count),
then harvests every constraint that pins down its cells. With
iterate_to_fixed_point the last two steps repeat until nothing changes.

The engine never sees mine placement and does no I/O.
*/

#include <optional>
#include <ostream>
#include "geometry.hpp"
#include "constraint.hpp"
#include "knowledge_base.hpp"
#include "random_source.hpp"

struct EngineOptions {
    bool iterate_to_fixed_point = false;
};

enum class MoveKind {
    SAFE,    // proven safe by the engine
    RANDOM   // fallback guess among the cells not known to be mines
};

struct Move {
    Position cell;
    MoveKind kind;
};

class InferenceEngine {
    private:
        BoardSize board_size;
        EngineOptions engine_options;
        CellSet made;
        CellSet safe_cells;
        CellSet mine_cells;
        KnowledgeBase knowledge_base;

        // One round of pairwise subset comparison. Returns true if any
        // constraint was added.
        bool derive_constraints();

        // Mark every cell some constraint pins down. Returns true if any cell
        // changed status.
        bool mark_known_cells();

    public:
        explicit InferenceEngine(BoardSize size, EngineOptions options = EngineOptions());

        void mark_mine(Position cell);
        void mark_safe(Position cell);

        // Called once per revealed cell with its neighbour mine count.
        void add_knowledge(Position cell, int count);

        // A known-safe cell not yet played; the smallest one, so replays match.
        std::optional<Position> make_safe_move() const;

        // Any cell neither played nor known to be a mine.
        std::optional<Position> make_random_move(RandomSource& random) const;

        // Safe move if there is one, random move otherwise.
        std::optional<Move> next_move(RandomSource& random) const;

        const CellSet& moves_made() const { return made; }
        const CellSet& safes() const { return safe_cells; }
        const CellSet& mines() const { return mine_cells; }
        const KnowledgeBase& knowledge() const { return knowledge_base; }
        BoardSize size() const { return board_size; }

        void print_knowledge(std::ostream& out) const;
};
