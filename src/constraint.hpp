#pragma once
/*
Constraint: the statement "exactly `count` of these cells are mines".

Cells are kept in a sorted set, which doubles as the canonical form used for
equality, ordering and duplicate detection in the KnowledgeBase.
Invariant: 0 <= count <= |cells|. Reductions assert it; a violation means the
engine was fed inconsistent clues.
*/

#include <set>
#include <optional>
#include <string>
#include "geometry.hpp"

using CellSet = std::set<Position>;

class Constraint {
    private:
        CellSet cell_set;
        int mine_count;

    public:
        Constraint() : cell_set(), mine_count(0) {}
        Constraint(CellSet cells, int count);

        const CellSet& get_cells() const { return cell_set; }
        int get_count() const { return mine_count; }
        int size() const { return static_cast<int>(cell_set.size()); }
        bool empty() const { return cell_set.empty(); }
        bool contains(Position p) const { return cell_set.find(p) != cell_set.end(); }

        // If p is one of the cells, drop it and account for one fewer mine.
        // Precondition: count > 0 when p is present.
        void reduce_as_mine(Position p);

        // If p is one of the cells, drop it; the count is unchanged.
        // Precondition: count < |cells| when p is present.
        void reduce_as_safe(Position p);

        // All cells, when every remaining cell must be a mine.
        std::optional<CellSet> known_mines() const;

        // All cells, when no remaining cell can be a mine.
        std::optional<CellSet> known_safes() const;

        std::string to_string() const;
};

bool operator ==(const Constraint& a, const Constraint& b);
bool operator !=(const Constraint& a, const Constraint& b);
bool operator <(const Constraint& a, const Constraint& b);
