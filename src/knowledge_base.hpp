#pragma once
/*
KnowledgeBase: ordered arena of Constraints, indexed two ways.

- canonical index: multiset of constraints (sorted cells + count), for O(log n)
  duplicate checks.
- cell index: cell -> ids of the constraints holding it, in ascending id order.
  Used to reduce only the constraints that mention a cell and to find subset
  partners without comparing every pair.

Constraints are mutated in place by reduce_as_mine / reduce_as_safe. Ids are
positions in insertion order and stay stable until compact() is called.
*/

#include <vector>
#include <set>
#include <unordered_map>
#include "constraint.hpp"

class KnowledgeBase {
    private:
        std::vector<Constraint> constraints;
        std::multiset<Constraint> canonical;
        std::unordered_map<Position, std::vector<int>, PositionHash> cell_index;

        void index_constraint(int id);
        template<typename Reduce>
        void reduce_all(Position p, Reduce reduce);

    public:
        // Append c unless it is empty or an equal constraint is already stored.
        bool add(Constraint c);

        bool contains(const Constraint& c) const {
            return canonical.find(c) != canonical.end();
        }

        void reduce_as_mine(Position p);
        void reduce_as_safe(Position p);

        // Drop constraints with no cells left, keeping the order of the rest.
        // Invalidates ids. Returns the number of constraints removed.
        int compact();

        // Ids of every constraint whose cells include all cells of `c`
        // (c itself, and equal copies of it, included).
        std::vector<int> subset_candidates(const Constraint& c) const;

        // Ids of the constraints that mention p.
        const std::vector<int>& constraints_with(Position p) const;

        int size() const { return static_cast<int>(constraints.size()); }
        bool empty() const { return constraints.empty(); }
        const Constraint& operator[](int id) const { return constraints[id]; }
        const std::vector<Constraint>& all() const { return constraints; }

        std::vector<Constraint>::const_iterator begin() const { return constraints.begin(); }
        std::vector<Constraint>::const_iterator end() const { return constraints.end(); }
};
