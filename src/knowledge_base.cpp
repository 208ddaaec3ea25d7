#include "knowledge_base.hpp"
#include <algorithm>
#include <iterator>
#include <cassert>

namespace {
const std::vector<int> NO_CONSTRAINTS;
}

void KnowledgeBase::index_constraint(int id) {
    const Constraint& c = constraints[id];
    canonical.insert(c);
    for (const Position& p : c.get_cells())
        cell_index[p].push_back(id);
}

bool KnowledgeBase::add(Constraint c) {
    if (c.empty() || contains(c))
        return false;
    constraints.push_back(std::move(c));
    index_constraint(size() - 1);
    return true;
}

template<typename Reduce>
void KnowledgeBase::reduce_all(Position p, Reduce reduce) {
    auto found = cell_index.find(p);
    if (found == cell_index.end())
        return;
    for (int id : found->second) {
        Constraint& c = constraints[id];
        auto entry = canonical.find(c);
        assert(entry != canonical.end());
        canonical.erase(entry);
        reduce(c);
        canonical.insert(c);
    }
    // every constraint holding p has dropped it
    cell_index.erase(found);
}

void KnowledgeBase::reduce_as_mine(Position p) {
    reduce_all(p, [p](Constraint& c) { c.reduce_as_mine(p); });
}

void KnowledgeBase::reduce_as_safe(Position p) {
    reduce_all(p, [p](Constraint& c) { c.reduce_as_safe(p); });
}

int KnowledgeBase::compact() {
    int before = size();
    constraints.erase(
        std::remove_if(constraints.begin(), constraints.end(),
                       [](const Constraint& c) { return c.empty(); }),
        constraints.end());
    int removed = before - size();
    if (removed == 0)
        return 0;

    canonical.clear();
    cell_index.clear();
    for (int id = 0; id < size(); id++)
        index_constraint(id);
    return removed;
}

const std::vector<int>& KnowledgeBase::constraints_with(Position p) const {
    auto found = cell_index.find(p);
    if (found == cell_index.end())
        return NO_CONSTRAINTS;
    return found->second;
}

std::vector<int> KnowledgeBase::subset_candidates(const Constraint& c) const {
    if (c.empty()) {
        std::vector<int> every(size());
        for (int id = 0; id < size(); id++) every[id] = id;
        return every;
    }
    auto it = c.get_cells().begin();
    std::vector<int> result = constraints_with(*it);
    for (++it; it != c.get_cells().end() && !result.empty(); ++it) {
        const std::vector<int>& other = constraints_with(*it);
        std::vector<int> narrowed;
        std::set_intersection(result.begin(), result.end(),
                              other.begin(), other.end(),
                              std::back_inserter(narrowed));
        result = std::move(narrowed);
    }
    return result;
}
