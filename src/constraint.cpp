#include "constraint.hpp"
#include <cassert>
#include <sstream>

Constraint::Constraint(CellSet cells, int count)
    : cell_set(std::move(cells)), mine_count(count) {
    assert(mine_count >= 0 && mine_count <= size());
}

void Constraint::reduce_as_mine(Position p) {
    auto it = cell_set.find(p);
    if (it == cell_set.end()) return;
    assert(mine_count > 0);
    cell_set.erase(it);
    mine_count--;
}

void Constraint::reduce_as_safe(Position p) {
    auto it = cell_set.find(p);
    if (it == cell_set.end()) return;
    assert(mine_count < size());
    cell_set.erase(it);
}

std::optional<CellSet> Constraint::known_mines() const {
    if (mine_count > 0 && size() == mine_count)
        return cell_set;
    return std::nullopt;
}

std::optional<CellSet> Constraint::known_safes() const {
    if (mine_count == 0 && !cell_set.empty())
        return cell_set;
    return std::nullopt;
}

std::string Constraint::to_string() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const Position& p : cell_set) {
        if (!first) oss << ", ";
        oss << ::to_string(p);
        first = false;
    }
    oss << "} = " << mine_count;
    return oss.str();
}

bool operator ==(const Constraint& a, const Constraint& b) {
    return a.get_count() == b.get_count() && a.get_cells() == b.get_cells();
}

bool operator !=(const Constraint& a, const Constraint& b) {
    return !(a == b);
}

bool operator <(const Constraint& a, const Constraint& b) {
    if (a.get_cells() != b.get_cells())
        return a.get_cells() < b.get_cells();
    return a.get_count() < b.get_count();
}
