#include "inference_engine.hpp"
#include <vector>
#include <cassert>

InferenceEngine::InferenceEngine(BoardSize size, EngineOptions options)
    : board_size(size), engine_options(options) {
    assert(size.valid());
}

void InferenceEngine::mark_mine(Position cell) {
    assert(safe_cells.find(cell) == safe_cells.end());
    mine_cells.insert(cell);
    knowledge_base.reduce_as_mine(cell);
}

void InferenceEngine::mark_safe(Position cell) {
    assert(mine_cells.find(cell) == mine_cells.end());
    safe_cells.insert(cell);
    knowledge_base.reduce_as_safe(cell);
}

void InferenceEngine::add_knowledge(Position cell, int count) {
    assert(in_bounds(board_size, cell));
    made.insert(cell);
    mark_safe(cell);

    // The new statement only mentions unresolved neighbours; known mines
    // among them are taken off the count up front.
    CellSet unknown;
    int known_mine_neighbors = 0;
    for (const Position& n : neighbors(board_size, cell)) {
        if (made.count(n)) continue;
        if (mine_cells.count(n)) {
            known_mine_neighbors++;
        } else if (!safe_cells.count(n)) {
            unknown.insert(n);
        }
    }
    int remaining = count - known_mine_neighbors;
    assert(remaining >= 0 && remaining <= static_cast<int>(unknown.size()));
    if (!unknown.empty())
        knowledge_base.add(Constraint(std::move(unknown), remaining));

    bool changed;
    do {
        bool derived = derive_constraints();
        bool marked = mark_known_cells();
        knowledge_base.compact();
        changed = derived || marked;
    } while (engine_options.iterate_to_fixed_point && changed);
}

bool InferenceEngine::derive_constraints() {
    std::vector<Constraint> batch;
    std::set<Constraint> batch_index;
    int n = knowledge_base.size();
    for (int a = 0; a < n; a++) {
        const Constraint& subset = knowledge_base[a];
        if (subset.empty()) continue;
        for (int b : knowledge_base.subset_candidates(subset)) {
            const Constraint& superset = knowledge_base[b];
            if (b == a || superset == subset) continue;

            CellSet diff;
            for (const Position& p : superset.get_cells())
                if (!subset.contains(p)) diff.insert(p);
            Constraint derived(std::move(diff), superset.get_count() - subset.get_count());

            if (knowledge_base.contains(derived) || batch_index.count(derived))
                continue;
            batch_index.insert(derived);
            batch.push_back(std::move(derived));
        }
    }
    for (auto& c : batch)
        knowledge_base.add(std::move(c));
    return !batch.empty();
}

bool InferenceEngine::mark_known_cells() {
    CellSet found_mines;
    CellSet found_safes;
    for (const Constraint& c : knowledge_base) {
        if (auto cells = c.known_mines())
            found_mines.insert(cells->begin(), cells->end());
        if (auto cells = c.known_safes())
            found_safes.insert(cells->begin(), cells->end());
    }

    bool changed = false;
    for (const Position& p : found_mines) {
        if (!mine_cells.count(p)) changed = true;
        mark_mine(p);
    }
    for (const Position& p : found_safes) {
        if (!safe_cells.count(p)) changed = true;
        mark_safe(p);
    }
    return changed;
}

std::optional<Position> InferenceEngine::make_safe_move() const {
    for (const Position& p : safe_cells)
        if (!made.count(p))
            return p;
    return std::nullopt;
}

std::optional<Position> InferenceEngine::make_random_move(RandomSource& random) const {
    std::vector<Position> available;
    for (const Position& p : all_positions(board_size))
        if (!made.count(p) && !mine_cells.count(p))
            available.push_back(p);
    if (available.empty())
        return std::nullopt;
    return random.pick(available);
}

std::optional<Move> InferenceEngine::next_move(RandomSource& random) const {
    if (auto safe = make_safe_move())
        return Move{*safe, MoveKind::SAFE};
    if (auto guess = make_random_move(random))
        return Move{*guess, MoveKind::RANDOM};
    return std::nullopt;
}

void InferenceEngine::print_knowledge(std::ostream& out) const {
    out << "Knowledge (" << knowledge_base.size() << " constraints):\n";
    for (const Constraint& c : knowledge_base)
        out << "  " << c.to_string() << "\n";
    out << "  safes: " << safe_cells.size()
        << ", mines: " << mine_cells.size()
        << ", moves made: " << made.size() << "\n";
}
