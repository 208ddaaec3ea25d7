#include "board.hpp"
#include <stdexcept>
#include <string>
#include "inference_engine.hpp"

void Board::check_size() const {
    if (!board_size.valid())
        throw std::invalid_argument("Board: dimensions must be positive with at most INT_MAX cells, got "
            + std::to_string(board_size.height) + "x" + std::to_string(board_size.width));
}

Board::Board(BoardSize size, int mine_count, RandomSource& random) : board_size(size) {
    check_size();
    if (mine_count < 0 || mine_count > size.num_cells())
        throw std::invalid_argument("Board: cannot place " + std::to_string(mine_count)
            + " mines on " + std::to_string(size.num_cells()) + " cells");
    has_mine.assign(size.height, std::vector<bool>(size.width, false));

    while (static_cast<int>(mine_set.size()) != mine_count) {
        int row = random.uniform_int(0, size.height - 1);
        int col = random.uniform_int(0, size.width - 1);
        if (!has_mine[row][col]) {
            has_mine[row][col] = true;
            mine_set.insert({row, col});
        }
    }
}

Board::Board(BoardSize size, const std::vector<Position>& mines) : board_size(size) {
    check_size();
    has_mine.assign(size.height, std::vector<bool>(size.width, false));
    for (const Position& p : mines) {
        if (!in_bounds(size, p))
            throw std::invalid_argument("Board: mine out of bounds at " + to_string(p));
        if (!mine_set.insert(p).second)
            throw std::invalid_argument("Board: repeated mine at " + to_string(p));
        has_mine[p.first][p.second] = true;
    }
}

bool Board::is_mine(Position p) const {
    if (!in_bounds(board_size, p)) return false;
    return has_mine[p.first][p.second];
}

int Board::nearby_mines(Position p) const {
    int count = 0;
    for (const Position& n : neighbors(board_size, p))
        if (has_mine[n.first][n.second])
            count++;
    return count;
}

void Board::flag(Position p) {
    if (in_bounds(board_size, p))
        flagged.insert(p);
}

void Board::render(std::ostream& out, const InferenceEngine* engine) const {
    std::string rule(2 * board_size.width + 1, '-');
    for (int row = 0; row < board_size.height; row++) {
        out << rule << "\n";
        for (int col = 0; col < board_size.width; col++) {
            Position p(row, col);
            char c = ' ';
            if (engine != nullptr && engine->moves_made().count(p)) {
                c = static_cast<char>('0' + nearby_mines(p));
            } else if (engine != nullptr && engine->mines().count(p)) {
                c = 'F';
            } else if (has_mine[row][col]) {
                c = 'X';
            }
            out << "|" << c;
        }
        out << "|\n";
    }
    out << rule << "\n";
}
