#include "game.hpp"

std::string to_string(GameOutcome outcome) {
    switch (outcome) {
        case GameOutcome::IN_PROGRESS: return "in progress";
        case GameOutcome::WON: return "won";
        case GameOutcome::LOST: return "lost";
        case GameOutcome::STUCK: return "stuck";
    }
    return "unknown";
}

Game::Game(Board board, EngineOptions options)
    : game_board(std::move(board)),
      ai(game_board.size(), options),
      cells_to_reveal(game_board.size().num_cells() - game_board.mine_count()) {
    if (cells_to_reveal == 0)
        stats.outcome = GameOutcome::WON;
}

StepResult Game::step(RandomSource& random) {
    if (over())
        return {std::nullopt, stats.outcome};

    std::optional<Move> move = ai.next_move(random);
    if (!move) {
        stats.outcome = all_safe_cells_revealed() ? GameOutcome::WON : GameOutcome::STUCK;
        return {std::nullopt, stats.outcome};
    }

    stats.moves++;
    if (move->kind == MoveKind::SAFE)
        stats.safe_moves++;
    else
        stats.random_moves++;

    if (game_board.is_mine(move->cell)) {
        stats.outcome = GameOutcome::LOST;
        stats.losing_cell = move->cell;
        return {move, stats.outcome};
    }

    ai.add_knowledge(move->cell, game_board.nearby_mines(move->cell));
    for (const Position& p : ai.mines())
        game_board.flag(p);
    stats.mines_flagged = static_cast<int>(game_board.flagged_mines().size());

    if (game_board.won() || all_safe_cells_revealed())
        stats.outcome = GameOutcome::WON;
    return {move, stats.outcome};
}

GameResult Game::play(RandomSource& random) {
    while (!over())
        step(random);
    return stats;
}
