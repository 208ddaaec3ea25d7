#pragma once
/*
Game: drives one round of play between a Board and an InferenceEngine.

Each step asks the engine for a move (safe if known, random otherwise),
reveals it on the board, feeds the clue back as knowledge and flags every mine
the engine has proven. The game is won once every non-mine cell is revealed
or the flags match the mines exactly; it is lost on revealing a mine.
*/

#include <optional>
#include <string>
#include "board.hpp"
#include "inference_engine.hpp"
#include "random_source.hpp"

enum class GameOutcome {
    IN_PROGRESS,
    WON,
    LOST,
    STUCK   // no cell left to play, yet not won
};

std::string to_string(GameOutcome outcome);

struct StepResult {
    std::optional<Move> move;
    GameOutcome outcome;
};

struct GameResult {
    GameOutcome outcome = GameOutcome::IN_PROGRESS;
    int moves = 0;
    int safe_moves = 0;
    int random_moves = 0;
    int mines_flagged = 0;
    std::optional<Position> losing_cell;
};

class Game {
    private:
        Board game_board;
        InferenceEngine ai;
        GameResult stats;
        int cells_to_reveal;

        bool all_safe_cells_revealed() const {
            return static_cast<int>(ai.moves_made().size()) == cells_to_reveal;
        }

    public:
        Game(Board board, EngineOptions options = EngineOptions());

        StepResult step(RandomSource& random);

        // Step until the game is over.
        GameResult play(RandomSource& random);

        bool over() const { return stats.outcome != GameOutcome::IN_PROGRESS; }
        const GameResult& result() const { return stats; }
        const Board& board() const { return game_board; }
        const InferenceEngine& engine() const { return ai; }
};
