#undef NDEBUG
#include <cassert>
#include <iostream>
#include "../src/game.hpp"

void test_mine_free_board_is_won_on_first_reveal() {
    std::cout << "Testing a board without mines...\n";
    RandomSource random(3);
    Game game(Board({5, 5}, 0, random));
    assert(!game.over());
    GameResult result = game.play(random);

    // nothing to flag, so the first reveal already matches flags to mines
    assert(result.outcome == GameOutcome::WON);
    assert(result.moves == 1);
    assert(result.random_moves == 1);
    assert(result.mines_flagged == 0);

    std::cout << "PASSED: test_mine_free_board_is_won_on_first_reveal\n";
}

void test_all_mines_board_is_won_immediately() {
    RandomSource random(3);
    Game game(Board({2, 2}, 4, random));
    assert(game.over());
    assert(game.result().outcome == GameOutcome::WON);
    StepResult step = game.step(random);
    assert(!step.move.has_value());
    assert(step.outcome == GameOutcome::WON);

    std::cout << "PASSED: test_all_mines_board_is_won_immediately\n";
}

void test_step_reports_loss_on_mine() {
    std::cout << "Testing loss detection...\n";
    // every cell but one is a mine, so the opening guess almost surely loses
    RandomSource random(11);
    int losses = 0;
    for (int i = 0; i < 20; i++) {
        Game game(Board({3, 3}, 8, random));
        StepResult step = game.step(random);
        assert(step.move.has_value());
        assert(step.move->kind == MoveKind::RANDOM);
        if (step.outcome == GameOutcome::LOST) {
            losses++;
            assert(game.result().losing_cell == step.move->cell);
            assert(game.board().is_mine(step.move->cell));
            // a finished game does not move again
            StepResult after = game.step(random);
            assert(!after.move.has_value());
            assert(after.outcome == GameOutcome::LOST);
        } else {
            assert(step.outcome == GameOutcome::WON);
        }
    }
    assert(losses > 0);

    std::cout << "PASSED: test_step_reports_loss_on_mine\n";
}

void test_forced_layout_is_solved() {
    std::cout << "Testing a layout solvable from one opening...\n";
    // . . . .
    // . . . .
    // . . 1 1
    // . . 1 X
    Board board({4, 4}, {{3, 3}});
    Game game(board);
    RandomSource random(8);

    // guesses continue until one lands off the mine and opens the board
    GameResult result = game.play(random);
    if (result.outcome == GameOutcome::WON) {
        assert(game.board().won() ||
               static_cast<int>(game.engine().moves_made().size()) == 15);
        assert(!game.engine().moves_made().count({3, 3}));
        assert(result.moves == static_cast<int>(game.engine().moves_made().size()));
    } else {
        assert(result.outcome == GameOutcome::LOST);
        assert(result.losing_cell == Position(3, 3));
    }

    std::cout << "PASSED: test_forced_layout_is_solved\n";
}

void test_many_games_terminate_and_flag_only_mines() {
    std::cout << "Testing full games on random boards...\n";
    RandomSource random(1234);
    EngineOptions options;
    int wins = 0;
    const int games = 100;
    for (int i = 0; i < games; i++) {
        options.iterate_to_fixed_point = (i % 2 == 1);
        Game game(Board({8, 8}, 8, random), options);
        GameResult result = game.play(random);

        assert(result.outcome == GameOutcome::WON || result.outcome == GameOutcome::LOST);
        assert(result.moves == result.safe_moves + result.random_moves);
        for (const Position& p : game.board().flagged_mines())
            assert(game.board().is_mine(p));
        assert(result.mines_flagged == static_cast<int>(game.engine().mines().size()));
        if (result.outcome == GameOutcome::WON) {
            wins++;
            assert(!result.losing_cell.has_value());
        }
    }
    std::cout << "  Won " << wins << "/" << games << " games\n";
    // 8 mines on 8x8 rarely needs more than the opening guess
    assert(wins > games / 4);

    std::cout << "PASSED: test_many_games_terminate_and_flag_only_mines\n";
}

void test_outcome_names() {
    assert(to_string(GameOutcome::WON) == "won");
    assert(to_string(GameOutcome::LOST) == "lost");
    assert(to_string(GameOutcome::STUCK) == "stuck");
    assert(to_string(GameOutcome::IN_PROGRESS) == "in progress");

    std::cout << "PASSED: test_outcome_names\n";
}

int main() {
    test_mine_free_board_is_won_on_first_reveal();
    test_all_mines_board_is_won_immediately();
    test_step_reports_loss_on_mine();
    test_forced_layout_is_solved();
    test_many_games_terminate_and_flag_only_mines();
    test_outcome_names();

    std::cout << "\nAll game tests passed!\n";
    return 0;
}
