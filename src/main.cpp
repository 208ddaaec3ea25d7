#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include "board.hpp"
#include "game.hpp"
#include "logging.hpp"
#include "profiling.hpp"
#include "random_source.hpp"
#include "run_config.hpp"

int main(int argc, char** argv) {
    ParseArgsResult args = parse_args(argc, argv);
    if (!args.ok) {
        log_error("args", args.error);
        print_usage(std::cerr, argv[0]);
        return 2;
    }
    if (args.show_help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }
    const RunConfig& cfg = args.cfg;
    console_logger().set_quiet(cfg.quiet);

    RandomSource random(cfg.seed);
    BoardSize size{cfg.height, cfg.width};
    EngineOptions options;
    options.iterate_to_fixed_point = cfg.fixed_point;

    log_info("run", "board " + std::to_string(cfg.height) + "x" + std::to_string(cfg.width)
        + ", " + std::to_string(cfg.mines) + " mines, " + std::to_string(cfg.games)
        + " game(s), seed " + std::to_string(random.seed())
        + (cfg.fixed_point ? ", fixed-point inference" : ""));

    int wins = 0;
    int losses = 0;
    int stuck = 0;
    long long total_moves = 0;
    long long random_moves = 0;
    {
        ScopedTimer timer("Playing " + std::to_string(cfg.games) + " game(s)");
        for (int g = 1; g <= cfg.games; g++) {
            GameResult result;
            try {
                Game game(Board(size, cfg.mines, random), options);
                result = game.play(random);
                if (cfg.show_board) {
                    game.board().render(std::cout, &game.engine());
                    game.engine().print_knowledge(std::cout);
                }
            } catch (const std::invalid_argument& e) {
                log_error("board", e.what());
                return 2;
            }

            total_moves += result.moves;
            random_moves += result.random_moves;
            if (result.outcome == GameOutcome::WON) wins++;
            else if (result.outcome == GameOutcome::LOST) losses++;
            else stuck++;

            std::string line = "game " + std::to_string(g) + ": " + to_string(result.outcome)
                + " after " + std::to_string(result.moves) + " moves ("
                + std::to_string(result.safe_moves) + " safe, "
                + std::to_string(result.random_moves) + " random), "
                + std::to_string(result.mines_flagged) + " mines flagged";
            if (result.losing_cell)
                line += ", hit mine at " + to_string(*result.losing_cell);
            log_info("game", line);
        }
    }

    double win_rate = 100.0 * wins / cfg.games;
    std::cout << "Won " << wins << "/" << cfg.games << " games ("
              << std::fixed << std::setprecision(1) << win_rate << "%), "
              << losses << " lost";
    if (stuck > 0)
        std::cout << ", " << stuck << " stuck";
    std::cout << ", " << total_moves << " moves, " << random_moves << " guesses\n";
    return 0;
}
