#pragma once
/*
RunConfig: every tunable of a minesweeper_ai run, with the defaults of the
classic 8x8 / 8-mine game, plus the command-line parser that fills it.
*/

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <ostream>

struct RunConfig {
    int height = 8;
    int width = 8;
    int mines = 8;
    int games = 1;
    uint64_t seed = 0;          // 0 = seed from the clock
    bool fixed_point = false;   // iterate inference to a fixed point per reveal
    bool show_board = false;
    bool quiet = false;
};

struct ParseArgsResult {
    RunConfig cfg;
    bool ok = true;
    bool show_help = false;
    std::string error;
};

inline bool parse_i64(const char* s, long long& out) {
    if (s == nullptr) return false;
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s, &end, 10);
    if (errno == ERANGE) return false;
    if (end == s || (end != nullptr && *end != '\0')) return false;
    out = v;
    return true;
}

inline bool parse_u64(const char* s, uint64_t& out) {
    if (s == nullptr || *s == '-') return false;
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (errno == ERANGE) return false;
    if (end == s || (end != nullptr && *end != '\0')) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

inline bool parse_i32(const char* s, int& out) {
    long long v = 0;
    if (!parse_i64(s, v)) return false;
    if (v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

inline ParseArgsResult parse_args(int argc, char** argv) {
    ParseArgsResult r{};

    auto fail = [&](const std::string& msg) {
        r.ok = false;
        r.error = msg;
        return r;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view a(argv[i] != nullptr ? argv[i] : "");
        const char* v = nullptr;
        auto next = [&](const char*& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return out != nullptr;
        };
        auto bad_value = [&]() {
            return fail("invalid value for " + std::string(a) + ": " + (v != nullptr ? v : "<missing>"));
        };

        if (a == "--height") { if (!next(v) || !parse_i32(v, r.cfg.height)) return bad_value(); continue; }
        if (a == "--width") { if (!next(v) || !parse_i32(v, r.cfg.width)) return bad_value(); continue; }
        if (a == "--mines") { if (!next(v) || !parse_i32(v, r.cfg.mines)) return bad_value(); continue; }
        if (a == "--games") { if (!next(v) || !parse_i32(v, r.cfg.games) || r.cfg.games < 1) return bad_value(); continue; }
        if (a == "--seed") { if (!next(v) || !parse_u64(v, r.cfg.seed)) return bad_value(); continue; }

        if (a == "--fixed-point") { r.cfg.fixed_point = true; continue; }
        if (a == "--show-board") { r.cfg.show_board = true; continue; }
        if (a == "--quiet") { r.cfg.quiet = true; continue; }
        if (a == "--help" || a == "-h") { r.show_help = true; continue; }

        return fail("unknown argument: " + std::string(a));
    }

    // height * width must fit in an int
    if (r.cfg.height > 0 && r.cfg.width > 0 && r.cfg.height > INT_MAX / r.cfg.width)
        return fail("board " + std::to_string(r.cfg.height) + "x" + std::to_string(r.cfg.width)
                    + " has too many cells");
    return r;
}

inline void print_usage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " [options]\n"
        << "  --height N      board rows (default 8)\n"
        << "  --width N       board columns (default 8)\n"
        << "  --mines N       number of mines (default 8)\n"
        << "  --games N       games to play (default 1)\n"
        << "  --seed N        random seed, 0 = clock (default 0)\n"
        << "  --fixed-point   repeat inference until nothing new is learned\n"
        << "  --show-board    print the board after each game\n"
        << "  --quiet         only print the summary\n"
        << "  --help          show this message\n";
}
