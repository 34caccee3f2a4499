#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cellclear/board.hpp"
#include "cellclear/common.hpp"
#include "cellclear/move_sequence.hpp"
#include "cellclear/profiler.hpp"
#include "cellclear/shortcut_cache.hpp"
#include "cellclear/solver/bfs.hpp"
#include "cellclear/solver/shortcut.hpp"

using namespace std;
using namespace cellclear;

typedef struct Options {
    size_t moves = CELLCLEAR_DEFAULT_MOVES;
    bool use_stdin = false;
    int threads = 0;
    string strategy = "shortcut";
    bool profile = false;
    vector<string> boards;
} Options;

static void print_usage(const char* program) {
    cout << "Usage: " << program << " [options] [board...]\n"
         << "  -m, --moves N        Max number of moves (default " << CELLCLEAR_DEFAULT_MOVES << ", at most "
         << MoveSequence::MAX_LENGTH << ")\n"
         << "  -s, --stdin          Read boards as lines from stdin\n"
         << "  -t, --threads N      Worker threads (default: OpenMP default)\n"
         << "      --strategy S     shortcut (default) or bfs\n"
         << "      --profile        Print a timing report to stderr\n"
         << "  -h, --help           Show this help\n"
         << "Example: " << program << " \"18 9 6 0|0 9 3 0|33 18 18 3|0 0 15 0\"\n";
}

static bool parse_number(const string& text, long& value) {
    try {
        size_t used = 0;
        value = stol(text, &used);
        return used == text.size() && value >= 0;
    } catch (const logic_error&) {
        return false;
    }
}

static string trim(const string& line) {
    const char* blanks = " \t\r\n";
    size_t begin = line.find_first_not_of(blanks);
    if (begin == string::npos) return "";
    size_t end = line.find_last_not_of(blanks);
    return line.substr(begin, end - begin + 1);
}

// Returns the exit status, or -1 to continue
static int parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        long value = 0;
        if ((a == "-m" || a == "--moves") && i + 1 < argc) {
            if (!parse_number(argv[++i], value)) {
                cerr << "Invalid: --moves expects a non-negative number\n";
                return 1;
            }
            opts.moves = static_cast<size_t>(value);
        } else if ((a == "-t" || a == "--threads") && i + 1 < argc) {
            if (!parse_number(argv[++i], value)) {
                cerr << "Invalid: --threads expects a non-negative number\n";
                return 1;
            }
            opts.threads = static_cast<int>(value);
        } else if (a == "--strategy" && i + 1 < argc) {
            opts.strategy = argv[++i];
        } else if (a == "-s" || a == "--stdin") {
            opts.use_stdin = true;
        } else if (a == "--profile") {
            opts.profile = true;
        } else if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!a.empty() && a[0] == '-') {
            cerr << "Invalid: Unknown option " << a << "\n";
            return 1;
        } else {
            opts.boards.push_back(a);
        }
    }
    return -1;
}

int main(int argc, char* argv[]) {
    Options opts;
    int status = parse_args(argc, argv, opts);
    if (status >= 0) return status;

    if (opts.moves > MoveSequence::MAX_LENGTH) {
        cerr << "Invalid: Max supported moves: " << MoveSequence::MAX_LENGTH << "\n";
        return 1;
    }
    if (!opts.use_stdin && opts.boards.empty()) {
        cout << "No board to solve. Try --help." << endl;
        return 3;
    }

    unique_ptr<BaseSolver> solver;
    if (opts.strategy == "shortcut") {
        solver = make_unique<Shortcut::Solver>(ShortcutCache::build(opts.threads), opts.threads);
    } else if (opts.strategy == "bfs") {
        solver = make_unique<BFS::Solver>(opts.threads);
    } else {
        cerr << "Invalid: Unknown strategy " << opts.strategy << "\n";
        return 1;
    }

    // A malformed board is reported and skipped, the remaining boards are still solved
    status = 0;
    if (opts.use_stdin) {
        string line;
        while (getline(cin, line)) {
            string text = trim(line);
            if (text.empty()) continue;
            try {
                Board board = Board::parse(text);
                optional<MoveSequence> moves = solver->solve(board, opts.moves);
                cout << (moves ? join_moves(*moves, ",") : "X") << endl;
            } catch (const ParseError& e) {
                cerr << "Invalid: Failed to parse board! " << e.what() << "\n";
                cout << "Invalid" << endl;
                status = 2;
            }
        }
    } else {
        for (const string& text : opts.boards) {
            try {
                Board board = Board::parse(text);
                optional<MoveSequence> moves = solver->solve(board, opts.moves);
                if (moves) {
                    cout << "Solution with " << moves->size() << " moves: " << join_moves(*moves, ", ") << endl;
                } else {
                    cout << "No solution!" << endl;
                }
            } catch (const ParseError& e) {
                cerr << "Invalid: Failed to parse board! " << e.what() << "\n";
                status = 2;
            }
        }
    }

    if (opts.profile) Profiler::getInstance().report(cerr);
    return status;
}
