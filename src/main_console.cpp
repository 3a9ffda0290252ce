#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/Collision.hpp"
#include "core/GameSession.hpp"
#include "core/GameConfig.hpp"
#include "core/Grid.hpp"
#include "core/RandomSource.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"
#include "controller/RealtimeLoop.hpp"
#include "persistence/HighScoreReporter.hpp"
#include "persistence/HighScoreStore.hpp"

using namespace blockfall::core;
using blockfall::controller::InputAction;

namespace {

struct Options {
    GameConfig config = GameConfig::tetris();
    std::optional<std::uint32_t> seed;
    bool realtime{false};
};

void printUsage() {
    std::cout << "Usage: blockfall_console [--line-destroyer] [--seed N] [--realtime]\n";
}

bool parseArgs(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--line-destroyer") {
            opts.config = GameConfig::lineDestroyer();
        } else if (arg == "--tetris") {
            opts.config = GameConfig::tetris();
        } else if (arg == "--realtime") {
            opts.realtime = true;
        } else if (arg == "--seed" && i + 1 < argc) {
            try {
                opts.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid seed: " << argv[i] << '\n';
                return false;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            return false;
        }
    }
    return true;
}

// Helper: render the board with the falling piece as ASCII
void printGame(const SessionState& state) {
    const Grid grid = state.currentPiece ? withPiece(state.grid, *state.currentPiece) : state.grid;
    const int rows = grid.rows();
    const int cols = grid.cols();

    std::vector<std::string> lines(rows, std::string(cols, '.'));

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            switch (grid.cell(r, c)) {
            case CellState::Filled: lines[r][c] = '#'; break; // locked blocks
            case CellState::Active: lines[r][c] = 'X'; break; // falling piece
            case CellState::Empty:  break;
            }
        }
    }

    std::cout << "\n==== BLOCKFALL ====\n";
    std::cout << "Score: " << state.score
              << " | Level: " << state.level
              << " | Lines: " << state.linesCleared
              << " | Status: " << toString(state.phase) << '\n';

    // Next piece preview
    std::cout << "Next: " << toChar(state.nextPiece.type()) << '\n';
    for (const auto& row : state.nextPiece.shape()) {
        std::cout << "  ";
        for (auto v : row) {
            std::cout << (v ? 'X' : ' ');
        }
        std::cout << '\n';
    }

    // Print board with borders
    std::cout << '+' << std::string(cols, '-') << "+\n";
    for (int r = 0; r < rows; ++r) {
        std::cout << '|' << lines[r] << "|\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\n";

    std::cout << "Commands:\n"
              << "  a = left, d = right, s = soft drop, w = rotate\n"
              << "  h = hard drop, g = gravity tick\n"
              << "  p = pause/resume, n = new game, q = quit\n";
}

std::optional<InputAction> actionFor(char c) {
    switch (c) {
    case 'a': case 'A': return InputAction::MoveLeft;
    case 'd': case 'D': return InputAction::MoveRight;
    case 's': case 'S': return InputAction::SoftDrop;
    case 'w': case 'W': return InputAction::Rotate;
    case 'h': case 'H': return InputAction::HardDrop;
    case 'p': case 'P': return InputAction::PauseResume;
    case 'n': case 'N': return InputAction::NewGame;
    default: return std::nullopt;
    }
}

void printHighScores(const blockfall::persistence::IHighScoreStore& store, const std::string& gameId) {
    const auto scores = store.highScores(gameId);
    std::cout << "High scores (" << gameId << "):\n";
    if (scores.empty()) {
        std::cout << "  none yet\n";
    }
    int rank = 1;
    for (const auto& s : scores) {
        std::cout << "  " << rank++ << ". " << s.name << "  " << s.score << '\n';
    }
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return EXIT_FAILURE;
    }

    RandomSourcePtr random;
    if (opts.seed) {
        random = std::make_shared<MersenneRandomSource>(*opts.seed);
    }

    std::unique_ptr<GameSession> session;
    try {
        session = std::make_unique<GameSession>(opts.config, random);
    } catch (const std::exception& e) {
        std::cerr << "Cannot create game: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    blockfall::persistence::InMemoryHighScoreStore store;
    std::unique_ptr<blockfall::persistence::HighScoreReporter> reporter;
    if (opts.config.recordHighScores) {
        reporter = std::make_unique<blockfall::persistence::HighScoreReporter>(*session, store);
    }

    session->events().subscribe([](const GameEvent& event) {
        if (const auto* cleared = std::get_if<LinesClearedEvent>(&event.payload)) {
            std::cout << "Cleared " << cleared->lines << " line(s)!\n";
        } else if (const auto* up = std::get_if<LevelUpEvent>(&event.payload)) {
            std::cout << "Level " << up->level << " (drop every " << up->dropIntervalMs << " ms)\n";
        } else if (const auto* over = std::get_if<GameOverEvent>(&event.payload)) {
            std::cout << "GAME OVER. Final score: " << over->finalScore << '\n';
        }
    });

    blockfall::controller::GameController controller{*session};
    std::unique_ptr<blockfall::controller::RealtimeLoop> loop;

    session->start(); // start immediately

    if (opts.realtime) {
        loop = std::make_unique<blockfall::controller::RealtimeLoop>(*session);
        loop->start();
    }

    auto snapshot = [&]() {
        return loop ? loop->snapshot() : session->snapshot();
    };
    auto dispatch = [&](InputAction action) {
        if (loop) {
            loop->post(action);
        } else {
            controller.handleAction(action);
        }
    };

    std::string cmd;
    printGame(snapshot());

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        const char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        if (c == 'g' || c == 'G') {
            if (loop) {
                std::cout << "Gravity runs on its own in realtime mode.\n";
            } else {
                controller.update(
                    blockfall::controller::GameController::Duration{session->dropIntervalMs()});
            }
        } else if (auto action = actionFor(c)) {
            dispatch(*action);
        } else {
            std::cout << "Unknown command: " << c << '\n';
        }

        const SessionState state = snapshot();
        printGame(state);

        if (state.phase == GamePhase::GameOver) {
            if (reporter && reporter->hasPendingEntry()) {
                std::cout << "New high score! Enter your name (empty to skip): ";
                std::string name;
                std::getline(std::cin, name);
                if (reporter->submitName(name)) {
                    printHighScores(store, opts.config.gameId);
                } else {
                    reporter->skip();
                }
            }
            std::cout << "Press 'n' for a new game or 'q' to quit.\n";
        }
    }

    if (loop) {
        loop->stop();
    }
    return EXIT_SUCCESS;
}
