/**
 * @file heuristic_player.cpp
 * @brief Implementation of the built-in opponent
 *
 * @date 2025
 */

#include "renju/game/heuristic_player.hpp"

#include <spdlog/spdlog.h>

namespace renju {
namespace game {

HeuristicPlayer::HeuristicPlayer()
    : rng_(std::random_device{}()) {
}

HeuristicPlayer::HeuristicPlayer(std::mt19937::result_type seed)
    : rng_(seed) {
}

Move HeuristicPlayer::ChooseMove(const Board& board, Stone player) {
    Move move;

    // 1. Win
    if (FindWinningCell(board, player, move)) {
        spdlog::debug("Heuristic: winning move {}", MoveToString(move));
        return move;
    }

    // 2. Block
    if (FindWinningCell(board, Opponent(player), move)) {
        spdlog::debug("Heuristic: blocking move {}", MoveToString(move));
        return move;
    }

    // 3. Random
    auto empty = board.EmptyCells();
    if (!empty.empty()) {
        std::uniform_int_distribution<std::size_t> pick(0, empty.size() - 1);
        return empty[pick(rng_)];
    }

    return Move{kBoardSize / 2, kBoardSize / 2};
}

bool HeuristicPlayer::FindWinningCell(const Board& board, Stone stone, Move& move) {
    for (const auto& cell : board.EmptyCells()) {
        if (board.IsWinningMove(cell, stone)) {
            move = cell;
            return true;
        }
    }
    return false;
}

} // namespace game
} // namespace renju
