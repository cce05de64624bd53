/**
 * @file heuristic_player.hpp
 * @brief Built-in opponent used when no strategy (or a broken one) is supplied
 *
 * @date 2025
 */

#pragma once

#include "renju/game/board.hpp"

#include <random>

namespace renju {
namespace game {

/**
 * @class HeuristicPlayer
 * @brief Win if possible, else block, else play a random empty cell
 *
 * Falls back to the centre (7, 7) only when the board has no empty cell.
 */
class HeuristicPlayer {
public:
    HeuristicPlayer();
    explicit HeuristicPlayer(std::mt19937::result_type seed);

    Move ChooseMove(const Board& board, Stone player);

private:
    std::mt19937 rng_;

    static bool FindWinningCell(const Board& board, Stone stone, Move& move);
};

} // namespace game
} // namespace renju
