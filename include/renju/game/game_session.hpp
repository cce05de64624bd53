/**
 * @file game_session.hpp
 * @brief Turn order, history and result of one game
 *
 * @date 2025
 */

#pragma once

#include "renju/game/board.hpp"

#include <optional>
#include <vector>

namespace renju {
namespace game {

/**
 * @enum PlayResult
 * @brief Outcome of GameSession::Play
 */
enum class PlayResult {
    ACCEPTED,       ///< Stone placed
    OUT_OF_BOUNDS,  ///< Coordinate off the board
    OCCUPIED,       ///< Cell already taken
    GAME_OVER       ///< Game already decided
};

std::string PlayResultToString(PlayResult result);

/**
 * @class GameSession
 * @brief Black moves first; players alternate until five in a row or a full board
 */
class GameSession {
public:
    GameSession() = default;

    /**
     * @brief Place the current player's stone and advance the turn
     */
    PlayResult Play(const Move& move);

    void Reset();

    const Board& GetBoard() const { return board_; }
    Stone CurrentPlayer() const { return current_player_; }
    const std::vector<Move>& History() const { return history_; }

    bool IsOver() const { return game_over_; }
    bool IsDraw() const { return game_over_ && !winner_; }
    std::optional<Stone> Winner() const { return winner_; }

private:
    Board board_;
    Stone current_player_{Stone::BLACK};
    std::vector<Move> history_;
    bool game_over_{false};
    std::optional<Stone> winner_;
};

} // namespace game
} // namespace renju
