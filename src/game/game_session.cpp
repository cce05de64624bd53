/**
 * @file game_session.cpp
 * @brief Implementation of the game session
 *
 * @date 2025
 */

#include "renju/game/game_session.hpp"

#include <spdlog/spdlog.h>

namespace renju {
namespace game {

std::string PlayResultToString(PlayResult result) {
    switch (result) {
        case PlayResult::ACCEPTED: return "accepted";
        case PlayResult::OUT_OF_BOUNDS: return "out of bounds";
        case PlayResult::OCCUPIED: return "occupied";
        case PlayResult::GAME_OVER: return "game over";
        default: return "unknown";
    }
}

PlayResult GameSession::Play(const Move& move) {
    if (game_over_) {
        return PlayResult::GAME_OVER;
    }
    if (!Board::InBounds(move)) {
        return PlayResult::OUT_OF_BOUNDS;
    }
    if (!board_.Place(move, current_player_)) {
        return PlayResult::OCCUPIED;
    }

    history_.push_back(move);
    spdlog::debug("{} plays {}", StoneToString(current_player_), MoveToString(move));

    if (board_.IsWinningMove(move, current_player_)) {
        game_over_ = true;
        winner_ = current_player_;
        spdlog::debug("{} wins after {} moves", StoneToString(current_player_), history_.size());
    } else if (board_.IsFull()) {
        game_over_ = true;
    } else {
        current_player_ = Opponent(current_player_);
    }

    return PlayResult::ACCEPTED;
}

void GameSession::Reset() {
    board_.Clear();
    current_player_ = Stone::BLACK;
    history_.clear();
    game_over_ = false;
    winner_.reset();
}

} // namespace game
} // namespace renju
