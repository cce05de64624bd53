/**
 * @file strategy_player.cpp
 * @brief Implementation of the sandboxed strategy player
 *
 * @date 2025
 */

#include "renju/game/strategy_player.hpp"
#include "renju/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace renju {
namespace game {

using utils::StringUtils;

StrategyPlayer::StrategyPlayer(std::shared_ptr<core::SandboxBroker> broker,
                               std::string strategy_code,
                               HeuristicPlayer fallback)
    : broker_(std::move(broker))
    , strategy_code_(std::move(strategy_code))
    , fallback_(std::move(fallback)) {
}

std::string StrategyPlayer::BuildScript(const std::string& strategy_code,
                                        const Board& board, Stone player) {
    std::ostringstream script;

    script << "board = " << board.ToPythonLiteral() << "\n"
           << "current_player = " << static_cast<int>(player) << "\n"
           << "\n"
           << strategy_code << "\n"
           << "\n"
           << "try:\n"
           << "    __renju_move = tuple(int(v) for v in next_move)\n"
           << "    if len(__renju_move) != 2:\n"
           << "        __renju_move = None\n"
           << "except Exception:\n"
           << "    __renju_move = None\n"
           << "if __renju_move is None:\n"
           << "    print('" << kMoveMarker << " None')\n"
           << "else:\n"
           << "    print('" << kMoveMarker << "', __renju_move[0], __renju_move[1])\n";

    return script.str();
}

std::optional<Move> StrategyPlayer::ExtractMove(const std::string& output,
                                                std::string& strategy_output,
                                                std::string& error) {
    auto marker_pos = output.rfind(kMoveMarker);
    if (marker_pos == std::string::npos) {
        strategy_output = output;
        error = "strategy produced no move";
        return std::nullopt;
    }

    strategy_output = output.substr(0, marker_pos);

    auto payload_start = marker_pos + std::string(kMoveMarker).size();
    auto payload_end = output.find('\n', payload_start);
    auto tokens = StringUtils::SplitWhitespace(
        output.substr(payload_start, payload_end == std::string::npos
                                         ? std::string::npos
                                         : payload_end - payload_start));

    if (tokens.size() == 1 && tokens[0] == "None") {
        error = "next_move is missing or not a (row, col) pair";
        return std::nullopt;
    }

    Move move;
    std::istringstream values(StringUtils::Join(tokens, " "));
    if (tokens.size() != 2 || !(values >> move.row >> move.col)) {
        error = "malformed move marker";
        return std::nullopt;
    }

    return move;
}

MoveDecision StrategyPlayer::ChooseMove(const Board& board, Stone player) {
    auto result = broker_->ExecuteUntrusted(BuildScript(strategy_code_, board, player));

    if (!result.success) {
        return Fallback(board, player, "strategy execution failed", result.output);
    }

    std::string strategy_output;
    std::string error;
    auto move = ExtractMove(result.output, strategy_output, error);

    if (!move) {
        return Fallback(board, player, error, strategy_output);
    }
    if (!Board::InBounds(*move)) {
        return Fallback(board, player, "move " + MoveToString(*move) + " is out of bounds",
                        strategy_output);
    }
    if (!board.IsEmpty(move->row, move->col)) {
        return Fallback(board, player, "cell " + MoveToString(*move) + " is occupied",
                        strategy_output);
    }

    spdlog::debug("Strategy chose {}", MoveToString(*move));

    MoveDecision decision;
    decision.move = *move;
    decision.source = MoveSource::STRATEGY;
    decision.strategy_output = std::move(strategy_output);
    return decision;
}

MoveDecision StrategyPlayer::Fallback(const Board& board, Stone player, std::string reason,
                                      std::string strategy_output) {
    spdlog::warn("Strategy fallback: {}", reason);

    MoveDecision decision;
    decision.move = fallback_.ChooseMove(board, player);
    decision.source = MoveSource::FALLBACK;
    decision.strategy_output = std::move(strategy_output);
    decision.fallback_reason = std::move(reason);
    return decision;
}

} // namespace game
} // namespace renju
