/**
 * @file strategy_player.hpp
 * @brief Runs a user strategy in the sandbox and falls back to the heuristic
 *
 * A strategy is Python code that reads the globals `board` (15x15 nested
 * list, 0 empty / 1 black / 2 white) and `current_player` and assigns
 * `next_move = (row, col)`. It is executed through SandboxBroker; any failure
 * to produce a legal move results in the heuristic move.
 *
 * @date 2025
 */

#pragma once

#include "renju/core/sandbox_broker.hpp"
#include "renju/game/board.hpp"
#include "renju/game/heuristic_player.hpp"

#include <memory>
#include <optional>
#include <string>

namespace renju {
namespace game {

/// Line prefix the epilogue prints before the chosen move
constexpr const char* kMoveMarker = "__renju_next_move__";

/**
 * @enum MoveSource
 * @brief Who decided the move
 */
enum class MoveSource {
    STRATEGY,  ///< Legal move produced by the user strategy
    FALLBACK   ///< Heuristic move
};

/**
 * @struct MoveDecision
 * @brief Chosen move plus how it was obtained
 */
struct MoveDecision {
    Move move;
    MoveSource source{MoveSource::FALLBACK};
    std::string strategy_output;   ///< What the strategy printed (or the failure diagnostic)
    std::string fallback_reason;   ///< Empty when source == STRATEGY
};

/**
 * @class StrategyPlayer
 * @brief Sandboxed user strategy with heuristic fallback
 *
 * **Usage Example**:
 * @code
 * auto broker = std::make_shared<core::SandboxBroker>();
 * StrategyPlayer ai(broker, strategy_code, HeuristicPlayer());
 * auto decision = ai.ChooseMove(session.GetBoard(), Stone::WHITE);
 * session.Play(decision.move);
 * @endcode
 */
class StrategyPlayer {
public:
    StrategyPlayer(std::shared_ptr<core::SandboxBroker> broker,
                   std::string strategy_code,
                   HeuristicPlayer fallback = HeuristicPlayer());

    MoveDecision ChooseMove(const Board& board, Stone player);

    /**
     * @brief Strategy wrapped with the board prelude and the move epilogue
     */
    static std::string BuildScript(const std::string& strategy_code,
                                   const Board& board, Stone player);

    /**
     * @brief Split sandbox stdout into the strategy's own output and its move
     * @param output stdout of a successful run
     * @param strategy_output Receives everything printed before the marker
     * @param error Receives the reason when no move can be read
     */
    static std::optional<Move> ExtractMove(const std::string& output,
                                           std::string& strategy_output,
                                           std::string& error);

private:
    std::shared_ptr<core::SandboxBroker> broker_;
    std::string strategy_code_;
    HeuristicPlayer fallback_;

    MoveDecision Fallback(const Board& board, Stone player, std::string reason,
                          std::string strategy_output);
};

} // namespace game
} // namespace renju
