/**
 * @file move_parser.hpp
 * @brief Extract a board coordinate from free-form text
 *
 * @date 2025
 */

#pragma once

#include "renju/game/board.hpp"

#include <optional>
#include <string>

namespace renju {
namespace game {

/**
 * @class MoveParser
 * @brief Tolerant coordinate parser
 *
 * Tries, in order, and accepts the first form whose coordinates are on the
 * board:
 * 1. `(row, col)`
 * 2. `row, col`
 * 3. the first two integers anywhere in the text
 */
class MoveParser {
public:
    static std::optional<Move> Parse(const std::string& text);
};

} // namespace game
} // namespace renju
