/**
 * @file board.hpp
 * @brief 15x15 Gomoku board with five-in-a-row detection
 *
 * @date 2025
 */

#pragma once

#include <array>
#include <string>
#include <vector>

namespace renju {
namespace game {

constexpr int kBoardSize = 15;  ///< Rows and columns
constexpr int kWinLength = 5;   ///< Stones in a row needed to win

/**
 * @enum Stone
 * @brief Cell contents; values match the integers strategies see
 */
enum class Stone {
    EMPTY = 0,
    BLACK = 1,
    WHITE = 2
};

Stone Opponent(Stone stone);
std::string StoneToString(Stone stone);

/**
 * @struct Move
 * @brief Board coordinate, zero-based
 */
struct Move {
    int row{0};
    int col{0};

    bool operator==(const Move& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Move& other) const { return !(*this == other); }
};

std::string MoveToString(const Move& move);

/**
 * @class Board
 * @brief Fixed-size grid of stones
 */
class Board {
public:
    Board();

    static bool InBounds(int row, int col) {
        return row >= 0 && row < kBoardSize && col >= 0 && col < kBoardSize;
    }
    static bool InBounds(const Move& move) { return InBounds(move.row, move.col); }

    /**
     * @throws std::out_of_range for coordinates off the board
     */
    Stone At(int row, int col) const;

    bool IsEmpty(int row, int col) const;

    /**
     * @brief Put a stone on an empty in-bounds cell
     * @return false if the cell is off the board or occupied
     */
    bool Place(const Move& move, Stone stone);

    void Clear();

    bool IsFull() const;
    int StoneCount() const;
    std::vector<Move> EmptyCells() const;

    /**
     * @brief Whether stone at move completes five or more in a row
     *
     * The cell itself is counted as stone regardless of its contents, so
     * this also answers "would playing here win".
     */
    bool IsWinningMove(const Move& move, Stone stone) const;

    /**
     * @brief Coordinate grid with '.', 'X' (black) and 'O' (white)
     */
    std::string ToText() const;

    /**
     * @brief Nested list of ints, e.g. "[[0, 0, ...], ...]"
     */
    std::string ToPythonLiteral() const;

private:
    std::array<std::array<Stone, kBoardSize>, kBoardSize> cells_;
};

} // namespace game
} // namespace renju
