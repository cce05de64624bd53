/**
 * @file board.cpp
 * @brief Implementation of the Gomoku board
 *
 * @date 2025
 */

#include "renju/game/board.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace renju {
namespace game {

Stone Opponent(Stone stone) {
    switch (stone) {
        case Stone::BLACK: return Stone::WHITE;
        case Stone::WHITE: return Stone::BLACK;
        default: return Stone::EMPTY;
    }
}

std::string StoneToString(Stone stone) {
    switch (stone) {
        case Stone::BLACK: return "black";
        case Stone::WHITE: return "white";
        default: return "empty";
    }
}

std::string MoveToString(const Move& move) {
    return fmt::format("({}, {})", move.row, move.col);
}

Board::Board() {
    Clear();
}

Stone Board::At(int row, int col) const {
    if (!InBounds(row, col)) {
        throw std::out_of_range(fmt::format("cell ({}, {}) is off the board", row, col));
    }
    return cells_[row][col];
}

bool Board::IsEmpty(int row, int col) const {
    return InBounds(row, col) && cells_[row][col] == Stone::EMPTY;
}

bool Board::Place(const Move& move, Stone stone) {
    if (stone == Stone::EMPTY || !IsEmpty(move.row, move.col)) {
        return false;
    }
    cells_[move.row][move.col] = stone;
    return true;
}

void Board::Clear() {
    for (auto& row : cells_) {
        row.fill(Stone::EMPTY);
    }
}

bool Board::IsFull() const {
    return StoneCount() == kBoardSize * kBoardSize;
}

int Board::StoneCount() const {
    int count = 0;
    for (const auto& row : cells_) {
        for (Stone cell : row) {
            if (cell != Stone::EMPTY) {
                ++count;
            }
        }
    }
    return count;
}

std::vector<Move> Board::EmptyCells() const {
    std::vector<Move> empty;
    for (int r = 0; r < kBoardSize; ++r) {
        for (int c = 0; c < kBoardSize; ++c) {
            if (cells_[r][c] == Stone::EMPTY) {
                empty.push_back(Move{r, c});
            }
        }
    }
    return empty;
}

bool Board::IsWinningMove(const Move& move, Stone stone) const {
    if (!InBounds(move) || stone == Stone::EMPTY) {
        return false;
    }

    // Horizontal, vertical, main diagonal, anti-diagonal
    static const int kDirections[4][2] = {{0, 1}, {1, 0}, {1, 1}, {1, -1}};

    for (const auto& direction : kDirections) {
        int count = 1;
        for (int sign : {1, -1}) {
            int dr = direction[0] * sign;
            int dc = direction[1] * sign;
            int r = move.row + dr;
            int c = move.col + dc;
            while (InBounds(r, c) && cells_[r][c] == stone) {
                ++count;
                r += dr;
                c += dc;
            }
        }
        if (count >= kWinLength) {
            return true;
        }
    }

    return false;
}

std::string Board::ToText() const {
    std::string text = "   ";
    for (int c = 0; c < kBoardSize; ++c) {
        text += fmt::format("{:>3}", c);
    }
    text += "\n";

    for (int r = 0; r < kBoardSize; ++r) {
        text += fmt::format("{:>2} ", r);
        for (int c = 0; c < kBoardSize; ++c) {
            char symbol = '.';
            if (cells_[r][c] == Stone::BLACK) {
                symbol = 'X';
            } else if (cells_[r][c] == Stone::WHITE) {
                symbol = 'O';
            }
            text += fmt::format("{:>3}", symbol);
        }
        text += "\n";
    }

    return text;
}

std::string Board::ToPythonLiteral() const {
    std::string literal = "[";
    for (int r = 0; r < kBoardSize; ++r) {
        literal += (r == 0) ? "[" : ", [";
        for (int c = 0; c < kBoardSize; ++c) {
            if (c > 0) {
                literal += ", ";
            }
            literal += std::to_string(static_cast<int>(cells_[r][c]));
        }
        literal += "]";
    }
    literal += "]";
    return literal;
}

} // namespace game
} // namespace renju
