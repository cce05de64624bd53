#include <gtest/gtest.h>

#include <stdexcept>

#include "renju/game/board.hpp"

using namespace renju::game;

namespace {

void PlaceLine(Board& board, Move start, int dr, int dc, int count, Stone stone) {
  for (int i = 0; i < count; i++) {
    ASSERT_TRUE(board.Place(Move{start.row + dr * i, start.col + dc * i}, stone));
  }
}

}  // namespace

TEST(Board, StartsEmpty) {
  Board board;
  EXPECT_EQ(board.StoneCount(), 0);
  EXPECT_EQ(board.EmptyCells().size(), 225u);
  EXPECT_FALSE(board.IsFull());
  EXPECT_EQ(board.At(7, 7), Stone::EMPTY);
}

TEST(Board, PlaceRejectsOccupiedAndOutOfBounds) {
  Board board;
  EXPECT_TRUE(board.Place(Move{0, 0}, Stone::BLACK));
  EXPECT_FALSE(board.Place(Move{0, 0}, Stone::WHITE));
  EXPECT_FALSE(board.Place(Move{15, 0}, Stone::WHITE));
  EXPECT_FALSE(board.Place(Move{0, -1}, Stone::WHITE));
  EXPECT_FALSE(board.Place(Move{1, 1}, Stone::EMPTY));
  EXPECT_EQ(board.At(0, 0), Stone::BLACK);
  EXPECT_THROW(board.At(15, 15), std::out_of_range);
}

TEST(Board, DetectsFiveInEveryDirection) {
  struct Case { Move start; int dr, dc; };
  for (const auto& c : {Case{{7, 3}, 0, 1}, Case{{3, 7}, 1, 0}, Case{{3, 3}, 1, 1},
                        Case{{3, 11}, 1, -1}}) {
    Board board;
    PlaceLine(board, c.start, c.dr, c.dc, 5, Stone::WHITE);
    Move last{c.start.row + c.dr * 4, c.start.col + c.dc * 4};
    Move middle{c.start.row + c.dr * 2, c.start.col + c.dc * 2};
    EXPECT_TRUE(board.IsWinningMove(last, Stone::WHITE));
    EXPECT_TRUE(board.IsWinningMove(middle, Stone::WHITE));
    EXPECT_FALSE(board.IsWinningMove(last, Stone::BLACK));
  }
}

TEST(Board, FourIsNotEnough) {
  Board board;
  PlaceLine(board, Move{0, 0}, 0, 1, 4, Stone::BLACK);
  EXPECT_FALSE(board.IsWinningMove(Move{0, 3}, Stone::BLACK));
  // ...but the empty cell that completes it is a winning move
  EXPECT_TRUE(board.IsWinningMove(Move{0, 4}, Stone::BLACK));
}

TEST(Board, LineBrokenByOpponentDoesNotWin) {
  Board board;
  PlaceLine(board, Move{5, 0}, 0, 1, 2, Stone::BLACK);
  ASSERT_TRUE(board.Place(Move{5, 2}, Stone::WHITE));
  PlaceLine(board, Move{5, 3}, 0, 1, 3, Stone::BLACK);
  EXPECT_FALSE(board.IsWinningMove(Move{5, 4}, Stone::BLACK));
}

TEST(Board, OverlineCountsAsWin) {
  Board board;
  PlaceLine(board, Move{14, 0}, 0, 1, 6, Stone::BLACK);
  EXPECT_TRUE(board.IsWinningMove(Move{14, 5}, Stone::BLACK));
}

TEST(Board, TextRendering) {
  Board board;
  ASSERT_TRUE(board.Place(Move{0, 0}, Stone::BLACK));
  ASSERT_TRUE(board.Place(Move{0, 1}, Stone::WHITE));
  auto text = board.ToText();
  EXPECT_NE(text.find("\n 0   X  O  ."), std::string::npos);
  EXPECT_NE(text.find("14"), std::string::npos);
}

TEST(Board, PythonLiteral) {
  Board board;
  ASSERT_TRUE(board.Place(Move{0, 1}, Stone::WHITE));
  auto literal = board.ToPythonLiteral();
  EXPECT_EQ(literal.rfind("[[0, 2, 0,", 0), 0u);
  EXPECT_EQ(literal.substr(literal.size() - 2), "]]");
}

TEST(Board, FullBoard) {
  Board board;
  for (int r = 0; r < kBoardSize; r++) {
    for (int c = 0; c < kBoardSize; c++) {
      board.Place(Move{r, c}, (r + c) % 2 ? Stone::BLACK : Stone::WHITE);
    }
  }
  EXPECT_TRUE(board.IsFull());
  EXPECT_TRUE(board.EmptyCells().empty());
}
