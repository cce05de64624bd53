#include <gtest/gtest.h>

#include "renju/game/heuristic_player.hpp"

using namespace renju::game;

TEST(HeuristicPlayer, TakesImmediateWin) {
  Board board;
  for (int c = 3; c < 7; c++) ASSERT_TRUE(board.Place(Move{4, c}, Stone::WHITE));
  for (int c = 3; c < 7; c++) ASSERT_TRUE(board.Place(Move{10, c}, Stone::BLACK));

  HeuristicPlayer player(1);
  auto move = player.ChooseMove(board, Stone::WHITE);
  EXPECT_TRUE(move == (Move{4, 2}) || move == (Move{4, 7}));
}

TEST(HeuristicPlayer, BlocksOpponentWin) {
  Board board;
  for (int r = 0; r < 4; r++) ASSERT_TRUE(board.Place(Move{r, 0}, Stone::BLACK));
  ASSERT_TRUE(board.Place(Move{7, 7}, Stone::WHITE));

  HeuristicPlayer player(1);
  EXPECT_EQ(player.ChooseMove(board, Stone::WHITE), (Move{4, 0}));
}

TEST(HeuristicPlayer, WinBeatsBlock) {
  Board board;
  for (int r = 0; r < 4; r++) ASSERT_TRUE(board.Place(Move{r, 0}, Stone::BLACK));
  for (int r = 0; r < 4; r++) ASSERT_TRUE(board.Place(Move{r, 14}, Stone::WHITE));

  HeuristicPlayer player(1);
  EXPECT_EQ(player.ChooseMove(board, Stone::WHITE), (Move{4, 14}));
}

TEST(HeuristicPlayer, OtherwisePlaysAnEmptyCell) {
  Board board;
  ASSERT_TRUE(board.Place(Move{7, 7}, Stone::BLACK));

  HeuristicPlayer player(42);
  for (int i = 0; i < 50; i++) {
    auto move = player.ChooseMove(board, Stone::WHITE);
    EXPECT_TRUE(Board::InBounds(move));
    EXPECT_TRUE(board.IsEmpty(move.row, move.col));
  }
}

TEST(HeuristicPlayer, SameSeedSameMoves) {
  Board board;
  HeuristicPlayer a(7), b(7);
  for (int i = 0; i < 10; i++) {
    EXPECT_EQ(a.ChooseMove(board, Stone::BLACK), b.ChooseMove(board, Stone::BLACK));
  }
}

TEST(HeuristicPlayer, FullBoardFallsBackToCentre) {
  Board board;
  for (int r = 0; r < kBoardSize; r++) {
    for (int c = 0; c < kBoardSize; c++) {
      board.Place(Move{r, c}, (r + 2 * c) % 4 < 2 ? Stone::BLACK : Stone::WHITE);
    }
  }
  HeuristicPlayer player(1);
  EXPECT_EQ(player.ChooseMove(board, Stone::WHITE), (Move{7, 7}));
}
