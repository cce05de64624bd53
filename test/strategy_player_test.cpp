#include <gtest/gtest.h>

#include <memory>

#include "fake_provider.h"
#include "renju/core/sandbox_broker.hpp"
#include "renju/game/strategy_player.hpp"
#include "utils.h"

using namespace renju;
using namespace renju::game;

class StrategyPlayerTest : public ::testing::Test {
 protected:
  TempDir root;
  std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();
  std::shared_ptr<core::SandboxBroker> broker = std::make_shared<core::SandboxBroker>(
      core::SandboxBuilder().WithArtifactRoot(root.path()).Build(), provider);
  Board board;

  StrategyPlayer MakePlayer() {
    return StrategyPlayer(broker, "next_move = (7, 7)", HeuristicPlayer(3));
  }
};

TEST_F(StrategyPlayerTest, ScriptWrapsStrategy) {
  ASSERT_TRUE(board.Place(Move{0, 0}, Stone::BLACK));
  auto script = StrategyPlayer::BuildScript("next_move = (1, 2)", board, Stone::WHITE);

  EXPECT_EQ(script.rfind("board = [[1, 0,", 0), 0u);
  EXPECT_NE(script.find("current_player = 2\n"), std::string::npos);
  auto user = script.find("next_move = (1, 2)");
  auto epilogue = script.find(kMoveMarker);
  ASSERT_NE(user, std::string::npos);
  ASSERT_NE(epilogue, std::string::npos);
  EXPECT_LT(user, epilogue);
}

TEST_F(StrategyPlayerTest, UsesStrategyMove) {
  provider->script.stdout_output = "thinking...\n__renju_next_move__ 7 7\n";
  auto player = MakePlayer();

  auto decision = player.ChooseMove(board, Stone::WHITE);
  EXPECT_EQ(decision.source, MoveSource::STRATEGY);
  EXPECT_EQ(decision.move, (Move{7, 7}));
  EXPECT_EQ(decision.strategy_output, "thinking...\n");
  EXPECT_TRUE(decision.fallback_reason.empty());

  // The sandbox ran the wrapped script, not the bare strategy
  ASSERT_EQ(provider->artifact_contents.size(), 1u);
  EXPECT_NE(provider->artifact_contents[0].find("current_player = 2"), std::string::npos);
}

TEST_F(StrategyPlayerTest, FallsBackWhenExecutionFails) {
  provider->script.exit_code = 1;
  provider->script.stderr_output = "NameError: name 'foo' is not defined\n";
  auto player = MakePlayer();

  auto decision = player.ChooseMove(board, Stone::WHITE);
  EXPECT_EQ(decision.source, MoveSource::FALLBACK);
  EXPECT_EQ(decision.fallback_reason, "strategy execution failed");
  EXPECT_NE(decision.strategy_output.find("NameError"), std::string::npos);
  EXPECT_TRUE(board.IsEmpty(decision.move.row, decision.move.col));
}

TEST_F(StrategyPlayerTest, FallsBackOnTimeout) {
  provider->script.wait_times_out = true;
  auto player = MakePlayer();

  auto decision = player.ChooseMove(board, Stone::WHITE);
  EXPECT_EQ(decision.source, MoveSource::FALLBACK);
  EXPECT_NE(decision.strategy_output.find("timed out"), std::string::npos);
}

TEST_F(StrategyPlayerTest, FallsBackWithoutMarker) {
  provider->script.stdout_output = "hello\n";
  auto player = MakePlayer();

  auto decision = player.ChooseMove(board, Stone::WHITE);
  EXPECT_EQ(decision.source, MoveSource::FALLBACK);
  EXPECT_EQ(decision.fallback_reason, "strategy produced no move");
}

TEST_F(StrategyPlayerTest, FallsBackWhenNextMoveMissing) {
  provider->script.stdout_output = "__renju_next_move__ None\n";
  auto player = MakePlayer();

  auto decision = player.ChooseMove(board, Stone::WHITE);
  EXPECT_EQ(decision.source, MoveSource::FALLBACK);
  EXPECT_NE(decision.fallback_reason.find("next_move"), std::string::npos);
}

TEST_F(StrategyPlayerTest, FallsBackOnOutOfBoundsMove) {
  provider->script.stdout_output = "__renju_next_move__ -1 20\n";
  auto player = MakePlayer();

  auto decision = player.ChooseMove(board, Stone::WHITE);
  EXPECT_EQ(decision.source, MoveSource::FALLBACK);
  EXPECT_NE(decision.fallback_reason.find("out of bounds"), std::string::npos);
  EXPECT_TRUE(Board::InBounds(decision.move));
}

TEST_F(StrategyPlayerTest, FallsBackOnOccupiedCell) {
  ASSERT_TRUE(board.Place(Move{7, 7}, Stone::BLACK));
  provider->script.stdout_output = "__renju_next_move__ 7 7\n";
  auto player = MakePlayer();

  auto decision = player.ChooseMove(board, Stone::WHITE);
  EXPECT_EQ(decision.source, MoveSource::FALLBACK);
  EXPECT_NE(decision.fallback_reason.find("occupied"), std::string::npos);
  EXPECT_NE(decision.move, (Move{7, 7}));
}

TEST(StrategyPlayerExtract, UsesLastMarker) {
  std::string output, error;
  auto move = StrategyPlayer::ExtractMove(
      "__renju_next_move__ 1 1\nfake\n__renju_next_move__ 2 3\n", output, error);
  ASSERT_TRUE(move.has_value());
  EXPECT_EQ(*move, (Move{2, 3}));
  EXPECT_EQ(output, "__renju_next_move__ 1 1\nfake\n");
}

TEST(StrategyPlayerExtract, RejectsMalformedPayload) {
  std::string output, error;
  EXPECT_FALSE(StrategyPlayer::ExtractMove("__renju_next_move__ a b\n", output, error));
  EXPECT_EQ(error, "malformed move marker");
  EXPECT_FALSE(StrategyPlayer::ExtractMove("__renju_next_move__ 1 2 3\n", output, error));
}
