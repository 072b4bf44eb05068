#include <gtest/gtest.h>
#include "quoridor/game_state.hpp"
#include "quoridor/rules.hpp"
#include "quoridor_ai/negamax.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <iterator>

using namespace quoridor;
using quoridor_ai::Negamax;
using quoridor_ai::kWinScore;

// Helper function to play a game between two searchers
std::optional<Player> play_game(Negamax& north, Negamax& south, int size, int depth, int max_plies = 200) {
  GameState state(size);

  for (int ply = 0; ply < max_plies; ++ply) {
    if (auto w = Rules::winner(state)) {
      return w;
    }

    Negamax& ai = (state.current_player() == Player::North) ? north : south;
    auto move = ai.best_move(state, depth);
    if (!move) {
      return std::nullopt;
    }
    state.apply(*move);
  }

  // Max plies reached - draw
  return Rules::winner(state);
}

namespace {

bool contains(const MoveList& moves, const Move& m) {
  return std::find(moves.begin(), moves.end(), m) != moves.end();
}

} // namespace

TEST(NegamaxTest, TerminalScoreIgnoresDepth) {
  GameState state;
  state.set_pawn(Player::North, {8, 0});
  Negamax ai;

  for (int depth : {0, 1, 3}) {
    auto r = ai.search(state, depth);
    EXPECT_DOUBLE_EQ(r.score, kWinScore) << "depth " << depth;
    EXPECT_FALSE(r.move.has_value());
  }

  state.set_current_player(Player::South);
  auto r = ai.search(state, 2);
  EXPECT_DOUBLE_EQ(r.score, -kWinScore);
  EXPECT_FALSE(r.move.has_value());
}

TEST(NegamaxTest, DepthZeroIsMoverRelativeEvaluation) {
  GameState state;
  state.set_pawn(Player::North, {4, 4});
  state.set_walls_left(Player::South, 7);
  Negamax ai;

  auto r = ai.search(state, 0);
  EXPECT_DOUBLE_EQ(r.score, 41.5);
  EXPECT_FALSE(r.move.has_value());

  state.set_current_player(Player::South);
  EXPECT_DOUBLE_EQ(ai.search(state, 0).score, -41.5);
}

TEST(NegamaxTest, FindsImmediateWin) {
  GameState state;
  state.set_pawn(Player::North, {7, 0});
  state.set_pawn(Player::South, {8, 8});
  Negamax ai;

  auto r = ai.search(state, 1);
  ASSERT_TRUE(r.move.has_value());
  EXPECT_EQ(*r.move, Move::pawn({8, 0}));
  EXPECT_DOUBLE_EQ(r.score, kWinScore);
  EXPECT_GT(ai.get_stats().nodes_searched, 1);
}

TEST(NegamaxTest, PreferFasterWinsAddsRemainingDepth) {
  GameState state(5);
  state.set_pawn(Player::North, {3, 0});
  state.set_pawn(Player::South, {4, 4});
  Negamax ai;
  ai.set_prefer_faster_wins(true);

  auto r = ai.search(state, 3);
  ASSERT_TRUE(r.move.has_value());
  EXPECT_EQ(*r.move, Move::pawn({4, 0}));
  EXPECT_DOUBLE_EQ(r.score, kWinScore + 2);
}

TEST(NegamaxTest, SearchLeavesStateUntouched) {
  GameState state(5);
  state.apply(Move::wall(1, 1, Orientation::Horizontal));
  state.apply(Move::pawn({3, 2}));
  const Snapshot before = state.snapshot();
  const size_t history = state.history_size();

  Negamax ai;
  ai.set_detect_repetition(true);
  ai.set_score_pawn_destinations(true);
  auto r = ai.search(state, 3);

  EXPECT_TRUE(r.move.has_value());
  EXPECT_EQ(state.snapshot(), before);
  EXPECT_EQ(state.history_size(), history);
}

TEST(NegamaxTest, OrderedMovesIsPermutationOfLegalMoves) {
  GameState state;
  state.apply(Move::pawn({1, 4}));
  state.apply(Move::wall(6, 4, Orientation::Horizontal));

  MoveList legal;
  Rules::legal_moves(state, legal);

  Negamax ai;
  const MoveList ordered = ai.ordered_moves(state);
  ASSERT_EQ(ordered.size(), legal.size());
  for (const auto& m : legal) {
    EXPECT_TRUE(contains(ordered, m)) << m;
  }

  // pawn moves share one score, so they keep their generation order
  MoveList legal_pawns, ordered_pawns;
  std::copy_if(legal.begin(), legal.end(), std::back_inserter(legal_pawns),
               [](const Move& m) { return m.is_pawn(); });
  std::copy_if(ordered.begin(), ordered.end(), std::back_inserter(ordered_pawns),
               [](const Move& m) { return m.is_pawn(); });
  EXPECT_EQ(ordered_pawns, legal_pawns);

  ai.set_use_move_ordering(false);
  EXPECT_EQ(ai.ordered_moves(state), legal);
}

TEST(NegamaxTest, OrderedMovesPutsBlockingWallsFirst) {
  GameState state(5);
  state.set_pawn(Player::North, {3, 2});
  state.set_pawn(Player::South, {1, 0});

  // H(0,0) sends South around through (1,1),(1,2): 1 step becomes 3
  Negamax ai;
  const MoveList ordered = ai.ordered_moves(state);
  ASSERT_FALSE(ordered.empty());
  EXPECT_EQ(ordered.front(), Move::wall(0, 0, Orientation::Horizontal));
  // no other wall beats a pawn step, and ties keep pawns ahead
  EXPECT_EQ(ordered[1], Move::pawn({2, 2}));
  EXPECT_EQ(state.board().wall_count(), 0);
}

TEST(NegamaxTest, ScorePawnDestinationsPrefersForwardStep) {
  GameState state;
  state.set_pawn(Player::North, {2, 4});
  state.set_walls_left(Player::North, 0);

  Negamax ai;
  const MoveList plain = ai.ordered_moves(state);
  ASSERT_EQ(plain.size(), 4u);
  EXPECT_EQ(plain[0], Move::pawn({1, 4}));
  EXPECT_EQ(plain[1], Move::pawn({3, 4}));
  EXPECT_EQ(plain[2], Move::pawn({2, 3}));
  EXPECT_EQ(plain[3], Move::pawn({2, 5}));

  // forward 8-5, sideways 8-6, backward 8-7
  ai.set_score_pawn_destinations(true);
  const MoveList scored = ai.ordered_moves(state);
  ASSERT_EQ(scored.size(), 4u);
  EXPECT_EQ(scored[0], Move::pawn({3, 4}));
  EXPECT_EQ(scored[1], Move::pawn({2, 3}));
  EXPECT_EQ(scored[2], Move::pawn({2, 5}));
  EXPECT_EQ(scored[3], Move::pawn({1, 4}));
}

TEST(NegamaxTest, PawnNudgesFollowShortestPath) {
  GameState state;
  state.set_pawn(Player::North, {2, 4});
  state.set_walls_left(Player::North, 0);

  Negamax ai;
  ai.set_pawn_nudges(true);
  const MoveList ordered = ai.ordered_moves(state);
  ASSERT_EQ(ordered.size(), 4u);
  EXPECT_EQ(ordered[0], Move::pawn({3, 4}));
  EXPECT_EQ(ordered[1], Move::pawn({1, 4}));
  EXPECT_EQ(ordered[2], Move::pawn({2, 3}));
  EXPECT_EQ(ordered[3], Move::pawn({2, 5}));
}

TEST(NegamaxTest, PawnNudgesAvoidRecentSquares) {
  GameState state;
  // North loops (0,4) -> (1,4) -> (1,5) -> (2,5) -> (2,4) while South drifts along its row
  const Coord north[] = {{1, 4}, {1, 5}, {2, 5}, {2, 4}};
  const Coord south[] = {{8, 3}, {8, 2}, {8, 1}, {8, 0}};
  for (int i = 0; i < 4; ++i) {
    state.apply(Move::pawn(north[i]));
    state.apply(Move::pawn(south[i]));
  }
  state.set_walls_left(Player::North, 0);

  const auto recent = state.recent_squares(Player::North, 6);
  ASSERT_EQ(recent.size(), 4u);
  EXPECT_EQ(recent.front(), (Coord{2, 5}));

  Negamax ai;
  const MoveList plain = ai.ordered_moves(state);
  ASSERT_EQ(plain.size(), 4u);
  EXPECT_EQ(plain[0], Move::pawn({1, 4}));
  EXPECT_EQ(plain[3], Move::pawn({2, 5}));

  // (3,4) path +2.0, (2,3) 0, (1,4) recent -0.7, (2,5) back -1.5 and recent -0.7
  ai.set_pawn_nudges(true);
  const MoveList ordered = ai.ordered_moves(state);
  ASSERT_EQ(ordered.size(), 4u);
  EXPECT_EQ(ordered[0], Move::pawn({3, 4}));
  EXPECT_EQ(ordered[1], Move::pawn({2, 3}));
  EXPECT_EQ(ordered[2], Move::pawn({1, 4}));
  EXPECT_EQ(ordered[3], Move::pawn({2, 5}));
}

TEST(NegamaxTest, PawnNudgesForgetOlderSquares) {
  GameState state;
  // (1,4) is North's 7th most recent square, outside the window
  const Coord north[] = {{1, 4}, {1, 5}, {1, 6}, {1, 7}, {2, 7}, {2, 6}, {2, 5}, {2, 4}};
  const Coord south[] = {{8, 3}, {8, 2}, {8, 1}, {8, 0}, {8, 1}, {8, 2}, {8, 3}, {8, 4}};
  for (int i = 0; i < 8; ++i) {
    state.apply(Move::pawn(north[i]));
    state.apply(Move::pawn(south[i]));
  }
  state.set_walls_left(Player::North, 0);

  Negamax ai;
  ai.set_pawn_nudges(true);
  const MoveList ordered = ai.ordered_moves(state);
  ASSERT_EQ(ordered.size(), 4u);
  EXPECT_EQ(ordered[0], Move::pawn({3, 4}));
  EXPECT_EQ(ordered[1], Move::pawn({1, 4}));
  EXPECT_EQ(ordered[2], Move::pawn({2, 3}));
  EXPECT_EQ(ordered[3], Move::pawn({2, 5}));
}

TEST(NegamaxTest, BestMoveIsLegal) {
  GameState state(5);
  Negamax ai;

  auto move = ai.best_move(state, 2);
  ASSERT_TRUE(move.has_value());
  EXPECT_TRUE(Rules::is_legal(state, *move)) << *move;
  EXPECT_EQ(ai.get_stats().max_depth_reached, 2);
}

TEST(NegamaxTest, BestMoveFollowsPathWithoutWalls) {
  GameState state;
  state.set_walls_left(Player::North, 0);
  Negamax ai;

  auto move = ai.best_move(state, 3);
  ASSERT_TRUE(move.has_value());
  EXPECT_EQ(*move, Move::pawn({1, 4}));
  EXPECT_EQ(ai.get_stats().nodes_searched, 0) << "no tree search needed";
}

TEST(NegamaxTest, BestMoveOnFinishedGame) {
  GameState state;
  state.set_pawn(Player::South, {0, 3});
  Negamax ai;
  EXPECT_FALSE(ai.best_move(state, 2).has_value());
}

TEST(NegamaxTest, BestMoveHonorsTimeLimit) {
  GameState state(5);
  Negamax ai;

  auto move = ai.best_move(state, 2, 1);
  ASSERT_TRUE(move.has_value());
  EXPECT_TRUE(Rules::is_legal(state, *move));
  EXPECT_GE(ai.get_stats().max_depth_reached, 1);
}

TEST(NegamaxTest, RepetitionDetectionCutsRepeatedLines) {
  GameState state(5);
  state.set_walls_left(Player::North, 0);
  state.set_walls_left(Player::South, 0);
  const Snapshot before = state.snapshot();

  Negamax ai;
  auto off = ai.search(state, 5);
  EXPECT_EQ(ai.get_stats().repetitions, 0);

  // both pawns step out and back within four plies, leaving depth 1 at the repeat
  ai.set_detect_repetition(true);
  auto on = ai.search(state, 5);
  EXPECT_GT(ai.get_stats().repetitions, 0);
  ASSERT_TRUE(on.move.has_value());
  EXPECT_TRUE(Rules::is_legal(state, *on.move));
  EXPECT_DOUBLE_EQ(on.score, off.score);
  EXPECT_EQ(state.snapshot(), before);

  // a repeat reached with no depth left is scored as a leaf
  ai.search(state, 4);
  EXPECT_EQ(ai.get_stats().repetitions, 0);
}

TEST(NegamaxTest, HugeMoveTimeIsClamped) {
  ASSERT_EQ(setenv("QUORIDOR_MOVE_TIME", "1e12", 1), 0);
  GameState state(5);
  Negamax ai;

  auto move = ai.best_move(state, 1);
  unsetenv("QUORIDOR_MOVE_TIME");

  ASSERT_TRUE(move.has_value());
  EXPECT_TRUE(Rules::is_legal(state, *move));
  EXPECT_EQ(ai.get_stats().max_depth_reached, 1);
}

TEST(NegamaxTest, SelfPlayFinishesGame) {
  Negamax north;
  Negamax south;

  auto winner = play_game(north, south, 5, 1);
  ASSERT_TRUE(winner.has_value());

  std::cout << "Negamax(1) vs Negamax(1) on 5x5: "
            << (*winner == Player::North ? "North" : "South") << " wins\n";
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
