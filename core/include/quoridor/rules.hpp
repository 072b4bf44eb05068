#pragma once
#include "quoridor/types.hpp"
#include "quoridor/move.hpp"
#include <optional>
#include <vector>

namespace quoridor {

class GameState; // forward

namespace Rules {
  // Move generation for the side to move. Wall probing places and removes
  // walls on the state's board, which is unchanged on return.
  void legal_pawn_moves(const GameState& s, std::vector<Coord>& out);
  void legal_wall_moves(GameState& s, std::vector<Wall>& out);
  void legal_moves(GameState& s, MoveList& out);

  bool is_legal(GameState& s, const Move& m);
  bool keeps_paths_open(GameState& s, const Wall& w);

  std::optional<Player> winner(const GameState& s);
  bool is_win(const GameState& s, Player p);

  std::optional<int> distance_to_goal(const GameState& s, Player p);

  // North-minus-South: 10 * (dSouth - dNorth) + 0.5 * (wallsNorth - wallsSouth).
  // 0 if either distance is missing.
  Score evaluate(const GameState& s);
}

} // namespace quoridor
