#pragma once
#include "quoridor/board.hpp"
#include "quoridor/types.hpp"
#include "quoridor/move.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace quoridor {

// What make_move changed, enough to reverse it exactly.
struct MoveDelta {
  Move move;
  Player mover;
  Coord from;  // pawn moves only
};

// Full value copy of a position; state identity is this tuple.
struct Snapshot {
  std::array<Coord, kPlayerCount> pawns;
  std::vector<uint8_t> h_walls;
  std::vector<uint8_t> v_walls;
  std::array<int, kPlayerCount> walls_left;
  Player to_move = Player::North;
};

inline bool operator==(const Snapshot& a, const Snapshot& b) {
  return a.pawns == b.pawns && a.h_walls == b.h_walls && a.v_walls == b.v_walls
      && a.walls_left == b.walls_left && a.to_move == b.to_move;
}

inline bool operator!=(const Snapshot& a, const Snapshot& b) {
  return !(a == b);
}

class GameState {
public:
  explicit GameState(int size = kDefaultBoardSize);
  void reset();

  int size() const { return board_.size(); }
  Player current_player() const { return to_move_; }

  const Board& board() const { return board_; }
  Board& board() { return board_; }

  const Coord& pawn(Player p) const { return pawns_[index(p)]; }
  int walls_left(Player p) const { return walls_left_[index(p)]; }

  int goal_row(Player p) const { return (p == Player::North) ? size() - 1 : 0; }
  std::vector<int> goal_rows(Player p) const { return {goal_row(p)}; }

  // Position setup for harnesses and tests; no legality checks.
  void set_pawn(Player p, const Coord& c) { pawns_[index(p)] = c; }
  void set_walls_left(Player p, int n) { walls_left_[index(p)] = n; }
  void set_current_player(Player p) { to_move_ = p; }

  // Checked: throws IllegalMove unless Rules::is_legal. Recorded for undo().
  void apply(const Move& m);
  bool undo();
  std::size_t history_size() const { return history_.size(); }

  // Squares p stood on before each of its last k recorded moves, newest first.
  std::vector<Coord> recent_squares(Player p, std::size_t k) const;

  // Unchecked make/unmake used by the search.
  MoveDelta make_move(const Move& m);
  void unmake_move(const MoveDelta& d);

  Snapshot snapshot() const;
  void restore(const Snapshot& s);  // also drops the undo history

private:
  Board board_;
  std::array<Coord, kPlayerCount> pawns_;
  std::array<int, kPlayerCount> walls_left_;
  Player to_move_ = Player::North;

  std::vector<MoveDelta> history_;
};

} // namespace quoridor
