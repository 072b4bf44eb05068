#pragma once
#include "quoridor/types.hpp"
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace quoridor {

class Move {
public:
  enum class Kind : uint8_t { Pawn = 0, Wall = 1 };

  static Move pawn(Coord to) { return Move(to); }
  static Move wall(Wall w) { return Move(w); }
  static Move wall(int row, int col, Orientation o) { return Move(Wall{row, col, o}); }

  Kind kind() const { return action_.index() == 0 ? Kind::Pawn : Kind::Wall; }
  bool is_pawn() const { return kind() == Kind::Pawn; }
  bool is_wall() const { return kind() == Kind::Wall; }

  // Only valid for the matching kind.
  const Coord& to() const { return std::get<Coord>(action_); }
  const Wall& wall() const { return std::get<Wall>(action_); }

  friend bool operator==(const Move& a, const Move& b) { return a.action_ == b.action_; }
  friend bool operator!=(const Move& a, const Move& b) { return !(a == b); }

private:
  explicit Move(Coord to) : action_(to) {}
  explicit Move(Wall w) : action_(w) {}

  std::variant<Coord, Wall> action_;
};

using MoveList = std::vector<Move>;

inline std::string to_string(const Move& m) {
  return m.is_pawn() ? "pawn" + to_string(m.to()) : "wall" + to_string(m.wall());
}

inline std::ostream& operator<<(std::ostream& os, const Move& m) { return os << to_string(m); }

} // namespace quoridor
