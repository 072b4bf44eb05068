#pragma once
#include <cstdint>
#include <ostream>
#include <string>

namespace quoridor {

// North starts on row 0 and races to row N-1, South the other way.
enum class Player : uint8_t { North = 0, South = 1 };

enum class Orientation : uint8_t { Horizontal = 0, Vertical = 1 };

using Score = double;

constexpr int kDefaultBoardSize = 9;
constexpr int kWallsPerPlayer = 10;
constexpr int kPlayerCount = 2;

inline Player opponent(Player p) {
  return (p == Player::North) ? Player::South : Player::North;
}

inline int index(Player p) { return static_cast<int>(p); }

struct Coord {
  int row = 0;
  int col = 0;
};

inline bool operator==(const Coord& a, const Coord& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Coord& a, const Coord& b) {
  return !(a == b);
}

inline bool operator<(const Coord& a, const Coord& b) {
  return a.row != b.row ? a.row < b.row : a.col < b.col;
}

// Anchor (row, col) with 0 <= row, col < N-1.
// Horizontal: blocks the vertical steps between rows row and row+1 at columns col and col+1.
// Vertical:   blocks the horizontal steps between columns col and col+1 at rows row and row+1.
struct Wall {
  int row = 0;
  int col = 0;
  Orientation orient = Orientation::Horizontal;
};

inline bool operator==(const Wall& a, const Wall& b) {
  return a.row == b.row && a.col == b.col && a.orient == b.orient;
}

inline bool operator!=(const Wall& a, const Wall& b) {
  return !(a == b);
}

inline std::string to_string(const Coord& c) {
  return "(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
}

inline std::string to_string(const Wall& w) {
  return "(" + std::to_string(w.row) + "," + std::to_string(w.col) + ","
      + (w.orient == Orientation::Horizontal ? "H" : "V") + ")";
}

inline std::string to_string(Player p) {
  return (p == Player::North) ? "North" : "South";
}

inline std::ostream& operator<<(std::ostream& os, const Coord& c) { return os << to_string(c); }
inline std::ostream& operator<<(std::ostream& os, const Wall& w) { return os << to_string(w); }
inline std::ostream& operator<<(std::ostream& os, Player p) { return os << to_string(p); }

} // namespace quoridor
