#pragma once
#include <stdexcept>
#include <string>

namespace quoridor {

// Board::place_wall on an out-of-range anchor or one that already holds a wall.
class InvalidWallPlacement : public std::logic_error {
public:
  explicit InvalidWallPlacement(const std::string& what)
    : std::logic_error("Illegal wall placement: " + what) {}
};

// GameState::apply with a move that is not legal in the current position.
class IllegalMove : public std::logic_error {
public:
  explicit IllegalMove(const std::string& what)
    : std::logic_error("Illegal move: " + what) {}
};

} // namespace quoridor
