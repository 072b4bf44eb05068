#pragma once
#include "quoridor/types.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace quoridor {

struct PathStep {
  int distance = 0;
  Coord next;  // first cell along a shortest path (start itself when already on a goal row)
};

/**
 * Movement graph of an N x N cell lattice.
 *
 * Walls live on the (N-1) x (N-1) anchor grid, one bit per anchor and
 * orientation. An anchor holds at most one wall of either orientation.
 * Pawns are not stored here.
 */
class Board {
public:
  explicit Board(int size = kDefaultBoardSize);

  int size() const { return size_; }
  void clear_walls();

  bool in_bounds(const Coord& c) const {
    return c.row >= 0 && c.row < size_ && c.col >= 0 && c.col < size_;
  }

  bool anchor_in_bounds(int row, int col) const {
    return row >= 0 && row < size_ - 1 && col >= 0 && col < size_ - 1;
  }

  bool has_wall(Orientation o, int row, int col) const;
  int wall_count() const;
  std::vector<Wall> placed_walls() const;

  // Exact-anchor conflicts only; adjacent walls of the same orientation are fine.
  bool wall_legal(const Wall& w) const;
  void place_wall(const Wall& w);   // throws InvalidWallPlacement
  void remove_wall(const Wall& w);

  // True when no orthogonal step connects a and b (including non-adjacent pairs).
  bool blocked_edge(const Coord& a, const Coord& b) const;
  std::vector<Coord> neighbors(const Coord& c) const;

  std::optional<int> astar_dist_to_goal(const Coord& start, const std::vector<int>& goal_rows) const;
  std::optional<PathStep> astar_next_step(const Coord& start, const std::vector<int>& goal_rows) const;
  std::optional<int> bfs_dist_to_goal(const Coord& start, const std::vector<int>& goal_rows) const;
  bool path_exists_for(const Coord& start, const std::vector<int>& goal_rows) const {
    return astar_dist_to_goal(start, goal_rows).has_value();
  }

  const std::vector<uint8_t>& horizontal_walls() const { return h_walls_; }
  const std::vector<uint8_t>& vertical_walls() const { return v_walls_; }
  void set_walls(const std::vector<uint8_t>& h, const std::vector<uint8_t>& v);

private:
  int anchor_index(int row, int col) const { return row * (size_ - 1) + col; }
  int cell_index(const Coord& c) const { return c.row * size_ + c.col; }
  Coord cell_at(int idx) const { return Coord{idx / size_, idx % size_}; }
  std::vector<uint8_t>& walls_of(Orientation o) {
    return (o == Orientation::Horizontal) ? h_walls_ : v_walls_;
  }

  // A* core shared by the distance and next-step queries. Fills parent when non-null.
  std::optional<int> astar(const Coord& start, const std::vector<int>& goal_rows,
                           std::vector<int>* parent, int* goal_cell) const;

  int size_;
  std::vector<uint8_t> h_walls_;
  std::vector<uint8_t> v_walls_;
};

// Tentative placement for legality probes: the wall is removed again when
// the guard goes out of scope.
class ScopedWall {
public:
  ScopedWall(Board& board, const Wall& w) : board_(board), wall_(w) { board_.place_wall(wall_); }
  ~ScopedWall() { board_.remove_wall(wall_); }

  ScopedWall(const ScopedWall&) = delete;
  ScopedWall& operator=(const ScopedWall&) = delete;

private:
  Board& board_;
  Wall wall_;
};

} // namespace quoridor
