#include "quoridor/board.hpp"
#include "quoridor/errors.hpp"
#include <algorithm>
#include <cstdlib>
#include <functional>
#include <limits>
#include <queue>
#include <stdexcept>
#include <tuple>

using namespace quoridor;

namespace {

bool is_goal_row(const std::vector<int>& goal_rows, int row) {
  return std::find(goal_rows.begin(), goal_rows.end(), row) != goal_rows.end();
}

// Rows change by at most one per step, so this never overestimates.
int rows_to_goal(const std::vector<int>& goal_rows, int row) {
  int best = std::numeric_limits<int>::max();
  for (int g : goal_rows) best = std::min(best, std::abs(row - g));
  return best;
}

} // namespace

Board::Board(int size) : size_(size) {
  if (size_ < 2) {
    throw std::invalid_argument("Board size must be at least 2, got " + std::to_string(size_));
  }
  clear_walls();
}

void Board::clear_walls() {
  const std::size_t anchors = static_cast<std::size_t>((size_ - 1) * (size_ - 1));
  h_walls_.assign(anchors, 0);
  v_walls_.assign(anchors, 0);
}

bool Board::has_wall(Orientation o, int row, int col) const {
  if (!anchor_in_bounds(row, col)) return false;
  const auto& walls = (o == Orientation::Horizontal) ? h_walls_ : v_walls_;
  return walls[anchor_index(row, col)] != 0;
}

int Board::wall_count() const {
  int n = 0;
  for (std::size_t i = 0; i < h_walls_.size(); ++i) {
    n += h_walls_[i] + v_walls_[i];
  }
  return n;
}

std::vector<Wall> Board::placed_walls() const {
  std::vector<Wall> out;
  for (int r = 0; r < size_ - 1; ++r) {
    for (int c = 0; c < size_ - 1; ++c) {
      if (h_walls_[anchor_index(r, c)]) out.push_back(Wall{r, c, Orientation::Horizontal});
      if (v_walls_[anchor_index(r, c)]) out.push_back(Wall{r, c, Orientation::Vertical});
    }
  }
  return out;
}

bool Board::wall_legal(const Wall& w) const {
  if (!anchor_in_bounds(w.row, w.col)) return false;
  const int i = anchor_index(w.row, w.col);
  // same orientation = overlap, other orientation = cross
  return h_walls_[i] == 0 && v_walls_[i] == 0;
}

void Board::place_wall(const Wall& w) {
  if (!wall_legal(w)) {
    throw InvalidWallPlacement(to_string(w));
  }
  walls_of(w.orient)[anchor_index(w.row, w.col)] = 1;
}

void Board::remove_wall(const Wall& w) {
  if (!anchor_in_bounds(w.row, w.col)) return;
  walls_of(w.orient)[anchor_index(w.row, w.col)] = 0;
}

void Board::set_walls(const std::vector<uint8_t>& h, const std::vector<uint8_t>& v) {
  if (h.size() != h_walls_.size() || v.size() != v_walls_.size()) {
    throw std::invalid_argument("Wall arrays do not match board size " + std::to_string(size_));
  }
  h_walls_ = h;
  v_walls_ = v;
}

bool Board::blocked_edge(const Coord& a, const Coord& b) const {
  if (a.row == b.row) {
    if (std::abs(a.col - b.col) != 1) return true;
    const int cmin = std::min(a.col, b.col);
    // a vertical wall spans two rows, so either covering anchor blocks this segment
    return has_wall(Orientation::Vertical, a.row, cmin)
        || has_wall(Orientation::Vertical, a.row - 1, cmin);
  }
  if (a.col == b.col) {
    if (std::abs(a.row - b.row) != 1) return true;
    const int rmin = std::min(a.row, b.row);
    return has_wall(Orientation::Horizontal, rmin, a.col)
        || has_wall(Orientation::Horizontal, rmin, a.col - 1);
  }
  return true; // diagonal
}

std::vector<Coord> Board::neighbors(const Coord& c) const {
  static constexpr int ORTHO[4][2] = {{-1,0},{1,0},{0,-1},{0,1}};

  std::vector<Coord> out;
  out.reserve(4);
  for (const auto& d : ORTHO) {
    const Coord q{c.row + d[0], c.col + d[1]};
    if (!in_bounds(q)) continue;
    if (!blocked_edge(c, q)) out.push_back(q);
  }
  return out;
}

std::optional<int> Board::astar(const Coord& start, const std::vector<int>& goal_rows,
                                std::vector<int>* parent, int* goal_cell) const {
  if (!in_bounds(start) || goal_rows.empty()) return std::nullopt;

  const int cells = size_ * size_;
  std::vector<int> g(cells, std::numeric_limits<int>::max());
  std::vector<uint8_t> closed(cells, 0);
  if (parent) parent->assign(cells, -1);

  // (f, insertion order, cell): equal f-scores pop in insertion order
  using Entry = std::tuple<int, uint32_t, int>;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;
  uint32_t seq = 0;

  const int s = cell_index(start);
  g[s] = 0;
  open.emplace(rows_to_goal(goal_rows, start.row), seq++, s);

  while (!open.empty()) {
    const int u = std::get<2>(open.top());
    open.pop();
    if (closed[u]) continue;

    const Coord cu = cell_at(u);
    if (is_goal_row(goal_rows, cu.row)) {
      if (goal_cell) *goal_cell = u;
      return g[u];
    }
    closed[u] = 1;

    for (const Coord& v : neighbors(cu)) {
      const int vi = cell_index(v);
      const int tentative = g[u] + 1;
      if (tentative < g[vi]) {
        g[vi] = tentative;
        if (parent) (*parent)[vi] = u;
        open.emplace(tentative + rows_to_goal(goal_rows, v.row), seq++, vi);
      }
    }
  }
  return std::nullopt;
}

std::optional<int> Board::astar_dist_to_goal(const Coord& start, const std::vector<int>& goal_rows) const {
  return astar(start, goal_rows, nullptr, nullptr);
}

std::optional<PathStep> Board::astar_next_step(const Coord& start, const std::vector<int>& goal_rows) const {
  std::vector<int> parent;
  int goal = -1;
  const auto dist = astar(start, goal_rows, &parent, &goal);
  if (!dist) return std::nullopt;

  // walk back from the goal cell until the cell whose parent is the start
  const int s = cell_index(start);
  int cur = goal;
  while (cur != s && parent[cur] != s) {
    cur = parent[cur];
  }
  return PathStep{*dist, cell_at(cur)};
}

std::optional<int> Board::bfs_dist_to_goal(const Coord& start, const std::vector<int>& goal_rows) const {
  if (!in_bounds(start) || goal_rows.empty()) return std::nullopt;

  std::vector<int> dist(size_ * size_, -1);
  std::queue<Coord> q;
  dist[cell_index(start)] = 0;
  q.push(start);

  while (!q.empty()) {
    const Coord u = q.front();
    q.pop();
    const int du = dist[cell_index(u)];
    if (is_goal_row(goal_rows, u.row)) return du;
    for (const Coord& v : neighbors(u)) {
      int& dv = dist[cell_index(v)];
      if (dv < 0) {
        dv = du + 1;
        q.push(v);
      }
    }
  }
  return std::nullopt;
}
