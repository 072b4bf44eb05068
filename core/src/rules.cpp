#include "quoridor/rules.hpp"
#include "quoridor/game_state.hpp"
#include <algorithm>

namespace quoridor {

static constexpr Orientation ORIENTATIONS[2] = {Orientation::Horizontal, Orientation::Vertical};

void Rules::legal_pawn_moves(const GameState& s, std::vector<Coord>& out) {
  out.clear();

  const Board& b = s.board();
  const Player me = s.current_player();
  const Coord mine = s.pawn(me);
  const Coord opp = s.pawn(opponent(me));

  auto add = [&](const Coord& c) {
    if (std::find(out.begin(), out.end(), c) == out.end()) out.push_back(c);
  };

  for (const Coord& q : b.neighbors(mine)) {
    if (q != opp) {
      add(q);
      continue;
    }

    // Opponent is adjacent: straight jump if the segment beyond is open
    const int dr = opp.row - mine.row;
    const int dc = opp.col - mine.col;
    const Coord jump{opp.row + dr, opp.col + dc};
    if (b.in_bounds(jump) && !b.blocked_edge(opp, jump)) {
      add(jump);
      continue;
    }

    // Otherwise side-step around the opponent, perpendicular to the approach
    if (b.blocked_edge(mine, opp)) continue;
    const Coord sides[2] = {
      (dr != 0) ? Coord{opp.row, opp.col - 1} : Coord{opp.row - 1, opp.col},
      (dr != 0) ? Coord{opp.row, opp.col + 1} : Coord{opp.row + 1, opp.col},
    };
    for (const Coord& side : sides) {
      if (!b.in_bounds(side)) continue;
      if (!b.blocked_edge(opp, side)) add(side);
    }
  }
}

bool Rules::keeps_paths_open(GameState& s, const Wall& w) {
  Board& b = s.board();
  if (!b.wall_legal(w)) return false;

  ScopedWall probe(b, w);
  return b.path_exists_for(s.pawn(Player::North), s.goal_rows(Player::North))
      && b.path_exists_for(s.pawn(Player::South), s.goal_rows(Player::South));
}

void Rules::legal_wall_moves(GameState& s, std::vector<Wall>& out) {
  out.clear();
  if (s.walls_left(s.current_player()) <= 0) return;

  const int n = s.size();
  for (int r = 0; r < n - 1; ++r) {
    for (int c = 0; c < n - 1; ++c) {
      for (Orientation o : ORIENTATIONS) {
        const Wall w{r, c, o};
        if (!s.board().wall_legal(w)) continue;
        if (keeps_paths_open(s, w)) out.push_back(w);
      }
    }
  }
}

void Rules::legal_moves(GameState& s, MoveList& out) {
  out.clear();

  std::vector<Coord> pawn_moves;
  legal_pawn_moves(s, pawn_moves);
  std::vector<Wall> wall_moves;
  legal_wall_moves(s, wall_moves);

  out.reserve(pawn_moves.size() + wall_moves.size());
  for (const Coord& c : pawn_moves) out.push_back(Move::pawn(c));
  for (const Wall& w : wall_moves) out.push_back(Move::wall(w));
}

bool Rules::is_legal(GameState& s, const Move& m) {
  if (m.is_pawn()) {
    std::vector<Coord> pawn_moves;
    legal_pawn_moves(s, pawn_moves);
    return std::find(pawn_moves.begin(), pawn_moves.end(), m.to()) != pawn_moves.end();
  }

  if (s.walls_left(s.current_player()) <= 0) return false;
  return keeps_paths_open(s, m.wall());
}

std::optional<Player> Rules::winner(const GameState& s) {
  if (is_win(s, Player::North)) return Player::North;
  if (is_win(s, Player::South)) return Player::South;
  return std::nullopt;
}

bool Rules::is_win(const GameState& s, Player p) {
  return s.pawn(p).row == s.goal_row(p);
}

std::optional<int> Rules::distance_to_goal(const GameState& s, Player p) {
  return s.board().astar_dist_to_goal(s.pawn(p), s.goal_rows(p));
}

Score Rules::evaluate(const GameState& s) {
  const auto d_north = distance_to_goal(s, Player::North);
  const auto d_south = distance_to_goal(s, Player::South);
  // cannot happen while every wall keeps both paths open
  if (!d_north || !d_south) return 0.0;

  const int wall_diff = s.walls_left(Player::North) - s.walls_left(Player::South);
  return (*d_south - *d_north) * 10.0 + wall_diff * 0.5;
}

} // namespace quoridor
