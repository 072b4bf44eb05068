#include "quoridor/game_state.hpp"
#include "quoridor/errors.hpp"
#include "quoridor/rules.hpp"

namespace quoridor {

GameState::GameState(int size) : board_(size) { reset(); }

void GameState::reset() {
  board_.clear_walls();
  const int n = board_.size();
  pawns_[index(Player::North)] = Coord{0, n / 2};
  pawns_[index(Player::South)] = Coord{n - 1, n / 2};
  walls_left_ = {kWallsPerPlayer, kWallsPerPlayer};
  to_move_ = Player::North;
  history_.clear();
}

void GameState::apply(const Move& m) {
  if (!Rules::is_legal(*this, m)) {
    throw IllegalMove(to_string(m) + " for " + to_string(to_move_));
  }
  history_.push_back(make_move(m));
}

bool GameState::undo() {
  if (history_.empty()) return false;
  unmake_move(history_.back());
  history_.pop_back();
  return true;
}

std::vector<Coord> GameState::recent_squares(Player p, std::size_t k) const {
  std::vector<Coord> out;
  for (auto it = history_.rbegin(); it != history_.rend() && out.size() < k; ++it) {
    if (it->mover == p) out.push_back(it->from);
  }
  return out;
}

MoveDelta GameState::make_move(const Move& m) {
  const Player me = to_move_;
  MoveDelta d{m, me, pawns_[index(me)]};

  if (m.is_pawn()) {
    pawns_[index(me)] = m.to();
  } else {
    board_.place_wall(m.wall());
    walls_left_[index(me)] -= 1;
  }

  to_move_ = opponent(me);
  return d;
}

void GameState::unmake_move(const MoveDelta& d) {
  if (d.move.is_pawn()) {
    pawns_[index(d.mover)] = d.from;
  } else {
    board_.remove_wall(d.move.wall());
    walls_left_[index(d.mover)] += 1;
  }
  to_move_ = d.mover;
}

Snapshot GameState::snapshot() const {
  return Snapshot{pawns_, board_.horizontal_walls(), board_.vertical_walls(), walls_left_, to_move_};
}

void GameState::restore(const Snapshot& s) {
  pawns_ = s.pawns;
  board_.set_walls(s.h_walls, s.v_walls);
  walls_left_ = s.walls_left;
  to_move_ = s.to_move;
  history_.clear();
}

} // namespace quoridor
